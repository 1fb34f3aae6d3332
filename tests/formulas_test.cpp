/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <orbitcraft/formulas.hpp>
#include <orbitcraft/vector.hpp>

#include <cmath>

namespace orbitcraft {
namespace {

constexpr double EARTH_MU = 3.986004418e14;
constexpr double SUN_MU = 1.98855e30 * GRAVITATIONAL_CONSTANT;
constexpr double EARTH_SEMI_MAJOR_AXIS = 149598023e3;
constexpr double MARS_SEMI_MAJOR_AXIS = 227.9392e9;

class FormulasTest : public ::testing::Test {
};

TEST_F(FormulasTest, ParameterFromSemiMajorAxis) {
    EXPECT_DOUBLE_EQ(formulas::parameterFromSemiMajorAxis(10000.0, 0.0), 10000.0);
    EXPECT_DOUBLE_EQ(formulas::parameterFromSemiMajorAxis(10000.0, 0.5), 7500.0);
}

// Test the period of a geostationary orbit
TEST_F(FormulasTest, OrbitalPeriod) {
    double period = formulas::orbitalPeriod(EARTH_MU, 42164e3);
    EXPECT_NEAR(period, SIDEREAL_DAY, 5.0);
    EXPECT_NEAR(formulas::semiMajorAxisFromOrbitalPeriod(EARTH_MU, period), 42164e3, 1e-3);
}

TEST_F(FormulasTest, SynodicPeriod) {
    double earth = formulas::orbitalPeriod(SUN_MU, EARTH_SEMI_MAJOR_AXIS);
    double mars = formulas::orbitalPeriod(SUN_MU, MARS_SEMI_MAJOR_AXIS);

    // About 780 days between Earth-Mars alignments
    double synodic = formulas::synodicPeriod(earth, mars);
    EXPECT_NEAR(synodic / ONE_DAY, 780.0, 2.0);
    EXPECT_DOUBLE_EQ(formulas::synodicPeriod(mars, earth), synodic);
}

TEST_F(FormulasTest, SynodicPeriodOfEqualPeriods) {
    EXPECT_DOUBLE_EQ(formulas::synodicPeriod(5000.0, 5000.0), 0.0);
    EXPECT_DOUBLE_EQ(formulas::synodicPeriod(5000.0, 5000.005), 0.0);
}

// Test the sphere of influence of the earth (about 925 000 km)
TEST_F(FormulasTest, SphereOfInfluence) {
    double soi = formulas::sphereOfInfluence(EARTH_SEMI_MAJOR_AXIS, 5.9722e24, 1.98855e30);
    EXPECT_NEAR(soi / 1000.0, 925000.0, 5000.0);
}

TEST_F(FormulasTest, TrueAnomalyAt) {
    double p = 10000e3;
    double e = 0.5;

    // r = p at ν = ±90°
    auto anomalies = formulas::trueAnomalyAt(p, p, e);
    ASSERT_TRUE(anomalies.has_value());
    EXPECT_NEAR(anomalies->first, PI / 2.0, 1e-12);
    EXPECT_NEAR(anomalies->second, 3.0 * PI / 2.0, 1e-12);

    // Beyond apoapsis
    EXPECT_FALSE(formulas::trueAnomalyAt(p / (1.0 - e) * 1.1, p, e).has_value());
}

TEST_F(FormulasTest, VisVivaSpeed) {
    double r = 7000e3;
    EXPECT_NEAR(formulas::visVivaSpeed(EARTH_MU, r, r), std::sqrt(EARTH_MU / r), 1e-9);
    EXPECT_NEAR(formulas::hyperbolicSpeed(EARTH_MU, r, 0.0), std::sqrt(2.0 * EARTH_MU / r), 1e-9);
}

// Test the conversions between true, eccentric and mean anomalies
TEST_F(FormulasTest, EccentricAnomaly) {
    double e = 0.3;
    EXPECT_NEAR(formulas::eccentricAnomaly(e, 0.0), 0.0, 1e-12);
    EXPECT_NEAR(formulas::eccentricAnomaly(e, PI), PI, 1e-7);

    for (double nu : {0.3, 1.5, 2.9, 3.5, 5.0}) {
        double E = formulas::eccentricAnomaly(e, nu);
        EXPECT_NEAR(clampAngle(formulas::trueAnomalyFromEccentricAnomaly(e, E)), nu, 1e-9) << "nu = " << nu;
    }
}

TEST_F(FormulasTest, HyperbolicEccentricAnomaly) {
    double e = 1.5;
    double F = formulas::hyperbolicEccentricAnomaly(e, 1.0);
    EXPECT_GT(F, 0.0);
    EXPECT_NEAR(formulas::hyperbolicEccentricAnomaly(e, TWO_PI - 1.0), -F, 1e-9);
}

TEST_F(FormulasTest, MeanAnomaly) {
    EXPECT_DOUBLE_EQ(formulas::meanAnomaly(0.0, 1.0), 1.0);
    EXPECT_NEAR(formulas::meanAnomaly(0.5, PI), PI, 1e-12);
}

TEST_F(FormulasTest, RoundToDays) {
    EXPECT_DOUBLE_EQ(formulas::roundToDays(2.4 * ONE_DAY), 2.0 * ONE_DAY);
    EXPECT_DOUBLE_EQ(formulas::roundToDays(2.6 * ONE_DAY), 3.0 * ONE_DAY);
}

}
}
