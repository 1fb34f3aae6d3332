/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <orbitcraft/formulas.hpp>
#include <orbitcraft/orbit.hpp>

#include <cmath>
#include <limits>
#include <optional>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace orbitcraft {
namespace {

constexpr double ANGLE_TOLERANCE = 1e-6;

double angleDistance(double a, double b) {
    return std::abs(minAngleDifference(clampAngle(a), clampAngle(b)));
}

struct Elements {
    std::string name;
    double parameter;
    double eccentricity;
    double inclination;
    double longitudeOfAscendingNode;
    double argumentOfPeriapsis;
    double trueAnomaly;
};

class OrbitTest : public ::testing::Test {
protected:
    Body earth{"Earth", ObjectConfig(5.9722e24, SIDEREAL_DAY, 6371e3), ObjectState()};

    OrbitPosition roundTrip(const Orbit& orbit, double trueAnomaly) {
        ObjectState state = orbit.calculateState(trueAnomaly, earth.getState());
        return OrbitPosition::calculate(earth, state);
    }

    void expectSameElements(const Elements& expected, const OrbitPosition& actual) {
        const Orbit& orbit = actual.getOrbit();
        EXPECT_NEAR(orbit.getParameter() / expected.parameter, 1.0, 1e-9) << expected.name;
        EXPECT_NEAR(orbit.getEccentricity(), expected.eccentricity, 1e-9) << expected.name;
        EXPECT_NEAR(orbit.getInclination(), expected.inclination, ANGLE_TOLERANCE) << expected.name;
        EXPECT_LT(angleDistance(orbit.getLongitudeOfAscendingNode(), expected.longitudeOfAscendingNode), ANGLE_TOLERANCE)
            << expected.name;
        EXPECT_LT(angleDistance(orbit.getArgumentOfPeriapsis(), expected.argumentOfPeriapsis), ANGLE_TOLERANCE)
            << expected.name;
        EXPECT_LT(angleDistance(actual.getTrueAnomaly(), expected.trueAnomaly), ANGLE_TOLERANCE) << expected.name;
    }
};

TEST_F(OrbitTest, RequiresPrimaryBody) {
    EXPECT_THROW(Orbit(nullptr, 7000e3, 0.0), std::invalid_argument);
}

// Test classification of the conic sections
TEST_F(OrbitTest, Classification) {
    Orbit circular(&earth, 7000e3, 0.0);
    Orbit nearCircular(&earth, 7000e3, 0.5e-4);
    Orbit elliptical(&earth, 7000e3, 0.3);
    Orbit parabolic(&earth, 7000e3, 1.0);
    Orbit hyperbolic(&earth, 7000e3, 1.5);

    EXPECT_EQ(circular.getType(), OrbitType::Circular);
    EXPECT_EQ(nearCircular.getType(), OrbitType::Circular);
    EXPECT_EQ(elliptical.getType(), OrbitType::Elliptical);
    EXPECT_EQ(parabolic.getType(), OrbitType::Parabolic);
    EXPECT_EQ(hyperbolic.getType(), OrbitType::Hyperbolic);

    EXPECT_TRUE(circular.isBound());
    EXPECT_TRUE(elliptical.isBound());
    EXPECT_TRUE(parabolic.isUnbound());
    EXPECT_TRUE(hyperbolic.isUnbound());
    EXPECT_FALSE(parabolic.isRadialParabolic());
    EXPECT_TRUE(parabolic.withParameter(0.0).isRadialParabolic());
}

TEST_F(OrbitTest, DerivedQuantities) {
    Orbit orbit = Orbit::fromSemiMajorAxis(&earth, 10000e3, 0.2);
    EXPECT_NEAR(orbit.getSemiMajorAxis(), 10000e3, 1e-3);
    EXPECT_NEAR(orbit.getPeriapsis(), 8000e3, 1e-3);
    EXPECT_NEAR(orbit.getApoapsis(), 12000e3, 1e-3);
    EXPECT_NEAR(orbit.getPeriod(),
                formulas::orbitalPeriod(earth.getStandardGravitationalParameter(), 10000e3), 1e-6);
}

// Test that unbound orbits report infinite apoapsis and period
TEST_F(OrbitTest, UnboundQuantities) {
    Orbit parabolic(&earth, 7000e3, 1.0);
    Orbit hyperbolic(&earth, 7000e3, 2.0);

    EXPECT_TRUE(std::isinf(parabolic.getApoapsis()));
    EXPECT_TRUE(std::isinf(parabolic.getSemiMajorAxis()));
    EXPECT_TRUE(std::isinf(parabolic.getPeriod()));
    EXPECT_TRUE(std::isinf(hyperbolic.getPeriod()));
    EXPECT_LT(hyperbolic.getSemiMajorAxis(), 0.0);
    EXPECT_NEAR(parabolic.getPeriapsis(), 3500e3, 1e-6);
}

TEST_F(OrbitTest, WithElementsReturnsCopies) {
    Orbit orbit(&earth, 7000e3, 0.1, 0.2, 0.3, 0.4);
    Orbit changed = orbit.withEccentricity(0.5).withInclination(1.0);

    EXPECT_DOUBLE_EQ(changed.getEccentricity(), 0.5);
    EXPECT_DOUBLE_EQ(changed.getInclination(), 1.0);
    EXPECT_DOUBLE_EQ(changed.getLongitudeOfAscendingNode(), 0.3);
    EXPECT_DOUBLE_EQ(orbit.getEccentricity(), 0.1);
    EXPECT_DOUBLE_EQ(orbit.getInclination(), 0.2);

    Orbit added = orbit.add(1000.0, 0.05, 0.1);
    EXPECT_DOUBLE_EQ(added.getParameter(), 7001e3);
    EXPECT_DOUBLE_EQ(added.getEccentricity(), 0.15);
    EXPECT_DOUBLE_EQ(added.getInclination(), 0.2 + 0.1);
    EXPECT_DOUBLE_EQ(added.getArgumentOfPeriapsis(), 0.4);
}

// Test that the semi-major axis takes precedence over the parameter
TEST_F(OrbitTest, FromElements) {
    Orbit fromParameter = Orbit::fromElements(&earth, 7000e3, std::nullopt, 0.2);
    EXPECT_DOUBLE_EQ(fromParameter.getParameter(), 7000e3);

    Orbit fromAxis = Orbit::fromElements(&earth, 7000e3, 10000e3, 0.2, 0.5);
    EXPECT_DOUBLE_EQ(fromAxis.getParameter(), 10000e3 * (1.0 - 0.2 * 0.2));
    EXPECT_DOUBLE_EQ(fromAxis.getInclination(), 0.5);

    EXPECT_THROW(Orbit::fromElements(&earth, std::nullopt, std::nullopt, 0.2), std::invalid_argument);
}

// Test that equatorial orbits lie in the world XZ plane, since Y is up
TEST_F(OrbitTest, EquatorialOrbitInWorldFrame) {
    Orbit orbit(&earth, 7000e3, 0.0);

    ObjectState periapsis = orbit.calculateState(0.0, earth.getState());
    EXPECT_NEAR(periapsis.getPosition().x, 7000e3, 1e-6);
    EXPECT_NEAR(periapsis.getPosition().y, 0.0, 1e-6);
    EXPECT_NEAR(periapsis.getPosition().z, 0.0, 1e-6);

    // A quarter turn later the object is on the +Z axis of the world frame
    ObjectState quarter = orbit.calculateState(PI / 2.0, earth.getState());
    EXPECT_NEAR(quarter.getPosition().z, 7000e3, 1e-6);
    EXPECT_NEAR(quarter.getPosition().y, 0.0, 1e-6);

    double speed = std::sqrt(earth.getStandardGravitationalParameter() / 7000e3);
    EXPECT_NEAR(periapsis.getVelocity().magnitude(), speed, 1e-9);
}

TEST_F(OrbitTest, StateIsOffsetByPrimaryBody) {
    Orbit orbit(&earth, 7000e3, 0.0);
    ObjectState primaryState(100.0, Vec3{1e9, 2e9, 3e9}, Vec3{10.0, 20.0, 30.0});

    ObjectState relative = orbit.calculateState(1.0, ObjectState());
    ObjectState absolute = orbit.calculateState(1.0, primaryState);

    EXPECT_DOUBLE_EQ(absolute.getTime(), 100.0);
    EXPECT_NEAR(absolute.getPosition().distance(relative.getPosition() + primaryState.getPosition()), 0.0, 1e-6);
    EXPECT_NEAR(absolute.getVelocity().distance(relative.getVelocity() + primaryState.getVelocity()), 0.0, 1e-9);
}

// Test element to state to element conversion for every regime
TEST_F(OrbitTest, RoundTripAllRegimes) {
    std::vector<Elements> cases = {
        {"elliptical inclined", 9000e3, 0.3, 0.5, 1.0, 2.0, 0.7},
        {"elliptical inclined past apoapsis", 9000e3, 0.3, 0.5, 1.0, 2.0, 4.0},
        {"elliptical polar", 9000e3, 0.1, PI / 2.0, 3.0, 5.0, 2.5},
        {"elliptical retrograde", 9000e3, 0.4, 2.5, 4.0, 1.5, 5.5},
        {"elliptical high eccentricity", 9000e3, 0.95, 0.3, 0.2, 0.1, 1.0},
        {"parabolic", 9000e3, 1.0, 0.4, 2.0, 1.0, 1.2},
        {"parabolic incoming", 9000e3, 1.0, 0.4, 2.0, 1.0, TWO_PI - 1.2},
        {"hyperbolic", 9000e3, 1.8, 0.8, 5.0, 3.0, 1.0},
        {"hyperbolic incoming", 9000e3, 1.8, 0.8, 5.0, 3.0, TWO_PI - 1.5},
    };

    for (const auto& expected : cases) {
        Orbit orbit(&earth, expected.parameter, expected.eccentricity, expected.inclination,
                    expected.longitudeOfAscendingNode, expected.argumentOfPeriapsis);
        expectSameElements(expected, roundTrip(orbit, expected.trueAnomaly));
    }
}

// Test state to element to state conversion over seeded random elliptic and hyperbolic states
TEST_F(OrbitTest, StateRoundTripSweep) {
    std::mt19937 rng(20250417);
    std::uniform_real_distribution<double> unit(-1.0, 1.0);
    std::uniform_real_distribution<double> radii(7000e3, 40000e3);
    std::uniform_real_distribution<double> ellipticSpeeds(0.5, 0.95);
    std::uniform_real_distribution<double> hyperbolicSpeeds(1.1, 2.0);
    std::uniform_real_distribution<double> flightPathAngles(-PI / 3.0, PI / 3.0);

    double mu = earth.getStandardGravitationalParameter();
    const int count = 200;
    int checked = 0;
    int hyperbolic = 0;

    for (int i = 0; i < count; i++) {
        Vec3 radial = Vec3{unit(rng), unit(rng), unit(rng)}.normalize();
        Vec3 random = Vec3{unit(rng), unit(rng), unit(rng)};
        Vec3 horizontal = (random - radial * random.dot(radial)).normalize();
        if (radial.magnitude() == 0.0 || horizontal.magnitude() == 0.0) {
            continue;
        }

        double radius = radii(rng);
        double escapeSpeed = std::sqrt(2.0 * mu / radius);
        double speed = escapeSpeed * (i % 2 == 0 ? ellipticSpeeds(rng) : hyperbolicSpeeds(rng));
        double flightPathAngle = flightPathAngles(rng);
        Vec3 direction = horizontal * std::cos(flightPathAngle) + radial * std::sin(flightPathAngle);

        ObjectState state(0.0, radial * radius, direction * speed);
        OrbitPosition position = OrbitPosition::calculate(earth, state);
        const Orbit& orbit = position.getOrbit();

        // Skip the regimes where some elements are undefined
        if (orbit.isCircular() || orbit.isParabolic()
            || orbit.getInclination() < 1e-3 || orbit.getInclination() > PI - 1e-3) {
            continue;
        }
        checked++;
        if (orbit.isUnbound()) {
            hyperbolic++;
        }

        ObjectState actual = position.calculateState(earth.getState());
        EXPECT_NEAR(actual.getPosition().distance(state.getPosition()) / radius, 0.0, 1e-6) << "case " << i;
        EXPECT_NEAR(actual.getVelocity().distance(state.getVelocity()) / speed, 0.0, 1e-6) << "case " << i;
    }

    EXPECT_GE(checked, count * 9 / 10);
    EXPECT_GE(hyperbolic, count / 3);
}

TEST_F(OrbitTest, RoundTripEquatorial) {
    // The node is undefined and reported as 0; the periapsis is measured from X
    Elements prograde{"equatorial prograde", 9000e3, 0.2, 0.0, 0.0, 1.2, 2.0};
    Orbit orbit(&earth, prograde.parameter, prograde.eccentricity, 0.0, 0.0, prograde.argumentOfPeriapsis);
    expectSameElements(prograde, roundTrip(orbit, prograde.trueAnomaly));

    Elements retrograde{"equatorial retrograde", 9000e3, 0.2, PI, 0.0, 1.2, 2.0};
    Orbit retrogradeOrbit(&earth, retrograde.parameter, retrograde.eccentricity, PI, 0.0,
                          retrograde.argumentOfPeriapsis);
    expectSameElements(retrograde, roundTrip(retrogradeOrbit, retrograde.trueAnomaly));
}

// Test circular orbits, where the periapsis is undefined and reported as 0
TEST_F(OrbitTest, RoundTripCircular) {
    Elements equatorial{"circular equatorial", 7000e3, 0.0, 0.0, 0.0, 0.0, 4.0};
    Orbit orbit(&earth, equatorial.parameter, 0.0);
    OrbitPosition position = roundTrip(orbit, equatorial.trueAnomaly);
    EXPECT_TRUE(position.getOrbit().isCircular());
    EXPECT_LT(angleDistance(position.getTrueAnomaly(), equatorial.trueAnomaly), ANGLE_TOLERANCE);
    EXPECT_DOUBLE_EQ(position.getOrbit().getArgumentOfPeriapsis(), 0.0);

    // The true anomaly is measured from the ascending node
    Elements inclined{"circular inclined", 7000e3, 0.0, 0.5, 1.0, 0.0, 4.0};
    Orbit inclinedOrbit(&earth, inclined.parameter, 0.0, inclined.inclination, inclined.longitudeOfAscendingNode);
    position = roundTrip(inclinedOrbit, inclined.trueAnomaly);
    EXPECT_LT(angleDistance(position.getOrbit().getLongitudeOfAscendingNode(), 1.0), ANGLE_TOLERANCE);
    EXPECT_NEAR(position.getOrbit().getInclination(), 0.5, ANGLE_TOLERANCE);
    EXPECT_LT(angleDistance(position.getTrueAnomaly(), inclined.trueAnomaly), ANGLE_TOLERANCE);
    EXPECT_DOUBLE_EQ(position.getOrbit().getArgumentOfPeriapsis(), 0.0);
}

// ============================================================================
// Argument of periapsis near the 0/2π boundary
// ============================================================================

TEST_F(OrbitTest, ArgumentOfPeriapsisJustBelowTwoPi) {
    double periapsis = TWO_PI - 1e-3;
    Orbit orbit(&earth, 9000e3, 0.2, 0.0, 0.0, periapsis);
    OrbitPosition position = roundTrip(orbit, 1.0);

    double actual = position.getOrbit().getArgumentOfPeriapsis();
    EXPECT_GE(actual, 0.0);
    EXPECT_LT(actual, TWO_PI);
    EXPECT_NEAR(actual, periapsis, ANGLE_TOLERANCE);
}

TEST_F(OrbitTest, ArgumentOfPeriapsisAtZero) {
    Orbit orbit(&earth, 9000e3, 0.2, 0.0, 0.0, 0.0);
    OrbitPosition position = roundTrip(orbit, 2.0);

    double actual = position.getOrbit().getArgumentOfPeriapsis();
    EXPECT_GE(actual, 0.0);
    EXPECT_LT(actual, TWO_PI);
    EXPECT_LT(angleDistance(actual, 0.0), ANGLE_TOLERANCE);
}

TEST_F(OrbitTest, ArgumentOfPeriapsisNearEquatorial) {
    Elements expected{"near equatorial", 9000e3, 0.2, 1e-5, 0.5, TWO_PI - 2e-3, 3.0};
    Orbit orbit(&earth, expected.parameter, expected.eccentricity, expected.inclination,
                expected.longitudeOfAscendingNode, expected.argumentOfPeriapsis);
    expectSameElements(expected, roundTrip(orbit, expected.trueAnomaly));
}

TEST_F(OrbitTest, ArgumentOfPeriapsisNearCircular) {
    Elements expected{"near circular", 9000e3, 2e-4, 0.3, 0.5, 1.5, 0.5};
    Orbit orbit(&earth, expected.parameter, expected.eccentricity, expected.inclination,
                expected.longitudeOfAscendingNode, expected.argumentOfPeriapsis);
    OrbitPosition position = roundTrip(orbit, expected.trueAnomaly);

    EXPECT_FALSE(position.getOrbit().isCircular());
    EXPECT_LT(angleDistance(position.getOrbit().getArgumentOfPeriapsis(), expected.argumentOfPeriapsis), 1e-4);
    EXPECT_LT(angleDistance(position.getTrueAnomaly(), expected.trueAnomaly), 1e-4);
}

// ============================================================================
// Comparisons
// ============================================================================

TEST_F(OrbitTest, SameOrbit) {
    Orbit orbit(&earth, 9000e3, 0.2, 0.3, 0.4, 0.5);
    EXPECT_TRUE(orbit.sameOrbit(orbit.withParameter(9000e3 + 10.0)));
    EXPECT_FALSE(orbit.sameOrbit(orbit.withParameter(9100e3)));
    EXPECT_FALSE(orbit.sameOrbit(orbit.withEccentricity(0.3)));

    // Angles compare on the circle
    Orbit wrapped(&earth, 9000e3, 0.2, 0.3, 0.4 + TWO_PI, 0.5 - TWO_PI);
    EXPECT_TRUE(orbit.sameOrbit(wrapped));
}

TEST_F(OrbitTest, SamePlane) {
    Orbit orbit(&earth, 9000e3, 0.2, 0.3, 0.4, 0.5);
    EXPECT_TRUE(orbit.samePlane(Orbit(&earth, 20000e3, 0.0, 0.3, 0.4, 0.0)));
    EXPECT_FALSE(orbit.samePlane(orbit.withInclination(0.4)));
    EXPECT_FALSE(orbit.samePlane(orbit.withLongitudeOfAscendingNode(1.0)));
}

TEST_F(OrbitTest, CalculateFromBody) {
    Body satellite("Satellite", ObjectConfig(1000.0),
                   Orbit(&earth, 7000e3, 0.1, 0.2, 0.3, 0.4).calculateState(1.0, earth.getState()), &earth);

    Orbit orbit = Orbit::calculate(satellite);
    EXPECT_NEAR(orbit.getParameter() / 7000e3, 1.0, 1e-9);
    EXPECT_EQ(orbit.getPrimaryBody(), &earth);
    EXPECT_THROW(OrbitPosition::calculate(earth), std::invalid_argument);
}

// ============================================================================
// Time of flight
// ============================================================================

TEST_F(OrbitTest, TimeToPeriapsisAndApoapsis) {
    Orbit orbit = Orbit::fromSemiMajorAxis(&earth, 10000e3, 0.3);
    double period = orbit.getPeriod();

    OrbitPosition atApoapsis(orbit, PI);
    EXPECT_NEAR(atApoapsis.timeToPeriapsis(), period / 2.0, 1e-6);

    OrbitPosition atPeriapsis(orbit, 0.0);
    EXPECT_NEAR(atPeriapsis.timeToApoapsis(), period / 2.0, 1e-6);

    // Just after periapsis a whole revolution is left
    OrbitPosition afterPeriapsis(orbit, 1e-3);
    EXPECT_GT(afterPeriapsis.timeToPeriapsis(), 0.99 * period);
    EXPECT_LT(afterPeriapsis.timeToPeriapsis(), period);
}

// Test that bound times are in [0, period) and add up around the orbit
TEST_F(OrbitTest, TimeToTrueAnomalyBound) {
    Orbit orbit = Orbit::fromSemiMajorAxis(&earth, 10000e3, 0.3);
    OrbitPosition position(orbit, 1.0);
    double period = orbit.getPeriod();

    double toTwo = position.timeToTrueAnomaly(2.0);
    double twoToFive = position.withTrueAnomaly(2.0).timeToTrueAnomaly(5.0);
    double toFive = position.timeToTrueAnomaly(5.0);
    EXPECT_NEAR(toTwo + twoToFive, toFive, 1e-6);

    double backwards = position.timeToTrueAnomaly(0.5);
    EXPECT_GT(backwards, 0.0);
    EXPECT_LT(backwards, period);
}

TEST_F(OrbitTest, TimeToTrueAnomalyUnbound) {
    OrbitPosition hyperbolic(Orbit(&earth, 9000e3, 1.5), TWO_PI - 1.0);
    EXPECT_GT(hyperbolic.timeToPeriapsis(), 0.0);
    EXPECT_LT(hyperbolic.timeToTrueAnomaly(TWO_PI - 1.5), 0.0);
    EXPECT_TRUE(std::isinf(hyperbolic.timeToApoapsis()));

    // Symmetric around periapsis
    OrbitPosition parabolic(Orbit(&earth, 9000e3, 1.0), TWO_PI - 1.0);
    double toPeriapsis = parabolic.timeToPeriapsis();
    EXPECT_GT(toPeriapsis, 0.0);
    EXPECT_NEAR(parabolic.withTrueAnomaly(0.0).timeToTrueAnomaly(1.0), toPeriapsis, 1e-6);
}

TEST_F(OrbitTest, AnomaliesForWrongOrbitType) {
    OrbitPosition elliptical(Orbit(&earth, 9000e3, 0.3), 1.0);
    EXPECT_DOUBLE_EQ(elliptical.getHyperbolicEccentricAnomaly(), 0.0);
    EXPECT_DOUBLE_EQ(elliptical.getParabolicEccentricAnomaly(), 0.0);
    EXPECT_GT(elliptical.getEccentricAnomaly(), 0.0);

    OrbitPosition hyperbolic(Orbit(&earth, 9000e3, 1.5), 1.0);
    EXPECT_DOUBLE_EQ(hyperbolic.getEccentricAnomaly(), 0.0);
    EXPECT_GT(hyperbolic.getHyperbolicEccentricAnomaly(), 0.0);
}

TEST_F(OrbitTest, PrintInfo) {
    std::ostringstream out;
    Orbit(&earth, 9000e3, 0.3).printInfo(out);
    EXPECT_NE(out.str().find("Elliptical"), std::string::npos);
    EXPECT_NE(out.str().find("Period"), std::string::npos);
}

}
}
