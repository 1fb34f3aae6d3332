/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <orbitcraft/formulas.hpp>
#include <orbitcraft/vector.hpp>

#include <algorithm>
#include <cmath>

namespace orbitcraft::formulas {

// Periods closer than this (seconds) never realign
constexpr double SYNODIC_PERIOD_EPSILON = 1e-2;

// Below this eccentricity the angular velocity is treated as constant
constexpr double ANGULAR_VELOCITY_CIRCULAR_LIMIT = 1e-6;

double parameterFromSemiMajorAxis(double semiMajorAxis, double eccentricity) {
    return semiMajorAxis * (1.0 - eccentricity * eccentricity);
}

double orbitalPeriod(double mu, double semiMajorAxis) {
    return (TWO_PI / std::sqrt(mu)) * std::pow(semiMajorAxis, 1.5);
}

double semiMajorAxisFromOrbitalPeriod(double mu, double period) {
    return std::cbrt((mu * period * period) / (4.0 * PI * PI));
}

double synodicPeriod(double period1, double period2) {
    if (std::abs(period1 - period2) <= SYNODIC_PERIOD_EPSILON) {
        return 0.0;
    }

    double shorter = std::min(period1, period2);
    double longer = std::max(period1, period2);
    return 1.0 / ((1.0 / shorter) - (1.0 / longer));
}

double sphereOfInfluence(double semiMajorAxis, double massSmaller, double massLarger) {
    return semiMajorAxis * std::pow(massSmaller / massLarger, 2.0 / 5.0);
}

std::optional<std::pair<double, double>> trueAnomalyAt(double distance, double parameter, double eccentricity) {
    double cosTrueAnomaly = (parameter - distance) / (eccentricity * distance);
    double trueAnomaly = std::acos(cosTrueAnomaly);
    if (std::isnan(trueAnomaly)) {
        return std::nullopt;
    }
    return std::make_pair(clampAngle(trueAnomaly), clampAngle(-trueAnomaly));
}

double angularVelocity(double semiMajorAxis, double eccentricity, double period, double distance) {
    if (eccentricity < ANGULAR_VELOCITY_CIRCULAR_LIMIT) {
        return TWO_PI / period;
    }

    double semiMinorAxis = semiMajorAxis * std::sqrt(1.0 - eccentricity * eccentricity);
    return (TWO_PI * semiMajorAxis * semiMinorAxis) / (period * distance * distance);
}

double visVivaSpeed(double mu, double distance, double semiMajorAxis) {
    return std::sqrt(mu * (2.0 / distance - 1.0 / semiMajorAxis));
}

double hyperbolicSpeed(double mu, double distance, double excessSpeed) {
    return std::sqrt(excessSpeed * excessSpeed + (2.0 * mu) / distance);
}

double eccentricAnomaly(double eccentricity, double trueAnomaly) {
    double cosTrueAnomaly = std::cos(trueAnomaly);
    double E = std::acos((eccentricity + cosTrueAnomaly) / (1.0 + eccentricity * cosTrueAnomaly));
    if (trueAnomaly > PI) {
        E = TWO_PI - E;
    }
    return E;
}

double hyperbolicEccentricAnomaly(double eccentricity, double trueAnomaly) {
    double cosTrueAnomaly = std::cos(trueAnomaly);
    double F = std::acosh((eccentricity + cosTrueAnomaly) / (1.0 + eccentricity * cosTrueAnomaly));
    if (trueAnomaly >= PI && trueAnomaly <= TWO_PI) {
        F = -F;
    }
    return F;
}

double parabolicEccentricAnomaly(double trueAnomaly) {
    return std::tan(trueAnomaly / 2.0);
}

double meanAnomaly(double eccentricity, double eccentricAnomaly) {
    return eccentricAnomaly - eccentricity * std::sin(eccentricAnomaly);
}

double trueAnomalyFromEccentricAnomaly(double eccentricity, double eccentricAnomaly) {
    return 2.0 * std::atan2(
        std::sqrt(1.0 + eccentricity) * std::sin(eccentricAnomaly / 2.0),
        std::sqrt(1.0 - eccentricity) * std::cos(eccentricAnomaly / 2.0));
}

double roundToDays(double time) {
    return std::round(time / ONE_DAY) * ONE_DAY;
}

} // namespace orbitcraft::formulas
