/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __ORBITCRAFT_FORMULAS_HPP
#define __ORBITCRAFT_FORMULAS_HPP

#include <optional>
#include <utility>

namespace orbitcraft {

// ============================================================================
// Physical Constants
// ============================================================================

constexpr double GRAVITATIONAL_CONSTANT = 6.67408e-11;   // m³/(kg·s²)
constexpr double ASTRONOMICAL_UNIT = 149597870700.0;     // m
constexpr double STANDARD_GRAVITY = 9.80665;             // m/s²
constexpr double EARTH_STANDARD_GRAVITATIONAL_PARAMETER = 3.986004418e14;   // m³/s²

// Time constants (seconds)
constexpr double ONE_HOUR = 60.0 * 60.0;
constexpr double ONE_DAY = 24.0 * ONE_HOUR;
constexpr double SIDEREAL_DAY = 23.0 * 60.0 * 60.0 + 56.0 * 60.0 + 4.0916;

/**
 * Closed-form two-body formulas.
 *
 * All quantities are SI: meters, seconds, kilograms and radians.
 */
namespace formulas {

/** Semi-latus rectum p = a(1 - e²). */
double parameterFromSemiMajorAxis(double semiMajorAxis, double eccentricity);

/** Orbital period T = 2π/√μ · a^(3/2). */
double orbitalPeriod(double mu, double semiMajorAxis);

/** Inverse of orbitalPeriod. */
double semiMajorAxisFromOrbitalPeriod(double mu, double period);

/**
 * Time between two successive alignments of bodies with the given periods.
 * @return 0 when the periods differ by no more than 1e-2 seconds
 */
double synodicPeriod(double period1, double period2);

/** Sphere of influence radius a·(m_small/m_large)^(2/5). */
double sphereOfInfluence(double semiMajorAxis, double massSmaller, double massLarger);

/**
 * Finds the two true anomalies at which an orbit reaches the given distance.
 * @return {ν, 2π-ν} wrapped into [0, 2π], or nullopt if the distance is never reached
 */
std::optional<std::pair<double, double>> trueAnomalyAt(double distance, double parameter, double eccentricity);

/** Angular velocity at the given distance along an orbit with the given period. */
double angularVelocity(double semiMajorAxis, double eccentricity, double period, double distance);

/** Speed from the vis-viva equation v² = μ(2/r - 1/a). */
double visVivaSpeed(double mu, double distance, double semiMajorAxis);

/** Speed at distance r on a hyperbola with the given excess speed. */
double hyperbolicSpeed(double mu, double distance, double excessSpeed);

/** Eccentric anomaly E for a bound orbit, in [0, 2π]. */
double eccentricAnomaly(double eccentricity, double trueAnomaly);

/** Hyperbolic eccentric anomaly F, negative on the incoming branch. */
double hyperbolicEccentricAnomaly(double eccentricity, double trueAnomaly);

/** Parabolic eccentric anomaly D = tan(ν/2). */
double parabolicEccentricAnomaly(double trueAnomaly);

/** Mean anomaly M = E - e·sin(E). */
double meanAnomaly(double eccentricity, double eccentricAnomaly);

/** True anomaly from the eccentric anomaly of a bound orbit. */
double trueAnomalyFromEccentricAnomaly(double eccentricity, double eccentricAnomaly);

/** Rounds a duration to a whole number of days. */
double roundToDays(double time);

} // namespace formulas

} // namespace orbitcraft

#endif
