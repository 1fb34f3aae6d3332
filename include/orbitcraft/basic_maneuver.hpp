/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __ORBITCRAFT_BASIC_MANEUVER_HPP
#define __ORBITCRAFT_BASIC_MANEUVER_HPP

#include <orbitcraft/maneuver.hpp>

namespace orbitcraft::basic {

/**
 * Single burn at apoapsis that moves the periapsis.
 * @throws GeometricInfeasibilityException if the new periapsis is above the apoapsis
 */
ManeuverSequence changePeriapsis(double currentTime, const OrbitPosition& position, double newPeriapsis);
ManeuverSequence changePeriapsis(double currentTime, const Body& object, double newPeriapsis);

/**
 * Single burn at periapsis that moves the apoapsis.
 * @throws GeometricInfeasibilityException if the new apoapsis is below the periapsis
 */
ManeuverSequence changeApoapsis(double currentTime, const OrbitPosition& position, double newApoapsis);
ManeuverSequence changeApoapsis(double currentTime, const Body& object, double newApoapsis);

/**
 * Single burn at apoapsis that tilts the orbit to a new inclination.
 */
ManeuverSequence changeInclination(double currentTime, const OrbitPosition& position, double newInclination);
ManeuverSequence changeInclination(double currentTime, const Body& object, double newInclination);

} // namespace orbitcraft::basic

#endif
