/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <orbitcraft/basic_maneuver.hpp>
#include <orbitcraft/exceptions.hpp>
#include <orbitcraft/formulas.hpp>

#include <spdlog/spdlog.h>

#include <format>

using spdlog::debug;

namespace orbitcraft::basic {

// Orbit through the given apsides, keeping the orientation of the old one
static Orbit orbitThroughApsides(const Orbit& orbit, double periapsis, double apoapsis) {
    double semiMajorAxis = (periapsis + apoapsis) / 2.0;
    double eccentricity = (apoapsis - periapsis) / (apoapsis + periapsis);
    return orbit
        .withEccentricity(eccentricity)
        .withParameter(formulas::parameterFromSemiMajorAxis(semiMajorAxis, eccentricity));
}

ManeuverSequence changePeriapsis(double currentTime, const OrbitPosition& position, double newPeriapsis) {
    const Orbit& orbit = position.getOrbit();
    if (newPeriapsis > orbit.getApoapsis()) {
        throw GeometricInfeasibilityException(
            std::format("New periapsis ({:.0f} m) cannot be higher than the apoapsis ({:.0f} m)",
                        newPeriapsis, orbit.getApoapsis()));
    }

    ObjectState apoapsisState = orbit.calculateState(PI);
    Orbit newOrbit = orbitThroughApsides(orbit, newPeriapsis, orbit.getApoapsis());
    Vec3 deltaVelocity = newOrbit.calculateState(PI).getVelocity() - apoapsisState.getVelocity();

    debug("Change periapsis {:.0f} -> {:.0f} m: dv = {:.2f} m/s",
          orbit.getPeriapsis(), newPeriapsis, deltaVelocity.magnitude());
    return ManeuverSequence::single(
        OrbitalManeuver::burn(currentTime, position, deltaVelocity, ManeuverTime::apoapsis()));
}

ManeuverSequence changePeriapsis(double currentTime, const Body& object, double newPeriapsis) {
    return changePeriapsis(currentTime, OrbitPosition::calculate(object), newPeriapsis);
}

ManeuverSequence changeApoapsis(double currentTime, const OrbitPosition& position, double newApoapsis) {
    const Orbit& orbit = position.getOrbit();
    if (newApoapsis < orbit.getPeriapsis()) {
        throw GeometricInfeasibilityException(
            std::format("New apoapsis ({:.0f} m) cannot be lower than the periapsis ({:.0f} m)",
                        newApoapsis, orbit.getPeriapsis()));
    }

    ObjectState periapsisState = orbit.calculateState(0.0);
    Orbit newOrbit = orbitThroughApsides(orbit, orbit.getPeriapsis(), newApoapsis);
    Vec3 deltaVelocity = newOrbit.calculateState(0.0).getVelocity() - periapsisState.getVelocity();

    debug("Change apoapsis {:.0f} -> {:.0f} m: dv = {:.2f} m/s",
          orbit.getApoapsis(), newApoapsis, deltaVelocity.magnitude());
    return ManeuverSequence::single(
        OrbitalManeuver::burn(currentTime, position, deltaVelocity, ManeuverTime::periapsis()));
}

ManeuverSequence changeApoapsis(double currentTime, const Body& object, double newApoapsis) {
    return changeApoapsis(currentTime, OrbitPosition::calculate(object), newApoapsis);
}

ManeuverSequence changeInclination(double currentTime, const OrbitPosition& position, double newInclination) {
    Orbit orbit = position.getOrbit().withArgumentOfPeriapsis(0.0);

    Vec3 velocity = orbit.calculateState(PI).getVelocity();
    Vec3 velocityNext = orbit.withInclination(newInclination).calculateState(PI).getVelocity();
    Vec3 deltaVelocity = velocityNext - velocity;

    debug("Change inclination {:.4f} -> {:.4f} rad: dv = {:.2f} m/s",
          orbit.getInclination(), newInclination, deltaVelocity.magnitude());
    return ManeuverSequence::single(
        OrbitalManeuver::burn(currentTime, position, deltaVelocity, ManeuverTime::apoapsis()));
}

ManeuverSequence changeInclination(double currentTime, const Body& object, double newInclination) {
    return changeInclination(currentTime, OrbitPosition::calculate(object), newInclination);
}

} // namespace orbitcraft::basic
