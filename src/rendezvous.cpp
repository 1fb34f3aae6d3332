/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <orbitcraft/rendezvous.hpp>
#include <orbitcraft/exceptions.hpp>
#include <orbitcraft/hohmann.hpp>

#include <cmath>
#include <format>
#include <stdexcept>

namespace orbitcraft::rendezvous {

ManeuverSequence inCircularOrbit(const PlannerContext& context,
                                 const ObjectConfig& config,
                                 const ObjectState& state,
                                 const OrbitPosition& position,
                                 const OrbitPosition& targetPosition) {
    const Orbit& orbit = position.getOrbit();
    const Orbit& targetOrbit = targetPosition.getOrbit();

    if (!(orbit.isCircular() && targetOrbit.isCircular())) {
        throw GeometricInfeasibilityException("Both orbits must be circular");
    }
    if (!orbit.samePlane(targetOrbit)) {
        throw GeometricInfeasibilityException("Both orbits must lie in the same plane");
    }

    double t = hohmann::timeToAlignment(position, targetPosition);
    context.notify(std::format("Rendezvous in circular orbit: transfer starts in {:.0f} s", t));

    return hohmann::create(context, config, state, position,
                           orbit.getSemiMajorAxis(), targetOrbit.getSemiMajorAxis(),
                           ManeuverTime::timeFromNow(t));
}

ManeuverSequence inSameOrbit(const PlannerContext& context,
                             const ObjectConfig& config,
                             const OrbitPosition& position,
                             const OrbitPosition& targetPosition,
                             int phasingOrbits) {
    const Orbit& orbit = position.getOrbit();
    const Orbit& targetOrbit = targetPosition.getOrbit();

    if (!orbit.sameOrbit(targetOrbit)) {
        throw GeometricInfeasibilityException("Both orbits must be the same");
    }
    if (phasingOrbits < 1) {
        throw std::invalid_argument("At least one phasing orbit is required");
    }

    const Body& primaryBody = *orbit.getPrimaryBody();
    double mu = primaryBody.getStandardGravitationalParameter();
    double n = static_cast<double>(phasingOrbits);

    // Where the target is when we reach periapsis
    double timeToPeriapsis = position.timeToPeriapsis();
    ObjectState primaryBodyState = primaryBody.getState();
    ObjectState targetState = targetPosition.calculateState(primaryBodyState);
    ObjectState targetAtPeriapsis = context.keplerSolver.solve(
        config, primaryBodyState, targetState, targetOrbit, primaryBodyState, timeToPeriapsis);
    double deltaTrueAnomaly = OrbitPosition::calculate(primaryBody, primaryBodyState, targetAtPeriapsis).getTrueAnomaly();

    // Period of the phasing orbit
    double T1 = orbit.getPeriod();
    double e1 = orbit.getEccentricity();
    double E = 2.0 * std::atan(std::sqrt((1.0 - e1) / (1.0 + e1)) * std::tan(deltaTrueAnomaly / 2.0));
    double t = (T1 / (TWO_PI * n)) * (E - e1 * std::sin(E));
    double T2 = (T1 - t) * n;

    // Phasing orbit shares the periapsis of the current one
    double a2 = std::pow(mu * std::pow(T2 / (TWO_PI * n), 2.0), 1.0 / 3.0);
    double rp = orbit.getPeriapsis();
    double ra = 2.0 * a2 - rp;

    double h1 = std::sqrt(orbit.getParameter() * mu);
    double h2 = std::sqrt(2.0 * mu) * std::sqrt((ra * rp) / (ra + rp));
    double deltaV = (h2 - h1) / rp;

    // Prograde at periapsis, relative to the primary body
    Vec3 dir = position.withTrueAnomaly(0.0).calculateState(ObjectState()).prograde();

    context.notify(std::format("Rendezvous in same orbit: phase {:.4f} rad, phasing period {:.0f} s, dv {:.2f} m/s",
                               deltaTrueAnomaly, T2, deltaV));

    return {
        OrbitalManeuver::burn(context.currentTime, position, dir * deltaV,
                              ManeuverTime::timeFromNow(timeToPeriapsis)),
        OrbitalManeuver::burn(context.currentTime, position, -dir * deltaV,
                              ManeuverTime::timeFromNow(timeToPeriapsis + T2))
    };
}

ManeuverSequence create(const PlannerContext& context,
                        const Body& object,
                        const OrbitPosition& targetPosition,
                        int phasingOrbits) {
    OrbitPosition position = OrbitPosition::calculate(object);
    const Orbit& orbit = position.getOrbit();
    const Orbit& targetOrbit = targetPosition.getOrbit();

    if (orbit.sameOrbit(targetOrbit)) {
        return inSameOrbit(context, object.getConfig(), position, targetPosition, phasingOrbits);
    }

    if (orbit.isCircular() && targetOrbit.isCircular()) {
        return inCircularOrbit(context, object.getConfig(), object.getState(), position, targetPosition);
    }

    throw GeometricInfeasibilityException("Current orbit not supported");
}

} // namespace orbitcraft::rendezvous
