/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <orbitcraft/hohmann.hpp>
#include <orbitcraft/exceptions.hpp>

#include <cmath>
#include <format>
#include <stdexcept>

namespace orbitcraft::hohmann {

TransferBurns calculateBurn(double mu, double currentRadius, double newRadius) {
    double r1 = currentRadius;
    double r2 = newRadius;

    TransferBurns burns;
    burns.firstBurn = std::sqrt(mu / r1) * (std::sqrt((2.0 * r2) / (r1 + r2)) - 1.0);
    burns.secondBurn = std::sqrt(mu / r2) * (1.0 - std::sqrt((2.0 * r1) / (r1 + r2)));
    burns.coastTime = PI * std::sqrt(std::pow(r1 + r2, 3.0) / (8.0 * mu));
    return burns;
}

double timeToAlignment(const OrbitPosition& position, const OrbitPosition& targetPosition) {
    const Orbit& orbit = position.getOrbit();

    double r1 = orbit.getSemiMajorAxis();
    double r2 = targetPosition.getOrbit().getSemiMajorAxis();
    double a1 = position.getTrueAnomaly();
    double a2 = targetPosition.getTrueAnomaly();

    // Phase angle the target must lead by at departure
    double alpha = PI * (1.0 - (1.0 / (2.0 * std::sqrt(2.0))) * std::sqrt(std::pow(r1 / r2 + 1.0, 3.0)));

    double deltaAngle = r2 > r1 ? a2 - a1 : a1 - a2;
    if (deltaAngle < 0.0) {
        deltaAngle += TWO_PI;
    }

    double mu = orbit.getStandardGravitationalParameter();
    double w1 = std::sqrt(mu / std::pow(r1, 3.0));
    double w2 = std::sqrt(mu / std::pow(r2, 3.0));
    double angularDeltaSpeed = std::abs(w1 - w2);

    if (r2 > r1) {
        return std::abs(deltaAngle - alpha) / angularDeltaSpeed;
    }
    return std::abs(deltaAngle + alpha) / angularDeltaSpeed;
}

ManeuverSequence create(const PlannerContext& context,
                        const ObjectConfig& config,
                        const ObjectState& state,
                        const OrbitPosition& position,
                        double currentRadius,
                        double newRadius,
                        ManeuverTime maneuverTime) {
    const Orbit& orbit = position.getOrbit();
    if (!orbit.isCircular()) {
        throw GeometricInfeasibilityException(
            std::format("The orbit is not circular (e = {})", orbit.getEccentricity()));
    }

    double t1 = maneuverTime.resolve(position);

    // Burn along the velocity relative to the primary body at departure
    PropagatedState burn = afterTime(context.keplerSolver, config, state, orbit, t1);
    Vec3 dir1 = (burn.state.getVelocity() - burn.primaryBodyState.getVelocity()).normalize();
    Vec3 dir2 = -dir1;

    TransferBurns burns = calculateBurn(orbit.getStandardGravitationalParameter(), currentRadius, newRadius);
    context.notify(std::format("Hohmann transfer {:.0f} m -> {:.0f} m: burns {:.2f} m/s, {:.2f} m/s, coast {:.0f} s",
                               currentRadius, newRadius, burns.firstBurn, burns.secondBurn, burns.coastTime));

    return {
        OrbitalManeuver(context.currentTime + t1, dir1 * burns.firstBurn),
        OrbitalManeuver(context.currentTime + t1 + burns.coastTime, dir2 * burns.secondBurn)
    };
}

ManeuverSequence create(const PlannerContext& context, const Body& object,
                        double newRadius, ManeuverTime maneuverTime) {
    const Body* primaryBody = object.getPrimaryBody();
    if (primaryBody == nullptr) {
        throw std::invalid_argument("The object of reference cannot transfer: " + object.getName());
    }

    return create(context,
                  object.getConfig(),
                  object.getState(),
                  OrbitPosition::calculate(object),
                  object.getState().distance(primaryBody->getState()),
                  newRadius,
                  maneuverTime);
}

} // namespace orbitcraft::hohmann
