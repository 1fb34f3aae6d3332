/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __ORBITCRAFT_HOHMANN_HPP
#define __ORBITCRAFT_HOHMANN_HPP

#include <orbitcraft/maneuver.hpp>

namespace orbitcraft::hohmann {

/**
 * Burn magnitudes and coast time of a Hohmann transfer.
 */
struct TransferBurns {
    double firstBurn = 0.0;     ///< Δv at departure (m/s), negative when lowering the orbit
    double secondBurn = 0.0;    ///< Δv at arrival (m/s), negative when lowering the orbit
    double coastTime = 0.0;     ///< Time between the burns (s)
};

/**
 * Closed form Hohmann transfer between two coplanar circular orbits.
 *
 * @param mu Standard gravitational parameter of the primary body
 * @param currentRadius Radius of the current orbit
 * @param newRadius Radius of the target orbit
 */
TransferBurns calculateBurn(double mu, double currentRadius, double newRadius);

/**
 * Time until the phase angle between an object and a target is the one a
 * Hohmann transfer requires, so that the object arrives where the target is.
 */
double timeToAlignment(const OrbitPosition& position, const OrbitPosition& targetPosition);

/**
 * Plans a Hohmann transfer between circular orbits.
 *
 * The first burn is along the object's prograde direction when the
 * maneuver time is reached, the second one half an orbit later along
 * the opposite direction.
 *
 * @param context Solvers and current time
 * @param config Configuration of the object
 * @param state Current absolute state of the object
 * @param position Current orbit position of the object
 * @param currentRadius Radius of the current orbit
 * @param newRadius Radius of the target orbit
 * @param maneuverTime When to start the transfer
 * @throws GeometricInfeasibilityException if the current orbit is not circular
 */
ManeuverSequence create(const PlannerContext& context,
                        const ObjectConfig& config,
                        const ObjectState& state,
                        const OrbitPosition& position,
                        double currentRadius,
                        double newRadius,
                        ManeuverTime maneuverTime);

/** Same as above, with the current radius taken from the object's distance to its primary body. */
ManeuverSequence create(const PlannerContext& context, const Body& object,
                        double newRadius, ManeuverTime maneuverTime);

} // namespace orbitcraft::hohmann

#endif
