/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __ORBITCRAFT_RENDEZVOUS_HPP
#define __ORBITCRAFT_RENDEZVOUS_HPP

#include <orbitcraft/maneuver.hpp>

namespace orbitcraft::rendezvous {

/**
 * Rendezvous between two different circular orbits in the same plane:
 * a Hohmann transfer started when the phase angle is right.
 * @throws GeometricInfeasibilityException if an orbit is not circular or the planes differ
 */
ManeuverSequence inCircularOrbit(const PlannerContext& context,
                                 const ObjectConfig& config,
                                 const ObjectState& state,
                                 const OrbitPosition& position,
                                 const OrbitPosition& targetPosition);

/**
 * Rendezvous with a target ahead or behind on the same orbit.
 *
 * At the next periapsis the object enters a phasing orbit whose period
 * differs from the current one by the phase lag spread over the given
 * number of revolutions, then burns back into the original orbit.
 *
 * @throws GeometricInfeasibilityException if the orbits are not the same
 */
ManeuverSequence inSameOrbit(const PlannerContext& context,
                             const ObjectConfig& config,
                             const OrbitPosition& position,
                             const OrbitPosition& targetPosition,
                             int phasingOrbits = 1);

/**
 * Picks the rendezvous method for the object and target orbits.
 * @throws GeometricInfeasibilityException for any other orbital relationship
 */
ManeuverSequence create(const PlannerContext& context,
                        const Body& object,
                        const OrbitPosition& targetPosition,
                        int phasingOrbits = 1);

} // namespace orbitcraft::rendezvous

#endif
