/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __ORBITCRAFT_CALCULATORS_HPP
#define __ORBITCRAFT_CALCULATORS_HPP

#include <orbitcraft/kepler.hpp>
#include <orbitcraft/orbit.hpp>

#include <optional>

namespace orbitcraft {

/**
 * Closest approach between two objects.
 */
struct Approach {
    double distance = 0.0;  ///< Minimum separation (m)
    double time = 0.0;      ///< Absolute time of the minimum separation (s)
};

/** Default sampling step of closestApproach() in seconds. */
constexpr double DEFAULT_APPROACH_STEP = 600.0 * 30.0;

/**
 * Finds the closest approach of two objects orbiting the same primary body
 * during one synodic period (one day when either orbit is unbound).
 *
 * Both orbits are sampled with the Kepler solver. The step is widened while
 * the separation grows, scaled by how fast it grows, so samples concentrate
 * around the minimum.
 *
 * @param solver Kepler solver used for sampling
 * @param config1 Configuration of the first object
 * @param position1 Orbit position of the first object
 * @param config2 Configuration of the second object
 * @param position2 Orbit position of the second object
 * @param primaryBodyState State of the common primary body; sample times are relative to it
 * @param deltaTime Base sampling step; 0 or less selects synodic period / 2000
 * @param workerThreads Number of threads the sampling window is split across
 * @return The approach, or nullopt when the periods are equal and the objects never realign
 * @throws GeometricInfeasibilityException if the primary bodies differ
 */
std::optional<Approach> closestApproach(const KeplerSolver& solver,
                                        const ObjectConfig& config1,
                                        const OrbitPosition& position1,
                                        const ObjectConfig& config2,
                                        const OrbitPosition& position2,
                                        const ObjectState& primaryBodyState,
                                        double deltaTime = DEFAULT_APPROACH_STEP,
                                        unsigned int workerThreads = 1);

/** Same as above, using the primary body's current state. */
std::optional<Approach> closestApproach(const KeplerSolver& solver,
                                        const ObjectConfig& config1,
                                        const OrbitPosition& position1,
                                        const ObjectConfig& config2,
                                        const OrbitPosition& position2,
                                        double deltaTime = DEFAULT_APPROACH_STEP,
                                        unsigned int workerThreads = 1);

/**
 * Time until an object on an unbound orbit leaves the sphere of influence
 * of its primary body.
 * @return nullopt for bound orbits, for a primary without a primary of its own,
 *         or when the crossing lies in the past
 */
std::optional<double> timeToLeaveSphereOfInfluence(const OrbitPosition& position);

/**
 * Time until an object hits the surface of its primary body.
 * @return nullopt when the periapsis clears the surface or the body has no radius
 */
std::optional<double> timeToImpact(const OrbitPosition& position);

} // namespace orbitcraft

#endif
