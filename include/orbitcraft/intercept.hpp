/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __ORBITCRAFT_INTERCEPT_HPP
#define __ORBITCRAFT_INTERCEPT_HPP

#include <orbitcraft/maneuver.hpp>

#include <optional>
#include <vector>

namespace orbitcraft::intercept {

/**
 * A grid cell of the intercept search that has a feasible transfer.
 */
struct PossibleLaunch {
    double startTime = 0.0;     ///< Launch time relative to now (s)
    double duration = 0.0;      ///< Transfer duration (s)
    Vec3 deltaVelocity;         ///< Burn at launch

    double arrivalTime() const { return startTime + duration; }
};

/**
 * Search window of the intercept grid. Both axes are sampled with the same
 * step, bounds included.
 */
struct InterceptSettings {
    double minInterceptTime = 0.0;          ///< Shortest transfer duration (s)
    double maxInterceptTime = 0.0;          ///< Longest transfer duration (s)
    double minLaunchTime = 0.0;             ///< Earliest launch, relative to now (s)
    double maxLaunchTime = 0.0;             ///< Latest launch, relative to now (s)
    double deltaTime = 60.0;                ///< Grid step (s)
    bool listPossibleLaunches = false;      ///< Collect every feasible cell
    std::optional<double> allowedDeltaV;    ///< Stop searching once a burn this small is found
};

/**
 * Outcome of the grid search.
 */
struct InterceptResult {
    std::optional<PossibleLaunch> best;             ///< Lowest Δv cell, nullopt if none is feasible
    std::vector<PossibleLaunch> possibleLaunches;   ///< Every feasible cell, when requested
};

/**
 * Searches launch times and transfer durations for the cheapest transfer
 * from an object to a target orbiting the same primary body.
 *
 * Each cell propagates both objects to the launch time, the target to the
 * arrival time, and solves Lambert's problem both ways round. Objects
 * resting on a surface only accept transfers that clear the body.
 *
 * The launch axis is split across context.workerThreads threads. The best
 * cell is the one with the lowest Δv, then the earliest launch, then the
 * shortest duration, so the result does not depend on the thread count.
 * Once a cell within allowedDeltaV is found the remaining workers stop.
 *
 * @param context Solvers, current time, worker threads and observer
 * @param primaryBody Common primary body
 * @param config Configuration of the object
 * @param state Current absolute state of the object
 * @param position Current orbit position of the object
 * @param targetConfig Configuration of the target
 * @param targetPosition Current orbit position of the target
 * @param settings Search window
 */
InterceptResult search(const PlannerContext& context,
                       const Body& primaryBody,
                       const ObjectConfig& config,
                       const ObjectState& state,
                       const OrbitPosition& position,
                       const ObjectConfig& targetConfig,
                       const OrbitPosition& targetPosition,
                       const InterceptSettings& settings);

/**
 * Plans an intercept of a target by an object.
 * @return The launch burn and an empty marker burn at arrival, or nullopt if no cell is feasible
 */
std::optional<ManeuverSequence> create(const PlannerContext& context,
                                       const Body& object,
                                       const ObjectConfig& targetConfig,
                                       const OrbitPosition& targetPosition,
                                       const InterceptSettings& settings);

} // namespace orbitcraft::intercept

#endif
