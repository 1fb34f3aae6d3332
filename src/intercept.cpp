/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <orbitcraft/intercept.hpp>
#include <orbitcraft/exceptions.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <cmath>
#include <cstddef>
#include <exception>
#include <format>
#include <stdexcept>
#include <thread>

using spdlog::debug;

namespace orbitcraft::intercept {

// Escape trajectories from a surface are checked for this long
constexpr double MAX_IMPACT_CHECK_TIME = 1000.0;

// Sampling step of the escape trajectory check
constexpr double IMPACT_CHECK_DELTA_TIME = 100.0;

namespace {

/**
 * Inputs shared by every cell of one search.
 */
struct SearchGrid {
    const PlannerContext& context;
    const Body& primaryBody;
    const ObjectConfig& config;
    const ObjectConfig& targetConfig;
    const Orbit& objectOrbit;
    const Orbit& targetOrbit;
    const InterceptSettings& settings;

    ObjectState objectInitial;
    ObjectState targetInitial;
    ObjectState primaryBodyInitial;
    Orbit primaryBodyOrbit;
    bool stationary = false;

    std::size_t launchCount = 0;
    std::size_t durationCount = 0;
};

/**
 * Best cell and feasible cells found by one worker.
 */
struct WorkerResult {
    std::optional<PossibleLaunch> best;
    std::vector<PossibleLaunch> possibleLaunches;
    std::size_t cellsEvaluated = 0;
    std::exception_ptr error;
};

// Lowest Δv first, then the earliest launch, then the shortest transfer
bool isBetter(const PossibleLaunch& candidate, const PossibleLaunch& current) {
    double candidateDeltaV = candidate.deltaVelocity.magnitude();
    double currentDeltaV = current.deltaVelocity.magnitude();
    if (candidateDeltaV != currentDeltaV) {
        return candidateDeltaV < currentDeltaV;
    }
    if (candidate.startTime != current.startTime) {
        return candidate.startTime < current.startTime;
    }
    return candidate.duration < current.duration;
}

std::size_t stepCount(double min, double max, double step) {
    if (max < min) {
        return 0;
    }
    return static_cast<std::size_t>(std::floor((max - min) / step + 1e-9)) + 1;
}

// State of the primary body after the given time from the start of the search
ObjectState primaryBodyStateAfter(const SearchGrid& grid, double time) {
    if (grid.primaryBody.isObjectOfReference()) {
        return grid.primaryBodyInitial;
    }

    const ObjectState& nextPrimaryState = grid.primaryBody.getPrimaryBody()->getState();
    return grid.context.keplerSolver.solve(
        grid.primaryBody.getConfig(),
        nextPrimaryState,
        grid.primaryBodyInitial,
        grid.primaryBodyOrbit,
        nextPrimaryState,
        time);
}

bool isValidLaunch(const SearchGrid& grid, const ObjectState& launchState, const ObjectState& primaryLaunchState) {
    if (!launchState.getVelocity().isFinite()) {
        return false;
    }

    if (!grid.stationary) {
        return true;
    }

    // The escape trajectory must not hit the body it launched from
    Orbit launchOrbit = OrbitPosition::calculate(grid.primaryBody, primaryLaunchState, launchState).getOrbit();
    double minDistance = grid.primaryBody.getRadius() + grid.config.getRadius();
    for (double t = IMPACT_CHECK_DELTA_TIME; t <= MAX_IMPACT_CHECK_TIME; t += IMPACT_CHECK_DELTA_TIME) {
        ObjectState nextState = grid.context.keplerSolver.solve(
            grid.config, primaryLaunchState, launchState, launchOrbit, primaryLaunchState, t);
        if (nextState.getPosition().distance(primaryLaunchState.getPosition()) <= minDistance) {
            return false;
        }
    }

    return true;
}

std::optional<Vec3> calculateIntercept(const SearchGrid& grid,
                                       const ObjectState& primaryBodyStateAtLaunch,
                                       const ObjectState& objectLaunchState,
                                       const ObjectState& targetLaunchState,
                                       double launchTime,
                                       double interceptTime) {
    if (interceptTime <= 0.0) {
        return std::nullopt;
    }

    try {
        ObjectState primaryBodyStateAtIntercept = primaryBodyStateAfter(grid, launchTime + interceptTime);
        ObjectState targetInterceptState = grid.context.keplerSolver.solve(
            grid.targetConfig,
            primaryBodyStateAtLaunch,
            targetLaunchState,
            grid.targetOrbit,
            primaryBodyStateAtIntercept,
            interceptTime);

        LambertSolution shortWay = grid.context.lambertSolver.solve(
            grid.primaryBody, primaryBodyStateAtLaunch, primaryBodyStateAtIntercept,
            objectLaunchState.getPosition(), targetInterceptState.getPosition(), interceptTime, true);
        LambertSolution longWay = grid.context.lambertSolver.solve(
            grid.primaryBody, primaryBodyStateAtLaunch, primaryBodyStateAtIntercept,
            objectLaunchState.getPosition(), targetInterceptState.getPosition(), interceptTime, false);

        Vec3 shortDeltaV = shortWay.velocity1 - objectLaunchState.getVelocity();
        Vec3 longDeltaV = longWay.velocity1 - objectLaunchState.getVelocity();

        // A branch that did not give finite velocities is never chosen
        bool shortFinite = shortDeltaV.isFinite();
        bool longFinite = longDeltaV.isFinite();

        ObjectState shortLaunch(objectLaunchState.getTime(), objectLaunchState.getPosition(), shortWay.velocity1);
        if (shortFinite && (!longFinite || shortDeltaV.magnitude() < longDeltaV.magnitude())
            && isValidLaunch(grid, shortLaunch, primaryBodyStateAtLaunch)) {
            return shortDeltaV;
        }

        ObjectState longLaunch(objectLaunchState.getTime(), objectLaunchState.getPosition(), longWay.velocity1);
        if (longFinite && isValidLaunch(grid, longLaunch, primaryBodyStateAtLaunch)) {
            return longDeltaV;
        }
    } catch (const NumericNonConvergenceException& e) {
        debug("No intercept for launch {:.0f} s, duration {:.0f} s: {}", launchTime, interceptTime, e.what());
    } catch (const GeometricInfeasibilityException& e) {
        debug("No intercept for launch {:.0f} s, duration {:.0f} s: {}", launchTime, interceptTime, e.what());
    }

    return std::nullopt;
}

void searchLaunches(const SearchGrid& grid, std::size_t firstLaunch, std::size_t lastLaunch,
                    std::atomic<bool>& cancelled, WorkerResult& result) {
    const InterceptSettings& settings = grid.settings;
    const KeplerSolver& solver = grid.context.keplerSolver;

    for (std::size_t i = firstLaunch; i < lastLaunch; i++) {
        if (cancelled.load()) {
            return;
        }

        double launchTime = settings.minLaunchTime + i * settings.deltaTime;

        ObjectState primaryBodyStateAtLaunch;
        ObjectState objectLaunchState;
        ObjectState targetLaunchState;
        try {
            primaryBodyStateAtLaunch = primaryBodyStateAfter(grid, launchTime);
            objectLaunchState = solver.solve(
                grid.config, grid.primaryBodyInitial, grid.objectInitial, grid.objectOrbit,
                primaryBodyStateAtLaunch, launchTime);
            targetLaunchState = solver.solve(
                grid.targetConfig, grid.primaryBodyInitial, grid.targetInitial, grid.targetOrbit,
                primaryBodyStateAtLaunch, launchTime);
        } catch (const NumericNonConvergenceException& e) {
            debug("Skipping launch {:.0f} s: {}", launchTime, e.what());
            result.cellsEvaluated += grid.durationCount;
            continue;
        }

        for (std::size_t j = 0; j < grid.durationCount; j++) {
            if (cancelled.load()) {
                return;
            }

            double interceptTime = settings.minInterceptTime + j * settings.deltaTime;
            auto deltaV = calculateIntercept(grid, primaryBodyStateAtLaunch, objectLaunchState,
                                             targetLaunchState, launchTime, interceptTime);
            result.cellsEvaluated++;
            if (!deltaV) {
                continue;
            }

            PossibleLaunch launch{launchTime, interceptTime, *deltaV};
            if (settings.listPossibleLaunches) {
                result.possibleLaunches.push_back(launch);
            }

            if (!result.best || isBetter(launch, *result.best)) {
                result.best = launch;
                if (settings.allowedDeltaV && deltaV->magnitude() <= *settings.allowedDeltaV) {
                    cancelled.store(true);
                    return;
                }
            }
        }
    }
}

} // namespace

InterceptResult search(const PlannerContext& context,
                       const Body& primaryBody,
                       const ObjectConfig& config,
                       const ObjectState& state,
                       const OrbitPosition& position,
                       const ObjectConfig& targetConfig,
                       const OrbitPosition& targetPosition,
                       const InterceptSettings& settings) {
    if (settings.deltaTime <= 0.0) {
        throw std::invalid_argument("The intercept search step must be positive");
    }

    SearchGrid grid{context, primaryBody, config, targetConfig, position.getOrbit(), targetPosition.getOrbit(), settings};
    grid.primaryBodyInitial = primaryBody.getState();
    grid.objectInitial = state;
    grid.targetInitial = targetPosition.calculateState(grid.primaryBodyInitial);
    grid.stationary = state.hasImpacted();
    if (!primaryBody.isObjectOfReference()) {
        grid.primaryBodyOrbit = Orbit::calculate(primaryBody);
    }
    grid.launchCount = stepCount(settings.minLaunchTime, settings.maxLaunchTime, settings.deltaTime);
    grid.durationCount = stepCount(settings.minInterceptTime, settings.maxInterceptTime, settings.deltaTime);

    std::size_t workerCount = std::clamp<std::size_t>(context.workerThreads, 1, std::max<std::size_t>(1, grid.launchCount));
    std::vector<WorkerResult> results(workerCount);
    std::atomic<bool> cancelled{false};

    // Contiguous blocks of launch times, in order
    std::size_t blockSize = (grid.launchCount + workerCount - 1) / workerCount;
    auto firstLaunch = [&](std::size_t worker) { return std::min(grid.launchCount, worker * blockSize); };

    if (workerCount == 1) {
        searchLaunches(grid, 0, grid.launchCount, cancelled, results[0]);
    } else {
        std::vector<std::thread> workers;
        for (std::size_t w = 0; w < workerCount; w++) {
            workers.emplace_back([&, w]() {
                try {
                    searchLaunches(grid, firstLaunch(w), firstLaunch(w + 1), cancelled, results[w]);
                } catch (...) {
                    results[w].error = std::current_exception();
                    cancelled.store(true);
                }
            });
        }
        for (auto& worker : workers) {
            worker.join();
        }
    }

    InterceptResult result;
    std::size_t cellsEvaluated = 0;
    for (auto& worker : results) {
        if (worker.error) {
            std::rethrow_exception(worker.error);
        }
        cellsEvaluated += worker.cellsEvaluated;
        if (worker.best && (!result.best || isBetter(*worker.best, *result.best))) {
            result.best = worker.best;
        }
        result.possibleLaunches.insert(result.possibleLaunches.end(),
                                       worker.possibleLaunches.begin(), worker.possibleLaunches.end());
    }

    if (result.best) {
        context.notify(std::format("Intercept: {} of {} cells searched, best dv {:.2f} m/s, launch {:.0f} s, duration {:.0f} s",
                                   cellsEvaluated, grid.launchCount * grid.durationCount,
                                   result.best->deltaVelocity.magnitude(), result.best->startTime, result.best->duration));
    } else {
        context.notify(std::format("Intercept: no feasible transfer in {} cells", cellsEvaluated));
    }
    return result;
}

std::optional<ManeuverSequence> create(const PlannerContext& context,
                                       const Body& object,
                                       const ObjectConfig& targetConfig,
                                       const OrbitPosition& targetPosition,
                                       const InterceptSettings& settings) {
    const Body* primaryBody = object.getPrimaryBody();
    if (primaryBody == nullptr) {
        throw std::invalid_argument("The object of reference cannot intercept: " + object.getName());
    }

    OrbitPosition position = OrbitPosition::calculate(object);
    InterceptResult result = search(context, *primaryBody, object.getConfig(), object.getState(), position,
                                    targetConfig, targetPosition, settings);
    if (!result.best) {
        return std::nullopt;
    }

    const PossibleLaunch& launch = *result.best;
    return ManeuverSequence{
        OrbitalManeuver::burn(context.currentTime, position, launch.deltaVelocity,
                              ManeuverTime::timeFromNow(launch.startTime)),
        OrbitalManeuver::burn(context.currentTime, position, Vec3(),
                              ManeuverTime::timeFromNow(launch.arrivalTime()))
    };
}

} // namespace orbitcraft::intercept
