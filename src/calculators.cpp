/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <orbitcraft/calculators.hpp>
#include <orbitcraft/exceptions.hpp>
#include <orbitcraft/formulas.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <exception>
#include <limits>
#include <stdexcept>
#include <thread>
#include <vector>

using spdlog::debug;

namespace orbitcraft {

// Sampling steps per synodic period when no step is given
constexpr double SYNODIC_SAMPLES = 2000.0;

// Largest step multiplier while the separation is growing
constexpr double MAX_STEP_RATE = 50.0;

// Treat a true anomaly this close to 2π as 0
constexpr double FULL_TURN_EPSILON = 1e-5;

namespace {

/**
 * Samples one window [start, end] of the closest approach search.
 */
struct ApproachWindow {
    double start = 0.0;
    double end = 0.0;
    double minDistance = std::numeric_limits<double>::max();
    double minTime = 0.0;
};

void sampleWindow(const KeplerSolver& solver,
                  const ObjectConfig& config1, const ObjectState& state1, const Orbit& orbit1,
                  const ObjectConfig& config2, const ObjectState& state2, const Orbit& orbit2,
                  const ObjectState& primaryBodyState,
                  double deltaTime,
                  ApproachWindow& window) {
    double maxChangeRate = 0.0;
    double prevDistance = 0.0;
    bool first = true;

    double t = window.start;
    while (t <= window.end) {
        ObjectState s1 = solver.solve(config1, primaryBodyState, state1, orbit1, primaryBodyState, t);
        ObjectState s2 = solver.solve(config2, primaryBodyState, state2, orbit2, primaryBodyState, t);

        double distance = s1.distance(s2);
        if (distance < window.minDistance) {
            window.minDistance = distance;
            window.minTime = t;
        }

        // Move faster while the objects are separating
        double stepRate = 1.0;
        if (!first) {
            double changeRate = (prevDistance - distance) / deltaTime;
            maxChangeRate = std::max(maxChangeRate, std::abs(changeRate));
            if (changeRate < 0.0 && maxChangeRate > 0.0) {
                stepRate = std::clamp(lerp(1.0, MAX_STEP_RATE, std::abs(changeRate) / maxChangeRate),
                                      1.0, MAX_STEP_RATE);
            }
        }

        t += stepRate * deltaTime;
        prevDistance = distance;
        first = false;
    }
}

} // namespace

std::optional<Approach> closestApproach(const KeplerSolver& solver,
                                        const ObjectConfig& config1,
                                        const OrbitPosition& position1,
                                        const ObjectConfig& config2,
                                        const OrbitPosition& position2,
                                        const ObjectState& primaryBodyState,
                                        double deltaTime,
                                        unsigned int workerThreads) {
    const Orbit& orbit1 = position1.getOrbit();
    const Orbit& orbit2 = position2.getOrbit();

    if (orbit1.getPrimaryBody() != orbit2.getPrimaryBody()) {
        throw GeometricInfeasibilityException("Both orbits must be around a common primary body");
    }

    double synodicPeriod = formulas::synodicPeriod(orbit1.getPeriod(), orbit2.getPeriod());
    if (synodicPeriod == 0.0) {
        return std::nullopt;
    }

    if (orbit1.isUnbound() || orbit2.isUnbound()) {
        synodicPeriod = ONE_DAY;
    }

    if (deltaTime <= 0.0) {
        deltaTime = synodicPeriod / SYNODIC_SAMPLES;
    }

    ObjectState state1 = position1.calculateState(primaryBodyState);
    ObjectState state2 = position2.calculateState(primaryBodyState);

    workerThreads = std::max(1u, workerThreads);
    std::vector<ApproachWindow> windows(workerThreads);
    double windowLength = synodicPeriod / workerThreads;
    for (unsigned int i = 0; i < workerThreads; i++) {
        windows[i].start = i * windowLength;
        windows[i].end = (i + 1 == workerThreads) ? synodicPeriod : (i + 1) * windowLength;
    }

    if (workerThreads == 1) {
        sampleWindow(solver, config1, state1, orbit1, config2, state2, orbit2,
                     primaryBodyState, deltaTime, windows[0]);
    } else {
        std::vector<std::thread> workers;
        std::vector<std::exception_ptr> errors(workerThreads);
        for (unsigned int i = 0; i < workerThreads; i++) {
            workers.emplace_back([&, i]() {
                try {
                    sampleWindow(solver, config1, state1, orbit1, config2, state2, orbit2,
                                 primaryBodyState, deltaTime, windows[i]);
                } catch (...) {
                    errors[i] = std::current_exception();
                }
            });
        }
        for (auto& worker : workers) {
            worker.join();
        }
        for (auto& error : errors) {
            if (error) {
                std::rethrow_exception(error);
            }
        }
    }

    // Windows are ordered by time, so a strict comparison keeps the earliest tie
    const ApproachWindow* best = &windows[0];
    for (const auto& window : windows) {
        if (window.minDistance < best->minDistance) {
            best = &window;
        }
    }

    debug("Closest approach {:.1f} m after {:.1f} s (synodic period {:.1f} s, step {:.1f} s)",
          best->minDistance, best->minTime, synodicPeriod, deltaTime);

    Approach approach;
    approach.distance = best->minDistance;
    approach.time = primaryBodyState.getTime() + best->minTime;
    return approach;
}

std::optional<Approach> closestApproach(const KeplerSolver& solver,
                                        const ObjectConfig& config1,
                                        const OrbitPosition& position1,
                                        const ObjectConfig& config2,
                                        const OrbitPosition& position2,
                                        double deltaTime,
                                        unsigned int workerThreads) {
    const Body* primaryBody = position1.getOrbit().getPrimaryBody();
    if (primaryBody == nullptr) {
        throw std::invalid_argument("Orbit has no primary body");
    }
    return closestApproach(solver, config1, position1, config2, position2,
                           primaryBody->getState(), deltaTime, workerThreads);
}

// Picks the root closest to the current true anomaly
static double nearestAnomaly(double trueAnomaly, const std::pair<double, double>& roots) {
    if (std::abs(trueAnomaly - roots.first) < std::abs(trueAnomaly - roots.second)) {
        return roots.first;
    }
    return roots.second;
}

std::optional<double> timeToLeaveSphereOfInfluence(const OrbitPosition& position) {
    const Orbit& orbit = position.getOrbit();
    if (!orbit.isUnbound()) {
        return std::nullopt;
    }

    const Body* soiBody = orbit.getPrimaryBody();
    if (soiBody == nullptr || soiBody->getPrimaryBody() == nullptr) {
        return std::nullopt;
    }
    const Body* nextSoiBody = soiBody->getPrimaryBody();

    // Close to a full turn counts as periapsis, otherwise the time would be negative
    double trueAnomaly = position.getTrueAnomaly();
    if (TWO_PI - trueAnomaly <= FULL_TURN_EPSILON) {
        trueAnomaly = 0.0;
    }

    double soi = formulas::sphereOfInfluence(
        Orbit::calculate(*soiBody).getSemiMajorAxis(),
        soiBody->getMass(),
        nextSoiBody->getMass());

    auto roots = formulas::trueAnomalyAt(soi, orbit.getParameter(), orbit.getEccentricity());
    if (!roots) {
        return std::nullopt;
    }

    double leaveAngle = nearestAnomaly(trueAnomaly, *roots);
    double timeToLeave = position.withTrueAnomaly(trueAnomaly).timeToTrueAnomaly(leaveAngle);
    if (timeToLeave > 0.0) {
        return timeToLeave;
    }
    return std::nullopt;
}

std::optional<double> timeToImpact(const OrbitPosition& position) {
    const Orbit& orbit = position.getOrbit();
    const Body* primaryBody = orbit.getPrimaryBody();
    if (primaryBody == nullptr || !primaryBody->hasRadius()) {
        return std::nullopt;
    }

    double radius = primaryBody->getRadius();
    if (orbit.getPeriapsis() > radius) {
        return std::nullopt;
    }

    auto roots = formulas::trueAnomalyAt(radius, orbit.getParameter(), orbit.getEccentricity());
    if (!roots) {
        return std::nullopt;
    }

    return position.timeToTrueAnomaly(nearestAnomaly(position.getTrueAnomaly(), *roots));
}

} // namespace orbitcraft
