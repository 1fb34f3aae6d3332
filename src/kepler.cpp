/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <orbitcraft/kepler.hpp>
#include <orbitcraft/exceptions.hpp>

#include <spdlog/spdlog.h>

#include <cmath>
#include <format>
#include <random>
#include <stdexcept>

using spdlog::debug;

namespace orbitcraft {

// Above this magnitude the hyperbolic initial guess diverges
constexpr double MAX_HYPERBOLIC_GUESS = 100.0;

// ============================================================================
// KeplerSolver
// ============================================================================

ObjectState KeplerSolver::propagate(const ObjectState& primaryBodyState,
                                    const ObjectState& state,
                                    const Orbit& orbit,
                                    double time) const {
    return solve(ObjectConfig(), primaryBodyState, state, orbit, primaryBodyState, time);
}

// ============================================================================
// UniversalVariableKeplerSolver
// ============================================================================

UniversalVariableKeplerSolver::UniversalVariableKeplerSolver(const SolverSettings& settings)
    : tolerance_(settings.keplerTolerance), maxIterations_(settings.keplerMaxIterations) {}

double UniversalVariableKeplerSolver::initialGuess(const Orbit& orbit, const Vec3& r0, const Vec3& v0,
                                                   double time, double sqrtMu, double alpha) const {
    if (orbit.isBound()) {
        return sqrtMu * time * alpha;
    }

    if (orbit.isHyperbolic()) {
        double a = 1.0 / alpha;
        double mu = sqrtMu * sqrtMu;
        double sign = time < 0.0 ? -1.0 : 1.0;
        double lnFactor = (-2.0 * mu * time)
                          / (a * (r0.dot(v0) + sign * std::sqrt(-mu * a) * (1.0 - r0.magnitude() * alpha)));
        double guess = sign * std::sqrt(-a) * std::log(lnFactor);
        if (std::isfinite(guess) && std::abs(guess) <= MAX_HYPERBOLIC_GUESS) {
            return guess;
        }

        std::mt19937_64 rng(seedFromInputs({r0.x, r0.y, r0.z, v0.x, v0.y, v0.z, time}));
        return std::uniform_real_distribution<double>(0.0, 1.0)(rng);
    }

    return sqrtMu * time / r0.magnitude();
}

double UniversalVariableKeplerSolver::solveUniversalVariable(const Orbit& orbit, const Vec3& r0, const Vec3& v0,
                                                             double time, double sqrtMu, double alpha) const {
    double r0Length = r0.magnitude();
    double r0v0BySqrtMu = r0.dot(v0) / sqrtMu;
    double x = initialGuess(orbit, r0, v0, time, sqrtMu, alpha);

    for (int i = 0; i < maxIterations_; i++) {
        double xSquared = x * x;
        double z = xSquared * alpha;
        double C = stumpffC(z);
        double S = stumpffS(z);

        double tn = (r0v0BySqrtMu * xSquared * C
                     + (1.0 - r0Length * alpha) * xSquared * x * S
                     + r0Length * x) / sqrtMu;
        double dtdx = (xSquared * C
                       + r0v0BySqrtMu * x * (1.0 - z * S)
                       + r0Length * (1.0 - z * C)) / sqrtMu;

        double dt = time - tn;
        x += dt / dtdx;

        if (!std::isfinite(x)) {
            break;
        }
        if (std::abs(dt) <= tolerance_) {
            return x;
        }
    }

    debug("Kepler solver failed: r0 = {:.1f} m, alpha = {}, dt = {:.1f} s", r0Length, alpha, time);
    throw NumericNonConvergenceException(
        std::format("Kepler solver did not converge after {} iterations (dt = {} s)", maxIterations_, time));
}

ObjectState UniversalVariableKeplerSolver::solve(const ObjectConfig& config,
                                                 const ObjectState& initialPrimaryBodyState,
                                                 const ObjectState& initialState,
                                                 const Orbit& initialOrbit,
                                                 const ObjectState& primaryBodyStateAtTime,
                                                 double time) const {
    if (time == 0.0) {
        return initialState;
    }

    if (initialState.hasImpacted()) {
        const Body* primaryBody = initialOrbit.getPrimaryBody();
        ObjectConfig primaryBodyConfig = primaryBody != nullptr ? primaryBody->getConfig() : ObjectConfig();
        return moveImpactedObject(primaryBodyConfig, initialPrimaryBodyState, primaryBodyStateAtTime,
                                  initialState, time);
    }

    Vec3 r0 = initialState.getPosition() - initialPrimaryBodyState.getPosition();
    Vec3 v0 = initialState.getVelocity() - initialPrimaryBodyState.getVelocity();

    double r0Length = r0.magnitude();
    double mu = initialOrbit.getStandardGravitationalParameter();
    double sqrtMu = std::sqrt(mu);
    double alpha = initialOrbit.isParabolic() ? 0.0 : ((2.0 * mu) / r0Length - v0.magnitudeSquared()) / mu;

    double x = solveUniversalVariable(initialOrbit, r0, v0, time, sqrtMu, alpha);
    double z = x * x * alpha;
    double C = stumpffC(z);
    double S = stumpffS(z);

    // Lagrange coefficients
    double f = 1.0 - (x * x / r0Length) * C;
    double g = time - (x * x * x / sqrtMu) * S;
    Vec3 r = r0 * f + v0 * g;

    double rLength = r.magnitude();
    double gp = 1.0 - (x * x / rLength) * C;
    double fp = (sqrtMu / (r0Length * rLength)) * x * (z * S - 1.0);
    Vec3 v = r0 * fp + v0 * gp;

    return ObjectState(
        initialState.getTime() + time,
        primaryBodyStateAtTime.getPosition() + r,
        primaryBodyStateAtTime.getVelocity() + v,
        calculateRotation(config.getRotationalPeriod(), initialState.getRotation(), time));
}

// ============================================================================
// Propagation Helpers
// ============================================================================

double calculateRotation(double rotationalPeriod, double rotation, double time) {
    if (rotationalPeriod == 0.0) {
        return rotation;
    }
    return clampAngle(rotation + (TWO_PI / rotationalPeriod) * time);
}

ObjectState moveImpactedObject(const ObjectConfig& primaryBodyConfig,
                               const ObjectState& initialPrimaryBodyState,
                               const ObjectState& nextPrimaryBodyState,
                               const ObjectState& state,
                               double time) {
    if (primaryBodyConfig.getRotationalPeriod() == 0.0) {
        ObjectState moved = state.swapReferenceFrame(initialPrimaryBodyState, nextPrimaryBodyState);
        return moved.withTime(moved.getTime() + time);
    }

    // Spherical coordinates in the world frame, latitude measured from the pole
    Vec3 r = state.getPosition() - initialPrimaryBodyState.getPosition();
    double distance = r.magnitude();
    double latitude = std::acos(r.y / distance);
    double longitude = std::atan2(r.z, r.x) + primaryBodyConfig.getRotationalSpeed() * time;

    Vec3 rNext{
        distance * std::sin(latitude) * std::cos(longitude),
        distance * std::cos(latitude),
        distance * std::sin(latitude) * std::sin(longitude)};

    Vec3 surfaceDirection = rNext.normalize().cross(primaryBodyConfig.getAxisOfRotation()).normalize();
    double surfaceSpeed = (TWO_PI * primaryBodyConfig.getRadius() / primaryBodyConfig.getRotationalPeriod())
                          * std::cos(PI / 2.0 - latitude);

    return ObjectState(
        state.getTime() + time,
        nextPrimaryBodyState.getPosition() + rNext,
        nextPrimaryBodyState.getVelocity() + surfaceDirection * surfaceSpeed,
        state.getRotation(),
        state.hasImpacted());
}

PropagatedState afterTime(const KeplerSolver& solver,
                          const ObjectConfig& config,
                          const ObjectState& state,
                          const Orbit& orbit,
                          double time,
                          bool relative) {
    const Body* primaryBody = orbit.getPrimaryBody();
    if (primaryBody == nullptr) {
        throw std::invalid_argument("Cannot propagate an orbit without a primary body");
    }

    // The object of reference does not move
    ObjectState primaryBodyState = primaryBody->getState();
    if (!primaryBody->isObjectOfReference()) {
        primaryBodyState = afterTime(solver, *primaryBody, time).state;
    }

    ObjectState nextState = solver.solve(
        config,
        primaryBody->getState(),
        state,
        orbit,
        relative ? ObjectState() : primaryBodyState,
        time);

    return {nextState, primaryBodyState};
}

PropagatedState afterTime(const KeplerSolver& solver, const Body& body, double time, bool relative) {
    return afterTime(solver, body.getConfig(), body.getState(), Orbit::calculate(body), time, relative);
}

} // namespace orbitcraft
