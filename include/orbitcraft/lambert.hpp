/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __ORBITCRAFT_LAMBERT_HPP
#define __ORBITCRAFT_LAMBERT_HPP

#include <orbitcraft/kepler.hpp>
#include <orbitcraft/state.hpp>

namespace orbitcraft {

/**
 * Velocities at both ends of a transfer arc.
 */
struct LambertSolution {
    Vec3 velocity1;     ///< Absolute velocity at the first position
    Vec3 velocity2;     ///< Absolute velocity at the second position
};

/**
 * Solves Lambert's (Gauss') problem: the two-body arc connecting two
 * positions in a given time of flight.
 */
class LambertSolver {
public:
    virtual ~LambertSolver() = default;

    /**
     * @param primaryBody The body being orbited (source of μ)
     * @param primaryBodyState1 State of the primary body at the first position
     * @param primaryBodyState2 State of the primary body at the second position
     * @param position1 Absolute first position
     * @param position2 Absolute second position
     * @param timeOfFlight Time between the positions (s)
     * @param shortWay Take the transfer angle below π instead of its complement
     * @throws NumericNonConvergenceException if no solution is found
     * @throws GeometricInfeasibilityException if the positions are collinear
     *         with the primary body on opposite sides, which leaves the
     *         transfer plane undefined
     */
    virtual LambertSolution solve(const Body& primaryBody,
                                  const ObjectState& primaryBodyState1,
                                  const ObjectState& primaryBodyState2,
                                  const Vec3& position1,
                                  const Vec3& position2,
                                  double timeOfFlight,
                                  bool shortWay = true) const = 0;
};

/**
 * Lambert solver using the universal variable formulation with Newton
 * iteration on z. When the iteration leaves the domain (y < 0) z is
 * reseeded from a random generator seeded with the call's inputs, so equal
 * inputs always give equal results.
 */
class UniversalVariableLambertSolver : public LambertSolver {
public:
    UniversalVariableLambertSolver() = default;
    explicit UniversalVariableLambertSolver(const SolverSettings& settings);

    LambertSolution solve(const Body& primaryBody,
                          const ObjectState& primaryBodyState1,
                          const ObjectState& primaryBodyState2,
                          const Vec3& position1,
                          const Vec3& position2,
                          double timeOfFlight,
                          bool shortWay = true) const override;

private:
    double solveForZ(double deltaTrueAnomaly, double timeOfFlight, double sqrtMu,
                     double r1Length, double r2Length, double A) const;

    double tolerance_ = 1e-6;
    int maxIterations_ = 1000;
};

/**
 * Lambert solver using the p-iteration method: Newton iteration on the
 * semi-latus rectum of the transfer orbit. Slower than the universal
 * variable method but it converges in cases where that method stalls.
 * The iteration starts between the two parabolic limits of p and is
 * reseeded from a generator seeded with the call's inputs.
 */
class PMethodLambertSolver : public LambertSolver {
public:
    PMethodLambertSolver() = default;
    explicit PMethodLambertSolver(const SolverSettings& settings);

    LambertSolution solve(const Body& primaryBody,
                          const ObjectState& primaryBodyState1,
                          const ObjectState& primaryBodyState2,
                          const Vec3& position1,
                          const Vec3& position2,
                          double timeOfFlight,
                          bool shortWay = true) const override;

private:
    double tolerance_ = 1e-4;
    int maxIterations_ = 1000;
};

/**
 * Tries the universal variable solver first and falls back to the
 * p-iteration method when it does not converge.
 */
class AdaptiveLambertSolver : public LambertSolver {
public:
    AdaptiveLambertSolver() = default;
    explicit AdaptiveLambertSolver(const SolverSettings& settings);
    AdaptiveLambertSolver(const SolverSettings& universalVariableSettings, const SolverSettings& pMethodSettings);

    LambertSolution solve(const Body& primaryBody,
                          const ObjectState& primaryBodyState1,
                          const ObjectState& primaryBodyState2,
                          const Vec3& position1,
                          const Vec3& position2,
                          double timeOfFlight,
                          bool shortWay = true) const override;

private:
    UniversalVariableLambertSolver universalVariable_;
    PMethodLambertSolver pMethod_;
};

} // namespace orbitcraft

#endif
