/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __ORBITCRAFT_KEPLER_HPP
#define __ORBITCRAFT_KEPLER_HPP

#include <orbitcraft/orbit.hpp>
#include <orbitcraft/state.hpp>

namespace orbitcraft {

/**
 * Convergence settings shared by the iterative solvers.
 */
struct SolverSettings {
    double keplerTolerance = 1e-6;      ///< Time residual at which the Kepler solver stops (s)
    int keplerMaxIterations = 1500;     ///< Newton iteration budget of the Kepler solver
    double lambertTolerance = 1e-6;     ///< Time residual at which the Lambert solver stops (s)
    int lambertMaxIterations = 1000;    ///< Newton iteration budget of the Lambert solver
};

// ============================================================================
// Kepler Problem
// ============================================================================

/**
 * Propagates an object along a known orbit.
 *
 * Implementations are stateless and safe to call from several threads.
 */
class KeplerSolver {
public:
    virtual ~KeplerSolver() = default;

    /**
     * State of an object after the given amount of time.
     *
     * @param config Configuration of the object (used for its own rotation)
     * @param initialPrimaryBodyState State of the primary body when the orbit was calculated
     * @param initialState Initial absolute state of the object
     * @param initialOrbit Orbit of the object at the initial state
     * @param primaryBodyStateAtTime State of the primary body after the time has passed
     * @param time Time to propagate, may be negative (s)
     * @return Absolute state relative to primaryBodyStateAtTime
     * @throws NumericNonConvergenceException if the solver does not converge
     */
    virtual ObjectState solve(const ObjectConfig& config,
                              const ObjectState& initialPrimaryBodyState,
                              const ObjectState& initialState,
                              const Orbit& initialOrbit,
                              const ObjectState& primaryBodyStateAtTime,
                              double time) const = 0;

    /**
     * Propagate a non-rotating object around a primary body that stays put.
     */
    ObjectState propagate(const ObjectState& primaryBodyState,
                          const ObjectState& state,
                          const Orbit& orbit,
                          double time) const;
};

/**
 * Kepler solver using the universal variable formulation, valid for every
 * conic section without branching on the orbit type.
 */
class UniversalVariableKeplerSolver : public KeplerSolver {
public:
    UniversalVariableKeplerSolver() = default;
    explicit UniversalVariableKeplerSolver(const SolverSettings& settings);

    ObjectState solve(const ObjectConfig& config,
                      const ObjectState& initialPrimaryBodyState,
                      const ObjectState& initialState,
                      const Orbit& initialOrbit,
                      const ObjectState& primaryBodyStateAtTime,
                      double time) const override;

private:
    double initialGuess(const Orbit& orbit, const Vec3& r0, const Vec3& v0,
                        double time, double sqrtMu, double alpha) const;
    double solveUniversalVariable(const Orbit& orbit, const Vec3& r0, const Vec3& v0,
                                  double time, double sqrtMu, double alpha) const;

    double tolerance_ = 1e-6;
    int maxIterations_ = 1500;
};

// ============================================================================
// Propagation Helpers
// ============================================================================

/**
 * Rotation angle of an object after the given time.
 * Objects with a rotational period of 0 do not rotate.
 */
double calculateRotation(double rotationalPeriod, double rotation, double time);

/**
 * Moves an object resting on the surface of its primary body so that it
 * follows the rotation and motion of that body.
 */
ObjectState moveImpactedObject(const ObjectConfig& primaryBodyConfig,
                               const ObjectState& initialPrimaryBodyState,
                               const ObjectState& nextPrimaryBodyState,
                               const ObjectState& state,
                               double time);

/**
 * Result of afterTime(): the object and its primary body after the time has passed.
 */
struct PropagatedState {
    ObjectState state;                  ///< Object state
    ObjectState primaryBodyState;       ///< Primary body state
};

/**
 * State of an object after the given time, propagating the whole chain of
 * primary bodies up to the object of reference first.
 * Sphere of influence changes and maneuvers are not taken into account.
 *
 * @param relative Return the state relative to the primary body instead of absolute
 */
PropagatedState afterTime(const KeplerSolver& solver,
                          const ObjectConfig& config,
                          const ObjectState& state,
                          const Orbit& orbit,
                          double time,
                          bool relative = false);

/** Same as above, for a body using its current state and orbit. */
PropagatedState afterTime(const KeplerSolver& solver, const Body& body, double time, bool relative = false);

} // namespace orbitcraft

#endif
