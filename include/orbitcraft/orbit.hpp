/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __ORBITCRAFT_ORBIT_HPP
#define __ORBITCRAFT_ORBIT_HPP

#include <orbitcraft/state.hpp>
#include <orbitcraft/vector.hpp>

#include <iostream>
#include <optional>
#include <string>

namespace orbitcraft {

// ============================================================================
// Orbit
// ============================================================================

/**
 * Conic section classification.
 */
enum class OrbitType {
    Circular,
    Elliptical,
    Parabolic,
    Hyperbolic
};

std::string toString(OrbitType type);

/**
 * Classical orbital elements of an object around a primary body.
 *
 * The size of the orbit is stored as the semi-latus rectum (parameter) so
 * that all four conic types share one representation. Angles are radians.
 * Orbits are immutable; the with...() methods return modified copies.
 *
 * Usage:
 *   auto orbit = Orbit::fromSemiMajorAxis(&earth, 7000e3, 0.1, 0.5);
 *   ObjectState state = orbit.calculateState(trueAnomaly, earth.getState());
 */
class Orbit {
public:
    /** Eccentricity tolerance used by all classification predicates. */
    static constexpr double ECCENTRICITY_EPSILON = 1e-4;

    Orbit() = default;

    /**
     * @param primaryBody Body being orbited (must not be null)
     * @param parameter Semi-latus rectum p in meters
     * @param eccentricity Eccentricity e
     * @param inclination Inclination i
     * @param longitudeOfAscendingNode Longitude of the ascending node Ω
     * @param argumentOfPeriapsis Argument of periapsis ω
     * @throws std::invalid_argument if primaryBody is null
     */
    Orbit(const Body* primaryBody, double parameter, double eccentricity,
          double inclination = 0.0, double longitudeOfAscendingNode = 0.0,
          double argumentOfPeriapsis = 0.0);

    /**
     * Build an orbit from its semi-major axis instead of its parameter.
     * Not defined for parabolic orbits.
     */
    static Orbit fromSemiMajorAxis(const Body* primaryBody, double semiMajorAxis,
                                   double eccentricity = 0.0, double inclination = 0.0,
                                   double longitudeOfAscendingNode = 0.0,
                                   double argumentOfPeriapsis = 0.0);

    /**
     * Build an orbit from either its parameter or its semi-major axis.
     * The semi-major axis is used when both are given.
     * @throws std::invalid_argument if neither is given
     */
    static Orbit fromElements(const Body* primaryBody, std::optional<double> parameter,
                              std::optional<double> semiMajorAxis, double eccentricity,
                              double inclination = 0.0, double longitudeOfAscendingNode = 0.0,
                              double argumentOfPeriapsis = 0.0);

    /**
     * Orbit of a body around its primary body, from their current states.
     * @throws std::invalid_argument if the body is the object of reference
     */
    static Orbit calculate(const Body& body);

    // Accessors for the elements
    const Body* getPrimaryBody() const { return primaryBody_; }
    double getParameter() const { return parameter_; }
    double getEccentricity() const { return eccentricity_; }
    double getInclination() const { return inclination_; }
    double getLongitudeOfAscendingNode() const { return longitudeOfAscendingNode_; }
    double getArgumentOfPeriapsis() const { return argumentOfPeriapsis_; }

    /** μ of the primary body, 0 when there is none. */
    double getStandardGravitationalParameter() const;

    double getPeriapsis() const;

    /** Apoapsis distance, +∞ for unbound orbits. */
    double getApoapsis() const;

    /** Semi-major axis, negative for hyperbolic orbits and +∞ for parabolic ones. */
    double getSemiMajorAxis() const;

    /** Orbital period, +∞ for unbound orbits. */
    double getPeriod() const;

    OrbitType getType() const;

    bool isCircular() const;
    bool isElliptical() const;
    bool isParabolic() const;
    bool isHyperbolic() const;
    bool isBound() const;
    bool isUnbound() const;
    bool isRadialParabolic() const;

    Orbit withParameter(double parameter) const;
    Orbit withEccentricity(double eccentricity) const;
    Orbit withInclination(double inclination) const;
    Orbit withLongitudeOfAscendingNode(double longitudeOfAscendingNode) const;
    Orbit withArgumentOfPeriapsis(double argumentOfPeriapsis) const;

    /** Copy with the given deltas added to each element. */
    Orbit add(double deltaParameter, double deltaEccentricity, double deltaInclination = 0.0,
              double deltaLongitudeOfAscendingNode = 0.0, double deltaArgumentOfPeriapsis = 0.0) const;

    /**
     * Rotation from the perifocal frame into the physics frame (3-1-3
     * sequence Ω, i, ω). Undefined Ω is treated as 0, and ω is treated as 0
     * when undefined or when the orbit is circular.
     */
    Matrix3 changeOfBasisMatrix() const;

    /**
     * State of an object at the given true anomaly.
     * @param trueAnomaly True anomaly ν
     * @param primaryBodyState State of the primary body; the result is offset by it
     * @return Absolute state, stamped with the primary body's time
     */
    ObjectState calculateState(double trueAnomaly, const ObjectState& primaryBodyState) const;

    /** Same as above, using the primary body's current state. */
    ObjectState calculateState(double trueAnomaly) const;

    /** True when all five elements match within ECCENTRICITY_EPSILON. */
    bool sameOrbit(const Orbit& other) const;

    /** True when the orbital planes match within ECCENTRICITY_EPSILON. */
    bool samePlane(const Orbit& other) const;

    /** Print a human readable description of the elements. */
    void printInfo(std::ostream& os) const;

private:
    const Body* primaryBody_ = nullptr;
    double parameter_ = 0.0;
    double eccentricity_ = 0.0;
    double inclination_ = 0.0;
    double longitudeOfAscendingNode_ = 0.0;
    double argumentOfPeriapsis_ = 0.0;
};

// ============================================================================
// OrbitPosition
// ============================================================================

/**
 * An orbit together with the true anomaly of an object on it.
 */
class OrbitPosition {
public:
    OrbitPosition() = default;
    OrbitPosition(const Orbit& orbit, double trueAnomaly);

    /**
     * Derive the orbit and true anomaly of an object from its state.
     *
     * @param primaryBody The body being orbited (source of μ)
     * @param primaryBodyState State of the primary body at the same time
     * @param state Absolute state of the object
     */
    static OrbitPosition calculate(const Body& primaryBody, const ObjectState& primaryBodyState,
                                   const ObjectState& state);

    /** Same as above, using the primary body's current state. */
    static OrbitPosition calculate(const Body& primaryBody, const ObjectState& state);

    /**
     * Orbit position of a body around its own primary, from current states.
     * @throws std::invalid_argument if the body is the object of reference
     */
    static OrbitPosition calculate(const Body& body);

    const Orbit& getOrbit() const { return orbit_; }
    double getTrueAnomaly() const { return trueAnomaly_; }

    OrbitPosition withTrueAnomaly(double trueAnomaly) const;
    OrbitPosition withOrbit(const Orbit& orbit) const;

    /** Eccentric anomaly for bound orbits, 0 otherwise. */
    double getEccentricAnomaly() const;

    /** Hyperbolic eccentric anomaly for hyperbolic orbits, 0 otherwise. */
    double getHyperbolicEccentricAnomaly() const;

    /** Parabolic eccentric anomaly for parabolic orbits, 0 otherwise. */
    double getParabolicEccentricAnomaly() const;

    /**
     * Time until the object reaches the given true anomaly.
     * Bound orbits always return a value in [0, period); unbound orbits
     * return a negative value if the anomaly lies behind the object.
     */
    double timeToTrueAnomaly(double trueAnomaly) const;

    double timeToPeriapsis() const;

    /** Time to apoapsis, +∞ for unbound orbits. */
    double timeToApoapsis() const;

    ObjectState calculateState(const ObjectState& primaryBodyState) const;
    ObjectState calculateState() const;

private:
    double timeToTrueAnomalyBound(double trueAnomaly) const;
    double timeToTrueAnomalyParabolic(double trueAnomaly) const;
    double timeToTrueAnomalyHyperbolic(double trueAnomaly) const;

    Orbit orbit_;
    double trueAnomaly_ = 0.0;
};

} // namespace orbitcraft

#endif
