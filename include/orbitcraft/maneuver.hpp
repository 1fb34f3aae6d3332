/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __ORBITCRAFT_MANEUVER_HPP
#define __ORBITCRAFT_MANEUVER_HPP

#include <orbitcraft/kepler.hpp>
#include <orbitcraft/lambert.hpp>
#include <orbitcraft/orbit.hpp>

#include <cstddef>
#include <functional>
#include <initializer_list>
#include <iostream>
#include <string>
#include <vector>

namespace orbitcraft {

// ============================================================================
// Maneuver Timing
// ============================================================================

enum class ManeuverTimeType {
    Periapsis,      ///< Next periapsis passage
    Apoapsis,       ///< Next apoapsis passage
    Now,            ///< Current time
    TimeFromNow     ///< Fixed delay from the current time
};

/**
 * When a burn should happen, relative to an object's orbit or to now.
 */
struct ManeuverTime {
    ManeuverTimeType type = ManeuverTimeType::Now;
    double value = 0.0;     ///< Delay in seconds, only used by TimeFromNow

    static ManeuverTime periapsis() { return {ManeuverTimeType::Periapsis, 0.0}; }
    static ManeuverTime apoapsis() { return {ManeuverTimeType::Apoapsis, 0.0}; }
    static ManeuverTime now() { return {ManeuverTimeType::Now, 0.0}; }
    static ManeuverTime timeFromNow(double time) { return {ManeuverTimeType::TimeFromNow, time}; }

    /** Seconds from now until this time on the given orbit position. */
    double resolve(const OrbitPosition& position) const;
};

// ============================================================================
// Maneuvers
// ============================================================================

/**
 * A single impulsive burn: at the given absolute time, add the velocity
 * delta to the object's velocity exactly once.
 */
class OrbitalManeuver {
public:
    OrbitalManeuver(double time, const Vec3& deltaVelocity);

    /**
     * Creates a burn for an object, resolving the maneuver time against the
     * object's current orbit.
     *
     * @param currentTime The current simulation time
     * @param object The object that burns
     * @param deltaVelocity The velocity change
     * @param maneuverTime When to burn
     */
    static OrbitalManeuver burn(double currentTime, const Body& object,
                                const Vec3& deltaVelocity, ManeuverTime maneuverTime);

    /** Same as above, for an object at the given orbit position. */
    static OrbitalManeuver burn(double currentTime, const OrbitPosition& position,
                                const Vec3& deltaVelocity, ManeuverTime maneuverTime);

    double getTime() const { return time_; }
    const Vec3& getDeltaVelocity() const { return deltaVelocity_; }

    /** Applies the burn to a state taken at the maneuver time. */
    ObjectState apply(const ObjectState& state) const;

private:
    double time_;
    Vec3 deltaVelocity_;
};

std::ostream& operator<<(std::ostream& os, const OrbitalManeuver& maneuver);

/**
 * Ordered list of burns produced by a planner.
 */
class ManeuverSequence {
public:
    ManeuverSequence() = default;
    ManeuverSequence(std::initializer_list<OrbitalManeuver> maneuvers);

    static ManeuverSequence single(const OrbitalManeuver& maneuver);

    void add(const OrbitalManeuver& maneuver);

    std::size_t size() const { return maneuvers_.size(); }
    bool empty() const { return maneuvers_.empty(); }
    const OrbitalManeuver& operator[](std::size_t index) const { return maneuvers_[index]; }

    std::vector<OrbitalManeuver>::const_iterator begin() const { return maneuvers_.begin(); }
    std::vector<OrbitalManeuver>::const_iterator end() const { return maneuvers_.end(); }

    /** Sum of the burn magnitudes. */
    double totalDeltaVelocity() const;

private:
    std::vector<OrbitalManeuver> maneuvers_;
};

// ============================================================================
// Planner Context
// ============================================================================

/**
 * Receives diagnostic messages from the planners.
 */
using PlannerObserver = std::function<void(const std::string&)>;

/**
 * Everything a planner needs besides the objects involved.
 */
struct PlannerContext {
    const KeplerSolver& keplerSolver;
    const LambertSolver& lambertSolver;
    double currentTime = 0.0;           ///< Current simulation time (s)
    unsigned int workerThreads = 1;     ///< Threads used by grid searches
    PlannerObserver observer;           ///< Optional diagnostics sink

    /** Logs a message and forwards it to the observer, if any. */
    void notify(const std::string& message) const;
};

} // namespace orbitcraft

#endif
