/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __ORBITCRAFT_STATE_HPP
#define __ORBITCRAFT_STATE_HPP

#include <orbitcraft/vector.hpp>

#include <optional>
#include <string>

namespace orbitcraft {

/**
 * Kinematic state of an object at a point in time.
 *
 * Position and velocity are either absolute or relative to a primary body;
 * the two are only converted through makeRelative() / makeAbsolute().
 * The local frame helpers (prograde, radial, normal) assume a state that is
 * relative to the primary body.
 */
class ObjectState {
public:
    ObjectState() = default;
    ObjectState(double time, const Vec3& position, const Vec3& velocity,
                double rotation = 0.0, bool impacted = false);

    double getTime() const { return time_; }                 ///< Simulation time (s)
    const Vec3& getPosition() const { return position_; }    ///< Position (m)
    const Vec3& getVelocity() const { return velocity_; }    ///< Velocity (m/s)
    double getRotation() const { return rotation_; }         ///< Rotation about the own axis (rad)
    bool hasImpacted() const { return impacted_; }           ///< Resting on the primary body's surface

    /** Unit vector along the velocity. */
    Vec3 prograde() const;

    /** Unit vector against the velocity. */
    Vec3 retrograde() const;

    /** Unit vector pointing away from the primary body. */
    Vec3 radial() const;

    /** Unit vector along the orbital angular momentum. */
    Vec3 normal() const;

    ObjectState add(const Vec3& deltaPosition, const Vec3& deltaVelocity) const;
    ObjectState withTime(double time) const;
    ObjectState withVelocity(const Vec3& velocity) const;
    ObjectState withRotation(double rotation) const;
    ObjectState withImpacted(bool impacted) const;

    /** Expresses this absolute state relative to the given primary body state. */
    ObjectState makeRelative(const ObjectState& primaryBodyState) const;

    /** Expresses this relative state in absolute coordinates. */
    ObjectState makeAbsolute(const ObjectState& primaryBodyState) const;

    /** Moves the state from one primary body state to another, keeping the relative offset. */
    ObjectState swapReferenceFrame(const ObjectState& currentPrimaryBodyState,
                                   const ObjectState& newPrimaryBodyState) const;

    double distance(const ObjectState& other) const;

private:
    double time_ = 0.0;
    Vec3 position_;
    Vec3 velocity_;
    double rotation_ = 0.0;
    bool impacted_ = false;
};

/**
 * Static physical configuration of an object.
 */
class ObjectConfig {
public:
    ObjectConfig() = default;

    /**
     * @param mass Mass in kilograms
     * @param rotationalPeriod Sidereal rotation period in seconds (0 = not rotating)
     * @param radius Physical radius in meters, if the object has a surface
     * @param axisOfRotation Unit rotation axis, world up by default
     */
    explicit ObjectConfig(double mass, double rotationalPeriod = 0.0,
                          std::optional<double> radius = std::nullopt,
                          const Vec3& axisOfRotation = Vec3::up());

    double getMass() const { return mass_; }
    double getRotationalPeriod() const { return rotationalPeriod_; }
    const Vec3& getAxisOfRotation() const { return axisOfRotation_; }

    /** 2π / rotational period. */
    double getRotationalSpeed() const;

    /** μ = G · mass. */
    double getStandardGravitationalParameter() const;

    bool hasRadius() const { return radius_.has_value(); }

    /** Physical radius in meters, 0 when the object has none. */
    double getRadius() const { return radius_.value_or(0.0); }

    ObjectConfig withMass(double mass) const;

private:
    double mass_ = 0.0;
    double rotationalPeriod_ = 0.0;
    std::optional<double> radius_;
    Vec3 axisOfRotation_ = Vec3::up();
};

/**
 * A physical body: star, planet, moon or spacecraft.
 *
 * Each body references exactly one primary body, except the object of
 * reference at the root of the tree. Bodies are created at scenario setup
 * and must outlive every Orbit that refers to them.
 */
class Body {
public:
    Body(std::string name, ObjectConfig config, ObjectState state, const Body* primaryBody = nullptr);
    ~Body() = default;

    // Orbits refer to bodies by address
    Body(const Body&) = delete;
    Body& operator=(const Body&) = delete;
    Body(Body&&) = delete;
    Body& operator=(Body&&) = delete;

    const std::string& getName() const { return name_; }
    const ObjectConfig& getConfig() const { return config_; }
    const ObjectState& getState() const { return state_; }
    const Body* getPrimaryBody() const { return primaryBody_; }

    bool isObjectOfReference() const { return primaryBody_ == nullptr; }

    double getMass() const { return config_.getMass(); }
    double getStandardGravitationalParameter() const { return config_.getStandardGravitationalParameter(); }
    bool hasRadius() const { return config_.hasRadius(); }
    double getRadius() const { return config_.getRadius(); }

    /**
     * Replace the current state. Only the external propagation step calls this.
     */
    void setState(const ObjectState& state) { state_ = state; }

private:
    std::string name_;
    ObjectConfig config_;
    ObjectState state_;
    const Body* primaryBody_;
};

} // namespace orbitcraft

#endif
