/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <orbitcraft/state.hpp>
#include <orbitcraft/formulas.hpp>

#include <utility>

namespace orbitcraft {

// ============================================================================
// ObjectState
// ============================================================================

ObjectState::ObjectState(double time, const Vec3& position, const Vec3& velocity,
                         double rotation, bool impacted)
    : time_(time), position_(position), velocity_(velocity),
      rotation_(rotation), impacted_(impacted) {}

Vec3 ObjectState::prograde() const {
    return velocity_.normalize();
}

Vec3 ObjectState::retrograde() const {
    return -prograde();
}

Vec3 ObjectState::radial() const {
    return position_.normalize();
}

Vec3 ObjectState::normal() const {
    return radial().cross(prograde()).normalize();
}

ObjectState ObjectState::add(const Vec3& deltaPosition, const Vec3& deltaVelocity) const {
    return {time_, position_ + deltaPosition, velocity_ + deltaVelocity, rotation_, impacted_};
}

ObjectState ObjectState::withTime(double time) const {
    ObjectState copy = *this;
    copy.time_ = time;
    return copy;
}

ObjectState ObjectState::withVelocity(const Vec3& velocity) const {
    ObjectState copy = *this;
    copy.velocity_ = velocity;
    return copy;
}

ObjectState ObjectState::withRotation(double rotation) const {
    ObjectState copy = *this;
    copy.rotation_ = rotation;
    return copy;
}

ObjectState ObjectState::withImpacted(bool impacted) const {
    ObjectState copy = *this;
    copy.impacted_ = impacted;
    return copy;
}

ObjectState ObjectState::makeRelative(const ObjectState& primaryBodyState) const {
    return add(-primaryBodyState.position_, -primaryBodyState.velocity_);
}

ObjectState ObjectState::makeAbsolute(const ObjectState& primaryBodyState) const {
    return add(primaryBodyState.position_, primaryBodyState.velocity_);
}

ObjectState ObjectState::swapReferenceFrame(const ObjectState& currentPrimaryBodyState,
                                            const ObjectState& newPrimaryBodyState) const {
    return makeRelative(currentPrimaryBodyState).makeAbsolute(newPrimaryBodyState);
}

double ObjectState::distance(const ObjectState& other) const {
    return position_.distance(other.position_);
}

// ============================================================================
// ObjectConfig
// ============================================================================

ObjectConfig::ObjectConfig(double mass, double rotationalPeriod,
                           std::optional<double> radius, const Vec3& axisOfRotation)
    : mass_(mass), rotationalPeriod_(rotationalPeriod),
      radius_(radius), axisOfRotation_(axisOfRotation) {}

double ObjectConfig::getRotationalSpeed() const {
    return TWO_PI / rotationalPeriod_;
}

double ObjectConfig::getStandardGravitationalParameter() const {
    return mass_ * GRAVITATIONAL_CONSTANT;
}

ObjectConfig ObjectConfig::withMass(double mass) const {
    return ObjectConfig(mass, rotationalPeriod_, radius_, axisOfRotation_);
}

// ============================================================================
// Body
// ============================================================================

Body::Body(std::string name, ObjectConfig config, ObjectState state, const Body* primaryBody)
    : name_(std::move(name)), config_(config), state_(state), primaryBody_(primaryBody) {}

} // namespace orbitcraft
