/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <orbitcraft/maneuver.hpp>

#include <spdlog/spdlog.h>

#include <format>

using spdlog::debug;

namespace orbitcraft {

double ManeuverTime::resolve(const OrbitPosition& position) const {
    switch (type) {
        case ManeuverTimeType::Periapsis:
            return position.timeToPeriapsis();
        case ManeuverTimeType::Apoapsis:
            return position.timeToApoapsis();
        case ManeuverTimeType::Now:
            return 0.0;
        case ManeuverTimeType::TimeFromNow:
            return value;
    }
    return 0.0;
}

// ============================================================================
// OrbitalManeuver
// ============================================================================

OrbitalManeuver::OrbitalManeuver(double time, const Vec3& deltaVelocity)
    : time_(time), deltaVelocity_(deltaVelocity) {}

OrbitalManeuver OrbitalManeuver::burn(double currentTime, const Body& object,
                                      const Vec3& deltaVelocity, ManeuverTime maneuverTime) {
    return burn(currentTime, OrbitPosition::calculate(object), deltaVelocity, maneuverTime);
}

OrbitalManeuver OrbitalManeuver::burn(double currentTime, const OrbitPosition& position,
                                      const Vec3& deltaVelocity, ManeuverTime maneuverTime) {
    return OrbitalManeuver(currentTime + maneuverTime.resolve(position), deltaVelocity);
}

ObjectState OrbitalManeuver::apply(const ObjectState& state) const {
    return state.withVelocity(state.getVelocity() + deltaVelocity_);
}

std::ostream& operator<<(std::ostream& os, const OrbitalManeuver& maneuver) {
    os << std::format("time: {:.1f} s, dv: {:.2f} m/s",
                      maneuver.getTime(), maneuver.getDeltaVelocity().magnitude());
    return os;
}

// ============================================================================
// ManeuverSequence
// ============================================================================

ManeuverSequence::ManeuverSequence(std::initializer_list<OrbitalManeuver> maneuvers)
    : maneuvers_(maneuvers) {}

ManeuverSequence ManeuverSequence::single(const OrbitalManeuver& maneuver) {
    return ManeuverSequence{maneuver};
}

void ManeuverSequence::add(const OrbitalManeuver& maneuver) {
    maneuvers_.push_back(maneuver);
}

double ManeuverSequence::totalDeltaVelocity() const {
    double total = 0.0;
    for (const auto& maneuver : maneuvers_) {
        total += maneuver.getDeltaVelocity().magnitude();
    }
    return total;
}

// ============================================================================
// PlannerContext
// ============================================================================

void PlannerContext::notify(const std::string& message) const {
    debug("{}", message);
    if (observer) {
        observer(message);
    }
}

} // namespace orbitcraft
