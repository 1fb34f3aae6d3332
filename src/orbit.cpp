/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <orbitcraft/orbit.hpp>
#include <orbitcraft/formulas.hpp>

#include <algorithm>
#include <cmath>
#include <format>
#include <limits>
#include <stdexcept>

namespace orbitcraft {

constexpr double INFINITE = std::numeric_limits<double>::infinity();

// Parameter below which a parabolic orbit degenerates into a radial line
constexpr double RADIAL_PARABOLIC_PARAMETER = 1e-5;

// acos() that tolerates rounding just outside [-1, 1]; NaN stays NaN
static double safeAcos(double x) {
    if (std::isnan(x)) {
        return x;
    }
    return std::acos(std::clamp(x, -1.0, 1.0));
}

static double zeroIfNaN(double x) {
    return std::isnan(x) ? 0.0 : x;
}

std::string toString(OrbitType type) {
    switch (type) {
        case OrbitType::Circular: return "Circular";
        case OrbitType::Elliptical: return "Elliptical";
        case OrbitType::Parabolic: return "Parabolic";
        case OrbitType::Hyperbolic: return "Hyperbolic";
    }
    return "Unknown";
}

// ============================================================================
// Orbit
// ============================================================================

Orbit::Orbit(const Body* primaryBody, double parameter, double eccentricity,
             double inclination, double longitudeOfAscendingNode, double argumentOfPeriapsis)
    : primaryBody_(primaryBody),
      parameter_(parameter),
      eccentricity_(eccentricity),
      inclination_(inclination),
      longitudeOfAscendingNode_(longitudeOfAscendingNode),
      argumentOfPeriapsis_(argumentOfPeriapsis) {
    if (primaryBody_ == nullptr) {
        throw std::invalid_argument("An orbit requires a primary body");
    }
}

Orbit Orbit::fromSemiMajorAxis(const Body* primaryBody, double semiMajorAxis, double eccentricity,
                               double inclination, double longitudeOfAscendingNode,
                               double argumentOfPeriapsis) {
    return Orbit(primaryBody,
                 formulas::parameterFromSemiMajorAxis(semiMajorAxis, eccentricity),
                 eccentricity, inclination, longitudeOfAscendingNode, argumentOfPeriapsis);
}

Orbit Orbit::fromElements(const Body* primaryBody, std::optional<double> parameter,
                          std::optional<double> semiMajorAxis, double eccentricity,
                          double inclination, double longitudeOfAscendingNode,
                          double argumentOfPeriapsis) {
    if (semiMajorAxis) {
        return fromSemiMajorAxis(primaryBody, *semiMajorAxis, eccentricity,
                                 inclination, longitudeOfAscendingNode, argumentOfPeriapsis);
    }
    if (!parameter) {
        throw std::invalid_argument("Either the parameter or the semi-major axis is required");
    }
    return Orbit(primaryBody, *parameter, eccentricity, inclination, longitudeOfAscendingNode, argumentOfPeriapsis);
}

Orbit Orbit::calculate(const Body& body) {
    return OrbitPosition::calculate(body).getOrbit();
}

double Orbit::getStandardGravitationalParameter() const {
    if (primaryBody_ == nullptr) {
        return 0.0;
    }
    return primaryBody_->getStandardGravitationalParameter();
}

double Orbit::getPeriapsis() const {
    return parameter_ / (1.0 + eccentricity_);
}

double Orbit::getApoapsis() const {
    if (isUnbound()) {
        return INFINITE;
    }
    return parameter_ / (1.0 - eccentricity_);
}

double Orbit::getSemiMajorAxis() const {
    if (isHyperbolic() || isBound()) {
        return parameter_ / (1.0 - eccentricity_ * eccentricity_);
    }
    return INFINITE;
}

double Orbit::getPeriod() const {
    if (isUnbound()) {
        return INFINITE;
    }
    return formulas::orbitalPeriod(getStandardGravitationalParameter(), getSemiMajorAxis());
}

OrbitType Orbit::getType() const {
    if (isCircular()) {
        return OrbitType::Circular;
    }
    if (isElliptical()) {
        return OrbitType::Elliptical;
    }
    if (isParabolic()) {
        return OrbitType::Parabolic;
    }
    return OrbitType::Hyperbolic;
}

bool Orbit::isCircular() const {
    return eccentricity_ <= ECCENTRICITY_EPSILON;
}

bool Orbit::isElliptical() const {
    return eccentricity_ > ECCENTRICITY_EPSILON && eccentricity_ < 1.0 - ECCENTRICITY_EPSILON;
}

bool Orbit::isParabolic() const {
    return std::abs(eccentricity_ - 1.0) <= ECCENTRICITY_EPSILON;
}

bool Orbit::isHyperbolic() const {
    return eccentricity_ > 1.0 + ECCENTRICITY_EPSILON;
}

bool Orbit::isBound() const {
    return eccentricity_ < 1.0 - ECCENTRICITY_EPSILON;
}

bool Orbit::isUnbound() const {
    return !isBound();
}

bool Orbit::isRadialParabolic() const {
    return parameter_ <= RADIAL_PARABOLIC_PARAMETER && isParabolic();
}

Orbit Orbit::withParameter(double parameter) const {
    Orbit copy = *this;
    copy.parameter_ = parameter;
    return copy;
}

Orbit Orbit::withEccentricity(double eccentricity) const {
    Orbit copy = *this;
    copy.eccentricity_ = eccentricity;
    return copy;
}

Orbit Orbit::withInclination(double inclination) const {
    Orbit copy = *this;
    copy.inclination_ = inclination;
    return copy;
}

Orbit Orbit::withLongitudeOfAscendingNode(double longitudeOfAscendingNode) const {
    Orbit copy = *this;
    copy.longitudeOfAscendingNode_ = longitudeOfAscendingNode;
    return copy;
}

Orbit Orbit::withArgumentOfPeriapsis(double argumentOfPeriapsis) const {
    Orbit copy = *this;
    copy.argumentOfPeriapsis_ = argumentOfPeriapsis;
    return copy;
}

Orbit Orbit::add(double deltaParameter, double deltaEccentricity, double deltaInclination,
                 double deltaLongitudeOfAscendingNode, double deltaArgumentOfPeriapsis) const {
    Orbit copy = *this;
    copy.parameter_ += deltaParameter;
    copy.eccentricity_ += deltaEccentricity;
    copy.inclination_ += deltaInclination;
    copy.longitudeOfAscendingNode_ += deltaLongitudeOfAscendingNode;
    copy.argumentOfPeriapsis_ += deltaArgumentOfPeriapsis;
    return copy;
}

Matrix3 Orbit::changeOfBasisMatrix() const {
    double node = zeroIfNaN(longitudeOfAscendingNode_);
    double periapsis = argumentOfPeriapsis_;
    if (std::isnan(periapsis) || isCircular()) {
        periapsis = 0.0;
    }

    double cosNode = std::cos(node);
    double sinNode = std::sin(node);
    double cosPeriapsis = std::cos(periapsis);
    double sinPeriapsis = std::sin(periapsis);
    double cosInclination = std::cos(inclination_);
    double sinInclination = std::sin(inclination_);

    Matrix3 r;
    r.m[0][0] = cosNode * cosPeriapsis - sinNode * sinPeriapsis * cosInclination;
    r.m[0][1] = -cosNode * sinPeriapsis - sinNode * cosPeriapsis * cosInclination;
    r.m[0][2] = sinNode * sinInclination;

    r.m[1][0] = sinNode * cosPeriapsis + cosNode * sinPeriapsis * cosInclination;
    r.m[1][1] = -sinNode * sinPeriapsis + cosNode * cosPeriapsis * cosInclination;
    r.m[1][2] = -cosNode * sinInclination;

    r.m[2][0] = sinPeriapsis * sinInclination;
    r.m[2][1] = cosPeriapsis * sinInclination;
    r.m[2][2] = cosInclination;
    return r;
}

ObjectState Orbit::calculateState(double trueAnomaly, const ObjectState& primaryBodyState) const {
    double mu = getStandardGravitationalParameter();
    double cosTrueAnomaly = std::cos(trueAnomaly);
    double sinTrueAnomaly = std::sin(trueAnomaly);

    // Perifocal frame: P towards periapsis, Q a quarter turn ahead in the orbital plane
    double distance = parameter_ / (1.0 + eccentricity_ * cosTrueAnomaly);
    Vec3 perifocalPosition{distance * cosTrueAnomaly, distance * sinTrueAnomaly, 0.0};
    double speedFactor = std::sqrt(mu / parameter_);
    Vec3 perifocalVelocity{-speedFactor * sinTrueAnomaly, speedFactor * (eccentricity_ + cosTrueAnomaly), 0.0};

    Matrix3 rotation = changeOfBasisMatrix();
    Vec3 position = swapYZ(rotation * perifocalPosition);
    Vec3 velocity = swapYZ(rotation * perifocalVelocity);

    return ObjectState(
        primaryBodyState.getTime(),
        primaryBodyState.getPosition() + position,
        primaryBodyState.getVelocity() + velocity);
}

ObjectState Orbit::calculateState(double trueAnomaly) const {
    if (primaryBody_ == nullptr) {
        throw std::logic_error("Orbit has no primary body");
    }
    return calculateState(trueAnomaly, primaryBody_->getState());
}

// Compares two angles on the circle
static bool sameAngle(double a, double b) {
    return std::abs(minAngleDifference(clampAngle(a), clampAngle(b))) <= Orbit::ECCENTRICITY_EPSILON;
}

bool Orbit::sameOrbit(const Orbit& other) const {
    double parameterTolerance = ECCENTRICITY_EPSILON * std::max(1.0, std::max(parameter_, other.parameter_));
    return std::abs(parameter_ - other.parameter_) <= parameterTolerance
        && std::abs(eccentricity_ - other.eccentricity_) <= ECCENTRICITY_EPSILON
        && std::abs(inclination_ - other.inclination_) <= ECCENTRICITY_EPSILON
        && sameAngle(zeroIfNaN(longitudeOfAscendingNode_), zeroIfNaN(other.longitudeOfAscendingNode_))
        && sameAngle(zeroIfNaN(argumentOfPeriapsis_), zeroIfNaN(other.argumentOfPeriapsis_));
}

bool Orbit::samePlane(const Orbit& other) const {
    if (std::abs(inclination_ - other.inclination_) > ECCENTRICITY_EPSILON) {
        return false;
    }
    if (std::isnan(longitudeOfAscendingNode_) && std::isnan(other.longitudeOfAscendingNode_)) {
        return true;
    }
    return sameAngle(zeroIfNaN(longitudeOfAscendingNode_), zeroIfNaN(other.longitudeOfAscendingNode_));
}

void Orbit::printInfo(std::ostream& os) const {
    os << "Type:                          " << toString(getType()) << std::endl;
    os << "Parameter:                     " << std::format("{:.3f} km", parameter_ / 1000.0) << std::endl;
    os << "Eccentricity:                  " << std::format("{:.6f}", eccentricity_) << std::endl;
    os << "Inclination:                   " << std::format("{:.4f} deg", inclination_ * RADIANS_TO_DEGREES) << std::endl;
    os << "Longitude of Ascending Node:   " << std::format("{:.4f} deg", longitudeOfAscendingNode_ * RADIANS_TO_DEGREES) << std::endl;
    os << "Argument of Periapsis:         " << std::format("{:.4f} deg", argumentOfPeriapsis_ * RADIANS_TO_DEGREES) << std::endl;
    os << "Periapsis:                     " << std::format("{:.3f} km", getPeriapsis() / 1000.0) << std::endl;
    if (isBound()) {
        os << "Apoapsis:                      " << std::format("{:.3f} km", getApoapsis() / 1000.0) << std::endl;
        os << "Semi-major Axis:               " << std::format("{:.3f} km", getSemiMajorAxis() / 1000.0) << std::endl;
        os << "Period:                        " << std::format("{:.1f} s", getPeriod()) << std::endl;
    }
}

// ============================================================================
// OrbitPosition
// ============================================================================

OrbitPosition::OrbitPosition(const Orbit& orbit, double trueAnomaly)
    : orbit_(orbit), trueAnomaly_(trueAnomaly) {}

OrbitPosition OrbitPosition::calculate(const Body& primaryBody, const ObjectState& primaryBodyState,
                                       const ObjectState& state) {
    double mu = primaryBody.getStandardGravitationalParameter();

    // Work in the physics frame, where up is +Z
    Vec3 r = swapYZ(state.getPosition() - primaryBodyState.getPosition());
    Vec3 v = swapYZ(state.getVelocity() - primaryBodyState.getVelocity());
    double rLength = r.magnitude();

    Vec3 h = r.cross(v);
    Vec3 eccentricityVector = (r * (v.magnitudeSquared() - mu / rLength) - v * r.dot(v)) * (1.0 / mu);
    Vec3 nodeVector = swapYZ(Vec3::up()).cross(h);

    double hLength = h.magnitude();
    double nLength = nodeVector.magnitude();
    double eccentricity = eccentricityVector.magnitude();
    double parameter = h.magnitudeSquared() / mu;
    double inclination = safeAcos(h.z / hLength);

    bool circular = eccentricity <= Orbit::ECCENTRICITY_EPSILON;
    bool nonEquatorial = inclination > 0.0 && std::abs(inclination - PI) > Orbit::ECCENTRICITY_EPSILON;

    double longitudeOfAscendingNode = 0.0;
    double argumentOfPeriapsis = 0.0;

    if (nonEquatorial) {
        longitudeOfAscendingNode = safeAcos(nodeVector.x / nLength);
        if (nodeVector.y < 0.0) {
            longitudeOfAscendingNode = TWO_PI - longitudeOfAscendingNode;
        }

        if (!circular) {
            argumentOfPeriapsis = safeAcos(nodeVector.dot(eccentricityVector) / (nLength * eccentricity));
            if (eccentricityVector.z < 0.0) {
                argumentOfPeriapsis = TWO_PI - argumentOfPeriapsis;
            }
        }
    } else if (!circular) {
        argumentOfPeriapsis = std::atan2(eccentricityVector.y, eccentricityVector.x);
        if (h.z < 0.0) {
            // Retrograde: the angle is measured clockwise when seen from +Z
            argumentOfPeriapsis = TWO_PI - argumentOfPeriapsis;
        }
        if (argumentOfPeriapsis < 0.0) {
            argumentOfPeriapsis += TWO_PI;
        }
        argumentOfPeriapsis = clampAngle(argumentOfPeriapsis);
    }

    double trueAnomaly = 0.0;
    if (circular) {
        if (!nonEquatorial) {
            // Measured from the X axis
            trueAnomaly = safeAcos(r.x / rLength);
            if (v.x > 0.0) {
                trueAnomaly = TWO_PI - trueAnomaly;
            }
        } else {
            // Argument of latitude, measured from the ascending node
            trueAnomaly = safeAcos(nodeVector.dot(r) / (nLength * rLength));
            if (r.z < 0.0) {
                trueAnomaly = TWO_PI - trueAnomaly;
            }
        }
    } else {
        trueAnomaly = safeAcos(eccentricityVector.dot(r) / (eccentricity * rLength));
        if (r.dot(v) < 0.0) {
            trueAnomaly = TWO_PI - trueAnomaly;
        }
    }

    Orbit orbit(&primaryBody,
                parameter,
                eccentricity,
                zeroIfNaN(inclination),
                zeroIfNaN(longitudeOfAscendingNode),
                zeroIfNaN(argumentOfPeriapsis));
    return OrbitPosition(orbit, zeroIfNaN(trueAnomaly));
}

OrbitPosition OrbitPosition::calculate(const Body& primaryBody, const ObjectState& state) {
    return calculate(primaryBody, primaryBody.getState(), state);
}

OrbitPosition OrbitPosition::calculate(const Body& body) {
    const Body* primaryBody = body.getPrimaryBody();
    if (primaryBody == nullptr) {
        throw std::invalid_argument("The object of reference has no orbit: " + body.getName());
    }
    return calculate(*primaryBody, primaryBody->getState(), body.getState());
}

OrbitPosition OrbitPosition::withTrueAnomaly(double trueAnomaly) const {
    return OrbitPosition(orbit_, trueAnomaly);
}

OrbitPosition OrbitPosition::withOrbit(const Orbit& orbit) const {
    return OrbitPosition(orbit, trueAnomaly_);
}

double OrbitPosition::getEccentricAnomaly() const {
    if (!orbit_.isBound()) {
        return 0.0;
    }
    return formulas::eccentricAnomaly(orbit_.getEccentricity(), trueAnomaly_);
}

double OrbitPosition::getHyperbolicEccentricAnomaly() const {
    if (!orbit_.isHyperbolic()) {
        return 0.0;
    }
    return formulas::hyperbolicEccentricAnomaly(orbit_.getEccentricity(), trueAnomaly_);
}

double OrbitPosition::getParabolicEccentricAnomaly() const {
    if (!orbit_.isParabolic()) {
        return 0.0;
    }
    return formulas::parabolicEccentricAnomaly(trueAnomaly_);
}

double OrbitPosition::timeToTrueAnomalyBound(double trueAnomaly) const {
    double e = orbit_.getEccentricity();
    double a = orbit_.getSemiMajorAxis();
    double mu = orbit_.getStandardGravitationalParameter();

    double E = formulas::eccentricAnomaly(e, trueAnomaly_);
    double targetE = formulas::eccentricAnomaly(e, trueAnomaly);

    double factor = std::sqrt(a * a * a / mu);
    double time = factor * (formulas::meanAnomaly(e, targetE) - formulas::meanAnomaly(e, E));

    // Already passed this revolution, wait for the next one
    if (time < 0.0) {
        time += TWO_PI * factor;
    }
    return time;
}

double OrbitPosition::timeToTrueAnomalyParabolic(double trueAnomaly) const {
    double p = orbit_.getParameter();
    double mu = orbit_.getStandardGravitationalParameter();
    double sqrtP = std::sqrt(p);

    double D = sqrtP * formulas::parabolicEccentricAnomaly(trueAnomaly_);
    double targetD = sqrtP * formulas::parabolicEccentricAnomaly(trueAnomaly);

    // Barker's equation
    double factor = 1.0 / (2.0 * std::sqrt(mu));
    double target = factor * (p * targetD + targetD * targetD * targetD / 3.0);
    double current = factor * (p * D + D * D * D / 3.0);
    return target - current;
}

double OrbitPosition::timeToTrueAnomalyHyperbolic(double trueAnomaly) const {
    double e = orbit_.getEccentricity();
    double a = orbit_.getSemiMajorAxis();
    double mu = orbit_.getStandardGravitationalParameter();

    double F = formulas::hyperbolicEccentricAnomaly(e, trueAnomaly_);
    double targetF = formulas::hyperbolicEccentricAnomaly(e, trueAnomaly);

    double factor = std::sqrt(-a * a * a / mu);
    return factor * ((e * std::sinh(targetF) - targetF) - (e * std::sinh(F) - F));
}

double OrbitPosition::timeToTrueAnomaly(double trueAnomaly) const {
    if (orbit_.isBound()) {
        return timeToTrueAnomalyBound(trueAnomaly);
    }
    if (orbit_.isParabolic()) {
        return timeToTrueAnomalyParabolic(trueAnomaly);
    }
    return timeToTrueAnomalyHyperbolic(trueAnomaly);
}

double OrbitPosition::timeToPeriapsis() const {
    return timeToTrueAnomaly(TWO_PI);
}

double OrbitPosition::timeToApoapsis() const {
    if (!orbit_.isBound()) {
        return INFINITE;
    }
    return timeToTrueAnomalyBound(PI);
}

ObjectState OrbitPosition::calculateState(const ObjectState& primaryBodyState) const {
    return orbit_.calculateState(trueAnomaly_, primaryBodyState);
}

ObjectState OrbitPosition::calculateState() const {
    return orbit_.calculateState(trueAnomaly_);
}

} // namespace orbitcraft
