/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <orbitcraft/vector.hpp>

#include <cmath>

namespace orbitcraft {

// Below this magnitude the Stumpff functions are evaluated from their series
constexpr double STUMPFF_SERIES_LIMIT = 1e-3;

double clampAngle(double angle) {
    if (!std::isfinite(angle)) {
        return angle;
    }
    angle = std::fmod(angle, TWO_PI);
    if (angle < 0.0) {
        angle += TWO_PI;
    }
    return angle;
}

double angleBetween(const Vec3& u, const Vec3& v) {
    if (u == v) {
        return 0.0;
    }
    return std::atan2(u.cross(v).magnitude(), u.dot(v));
}

double angleBetween(const Vec3& u, const Vec3& v, const Vec3& n) {
    if (u == v) {
        return 0.0;
    }
    double angle = angleBetween(u, v);
    double side = n.dot(u.cross(v));
    return side < 0.0 ? -angle : angle;
}

double minAngleDifference(double angle, double requiredAngle) {
    double delta = requiredAngle - angle;
    if (delta > PI) {
        delta -= TWO_PI;
    }
    if (delta < -PI) {
        delta += TWO_PI;
    }
    return delta;
}

double stumpffC(double z) {
    if (std::abs(z) < STUMPFF_SERIES_LIMIT) {
        return 1.0 / 2.0 - z / 24.0 + (z * z) / 720.0 - (z * z * z) / 40320.0;
    }
    if (z > 0.0) {
        return (1.0 - std::cos(std::sqrt(z))) / z;
    }
    return (1.0 - std::cosh(std::sqrt(-z))) / z;
}

double stumpffS(double z) {
    if (std::abs(z) < STUMPFF_SERIES_LIMIT) {
        return 1.0 / 6.0 - z / 120.0 + (z * z) / 5040.0 - (z * z * z) / 362880.0;
    }
    if (z > 0.0) {
        double sqrtZ = std::sqrt(z);
        return (sqrtZ - std::sin(sqrtZ)) / (sqrtZ * sqrtZ * sqrtZ);
    }
    double sqrtZ = std::sqrt(-z);
    return (std::sinh(sqrtZ) - sqrtZ) / (sqrtZ * sqrtZ * sqrtZ);
}

} // namespace orbitcraft
