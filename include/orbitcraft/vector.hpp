/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __ORBITCRAFT_VECTOR_HPP
#define __ORBITCRAFT_VECTOR_HPP

#include <cmath>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <numbers>

namespace orbitcraft {

// ============================================================================
// Angle Constants
// ============================================================================

constexpr double PI = std::numbers::pi;
constexpr double TWO_PI = 2.0 * std::numbers::pi;

// Degree-radian conversion factors
constexpr double DEGREES_TO_RADIANS = std::numbers::pi / 180.0;
constexpr double RADIANS_TO_DEGREES = 180.0 / std::numbers::pi;

// ============================================================================
// Basic Data Types
// ============================================================================

/**
 * 3D vector in Cartesian coordinates.
 */
struct Vec3 {
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;

    Vec3 operator+(const Vec3& other) const {
        return {x + other.x, y + other.y, z + other.z};
    }

    Vec3 operator-(const Vec3& other) const {
        return {x - other.x, y - other.y, z - other.z};
    }

    Vec3 operator-() const {
        return {-x, -y, -z};
    }

    Vec3 operator*(double scalar) const {
        return {x * scalar, y * scalar, z * scalar};
    }

    Vec3 operator/(double scalar) const {
        return {x / scalar, y / scalar, z / scalar};
    }

    Vec3& operator+=(const Vec3& other) {
        x += other.x;
        y += other.y;
        z += other.z;
        return *this;
    }

    bool operator==(const Vec3& other) const = default;

    double magnitude() const {
        return std::sqrt(x*x + y*y + z*z);
    }

    double magnitudeSquared() const {
        return x*x + y*y + z*z;
    }

    double dot(const Vec3& other) const {
        return x * other.x + y * other.y + z * other.z;
    }

    Vec3 cross(const Vec3& other) const {
        return {
            y * other.z - z * other.y,
            z * other.x - x * other.z,
            x * other.y - y * other.x
        };
    }

    /**
     * Returns a unit vector (magnitude = 1) in the same direction as this vector.
     * The zero vector is returned unchanged.
     */
    Vec3 normalize() const {
        double mag = magnitude();
        if (mag == 0.0) {
            return *this;
        }
        return {x / mag, y / mag, z / mag};
    }

    double distance(const Vec3& other) const {
        return (*this - other).magnitude();
    }

    bool isNaN() const {
        return std::isnan(x) || std::isnan(y) || std::isnan(z);
    }

    bool isFinite() const {
        return std::isfinite(x) && std::isfinite(y) && std::isfinite(z);
    }

    /** Canonical "up" direction of the world frame. */
    static constexpr Vec3 up() { return {0.0, 1.0, 0.0}; }

    /** Canonical "right" direction of the world frame. */
    static constexpr Vec3 right() { return {1.0, 0.0, 0.0}; }
};

inline Vec3 operator*(double scalar, const Vec3& v) {
    return v * scalar;
}

/**
 * 3x3 row-major rotation matrix.
 */
struct Matrix3 {
    double m[3][3] = {{1.0, 0.0, 0.0}, {0.0, 1.0, 0.0}, {0.0, 0.0, 1.0}};

    Vec3 operator*(const Vec3& v) const {
        return {
            m[0][0] * v.x + m[0][1] * v.y + m[0][2] * v.z,
            m[1][0] * v.x + m[1][1] * v.y + m[1][2] * v.z,
            m[2][0] * v.x + m[2][1] * v.y + m[2][2] * v.z
        };
    }
};

// ============================================================================
// Math Helpers
// ============================================================================

/**
 * Converts between the world frame (Y up) and the physics frame (Z up)
 * by swapping the Y and Z components. The operation is its own inverse.
 */
inline Vec3 swapYZ(const Vec3& v) {
    return {v.x, v.z, v.y};
}

/** Wraps an angle into [0, 2π]. */
double clampAngle(double angle);

/** Unsigned angle between two vectors in [0, π]. */
double angleBetween(const Vec3& u, const Vec3& v);

/** Angle between two vectors, signed by the direction of the normal n. */
double angleBetween(const Vec3& u, const Vec3& v, const Vec3& n);

/** Shortest signed difference requiredAngle - angle, in [-π, π]. */
double minAngleDifference(double angle, double requiredAngle);

/** Linear interpolation between a and b. */
inline double lerp(double a, double b, double amount) {
    return a + (b - a) * amount;
}

/**
 * Stumpff function C(z).
 * Uses a series expansion for |z| < 1e-3 to avoid cancellation near z = 0.
 */
double stumpffC(double z);

/**
 * Stumpff function S(z).
 * Uses a series expansion for |z| < 1e-3 to avoid cancellation near z = 0.
 */
double stumpffS(double z);

/**
 * Builds a reproducible random seed from the inputs of a computation.
 * Identical inputs always produce the same seed.
 */
inline std::uint64_t seedFromInputs(std::initializer_list<double> values) {
    std::uint64_t seed = 0x9E3779B97F4A7C15ULL;
    for (double value : values) {
        seed ^= std::hash<double>{}(value) + 0x9E3779B97F4A7C15ULL + (seed << 6) + (seed >> 2);
    }
    return seed;
}

} // namespace orbitcraft

#endif
