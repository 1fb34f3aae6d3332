/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __ORBITCRAFT_EXCEPTIONS_HPP
#define __ORBITCRAFT_EXCEPTIONS_HPP

#include <stdexcept>
#include <string>

namespace orbitcraft {

// ============================================================================
// Exception Classes
// ============================================================================

/**
 * Base exception class for astrodynamics errors.
 */
class OrbitCraftException : public std::runtime_error {
public:
    explicit OrbitCraftException(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * Exception thrown when a requested orbital change is physically impossible
 * for the current orbit, or the orbital configuration is not supported.
 * Thrown before any maneuver is produced.
 */
class GeometricInfeasibilityException : public OrbitCraftException {
public:
    explicit GeometricInfeasibilityException(const std::string& msg) : OrbitCraftException(msg) {}
};

/**
 * Exception thrown when an iterative solver exceeds its iteration budget or
 * leaves the domain where a solution exists.
 */
class NumericNonConvergenceException : public OrbitCraftException {
public:
    explicit NumericNonConvergenceException(const std::string& msg) : OrbitCraftException(msg) {}
};

} // namespace orbitcraft

#endif
