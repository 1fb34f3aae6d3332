/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <orbitcraft/lambert.hpp>
#include <orbitcraft/exceptions.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <format>
#include <random>

using spdlog::debug;

namespace orbitcraft {

// Iterations between forced reseeds of a stalled iteration
constexpr int RESEED_INTERVAL = 200;

// Below this |z| the Stumpff derivatives use their series expansions
constexpr double DERIVATIVE_SERIES_LIMIT = 1e-3;

// Iterations between forced reseeds of the p-iteration
constexpr int P_RESEED_INTERVAL = 100;

// Transfer angles this close to π have no defined transfer plane (rad)
constexpr double COLLINEAR_TOLERANCE = 1e-9;

// Angle swept from r1 to r2 in the direction of travel
static double transferAngle(const Vec3& r1, const Vec3& r2, bool shortWay) {
    double deltaTrueAnomaly = angleBetween(r1, r2);
    if (std::abs(deltaTrueAnomaly - PI) < COLLINEAR_TOLERANCE) {
        throw GeometricInfeasibilityException(std::format(
            "Lambert's problem is undefined for positions on opposite sides of the primary body ({:.3e} rad from 180 degrees)",
            std::abs(deltaTrueAnomaly - PI)));
    }
    return shortWay ? deltaTrueAnomaly : TWO_PI - deltaTrueAnomaly;
}

static double calculateY(double r1Length, double r2Length, double z, double S, double C, double A) {
    return r1Length + r2Length - (A * (1.0 - z * S)) / std::sqrt(C);
}

UniversalVariableLambertSolver::UniversalVariableLambertSolver(const SolverSettings& settings)
    : tolerance_(settings.lambertTolerance), maxIterations_(settings.lambertMaxIterations) {}

double UniversalVariableLambertSolver::solveForZ(double deltaTrueAnomaly, double timeOfFlight, double sqrtMu,
                                                 double r1Length, double r2Length, double A) const {
    const double maxZ = TWO_PI * TWO_PI;
    std::mt19937_64 rng(seedFromInputs({deltaTrueAnomaly, timeOfFlight, sqrtMu, r1Length, r2Length}));
    std::uniform_real_distribution<double> reseed(-maxZ, maxZ);

    double z = deltaTrueAnomaly * deltaTrueAnomaly;

    for (int i = 0; i < maxIterations_; i++) {
        double S = stumpffS(z);
        double C = stumpffC(z);
        double y = calculateY(r1Length, r2Length, z, S, C, A);

        // Outside the domain, pick a new starting point
        if (y < 0.0) {
            if (i < maxIterations_ - 1) {
                z = reseed(rng);
                continue;
            }
            break;
        }

        double x = std::sqrt(y / C);
        double sqrtY = std::sqrt(y);

        double time = (x * x * x * S + A * sqrtY) / sqrtMu;
        double dt = timeOfFlight - time;
        if (std::abs(dt) <= tolerance_) {
            debug("Lambert solver converged after {} iterations (z = {})", i, z);
            return z;
        }

        // Derivatives of S and C
        double Sp = 0.0;
        double Cp = 0.0;
        if (std::abs(z) < DERIVATIVE_SERIES_LIMIT) {
            Sp = 1.0 / 120.0 + (2.0 * z) / 5040.0 - (3.0 * z * z) / 362880.0 + (4.0 * z * z * z) / 39916800.0;
            Cp = 1.0 / 24.0 + (2.0 * z) / 720.0 - (3.0 * z * z) / 40320.0 + (4.0 * z * z * z) / 3628800.0;
        } else {
            Sp = (C - 3.0 * S) / (2.0 * z);
            Cp = (1.0 - z * S - 2.0 * C) / (2.0 * z);
        }

        double dtdz = x * x * x * (Sp - (3.0 * S * Cp) / (2.0 * C)) + (A / 8.0) * ((3.0 * S * sqrtY) / C + A / x);
        dtdz /= sqrtMu;
        z += dt / dtdz;

        if ((i > 0 && i % RESEED_INTERVAL == 0) || !std::isfinite(z)) {
            z = reseed(rng);
        }
    }

    throw NumericNonConvergenceException("Lambert's problem cannot be solved with the current parameters");
}

LambertSolution UniversalVariableLambertSolver::solve(const Body& primaryBody,
                                                      const ObjectState& primaryBodyState1,
                                                      const ObjectState& primaryBodyState2,
                                                      const Vec3& position1,
                                                      const Vec3& position2,
                                                      double timeOfFlight,
                                                      bool shortWay) const {
    Vec3 r1 = position1 - primaryBodyState1.getPosition();
    Vec3 r2 = position2 - primaryBodyState2.getPosition();

    double r1Length = r1.magnitude();
    double r2Length = r2.magnitude();
    double mu = primaryBody.getStandardGravitationalParameter();
    double sqrtMu = std::sqrt(mu);

    double deltaTrueAnomaly = transferAngle(r1, r2, shortWay);

    double sign = deltaTrueAnomaly < PI ? 1.0 : -1.0;
    double A = sign * std::sqrt(r1Length * r2Length * (1.0 + std::cos(deltaTrueAnomaly)));

    double z = solveForZ(deltaTrueAnomaly, timeOfFlight, sqrtMu, r1Length, r2Length, A);
    double y = calculateY(r1Length, r2Length, z, stumpffS(z), stumpffC(z), A);

    // Lagrange coefficients
    double f = 1.0 - y / r1Length;
    double g = A * std::sqrt(y / mu);
    double gp = 1.0 - y / r2Length;

    Vec3 v1 = (r2 - r1 * f) / g;
    Vec3 v2 = (r2 * gp - r1) / g;
    return {primaryBodyState1.getVelocity() + v1, primaryBodyState2.getVelocity() + v2};
}

// ============================================================================
// P-Iteration
// ============================================================================

PMethodLambertSolver::PMethodLambertSolver(const SolverSettings& settings)
    : tolerance_(settings.lambertTolerance), maxIterations_(settings.lambertMaxIterations) {}

LambertSolution PMethodLambertSolver::solve(const Body& primaryBody,
                                            const ObjectState& primaryBodyState1,
                                            const ObjectState& primaryBodyState2,
                                            const Vec3& position1,
                                            const Vec3& position2,
                                            double timeOfFlight,
                                            bool shortWay) const {
    Vec3 r1 = position1 - primaryBodyState1.getPosition();
    Vec3 r2 = position2 - primaryBodyState2.getPosition();

    double r1Length = r1.magnitude();
    double r2Length = r2.magnitude();
    double mu = primaryBody.getStandardGravitationalParameter();

    double deltaTrueAnomaly = transferAngle(r1, r2, shortWay);
    double cosDelta = std::cos(deltaTrueAnomaly);
    double sinDelta = std::sin(deltaTrueAnomaly);
    double tanHalfDelta = std::tan(deltaTrueAnomaly / 2.0);

    double k = r1Length * r2Length * (1.0 - cosDelta);
    double l = r1Length + r2Length;
    double m = r1Length * r2Length * (1.0 + cosDelta);

    // p between these values gives an ellipse, at them a parabola
    double pLower = k / (l + std::sqrt(2.0 * m));
    double pUpper = k / (l - std::sqrt(2.0 * m));
    if (!(pLower > 0.0) || !std::isfinite(pUpper) || pUpper <= pLower) {
        throw NumericNonConvergenceException(std::format(
            "Lambert's problem has no p range for a transfer angle of {:.6f} rad", deltaTrueAnomaly));
    }

    std::mt19937_64 rng(seedFromInputs({deltaTrueAnomaly, timeOfFlight, mu, r1Length, r2Length}));
    std::uniform_real_distribution<double> reseed(pLower, pUpper);

    double p = 0.5 * (pLower + pUpper);

    for (int i = 0; i < maxIterations_; i++) {
        double a = m * k * p / ((2.0 * m - l * l) * p * p + 2.0 * k * l * p - k * k);

        // Lagrange coefficients
        double f = 1.0 - (r2Length / p) * (1.0 - cosDelta);
        double g = r1Length * r2Length * sinDelta / std::sqrt(mu * p);
        double fp = std::sqrt(mu / p) * tanHalfDelta * ((1.0 - cosDelta) / p - 1.0 / r1Length - 1.0 / r2Length);

        // Time of flight and its derivative with respect to p
        double time = 0.0;
        double anomalyTerm = 0.0;
        if (a > 0.0) {
            double cosE = 1.0 - (r1Length / a) * (1.0 - f);
            double sinE = -r1Length * r2Length * fp / std::sqrt(mu * a);
            double deltaE = clampAngle(std::atan2(sinE, cosE));
            double scale = std::sqrt(a * a * a / mu);
            time = g + scale * (deltaE - sinE);
            anomalyTerm = scale * (2.0 * k * sinE) / (p * (k - l * p));
        } else {
            double coshF = std::max(1.0, 1.0 - (r1Length / a) * (1.0 - f));
            double deltaF = std::acosh(coshF);
            double sinhF = std::sinh(deltaF);
            double scale = std::sqrt(-a * a * a / mu);
            time = g + scale * (sinhF - deltaF);
            anomalyTerm = -scale * (2.0 * k * sinhF) / (p * (k - l * p));
        }
        double dtdp = -g / (2.0 * p)
                      - 1.5 * a * (time - g) * ((k * k + (2.0 * m - l * l) * p * p) / (m * k * p * p))
                      + anomalyTerm;

        double dt = timeOfFlight - time;
        if (std::abs(dt) <= tolerance_) {
            debug("P-iteration converged after {} iterations (p = {})", i, p);
            Vec3 v1 = (r2 - r1 * f) / g;
            double gp = 1.0 - (r1Length / p) * (1.0 - cosDelta);
            Vec3 v2 = r1 * fp + v1 * gp;
            return {primaryBodyState1.getVelocity() + v1, primaryBodyState2.getVelocity() + v2};
        }

        p += dt / dtdp;

        if ((i > 0 && i % P_RESEED_INTERVAL == 0) || !std::isfinite(p) || p <= 0.0) {
            p = reseed(rng);
        }
    }

    throw NumericNonConvergenceException("Lambert's problem cannot be solved by p-iteration with the current parameters");
}

// ============================================================================
// Adaptive
// ============================================================================

AdaptiveLambertSolver::AdaptiveLambertSolver(const SolverSettings& settings)
    : universalVariable_(settings), pMethod_(settings) {}

AdaptiveLambertSolver::AdaptiveLambertSolver(const SolverSettings& universalVariableSettings,
                                             const SolverSettings& pMethodSettings)
    : universalVariable_(universalVariableSettings), pMethod_(pMethodSettings) {}

LambertSolution AdaptiveLambertSolver::solve(const Body& primaryBody,
                                             const ObjectState& primaryBodyState1,
                                             const ObjectState& primaryBodyState2,
                                             const Vec3& position1,
                                             const Vec3& position2,
                                             double timeOfFlight,
                                             bool shortWay) const {
    try {
        return universalVariable_.solve(primaryBody, primaryBodyState1, primaryBodyState2,
                                        position1, position2, timeOfFlight, shortWay);
    } catch (const NumericNonConvergenceException& e) {
        debug("Universal variable solver failed, trying p-iteration: {}", e.what());
    }
    return pMethod_.solve(primaryBody, primaryBodyState1, primaryBodyState2,
                          position1, position2, timeOfFlight, shortWay);
}

} // namespace orbitcraft
