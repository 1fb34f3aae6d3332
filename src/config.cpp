/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <orbitcraft/config.hpp>
#include <date/date.h>

#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>

namespace orbitcraft {

namespace {

constexpr double MIN_TOLERANCE = 1e-12;
constexpr double MAX_TOLERANCE = 1.0;
constexpr int MAX_ITERATIONS = 100000;

constexpr const char *CONFIG_FILE_NAME = ".orbitcraft.toml";

// Calendar formats accepted for the epoch, all UTC
constexpr const char *EPOCH_FORMATS[] = {
    "%Y-%m-%d %H:%M:%S",
    "%Y-%m-%dT%H:%M:%S",
    "%Y-%m-%dT%H:%M:%SZ",
    "%Y-%m-%d",
};

double clampTolerance(const double tolerance) {
    if (tolerance >= MIN_TOLERANCE && tolerance <= MAX_TOLERANCE) {
        return tolerance;
    }
    if (tolerance > MAX_TOLERANCE) {
        return MAX_TOLERANCE;
    }
    return MIN_TOLERANCE;
}

int clampIterations(const int iterations) {
    if (iterations > 0 && iterations <= MAX_ITERATIONS) {
        return iterations;
    }
    if (iterations > MAX_ITERATIONS) {
        return MAX_ITERATIONS;
    }
    return 1;
}

}

double Config::getKeplerTolerance() {
    return clampTolerance(keplerTolerance);
}

void Config::setKeplerTolerance(const double tolerance) {
    keplerTolerance = clampTolerance(tolerance);
}

int Config::getKeplerMaxIterations() {
    return clampIterations(keplerMaxIterations);
}

void Config::setKeplerMaxIterations(const int iterations) {
    keplerMaxIterations = clampIterations(iterations);
}

double Config::getLambertTolerance() {
    return clampTolerance(lambertTolerance);
}

void Config::setLambertTolerance(const double tolerance) {
    lambertTolerance = clampTolerance(tolerance);
}

int Config::getLambertMaxIterations() {
    return clampIterations(lambertMaxIterations);
}

void Config::setLambertMaxIterations(const int iterations) {
    lambertMaxIterations = clampIterations(iterations);
}

unsigned int Config::getWorkerThreads() {
    if (workerThreads > 0 && workerThreads <= MAX_WORKER_THREADS) {
        return workerThreads;
    }
    if (workerThreads > MAX_WORKER_THREADS) {
        return MAX_WORKER_THREADS;
    }
    return 1;
}

void Config::setWorkerThreads(const unsigned int threads) {
    unsigned int t = threads;
    if (t == 0) {
        // hardware_concurrency() may return 0 when it is not known
        t = std::thread::hardware_concurrency();
    }
    if (t > 0 && t <= MAX_WORKER_THREADS) {
        workerThreads = t;
    } else if (t > MAX_WORKER_THREADS) {
        workerThreads = MAX_WORKER_THREADS;
    } else {
        workerThreads = 1;
    }
}

bool Config::hasAllowedDeltaV() {
    return allowedDeltaV.has_value();
}

void Config::clearAllowedDeltaV() {
    allowedDeltaV.reset();
}

std::optional<double> Config::getAllowedDeltaV() {
    return allowedDeltaV;
}

void Config::setAllowedDeltaV(const double deltaV) {
    allowedDeltaV = deltaV > 0.0 ? deltaV : 0.0;
}

bool Config::getVerbose() {
    return verbose;
}

void Config::setVerbose(bool v) {
    verbose = v;
}

time_point Config::getEpoch() {
    return epoch;
}

void Config::setEpoch(const time_point tp) {
    epoch = tp;
}

void Config::setEpoch(const std::string &timeStr) {
    for (const char *format : EPOCH_FORMATS) {
        std::istringstream in(timeStr);
        time_point tp;
        in >> date::parse(format, tp);
        if (!in.fail() && in.peek() == std::char_traits<char>::eof()) {
            epoch = tp;
            return;
        }
    }
    throw std::invalid_argument("Invalid epoch (expected YYYY-MM-DD HH:MM:SS in UTC): " + timeStr);
}

std::string Config::formatTime(const double simulationTime) {
    auto timePoint = epoch + std::chrono::duration_cast<time_point::duration>(
        std::chrono::duration<double>(simulationTime)
    );
    return date::format("%F %T UTC", std::chrono::floor<std::chrono::seconds>(timePoint));
}

std::string Config::defaultConfigFile() {
    const char *home = std::getenv("HOME");
    if (home == nullptr) {
        return CONFIG_FILE_NAME;
    }
    return (std::filesystem::path(home) / CONFIG_FILE_NAME).string();
}

SolverSettings Config::solverSettings() {
    SolverSettings settings;
    settings.keplerTolerance = getKeplerTolerance();
    settings.keplerMaxIterations = getKeplerMaxIterations();
    settings.lambertTolerance = getLambertTolerance();
    settings.lambertMaxIterations = getLambertMaxIterations();
    return settings;
}

}
