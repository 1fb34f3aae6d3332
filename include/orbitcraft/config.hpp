/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __ORBITCRAFT_CONFIG_HPP
#define __ORBITCRAFT_CONFIG_HPP

#include <orbitcraft/kepler.hpp>

#include <chrono>
#include <optional>
#include <string>

namespace orbitcraft {

using time_point = std::chrono::system_clock::time_point;

// 2000-01-01 12:00:00 UTC
const time_point J2000_EPOCH = std::chrono::system_clock::from_time_t(946728000);

constexpr unsigned int MAX_WORKER_THREADS = 64;

/**
 * Settings of the command line tool. Setters clamp values into their valid
 * range; getters never return a value outside of it.
 */
class Config {
public:
    // Empty constructor
    Config() = default;
    ~Config() = default;

    double getKeplerTolerance();
    void setKeplerTolerance(const double tolerance);

    int getKeplerMaxIterations();
    void setKeplerMaxIterations(const int iterations);

    double getLambertTolerance();
    void setLambertTolerance(const double tolerance);

    int getLambertMaxIterations();
    void setLambertMaxIterations(const int iterations);

    /** Threads used by grid searches. Setting 0 uses the hardware concurrency. */
    unsigned int getWorkerThreads();
    void setWorkerThreads(const unsigned int threads);

    bool hasAllowedDeltaV();
    void clearAllowedDeltaV();
    std::optional<double> getAllowedDeltaV();
    void setAllowedDeltaV(const double deltaV);

    bool getVerbose();
    void setVerbose(bool);

    /** Calendar time of simulation time 0. */
    time_point getEpoch();
    void setEpoch(const time_point tp);

    /**
     * Sets the epoch from a UTC calendar time, either "YYYY-MM-DD HH:MM:SS",
     * "YYYY-MM-DDTHH:MM:SS[Z]" or "YYYY-MM-DD" for midnight.
     * @throws std::invalid_argument if the time cannot be parsed
     */
    void setEpoch(const std::string &timeStr);

    /** Calendar time of a simulation time, truncated to seconds. */
    std::string formatTime(const double simulationTime);

    /** Path of the configuration file read by the command line tool. */
    static std::string defaultConfigFile();

    /** Solver settings built from the tolerances and iteration limits. */
    SolverSettings solverSettings();

private:
    double keplerTolerance = 1e-6;
    int keplerMaxIterations = 1500;
    double lambertTolerance = 1e-6;
    int lambertMaxIterations = 1000;
    unsigned int workerThreads = 1;
    std::optional<double> allowedDeltaV;
    bool verbose = false;
    time_point epoch = J2000_EPOCH;
};

}

#endif
