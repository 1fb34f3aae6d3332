/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <orbitcraft.hpp>
#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <format>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

orbitcraft::Vec3 toVector(const std::vector<double> &values) {
    if (values.size() != 3) {
        throw std::invalid_argument(std::format("Expected 3 vector components, got {}", values.size()));
    }
    return {values[0], values[1], values[2]};
}

std::string formatVector(const orbitcraft::Vec3 &v) {
    return std::format("({:.6e}, {:.6e}, {:.6e})", v.x, v.y, v.z);
}

void printManeuvers(orbitcraft::Config &config, const orbitcraft::ManeuverSequence &maneuvers) {
    constexpr std::string_view rowFormat = "{:^25} {:^14} {:^44}";

    std::cout << std::format(rowFormat, "Time", "Delta V (m/s)", "Burn (m/s)") << std::endl;
    std::cout << std::format(rowFormat, std::string(25, '-'), std::string(14, '-'), std::string(44, '-')) << std::endl;
    for (const auto &maneuver : maneuvers) {
        std::cout << std::format(rowFormat,
            config.formatTime(maneuver.getTime()),
            std::format("{:.2f}", maneuver.getDeltaVelocity().magnitude()),
            formatVector(maneuver.getDeltaVelocity())) << std::endl;
    }
    std::cout << std::format("Total delta V: {:.2f} m/s", maneuvers.totalDeltaVelocity()) << std::endl;
}

/** Program entry point */
int main(int argc, char* argv[]) {
    using namespace orbitcraft;

    Config config;
    config.setVerbose(false);
    config.setEpoch(J2000_EPOCH);
    config.setWorkerThreads(0);
    spdlog::set_level(spdlog::level::info);

    auto configFile = Config::defaultConfigFile();

    CLI::App app{"OrbitCraft"};
    argv = app.ensure_utf8(argv);

    app.set_config("--config", configFile, "Read configuration from this file (default: " + configFile + ").");

    app.add_flag_function("-v,--verbose",
        [&config](const int64_t v) {
            config.setVerbose(v > 0);
            spdlog::set_level(v > 0 ? spdlog::level::debug : spdlog::level::info);
        },
        "Display debugging information");
    app.add_option_function<std::string>("--epoch",
        [&config](const std::string &timeStr) { config.setEpoch(timeStr); },
        "UTC calendar time of simulation time 0 (YYYY-MM-DD HH:MM:SS, default J2000)");
    app.add_option_function<unsigned int>("--threads",
        [&config](const unsigned int threads) { config.setWorkerThreads(threads); },
        "Worker threads used by searches (default: all cores, max 64)");
    app.add_option_function<double>("--kepler-tolerance",
        [&config](const double tolerance) { config.setKeplerTolerance(tolerance); },
        "Convergence tolerance of the Kepler solver in seconds (default 1e-6)");
    app.add_option_function<int>("--kepler-iterations",
        [&config](const int iterations) { config.setKeplerMaxIterations(iterations); },
        "Iteration limit of the Kepler solver (default 1500)");
    app.add_option_function<double>("--lambert-tolerance",
        [&config](const double tolerance) { config.setLambertTolerance(tolerance); },
        "Convergence tolerance of the Lambert solver in seconds (default 1e-6)");
    app.add_option_function<int>("--lambert-iterations",
        [&config](const int iterations) { config.setLambertMaxIterations(iterations); },
        "Iteration limit of the Lambert solver (default 1000)");
    app.add_option_function<double>("--allowed-dv",
        [&config](const double deltaV) { config.setAllowedDeltaV(deltaV); },
        "Stop searching once a burn this small is found, in m/s");

    app.ignore_case();

    double mu = EARTH_STANDARD_GRAVITATIONAL_PARAMETER;
    std::vector<double> position;
    std::vector<double> velocity;
    double deltaTime = 0.0;

    // Elements command - state vector to orbital elements
    auto elementsCommand = app.add_subcommand("elements", "Convert a state vector to orbital elements");
    elementsCommand->add_option("--mu", mu, "Standard gravitational parameter of the primary body in m^3/s^2 (default: Earth)");
    elementsCommand->add_option("--pos", position, "Position relative to the primary body in m (x y z)")->expected(3)->required();
    elementsCommand->add_option("--vel", velocity, "Velocity relative to the primary body in m/s (x y z)")->expected(3)->required();

    // Propagate command - state vector after some time
    auto propagateCommand = app.add_subcommand("propagate", "Propagate a state vector along its orbit");
    propagateCommand->add_option("--mu", mu, "Standard gravitational parameter of the primary body in m^3/s^2 (default: Earth)");
    propagateCommand->add_option("--pos", position, "Position relative to the primary body in m (x y z)")->expected(3)->required();
    propagateCommand->add_option("--vel", velocity, "Velocity relative to the primary body in m/s (x y z)")->expected(3)->required();
    propagateCommand->add_option("--dt", deltaTime, "Time to propagate in seconds")->required();

    // Lambert command - velocities between two positions
    std::vector<double> lambertR1;
    std::vector<double> lambertR2;
    double timeOfFlight = 0.0;
    bool longWay = false;
    auto lambertCommand = app.add_subcommand("lambert", "Solve Lambert's problem between two positions");
    lambertCommand->add_option("--mu", mu, "Standard gravitational parameter of the primary body in m^3/s^2 (default: Earth)");
    lambertCommand->add_option("--r1", lambertR1, "Departure position in m (x y z)")->expected(3)->required();
    lambertCommand->add_option("--r2", lambertR2, "Arrival position in m (x y z)")->expected(3)->required();
    lambertCommand->add_option("--tof", timeOfFlight, "Time of flight in seconds")->required();
    lambertCommand->add_flag("--long", longWay, "Take the long way around");

    // Hohmann command - closed form transfer between circular orbits
    double radius1 = 0.0;
    double radius2 = 0.0;
    auto hohmannCommand = app.add_subcommand("hohmann", "Hohmann transfer between two circular orbits");
    hohmannCommand->add_option("--mu", mu, "Standard gravitational parameter of the primary body in m^3/s^2 (default: Earth)");
    hohmannCommand->add_option("--r1", radius1, "Radius of the current orbit in m")->required();
    hohmannCommand->add_option("--r2", radius2, "Radius of the new orbit in m")->required();

    // Transfer command - planetary transfer in the solar system scenario
    std::string fromPlanet = "Earth";
    std::string toPlanet = "Mars";
    double altitude = DEFAULT_PARKING_ALTITUDE;
    bool useHohmann = false;
    bool coplanar = false;
    auto transferCommand = app.add_subcommand("transfer", "Plan a transfer from a parking orbit to another planet");
    transferCommand->add_option("--from", fromPlanet, "Planet the spacecraft orbits (default Earth)");
    transferCommand->add_option("--to", toPlanet, "Destination planet (default Mars)");
    transferCommand->add_option("--altitude", altitude, "Altitude of the circular parking orbit in m (default 300000)");
    transferCommand->add_flag("--hohmann", useHohmann, "Use a Hohmann transfer for the heliocentric leg instead of searching");
    transferCommand->add_flag("--coplanar", coplanar, "Put every planet in the ecliptic");

    // Approach command - closest approach of two planets
    std::string approachFirst = "Earth";
    std::string approachSecond = "Mars";
    auto approachCommand = app.add_subcommand("approach", "Closest approach of two planets during one synodic period");
    approachCommand->add_option("first", approachFirst, "First planet (default Earth)");
    approachCommand->add_option("second", approachSecond, "Second planet (default Mars)");
    approachCommand->add_option("--dt", deltaTime, "Sampling step in seconds (default: synodic period / 2000)");
    approachCommand->add_flag("--coplanar", coplanar, "Put every planet in the ecliptic");

    // Command callbacks

    elementsCommand->final_callback([&mu, &position, &velocity](void) {
        try {
            Body primary("Primary", ObjectConfig(mu / GRAVITATIONAL_CONSTANT), ObjectState());
            ObjectState state(0.0, toVector(position), toVector(velocity));
            OrbitPosition orbitPosition = OrbitPosition::calculate(primary, state);
            orbitPosition.getOrbit().printInfo(std::cout);
            std::cout << std::format("True Anomaly: {:.6f} deg", orbitPosition.getTrueAnomaly() * RADIANS_TO_DEGREES) << std::endl;
            std::cout << std::format("Time to Periapsis: {:.3f} s", orbitPosition.timeToPeriapsis()) << std::endl;
        } catch (const std::exception &err) {
            std::cerr << err.what() << std::endl;
            std::exit(1);
        }
    });

    propagateCommand->final_callback([&config, &mu, &position, &velocity, &deltaTime](void) {
        try {
            Body primary("Primary", ObjectConfig(mu / GRAVITATIONAL_CONSTANT), ObjectState());
            ObjectState state(0.0, toVector(position), toVector(velocity));
            Orbit orbit = OrbitPosition::calculate(primary, state).getOrbit();

            UniversalVariableKeplerSolver solver(config.solverSettings());
            ObjectState next = solver.solve(ObjectConfig(), ObjectState(), state, orbit, ObjectState(), deltaTime);

            std::cout << "Time:     " << config.formatTime(next.getTime()) << std::endl;
            std::cout << "Position: " << formatVector(next.getPosition()) << " m" << std::endl;
            std::cout << "Velocity: " << formatVector(next.getVelocity()) << " m/s" << std::endl;
        } catch (const std::exception &err) {
            std::cerr << err.what() << std::endl;
            std::exit(1);
        }
    });

    lambertCommand->final_callback([&config, &mu, &lambertR1, &lambertR2, &timeOfFlight, &longWay](void) {
        try {
            Body primary("Primary", ObjectConfig(mu / GRAVITATIONAL_CONSTANT), ObjectState());
            AdaptiveLambertSolver solver(config.solverSettings());
            LambertSolution solution = solver.solve(primary, ObjectState(), ObjectState(),
                toVector(lambertR1), toVector(lambertR2), timeOfFlight, !longWay);

            std::cout << "Departure velocity: " << formatVector(solution.velocity1) << " m/s" << std::endl;
            std::cout << "Arrival velocity:   " << formatVector(solution.velocity2) << " m/s" << std::endl;
        } catch (const std::exception &err) {
            std::cerr << err.what() << std::endl;
            std::exit(1);
        }
    });

    hohmannCommand->final_callback([&mu, &radius1, &radius2](void) {
        try {
            if (radius1 <= 0.0 || radius2 <= 0.0) {
                throw std::invalid_argument("Orbit radii must be positive");
            }
            hohmann::TransferBurns burns = hohmann::calculateBurn(mu, radius1, radius2);
            std::cout << std::format("First burn:  {:.3f} m/s", burns.firstBurn) << std::endl;
            std::cout << std::format("Second burn: {:.3f} m/s", burns.secondBurn) << std::endl;
            std::cout << std::format("Coast time:  {:.1f} s", burns.coastTime) << std::endl;
        } catch (const std::exception &err) {
            std::cerr << err.what() << std::endl;
            std::exit(1);
        }
    });

    transferCommand->final_callback([&config, &fromPlanet, &toPlanet, &altitude, &useHohmann, &coplanar](void) {
        try {
            SolarSystem solarSystem(coplanar);
            const Body &ship = solarSystem.addSatelliteInOrbit("Spacecraft", ObjectConfig(1000.0, 0.0, 10.0),
                                                               fromPlanet, altitude);
            const Body &target = solarSystem.get(toPlanet);

            UniversalVariableKeplerSolver keplerSolver(config.solverSettings());
            AdaptiveLambertSolver lambertSolver(config.solverSettings());
            PlannerContext context{keplerSolver, lambertSolver, 0.0, config.getWorkerThreads(),
                [](const std::string &message) { std::cerr << message << std::endl; }};

            TransferSettings settings;
            if (config.hasAllowedDeltaV()) {
                settings.midcourseAllowedDeltaV = *config.getAllowedDeltaV();
            }

            PlanetaryTransfer transfer(context, ship, target, settings);
            std::optional<ManeuverSequence> maneuvers;
            if (useHohmann) {
                transfer.useHohmannHeliocentricLeg();
                transfer.calculateInjectionBurn();
                transfer.calculateSphereOfInfluenceExit();
                if (transfer.calculateMidcourseCorrection()) {
                    maneuvers = transfer.computeManeuvers();
                }
            } else {
                maneuvers = transfer.compute();
            }

            if (!maneuvers.has_value()) {
                std::cerr << "No feasible transfer from " << fromPlanet << " to " << toPlanet << " found." << std::endl;
                std::exit(1);
            }

            std::cout << std::endl;
            std::cout << "Transfer from " << ship.getPrimaryBody()->getName() << " to " << target.getName() << ":" << std::endl;
            std::cout << std::endl;
            printManeuvers(config, *maneuvers);
        } catch (const std::exception &err) {
            std::cerr << err.what() << std::endl;
            std::exit(1);
        }
    });

    approachCommand->final_callback([&config, &approachFirst, &approachSecond, &deltaTime, &coplanar](void) {
        try {
            SolarSystem solarSystem(coplanar);
            const Body &first = solarSystem.get(approachFirst);
            const Body &second = solarSystem.get(approachSecond);

            UniversalVariableKeplerSolver solver(config.solverSettings());
            auto approach = closestApproach(solver,
                first.getConfig(), OrbitPosition::calculate(first),
                second.getConfig(), OrbitPosition::calculate(second),
                deltaTime, config.getWorkerThreads());

            if (!approach.has_value()) {
                std::cerr << first.getName() << " and " << second.getName() << " never realign." << std::endl;
                std::exit(1);
            }

            std::cout << std::format("Closest approach of {} and {}: {:.0f} km at {}",
                first.getName(), second.getName(), approach->distance / 1000.0,
                config.formatTime(approach->time)) << std::endl;
        } catch (const std::exception &err) {
            std::cerr << err.what() << std::endl;
            std::exit(1);
        }
    });

    CLI11_PARSE(app, argc, argv);

    if (app.get_subcommands().empty()) {
        std::cerr << app.help() << std::endl;
        std::exit(1);
    }

    return 0;
}
