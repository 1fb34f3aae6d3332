/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __ORBITCRAFT_SOLAR_SYSTEM_HPP
#define __ORBITCRAFT_SOLAR_SYSTEM_HPP

#include <orbitcraft/orbit.hpp>
#include <orbitcraft/state.hpp>

#include <memory>
#include <string>
#include <vector>

namespace orbitcraft {

// Default altitude of satellites placed around a planet
constexpr double DEFAULT_PARKING_ALTITUDE = 300e3;

/**
 * Physical data and reference orbit of a solar system body.
 * Angles are in degrees.
 */
struct BodyData {
    std::string name;
    std::string primary;            ///< Name of the body it orbits, empty for the sun
    double radius;                  ///< Mean radius (m)
    double mass;                    ///< (kg)
    double rotationalPeriod;        ///< Negative for retrograde rotation (s)
    double semiMajorAxis;           ///< (m)
    double eccentricity;
    double inclination;
    double longitudeOfAscendingNode;
    double argumentOfPeriapsis;
};

/** The sun, the planets and the moon, in the order they are created. */
const std::vector<BodyData>& solarSystemData();

/**
 * A scenario with the sun at the origin, the planets at their periapsis and
 * the moon around the earth. Bodies are owned by the solar system and keep
 * their addresses for its whole lifetime.
 *
 *   SolarSystem system;
 *   const Body& ship = system.addSatelliteInOrbit("Ship", ObjectConfig(1000.0), "Earth", 300e3);
 */
class SolarSystem {
public:
    /**
     * @param coplanar Put every orbit in the ecliptic with no inclination
     */
    explicit SolarSystem(bool coplanar = false);

    const Body& getSun() const { return *bodies_.front(); }

    /**
     * Body by name, ignoring case.
     * @throws std::invalid_argument if there is no such body
     */
    const Body& get(const std::string& name) const;

    /** Body by name, ignoring case, or nullptr. */
    const Body* find(const std::string& name) const;

    const std::vector<std::unique_ptr<Body>>& getBodies() const { return bodies_; }

    /**
     * Adds an object on the given orbit position.
     * @throws std::invalid_argument if a body with the same name exists
     */
    const Body& addObject(const std::string& name, const ObjectConfig& config, const OrbitPosition& position);

    /**
     * Adds an object in a circular equatorial orbit at the given altitude
     * above a body's surface.
     */
    const Body& addSatelliteInOrbit(const std::string& name, const ObjectConfig& config,
                                    const std::string& primaryBody, double altitude = DEFAULT_PARKING_ALTITUDE);

private:
    const Body& add(std::unique_ptr<Body> body);

    std::vector<std::unique_ptr<Body>> bodies_;
};

}

#endif
