/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <orbitcraft/solar_system.hpp>
#include <orbitcraft/formulas.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <utility>

using spdlog::debug;

namespace orbitcraft {

namespace {

bool sameName(const std::string& a, const std::string& b) {
    return std::equal(a.begin(), a.end(), b.begin(), b.end(), [](char x, char y) {
        return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
    });
}

}

const std::vector<BodyData>& solarSystemData() {
    static const std::vector<BodyData> data = {
        {"Sun", "", 695700e3, 1.98855e30, 0.0, 0.0, 0.0, 0.0, 0.0, 0.0},
        {"Mercury", "Sun", 2439.7e3, 3.3011e23, 58.6462 * ONE_DAY,
         57909050e3, 0.20563, 7.005, 48.331, 29.124},
        {"Venus", "Sun", 6051.8e3, 4.8675e24, -243.0185 * ONE_DAY,
         108208000e3, 0.006772, 3.39458, 76.680, 54.884},
        {"Earth", "Sun", 6371e3, 5.9722e24, SIDEREAL_DAY,
         149598023e3, 0.0167086, 0.00005, -11.26064, 114.20783},
        {"Moon", "Earth", 1737.1e3, 7.342e22, 27.321661 * ONE_DAY,
         384399e3, 0.0549, 5.145, 0.0, 0.0},
        {"Mars", "Sun", 3389.5e3, 6.4171e23, 24.622962 * ONE_HOUR,
         227.9392e9, 0.0934, 1.850, 49.558, 286.502},
        {"Jupiter", "Sun", 69911e3, 1.8986e27, 9.0 * ONE_HOUR + 55.0 * 60.0 + 29.685,
         778.299e9, 0.048498, 1.303, 100.464, 273.867},
        {"Saturn", "Sun", 58232e3, 5.6836e26, 10.0 * ONE_HOUR + 39.0 * 60.0 + 22.4,
         1429.39e9, 0.05555, 2.485240, 113.665, 339.392},
        {"Uranus", "Sun", 25362e3, 8.6810e25, 17.24 * ONE_HOUR,
         2875.04e9, 0.046381, 0.773, 74.006, 96.998857},
        {"Neptune", "Sun", 24622e3, 1.0243e26, 16.11 * ONE_HOUR,
         4504.45e9, 0.009456, 1.767975, 131.784, 276.336},
        {"Pluto", "Sun", 1187e3, 1.303e22, 6.387230 * ONE_DAY,
         5915e9, 0.24905, 17.1405, 110.299, 113.834},
    };
    return data;
}

SolarSystem::SolarSystem(bool coplanar) {
    for (const BodyData& data : solarSystemData()) {
        ObjectConfig config(data.mass, data.rotationalPeriod, data.radius);

        if (data.primary.empty()) {
            add(std::make_unique<Body>(data.name, config, ObjectState()));
            continue;
        }

        const Body& primaryBody = get(data.primary);
        double inclination = coplanar ? 0.0 : data.inclination * DEGREES_TO_RADIANS;
        Orbit orbit = Orbit::fromSemiMajorAxis(
            &primaryBody,
            data.semiMajorAxis,
            data.eccentricity,
            inclination,
            data.longitudeOfAscendingNode * DEGREES_TO_RADIANS,
            data.argumentOfPeriapsis * DEGREES_TO_RADIANS);

        add(std::make_unique<Body>(data.name, config, orbit.calculateState(0.0), &primaryBody));
    }
}

const Body* SolarSystem::find(const std::string& name) const {
    for (const auto& body : bodies_) {
        if (sameName(body->getName(), name)) {
            return body.get();
        }
    }
    return nullptr;
}

const Body& SolarSystem::get(const std::string& name) const {
    const Body* body = find(name);
    if (body == nullptr) {
        throw std::invalid_argument("Unknown body: " + name);
    }
    return *body;
}

const Body& SolarSystem::addObject(const std::string& name, const ObjectConfig& config, const OrbitPosition& position) {
    const Body* primaryBody = position.getOrbit().getPrimaryBody();
    return add(std::make_unique<Body>(name, config, position.calculateState(), primaryBody));
}

const Body& SolarSystem::addSatelliteInOrbit(const std::string& name, const ObjectConfig& config,
                                             const std::string& primaryBody, double altitude) {
    const Body& primary = get(primaryBody);
    Orbit orbit = Orbit::fromSemiMajorAxis(&primary, primary.getRadius() + altitude);
    return addObject(name, config, OrbitPosition(orbit, 0.0));
}

const Body& SolarSystem::add(std::unique_ptr<Body> body) {
    if (find(body->getName()) != nullptr) {
        throw std::invalid_argument("Duplicate body: " + body->getName());
    }
    debug("Added {} at {} m from the origin", body->getName(), body->getState().getPosition().magnitude());
    bodies_.push_back(std::move(body));
    return *bodies_.back();
}

}
