/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __ORBITCRAFT_HPP
#define __ORBITCRAFT_HPP

#include <orbitcraft/config.hpp>
#include <orbitcraft/exceptions.hpp>
#include <orbitcraft/formulas.hpp>
#include <orbitcraft/orbit.hpp>
#include <orbitcraft/kepler.hpp>
#include <orbitcraft/lambert.hpp>
#include <orbitcraft/calculators.hpp>
#include <orbitcraft/maneuver.hpp>
#include <orbitcraft/basic_maneuver.hpp>
#include <orbitcraft/hohmann.hpp>
#include <orbitcraft/intercept.hpp>
#include <orbitcraft/rendezvous.hpp>
#include <orbitcraft/planetary_transfer.hpp>
#include <orbitcraft/solar_system.hpp>

#endif
