/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <orbitcraft/planetary_transfer.hpp>
#include <orbitcraft/calculators.hpp>
#include <orbitcraft/exceptions.hpp>
#include <orbitcraft/hohmann.hpp>

#include <spdlog/spdlog.h>

#include <chrono>
#include <cmath>
#include <format>
#include <stdexcept>
#include <utility>

using spdlog::debug;

namespace orbitcraft {

namespace {

// Direction in the orbital plane perpendicular to the prograde direction
Vec3 radialOf(const Vec3& prograde) {
    return Vec3{prograde.z, prograde.y, -prograde.x}.normalize();
}

Vec3 normalOf(const Vec3& prograde) {
    return prograde.cross(radialOf(prograde)).normalize();
}

/**
 * Angle from the planet's direction of motion to the object, measured
 * around the orbit normal, in [0, 2π).
 */
double angleToPrograde(const Vec3& planetPosition, const Vec3& planetVelocity, const Vec3& objectPosition) {
    Vec3 prograde = planetVelocity.normalize();
    double angle = angleBetween(planetVelocity, objectPosition - planetPosition, normalOf(prograde));
    if (angle < 0.0) {
        angle += TWO_PI;
    }
    return angle;
}

const Body& currentPlanetOf(const Body& object) {
    const Body* planet = object.getPrimaryBody();
    if (planet == nullptr || planet->getPrimaryBody() == nullptr) {
        throw GeometricInfeasibilityException("The object must orbit a planet: " + object.getName());
    }
    return *planet;
}

const Body& checkedTarget(const Body& object, const Body& target) {
    const Body* targetPrimary = target.getPrimaryBody();
    if (targetPrimary == nullptr || !targetPrimary->isObjectOfReference()) {
        throw GeometricInfeasibilityException("The target must be a planet: " + target.getName());
    }
    if (&target == &currentPlanetOf(object)) {
        throw GeometricInfeasibilityException("The target cannot be the current planet: " + target.getName());
    }
    return target;
}

} // namespace

std::string toString(TransferStage stage) {
    switch (stage) {
        case TransferStage::Heliocentric: return "Heliocentric";
        case TransferStage::Injection: return "Injection";
        case TransferStage::SoiExit: return "SoiExit";
        case TransferStage::Midcourse: return "Midcourse";
        case TransferStage::Assembled: return "Assembled";
        case TransferStage::Failed: return "Failed";
    }
    return "Unknown";
}

PlanetaryTransfer::PlanetaryTransfer(const PlannerContext& context, const Body& object, const Body& target,
                                     TransferSettings settings)
    : context_(context),
      object_(object),
      target_(checkedTarget(object, target)),
      currentPlanet_(currentPlanetOf(object)),
      sun_(*currentPlanet_.getPrimaryBody()),
      settings_(settings),
      currentPlanetPosition_(OrbitPosition::calculate(currentPlanet_)),
      targetPosition_(OrbitPosition::calculate(target_)),
      objectPosition_(OrbitPosition::calculate(object_)) {
    if (target_.getPrimaryBody() != &sun_) {
        throw GeometricInfeasibilityException(
            std::format("{} and {} do not orbit the same star", currentPlanet_.getName(), target_.getName()));
    }
}

void PlanetaryTransfer::requireStage(TransferStage stage, const char* operation) const {
    if (stage_ != stage) {
        throw std::logic_error(std::format("{} requires stage {} but the transfer is at stage {}",
                                           operation, toString(stage), toString(stage_)));
    }
}

// ============================================================================
// Heliocentric Transfer Orbit
// ============================================================================

bool PlanetaryTransfer::calculateHeliocentricTransferOrbit() {
    requireStage(TransferStage::Heliocentric, "calculateHeliocentricTransferOrbit");

    const Orbit& planetOrbit = currentPlanetPosition_.getOrbit();
    const Orbit& targetOrbit = targetPosition_.getOrbit();

    double hohmannCoastTime = formulas::roundToDays(hohmann::calculateBurn(
        sun_.getStandardGravitationalParameter(),
        planetOrbit.getSemiMajorAxis(),
        targetOrbit.getSemiMajorAxis()).coastTime);
    double synodicPeriod = formulas::synodicPeriod(planetOrbit.getPeriod(), targetOrbit.getPeriod());

    intercept::InterceptSettings search;
    search.minInterceptTime = hohmannCoastTime * settings_.minCoastRatio;
    search.maxInterceptTime = hohmannCoastTime * settings_.maxCoastRatio;
    search.minLaunchTime = 0.0;
    search.maxLaunchTime = formulas::roundToDays(synodicPeriod) * settings_.maxLaunchRatio;
    search.deltaTime = settings_.deltaTime;
    search.listPossibleLaunches = true;

    intercept::InterceptResult result = intercept::search(
        context_,
        sun_,
        currentPlanet_.getConfig(),
        currentPlanet_.getState(),
        currentPlanetPosition_,
        target_.getConfig(),
        targetPosition_,
        search);

    possibleDepartureBurns_ = std::move(result.possibleLaunches);
    if (!result.best) {
        context_.notify(std::format("No heliocentric transfer from {} to {}",
                                    currentPlanet_.getName(), target_.getName()));
        stage_ = TransferStage::Failed;
        return false;
    }

    setHeliocentricTransferOrbit(result.best->startTime,
                                 result.best->duration,
                                 result.best->deltaVelocity.magnitude());
    return true;
}

void PlanetaryTransfer::useHohmannHeliocentricLeg() {
    requireStage(TransferStage::Heliocentric, "useHohmannHeliocentricLeg");

    hohmann::TransferBurns burns = hohmann::calculateBurn(
        sun_.getStandardGravitationalParameter(),
        currentPlanetPosition_.getOrbit().getSemiMajorAxis(),
        targetPosition_.getOrbit().getSemiMajorAxis());

    setHeliocentricTransferOrbit(hohmann::timeToAlignment(currentPlanetPosition_, targetPosition_),
                                 burns.coastTime,
                                 burns.firstBurn);
}

void PlanetaryTransfer::setHeliocentricTransferOrbit(double departureTime, double coastTime, double transferBurn) {
    requireStage(TransferStage::Heliocentric, "setHeliocentricTransferOrbit");

    departureTime_ = departureTime;
    heliocentricCoastTime_ = coastTime;
    heliocentricTransferBurn_ = transferBurn;
    stage_ = TransferStage::Injection;

    context_.notify(std::format("Heliocentric transfer {} -> {}: departure in {:.0f} s, coast {:.0f} s, dv {:.2f} m/s",
                                currentPlanet_.getName(), target_.getName(),
                                departureTime_, heliocentricCoastTime_, heliocentricTransferBurn_));
}

// ============================================================================
// Injection Burn
// ============================================================================

double PlanetaryTransfer::injectionBurnTime(double alignmentTime, double distance, double injectionSpeed) const {
    double mu = currentPlanet_.getStandardGravitationalParameter();

    // Ejection angle of the escape hyperbola
    double energy = injectionSpeed * injectionSpeed * 0.5 - mu / distance;
    double h = distance * injectionSpeed;
    double e = std::sqrt(1.0 + (2.0 * energy * h * h) / (mu * mu));
    double requiredEjectionAngle = std::acos(-1.0 / e);

    double angularSpeed = std::sqrt(mu / std::pow(distance, 3.0));

    // Inner planets are reached by leaving against the planet's motion
    double transferDirection = 1.0;
    if (targetPosition_.getOrbit().getSemiMajorAxis() < currentPlanetPosition_.getOrbit().getSemiMajorAxis()) {
        transferDirection = -1.0;
    }

    PropagatedState planet = afterTime(context_.keplerSolver, currentPlanet_, alignmentTime);
    ObjectState objectState = context_.keplerSolver.solve(
        object_.getConfig(),
        currentPlanet_.getState(),
        object_.getState(),
        objectPosition_.getOrbit(),
        planet.state,
        alignmentTime);

    double currentEjectionAngle = angleToPrograde(
        planet.state.getPosition(),
        planet.state.getVelocity() * transferDirection,
        objectState.getPosition());

    debug("Ejection angle: current {} rad, required {} rad", currentEjectionAngle, requiredEjectionAngle);
    return alignmentTime + (currentEjectionAngle - requiredEjectionAngle) / angularSpeed;
}

void PlanetaryTransfer::calculateInjectionBurn() {
    requireStage(TransferStage::Injection, "calculateInjectionBurn");

    const ObjectState& state = object_.getState();
    const ObjectState& planetState = currentPlanet_.getState();
    double r0 = state.getPosition().distance(planetState.getPosition());
    double orbitalSpeed = state.getVelocity().distance(planetState.getVelocity());

    // The heliocentric burn is the hyperbolic excess speed
    double v0 = std::sqrt(heliocentricTransferBurn_ * heliocentricTransferBurn_
                          + (2.0 * currentPlanet_.getStandardGravitationalParameter()) / r0);
    double injectionDeltaV = v0 - orbitalSpeed;

    departureTime_ = injectionBurnTime(departureTime_, r0, v0);

    PropagatedState injection = afterTime(context_.keplerSolver, object_, departureTime_);
    injectionState_ = injection.state;
    injectionPrimaryBodyState_ = injection.primaryBodyState;

    Vec3 prograde = injectionState_.makeRelative(injectionPrimaryBodyState_).prograde();
    injectionBurn_ = prograde * injectionDeltaV;
    stage_ = TransferStage::SoiExit;

    context_.notify(std::format("Injection burn in {:.0f} s: {:.2f} m/s (escape speed {:.2f} m/s)",
                                departureTime_, injectionDeltaV, v0));
}

// ============================================================================
// Leaving the Sphere of Influence
// ============================================================================

void PlanetaryTransfer::calculateSphereOfInfluenceExit() {
    requireStage(TransferStage::SoiExit, "calculateSphereOfInfluenceExit");

    ObjectState injectionState = injectionState_.withVelocity(injectionState_.getVelocity() + injectionBurn_);
    OrbitPosition injectionOrbit = OrbitPosition::calculate(currentPlanet_, injectionPrimaryBodyState_, injectionState)
        .withTrueAnomaly(0.0);

    timeToLeaveSphereOfInfluence_ = timeToLeaveSphereOfInfluence(injectionOrbit).value_or(0.0);

    ObjectState leavePrimaryBodyState = context_.keplerSolver.solve(
        currentPlanet_.getConfig(),
        sun_.getState(),
        injectionPrimaryBodyState_,
        currentPlanetPosition_.getOrbit(),
        sun_.getState(),
        timeToLeaveSphereOfInfluence_);

    leaveSphereOfInfluenceState_ = context_.keplerSolver.solve(
        object_.getConfig(),
        injectionPrimaryBodyState_,
        injectionState,
        injectionOrbit.getOrbit(),
        leavePrimaryBodyState,
        timeToLeaveSphereOfInfluence_);

    heliocentricPosition_ = OrbitPosition::calculate(sun_, leaveSphereOfInfluenceState_);

    PropagatedState targetAtExit = afterTime(context_.keplerSolver, target_,
                                             departureTime_ + timeToLeaveSphereOfInfluence_);
    targetPositionAtExit_ = OrbitPosition::calculate(sun_, targetAtExit.state);
    stage_ = TransferStage::Midcourse;

    context_.notify(std::format("Leaving the sphere of influence of {} {:.0f} s after injection",
                                currentPlanet_.getName(), timeToLeaveSphereOfInfluence_));
}

// ============================================================================
// Midcourse Correction
// ============================================================================

bool PlanetaryTransfer::calculateMidcourseCorrection() {
    requireStage(TransferStage::Midcourse, "calculateMidcourseCorrection");

    double coastTime = formulas::roundToDays(heliocentricCoastTime_);

    intercept::InterceptSettings search;
    search.minInterceptTime = coastTime * settings_.midcourseMinCoastRatio;
    search.maxInterceptTime = coastTime * settings_.midcourseMaxCoastRatio;
    search.minLaunchTime = 0.0;
    search.maxLaunchTime = coastTime * settings_.midcourseMaxLaunchRatio;
    search.deltaTime = settings_.midcourseDeltaTime;
    search.listPossibleLaunches = false;
    search.allowedDeltaV = settings_.midcourseAllowedDeltaV;

    intercept::InterceptResult result = intercept::search(
        context_,
        sun_,
        object_.getConfig(),
        leaveSphereOfInfluenceState_,
        *heliocentricPosition_,
        target_.getConfig(),
        *targetPositionAtExit_,
        search);

    if (!result.best) {
        context_.notify(std::format("No midcourse correction to {}", target_.getName()));
        stage_ = TransferStage::Failed;
        return false;
    }

    midcourseBurn_ = result.best->deltaVelocity;
    midcourseBurnTime_ = result.best->startTime;
    stage_ = TransferStage::Assembled;

    context_.notify(std::format("Midcourse correction {:.0f} s after leaving the sphere of influence: {:.2f} m/s",
                                midcourseBurnTime_, midcourseBurn_.magnitude()));
    return true;
}

// ============================================================================
// Assembly
// ============================================================================

ManeuverSequence PlanetaryTransfer::computeManeuvers() const {
    requireStage(TransferStage::Assembled, "computeManeuvers");

    double injectionTime = context_.currentTime + departureTime_;
    return {
        OrbitalManeuver(injectionTime, injectionBurn_),
        OrbitalManeuver(injectionTime + timeToLeaveSphereOfInfluence_ + midcourseBurnTime_, midcourseBurn_)
    };
}

std::optional<ManeuverSequence> PlanetaryTransfer::compute() {
    auto start = std::chrono::steady_clock::now();

    if (!calculateHeliocentricTransferOrbit()) {
        return std::nullopt;
    }
    calculateInjectionBurn();
    calculateSphereOfInfluenceExit();
    if (!calculateMidcourseCorrection()) {
        return std::nullopt;
    }

    ManeuverSequence maneuvers = computeManeuvers();
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
    context_.notify(std::format("Computed transfer from {} to {} in {} ms, dv {:.2f} m/s",
                                currentPlanet_.getName(), target_.getName(),
                                elapsed.count(), maneuvers.totalDeltaVelocity()));
    return maneuvers;
}

} // namespace orbitcraft
