/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __ORBITCRAFT_PLANETARY_TRANSFER_HPP
#define __ORBITCRAFT_PLANETARY_TRANSFER_HPP

#include <orbitcraft/formulas.hpp>
#include <orbitcraft/intercept.hpp>
#include <orbitcraft/maneuver.hpp>

#include <optional>
#include <string>
#include <vector>

namespace orbitcraft {

// ============================================================================
// Planetary Transfer
// ============================================================================

/**
 * Stages of a planetary transfer, in the order they run.
 * The stage held by a transfer is the next one to be computed.
 */
enum class TransferStage {
    Heliocentric,   ///< Transfer orbit between the two planets
    Injection,      ///< Burn that leaves the parking orbit
    SoiExit,        ///< State when leaving the current planet's sphere of influence
    Midcourse,      ///< Correction burn after leaving the sphere of influence
    Assembled,      ///< All stages are done
    Failed          ///< A search found no feasible transfer
};

std::string toString(TransferStage stage);

/**
 * Search windows of the two intercept searches. Ratios are relative to the
 * Hohmann coast time between the planets (or the heliocentric coast time
 * for the midcourse search), rounded to whole days.
 */
struct TransferSettings {
    double minCoastRatio = 0.5;                     ///< Shortest heliocentric transfer
    double maxCoastRatio = 2.0;                     ///< Longest heliocentric transfer
    double maxLaunchRatio = 1.0;                    ///< Latest departure, in synodic periods
    double deltaTime = ONE_DAY;                     ///< Heliocentric grid step (s)

    double midcourseMinCoastRatio = 0.75;           ///< Shortest midcourse transfer
    double midcourseMaxCoastRatio = 2.0;            ///< Longest midcourse transfer
    double midcourseMaxLaunchRatio = 0.5;           ///< Latest midcourse burn
    double midcourseDeltaTime = 0.5 * ONE_DAY;      ///< Midcourse grid step (s)
    double midcourseAllowedDeltaV = 150.0;          ///< Stop once a correction this small is found (m/s)
};

/**
 * Plans a transfer from an object orbiting one planet to another planet
 * of the same star.
 *
 * The transfer runs as a pipeline where every stage uses the results of the
 * one before:
 *   1. Heliocentric: intercept search between the two planets around the sun.
 *   2. Injection: turns the heliocentric burn into a burn from the parking
 *      orbit and times it so the escape hyperbola leaves in the right direction.
 *   3. SoiExit: follows the escape orbit to the edge of the sphere of influence.
 *   4. Midcourse: a narrower intercept search from that state to the target.
 *   5. Assembled: the injection and midcourse burns.
 *
 * Calling a stage out of order throws std::logic_error.
 *
 *   PlanetaryTransfer transfer(context, ship, mars);
 *   std::optional<ManeuverSequence> maneuvers = transfer.compute();
 */
class PlanetaryTransfer {
public:
    /**
     * @param context Solvers, current time, worker threads and observer
     * @param object Object orbiting a planet
     * @param target Destination planet
     * @throws GeometricInfeasibilityException if the target is not a planet or
     *         is the planet the object is orbiting
     */
    PlanetaryTransfer(const PlannerContext& context, const Body& object, const Body& target,
                      TransferSettings settings = TransferSettings());

    TransferStage getStage() const { return stage_; }

    // ------------------------------------------------------------------------
    // Stage 1: Heliocentric transfer orbit
    // ------------------------------------------------------------------------

    /**
     * Searches departure times over one synodic period for the cheapest
     * transfer between the planets.
     * @return false if no feasible transfer was found
     */
    bool calculateHeliocentricTransferOrbit();

    /** Uses a Hohmann transfer between the planet orbits instead of a search. */
    void useHohmannHeliocentricLeg();

    /** Uses a heliocentric transfer computed elsewhere. */
    void setHeliocentricTransferOrbit(double departureTime, double coastTime, double transferBurn);

    // ------------------------------------------------------------------------
    // Stage 2: Injection burn
    // ------------------------------------------------------------------------

    /**
     * Adds the speed needed to escape the planet to the heliocentric burn and
     * moves the burn so the escape hyperbola leaves along the planet's
     * velocity (against it when the target is closer to the sun).
     */
    void calculateInjectionBurn();

    // ------------------------------------------------------------------------
    // Stage 3: Leaving the sphere of influence
    // ------------------------------------------------------------------------

    void calculateSphereOfInfluenceExit();

    // ------------------------------------------------------------------------
    // Stage 4: Midcourse correction
    // ------------------------------------------------------------------------

    /**
     * @return false if no feasible correction was found
     */
    bool calculateMidcourseCorrection();

    // ------------------------------------------------------------------------
    // Stage 5: Assembly
    // ------------------------------------------------------------------------

    /** Injection burn and midcourse burn at their absolute times. */
    ManeuverSequence computeManeuvers() const;

    /**
     * Runs every stage in order.
     * @return The maneuvers, or nullopt if one of the searches found nothing
     */
    std::optional<ManeuverSequence> compute();

    // ------------------------------------------------------------------------
    // Results
    // ------------------------------------------------------------------------

    /** Feasible cells of the heliocentric search. */
    const std::vector<intercept::PossibleLaunch>& getPossibleDepartureBurns() const { return possibleDepartureBurns_; }

    double getDepartureTime() const { return departureTime_; }                   ///< From now (s)
    double getHeliocentricCoastTime() const { return heliocentricCoastTime_; }   ///< (s)
    double getHeliocentricTransferBurn() const { return heliocentricTransferBurn_; } ///< (m/s)
    const Vec3& getInjectionBurn() const { return injectionBurn_; }
    double getTimeToLeaveSphereOfInfluence() const { return timeToLeaveSphereOfInfluence_; } ///< From the injection (s)
    const ObjectState& getSphereOfInfluenceExitState() const { return leaveSphereOfInfluenceState_; }
    const Vec3& getMidcourseBurn() const { return midcourseBurn_; }
    double getMidcourseBurnTime() const { return midcourseBurnTime_; }           ///< From leaving the SOI (s)

private:
    void requireStage(TransferStage stage, const char* operation) const;
    double injectionBurnTime(double alignmentTime, double distance, double injectionSpeed) const;

    const PlannerContext& context_;
    const Body& object_;
    const Body& target_;
    const Body& currentPlanet_;
    const Body& sun_;
    TransferSettings settings_;

    OrbitPosition currentPlanetPosition_;
    OrbitPosition targetPosition_;
    OrbitPosition objectPosition_;

    TransferStage stage_ = TransferStage::Heliocentric;

    std::vector<intercept::PossibleLaunch> possibleDepartureBurns_;
    double departureTime_ = 0.0;
    double heliocentricCoastTime_ = 0.0;
    double heliocentricTransferBurn_ = 0.0;

    Vec3 injectionBurn_;
    ObjectState injectionState_;
    ObjectState injectionPrimaryBodyState_;

    double timeToLeaveSphereOfInfluence_ = 0.0;
    ObjectState leaveSphereOfInfluenceState_;
    std::optional<OrbitPosition> heliocentricPosition_;
    std::optional<OrbitPosition> targetPositionAtExit_;

    Vec3 midcourseBurn_;
    double midcourseBurnTime_ = 0.0;
};

} // namespace orbitcraft

#endif
