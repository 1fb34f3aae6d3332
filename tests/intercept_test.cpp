/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <orbitcraft/formulas.hpp>
#include <orbitcraft/intercept.hpp>

#include <cmath>
#include <cstddef>
#include <limits>
#include <stdexcept>

namespace orbitcraft {
namespace {

// Solves the short way normally and returns a fixed velocity for the long way
class FixedLongWayLambertSolver : public LambertSolver {
public:
    explicit FixedLongWayLambertSolver(double longWaySpeed) : longWaySpeed_(longWaySpeed) {}

    LambertSolution solve(const Body& primaryBody,
                          const ObjectState& primaryBodyState1,
                          const ObjectState& primaryBodyState2,
                          const Vec3& position1,
                          const Vec3& position2,
                          double timeOfFlight,
                          bool shortWay) const override {
        if (shortWay) {
            return solver_.solve(primaryBody, primaryBodyState1, primaryBodyState2,
                                 position1, position2, timeOfFlight, true);
        }
        Vec3 velocity{longWaySpeed_, longWaySpeed_, longWaySpeed_};
        return {velocity, velocity};
    }

private:
    UniversalVariableLambertSolver solver_;
    double longWaySpeed_;
};

class InterceptTest : public ::testing::Test {
protected:
    Body earth{"Earth", ObjectConfig(5.9722e24, SIDEREAL_DAY, 6371e3), ObjectState()};
    Orbit shipOrbit{&earth, 7000e3, 0.0};
    Body ship{"Ship", ObjectConfig(1000.0), shipOrbit.calculateState(0.0, earth.getState()), &earth};
    ObjectConfig targetConfig{500.0};
    OrbitPosition targetPosition{Orbit(&earth, 7500e3, 0.0), 0.5};

    UniversalVariableKeplerSolver keplerSolver;
    UniversalVariableLambertSolver lambertSolver;

    intercept::InterceptSettings settings() const {
        intercept::InterceptSettings s;
        s.minLaunchTime = 0.0;
        s.maxLaunchTime = 1200.0;
        s.minInterceptTime = 1800.0;
        s.maxInterceptTime = 3600.0;
        s.deltaTime = 300.0;
        s.listPossibleLaunches = true;
        return s;
    }

    intercept::InterceptResult search(unsigned int workerThreads, const intercept::InterceptSettings& s) {
        return search(lambertSolver, workerThreads, s);
    }

    intercept::InterceptResult search(const LambertSolver& solver, unsigned int workerThreads,
                                      const intercept::InterceptSettings& s) {
        PlannerContext context{keplerSolver, solver, 0.0, workerThreads};
        return intercept::search(context, earth, ship.getConfig(), ship.getState(),
                                 OrbitPosition::calculate(ship), targetConfig, targetPosition, s);
    }

    // Object resting on the equator at +X, moving with the surface
    ObjectState surfaceState(bool impacted) const {
        double radius = earth.getRadius();
        Vec3 surfaceVelocity{0.0, 0.0, earth.getConfig().getRotationalSpeed() * radius};
        return ObjectState(0.0, Vec3{radius, 0.0, 0.0}, surfaceVelocity, 0.0, impacted);
    }

    // Launches at time 0 from the surface towards a target on a circular orbit
    intercept::InterceptResult surfaceSearch(const ObjectConfig& config, const ObjectState& state,
                                             const OrbitPosition& target, double minDuration, double maxDuration) {
        intercept::InterceptSettings s;
        s.minLaunchTime = 0.0;
        s.maxLaunchTime = 0.0;
        s.minInterceptTime = minDuration;
        s.maxInterceptTime = maxDuration;
        s.deltaTime = 600.0;
        s.listPossibleLaunches = true;

        PlannerContext context{keplerSolver, lambertSolver, 0.0, 1};
        OrbitPosition position(Orbit(&earth, earth.getRadius(), 0.0), 0.0);
        return intercept::search(context, earth, config, state, position, targetConfig, target, s);
    }

    // Circular orbit position that reaches the given angle after the given time
    OrbitPosition circularTargetAt(double radius, double angle, double time) const {
        double meanMotion = std::sqrt(earth.getStandardGravitationalParameter() / (radius * radius * radius));
        return OrbitPosition(Orbit(&earth, radius, 0.0), angle - meanMotion * time);
    }
};

// Test that following the best burn meets the target
TEST_F(InterceptTest, BestLaunchReachesTarget) {
    intercept::InterceptResult result = search(1, settings());
    ASSERT_TRUE(result.best.has_value());
    EXPECT_FALSE(result.possibleLaunches.empty());
    EXPECT_LE(result.possibleLaunches.size(), 35u);

    for (const auto& launch : result.possibleLaunches) {
        EXPECT_LE(result.best->deltaVelocity.magnitude(), launch.deltaVelocity.magnitude());
    }

    const intercept::PossibleLaunch& best = *result.best;
    ObjectState launch = keplerSolver.propagate(earth.getState(), ship.getState(), shipOrbit, best.startTime);
    ObjectState transfer = launch.withVelocity(launch.getVelocity() + best.deltaVelocity);
    Orbit transferOrbit = OrbitPosition::calculate(earth, transfer).getOrbit();
    ObjectState arrival = keplerSolver.propagate(earth.getState(), transfer, transferOrbit, best.duration);

    ObjectState target = keplerSolver.propagate(earth.getState(), targetPosition.calculateState(earth.getState()),
                                                targetPosition.getOrbit(), best.arrivalTime());
    EXPECT_NEAR(arrival.getPosition().distance(target.getPosition()), 0.0, 100.0);
}

// Test that the thread count does not change the result
TEST_F(InterceptTest, WorkerThreadsAgree) {
    intercept::InterceptResult single = search(1, settings());
    intercept::InterceptResult parallel = search(3, settings());
    ASSERT_TRUE(single.best.has_value());
    ASSERT_TRUE(parallel.best.has_value());

    EXPECT_DOUBLE_EQ(parallel.best->startTime, single.best->startTime);
    EXPECT_DOUBLE_EQ(parallel.best->duration, single.best->duration);
    EXPECT_EQ(parallel.best->deltaVelocity, single.best->deltaVelocity);

    ASSERT_EQ(parallel.possibleLaunches.size(), single.possibleLaunches.size());
    for (std::size_t i = 0; i < single.possibleLaunches.size(); i++) {
        EXPECT_DOUBLE_EQ(parallel.possibleLaunches[i].startTime, single.possibleLaunches[i].startTime);
        EXPECT_DOUBLE_EQ(parallel.possibleLaunches[i].duration, single.possibleLaunches[i].duration);
    }
}

// Test that a search stops at the first burn within the allowed budget
TEST_F(InterceptTest, AllowedDeltaV) {
    intercept::InterceptSettings s = settings();
    s.allowedDeltaV = 1e6;

    intercept::InterceptResult result = search(1, s);
    ASSERT_TRUE(result.best.has_value());
    EXPECT_EQ(result.possibleLaunches.size(), 1u);
    EXPECT_DOUBLE_EQ(result.best->startTime, 0.0);
}

// Test that zero length transfers are never feasible
TEST_F(InterceptTest, ZeroDuration) {
    intercept::InterceptSettings s = settings();
    s.minInterceptTime = 0.0;
    s.maxInterceptTime = 0.0;

    intercept::InterceptResult result = search(2, s);
    EXPECT_FALSE(result.best.has_value());
    EXPECT_TRUE(result.possibleLaunches.empty());
}

// Test that a search with the target on the object and no time to move finds nothing
TEST_F(InterceptTest, DegenerateSameOrigin) {
    OrbitPosition samePosition = OrbitPosition::calculate(ship);
    intercept::InterceptSettings s;
    s.listPossibleLaunches = true;

    for (unsigned int workerThreads : {1u, 4u}) {
        PlannerContext context{keplerSolver, lambertSolver, 0.0, workerThreads};
        intercept::InterceptResult result = intercept::search(context, earth, ship.getConfig(), ship.getState(),
                                                              samePosition, ship.getConfig(), samePosition, s);
        EXPECT_FALSE(result.best.has_value());
        EXPECT_TRUE(result.possibleLaunches.empty());
    }

    PlannerContext context{keplerSolver, lambertSolver, 0.0, 1};
    EXPECT_FALSE(intercept::create(context, ship, ship.getConfig(), samePosition, s).has_value());
}

// Test that a launch from the surface must clear the body, allowing for the size of the craft
TEST_F(InterceptTest, SurfaceLaunchClearsBody) {
    OrbitPosition target = circularTargetAt(20000e3, 60.0 * DEGREES_TO_RADIANS, 3600.0);
    ObjectState onSurface = surfaceState(true);
    ASSERT_TRUE(onSurface.hasImpacted());

    intercept::InterceptResult result = surfaceSearch(ObjectConfig(1000.0), onSurface, target, 3000.0, 4200.0);
    ASSERT_TRUE(result.best.has_value());
    EXPECT_EQ(result.possibleLaunches.size(), 3u);

    // Every accepted burn climbs away from the surface
    for (const auto& launch : result.possibleLaunches) {
        ObjectState start = onSurface.withImpacted(false).withVelocity(onSurface.getVelocity() + launch.deltaVelocity);
        Orbit orbit = OrbitPosition::calculate(earth, start).getOrbit();
        for (double t = 100.0; t <= 1000.0; t += 100.0) {
            ObjectState next = keplerSolver.propagate(earth.getState(), start, orbit, t);
            EXPECT_GT(next.getPosition().magnitude(), earth.getRadius()) << launch.duration << " s at " << t << " s";
        }
    }

    // A craft 2000 km across is still inside that margin 100 s after launch
    intercept::InterceptResult large = surfaceSearch(ObjectConfig(1000.0, 0.0, 2000e3), onSurface, target, 3000.0, 4200.0);
    EXPECT_FALSE(large.best.has_value());
    EXPECT_TRUE(large.possibleLaunches.empty());
}

// Test that fast transfers cutting through the body are rejected only for objects on the surface
TEST_F(InterceptTest, SurfaceLaunchThroughBody) {
    OrbitPosition target = circularTargetAt(8000e3, 120.0 * DEGREES_TO_RADIANS, 600.0);

    intercept::InterceptResult fromSurface = surfaceSearch(ObjectConfig(1000.0), surfaceState(true), target, 600.0, 600.0);
    EXPECT_FALSE(fromSurface.best.has_value());
    EXPECT_TRUE(fromSurface.possibleLaunches.empty());

    intercept::InterceptResult inFlight = surfaceSearch(ObjectConfig(1000.0), surfaceState(false), target, 600.0, 600.0);
    ASSERT_TRUE(inFlight.best.has_value());
    EXPECT_TRUE(inFlight.best->deltaVelocity.isFinite());
}

// Test that a long way without finite velocities leaves the short way in place
TEST_F(InterceptTest, NonFiniteLongWay) {
    FixedLongWayLambertSolver huge(1e12);
    FixedLongWayLambertSolver notANumber(std::numeric_limits<double>::quiet_NaN());
    FixedLongWayLambertSolver infinite(std::numeric_limits<double>::infinity());

    intercept::InterceptResult expected = search(huge, 1, settings());
    ASSERT_TRUE(expected.best.has_value());
    EXPECT_LT(expected.best->deltaVelocity.magnitude(), 1e6);

    for (const LambertSolver* solver : {static_cast<const LambertSolver*>(&notANumber),
                                        static_cast<const LambertSolver*>(&infinite)}) {
        intercept::InterceptResult result = search(*solver, 1, settings());
        ASSERT_TRUE(result.best.has_value());
        EXPECT_DOUBLE_EQ(result.best->startTime, expected.best->startTime);
        EXPECT_DOUBLE_EQ(result.best->duration, expected.best->duration);
        EXPECT_EQ(result.best->deltaVelocity, expected.best->deltaVelocity);

        ASSERT_EQ(result.possibleLaunches.size(), expected.possibleLaunches.size());
        for (const auto& launch : result.possibleLaunches) {
            EXPECT_TRUE(launch.deltaVelocity.isFinite());
        }
    }
}

TEST_F(InterceptTest, InvalidStep) {
    intercept::InterceptSettings s = settings();
    s.deltaTime = 0.0;
    EXPECT_THROW(search(1, s), std::invalid_argument);
}

TEST_F(InterceptTest, Create) {
    PlannerContext context{keplerSolver, lambertSolver, 500.0, 2};
    auto maneuvers = intercept::create(context, ship, targetConfig, targetPosition, settings());
    ASSERT_TRUE(maneuvers.has_value());
    ASSERT_EQ(maneuvers->size(), 2u);

    intercept::InterceptResult result = search(1, settings());
    EXPECT_DOUBLE_EQ((*maneuvers)[0].getTime(), 500.0 + result.best->startTime);
    EXPECT_DOUBLE_EQ((*maneuvers)[1].getTime(), 500.0 + result.best->arrivalTime());
    EXPECT_EQ((*maneuvers)[0].getDeltaVelocity(), result.best->deltaVelocity);
    EXPECT_EQ((*maneuvers)[1].getDeltaVelocity(), Vec3());

    intercept::InterceptSettings impossible = settings();
    impossible.maxInterceptTime = 0.0;
    impossible.minInterceptTime = 0.0;
    EXPECT_FALSE(intercept::create(context, ship, targetConfig, targetPosition, impossible).has_value());
}

}
}
