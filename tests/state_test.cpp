/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <orbitcraft/formulas.hpp>
#include <orbitcraft/state.hpp>

namespace orbitcraft {
namespace {

class StateTest : public ::testing::Test {
protected:
    ObjectState state{10.0, Vec3{7000e3, 0.0, 0.0}, Vec3{0.0, 0.0, 7500.0}};
    ObjectState primary{10.0, Vec3{1e9, 0.0, 0.0}, Vec3{0.0, 0.0, 30000.0}};
};

TEST_F(StateTest, DefaultConstruction) {
    ObjectState defaultState;
    EXPECT_DOUBLE_EQ(defaultState.getTime(), 0.0);
    EXPECT_EQ(defaultState.getPosition(), Vec3());
    EXPECT_EQ(defaultState.getVelocity(), Vec3());
    EXPECT_FALSE(defaultState.hasImpacted());
}

TEST_F(StateTest, Directions) {
    EXPECT_EQ(state.prograde(), (Vec3{0.0, 0.0, 1.0}));
    EXPECT_EQ(state.retrograde(), (Vec3{0.0, 0.0, -1.0}));
    EXPECT_EQ(state.radial(), (Vec3{1.0, 0.0, 0.0}));
    EXPECT_EQ(state.normal(), (Vec3{0.0, -1.0, 0.0}));
}

// Test that relative and absolute states are inverses of each other
TEST_F(StateTest, RelativeAndAbsolute) {
    ObjectState absolute = state.makeAbsolute(primary);
    EXPECT_DOUBLE_EQ(absolute.getPosition().x, 1e9 + 7000e3);
    EXPECT_DOUBLE_EQ(absolute.getVelocity().z, 37500.0);
    EXPECT_DOUBLE_EQ(absolute.getTime(), state.getTime());

    ObjectState relative = absolute.makeRelative(primary);
    EXPECT_EQ(relative.getPosition(), state.getPosition());
    EXPECT_EQ(relative.getVelocity(), state.getVelocity());
}

TEST_F(StateTest, SwapReferenceFrame) {
    ObjectState moved = state.makeAbsolute(primary).swapReferenceFrame(primary, ObjectState());
    EXPECT_NEAR(moved.getPosition().distance(state.getPosition()), 0.0, 1e-6);
}

// Test that the with...() methods leave the original untouched
TEST_F(StateTest, ImmutableCopies) {
    ObjectState copy = state.withTime(20.0).withVelocity(Vec3{1.0, 2.0, 3.0}).withImpacted(true).withRotation(1.5);
    EXPECT_DOUBLE_EQ(copy.getTime(), 20.0);
    EXPECT_EQ(copy.getVelocity(), (Vec3{1.0, 2.0, 3.0}));
    EXPECT_TRUE(copy.hasImpacted());
    EXPECT_DOUBLE_EQ(copy.getRotation(), 1.5);

    EXPECT_DOUBLE_EQ(state.getTime(), 10.0);
    EXPECT_FALSE(state.hasImpacted());
}

TEST_F(StateTest, Distance) {
    EXPECT_NEAR(state.distance(primary), 1e9 - 7000e3, 1e-6);
}

TEST_F(StateTest, ConfigDerivedValues) {
    ObjectConfig config(5.9722e24, SIDEREAL_DAY, 6371e3);
    EXPECT_NEAR(config.getStandardGravitationalParameter(), 3.986e14, 1e11);
    EXPECT_TRUE(config.hasRadius());
    EXPECT_DOUBLE_EQ(config.getRadius(), 6371e3);
    EXPECT_NEAR(config.getRotationalSpeed(), TWO_PI / SIDEREAL_DAY, 1e-15);
    EXPECT_EQ(config.getAxisOfRotation(), Vec3::up());

    ObjectConfig noRadius(1000.0);
    EXPECT_FALSE(noRadius.hasRadius());
    EXPECT_DOUBLE_EQ(noRadius.getRadius(), 0.0);
    EXPECT_DOUBLE_EQ(noRadius.withMass(2000.0).getMass(), 2000.0);
}

TEST_F(StateTest, BodyHierarchy) {
    Body sun("Sun", ObjectConfig(1.98855e30), ObjectState());
    Body earth("Earth", ObjectConfig(5.9722e24), primary, &sun);

    EXPECT_TRUE(sun.isObjectOfReference());
    EXPECT_FALSE(earth.isObjectOfReference());
    EXPECT_EQ(earth.getPrimaryBody(), &sun);
    EXPECT_EQ(earth.getName(), "Earth");

    earth.setState(state);
    EXPECT_EQ(earth.getState().getPosition(), state.getPosition());
}

}
}
