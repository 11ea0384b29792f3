// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Changyu Hu
//
// Commons Clause addition:
// This software is provided for non-commercial use only. See LICENSE file for details.

#include <gtest/gtest.h>

#include "PotentialFlow/field/FlowTypes.hpp"
#include "PotentialFlow/flow/Tunnel.hpp"
#include "PotentialFlow/utils/Logger.hpp"

using namespace pflow;

TEST(ObstacleKindTest, WireCodesMatchHostRenderer)
{
    EXPECT_EQ(obstacleKindFromCode(0), ObstacleKind::Sphere);
    EXPECT_EQ(obstacleKindFromCode(1), ObstacleKind::Cylinder);
    EXPECT_EQ(obstacleKindFromCode(2), ObstacleKind::Airfoil);
    EXPECT_EQ(obstacleKindCode(ObstacleKind::Airfoil), 2);
}

TEST(ObstacleKindTest, UnknownCodeIsRejected)
{
    EXPECT_THROW(obstacleKindFromCode(3), std::invalid_argument);
    EXPECT_THROW(obstacleKindFromCode(-1), std::invalid_argument);
}

TEST(ObstacleKindTest, NamesAreCaseInsensitive)
{
    EXPECT_EQ(obstacleKindFromName("Cylinder"), ObstacleKind::Cylinder);
    EXPECT_EQ(obstacleKindFromName("AIRFOIL"), ObstacleKind::Airfoil);
    EXPECT_STREQ(obstacleKindName(ObstacleKind::Sphere), "sphere");
    EXPECT_THROW(obstacleKindFromName("wing"), std::invalid_argument);
}

TEST(ObstacleKindTest, FormatsThroughFmt)
{
    EXPECT_EQ(fmt::format("{}", ObstacleKind::Cylinder), "cylinder");
}

TEST(ObstacleDescriptorTest, DefaultsToUnitSphereAtOrigin)
{
    const ObstacleDescriptor obstacle;
    EXPECT_EQ(obstacle.kind, ObstacleKind::Sphere);
    EXPECT_DOUBLE_EQ(obstacle.radius, 1.0);
    EXPECT_EQ(obstacle.position, vec3_t(0.0));
}

TEST(TunnelTest, DefaultGeometry)
{
    const flow::Tunnel tunnel;
    EXPECT_DOUBLE_EQ(tunnel.length(), 20.0);
    EXPECT_DOUBLE_EQ(tunnel.halfWidth(), 4.0);
    EXPECT_DOUBLE_EQ(tunnel.halfHeight(), 4.0);
    EXPECT_TRUE(tunnel.isValid());
}

TEST(TunnelTest, ExitTests)
{
    const flow::Tunnel tunnel;
    EXPECT_FALSE(tunnel.exitedAxially(vec3_t(10.0, 0.0, 0.0)));
    EXPECT_TRUE(tunnel.exitedAxially(vec3_t(10.001, 0.0, 0.0)));
    EXPECT_FALSE(tunnel.exitedLaterally(vec3_t(0.0, 4.0, -4.0)));
    EXPECT_TRUE(tunnel.exitedLaterally(vec3_t(0.0, -4.01, 0.0)));
    EXPECT_TRUE(tunnel.exitedLaterally(vec3_t(0.0, 0.0, 4.01)));
}

TEST(TunnelTest, ReadsPartialJson)
{
    const auto j = nlohmann::json::parse(R"({"exit_x": 30.0, "width": 12})");
    const auto tunnel = j.get<flow::Tunnel>();
    EXPECT_DOUBLE_EQ(tunnel.entry_x, -10.0);
    EXPECT_DOUBLE_EQ(tunnel.exit_x, 30.0);
    EXPECT_DOUBLE_EQ(tunnel.width, 12.0);
    EXPECT_DOUBLE_EQ(tunnel.height, 8.0);
}

TEST(TunnelTest, InvalidOrderingIsDetected)
{
    flow::Tunnel tunnel;
    tunnel.exit_x = tunnel.entry_x;
    EXPECT_FALSE(tunnel.isValid());
}

TEST(LoggerFormatTest, GlmVectorsFormatWithFourDecimals)
{
    EXPECT_EQ(fmt::format("{}", vec3_t(1.0, -2.5, 0.125)), "[1.0000, -2.5000, 0.1250]");
}
