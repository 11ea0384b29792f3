// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Changyu Hu
//
// Commons Clause addition:
// This software is provided for non-commercial use only. See LICENSE file for details.

#include <gtest/gtest.h>

#include <algorithm>

#include "PotentialFlow/field/ScalarFieldEvaluator.hpp"
#include "PotentialFlow/flow/FieldSlice.hpp"

using namespace pflow;
using flow::FieldMode;
using flow::FieldSlice;
using flow::SliceAxis;

namespace
{
    void expectVec3Near(const vec3_t &a, const vec3_t &b, double tol = 1e-6)
    {
        EXPECT_NEAR(a.x, b.x, tol);
        EXPECT_NEAR(a.y, b.y, tol);
        EXPECT_NEAR(a.z, b.z, tol);
    }

    flow::SliceSettings settingsFor(FieldMode mode, SliceAxis axis, real position, int resolution)
    {
        flow::SliceSettings settings;
        settings.mode = mode;
        settings.axis = axis;
        settings.position = position;
        settings.resolution = resolution;
        return settings;
    }
} // namespace

class FieldSliceTest : public ::testing::Test
{
protected:
    flow::Tunnel tunnel;
    TickParameters tick;
    field::ScalarFieldEvaluator evaluator;
};

TEST_F(FieldSliceTest, CrossSectionLayout)
{
    const FlatBuffer points = FieldSlice::latticePoints(SliceAxis::X, 2.5, 3, tunnel);
    ASSERT_EQ(points.size(), 27u);
    expectVec3Near(loadVec3(points.data(), 0 * 3 + 0), vec3_t(2.5, -4.0, -4.0));
    expectVec3Near(loadVec3(points.data(), 1 * 3 + 2), vec3_t(2.5, 0.0, 4.0));
    expectVec3Near(loadVec3(points.data(), 2 * 3 + 0), vec3_t(2.5, 4.0, -4.0));
}

TEST_F(FieldSliceTest, LongitudinalLayouts)
{
    const FlatBuffer vertical = FieldSlice::latticePoints(SliceAxis::Y, -1.0, 3, tunnel);
    expectVec3Near(loadVec3(vertical.data(), 0), vec3_t(-10.0, -1.0, -4.0));
    expectVec3Near(loadVec3(vertical.data(), 2 * 3 + 1), vec3_t(10.0, -1.0, 0.0));

    const FlatBuffer horizontal = FieldSlice::latticePoints(SliceAxis::Z, 0.5, 3, tunnel);
    expectVec3Near(loadVec3(horizontal.data(), 1 * 3 + 0), vec3_t(0.0, -4.0, 0.5));
    expectVec3Near(loadVec3(horizontal.data(), 2 * 3 + 2), vec3_t(10.0, 4.0, 0.5));
}

TEST_F(FieldSliceTest, ResolutionBelowTwoIsRejected)
{
    EXPECT_THROW(FieldSlice::latticePoints(SliceAxis::X, 0.0, 1, tunnel), std::invalid_argument);
    EXPECT_THROW(FieldSlice::build(settingsFor(FieldMode::Velocity, SliceAxis::Z, 0.0, 0), tunnel, tick, evaluator),
                 std::invalid_argument);
}

TEST_F(FieldSliceTest, InactiveSettingsAreRejected)
{
    EXPECT_THROW(FieldSlice::build(settingsFor(FieldMode::None, SliceAxis::Z, 0.0, 10), tunnel, tick, evaluator),
                 std::invalid_argument);
    EXPECT_THROW(FieldSlice::build(settingsFor(FieldMode::Velocity, SliceAxis::None, 0.0, 10), tunnel, tick, evaluator),
                 std::invalid_argument);
}

TEST_F(FieldSliceTest, OutlineIsClosedAroundThePlane)
{
    const auto outline = FieldSlice::outlineFor(SliceAxis::Y, 1.0, tunnel);
    EXPECT_EQ(outline.front(), outline.back());
    expectVec3Near(outline[0], vec3_t(-10.0, 1.0, -4.0));
    expectVec3Near(outline[1], vec3_t(10.0, 1.0, -4.0));
    expectVec3Near(outline[2], vec3_t(10.0, 1.0, 4.0));
    expectVec3Near(outline[3], vec3_t(-10.0, 1.0, 4.0));
}

TEST_F(FieldSliceTest, ColourRamps)
{
    expectVec3Near(FieldSlice::colorFor(FieldMode::Velocity, 0.0), vec3_t(0.0, 0.0, 1.0));
    expectVec3Near(FieldSlice::colorFor(FieldMode::Velocity, 0.5), vec3_t(1.0, 1.0, 1.0));
    expectVec3Near(FieldSlice::colorFor(FieldMode::Velocity, 1.0), vec3_t(1.0, 1.0, 0.0));

    expectVec3Near(FieldSlice::colorFor(FieldMode::Pressure, 0.0), vec3_t(0.0, 0.0, 1.0));
    expectVec3Near(FieldSlice::colorFor(FieldMode::Pressure, 0.5), vec3_t(1.0, 1.0, 1.0));
    expectVec3Near(FieldSlice::colorFor(FieldMode::Pressure, 1.0), vec3_t(1.0, 0.0, 0.0));
    expectVec3Near(FieldSlice::colorFor(FieldMode::Pressure, 0.25), vec3_t(0.5, 1.0, 1.0));
}

TEST_F(FieldSliceTest, VelocitySliceSamplesTheField)
{
    const FieldSlice slice = FieldSlice::build(settingsFor(FieldMode::Velocity, SliceAxis::Z, 0.0, 21), tunnel, tick, evaluator);
    ASSERT_EQ(slice.pointCount(), 441u);
    ASSERT_EQ(slice.values().size(), 441u);
    ASSERT_EQ(slice.colors().size(), 441u * 3);

    // (5, 0, 0): 1 - (1/5)^3
    EXPECT_NEAR(slice.values()[15 * 21 + 10], 0.992f, 1e-6);
    // obstacle centre
    EXPECT_EQ(slice.values()[10 * 21 + 10], 0.0f);

    const float max_value = *std::max_element(slice.values().begin(), slice.values().end());
    EXPECT_DOUBLE_EQ(slice.rangeMin(), 0.0);
    EXPECT_NEAR(slice.rangeMax(), 1.2 * max_value, 1e-9);

    for (float c : slice.colors())
    {
        EXPECT_GE(c, 0.0f);
        EXPECT_LE(c, 1.0f);
    }
}

TEST_F(FieldSliceTest, PressureRangeIsCentredOnDynamicPressure)
{
    tick.flow.free_stream_velocity = 2.0;
    tick.flow.fluid_density = 1.5;
    tick.obstacle.kind = ObstacleKind::Cylinder;
    const FieldSlice slice = FieldSlice::build(settingsFor(FieldMode::Pressure, SliceAxis::Z, 0.0, 21), tunnel, tick, evaluator);

    const double p_ref = 0.5 * 1.5 * 2.0 * 2.0;
    EXPECT_NEAR(0.5 * (slice.rangeMin() + slice.rangeMax()), p_ref, 1e-9);
    EXPECT_GT(slice.rangeMax(), slice.rangeMin());

    // the obstacle interior is at rest, so it reads the full dynamic pressure
    EXPECT_NEAR(slice.values()[10 * 21 + 10], p_ref, 1e-6);
}

TEST_F(FieldSliceTest, UniformValuesMapToTheLowEnd)
{
    tick.flow.free_stream_velocity = 0.0;
    const FieldSlice slice = FieldSlice::build(settingsFor(FieldMode::Velocity, SliceAxis::X, 3.0, 10), tunnel, tick, evaluator);

    EXPECT_DOUBLE_EQ(slice.rangeMin(), slice.rangeMax());
    for (std::size_t k = 0; k < slice.pointCount(); ++k)
    {
        expectVec3Near(loadVec3(slice.colors().data(), k), vec3_t(0.0, 0.0, 1.0));
    }
}

TEST_F(FieldSliceTest, AxisAndModeNames)
{
    EXPECT_EQ(flow::sliceAxisFromName("Y"), SliceAxis::Y);
    EXPECT_EQ(flow::sliceAxisFromName("none"), SliceAxis::None);
    EXPECT_EQ(flow::fieldModeFromName("Pressure"), FieldMode::Pressure);
    EXPECT_STREQ(flow::fieldModeName(FieldMode::Velocity), "velocity");
    EXPECT_THROW(flow::sliceAxisFromName("w"), std::invalid_argument);
    EXPECT_THROW(flow::fieldModeFromName("vorticity"), std::invalid_argument);
}
