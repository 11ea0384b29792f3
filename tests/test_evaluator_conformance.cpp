// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Changyu Hu
//
// Commons Clause addition:
// This software is provided for non-commercial use only. See LICENSE file for details.

#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <random>

#include "PotentialFlow/field/BatchFieldEvaluator.hpp"
#include "PotentialFlow/field/ScalarFieldEvaluator.hpp"

using namespace pflow;

namespace
{
    // relative above 1, absolute below
    ::testing::AssertionResult closeEnough(float got, float expected, double tol = 1e-5)
    {
        const double limit = tol * std::max(1.0, std::abs(static_cast<double>(expected)));
        if (std::abs(static_cast<double>(got) - expected) <= limit)
        {
            return ::testing::AssertionSuccess();
        }
        return ::testing::AssertionFailure() << "batch " << got << " vs scalar " << expected;
    }

    class ConformanceTest : public ::testing::Test
    {
    protected:
        // count is not a multiple of the block size, so the tail block is exercised too
        static constexpr std::size_t kSamples = 10007;

        void SetUp() override
        {
            std::mt19937 rng(20240601u);
            std::uniform_real_distribution<float> ux(-10.0f, 10.0f);
            std::uniform_real_distribution<float> uyz(-4.0f, 4.0f);
            std::uniform_real_distribution<float> shell(0.97f, 1.03f);
            std::uniform_real_distribution<float> dir(-1.0f, 1.0f);

            positions.resize(kSamples * 3);
            for (std::size_t i = 0; i < kSamples; ++i)
            {
                vec3_t p;
                if (i % 4 == 0)
                {
                    // straddle the obstacle surface
                    vec3_t d(dir(rng), dir(rng), dir(rng));
                    if (glm::length(d) < 1e-3)
                        d = vec3_t(1.0, 0.0, 0.0);
                    p = glm::normalize(d) * static_cast<real>(shell(rng));
                }
                else
                {
                    p = vec3_t(ux(rng), uyz(rng), uyz(rng));
                }
                storeVec3(positions.data(), i, p);
            }
        }

        FlatBuffer positions;
        field::ScalarFieldEvaluator scalar;
        field::BatchFieldEvaluator batch;
    };
} // namespace

TEST_F(ConformanceTest, VelocitiesMatchOverRandomFlowParameters)
{
    // every chunk draws its own kind, U and rho; chunks straddle the batch block boundary
    constexpr std::size_t kChunk = 37;

    std::mt19937 rng(7u);
    std::uniform_real_distribution<double> speed(-3.0, 3.0);
    std::uniform_real_distribution<double> density(0.5, 2.0);
    std::uniform_int_distribution<int> kind_code(0, 2);

    FlatBuffer got(kChunk * 3);
    FlatBuffer expected(kChunk * 3);
    int failures = 0;
    for (std::size_t first = 0; first < kSamples && failures < 10; first += kChunk)
    {
        const std::size_t n = std::min(kChunk, kSamples - first);
        const FlowParameters flow{speed(rng), density(rng)};
        ObstacleDescriptor obstacle;
        obstacle.kind = obstacleKindFromCode(kind_code(rng));

        const float *chunk = positions.data() + first * 3;
        scalar.evaluate(chunk, n, flow, obstacle, expected.data());
        batch.evaluate(chunk, n, flow, obstacle, got.data());

        for (std::size_t k = 0; k < n * 3; ++k)
        {
            const auto result = closeEnough(got[k], expected[k]);
            EXPECT_TRUE(result) << obstacleKindName(obstacle.kind) << " particle " << first + k / 3
                                << ", U = " << flow.free_stream_velocity << ", rho = " << flow.fluid_density;
            if (!result)
                ++failures;
        }
    }
}

TEST_F(ConformanceTest, UnknownKindFallsBackToFreeStreamInBothKernels)
{
    const FlowParameters flow{1.4, 1.0};
    ObstacleDescriptor airfoil;
    airfoil.kind = ObstacleKind::Airfoil;
    ObstacleDescriptor unknown;
    unknown.kind = static_cast<ObstacleKind>(7);

    FlatBuffer got;
    FlatBuffer expected;
    // a valid kind first, so nothing from its blocks may carry over
    batch.evaluate(positions, kSamples, flow, airfoil, got);
    batch.evaluate(positions, kSamples, flow, unknown, got);
    scalar.evaluate(positions, kSamples, flow, unknown, expected);

    ASSERT_EQ(got.size(), expected.size());
    for (std::size_t k = 0; k < got.size(); ++k)
    {
        ASSERT_TRUE(closeEnough(got[k], expected[k])) << "component " << k;
    }
}

TEST_F(ConformanceTest, OffsetObstacleMatches)
{
    ObstacleDescriptor obstacle;
    obstacle.kind = ObstacleKind::Airfoil;
    obstacle.position = vec3_t(-2.5, 1.0, 0.5);
    const FlowParameters flow{1.3, 1.2};

    const FlatBuffer expected = scalar.evaluate(positions, kSamples, flow, obstacle);
    const FlatBuffer got = batch.evaluate(positions, kSamples, flow, obstacle);
    for (std::size_t k = 0; k < got.size(); ++k)
    {
        ASSERT_TRUE(closeEnough(got[k], expected[k])) << "component " << k;
    }
}

TEST_F(ConformanceTest, KindSwitchBetweenCallsLeavesNoResidue)
{
    // same buffers reused across kinds, as the particle loop does when the host switches obstacles
    const FlowParameters flow{1.0, 1.0};
    FlatBuffer got;
    FlatBuffer expected;
    for (ObstacleKind kind : {ObstacleKind::Airfoil, ObstacleKind::Sphere, ObstacleKind::Cylinder, ObstacleKind::Sphere})
    {
        ObstacleDescriptor obstacle;
        obstacle.kind = kind;
        batch.evaluate(positions, kSamples, flow, obstacle, got);
        scalar.evaluate(positions, kSamples, flow, obstacle, expected);
        for (std::size_t k = 0; k < got.size(); ++k)
        {
            ASSERT_TRUE(closeEnough(got[k], expected[k])) << obstacleKindName(kind) << " component " << k;
        }
    }
}

TEST_F(ConformanceTest, PressuresMatch)
{
    const FlowParameters flow{1.7, 0.9};
    ObstacleDescriptor obstacle;
    obstacle.kind = ObstacleKind::Cylinder;
    const FlatBuffer velocities = scalar.evaluate(positions, kSamples, flow, obstacle);

    const FlatBuffer expected = scalar.evaluatePressure(velocities, kSamples, flow.free_stream_velocity, flow.fluid_density);
    const FlatBuffer got = batch.evaluatePressure(velocities, kSamples, flow.free_stream_velocity, flow.fluid_density);
    ASSERT_EQ(got.size(), kSamples);
    for (std::size_t k = 0; k < kSamples; ++k)
    {
        ASSERT_TRUE(closeEnough(got[k], expected[k])) << "particle " << k;
    }
}
