/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include <gtest/gtest.h>

#include "sequencer/time_warp.hpp"
#include <cmath>
#include <numbers>

namespace kb::sequencer {

    class TimeWarpTest : public ::testing::Test {
    protected:
        static constexpr WarpCurve ALL_CURVES[] = {
            WarpCurve::LINEAR, WarpCurve::SINE, WarpCurve::COSINE, WarpCurve::BACK_FORTH,
            WarpCurve::EASE_IN, WarpCurve::EASE_OUT, WarpCurve::EASE_IN_OUT};
    };

    TEST_F(TimeWarpTest, EndpointsOfMonotonicCurves) {
        for (const WarpCurve curve : ALL_CURVES) {
            if (curve == WarpCurve::BACK_FORTH) continue;
            EXPECT_NEAR(applyWarpCurve(0.0, curve), 0.0, 1e-12) << warpCurveName(curve);
            EXPECT_NEAR(applyWarpCurve(1.0, curve), 1.0, 1e-12) << warpCurveName(curve);
        }
    }

    TEST_F(TimeWarpTest, SineIsQuarterWave) {
        EXPECT_NEAR(applyWarpCurve(0.5, WarpCurve::SINE), std::sin(std::numbers::pi / 4.0), 1e-12);
        EXPECT_GT(applyWarpCurve(0.5, WarpCurve::SINE), 0.5);
    }

    TEST_F(TimeWarpTest, CosineIsSymmetric) {
        EXPECT_NEAR(applyWarpCurve(0.5, WarpCurve::COSINE), 0.5, 1e-12);
        EXPECT_NEAR(applyWarpCurve(0.25, WarpCurve::COSINE) + applyWarpCurve(0.75, WarpCurve::COSINE), 1.0, 1e-12);
    }

    TEST_F(TimeWarpTest, BackForthReturnsToStart) {
        EXPECT_DOUBLE_EQ(applyWarpCurve(0.0, WarpCurve::BACK_FORTH), 0.0);
        EXPECT_DOUBLE_EQ(applyWarpCurve(0.5, WarpCurve::BACK_FORTH), 1.0);
        EXPECT_DOUBLE_EQ(applyWarpCurve(1.0, WarpCurve::BACK_FORTH), 0.0);
        EXPECT_DOUBLE_EQ(applyWarpCurve(0.25, WarpCurve::BACK_FORTH), 0.5);
    }

    TEST_F(TimeWarpTest, ValuesOutsideUnitIntervalAreNotClamped) {
        EXPECT_DOUBLE_EQ(applyWarpCurve(1.5, WarpCurve::LINEAR), 1.5);
        EXPECT_DOUBLE_EQ(applyWarpCurve(-0.5, WarpCurve::EASE_IN), 0.25);
    }

    TEST_F(TimeWarpTest, ComposeAppliesInnerFirst) {
        const TimeWarp ease_then_double = compose([](const double t) { return 2.0 * t; },
                                                  makeTimeWarp(WarpCurve::EASE_IN));
        EXPECT_DOUBLE_EQ(ease_then_double(0.5), 0.5);

        const TimeWarp double_then_ease = compose(makeTimeWarp(WarpCurve::EASE_IN),
                                                  [](const double t) { return 2.0 * t; });
        EXPECT_DOUBLE_EQ(double_then_ease(0.5), 1.0);
    }

    TEST_F(TimeWarpTest, NamesRoundTrip) {
        for (const WarpCurve curve : ALL_CURVES) {
            const auto parsed = parseWarpCurve(warpCurveName(curve));
            ASSERT_TRUE(parsed.has_value());
            EXPECT_EQ(*parsed, curve);
        }
        EXPECT_FALSE(parseWarpCurve("bounce").has_value());
        EXPECT_FALSE(parseWarpCurve("").has_value());
    }

} // namespace kb::sequencer
