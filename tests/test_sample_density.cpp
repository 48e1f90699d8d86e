/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include <gtest/gtest.h>

#include "rendering/sample_density.hpp"

namespace kb::rendering {

    class SampleDensityTest : public ::testing::Test {
    protected:
        FrameGeometry frame{240, 320};
    };

    TEST_F(SampleDensityTest, BaseScaleFitsTheTighterAxis) {
        // 480x640 canvas: both axes shrink by one half
        EXPECT_DOUBLE_EQ(baseScale(480, 640, frame), 0.5);
        // Wide canvas: height decides
        EXPECT_DOUBLE_EQ(baseScale(120, 640, frame), 2.0);
        // Tall canvas: width decides
        EXPECT_DOUBLE_EQ(baseScale(1000, 160, frame), 2.0);
    }

    TEST_F(SampleDensityTest, FullCanvasViewportCoversTheFrameAspect) {
        const double base = baseScale(480, 640, frame);
        const ViewportExtent extent = viewportExtent({1.0, 1.0, 1.0}, frame, base);
        EXPECT_DOUBLE_EQ(extent.width, 640.0);
        EXPECT_DOUBLE_EQ(extent.height, 480.0);
    }

    TEST_F(SampleDensityTest, ViewportShrinksWithScale) {
        const double base = baseScale(480, 640, frame);
        const ViewportExtent extent = viewportExtent({1.0, 1.0, 0.25}, frame, base);
        EXPECT_DOUBLE_EQ(extent.width, 160.0);
        EXPECT_DOUBLE_EQ(extent.height, 120.0);
    }

    TEST_F(SampleDensityTest, SpacingAboveOneMeansMinification) {
        const double base = baseScale(480, 640, frame);
        EXPECT_DOUBLE_EQ(sampleSpacing({1.0, 1.0, 1.0}, frame, base), 2.0);
        EXPECT_DOUBLE_EQ(sampleSpacing({1.0, 1.0, 0.5}, frame, base), 1.0);
        EXPECT_DOUBLE_EQ(sampleSpacing({1.0, 1.0, 0.25}, frame, base), 0.5);
    }

    TEST_F(SampleDensityTest, SpacingIsProportionalToScale) {
        const double base = baseScale(300, 500, frame);
        const double full = sampleSpacing({1.0, 1.0, 1.0}, frame, base);
        const double quarter = sampleSpacing({10.0, 20.0, 0.25}, frame, base);
        EXPECT_NEAR(quarter, full * 0.25, 1e-12);
    }

} // namespace kb::rendering
