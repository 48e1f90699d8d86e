/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include <gtest/gtest.h>

#include "sequencer/interpolation.hpp"
#include <stdexcept>
#include <vector>

namespace kb::sequencer {

    class RectInterpolationTest : public ::testing::Test {
    protected:
        RectSchedule linearSchedule(const int frames) const {
            return {start, end, makeTimeWarp(WarpCurve::LINEAR), frames};
        }

        ViewRect start{1.0, 1.0, 1.0};
        ViewRect end{41.0, 21.0, 0.5};
    };

    TEST_F(RectInterpolationTest, FrameCountRoundsToNearest) {
        EXPECT_EQ(frameCount(3.0, 30.0), 90);
        EXPECT_EQ(frameCount(1.0, 29.97), 30);
        EXPECT_EQ(frameCount(0.05, 30.0), 2); // 1.5 rounds away from zero
        EXPECT_EQ(frameCount(0.01, 30.0), 0);
    }

    TEST_F(RectInterpolationTest, EndpointsAreExact) {
        const RectSchedule schedule{start, end, makeTimeWarp(WarpCurve::SINE), 90};
        EXPECT_EQ(interpolateRect(schedule, 0), start);
        EXPECT_EQ(interpolateRect(schedule, 89), end);
    }

    TEST_F(RectInterpolationTest, LinearMidpoint) {
        const ViewRect mid = interpolateRect(linearSchedule(3), 1);
        EXPECT_DOUBLE_EQ(mid.x, 21.0);
        EXPECT_DOUBLE_EQ(mid.y, 11.0);
        EXPECT_DOUBLE_EQ(mid.scale, 0.75);
    }

    TEST_F(RectInterpolationTest, SingleFrameShowsStart) {
        EXPECT_EQ(interpolateRect(linearSchedule(1), 0), start);
    }

    TEST_F(RectInterpolationTest, MissingWarpMeansIdentity) {
        RectSchedule schedule = linearSchedule(5);
        schedule.warp = nullptr;
        EXPECT_DOUBLE_EQ(interpolateRect(schedule, 2).x, 21.0);
    }

    TEST_F(RectInterpolationTest, WarpBeyondUnitIntervalExtrapolates) {
        RectSchedule schedule = linearSchedule(2);
        schedule.warp = [](const double t) { return 2.0 * t; };
        const ViewRect last = interpolateRect(schedule, 1);
        EXPECT_DOUBLE_EQ(last.x, 81.0);
        EXPECT_DOUBLE_EQ(last.scale, 0.0);
    }

    TEST_F(RectInterpolationTest, BackForthEndsWhereItStarted) {
        const RectSchedule schedule{start, end, makeTimeWarp(WarpCurve::BACK_FORTH), 11};
        EXPECT_EQ(interpolateRect(schedule, 10), start);
        EXPECT_EQ(interpolateRect(schedule, 5), end);
    }

    TEST_F(RectInterpolationTest, OutOfRangeIndexThrows) {
        const RectSchedule schedule = linearSchedule(4);
        EXPECT_THROW((void)interpolateRect(schedule, -1), std::out_of_range);
        EXPECT_THROW((void)interpolateRect(schedule, 4), std::out_of_range);
    }

    TEST_F(RectInterpolationTest, BuildScheduleMatchesPerFrameQueries) {
        const RectSchedule schedule{start, end, makeTimeWarp(WarpCurve::COSINE), 17};
        const std::vector<ViewRect> rects = buildRectSchedule(schedule);
        ASSERT_EQ(rects.size(), 17u);
        for (int i = 0; i < 17; ++i) {
            EXPECT_EQ(rects[static_cast<size_t>(i)], interpolateRect(schedule, i));
        }
    }

    TEST_F(RectInterpolationTest, PreviewIncludesFirstAndLastFrame) {
        const PreviewRange preview(linearSchedule(90), 25);
        ASSERT_EQ(preview.size(), 25u);
        EXPECT_EQ(preview[0].frame_index, 0);
        EXPECT_EQ(preview[24].frame_index, 89);
        EXPECT_EQ(preview[0].rect, start);
        EXPECT_EQ(preview[24].rect, end);

        int previous = -1;
        for (const PreviewSample sample : preview) {
            EXPECT_GT(sample.frame_index, previous);
            previous = sample.frame_index;
        }
    }

    TEST_F(RectInterpolationTest, PreviewNeverExceedsFrameCount) {
        const PreviewRange preview(linearSchedule(4), 25);
        ASSERT_EQ(preview.size(), 4u);
        for (size_t i = 0; i < preview.size(); ++i) {
            EXPECT_EQ(preview.frameIndexAt(i), static_cast<int>(i));
        }
    }

    TEST_F(RectInterpolationTest, PreviewKeepsBothEndpointsForOneSample) {
        const PreviewRange preview(linearSchedule(10), 1);
        ASSERT_EQ(preview.size(), 2u);
        EXPECT_EQ(preview.frameIndexAt(0), 0);
        EXPECT_EQ(preview.frameIndexAt(1), 9);
    }

    TEST_F(RectInterpolationTest, PreviewIsRepeatable) {
        const PreviewRange preview(linearSchedule(30), 5);
        std::vector<int> first_pass;
        for (const PreviewSample sample : preview) {
            first_pass.push_back(sample.frame_index);
        }
        std::vector<int> second_pass;
        for (const PreviewSample sample : preview) {
            second_pass.push_back(sample.frame_index);
        }
        EXPECT_EQ(first_pass, second_pass);
        EXPECT_EQ(first_pass, (std::vector<int>{0, 7, 15, 22, 29}));
    }

    TEST_F(RectInterpolationTest, EmptyPreview) {
        EXPECT_TRUE(PreviewRange(linearSchedule(10), 0).empty());
        EXPECT_THROW((void)PreviewRange(linearSchedule(10), 0).frameIndexAt(0), std::out_of_range);
    }

} // namespace kb::sequencer
