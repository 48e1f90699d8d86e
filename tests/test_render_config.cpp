/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include <gtest/gtest.h>

#include "rendering/render_config.hpp"
#include "test_helpers.hpp"
#include <limits>
#include <stdexcept>

namespace kb::rendering {

    class RenderConfigTest : public ::testing::Test {
    protected:
        void SetUp() override {
            config = RenderConfig::forCanvas(test::gradientCanvas(100, 200));
            config.frame_size = {24, 32};
        }

        void expectRejected(const std::string& field) const {
            const auto result = validateConfig(config);
            ASSERT_FALSE(result.has_value()) << "expected " << field << " to be rejected";
            EXPECT_EQ(result.error().kind, RenderErrorKind::CONFIGURATION);
            EXPECT_EQ(result.error().field, field) << result.error().format();
        }

        RenderConfig config;
    };

    TEST_F(RenderConfigTest, CanvasDefaults) {
        EXPECT_EQ(config.start_rect, (sequencer::ViewRect{1.0, 1.0, 1.0}));
        EXPECT_DOUBLE_EQ(config.end_rect.x, 40.0);
        EXPECT_DOUBLE_EQ(config.end_rect.y, 20.0);
        EXPECT_DOUBLE_EQ(config.end_rect.scale, 0.5);
        EXPECT_DOUBLE_EQ(config.duration, 3.0);
        EXPECT_DOUBLE_EQ(config.frame_rate, 30.0);
        EXPECT_FALSE(config.antialias);
        EXPECT_EQ(config.edge_policy, EdgePolicy::CLAMP);
        EXPECT_NEAR(config.time_warp(0.5), 0.7071067811865476, 1e-12);
        EXPECT_TRUE(validateConfig(config).has_value());
    }

    TEST_F(RenderConfigTest, TinyCanvasEndRectStaysInside) {
        const sequencer::ViewRect end = defaultEndRect(3, 4);
        EXPECT_DOUBLE_EQ(end.x, 1.0);
        EXPECT_DOUBLE_EQ(end.y, 1.0);
    }

    TEST_F(RenderConfigTest, RejectsEmptyCanvas) {
        config.canvas = core::Canvas{};
        expectRejected("canvas");
    }

    TEST_F(RenderConfigTest, RejectsUnsupportedChannelCount) {
        config.canvas = test::gradientCanvas(10, 10, 4);
        expectRejected("canvas");
    }

    TEST_F(RenderConfigTest, RejectsNonPositiveTiming) {
        config.duration = 0.0;
        expectRejected("duration");
        config.duration = 1.0;
        config.frame_rate = -30.0;
        expectRejected("frame_rate");
        config.frame_rate = std::numeric_limits<double>::quiet_NaN();
        expectRejected("frame_rate");
    }

    TEST_F(RenderConfigTest, RejectsScheduleWithoutFrames) {
        config.duration = 0.01;
        config.frame_rate = 30.0;
        expectRejected("duration");
    }

    TEST_F(RenderConfigTest, RejectsBadFrameGeometry) {
        config.frame_size = {0, 32};
        expectRejected("frame_size");
    }

    TEST_F(RenderConfigTest, RejectsScaleOutsideUnitInterval) {
        config.end_rect.scale = 1.5;
        expectRejected("end_rect.scale");
        config.end_rect.scale = 0.0;
        expectRejected("end_rect.scale");
    }

    TEST_F(RenderConfigTest, RejectsCornerOutsideCanvas) {
        config.start_rect.x = 0.5;
        expectRejected("start_rect.x");
        config.start_rect.x = 1.0;
        config.start_rect.y = 101.0;
        expectRejected("start_rect.y");
        config.start_rect.y = std::numeric_limits<double>::infinity();
        expectRejected("start_rect.y");
    }

    TEST_F(RenderConfigTest, RejectsBrokenTimeWarp) {
        config.time_warp = nullptr;
        expectRejected("time_warp");
        config.time_warp = [](const double t) { return t / 0.0 * 0.0; };
        expectRejected("time_warp");
        config.time_warp = [](double) -> double { throw std::runtime_error("boom"); };
        expectRejected("time_warp");
    }

    TEST_F(RenderConfigTest, RejectsFilterKernelAndWorkers) {
        config.filter_kernel_size = 0.0;
        expectRejected("filter_kernel_size");
        config.filter_kernel_size = 1.0;
        config.worker_threads = 0;
        expectRejected("worker_threads");
    }

    TEST_F(RenderConfigTest, ScheduleFollowsConfig) {
        config.duration = 2.0;
        config.frame_rate = 12.5;
        const sequencer::RectSchedule schedule = makeSchedule(config);
        EXPECT_EQ(schedule.frame_count, 25);
        EXPECT_EQ(schedule.start, config.start_rect);
        EXPECT_EQ(schedule.end, config.end_rect);
    }

    TEST_F(RenderConfigTest, ErrorFormatNamesKindAndField) {
        const RenderError error = RenderError::configuration("duration", "must be positive");
        EXPECT_EQ(error.format(), "configuration error [duration]: must be positive");
        EXPECT_STREQ(errorKindName(RenderErrorKind::SINK), "sink error");
    }

} // namespace kb::rendering
