/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include <gtest/gtest.h>

#include "io/image_decoder.hpp"
#include "io/video/video_encoder.hpp"
#include "io/video/video_file_sink.hpp"
#include "rendering/ken_burns_sequence.hpp"
#include "test_helpers.hpp"
#include <filesystem>
#include <vector>

#ifndef _WIN32
#include <csignal>
#include <sys/resource.h>
#endif

namespace kb::io::video {

#ifndef _WIN32
    // Caps the size of files this process may write; writes past it fail with EFBIG
    class FileSizeLimit {
    public:
        explicit FileSizeLimit(const rlim_t bytes) {
            previous_handler_ = std::signal(SIGXFSZ, SIG_IGN);
            getrlimit(RLIMIT_FSIZE, &previous_);
            rlimit capped = previous_;
            capped.rlim_cur = bytes;
            active_ = setrlimit(RLIMIT_FSIZE, &capped) == 0;
        }
        ~FileSizeLimit() {
            setrlimit(RLIMIT_FSIZE, &previous_);
            std::signal(SIGXFSZ, previous_handler_);
        }
        FileSizeLimit(const FileSizeLimit&) = delete;
        FileSizeLimit& operator=(const FileSizeLimit&) = delete;

        [[nodiscard]] bool active() const { return active_; }

    private:
        rlimit previous_{};
        void (*previous_handler_)(int) = SIG_DFL;
        bool active_ = false;
    };
#endif

    class VideoEncoderTest : public ::testing::Test {
    protected:
        void SetUp() override {
            temp_dir = std::filesystem::temp_directory_path() /
                       (std::string("kenburns_video_") + ::testing::UnitTest::GetInstance()->current_test_info()->name());
            std::filesystem::create_directories(temp_dir);
        }

        void TearDown() override {
            std::error_code ec;
            std::filesystem::remove_all(temp_dir, ec);
        }

        std::filesystem::path temp_dir;
    };

    TEST_F(VideoEncoderTest, OddDimensionsAreRejected) {
        VideoEncoder encoder;
        VideoExportOptions options;
        options.width = 33;
        options.height = 24;
        const auto result = encoder.open(temp_dir / "odd.mp4", options);
        ASSERT_FALSE(result.has_value());
        EXPECT_NE(result.error().find("even"), std::string::npos);
        EXPECT_FALSE(encoder.isOpen());
    }

    TEST_F(VideoEncoderTest, WriteBeforeOpenFails) {
        VideoEncoder encoder;
        const std::vector<uint8_t> pixels(16 * 16 * 3);
        EXPECT_FALSE(encoder.writeFrame(pixels, 16, 16).has_value());
        EXPECT_TRUE(encoder.close().has_value());
    }

    TEST_F(VideoEncoderTest, EncodesRenderedSequence) {
        rendering::RenderConfig config = rendering::RenderConfig::forCanvas(test::gradientCanvas(48, 64, 3));
        config.frame_size = {24, 32};
        config.duration = 0.5;
        config.frame_rate = 10.0;

        const auto path = temp_dir / "clip.mp4";
        VideoFileSink sink(path, 28);
        rendering::KenBurnsSequence sequence(config);
        const auto summary = sequence.render(sink);
        if (!summary && summary.error().kind == rendering::RenderErrorKind::SINK &&
            summary.error().message.find("encoder not found") != std::string::npos) {
            GTEST_SKIP() << "No H.264 encoder in this FFmpeg build";
        }
        ASSERT_TRUE(summary.has_value()) << summary.error().format();
        EXPECT_EQ(summary->frame_count, 5);
        ASSERT_TRUE(std::filesystem::exists(path));
        EXPECT_GT(std::filesystem::file_size(path), 0u);

        // The first decoded frame is the full-canvas view
        const auto decoded = decode_image({path});
        ASSERT_TRUE(decoded.has_value()) << decoded.error();
        EXPECT_EQ(decoded->width(), 32);
        EXPECT_EQ(decoded->height(), 24);
    }

    TEST_F(VideoEncoderTest, AbortRemovesPartialFile) {
        VideoFileSink sink(temp_dir / "partial.mp4");
        const auto opened = sink.open({16, 16, 1, 25.0});
        if (!opened && opened.error().find("encoder not found") != std::string::npos) {
            GTEST_SKIP() << "No H.264 encoder in this FFmpeg build";
        }
        ASSERT_TRUE(opened.has_value()) << opened.error();
        ASSERT_TRUE(sink.writeFrame(core::Canvas(16, 16, 1)).has_value());
        sink.abort();
        EXPECT_FALSE(std::filesystem::exists(temp_dir / "partial.mp4"));
    }

    TEST_F(VideoEncoderTest, AbortAfterCloseKeepsFinishedFile) {
        const auto path = temp_dir / "finished.mp4";
        VideoFileSink sink(path);
        const auto opened = sink.open({16, 16, 1, 25.0});
        if (!opened && opened.error().find("encoder not found") != std::string::npos) {
            GTEST_SKIP() << "No H.264 encoder in this FFmpeg build";
        }
        ASSERT_TRUE(opened.has_value()) << opened.error();
        ASSERT_TRUE(sink.writeFrame(test::gradientCanvas(16, 16)).has_value());
        ASSERT_TRUE(sink.close().has_value());
        sink.abort();
        EXPECT_TRUE(std::filesystem::exists(path));
    }

#ifndef _WIN32
    TEST_F(VideoEncoderTest, FailedFinalizeLeavesNoFileAfterAbort) {
        const auto path = temp_dir / "truncated.mp4";
        bool failed = false;
        {
            // Far smaller than the encoder headers, so some write must fail
            FileSizeLimit limit(256);
            if (!limit.active()) {
                GTEST_SKIP() << "RLIMIT_FSIZE not adjustable";
            }
            VideoFileSink sink(path);
            const auto opened = sink.open({16, 16, 1, 25.0});
            if (!opened && opened.error().find("encoder not found") != std::string::npos) {
                GTEST_SKIP() << "No H.264 encoder in this FFmpeg build";
            }
            if (!opened) {
                failed = true;
            } else {
                for (int i = 0; i < 3 && !failed; ++i) {
                    failed = !sink.writeFrame(test::gradientCanvas(16, 16)).has_value();
                }
                if (!failed) {
                    failed = !sink.close().has_value();
                }
                if (failed) {
                    sink.abort();
                }
            }
        }
        EXPECT_TRUE(failed);
        EXPECT_FALSE(std::filesystem::exists(path));
    }
#endif

    TEST_F(VideoEncoderTest, SinkRejectsWrongFrameShape) {
        VideoFileSink sink(temp_dir / "shape.mp4");
        const auto opened = sink.open({16, 16, 3, 25.0});
        if (!opened) {
            GTEST_SKIP() << opened.error();
        }
        EXPECT_FALSE(sink.writeFrame(core::Canvas(16, 16, 1)).has_value());
        sink.abort();
    }

    TEST_F(VideoEncoderTest, DecoderReportsMissingFile) {
        const auto decoded = decode_image({temp_dir / "missing.png"});
        ASSERT_FALSE(decoded.has_value());
        EXPECT_NE(decoded.error().find("missing.png"), std::string::npos);
    }

} // namespace kb::io::video
