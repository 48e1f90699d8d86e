/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include <gtest/gtest.h>

#include "app/render_command.hpp"
#include "core/image_loader.hpp"
#include "test_helpers.hpp"
#include <filesystem>
#include <fstream>
#include <vector>

namespace kb::app {

    class RenderCommandTest : public ::testing::Test {
    protected:
        static std::expected<RenderCommandOptions, std::string> parse(std::vector<const char*> args) {
            args.insert(args.begin(), "kenburns");
            return parse_command_line(args);
        }
    };

    TEST_F(RenderCommandTest, ProjectOnly) {
        const auto options = parse({"project.json"});
        ASSERT_TRUE(options.has_value()) << options.error();
        EXPECT_EQ(options->project_path, std::filesystem::path("project.json"));
        EXPECT_FALSE(options->preview_only);
        EXPECT_EQ(options->log_level, core::LogLevel::Info);
    }

    TEST_F(RenderCommandTest, Flags) {
        const auto options = parse({"--preview-only", "project.json", "--verbose"});
        ASSERT_TRUE(options.has_value());
        EXPECT_TRUE(options->preview_only);
        EXPECT_EQ(options->log_level, core::LogLevel::Debug);

        const auto quiet = parse({"project.json", "--log-level", "warn"});
        ASSERT_TRUE(quiet.has_value());
        EXPECT_EQ(quiet->log_level, core::LogLevel::Warn);
    }

    TEST_F(RenderCommandTest, Errors) {
        EXPECT_FALSE(parse({}).has_value());
        EXPECT_FALSE(parse({"a.json", "b.json"}).has_value());
        EXPECT_FALSE(parse({"a.json", "--fast"}).has_value());
        EXPECT_FALSE(parse({"a.json", "--log-level"}).has_value());
        EXPECT_FALSE(parse({"a.json", "--log-level", "loud"}).has_value());
    }

    TEST_F(RenderCommandTest, HelpNeedsNoProject) {
        const auto options = parse({"--help"});
        ASSERT_TRUE(options.has_value());
        EXPECT_TRUE(options->show_help);
        EXPECT_NE(usage("kenburns").find("--preview-only"), std::string::npos);
    }

    TEST_F(RenderCommandTest, PreviewOnlyWritesOverlay) {
        const auto dir = std::filesystem::temp_directory_path() / "kenburns_command_test";
        std::filesystem::create_directories(dir);
        std::ofstream(dir / "project.json")
            << R"({"image": "in.png", "output": "clip.mp4", "frame_size": [12, 16], "duration": 1})";

        core::set_image_loader([](const core::ImageLoadParams&) -> std::expected<core::Canvas, std::string> {
            return test::gradientCanvas(30, 40, 3);
        });
        RenderCommandOptions options;
        options.project_path = dir / "project.json";
        options.preview_only = true;
        options.log_level = core::LogLevel::Warn;

        EXPECT_EQ(run_render(options), 0);
        EXPECT_TRUE(std::filesystem::exists(dir / "clip.png"));
        EXPECT_FALSE(std::filesystem::exists(dir / "clip.mp4"));

        core::set_image_loader(nullptr);
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
    }

    TEST_F(RenderCommandTest, InvalidProjectFails) {
        const auto dir = std::filesystem::temp_directory_path() / "kenburns_command_invalid";
        std::filesystem::create_directories(dir);
        std::ofstream(dir / "project.json") << R"({"image": "in.png", "method": "nearest"})";

        RenderCommandOptions options;
        options.project_path = dir / "project.json";
        options.log_level = core::LogLevel::Off;
        EXPECT_EQ(run_render(options), 1);

        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
    }

} // namespace kb::app
