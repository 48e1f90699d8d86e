/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/logger.hpp"
#include <expected>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>

namespace kb::app {

    struct RenderCommandOptions {
        std::filesystem::path project_path;
        bool preview_only = false; // write the overlay PNG, skip the video
        core::LogLevel log_level = core::LogLevel::Info;
        bool show_help = false;
    };

    [[nodiscard]] std::string usage(std::string_view program);

    [[nodiscard]] std::expected<RenderCommandOptions, std::string> parse_command_line(
        std::span<const char* const> args);

    // Returns the process exit code: 0 on success, 1 on any error
    int run_render(const RenderCommandOptions& options);

} // namespace kb::app
