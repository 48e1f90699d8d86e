/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "app/render_command.hpp"
#include <cstdio>
#include <exception>
#include <span>

int main(int argc, char* argv[]) {
    const char* const* const argv_begin = argv;
    const std::span<const char* const> args(argv_begin, static_cast<size_t>(argc));
    const char* const program = argc > 0 ? argv[0] : "kenburns";

    auto options = kb::app::parse_command_line(args);
    if (!options) {
        std::fprintf(stderr, "%s\n%s", options.error().c_str(), kb::app::usage(program).c_str());
        return 1;
    }
    if (options->show_help) {
        std::fputs(kb::app::usage(program).c_str(), stdout);
        return 0;
    }

    try {
        return kb::app::run_render(*options);
    } catch (const std::exception& e) {
        LOG_ERROR("Fatal: {}", e.what());
        return 1;
    }
}
