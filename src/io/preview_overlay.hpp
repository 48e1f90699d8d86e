/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/canvas.hpp"
#include "core/export.hpp"
#include "rendering/rendering_types.hpp"
#include "sequencer/interpolation.hpp"
#include <cstddef>
#include <expected>
#include <filesystem>
#include <string>

namespace kb::io {

    struct OverlayColor {
        float r = 0.0f;
        float g = 0.0f;
        float b = 0.0f;
    };

    // Blue for the first sample, red for the last
    [[nodiscard]] KB_IO_API OverlayColor overlay_color(size_t sample, size_t sample_count);

    // RGB copy of the canvas with every preview viewport outlined
    [[nodiscard]] KB_IO_API core::Canvas draw_preview_overlay(const core::Canvas& canvas,
                                                              const sequencer::PreviewRange& samples,
                                                              const rendering::FrameGeometry& frame,
                                                              double base_scale);

    [[nodiscard]] KB_IO_API std::expected<void, std::string> write_preview_overlay(
        const std::filesystem::path& path,
        const core::Canvas& canvas,
        const sequencer::PreviewRange& samples,
        const rendering::FrameGeometry& frame,
        double base_scale);

} // namespace kb::io
