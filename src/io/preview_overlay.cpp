/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "preview_overlay.hpp"
#include "core/logger.hpp"
#include "rendering/sample_density.hpp"
#include <algorithm>
#include <cmath>
#include <system_error>
#include <vector>

#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>

namespace kb::io {

    namespace {
        void putPixel(core::Canvas& image, const int row, const int col, const OverlayColor& color) {
            if (row < 0 || col < 0 || row >= image.height() || col >= image.width()) {
                return;
            }
            image.at(row, col, 0) = color.r;
            image.at(row, col, 1) = color.g;
            image.at(row, col, 2) = color.b;
        }

        // One pixel wide outline, corners given as 0-based inclusive pixel indices
        void drawOutline(core::Canvas& image, const int top, const int left, const int bottom, const int right,
                         const OverlayColor& color) {
            for (int c = left; c <= right; ++c) {
                putPixel(image, top, c, color);
                putPixel(image, bottom, c, color);
            }
            for (int r = top; r <= bottom; ++r) {
                putPixel(image, r, left, color);
                putPixel(image, r, right, color);
            }
        }

        core::Canvas toRgb(const core::Canvas& canvas) {
            if (canvas.channels() == 3) {
                return canvas;
            }
            core::Canvas rgb(canvas.height(), canvas.width(), 3);
            for (int r = 0; r < canvas.height(); ++r) {
                for (int c = 0; c < canvas.width(); ++c) {
                    const float v = canvas.at(r, c, 0);
                    rgb.at(r, c, 0) = v;
                    rgb.at(r, c, 1) = v;
                    rgb.at(r, c, 2) = v;
                }
            }
            return rgb;
        }
    } // namespace

    OverlayColor overlay_color(const size_t sample, const size_t sample_count) {
        const float t = sample_count > 1
                            ? static_cast<float>(sample) / static_cast<float>(sample_count - 1)
                            : 0.0f;
        return {t, 0.0f, 1.0f - t};
    }

    core::Canvas draw_preview_overlay(const core::Canvas& canvas,
                                      const sequencer::PreviewRange& samples,
                                      const rendering::FrameGeometry& frame,
                                      const double base_scale) {
        core::Canvas image = toRgb(canvas);
        size_t i = 0;
        for (const sequencer::PreviewSample sample : samples) {
            const rendering::ViewportExtent extent = rendering::viewportExtent(sample.rect, frame, base_scale);
            const int left = static_cast<int>(std::lround(sample.rect.x)) - 1;
            const int top = static_cast<int>(std::lround(sample.rect.y)) - 1;
            const int right = static_cast<int>(std::lround(sample.rect.x + extent.width - 1.0)) - 1;
            const int bottom = static_cast<int>(std::lround(sample.rect.y + extent.height - 1.0)) - 1;
            drawOutline(image, top, left, std::max(top, bottom), std::max(left, right),
                        overlay_color(i++, samples.size()));
        }
        return image;
    }

    std::expected<void, std::string> write_preview_overlay(const std::filesystem::path& path,
                                                           const core::Canvas& canvas,
                                                           const sequencer::PreviewRange& samples,
                                                           const rendering::FrameGeometry& frame,
                                                           const double base_scale) {
        if (canvas.empty()) {
            return std::unexpected("Cannot draw a preview of an empty canvas");
        }
        if (path.has_parent_path()) {
            std::error_code ec;
            std::filesystem::create_directories(path.parent_path(), ec);
            if (ec) {
                return std::unexpected("Cannot create " + path.parent_path().string() + ": " + ec.message());
            }
        }

        const core::Canvas image = draw_preview_overlay(canvas, samples, frame, base_scale);
        const std::vector<uint8_t> bytes = image.toBytes();
        if (!stbi_write_png(path.string().c_str(), image.width(), image.height(), 3,
                            bytes.data(), image.width() * 3)) {
            return std::unexpected("Failed to write preview " + path.string());
        }
        LOG_INFO("Preview with {} viewports written to {}", samples.size(), path.string());
        return {};
    }

} // namespace kb::io
