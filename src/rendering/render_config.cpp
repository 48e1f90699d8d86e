/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "render_config.hpp"
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <exception>
#include <string>

namespace kb::rendering {

    namespace {
        std::string describe(const double v) {
            return std::to_string(v);
        }

        std::expected<void, RenderError> validateRect(const sequencer::ViewRect& rect,
                                                      const std::string& name,
                                                      const core::Canvas& canvas) {
            if (!std::isfinite(rect.x) || rect.x < 1.0 || rect.x > canvas.width()) {
                return std::unexpected(RenderError::configuration(
                    name + ".x", "expected a value in [1, " + std::to_string(canvas.width()) +
                                     "], got " + describe(rect.x)));
            }
            if (!std::isfinite(rect.y) || rect.y < 1.0 || rect.y > canvas.height()) {
                return std::unexpected(RenderError::configuration(
                    name + ".y", "expected a value in [1, " + std::to_string(canvas.height()) +
                                     "], got " + describe(rect.y)));
            }
            if (!std::isfinite(rect.scale) || rect.scale <= 0.0 || rect.scale > 1.0) {
                return std::unexpected(RenderError::configuration(
                    name + ".scale", "expected a value in (0, 1], got " + describe(rect.scale)));
            }
            return {};
        }

        std::expected<void, RenderError> validateTimeWarp(const sequencer::TimeWarp& warp) {
            if (!warp) {
                return std::unexpected(RenderError::configuration("time_warp", "no time warp function set"));
            }
            try {
                const double at_start = warp(0.0);
                const double at_end = warp(1.0);
                if (!std::isfinite(at_start) || !std::isfinite(at_end)) {
                    return std::unexpected(RenderError::configuration(
                        "time_warp", "must map [0, 1] to finite values, got " + describe(at_start) +
                                         " at 0 and " + describe(at_end) + " at 1"));
                }
            } catch (const std::exception& e) {
                return std::unexpected(RenderError::configuration(
                    "time_warp", std::string("evaluation failed: ") + e.what()));
            }
            return {};
        }
    } // namespace

    RenderConfig RenderConfig::forCanvas(core::Canvas canvas) {
        RenderConfig config;
        config.end_rect = defaultEndRect(canvas.height(), canvas.width());
        config.canvas = std::move(canvas);
        return config;
    }

    sequencer::ViewRect defaultEndRect(const int canvas_height, const int canvas_width) {
        return {
            std::max(1.0, DEFAULT_END_OFFSET * canvas_width),
            std::max(1.0, DEFAULT_END_OFFSET * canvas_height),
            DEFAULT_END_SCALE};
    }

    std::expected<void, RenderError> validateConfig(const RenderConfig& config) {
        const core::Canvas& canvas = config.canvas;
        if (canvas.empty()) {
            return std::unexpected(RenderError::configuration("canvas", "canvas is empty"));
        }
        if (canvas.channels() != 1 && canvas.channels() != 3) {
            return std::unexpected(RenderError::configuration(
                "canvas", "channel count must be 1 or 3, got " + std::to_string(canvas.channels())));
        }

        const auto kernel = static_cast<uint8_t>(kernelOf(config.method));
        if (kernel > static_cast<uint8_t>(InterpolationKernel::CUBIC)) {
            return std::unexpected(RenderError::configuration(
                "method", "unknown interpolation kernel " + std::to_string(kernel)));
        }

        if (auto warp = validateTimeWarp(config.time_warp); !warp) {
            return warp;
        }

        if (!std::isfinite(config.duration) || config.duration <= 0.0) {
            return std::unexpected(RenderError::configuration(
                "duration", "must be positive, got " + describe(config.duration)));
        }
        if (!std::isfinite(config.frame_rate) || config.frame_rate <= 0.0) {
            return std::unexpected(RenderError::configuration(
                "frame_rate", "must be positive, got " + describe(config.frame_rate)));
        }
        if (const int frames = sequencer::frameCount(config.duration, config.frame_rate); frames < 1) {
            return std::unexpected(RenderError::configuration(
                "duration", "duration x frame_rate rounds to " + std::to_string(frames) +
                                " frames, at least 1 is required"));
        }
        if (config.frame_size.height <= 0 || config.frame_size.width <= 0) {
            return std::unexpected(RenderError::configuration(
                "frame_size", "must be positive, got " + std::to_string(config.frame_size.height) +
                                  "x" + std::to_string(config.frame_size.width)));
        }

        if (auto start = validateRect(config.start_rect, "start_rect", canvas); !start) {
            return start;
        }
        if (auto end = validateRect(config.end_rect, "end_rect", canvas); !end) {
            return end;
        }

        if (!std::isfinite(config.filter_kernel_size) || config.filter_kernel_size <= 0.0) {
            return std::unexpected(RenderError::configuration(
                "filter_kernel_size", "must be positive, got " + describe(config.filter_kernel_size)));
        }
        if (config.worker_threads < 1) {
            return std::unexpected(RenderError::configuration(
                "worker_threads", "must be at least 1, got " + std::to_string(config.worker_threads)));
        }
        return {};
    }

    sequencer::RectSchedule makeSchedule(const RenderConfig& config) {
        return {
            config.start_rect,
            config.end_rect,
            config.time_warp,
            sequencer::frameCount(config.duration, config.frame_rate)};
    }

} // namespace kb::rendering
