/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/canvas.hpp"
#include "core/export.hpp"
#include "io/video/video_export_options.hpp"
#include "rendering/frame_sampler.hpp"
#include "rendering/render_config.hpp"
#include "rendering/render_error.hpp"
#include "rendering/rendering_types.hpp"
#include "sequencer/interpolation.hpp"
#include "sequencer/time_warp.hpp"
#include "sequencer/view_rect.hpp"
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kb::io {

    /**
     * @brief Ken Burns render project (.json)
     *
     * Everything the command line renderer needs for one clip:
     *   - source image and optional pre-scale
     *   - output video path and quality
     *   - timing, frame geometry, start/end viewports, time warp
     *   - resampling strategy, antialiasing and edge handling
     *   - optional preview overlay
     *
     * Relative paths are resolved against the directory holding the project file.
     */

    constexpr const char* RENDER_PROJECT_VERSION = "1.0";

    struct RenderProject {
        std::filesystem::path image;
        float image_scale = 1.0f;
        std::filesystem::path output;

        double duration = rendering::DEFAULT_DURATION;
        double frame_rate = rendering::DEFAULT_FRAME_RATE;
        rendering::FrameGeometry frame_size;

        // Unset rects fall back to the canvas defaults
        std::optional<sequencer::ViewRect> start_rect;
        std::optional<sequencer::ViewRect> end_rect;

        // Composed outer-first: {A, B} renders A(B(t))
        std::vector<sequencer::WarpCurve> time_warp{sequencer::WarpCurve::SINE};

        rendering::ResamplingStrategy method = rendering::ResamplingStrategy::GRIDDED_INTERPOLATION;
        std::optional<rendering::InterpolationKernel> interpolation;
        bool antialias = false;
        double filter_kernel_size = rendering::DEFAULT_FILTER_KERNEL_SIZE;
        rendering::EdgePolicy edge_policy = rendering::EdgePolicy::CLAMP;
        bool cache_prefilter = true;
        int worker_threads = 1;
        int crf = video::DEFAULT_CRF;

        std::filesystem::path preview; // empty: no overlay
        int preview_samples = sequencer::DEFAULT_PREVIEW_SAMPLES;
    };

    [[nodiscard]] KB_IO_API const char* edge_policy_name(rendering::EdgePolicy policy);
    [[nodiscard]] KB_IO_API std::optional<rendering::EdgePolicy> parse_edge_policy(std::string_view name);

    [[nodiscard]] KB_IO_API std::expected<RenderProject, rendering::RenderError> parse_render_project(
        const std::string& json_text,
        const std::filesystem::path& base_dir = {});

    [[nodiscard]] KB_IO_API std::expected<RenderProject, rendering::RenderError> load_render_project(
        const std::filesystem::path& path);

    [[nodiscard]] KB_IO_API std::string serialize_render_project(const RenderProject& project);

    [[nodiscard]] KB_IO_API std::expected<void, std::string> save_render_project(
        const std::filesystem::path& path,
        const RenderProject& project);

    // Outer-first curve list to a single warp; empty list gives the identity
    [[nodiscard]] KB_IO_API sequencer::TimeWarp compose_time_warp(const std::vector<sequencer::WarpCurve>& curves);

    // Canvas defaults overridden by every setting the project carries
    [[nodiscard]] KB_IO_API rendering::RenderConfig make_render_config(const RenderProject& project,
                                                                       core::Canvas canvas);

} // namespace kb::io
