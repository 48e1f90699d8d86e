/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/canvas.hpp"
#include "core/export.hpp"
#include "rendering/frame_sampler.hpp"
#include "rendering/render_error.hpp"
#include "rendering/rendering_types.hpp"
#include "sequencer/interpolation.hpp"
#include "sequencer/time_warp.hpp"
#include "sequencer/view_rect.hpp"
#include <expected>
#include <functional>

namespace kb::rendering {

    inline constexpr double DEFAULT_DURATION = 3.0;    // seconds
    inline constexpr double DEFAULT_FRAME_RATE = 30.0; // frames per second
    inline constexpr double DEFAULT_FILTER_KERNEL_SIZE = 0.5;
    inline constexpr double DEFAULT_END_OFFSET = 0.2; // end rect corner, fraction of canvas extent
    inline constexpr double DEFAULT_END_SCALE = 0.5;

    struct KB_RENDERING_API RenderConfig {
        core::Canvas canvas;

        double duration = DEFAULT_DURATION;
        double frame_rate = DEFAULT_FRAME_RATE;
        FrameGeometry frame_size;

        sequencer::ViewRect start_rect;
        sequencer::ViewRect end_rect;
        sequencer::TimeWarp time_warp = sequencer::makeTimeWarp(sequencer::WarpCurve::SINE);

        SamplingMethod method = GriddedSampling{};

        // Gaussian prefilter when frames minify the canvas. Experimental.
        bool antialias = false;
        // 1: hardly any aliasing, 0.5: some aliasing but crisp contrast, >>1: blurry
        double filter_kernel_size = DEFAULT_FILTER_KERNEL_SIZE;

        EdgePolicy edge_policy = EdgePolicy::CLAMP;
        bool cache_prefilter = true;
        int worker_threads = 1;

        std::function<void(int, int)> progress_callback; // (frames written, total)

        // Defaults derived from the canvas: full-canvas start, zoomed-in end
        [[nodiscard]] static RenderConfig forCanvas(core::Canvas canvas);
    };

    [[nodiscard]] KB_RENDERING_API sequencer::ViewRect defaultEndRect(int canvas_height, int canvas_width);

    [[nodiscard]] KB_RENDERING_API std::expected<void, RenderError> validateConfig(const RenderConfig& config);

    [[nodiscard]] KB_RENDERING_API sequencer::RectSchedule makeSchedule(const RenderConfig& config);

} // namespace kb::rendering
