/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/canvas.hpp"
#include "core/export.hpp"
#include "rendering/frame_sink.hpp"
#include "rendering/prefilter.hpp"
#include "rendering/render_config.hpp"
#include "rendering/render_error.hpp"
#include "sequencer/interpolation.hpp"
#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>

namespace kb::rendering {

    enum class RenderState : uint8_t {
        UNVALIDATED, // configuration changed since the last render attempt
        RENDERING,
        DONE,  // every frame delivered and the sink closed
        FAILED // validation or a mid-render error aborted the attempt
    };

    [[nodiscard]] KB_RENDERING_API const char* renderStateName(RenderState state);

    struct RenderSummary {
        int frame_count = 0;
        double base_scale = 0.0;
        size_t prefilter_passes = 0; // canvases blurred
        size_t prefilter_reuses = 0; // frames served from the prefilter cache
    };

    /// Renders a pan/zoom over one still image into an ordered frame sink.
    class KB_RENDERING_API KenBurnsSequence {
    public:
        explicit KenBurnsSequence(RenderConfig config);

        [[nodiscard]] const RenderConfig& config() const { return config_; }

        // Resets the state to UNVALIDATED. Throws std::logic_error while rendering.
        [[nodiscard]] RenderConfig& mutableConfig();
        void setConfig(RenderConfig config);

        [[nodiscard]] RenderState state() const { return state_; }

        [[nodiscard]] std::expected<void, RenderError> validate() const;

        [[nodiscard]] int frameCount() const;
        [[nodiscard]] double baseScale() const;
        [[nodiscard]] sequencer::RectSchedule schedule() const;

        /// Validate, open the sink, write frameCount() frames in index order and close it.
        /// Configuration errors are reported before the sink is touched; later failures
        /// abort the sink so no partial output survives.
        [[nodiscard]] std::expected<RenderSummary, RenderError> render(IFrameSink& sink);

        // Single frame without a sink, for previews and inspection
        [[nodiscard]] std::expected<core::Canvas, RenderError> renderFrame(int frame_index);

        // Read-only: evenly spaced viewports including the first and last frame
        [[nodiscard]] sequencer::PreviewRange previewRects(
            int sample_count = sequencer::DEFAULT_PREVIEW_SAMPLES) const;

        [[nodiscard]] const PrefilterCache& prefilterCache() const { return prefilter_cache_; }

    private:
        struct FrameJob {
            int index = 0;
            sequencer::ViewRect rect;
            double spacing = 0.0;
            std::shared_ptr<const core::Canvas> filtered; // null when sampling the raw canvas
        };

        [[nodiscard]] FrameJob prepareFrame(const sequencer::RectSchedule& schedule, int index, double base_scale);
        [[nodiscard]] std::expected<core::Canvas, RenderError> sampleJob(const FrameJob& job, double base_scale) const;
        [[nodiscard]] std::expected<RenderSummary, RenderError> renderFrames(IFrameSink& sink);
        void warnIfDeprecated() const;

        RenderConfig config_;
        RenderState state_ = RenderState::UNVALIDATED;
        PrefilterCache prefilter_cache_;
    };

} // namespace kb::rendering
