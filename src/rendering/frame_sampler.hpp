/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/canvas.hpp"
#include "core/export.hpp"
#include "rendering/rendering_types.hpp"
#include "sequencer/view_rect.hpp"
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace kb::rendering {

    // Exact source coordinates per output pixel, one interpolation pass.
    struct GriddedSampling {
        InterpolationKernel interpolant = InterpolationKernel::LINEAR;
    };

    // Integer crop then resize. Crop corners snap to whole pixels, so slow
    // pans visibly jitter. Only worth it for very large canvases.
    struct NearestCropSampling {
        InterpolationKernel resize_kernel = InterpolationKernel::CUBIC;
    };

    // Sub-pixel shift, resize, then a hard crop. Two resampling passes.
    struct TranslateSampling {
        InterpolationKernel resize_kernel = InterpolationKernel::CUBIC;
    };

    using SamplingMethod = std::variant<GriddedSampling, NearestCropSampling, TranslateSampling>;

    enum class ResamplingStrategy : uint8_t {
        GRIDDED_INTERPOLATION,
        NEAREST_CROP,
        TRANSLATE
    };

    [[nodiscard]] inline ResamplingStrategy strategyOf(const SamplingMethod& method) {
        return static_cast<ResamplingStrategy>(method.index());
    }

    [[nodiscard]] inline bool isDeprecated(const ResamplingStrategy strategy) {
        return strategy != ResamplingStrategy::GRIDDED_INTERPOLATION;
    }

    [[nodiscard]] KB_RENDERING_API const char* strategyName(ResamplingStrategy strategy);
    [[nodiscard]] KB_RENDERING_API std::optional<ResamplingStrategy> parseStrategy(std::string_view name);
    [[nodiscard]] KB_RENDERING_API const char* kernelName(InterpolationKernel kernel);
    [[nodiscard]] KB_RENDERING_API std::optional<InterpolationKernel> parseKernel(std::string_view name);

    // Strategy with its kernel; unset kernel keeps the strategy default
    [[nodiscard]] KB_RENDERING_API SamplingMethod makeSamplingMethod(
        ResamplingStrategy strategy,
        std::optional<InterpolationKernel> kernel = std::nullopt);

    [[nodiscard]] KB_RENDERING_API InterpolationKernel kernelOf(const SamplingMethod& method);

    // Fails when the viewport [x, x + w - 1] x [y, y + h - 1] leaves the canvas
    [[nodiscard]] KB_RENDERING_API std::expected<void, std::string> checkViewportInBounds(
        int canvas_height, int canvas_width,
        const sequencer::ViewRect& rect,
        const FrameGeometry& frame,
        double base_scale);

    /// Render one frame of `frame` size from `source` (raw or prefiltered canvas).
    /// Output has source.channels() channels. With EdgePolicy::STRICT a viewport
    /// outside the canvas is an error, otherwise border pixels are replicated.
    [[nodiscard]] KB_RENDERING_API std::expected<core::Canvas, std::string> sampleFrame(
        const core::Canvas& source,
        const sequencer::ViewRect& rect,
        const FrameGeometry& frame,
        const SamplingMethod& method,
        double base_scale,
        EdgePolicy edge_policy = EdgePolicy::CLAMP);

} // namespace kb::rendering
