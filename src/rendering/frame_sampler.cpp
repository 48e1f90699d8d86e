/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "frame_sampler.hpp"
#include "resample.hpp"
#include "sample_density.hpp"
#include <algorithm>
#include <cmath>
#include <type_traits>

namespace kb::rendering {

    namespace {
        constexpr double BOUNDS_TOLERANCE = 1e-6;

        core::Canvas cropClamped(const core::Canvas& src, const int top, const int left,
                                 const int height, const int width) {
            core::Canvas crop(height, width, src.channels());
            const int channels = src.channels();
            for (int r = 0; r < height; ++r) {
                const float* const in = src.row(std::clamp(top + r, 0, src.height() - 1));
                float* const out = crop.row(r);
                for (int c = 0; c < width; ++c) {
                    const int sc = std::clamp(left + c, 0, src.width() - 1);
                    std::copy_n(in + static_cast<size_t>(sc) * channels, channels,
                                out + static_cast<size_t>(c) * channels);
                }
            }
            return crop;
        }

        core::Canvas sampleNearestCrop(const core::Canvas& src, const sequencer::ViewRect& rect,
                                       const FrameGeometry& frame, const double base_scale,
                                       const NearestCropSampling& params) {
            const ViewportExtent extent = viewportExtent(rect, frame, base_scale);
            const int left = static_cast<int>(std::lround(rect.x)) - 1;
            const int top = static_cast<int>(std::lround(rect.y)) - 1;
            const int width = std::max(1, static_cast<int>(std::lround(extent.width)));
            const int height = std::max(1, static_cast<int>(std::lround(extent.height)));

            const core::Canvas crop = cropClamped(src, top, left, height, width);
            return resize(crop, frame.height, frame.width, params.resize_kernel);
        }

        core::Canvas sampleTranslate(const core::Canvas& src, const sequencer::ViewRect& rect,
                                     const FrameGeometry& frame, const double base_scale,
                                     const TranslateSampling& params) {
            const core::Canvas shifted = translate(src, 1.0 - rect.y, 1.0 - rect.x);
            const double factor = base_scale / rect.scale;
            return resampleScaled(shifted, factor, factor, frame.height, frame.width, params.resize_kernel);
        }

        core::Canvas sampleGridded(const core::Canvas& src, const sequencer::ViewRect& rect,
                                   const FrameGeometry& frame, const double base_scale,
                                   const GriddedSampling& params) {
            const ViewportExtent extent = viewportExtent(rect, frame, base_scale);
            const double x0 = rect.x - 1.0;
            const double y0 = rect.y - 1.0;
            // First and last output samples land on the viewport's first and last pixel
            const double step_x = frame.width > 1 ? std::max(0.0, extent.width - 1.0) / (frame.width - 1) : 0.0;
            const double step_y = frame.height > 1 ? std::max(0.0, extent.height - 1.0) / (frame.height - 1) : 0.0;

            core::Canvas out(frame.height, frame.width, src.channels());
            const int channels = src.channels();
            for (int r = 0; r < frame.height; ++r) {
                const double sy = y0 + r * step_y;
                float* const dst_row = out.row(r);
                for (int c = 0; c < frame.width; ++c) {
                    const double sx = x0 + c * step_x;
                    samplePixel(src, sy, sx, params.interpolant, dst_row + static_cast<size_t>(c) * channels);
                }
            }
            return out;
        }
    } // namespace

    const char* strategyName(const ResamplingStrategy strategy) {
        switch (strategy) {
            case ResamplingStrategy::GRIDDED_INTERPOLATION: return "gridded";
            case ResamplingStrategy::NEAREST_CROP: return "crop";
            case ResamplingStrategy::TRANSLATE: return "translate";
        }
        return "gridded";
    }

    std::optional<ResamplingStrategy> parseStrategy(const std::string_view name) {
        if (name == "gridded") {
            return ResamplingStrategy::GRIDDED_INTERPOLATION;
        }
        if (name == "crop") {
            return ResamplingStrategy::NEAREST_CROP;
        }
        if (name == "translate") {
            return ResamplingStrategy::TRANSLATE;
        }
        return std::nullopt;
    }

    const char* kernelName(const InterpolationKernel kernel) {
        switch (kernel) {
            case InterpolationKernel::LINEAR: return "linear";
            case InterpolationKernel::CUBIC: return "cubic";
        }
        return "linear";
    }

    std::optional<InterpolationKernel> parseKernel(const std::string_view name) {
        if (name == "linear") {
            return InterpolationKernel::LINEAR;
        }
        if (name == "cubic") {
            return InterpolationKernel::CUBIC;
        }
        return std::nullopt;
    }

    SamplingMethod makeSamplingMethod(const ResamplingStrategy strategy,
                                      const std::optional<InterpolationKernel> kernel) {
        switch (strategy) {
            case ResamplingStrategy::GRIDDED_INTERPOLATION: {
                GriddedSampling method;
                method.interpolant = kernel.value_or(method.interpolant);
                return method;
            }
            case ResamplingStrategy::NEAREST_CROP: {
                NearestCropSampling method;
                method.resize_kernel = kernel.value_or(method.resize_kernel);
                return method;
            }
            case ResamplingStrategy::TRANSLATE: {
                TranslateSampling method;
                method.resize_kernel = kernel.value_or(method.resize_kernel);
                return method;
            }
        }
        return GriddedSampling{};
    }

    InterpolationKernel kernelOf(const SamplingMethod& method) {
        return std::visit(
            [](const auto& params) -> InterpolationKernel {
                using T = std::decay_t<decltype(params)>;
                if constexpr (std::is_same_v<T, GriddedSampling>) {
                    return params.interpolant;
                } else {
                    return params.resize_kernel;
                }
            },
            method);
    }

    std::expected<void, std::string> checkViewportInBounds(const int canvas_height, const int canvas_width,
                                                           const sequencer::ViewRect& rect,
                                                           const FrameGeometry& frame,
                                                           const double base_scale) {
        const ViewportExtent extent = viewportExtent(rect, frame, base_scale);
        const double x_last = rect.x + extent.width - 1.0;
        const double y_last = rect.y + extent.height - 1.0;
        if (rect.x < 1.0 - BOUNDS_TOLERANCE || x_last > canvas_width + BOUNDS_TOLERANCE) {
            return std::unexpected("viewport columns [" + std::to_string(rect.x) + ", " +
                                   std::to_string(x_last) + "] exceed canvas width " +
                                   std::to_string(canvas_width));
        }
        if (rect.y < 1.0 - BOUNDS_TOLERANCE || y_last > canvas_height + BOUNDS_TOLERANCE) {
            return std::unexpected("viewport rows [" + std::to_string(rect.y) + ", " +
                                   std::to_string(y_last) + "] exceed canvas height " +
                                   std::to_string(canvas_height));
        }
        return {};
    }

    std::expected<core::Canvas, std::string> sampleFrame(const core::Canvas& source,
                                                         const sequencer::ViewRect& rect,
                                                         const FrameGeometry& frame,
                                                         const SamplingMethod& method,
                                                         const double base_scale,
                                                         const EdgePolicy edge_policy) {
        if (source.empty()) {
            return std::unexpected("Source canvas is empty");
        }
        if (frame.height <= 0 || frame.width <= 0) {
            return std::unexpected("Frame geometry must be positive");
        }
        if (!std::isfinite(rect.x) || !std::isfinite(rect.y) || !std::isfinite(rect.scale)) {
            return std::unexpected("Viewport (" + std::to_string(rect.x) + ", " + std::to_string(rect.y) + ", " +
                                   std::to_string(rect.scale) + ") is not finite");
        }
        if (!(rect.scale > 0.0) || !(base_scale > 0.0)) {
            return std::unexpected("Viewport scale must be positive");
        }

        if (edge_policy == EdgePolicy::STRICT) {
            if (auto in_bounds = checkViewportInBounds(source.height(), source.width(), rect, frame, base_scale);
                !in_bounds) {
                return std::unexpected(in_bounds.error());
            }
        }

        return std::visit(
            [&](const auto& params) -> core::Canvas {
                using T = std::decay_t<decltype(params)>;
                if constexpr (std::is_same_v<T, GriddedSampling>) {
                    return sampleGridded(source, rect, frame, base_scale, params);
                } else if constexpr (std::is_same_v<T, NearestCropSampling>) {
                    return sampleNearestCrop(source, rect, frame, base_scale, params);
                } else {
                    return sampleTranslate(source, rect, frame, base_scale, params);
                }
            },
            method);
    }

} // namespace kb::rendering
