/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/canvas.hpp"
#include "core/export.hpp"
#include "rendering/rendering_types.hpp"

namespace kb::rendering {

    // Point samplers over 0-based continuous coordinates. Coordinates past the
    // border read the nearest edge pixel. `out` receives src.channels() values.
    KB_RENDERING_API void sampleLinear(const core::Canvas& src, double y, double x, float* out);
    KB_RENDERING_API void sampleCubic(const core::Canvas& src, double y, double x, float* out);
    KB_RENDERING_API void samplePixel(const core::Canvas& src, double y, double x, InterpolationKernel kernel, float* out);

    // Top-left out_height x out_width window of src scaled by (factor_y, factor_x).
    // Pixel centres map as src = (dst + 0.5) / factor - 0.5.
    [[nodiscard]] KB_RENDERING_API core::Canvas resampleScaled(const core::Canvas& src,
                                              double factor_y, double factor_x,
                                              int out_height, int out_width,
                                              InterpolationKernel kernel);

    [[nodiscard]] KB_RENDERING_API core::Canvas resize(const core::Canvas& src, int out_height, int out_width,
                                      InterpolationKernel kernel);

    // Sub-pixel shift with bilinear resampling: out(r, c) = src(r - dy, c - dx)
    [[nodiscard]] KB_RENDERING_API core::Canvas translate(const core::Canvas& src, double dy, double dx);

} // namespace kb::rendering
