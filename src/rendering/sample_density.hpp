/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/export.hpp"
#include "rendering/rendering_types.hpp"
#include "sequencer/view_rect.hpp"

namespace kb::rendering {

    // Scale at which the whole canvas covers the frame without empty borders.
    // All ViewRect::scale values are relative to it.
    [[nodiscard]] KB_RENDERING_API double baseScale(int canvas_height, int canvas_width, const FrameGeometry& frame);

    [[nodiscard]] KB_RENDERING_API ViewportExtent viewportExtent(const sequencer::ViewRect& rect,
                                                const FrameGeometry& frame,
                                                double base_scale);

    // Canvas pixels between adjacent output samples on the more demanding axis.
    // Above 1 the frame minifies the canvas and can alias.
    [[nodiscard]] KB_RENDERING_API double sampleSpacing(const sequencer::ViewRect& rect,
                                       const FrameGeometry& frame,
                                       double base_scale);

} // namespace kb::rendering
