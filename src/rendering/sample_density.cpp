/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "sample_density.hpp"
#include <algorithm>

namespace kb::rendering {

    double baseScale(const int canvas_height, const int canvas_width, const FrameGeometry& frame) {
        return std::max(static_cast<double>(frame.height) / canvas_height,
                        static_cast<double>(frame.width) / canvas_width);
    }

    ViewportExtent viewportExtent(const sequencer::ViewRect& rect, const FrameGeometry& frame,
                                  const double base_scale) {
        return {
            static_cast<double>(frame.width) / base_scale * rect.scale,
            static_cast<double>(frame.height) / base_scale * rect.scale};
    }

    double sampleSpacing(const sequencer::ViewRect& rect, const FrameGeometry& frame,
                         const double base_scale) {
        const ViewportExtent extent = viewportExtent(rect, frame, base_scale);
        const double spacing_x = extent.width / frame.width;
        const double spacing_y = extent.height / frame.height;
        return std::max(spacing_x, spacing_y);
    }

} // namespace kb::rendering
