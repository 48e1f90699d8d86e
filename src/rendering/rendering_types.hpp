/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <cstdint>

namespace kb::rendering {

    inline constexpr int DEFAULT_FRAME_HEIGHT = 240;
    inline constexpr int DEFAULT_FRAME_WIDTH = 320;

    struct FrameGeometry {
        int height = DEFAULT_FRAME_HEIGHT;
        int width = DEFAULT_FRAME_WIDTH;

        bool operator==(const FrameGeometry&) const = default;
    };

    enum class InterpolationKernel : uint8_t {
        LINEAR,
        CUBIC // Catmull-Rom
    };

    // What happens when a viewport reaches past the canvas border
    enum class EdgePolicy : uint8_t {
        CLAMP, // replicate the border pixels
        STRICT // reject the frame with a sampling error
    };

    // Viewport size in canvas pixels
    struct ViewportExtent {
        double width = 0.0;
        double height = 0.0;
    };

} // namespace kb::rendering
