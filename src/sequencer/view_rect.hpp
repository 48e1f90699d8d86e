/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

namespace kb::sequencer {

    inline constexpr double FULL_CANVAS_SCALE = 1.0;

    // Viewport over the canvas. x, y are 1-based canvas coordinates of the
    // top-left sample; scale is relative to the base scale (1 = whole canvas).
    struct ViewRect {
        double x = 1.0;
        double y = 1.0;
        double scale = FULL_CANVAS_SCALE;

        bool operator==(const ViewRect&) const = default;
    };

} // namespace kb::sequencer
