/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <cstdint>

namespace kb::io::video {

    inline constexpr int DEFAULT_CRF = 18;

    enum class PixelLayout : uint8_t {
        GRAY8, // one byte per pixel
        RGB24  // interleaved red, green, blue
    };

    [[nodiscard]] inline constexpr int channelCount(const PixelLayout layout) {
        switch (layout) {
            case PixelLayout::GRAY8: return 1;
            case PixelLayout::RGB24: return 3;
        }
        return 3;
    }

    struct VideoExportOptions {
        int width = 0;  // must be even for YUV 4:2:0
        int height = 0; // must be even for YUV 4:2:0
        double framerate = 30.0;
        int crf = DEFAULT_CRF; // Constant Rate Factor (15-28, lower = better quality)
        PixelLayout input_layout = PixelLayout::RGB24;
    };

} // namespace kb::io::video
