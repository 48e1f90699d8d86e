/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/canvas.hpp"
#include <expected>
#include <string>

namespace kb::rendering {

    struct FrameFormat {
        int height = 0;
        int width = 0;
        int channels = 0;
        double frame_rate = 0.0;
    };

    /// Ordered consumer of rendered frames, typically a video encoder.
    /// Frames arrive in index order between open() and close(). After a failed
    /// render abort() is called instead of close() and must discard any partial output.
    class IFrameSink {
    public:
        virtual ~IFrameSink() = default;

        [[nodiscard]] virtual std::expected<void, std::string> open(const FrameFormat& format) = 0;
        [[nodiscard]] virtual std::expected<void, std::string> writeFrame(const core::Canvas& frame) = 0;
        [[nodiscard]] virtual std::expected<void, std::string> close() = 0;
        virtual void abort() = 0;
    };

} // namespace kb::rendering
