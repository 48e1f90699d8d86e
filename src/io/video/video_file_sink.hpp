/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/export.hpp"
#include "rendering/frame_sink.hpp"
#include "video_encoder.hpp"
#include <filesystem>

namespace kb::io::video {

    /// Frame sink writing an H.264 mp4. Float frames are quantized to 8 bit;
    /// one-channel frames are encoded as grayscale.
    class KB_IO_API VideoFileSink final : public rendering::IFrameSink {
    public:
        explicit VideoFileSink(std::filesystem::path output_path, int crf = DEFAULT_CRF);

        [[nodiscard]] std::expected<void, std::string> open(const rendering::FrameFormat& format) override;
        [[nodiscard]] std::expected<void, std::string> writeFrame(const core::Canvas& frame) override;
        [[nodiscard]] std::expected<void, std::string> close() override;
        void abort() override;

        [[nodiscard]] const std::filesystem::path& path() const { return output_path_; }

    private:
        std::filesystem::path output_path_;
        int crf_;
        rendering::FrameFormat format_;
        VideoEncoder encoder_;
    };

} // namespace kb::io::video
