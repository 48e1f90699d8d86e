/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/export.hpp"
#include "video_export_options.hpp"
#include <cstdint>
#include <expected>
#include <filesystem>
#include <memory>
#include <span>
#include <string>

namespace kb::io::video {

    class VideoEncoderImpl;

    class KB_IO_API VideoEncoder {
    public:
        VideoEncoder();
        ~VideoEncoder();

        VideoEncoder(const VideoEncoder&) = delete;
        VideoEncoder& operator=(const VideoEncoder&) = delete;
        VideoEncoder(VideoEncoder&&) noexcept;
        VideoEncoder& operator=(VideoEncoder&&) noexcept;

        // Initialize encoder with output path and options
        [[nodiscard]] std::expected<void, std::string> open(
            const std::filesystem::path& output_path,
            const VideoExportOptions& options);

        // Write one tightly packed frame in the layout given to open()
        [[nodiscard]] std::expected<void, std::string> writeFrame(
            std::span<const uint8_t> pixels,
            int width,
            int height);

        // Flush the encoder and finalize the video file
        [[nodiscard]] std::expected<void, std::string> close();

        // Release everything and delete the partially written file
        void abort();

        [[nodiscard]] bool isOpen() const;
        [[nodiscard]] int64_t framesWritten() const;

    private:
        std::unique_ptr<VideoEncoderImpl> impl_;
    };

} // namespace kb::io::video
