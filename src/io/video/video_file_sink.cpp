/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "video_file_sink.hpp"
#include "core/logger.hpp"
#include <system_error>
#include <utility>
#include <vector>

namespace kb::io::video {

    VideoFileSink::VideoFileSink(std::filesystem::path output_path, const int crf)
        : output_path_(std::move(output_path)),
          crf_(crf) {}

    std::expected<void, std::string> VideoFileSink::open(const rendering::FrameFormat& format) {
        if (format.channels != 1 && format.channels != 3) {
            return std::unexpected("Unsupported channel count " + std::to_string(format.channels));
        }
        if (output_path_.has_parent_path()) {
            std::error_code ec;
            std::filesystem::create_directories(output_path_.parent_path(), ec);
            if (ec) {
                return std::unexpected("Cannot create " + output_path_.parent_path().string() + ": " + ec.message());
            }
        }

        VideoExportOptions options;
        options.width = format.width;
        options.height = format.height;
        options.framerate = format.frame_rate;
        options.crf = crf_;
        options.input_layout = format.channels == 1 ? PixelLayout::GRAY8 : PixelLayout::RGB24;

        format_ = format;
        LOG_DEBUG("Opening video sink {}", output_path_.string());
        return encoder_.open(output_path_, options);
    }

    std::expected<void, std::string> VideoFileSink::writeFrame(const core::Canvas& frame) {
        if (frame.height() != format_.height || frame.width() != format_.width ||
            frame.channels() != format_.channels) {
            return std::unexpected("Frame shape does not match the opened format");
        }
        const std::vector<uint8_t> bytes = frame.toBytes();
        return encoder_.writeFrame(bytes, frame.width(), frame.height());
    }

    std::expected<void, std::string> VideoFileSink::close() {
        return encoder_.close();
    }

    void VideoFileSink::abort() {
        encoder_.abort();
    }

} // namespace kb::io::video
