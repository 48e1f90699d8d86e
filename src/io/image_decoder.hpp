/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/canvas.hpp"
#include "core/export.hpp"
#include "core/image_loader.hpp"
#include <expected>
#include <string>

namespace kb::io {

    // Decode the first frame of a still image (png, jpg, bmp, tiff, ...) with FFmpeg.
    // Grayscale sources give a one-channel canvas, everything else RGB.
    // params.scale resizes the decoded image (bicubic).
    [[nodiscard]] KB_IO_API std::expected<core::Canvas, std::string> decode_image(const core::ImageLoadParams& params);

    // Registers decode_image as the process image loader
    KB_IO_API void install_ffmpeg_image_loader();

} // namespace kb::io
