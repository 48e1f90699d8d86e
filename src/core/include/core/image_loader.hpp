/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/canvas.hpp"
#include "core/export.hpp"
#include <expected>
#include <filesystem>
#include <functional>
#include <string>

namespace kb::core {

    struct ImageLoadParams {
        std::filesystem::path path;
        float scale = 1.0f; // >1 upsamples small images before rendering
    };

    using ImageLoadFunc = std::function<std::expected<Canvas, std::string>(const ImageLoadParams&)>;

    KB_CORE_API void set_image_loader(ImageLoadFunc fn);
    [[nodiscard]] KB_CORE_API bool has_image_loader();
    [[nodiscard]] KB_CORE_API std::expected<Canvas, std::string> load_image(const ImageLoadParams& params);

} // namespace kb::core
