/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/image_loader.hpp"
#include <mutex>
#include <utility>

namespace kb::core {

    namespace {
        std::mutex g_loader_mutex;
        ImageLoadFunc g_image_loader;
    } // namespace

    void set_image_loader(ImageLoadFunc fn) {
        std::lock_guard lock(g_loader_mutex);
        g_image_loader = std::move(fn);
    }

    bool has_image_loader() {
        std::lock_guard lock(g_loader_mutex);
        return static_cast<bool>(g_image_loader);
    }

    std::expected<Canvas, std::string> load_image(const ImageLoadParams& params) {
        ImageLoadFunc loader;
        {
            std::lock_guard lock(g_loader_mutex);
            loader = g_image_loader;
        }
        if (!loader) {
            return std::unexpected("No image loader registered");
        }
        if (!(params.scale > 0.0f)) {
            return std::unexpected("Image scale must be positive");
        }
        return loader(params);
    }

} // namespace kb::core
