/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/canvas.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

namespace kb::core {

    namespace {
        size_t checkedSize(const int height, const int width, const int channels) {
            if (height < 0 || width < 0 || channels < 0) {
                throw std::invalid_argument("Canvas dimensions must be non-negative");
            }
            return static_cast<size_t>(height) * width * channels;
        }
    } // namespace

    Canvas::Canvas(const int height, const int width, const int channels)
        : height_(height),
          width_(width),
          channels_(channels),
          data_(checkedSize(height, width, channels), 0.0f) {}

    Canvas::Canvas(const int height, const int width, const int channels, std::vector<float> data)
        : height_(height),
          width_(width),
          channels_(channels),
          data_(std::move(data)) {
        if (data_.size() != checkedSize(height, width, channels)) {
            throw std::invalid_argument("Canvas data size " + std::to_string(data_.size()) +
                                        " does not match " + std::to_string(height) + "x" +
                                        std::to_string(width) + "x" + std::to_string(channels));
        }
    }

    Canvas Canvas::fromBytes(const std::span<const uint8_t> bytes, const int height, const int width,
                             const int channels) {
        if (bytes.size() != checkedSize(height, width, channels)) {
            throw std::invalid_argument("Pixel buffer size does not match image dimensions");
        }
        std::vector<float> data(bytes.size());
        constexpr float INV_255 = 1.0f / 255.0f;
        std::transform(bytes.begin(), bytes.end(), data.begin(),
                       [](const uint8_t v) { return static_cast<float>(v) * INV_255; });
        return Canvas(height, width, channels, std::move(data));
    }

    std::vector<uint8_t> Canvas::toBytes() const {
        std::vector<uint8_t> bytes(data_.size());
        std::transform(data_.begin(), data_.end(), bytes.begin(), [](const float v) {
            return static_cast<uint8_t>(std::lround(std::clamp(v, 0.0f, 1.0f) * 255.0f));
        });
        return bytes;
    }

} // namespace kb::core
