/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/export.hpp"
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace kb::core {

    /// Row-major, channel-interleaved float image [height, width, channels].
    /// Values decoded from 8-bit sources are normalized to [0, 1].
    class KB_CORE_API Canvas {
    public:
        Canvas() = default;
        Canvas(int height, int width, int channels);
        Canvas(int height, int width, int channels, std::vector<float> data);

        // 8-bit interleaved pixels, normalized by 1/255
        [[nodiscard]] static Canvas fromBytes(std::span<const uint8_t> bytes, int height, int width, int channels);

        [[nodiscard]] int height() const { return height_; }
        [[nodiscard]] int width() const { return width_; }
        [[nodiscard]] int channels() const { return channels_; }
        [[nodiscard]] bool empty() const { return data_.empty(); }
        [[nodiscard]] size_t size() const { return data_.size(); }
        [[nodiscard]] size_t rowStride() const { return static_cast<size_t>(width_) * channels_; }

        [[nodiscard]] bool sameShape(const Canvas& other) const {
            return height_ == other.height_ && width_ == other.width_ && channels_ == other.channels_;
        }

        [[nodiscard]] float& at(const int row, const int col, const int ch) {
            return data_[index(row, col, ch)];
        }
        [[nodiscard]] float at(const int row, const int col, const int ch) const {
            return data_[index(row, col, ch)];
        }

        [[nodiscard]] float* row(const int r) { return data_.data() + static_cast<size_t>(r) * rowStride(); }
        [[nodiscard]] const float* row(const int r) const { return data_.data() + static_cast<size_t>(r) * rowStride(); }

        [[nodiscard]] std::span<float> data() { return data_; }
        [[nodiscard]] std::span<const float> data() const { return data_; }

        // Clamps to [0, 1] and rounds to the nearest 8-bit level
        [[nodiscard]] std::vector<uint8_t> toBytes() const;

        bool operator==(const Canvas& other) const = default;

    private:
        [[nodiscard]] size_t index(const int row, const int col, const int ch) const {
            return (static_cast<size_t>(row) * width_ + col) * channels_ + ch;
        }

        int height_ = 0;
        int width_ = 0;
        int channels_ = 0;
        std::vector<float> data_;
    };

} // namespace kb::core
