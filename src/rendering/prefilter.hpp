/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/canvas.hpp"
#include "core/export.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>

namespace kb::rendering {

    // Spacing is quantized to 1/8 px before it drives the blur
    inline constexpr double SPACING_BUCKETS_PER_PIXEL = 8.0;

    [[nodiscard]] KB_RENDERING_API int spacingBucket(double spacing);
    [[nodiscard]] KB_RENDERING_API double bucketSpacing(int bucket);

    // Separable Gaussian, radius ceil(2 sigma), border pixels replicated.
    // Channels are filtered independently. sigma <= 0 returns a copy.
    [[nodiscard]] KB_RENDERING_API core::Canvas gaussianBlur(const core::Canvas& src, double sigma);

    // Low-pass for a frame whose samples are `spacing` canvas pixels apart:
    // sigma = bucketed spacing * kernel_size
    [[nodiscard]] KB_RENDERING_API core::Canvas prefilter(const core::Canvas& src, double spacing, double kernel_size);

    /// Keeps the most recent prefiltered canvas of a render. Snapshots handed out
    /// stay valid after the cache moves on to another spacing bucket.
    /// Not thread-safe: only the thread driving the render may call acquire().
    class KB_RENDERING_API PrefilterCache {
    public:
        [[nodiscard]] std::shared_ptr<const core::Canvas> acquire(const core::Canvas& src,
                                                                  double spacing,
                                                                  double kernel_size);
        void clear();

        // Disabled caches filter on every acquire()
        void setEnabled(bool enabled) { enabled_ = enabled; }
        [[nodiscard]] bool enabled() const { return enabled_; }

        [[nodiscard]] uint64_t version() const { return version_; }
        [[nodiscard]] size_t hits() const { return hits_; }
        [[nodiscard]] size_t misses() const { return misses_; }
        [[nodiscard]] std::optional<int> bucket() const { return bucket_; }

    private:
        std::shared_ptr<const core::Canvas> filtered_;
        std::optional<int> bucket_;
        double kernel_size_ = 0.0;
        uint64_t version_ = 0;
        size_t hits_ = 0;
        size_t misses_ = 0;
        bool enabled_ = true;
    };

} // namespace kb::rendering
