/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "prefilter.hpp"
#include "core/logger.hpp"
#include <algorithm>
#include <cmath>
#include <vector>

namespace kb::rendering {

    namespace {
        std::vector<float> gaussianKernel(const double sigma, const int radius) {
            std::vector<float> kernel(static_cast<size_t>(2 * radius + 1));
            double sum = 0.0;
            for (int k = -radius; k <= radius; ++k) {
                const double value = std::exp(-static_cast<double>(k * k) / (2.0 * sigma * sigma));
                kernel[static_cast<size_t>(k + radius)] = static_cast<float>(value);
                sum += value;
            }
            for (float& w : kernel) {
                w = static_cast<float>(w / sum);
            }
            return kernel;
        }
    } // namespace

    int spacingBucket(const double spacing) {
        return static_cast<int>(std::lround(spacing * SPACING_BUCKETS_PER_PIXEL));
    }

    double bucketSpacing(const int bucket) {
        return static_cast<double>(bucket) / SPACING_BUCKETS_PER_PIXEL;
    }

    core::Canvas gaussianBlur(const core::Canvas& src, const double sigma) {
        if (!(sigma > 0.0) || src.empty()) {
            return src;
        }

        const int h = src.height();
        const int w = src.width();
        const int channels = src.channels();
        const int radius = std::max(1, static_cast<int>(std::ceil(2.0 * sigma)));
        const std::vector<float> kernel = gaussianKernel(sigma, radius);

        // Horizontal pass
        core::Canvas temp(h, w, channels);
        for (int r = 0; r < h; ++r) {
            const float* const in = src.row(r);
            float* const out = temp.row(r);
            for (int c = 0; c < w; ++c) {
                for (int ch = 0; ch < channels; ++ch) {
                    float acc = 0.0f;
                    for (int k = -radius; k <= radius; ++k) {
                        const int sc = std::clamp(c + k, 0, w - 1);
                        acc += in[sc * channels + ch] * kernel[static_cast<size_t>(k + radius)];
                    }
                    out[c * channels + ch] = acc;
                }
            }
        }

        // Vertical pass
        core::Canvas dst(h, w, channels);
        const size_t stride = temp.rowStride();
        for (int r = 0; r < h; ++r) {
            float* const out = dst.row(r);
            for (size_t i = 0; i < stride; ++i) {
                float acc = 0.0f;
                for (int k = -radius; k <= radius; ++k) {
                    const int sr = std::clamp(r + k, 0, h - 1);
                    acc += temp.row(sr)[i] * kernel[static_cast<size_t>(k + radius)];
                }
                out[i] = acc;
            }
        }
        return dst;
    }

    core::Canvas prefilter(const core::Canvas& src, const double spacing, const double kernel_size) {
        const double sigma = bucketSpacing(spacingBucket(spacing)) * kernel_size;
        return gaussianBlur(src, sigma);
    }

    std::shared_ptr<const core::Canvas> PrefilterCache::acquire(const core::Canvas& src,
                                                                const double spacing,
                                                                const double kernel_size) {
        const int bucket = spacingBucket(spacing);
        if (enabled_ && filtered_ && bucket_ == bucket && kernel_size_ == kernel_size) {
            ++hits_;
            return filtered_;
        }

        ++misses_;
        auto filtered = std::make_shared<const core::Canvas>(prefilter(src, spacing, kernel_size));
        LOG_DEBUG("Prefiltered canvas for spacing {:.3f} (sigma {:.3f})",
                  bucketSpacing(bucket), bucketSpacing(bucket) * kernel_size);
        if (enabled_) {
            filtered_ = filtered;
            bucket_ = bucket;
            kernel_size_ = kernel_size;
            ++version_;
        }
        return filtered;
    }

    void PrefilterCache::clear() {
        filtered_.reset();
        bucket_.reset();
        kernel_size_ = 0.0;
        hits_ = 0;
        misses_ = 0;
    }

} // namespace kb::rendering
