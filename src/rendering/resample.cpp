/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "resample.hpp"
#include <algorithm>
#include <array>
#include <cmath>

namespace kb::rendering {

    namespace {
        constexpr int CUBIC_TAPS = 4;

        int clampIndex(const int i, const int size) {
            return std::clamp(i, 0, size - 1);
        }

        // Catmull-Rom (Keys, a = -0.5)
        double cubicWeight(const double d) {
            const double ad = std::abs(d);
            if (ad <= 1.0) {
                return (1.5 * ad - 2.5) * ad * ad + 1.0;
            }
            if (ad < 2.0) {
                return ((-0.5 * ad + 2.5) * ad - 4.0) * ad + 2.0;
            }
            return 0.0;
        }
    } // namespace

    void sampleLinear(const core::Canvas& src, double y, double x, float* const out) {
        const int h = src.height();
        const int w = src.width();
        const int channels = src.channels();

        y = std::clamp(y, 0.0, static_cast<double>(h - 1));
        x = std::clamp(x, 0.0, static_cast<double>(w - 1));

        const int y0 = static_cast<int>(std::floor(y));
        const int x0 = static_cast<int>(std::floor(x));
        const int y1 = std::min(y0 + 1, h - 1);
        const int x1 = std::min(x0 + 1, w - 1);
        const float fy = static_cast<float>(y - y0);
        const float fx = static_cast<float>(x - x0);

        const float* const r0 = src.row(y0);
        const float* const r1 = src.row(y1);
        for (int ch = 0; ch < channels; ++ch) {
            const float top = r0[x0 * channels + ch] * (1.0f - fx) + r0[x1 * channels + ch] * fx;
            const float bottom = r1[x0 * channels + ch] * (1.0f - fx) + r1[x1 * channels + ch] * fx;
            out[ch] = top * (1.0f - fy) + bottom * fy;
        }
    }

    void sampleCubic(const core::Canvas& src, double y, double x, float* const out) {
        const int h = src.height();
        const int w = src.width();
        const int channels = src.channels();

        y = std::clamp(y, 0.0, static_cast<double>(h - 1));
        x = std::clamp(x, 0.0, static_cast<double>(w - 1));

        const int y0 = static_cast<int>(std::floor(y));
        const int x0 = static_cast<int>(std::floor(x));

        std::array<double, CUBIC_TAPS> wy{};
        std::array<double, CUBIC_TAPS> wx{};
        std::array<int, CUBIC_TAPS> iy{};
        std::array<int, CUBIC_TAPS> ix{};
        for (int k = 0; k < CUBIC_TAPS; ++k) {
            iy[k] = clampIndex(y0 - 1 + k, h);
            ix[k] = clampIndex(x0 - 1 + k, w);
            wy[k] = cubicWeight(y - (y0 - 1 + k));
            wx[k] = cubicWeight(x - (x0 - 1 + k));
        }

        for (int ch = 0; ch < channels; ++ch) {
            double acc = 0.0;
            for (int j = 0; j < CUBIC_TAPS; ++j) {
                const float* const r = src.row(iy[j]);
                double row_acc = 0.0;
                for (int i = 0; i < CUBIC_TAPS; ++i) {
                    row_acc += wx[i] * r[ix[i] * channels + ch];
                }
                acc += wy[j] * row_acc;
            }
            out[ch] = static_cast<float>(acc);
        }
    }

    void samplePixel(const core::Canvas& src, const double y, const double x,
                     const InterpolationKernel kernel, float* const out) {
        switch (kernel) {
            case InterpolationKernel::LINEAR:
                sampleLinear(src, y, x, out);
                return;
            case InterpolationKernel::CUBIC:
                sampleCubic(src, y, x, out);
                return;
        }
        sampleLinear(src, y, x, out);
    }

    core::Canvas resampleScaled(const core::Canvas& src,
                                const double factor_y, const double factor_x,
                                const int out_height, const int out_width,
                                const InterpolationKernel kernel) {
        core::Canvas dst(out_height, out_width, src.channels());
        const int channels = src.channels();
        for (int r = 0; r < out_height; ++r) {
            const double sy = (r + 0.5) / factor_y - 0.5;
            float* const dst_row = dst.row(r);
            for (int c = 0; c < out_width; ++c) {
                const double sx = (c + 0.5) / factor_x - 0.5;
                samplePixel(src, sy, sx, kernel, dst_row + static_cast<size_t>(c) * channels);
            }
        }
        return dst;
    }

    core::Canvas resize(const core::Canvas& src, const int out_height, const int out_width,
                        const InterpolationKernel kernel) {
        const double factor_y = static_cast<double>(out_height) / src.height();
        const double factor_x = static_cast<double>(out_width) / src.width();
        return resampleScaled(src, factor_y, factor_x, out_height, out_width, kernel);
    }

    core::Canvas translate(const core::Canvas& src, const double dy, const double dx) {
        core::Canvas dst(src.height(), src.width(), src.channels());
        const int channels = src.channels();
        for (int r = 0; r < src.height(); ++r) {
            float* const dst_row = dst.row(r);
            for (int c = 0; c < src.width(); ++c) {
                sampleLinear(src, r - dy, c - dx, dst_row + static_cast<size_t>(c) * channels);
            }
        }
        return dst;
    }

} // namespace kb::rendering
