/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "interpolation.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace kb::sequencer {

    int frameCount(const double duration, const double frame_rate) {
        return static_cast<int>(std::lround(duration * frame_rate));
    }

    double normalizedTime(const int frame_index, const int frame_count) {
        if (frame_count <= 1) {
            return 0.0;
        }
        return static_cast<double>(frame_index) / static_cast<double>(frame_count - 1);
    }

    ViewRect lerpRect(const ViewRect& a, const ViewRect& b, const double w) {
        return {
            std::lerp(a.x, b.x, w),
            std::lerp(a.y, b.y, w),
            std::lerp(a.scale, b.scale, w)};
    }

    ViewRect interpolateRect(const RectSchedule& schedule, const int frame_index) {
        if (frame_index < 0 || frame_index >= schedule.frame_count) {
            throw std::out_of_range("Frame index " + std::to_string(frame_index) +
                                    " outside schedule of " + std::to_string(schedule.frame_count) +
                                    " frames");
        }
        const double t = normalizedTime(frame_index, schedule.frame_count);
        const double w = schedule.warp ? schedule.warp(t) : t;
        return lerpRect(schedule.start, schedule.end, w);
    }

    std::vector<ViewRect> buildRectSchedule(const RectSchedule& schedule) {
        std::vector<ViewRect> rects;
        rects.reserve(static_cast<size_t>(std::max(schedule.frame_count, 0)));
        for (int i = 0; i < schedule.frame_count; ++i) {
            rects.push_back(interpolateRect(schedule, i));
        }
        return rects;
    }

    PreviewRange::PreviewRange(RectSchedule schedule, const int sample_count)
        : schedule_(std::move(schedule)) {
        if (sample_count <= 0 || schedule_.frame_count <= 0) {
            count_ = 0;
            return;
        }
        // Both endpoints are kept even when a single sample is requested
        count_ = static_cast<size_t>(std::min(schedule_.frame_count, std::max(sample_count, 2)));
    }

    int PreviewRange::frameIndexAt(const size_t i) const {
        if (i >= count_) {
            throw std::out_of_range("Preview sample " + std::to_string(i) + " out of range");
        }
        const auto frames = static_cast<size_t>(schedule_.frame_count);
        if (count_ == frames) {
            return static_cast<int>(i);
        }
        // round(linspace(0, frames - 1, count))
        const double step = static_cast<double>(frames - 1) / static_cast<double>(count_ - 1);
        return static_cast<int>(std::lround(static_cast<double>(i) * step));
    }

    PreviewSample PreviewRange::operator[](const size_t i) const {
        const int frame = frameIndexAt(i);
        return {frame, interpolateRect(schedule_, frame)};
    }

} // namespace kb::sequencer
