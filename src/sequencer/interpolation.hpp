/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "time_warp.hpp"
#include "view_rect.hpp"
#include <cstddef>
#include <iterator>
#include <vector>

namespace kb::sequencer {

    inline constexpr int DEFAULT_PREVIEW_SAMPLES = 25;

    struct RectSchedule {
        ViewRect start;
        ViewRect end;
        TimeWarp warp;
        int frame_count = 1;
    };

    // round(duration * frame_rate); callers validate the result is >= 1
    [[nodiscard]] int frameCount(double duration, double frame_rate);

    // index / (count - 1), 0 for a single-frame schedule
    [[nodiscard]] double normalizedTime(int frame_index, int frame_count);

    // a + w (b - a) per component, exact at w = 0 and w = 1
    [[nodiscard]] ViewRect lerpRect(const ViewRect& a, const ViewRect& b, double w);

    // Throws std::out_of_range for indices outside [0, frame_count)
    [[nodiscard]] ViewRect interpolateRect(const RectSchedule& schedule, int frame_index);

    [[nodiscard]] std::vector<ViewRect> buildRectSchedule(const RectSchedule& schedule);

    struct PreviewSample {
        int frame_index = 0;
        ViewRect rect;
    };

    /// Evenly spaced subset of the schedule for drawing. Elements are computed on
    /// access, the range owns a copy of the schedule and can be iterated repeatedly.
    /// The first and last frame are always part of a non-empty range.
    class PreviewRange {
    public:
        class Iterator {
        public:
            using iterator_category = std::forward_iterator_tag;
            using value_type = PreviewSample;
            using difference_type = std::ptrdiff_t;
            using pointer = void;
            using reference = PreviewSample;

            Iterator() = default;
            Iterator(const PreviewRange* range, const size_t pos) : range_(range), pos_(pos) {}

            PreviewSample operator*() const { return (*range_)[pos_]; }
            Iterator& operator++() {
                ++pos_;
                return *this;
            }
            Iterator operator++(int) {
                Iterator copy = *this;
                ++pos_;
                return copy;
            }
            bool operator==(const Iterator& other) const = default;

        private:
            const PreviewRange* range_ = nullptr;
            size_t pos_ = 0;
        };

        PreviewRange(RectSchedule schedule, int sample_count);

        [[nodiscard]] size_t size() const { return count_; }
        [[nodiscard]] bool empty() const { return count_ == 0; }
        [[nodiscard]] int frameIndexAt(size_t i) const;
        [[nodiscard]] PreviewSample operator[](size_t i) const;

        [[nodiscard]] Iterator begin() const { return {this, 0}; }
        [[nodiscard]] Iterator end() const { return {this, count_}; }

    private:
        RectSchedule schedule_;
        size_t count_ = 0;
    };

} // namespace kb::sequencer
