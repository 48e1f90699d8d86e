/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string_view>

namespace kb::sequencer {

    // Maps normalized render progress in [0,1] to the rect interpolation
    // parameter. Output is not clamped; values outside [0,1] extrapolate.
    using TimeWarp = std::function<double(double)>;

    enum class WarpCurve : uint8_t {
        LINEAR,
        SINE,       // sin(pi/2 t), fast start and soft landing
        COSINE,     // 0.5 - 0.5 cos(pi t), soft at both ends
        BACK_FORTH, // 0 -> 1 -> 0, reaches the end rect at t = 0.5
        EASE_IN,
        EASE_OUT,
        EASE_IN_OUT
    };

    [[nodiscard]] double applyWarpCurve(double t, WarpCurve curve);

    [[nodiscard]] TimeWarp makeTimeWarp(WarpCurve curve);

    // outer(inner(t))
    [[nodiscard]] TimeWarp compose(TimeWarp outer, TimeWarp inner);

    [[nodiscard]] const char* warpCurveName(WarpCurve curve);
    [[nodiscard]] std::optional<WarpCurve> parseWarpCurve(std::string_view name);

} // namespace kb::sequencer
