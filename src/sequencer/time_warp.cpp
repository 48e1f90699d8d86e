/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "time_warp.hpp"
#include <cmath>
#include <numbers>
#include <utility>

namespace kb::sequencer {

    double applyWarpCurve(const double t, const WarpCurve curve) {
        switch (curve) {
            case WarpCurve::LINEAR:
                return t;
            case WarpCurve::SINE:
                return std::sin(std::numbers::pi / 2.0 * t);
            case WarpCurve::COSINE:
                return 0.5 - 0.5 * std::cos(std::numbers::pi * t);
            case WarpCurve::BACK_FORTH:
                return t < 0.5 ? 2.0 * t : 2.0 - 2.0 * t;
            case WarpCurve::EASE_IN:
                return t * t;
            case WarpCurve::EASE_OUT:
                return t * (2.0 - t);
            case WarpCurve::EASE_IN_OUT:
                return t < 0.5
                    ? 2.0 * t * t
                    : -1.0 + (4.0 - 2.0 * t) * t;
        }
        return t;
    }

    TimeWarp makeTimeWarp(const WarpCurve curve) {
        return [curve](const double t) { return applyWarpCurve(t, curve); };
    }

    TimeWarp compose(TimeWarp outer, TimeWarp inner) {
        return [outer = std::move(outer), inner = std::move(inner)](const double t) {
            return outer(inner(t));
        };
    }

    const char* warpCurveName(const WarpCurve curve) {
        switch (curve) {
            case WarpCurve::LINEAR: return "linear";
            case WarpCurve::SINE: return "sine";
            case WarpCurve::COSINE: return "cosine";
            case WarpCurve::BACK_FORTH: return "back_forth";
            case WarpCurve::EASE_IN: return "ease_in";
            case WarpCurve::EASE_OUT: return "ease_out";
            case WarpCurve::EASE_IN_OUT: return "ease_in_out";
        }
        return "linear";
    }

    std::optional<WarpCurve> parseWarpCurve(const std::string_view name) {
        for (const WarpCurve curve : {WarpCurve::LINEAR, WarpCurve::SINE, WarpCurve::COSINE,
                                      WarpCurve::BACK_FORTH, WarpCurve::EASE_IN, WarpCurve::EASE_OUT,
                                      WarpCurve::EASE_IN_OUT}) {
            if (name == warpCurveName(curve)) {
                return curve;
            }
        }
        return std::nullopt;
    }

} // namespace kb::sequencer
