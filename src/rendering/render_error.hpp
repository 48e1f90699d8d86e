/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/export.hpp"
#include <cstdint>
#include <string>
#include <utility>

namespace kb::rendering {

    enum class RenderErrorKind : uint8_t {
        CONFIGURATION, // rejected before the sink is opened
        SAMPLING,      // a frame could not be produced
        SINK           // the frame sink failed to open, accept or close
    };

    [[nodiscard]] KB_RENDERING_API const char* errorKindName(RenderErrorKind kind);

    struct KB_RENDERING_API RenderError {
        RenderErrorKind kind = RenderErrorKind::CONFIGURATION;
        std::string field; // offending setting or sink operation
        std::string message;

        [[nodiscard]] std::string format() const;

        [[nodiscard]] static RenderError configuration(std::string field, std::string message) {
            return {RenderErrorKind::CONFIGURATION, std::move(field), std::move(message)};
        }
        [[nodiscard]] static RenderError sampling(std::string field, std::string message) {
            return {RenderErrorKind::SAMPLING, std::move(field), std::move(message)};
        }
        [[nodiscard]] static RenderError sink(std::string field, std::string message) {
            return {RenderErrorKind::SINK, std::move(field), std::move(message)};
        }
    };

} // namespace kb::rendering
