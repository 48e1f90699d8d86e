/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "render_error.hpp"

namespace kb::rendering {

    const char* errorKindName(const RenderErrorKind kind) {
        switch (kind) {
            case RenderErrorKind::CONFIGURATION: return "configuration error";
            case RenderErrorKind::SAMPLING: return "sampling error";
            case RenderErrorKind::SINK: return "sink error";
        }
        return "error";
    }

    std::string RenderError::format() const {
        std::string text = errorKindName(kind);
        if (!field.empty()) {
            text += " [" + field + "]";
        }
        text += ": " + message;
        return text;
    }

} // namespace kb::rendering
