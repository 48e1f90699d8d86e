/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

// Public entry point for embedding the renderer

#include "core/canvas.hpp"
#include "core/image_loader.hpp"
#include "core/logger.hpp"
#include "io/formats/render_project.hpp"
#include "io/image_decoder.hpp"
#include "io/preview_overlay.hpp"
#include "io/video/video_file_sink.hpp"
#include "rendering/frame_sampler.hpp"
#include "rendering/frame_sink.hpp"
#include "rendering/ken_burns_sequence.hpp"
#include "rendering/render_config.hpp"
#include "rendering/render_error.hpp"
#include "sequencer/interpolation.hpp"
#include "sequencer/time_warp.hpp"

#define KB_VERSION_MAJOR 1
#define KB_VERSION_MINOR 0
#define KB_VERSION_PATCH 0
