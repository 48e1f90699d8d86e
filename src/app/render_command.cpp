/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "app/render_command.hpp"
#include "core/image_loader.hpp"
#include "io/formats/render_project.hpp"
#include "io/image_decoder.hpp"
#include "io/preview_overlay.hpp"
#include "io/video/video_file_sink.hpp"
#include "rendering/ken_burns_sequence.hpp"
#include <utility>

namespace kb::app {

    namespace {
        std::filesystem::path preview_path(const io::RenderProject& project) {
            if (!project.preview.empty()) {
                return project.preview;
            }
            return std::filesystem::path(project.output).replace_extension(".png");
        }
    } // namespace

    std::string usage(const std::string_view program) {
        return "Usage: " + std::string(program) +
               " <project.json> [--preview-only] [--verbose] [--log-level <level>]\n"
               "  --preview-only       draw the viewport overlay PNG and skip the video\n"
               "  --verbose            same as --log-level debug\n"
               "  --log-level <level>  trace, debug, info, warn, error or off\n";
    }

    std::expected<RenderCommandOptions, std::string> parse_command_line(const std::span<const char* const> args) {
        RenderCommandOptions options;
        for (size_t i = 1; i < args.size(); ++i) {
            const std::string_view arg = args[i];
            if (arg == "--help" || arg == "-h") {
                options.show_help = true;
            } else if (arg == "--preview-only") {
                options.preview_only = true;
            } else if (arg == "--verbose" || arg == "-v") {
                options.log_level = core::LogLevel::Debug;
            } else if (arg == "--log-level") {
                if (i + 1 >= args.size()) {
                    return std::unexpected("--log-level needs a value");
                }
                const std::string_view name = args[++i];
                if (!core::parseLogLevel(name, options.log_level)) {
                    return std::unexpected("Unknown log level '" + std::string(name) + "'");
                }
            } else if (arg.starts_with("-")) {
                return std::unexpected("Unknown option '" + std::string(arg) + "'");
            } else if (options.project_path.empty()) {
                options.project_path = arg;
            } else {
                return std::unexpected("Unexpected argument '" + std::string(arg) + "'");
            }
        }
        if (options.project_path.empty() && !options.show_help) {
            return std::unexpected("Missing project file");
        }
        return options;
    }

    int run_render(const RenderCommandOptions& options) {
        core::Logger::get().init(options.log_level);

        if (!core::has_image_loader()) {
            io::install_ffmpeg_image_loader();
        }

        auto project = io::load_render_project(options.project_path);
        if (!project) {
            LOG_ERROR("{}", project.error().format());
            return 1;
        }

        auto canvas = core::load_image({project->image, project->image_scale});
        if (!canvas) {
            LOG_ERROR("Failed to load image: {}", canvas.error());
            return 1;
        }
        LOG_INFO("Canvas {}x{} ({} channel{})", canvas->width(), canvas->height(), canvas->channels(),
                 canvas->channels() == 1 ? "" : "s");

        rendering::KenBurnsSequence sequence(io::make_render_config(*project, std::move(*canvas)));
        if (auto valid = sequence.validate(); !valid) {
            LOG_ERROR("{}", valid.error().format());
            return 1;
        }

        if (options.preview_only || !project->preview.empty()) {
            const auto preview = sequence.previewRects(project->preview_samples);
            if (auto written = io::write_preview_overlay(preview_path(*project), sequence.config().canvas,
                                                         preview, sequence.config().frame_size,
                                                         sequence.baseScale());
                !written) {
                LOG_ERROR("{}", written.error());
                return 1;
            }
        }
        if (options.preview_only) {
            return 0;
        }

        io::video::VideoFileSink sink(project->output, project->crf);
        const auto summary = sequence.render(sink);
        if (!summary) {
            // render() already logged the failure
            return 1;
        }
        LOG_INFO("Wrote {} ({} frames, {} prefilter passes, {} reused)", project->output.string(),
                 summary->frame_count, summary->prefilter_passes, summary->prefilter_reuses);
        return 0;
    }

} // namespace kb::app
