/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "render_project.hpp"
#include "core/logger.hpp"
#include <array>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace kb::io {

    using json = nlohmann::json;
    using rendering::RenderError;

    namespace {

        constexpr std::array KNOWN_KEYS = {
            "version", "image", "image_scale", "output", "duration", "frame_rate", "frame_size",
            "start_rect", "end_rect", "time_warp", "method", "interpolation", "antialias",
            "filter_kernel_size", "edge_policy", "cache_prefilter", "worker_threads", "crf",
            "preview", "preview_samples"};

        bool is_known_key(const std::string& key) {
            for (const char* known : KNOWN_KEYS) {
                if (key == known) return true;
            }
            return false;
        }

        std::filesystem::path resolve(const std::filesystem::path& base_dir, const std::string& value) {
            std::filesystem::path p(value);
            if (p.is_relative() && !base_dir.empty()) {
                return base_dir / p;
            }
            return p;
        }

        // [x, y, scale]
        sequencer::ViewRect json_to_rect(const json& j) {
            if (!j.is_array() || j.size() != 3) {
                throw std::invalid_argument("expected [x, y, scale]");
            }
            return {j[0].get<double>(), j[1].get<double>(), j[2].get<double>()};
        }

        json rect_to_json(const sequencer::ViewRect& r) {
            return json::array({r.x, r.y, r.scale});
        }

        sequencer::WarpCurve json_to_curve(const json& j) {
            const auto name = j.get<std::string>();
            const auto curve = sequencer::parseWarpCurve(name);
            if (!curve) {
                throw std::invalid_argument("unknown time warp '" + name + "'");
            }
            return *curve;
        }

    } // anonymous namespace

    const char* edge_policy_name(const rendering::EdgePolicy policy) {
        switch (policy) {
            case rendering::EdgePolicy::CLAMP: return "clamp";
            case rendering::EdgePolicy::STRICT: return "strict";
        }
        return "clamp";
    }

    std::optional<rendering::EdgePolicy> parse_edge_policy(const std::string_view name) {
        if (name == "clamp") return rendering::EdgePolicy::CLAMP;
        if (name == "strict") return rendering::EdgePolicy::STRICT;
        return std::nullopt;
    }

    std::expected<RenderProject, RenderError> parse_render_project(
        const std::string& json_text,
        const std::filesystem::path& base_dir) {

        json j;
        try {
            j = json::parse(json_text);
        } catch (const json::parse_error& e) {
            return std::unexpected(RenderError::configuration("project", e.what()));
        }
        if (!j.is_object()) {
            return std::unexpected(RenderError::configuration("project", "expected a JSON object"));
        }

        for (const auto& [key, value] : j.items()) {
            if (!is_known_key(key)) {
                LOG_WARN("Ignoring unknown project key '{}'", key);
            }
        }

        RenderProject project;
        std::string key;
        try {
            key = "image";
            if (!j.contains(key)) {
                return std::unexpected(RenderError::configuration(key, "missing source image"));
            }
            project.image = resolve(base_dir, j.at(key).get<std::string>());

            key = "image_scale";
            if (j.contains(key)) project.image_scale = j.at(key).get<float>();

            key = "output";
            if (j.contains(key)) {
                project.output = resolve(base_dir, j.at(key).get<std::string>());
            } else {
                project.output = std::filesystem::path(project.image).replace_extension(".mp4");
            }

            key = "duration";
            if (j.contains(key)) project.duration = j.at(key).get<double>();

            key = "frame_rate";
            if (j.contains(key)) project.frame_rate = j.at(key).get<double>();

            key = "frame_size";
            if (j.contains(key)) {
                const json& size = j.at(key);
                if (!size.is_array() || size.size() != 2) {
                    throw std::invalid_argument("expected [height, width]");
                }
                project.frame_size = {size[0].get<int>(), size[1].get<int>()};
            }

            key = "start_rect";
            if (j.contains(key)) project.start_rect = json_to_rect(j.at(key));

            key = "end_rect";
            if (j.contains(key)) project.end_rect = json_to_rect(j.at(key));

            key = "time_warp";
            if (j.contains(key)) {
                const json& warp = j.at(key);
                project.time_warp.clear();
                if (warp.is_array()) {
                    for (const auto& curve : warp) {
                        project.time_warp.push_back(json_to_curve(curve));
                    }
                    if (project.time_warp.empty()) {
                        throw std::invalid_argument("at least one curve required");
                    }
                } else {
                    project.time_warp.push_back(json_to_curve(warp));
                }
            }

            key = "method";
            if (j.contains(key)) {
                const auto name = j.at(key).get<std::string>();
                const auto strategy = rendering::parseStrategy(name);
                if (!strategy) {
                    throw std::invalid_argument("unknown resampling strategy '" + name + "'");
                }
                project.method = *strategy;
            }

            key = "interpolation";
            if (j.contains(key)) {
                const auto name = j.at(key).get<std::string>();
                const auto kernel = rendering::parseKernel(name);
                if (!kernel) {
                    throw std::invalid_argument("unknown interpolation kernel '" + name + "'");
                }
                project.interpolation = *kernel;
            }

            key = "antialias";
            if (j.contains(key)) project.antialias = j.at(key).get<bool>();

            key = "filter_kernel_size";
            if (j.contains(key)) project.filter_kernel_size = j.at(key).get<double>();

            key = "edge_policy";
            if (j.contains(key)) {
                const auto name = j.at(key).get<std::string>();
                const auto policy = parse_edge_policy(name);
                if (!policy) {
                    throw std::invalid_argument("unknown edge policy '" + name + "'");
                }
                project.edge_policy = *policy;
            }

            key = "cache_prefilter";
            if (j.contains(key)) project.cache_prefilter = j.at(key).get<bool>();

            key = "worker_threads";
            if (j.contains(key)) project.worker_threads = j.at(key).get<int>();

            key = "crf";
            if (j.contains(key)) project.crf = j.at(key).get<int>();

            key = "preview";
            if (j.contains(key)) project.preview = resolve(base_dir, j.at(key).get<std::string>());

            key = "preview_samples";
            if (j.contains(key)) project.preview_samples = j.at(key).get<int>();
        } catch (const json::exception& e) {
            return std::unexpected(RenderError::configuration(key, e.what()));
        } catch (const std::invalid_argument& e) {
            return std::unexpected(RenderError::configuration(key, e.what()));
        }

        return project;
    }

    std::expected<RenderProject, RenderError> load_render_project(const std::filesystem::path& path) {
        LOG_INFO("Loading render project: {}", path.string());

        std::ifstream file(path);
        if (!file) {
            return std::unexpected(RenderError::configuration("project", "cannot open " + path.string()));
        }
        std::ostringstream buffer;
        buffer << file.rdbuf();

        return parse_render_project(buffer.str(), path.parent_path());
    }

    std::string serialize_render_project(const RenderProject& project) {
        json j;
        j["version"] = RENDER_PROJECT_VERSION;
        j["image"] = project.image.generic_string();
        j["image_scale"] = project.image_scale;
        j["output"] = project.output.generic_string();
        j["duration"] = project.duration;
        j["frame_rate"] = project.frame_rate;
        j["frame_size"] = json::array({project.frame_size.height, project.frame_size.width});
        if (project.start_rect) j["start_rect"] = rect_to_json(*project.start_rect);
        if (project.end_rect) j["end_rect"] = rect_to_json(*project.end_rect);

        json warp = json::array();
        for (const auto curve : project.time_warp) {
            warp.push_back(sequencer::warpCurveName(curve));
        }
        j["time_warp"] = warp;

        j["method"] = rendering::strategyName(project.method);
        if (project.interpolation) j["interpolation"] = rendering::kernelName(*project.interpolation);
        j["antialias"] = project.antialias;
        j["filter_kernel_size"] = project.filter_kernel_size;
        j["edge_policy"] = edge_policy_name(project.edge_policy);
        j["cache_prefilter"] = project.cache_prefilter;
        j["worker_threads"] = project.worker_threads;
        j["crf"] = project.crf;
        if (!project.preview.empty()) j["preview"] = project.preview.generic_string();
        j["preview_samples"] = project.preview_samples;

        return j.dump(2);
    }

    std::expected<void, std::string> save_render_project(const std::filesystem::path& path,
                                                         const RenderProject& project) {
        LOG_INFO("Saving render project: {}", path.string());

        std::ofstream file(path, std::ios::trunc);
        if (!file) {
            return std::unexpected("Failed to open " + path.string() + " for writing");
        }
        file << serialize_render_project(project) << '\n';
        if (!file) {
            return std::unexpected("Failed to write " + path.string());
        }
        return {};
    }

    sequencer::TimeWarp compose_time_warp(const std::vector<sequencer::WarpCurve>& curves) {
        if (curves.empty()) {
            return sequencer::makeTimeWarp(sequencer::WarpCurve::LINEAR);
        }
        sequencer::TimeWarp warp = sequencer::makeTimeWarp(curves.back());
        for (auto it = curves.rbegin() + 1; it != curves.rend(); ++it) {
            warp = sequencer::compose(sequencer::makeTimeWarp(*it), std::move(warp));
        }
        return warp;
    }

    rendering::RenderConfig make_render_config(const RenderProject& project, core::Canvas canvas) {
        rendering::RenderConfig config = rendering::RenderConfig::forCanvas(std::move(canvas));
        config.duration = project.duration;
        config.frame_rate = project.frame_rate;
        config.frame_size = project.frame_size;
        if (project.start_rect) config.start_rect = *project.start_rect;
        if (project.end_rect) config.end_rect = *project.end_rect;
        config.time_warp = compose_time_warp(project.time_warp);
        config.method = rendering::makeSamplingMethod(project.method, project.interpolation);
        config.antialias = project.antialias;
        config.filter_kernel_size = project.filter_kernel_size;
        config.edge_policy = project.edge_policy;
        config.cache_prefilter = project.cache_prefilter;
        config.worker_threads = project.worker_threads;
        return config;
    }

} // namespace kb::io
