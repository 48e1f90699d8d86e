/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "ken_burns_sequence.hpp"
#include "core/logger.hpp"
#include "frame_sampler.hpp"
#include "sample_density.hpp"
#include <algorithm>
#include <cmath>
#include <exception>
#include <future>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace kb::rendering {

    namespace {
        // Aborts the sink unless the render reached close()
        class SinkGuard {
        public:
            explicit SinkGuard(IFrameSink& sink) : sink_(sink) {}
            ~SinkGuard() {
                if (armed_) {
                    sink_.abort();
                }
            }
            SinkGuard(const SinkGuard&) = delete;
            SinkGuard& operator=(const SinkGuard&) = delete;

            void release() { armed_ = false; }

        private:
            IFrameSink& sink_;
            bool armed_ = true;
        };
    } // namespace

    const char* renderStateName(const RenderState state) {
        switch (state) {
            case RenderState::UNVALIDATED: return "unvalidated";
            case RenderState::RENDERING: return "rendering";
            case RenderState::DONE: return "done";
            case RenderState::FAILED: return "failed";
        }
        return "unknown";
    }

    KenBurnsSequence::KenBurnsSequence(RenderConfig config)
        : config_(std::move(config)) {}

    RenderConfig& KenBurnsSequence::mutableConfig() {
        if (state_ == RenderState::RENDERING) {
            throw std::logic_error("Render configuration is frozen while rendering");
        }
        state_ = RenderState::UNVALIDATED;
        return config_;
    }

    void KenBurnsSequence::setConfig(RenderConfig config) {
        mutableConfig() = std::move(config);
    }

    std::expected<void, RenderError> KenBurnsSequence::validate() const {
        return validateConfig(config_);
    }

    int KenBurnsSequence::frameCount() const {
        return sequencer::frameCount(config_.duration, config_.frame_rate);
    }

    double KenBurnsSequence::baseScale() const {
        return rendering::baseScale(config_.canvas.height(), config_.canvas.width(), config_.frame_size);
    }

    sequencer::RectSchedule KenBurnsSequence::schedule() const {
        return makeSchedule(config_);
    }

    sequencer::PreviewRange KenBurnsSequence::previewRects(const int sample_count) const {
        return {makeSchedule(config_), sample_count};
    }

    void KenBurnsSequence::warnIfDeprecated() const {
        if (const ResamplingStrategy strategy = strategyOf(config_.method); isDeprecated(strategy)) {
            LOG_WARN("Resampling strategy '{}' is deprecated, use '{}'",
                     strategyName(strategy), strategyName(ResamplingStrategy::GRIDDED_INTERPOLATION));
        }
    }

    KenBurnsSequence::FrameJob KenBurnsSequence::prepareFrame(const sequencer::RectSchedule& schedule,
                                                              const int index, const double base_scale) {
        FrameJob job;
        job.index = index;
        job.rect = sequencer::interpolateRect(schedule, index);
        job.spacing = sampleSpacing(job.rect, config_.frame_size, base_scale);
        // Only the gridded interpolant reads the low-passed canvas
        if (config_.antialias && std::holds_alternative<GriddedSampling>(config_.method) &&
            std::isfinite(job.spacing) && job.spacing > 1.0) {
            job.filtered = prefilter_cache_.acquire(config_.canvas, job.spacing, config_.filter_kernel_size);
        }
        return job;
    }

    std::expected<core::Canvas, RenderError> KenBurnsSequence::sampleJob(const FrameJob& job,
                                                                         const double base_scale) const {
        const core::Canvas& source = job.filtered ? *job.filtered : config_.canvas;
        auto frame = sampleFrame(source, job.rect, config_.frame_size, config_.method, base_scale,
                                 config_.edge_policy);
        if (!frame) {
            return std::unexpected(RenderError::sampling(
                "frame " + std::to_string(job.index), frame.error()));
        }
        return std::move(*frame);
    }

    std::expected<core::Canvas, RenderError> KenBurnsSequence::renderFrame(const int frame_index) {
        if (state_ == RenderState::RENDERING) {
            throw std::logic_error("renderFrame() called during a render");
        }
        if (auto valid = validate(); !valid) {
            return std::unexpected(valid.error());
        }
        const int frames = frameCount();
        if (frame_index < 0 || frame_index >= frames) {
            return std::unexpected(RenderError::configuration(
                "frame_index", std::to_string(frame_index) + " outside [0, " + std::to_string(frames) + ")"));
        }
        const double base_scale = baseScale();
        prefilter_cache_.setEnabled(config_.cache_prefilter);
        const FrameJob job = prepareFrame(schedule(), frame_index, base_scale);
        return sampleJob(job, base_scale);
    }

    std::expected<RenderSummary, RenderError> KenBurnsSequence::render(IFrameSink& sink) {
        if (state_ == RenderState::RENDERING) {
            throw std::logic_error("render() is already in progress");
        }
        state_ = RenderState::UNVALIDATED;

        if (auto valid = validate(); !valid) {
            state_ = RenderState::FAILED;
            LOG_ERROR("{}", valid.error().format());
            return std::unexpected(valid.error());
        }
        warnIfDeprecated();

        state_ = RenderState::RENDERING;
        prefilter_cache_.clear();
        prefilter_cache_.setEnabled(config_.cache_prefilter);

        std::expected<RenderSummary, RenderError> result;
        try {
            result = renderFrames(sink);
        } catch (const std::exception& e) {
            result = std::unexpected(RenderError::sampling("render", e.what()));
        }
        prefilter_cache_.clear();

        if (!result) {
            state_ = RenderState::FAILED;
            LOG_ERROR("{}", result.error().format());
            return result;
        }
        state_ = RenderState::DONE;
        return result;
    }

    std::expected<RenderSummary, RenderError> KenBurnsSequence::renderFrames(IFrameSink& sink) {
        const sequencer::RectSchedule rect_schedule = schedule();
        const int frames = rect_schedule.frame_count;
        const double base_scale = baseScale();
        const int batch_size = std::max(1, config_.worker_threads);

        const FrameFormat format{config_.frame_size.height, config_.frame_size.width,
                                 config_.canvas.channels(), config_.frame_rate};
        if (auto opened = sink.open(format); !opened) {
            return std::unexpected(RenderError::sink("open", opened.error()));
        }
        SinkGuard guard(sink);

        LOG_INFO("Total frames: {} ({}x{} @ {} fps, {} sampling, antialias {})",
                 frames, format.width, format.height, format.frame_rate,
                 strategyName(strategyOf(config_.method)), config_.antialias ? "on" : "off");

        std::vector<FrameJob> jobs;
        std::vector<std::expected<core::Canvas, RenderError>> batch;
        jobs.reserve(static_cast<size_t>(batch_size));
        batch.reserve(static_cast<size_t>(batch_size));

        for (int first = 0; first < frames; first += batch_size) {
            const int last = std::min(frames, first + batch_size);

            // Only this thread touches the prefilter cache; workers get snapshots
            jobs.clear();
            for (int i = first; i < last; ++i) {
                jobs.push_back(prepareFrame(rect_schedule, i, base_scale));
            }

            batch.clear();
            if (jobs.size() == 1) {
                batch.push_back(sampleJob(jobs.front(), base_scale));
            } else {
                std::vector<std::future<std::expected<core::Canvas, RenderError>>> pending;
                pending.reserve(jobs.size());
                for (const FrameJob& job : jobs) {
                    pending.push_back(std::async(std::launch::async, [this, &job, base_scale]() {
                        return sampleJob(job, base_scale);
                    }));
                }
                for (auto& future : pending) {
                    batch.push_back(future.get());
                }
            }

            for (size_t k = 0; k < batch.size(); ++k) {
                const FrameJob& job = jobs[k];
                if (!batch[k]) {
                    return std::unexpected(batch[k].error());
                }
                LOG_DEBUG("Frame {}/{}: rect ({:.2f}, {:.2f}, {:.3f}), spacing {:.3f}{}",
                          job.index + 1, frames, job.rect.x, job.rect.y, job.rect.scale, job.spacing,
                          job.filtered ? ", prefiltered" : "");
                if (auto written = sink.writeFrame(*batch[k]); !written) {
                    return std::unexpected(RenderError::sink(
                        "writeFrame " + std::to_string(job.index), written.error()));
                }
                if (config_.progress_callback) {
                    config_.progress_callback(job.index + 1, frames);
                }
            }
        }

        if (auto closed = sink.close(); !closed) {
            return std::unexpected(RenderError::sink("close", closed.error()));
        }
        guard.release();

        RenderSummary summary;
        summary.frame_count = frames;
        summary.base_scale = base_scale;
        summary.prefilter_passes = prefilter_cache_.misses();
        summary.prefilter_reuses = prefilter_cache_.hits();
        LOG_INFO("done: {} frames", frames);
        return summary;
    }

} // namespace kb::rendering
