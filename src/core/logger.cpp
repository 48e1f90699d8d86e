/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/logger.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>

namespace kb::core {

    namespace {
        spdlog::level::level_enum toSpdlog(const LogLevel level) {
            switch (level) {
                case LogLevel::Trace: return spdlog::level::trace;
                case LogLevel::Debug: return spdlog::level::debug;
                case LogLevel::Info: return spdlog::level::info;
                case LogLevel::Warn: return spdlog::level::warn;
                case LogLevel::Error: return spdlog::level::err;
                case LogLevel::Off: return spdlog::level::off;
            }
            return spdlog::level::info;
        }
    } // namespace

    Logger& Logger::get() {
        static Logger instance;
        return instance;
    }

    Logger::Logger()
        : logger_(std::make_shared<spdlog::logger>(
              "kenburns", std::make_shared<spdlog::sinks::stderr_color_sink_mt>())) {
        logger_->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
        logger_->set_level(toSpdlog(level_));
    }

    void Logger::init(const LogLevel level) {
        setLevel(level);
        logger_->flush_on(spdlog::level::warn);
    }

    void Logger::setLevel(const LogLevel level) {
        level_ = level;
        logger_->set_level(toSpdlog(level));
    }

    bool parseLogLevel(const std::string_view name, LogLevel& out) {
        if (name == "trace") {
            out = LogLevel::Trace;
        } else if (name == "debug") {
            out = LogLevel::Debug;
        } else if (name == "info") {
            out = LogLevel::Info;
        } else if (name == "warn") {
            out = LogLevel::Warn;
        } else if (name == "error") {
            out = LogLevel::Error;
        } else if (name == "off") {
            out = LogLevel::Off;
        } else {
            return false;
        }
        return true;
    }

} // namespace kb::core
