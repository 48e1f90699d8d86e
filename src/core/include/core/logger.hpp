/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/export.hpp"
#include <cstdint>
#include <memory>
#include <spdlog/spdlog.h>
#include <string_view>

namespace kb::core {

    enum class LogLevel : uint8_t {
        Trace,
        Debug,
        Info,
        Warn,
        Error,
        Off
    };

    /// Process-wide logger. Writes to stderr so stdout stays free for tool output.
    class KB_CORE_API Logger {
    public:
        static Logger& get();

        void init(LogLevel level = LogLevel::Info);
        void setLevel(LogLevel level);

        [[nodiscard]] LogLevel level() const { return level_; }
        [[nodiscard]] spdlog::logger& logger() { return *logger_; }

        Logger(const Logger&) = delete;
        Logger& operator=(const Logger&) = delete;

    private:
        Logger();

        std::shared_ptr<spdlog::logger> logger_;
        LogLevel level_ = LogLevel::Info;
    };

    // Returns false for unknown names ("trace", "debug", "info", "warn", "error", "off")
    [[nodiscard]] KB_CORE_API bool parseLogLevel(std::string_view name, LogLevel& out);

} // namespace kb::core

#define KB_LOG_AT(lvl, ...)                                                              \
    ::kb::core::Logger::get().logger().log(                                              \
        ::spdlog::source_loc{__FILE__, __LINE__, static_cast<const char*>(__func__)}, \
        lvl, __VA_ARGS__)

#define LOG_TRACE(...) KB_LOG_AT(::spdlog::level::trace, __VA_ARGS__)
#define LOG_DEBUG(...) KB_LOG_AT(::spdlog::level::debug, __VA_ARGS__)
#define LOG_INFO(...)  KB_LOG_AT(::spdlog::level::info, __VA_ARGS__)
#define LOG_WARN(...)  KB_LOG_AT(::spdlog::level::warn, __VA_ARGS__)
#define LOG_ERROR(...) KB_LOG_AT(::spdlog::level::err, __VA_ARGS__)
