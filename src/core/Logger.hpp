/**
 * @file Logger.hpp
 * @brief Logging wrapper around spdlog.
 *
 * Owns the process logger: a coloured console sink and a rotating file under
 * the cache directory. Falls back to console-only output when the log file
 * cannot be opened. User commands report their outcome through
 * Logger::command().
 *
 * @section Dependencies
 * - spdlog
 *
 * @section Patterns
 * - Wrapper: Simplifies spdlog usage.
 */

#pragma once
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <filesystem>
#include <memory>
#include <string_view>
#include "util/Result.hpp"

namespace lrc {

class Logger {
public:
    static constexpr std::size_t kMaxFileSize = 5 * 1024 * 1024;
    static constexpr std::size_t kMaxFiles = 3;

    static void init(std::string_view appName = "lrcsync", bool debug = false);
    static void shutdown();

    static std::shared_ptr<spdlog::logger>& get();

    static void setDebug(bool debug);

    // Empty when only the console sink is active
    static const std::filesystem::path& logFile() {
        return logFile_;
    }

    // "<command>: ok" at debug, "<command>: <CODE> <message>" at warn
    template <typename T>
    static void command(std::string_view name, const Result<T>& result) {
        if (result)
            get()->debug("{}: ok", name);
        else
            get()->warn("{}: {} {}",
                        name,
                        errorCodeName(result.error().code),
                        result.error().message);
    }

    static void command(std::string_view name, std::string_view detail) {
        get()->debug("{}: {}", name, detail);
    }

private:
    static std::shared_ptr<spdlog::logger> logger_;
    static std::filesystem::path logFile_;
};

// Use these instead of calling Logger::get() directly

#define LOG_TRACE(...) SPDLOG_LOGGER_TRACE(lrc::Logger::get(), __VA_ARGS__)
#define LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(lrc::Logger::get(), __VA_ARGS__)
#define LOG_INFO(...) SPDLOG_LOGGER_INFO(lrc::Logger::get(), __VA_ARGS__)
#define LOG_WARN(...) SPDLOG_LOGGER_WARN(lrc::Logger::get(), __VA_ARGS__)
#define LOG_ERROR(...) SPDLOG_LOGGER_ERROR(lrc::Logger::get(), __VA_ARGS__)
#define LOG_CRITICAL(...) SPDLOG_LOGGER_CRITICAL(lrc::Logger::get(), __VA_ARGS__)

} // namespace lrc
