#include "Logger.hpp"
#include <vector>
#include "util/FileUtils.hpp"

namespace lrc {

std::shared_ptr<spdlog::logger> Logger::logger_;
std::filesystem::path Logger::logFile_;

namespace {
spdlog::level::level_enum levelFor(bool debug) {
    return debug ? spdlog::level::debug : spdlog::level::info;
}

void applyLevel(spdlog::logger& logger, bool debug) {
    logger.set_level(levelFor(debug));
    // Warnings carry command failures; keep them on disk even at info level
    logger.flush_on(debug ? spdlog::level::debug : spdlog::level::warn);
}
} // namespace

void Logger::init(std::string_view appName, bool debug) {
    std::string name(appName);
    spdlog::drop(name);
    logFile_.clear();

    std::vector<spdlog::sink_ptr> sinks;
    auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console->set_pattern("%^[%H:%M:%S.%e] [%l]%$ %v");
    sinks.push_back(console);

    std::string fileError;
    try {
        auto dir = file::cacheDir() / "logs";
        file::ensureDir(dir);
        auto path = dir / (name + ".log");
        auto rotating = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                path.string(), kMaxFileSize, kMaxFiles);
        rotating->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%s:%#] %v");
        sinks.push_back(rotating);
        logFile_ = path;
    } catch (const spdlog::spdlog_ex& ex) {
        fileError = ex.what();
    } catch (const std::filesystem::filesystem_error& ex) {
        fileError = ex.what();
    }

    logger_ = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    applyLevel(*logger_, debug);
    spdlog::register_logger(logger_);
    spdlog::set_default_logger(logger_);

    if (!fileError.empty())
        logger_->warn("Logging to console only: {}", fileError);
    else
        LOG_DEBUG("Log file: {}", logFile_.string());
    LOG_INFO("Logger initialized. Debug mode: {}", debug);
}

void Logger::shutdown() {
    if (logger_)
        logger_->flush();
    logger_.reset();
    logFile_.clear();
    spdlog::shutdown();
}

std::shared_ptr<spdlog::logger>& Logger::get() {
    if (!logger_)
        init();
    return logger_;
}

void Logger::setDebug(bool debug) {
    applyLevel(*get(), debug);
}

} // namespace lrc
