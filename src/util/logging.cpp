#include <rdbcpp_util/logging.h>
#include <rdbcpp_util/config.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <filesystem>
#include <mutex>
#include <vector>

namespace util {

std::shared_ptr<spdlog::logger> Logging::logger_;

namespace {
// Guards logger_; get() may race with the first init from several threads
std::mutex g_loggingMutex;
}

spdlog::level::level_enum Logging::parseLevel(const std::string& level) {
    if (level == "trace") return spdlog::level::trace;
    if (level == "debug") return spdlog::level::debug;
    if (level == "warn") return spdlog::level::warn;
    if (level == "error") return spdlog::level::err;
    if (level == "critical") return spdlog::level::critical;
    if (level == "off") return spdlog::level::off;
    return spdlog::level::info;
}

void Logging::init(const std::string& level,
                   bool console,
                   bool file,
                   const std::string& filePath,
                   size_t maxSizeMb,
                   size_t maxFiles) {
    std::lock_guard<std::mutex> lock(g_loggingMutex);
    initLocked(level, console, file, filePath, maxSizeMb, maxFiles);
}

void Logging::initLocked(const std::string& level,
                         bool console,
                         bool file,
                         const std::string& filePath,
                         size_t maxSizeMb,
                         size_t maxFiles) {
    // Idempotent: an existing logger only gets its level updated
    if (auto existing = spdlog::get(kLoggerName)) {
        existing->set_level(parseLevel(level));
        logger_ = existing;
        return;
    }

    std::vector<spdlog::sink_ptr> sinks;

    if (console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }

    if (file) {
        std::filesystem::path logPath(filePath);
        if (logPath.has_parent_path()) {
            std::filesystem::create_directories(logPath.parent_path());
        }

        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            filePath, maxSizeMb * 1024 * 1024, maxFiles));
    }

    logger_ = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
    logger_->set_level(parseLevel(level));
    logger_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");

    spdlog::register_logger(logger_);
}

void Logging::initFromConfig() {
    const auto& cfg = Config::logging();
    init(cfg.level, cfg.console, cfg.file, cfg.filePath,
         cfg.rotateMaxSizeMb, cfg.rotateMaxFiles);
}

std::shared_ptr<spdlog::logger> Logging::get() {
    std::lock_guard<std::mutex> lock(g_loggingMutex);
    if (!logger_) {
        initLocked("info", true, false, "logs/rdbcpp.log", 5, 3);
    }
    return logger_;
}

void Logging::shutdown() {
    std::lock_guard<std::mutex> lock(g_loggingMutex);
    if (logger_) {
        spdlog::drop(kLoggerName);
        logger_.reset();
    }
}

}  // namespace util
