#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace util {

class Logging {
public:
    static void init(const std::string& level = "info",
                     bool console = true,
                     bool file = false,
                     const std::string& filePath = "logs/rdbcpp.log",
                     size_t maxSizeMb = 5,
                     size_t maxFiles = 3);

    // Initialize from util::Config::logging()
    static void initFromConfig();

    static std::shared_ptr<spdlog::logger> get();

    // Shutdown logging (useful for tests)
    static void shutdown();

    static constexpr const char* kLoggerName = "rdbcpp";

private:
    static spdlog::level::level_enum parseLevel(const std::string& level);

    static void initLocked(const std::string& level, bool console, bool file,
                           const std::string& filePath, size_t maxSizeMb, size_t maxFiles);

    static std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace util
