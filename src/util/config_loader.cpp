#include <rdbcpp_util/config_loader.h>
#include <rdbcpp_util/logging.h>
#include <cstdlib>

#ifdef _WIN32
#include <windows.h>
#else
#include <unistd.h>
#include <pwd.h>
#include <climits>
#endif

namespace fs = std::filesystem;

namespace util {

std::vector<fs::path> ConfigLoader::customPaths_;

namespace {

std::string homeDirectory() {
#ifdef _WIN32
    const char* home = std::getenv("USERPROFILE");
#else
    const char* home = std::getenv("HOME");
    if (!home) {
        struct passwd* pw = getpwuid(getuid());
        if (pw) home = pw->pw_dir;
    }
#endif
    return home ? std::string(home) : std::string();
}

} // namespace

std::string ConfigLoader::findConfigFile(const std::string& filename) {
    auto logger = Logging::get();
    const auto paths = getSearchPaths();

    for (const auto& dir : paths) {
        std::error_code ec;
        auto candidate = dir / filename;
        if (fs::is_regular_file(candidate, ec)) {
            logger->debug("ConfigLoader: using {}", candidate.string());
            return candidate.string();
        }
    }

    logger->warn("ConfigLoader: '{}' not found in {} search paths", filename, paths.size());
    for (const auto& dir : paths) {
        logger->debug("ConfigLoader:   searched {}", dir.string());
    }
    return "";
}

std::vector<fs::path> ConfigLoader::getSearchPaths() {
    std::vector<fs::path> paths(customPaths_.begin(), customPaths_.end());

    std::error_code ec;
    auto cwd = fs::current_path(ec);
    if (!ec) {
        paths.push_back(cwd);
    }

#ifdef __linux__
    char exePath[PATH_MAX];
    ssize_t len = readlink("/proc/self/exe", exePath, sizeof(exePath) - 1);
    if (len != -1) {
        exePath[len] = '\0';
        paths.push_back(fs::path(exePath).parent_path());
    }
#endif

#ifdef RDBCPP_BINARY_DIR
    paths.push_back(fs::path(RDBCPP_BINARY_DIR));
#endif

#ifdef RDBCPP_SOURCE_DIR
    paths.push_back(fs::path(RDBCPP_SOURCE_DIR) / "config");
#endif

    paths.push_back(fs::path("/etc/rdbcpp"));

    auto home = homeDirectory();
    if (!home.empty()) {
        paths.push_back(fs::path(home) / ".config" / "rdbcpp");
    }

    if (const char* configPath = std::getenv("RDBCPP_CONFIG_PATH")) {
        paths.push_back(fs::path(configPath));
    }

    return paths;
}

void ConfigLoader::addSearchPath(const fs::path& path) {
    customPaths_.push_back(path);
}

void ConfigLoader::clearSearchPaths() {
    customPaths_.clear();
}

} // namespace util
