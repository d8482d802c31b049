#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace util {

/**
 * Locates client configuration files.
 *
 * Search order:
 * 1. Paths registered with addSearchPath()
 * 2. Current working directory
 * 3. Directory of the running executable
 * 4. Build directory root (RDBCPP_BINARY_DIR)
 * 5. Source config/ folder (RDBCPP_SOURCE_DIR)
 * 6. /etc/rdbcpp
 * 7. ~/.config/rdbcpp
 * 8. $RDBCPP_CONFIG_PATH
 */
class ConfigLoader {
public:
    /**
     * @param filename Config file name (e.g. "client_config.json")
     * @return Full path of the first match, empty string when nothing matched
     */
    static std::string findConfigFile(const std::string& filename);

    static std::vector<std::filesystem::path> getSearchPaths();

    static void addSearchPath(const std::filesystem::path& path);
    static void clearSearchPaths();

private:
    static std::vector<std::filesystem::path> customPaths_;
};

} // namespace util
