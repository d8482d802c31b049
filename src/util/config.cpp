#include <rdbcpp_util/config.h>
#include <fstream>
#include <cstdlib>

namespace util {

Config& Config::instance() {
    static Config cfg;
    return cfg;
}

bool Config::load(const std::string& jsonPath) {
    auto& cfg = instance();

    bool found = false;
    std::ifstream file(jsonPath);
    if (file.is_open()) {
        nlohmann::json j;
        file >> j;
        cfg.loadFromJson(j);
        found = true;
    }

    cfg.loadFromEnv();
    return found;
}

void Config::reset() {
    auto& cfg = instance();
    cfg.db_ = DbConfig{};
    cfg.logging_ = LoggingConfig{};
    cfg.client_ = ClientConfig{};
}

void Config::loadFromJson(const nlohmann::json& j) {
    if (j.contains("db")) {
        auto& jdb = j["db"];
        if (jdb.contains("server")) db_.server = jdb["server"];
        if (jdb.contains("path")) db_.path = jdb["path"];
        if (jdb.contains("user")) db_.user = jdb["user"];
        if (jdb.contains("password")) db_.password = jdb["password"];
        if (jdb.contains("charset")) db_.charset = jdb["charset"];
        if (jdb.contains("role")) db_.role = jdb["role"];
        if (jdb.contains("sql_dialect")) db_.sqlDialect = jdb["sql_dialect"];
    }

    if (j.contains("logging")) {
        auto& jlog = j["logging"];
        if (jlog.contains("level")) logging_.level = jlog["level"];
        if (jlog.contains("console")) logging_.console = jlog["console"];
        if (jlog.contains("file")) logging_.file = jlog["file"];
        if (jlog.contains("file_path")) logging_.filePath = jlog["file_path"];
        if (jlog.contains("rotate_max_size_mb")) logging_.rotateMaxSizeMb = jlog["rotate_max_size_mb"];
        if (jlog.contains("rotate_max_files")) logging_.rotateMaxFiles = jlog["rotate_max_files"];
    }

    if (j.contains("client")) {
        auto& jclient = j["client"];
        if (jclient.contains("dialect")) client_.dialect = jclient["dialect"];
        if (jclient.contains("default_isolation")) client_.defaultIsolation = jclient["default_isolation"];
        if (jclient.contains("default_read_only")) client_.defaultReadOnly = jclient["default_read_only"];
        if (jclient.contains("rollback_failure_precedence")) {
            client_.rollbackFailurePrecedence = jclient["rollback_failure_precedence"];
        }
        if (jclient.contains("pool_max_idle")) client_.poolMaxIdle = jclient["pool_max_idle"];
    }
}

void Config::loadFromEnv() {
    if (const char* val = std::getenv("RDBCPP_DB_SERVER")) db_.server = val;
    if (const char* val = std::getenv("RDBCPP_DB_PATH")) db_.path = val;
    if (const char* val = std::getenv("RDBCPP_DB_USER")) db_.user = val;
    if (const char* val = std::getenv("RDBCPP_DB_PASS")) db_.password = val;
    if (const char* val = std::getenv("RDBCPP_DB_CHARSET")) db_.charset = val;
    if (const char* val = std::getenv("RDBCPP_LOG_LEVEL")) logging_.level = val;
    if (const char* val = std::getenv("RDBCPP_DIALECT")) client_.dialect = val;
    if (const char* val = std::getenv("RDBCPP_POOL_MAX_IDLE")) {
        client_.poolMaxIdle = std::stoul(val);
    }
}

}  // namespace util
