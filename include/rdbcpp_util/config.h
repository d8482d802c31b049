#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace util {

class Config {
public:
    struct DbConfig {
        std::string server = "localhost";
        std::string path = "/var/lib/firebird/data/rdbcpp.fdb";
        std::string user = "SYSDBA";
        std::string password = "masterkey";
        std::string charset = "UTF8";
        std::string role;
        int sqlDialect = 3;
    };

    struct LoggingConfig {
        std::string level = "info";
        bool console = true;
        bool file = false;
        std::string filePath = "logs/rdbcpp.log";
        size_t rotateMaxSizeMb = 5;
        size_t rotateMaxFiles = 3;
    };

    struct ClientConfig {
        std::string dialect = "firebird";            // firebird | postgres | ansi
        std::string defaultIsolation = "default";    // default | read_uncommitted | read_committed | repeatable_read | serializable
        bool defaultReadOnly = false;
        std::string rollbackFailurePrecedence = "rollback";  // rollback | original
        size_t poolMaxIdle = 4;
    };

    static bool load(const std::string& jsonPath);
    static void reset();

    static DbConfig& db() { return instance().db_; }
    static LoggingConfig& logging() { return instance().logging_; }
    static ClientConfig& client() { return instance().client_; }

private:
    Config() = default;
    static Config& instance();

    void loadFromEnv();
    void loadFromJson(const nlohmann::json& j);

    DbConfig db_;
    LoggingConfig logging_;
    ClientConfig client_;
};

}  // namespace util
