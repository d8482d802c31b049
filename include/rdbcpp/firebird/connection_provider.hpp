#pragma once

#include "rdbcpp/firebird/connection.hpp"
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>

namespace rdbcpp {
namespace firebird {

/**
 * Hands out Firebird connections and keeps up to maxIdle released ones for reuse.
 *
 * Released connections that still have an open transaction or no longer
 * answer a ping are dropped instead of pooled.
 */
class FirebirdConnectionProvider : public core::ConnectionProvider {
public:
    struct Statistics {
        size_t created = 0;
        size_t reused = 0;
        size_t discarded = 0;
        size_t leased = 0;
        size_t idle = 0;
    };

    FirebirdConnectionProvider(ConnectionParams params, size_t maxIdle);

    // Parameters from util::Config::db(), pool size from util::Config::client()
    static std::shared_ptr<FirebirdConnectionProvider> fromConfig();

    std::shared_ptr<core::Connection> acquire() override;
    void release(std::shared_ptr<core::Connection> connection) noexcept override;

    Statistics getStatistics() const;
    const ConnectionParams& getParams() const noexcept { return params_; }

    // Drops all idle connections
    void clear();

private:
    ConnectionParams params_;
    size_t maxIdle_;

    mutable std::mutex mutex_;
    std::deque<std::shared_ptr<FirebirdConnection>> idle_;
    Statistics stats_;
};

} // namespace firebird
} // namespace rdbcpp
