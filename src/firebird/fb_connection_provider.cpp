#include "rdbcpp/firebird/connection_provider.hpp"
#include "rdbcpp_util/config.h"
#include "rdbcpp_util/logging.h"

namespace rdbcpp {
namespace firebird {

FirebirdConnectionProvider::FirebirdConnectionProvider(ConnectionParams params, size_t maxIdle)
    : params_(std::move(params))
    , maxIdle_(maxIdle) {
}

std::shared_ptr<FirebirdConnectionProvider> FirebirdConnectionProvider::fromConfig() {
    return std::make_shared<FirebirdConnectionProvider>(ConnectionParams::fromConfig(),
                                                        util::Config::client().poolMaxIdle);
}

std::shared_ptr<core::Connection> FirebirdConnectionProvider::acquire() {
    auto logger = util::Logging::get();

    while (true) {
        std::shared_ptr<FirebirdConnection> candidate;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (idle_.empty()) {
                break;
            }
            candidate = std::move(idle_.front());
            idle_.pop_front();
        }

        // ping outside the lock
        if (candidate->isConnected()) {
            std::lock_guard<std::mutex> lock(mutex_);
            ++stats_.reused;
            ++stats_.leased;
            if (logger) logger->debug("Reusing pooled connection to {}", params_.database);
            return candidate;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        ++stats_.discarded;
        if (logger) logger->warn("Discarding dead pooled connection to {}", params_.database);
    }

    auto connection = std::make_shared<FirebirdConnection>(params_);

    std::lock_guard<std::mutex> lock(mutex_);
    ++stats_.created;
    ++stats_.leased;
    return connection;
}

void FirebirdConnectionProvider::release(std::shared_ptr<core::Connection> connection) noexcept {
    if (!connection) {
        return;
    }

    auto firebirdConnection = std::dynamic_pointer_cast<FirebirdConnection>(connection);
    auto logger = util::Logging::get();

    std::lock_guard<std::mutex> lock(mutex_);
    if (stats_.leased > 0) {
        --stats_.leased;
    }

    if (!firebirdConnection || firebirdConnection->inTransaction() || idle_.size() >= maxIdle_) {
        ++stats_.discarded;
        if (logger) logger->debug("Closing released connection (pool full or transaction open)");
        return;
    }

    idle_.push_back(std::move(firebirdConnection));
}

FirebirdConnectionProvider::Statistics FirebirdConnectionProvider::getStatistics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    Statistics stats = stats_;
    stats.idle = idle_.size();
    return stats;
}

void FirebirdConnectionProvider::clear() {
    std::deque<std::shared_ptr<FirebirdConnection>> drained;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        drained.swap(idle_);
    }
}

} // namespace firebird
} // namespace rdbcpp
