#pragma once

#include "rdbcpp/core/parameter.hpp"
#include "rdbcpp/core/types.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rdbcpp {
namespace core {

/**
 * Interfaces a database driver implements for the client.
 *
 * Drivers report failures by throwing; the client wraps them into
 * ExecutionFailed at the point where results are consumed.
 */

enum class IsolationLevel {
    Default,
    ReadUncommitted,
    ReadCommitted,
    RepeatableRead,
    Serializable
};

std::string_view toString(IsolationLevel level) noexcept;

/** @throws InvalidSpecification for an unknown name */
IsolationLevel parseIsolationLevel(const std::string& name);

struct ColumnMetadata {
    std::string name;
    size_t index = 0;
    SqlType type = SqlType::Text;
    bool nullable = true;
};

using RawRow = std::vector<Field>;

class Cursor {
public:
    virtual ~Cursor() = default;

    /** @brief Next row, or std::nullopt once the cursor is exhausted */
    virtual std::optional<RawRow> next() = 0;

    virtual const std::vector<ColumnMetadata>& columns() const = 0;

    /** @brief Rows affected by a DML statement; 0 for queries */
    virtual std::uint64_t affectedRows() const = 0;

    /** @brief Release driver resources; further next() calls return nullopt */
    virtual void close() = 0;
};

class TransactionHandle {
public:
    virtual ~TransactionHandle() = default;

    virtual void commit() = 0;
    virtual void rollback() = 0;

    /** @brief Free the handle; called exactly once, after commit or rollback */
    virtual void release() noexcept = 0;
};

class Connection {
public:
    virtual ~Connection() = default;

    /**
     * @brief Execute one statement
     *
     * Inside an open transaction the statement joins it; otherwise the driver
     * commits it on its own once the cursor completes or is closed.
     */
    virtual std::unique_ptr<Cursor> executeStatement(const std::string& sql, const Bindings& bindings) = 0;

    virtual std::unique_ptr<TransactionHandle> beginTransaction(IsolationLevel isolation, bool readOnly) = 0;
};

class ConnectionProvider {
public:
    virtual ~ConnectionProvider() = default;

    virtual std::shared_ptr<Connection> acquire() = 0;
    virtual void release(std::shared_ptr<Connection> connection) noexcept = 0;
};

/**
 * @brief Returns its connection to the provider on destruction
 */
class ConnectionLease {
public:
    ConnectionLease() = default;
    ConnectionLease(std::shared_ptr<ConnectionProvider> provider, std::shared_ptr<Connection> connection)
        : provider_(std::move(provider)), connection_(std::move(connection)) {}

    ~ConnectionLease() { reset(); }

    ConnectionLease(const ConnectionLease&) = delete;
    ConnectionLease& operator=(const ConnectionLease&) = delete;

    ConnectionLease(ConnectionLease&& other) noexcept
        : provider_(std::move(other.provider_)), connection_(std::move(other.connection_)) {}

    ConnectionLease& operator=(ConnectionLease&& other) noexcept {
        if (this != &other) {
            reset();
            provider_ = std::move(other.provider_);
            connection_ = std::move(other.connection_);
        }
        return *this;
    }

    static ConnectionLease acquire(std::shared_ptr<ConnectionProvider> provider) {
        auto connection = provider->acquire();
        return ConnectionLease(std::move(provider), std::move(connection));
    }

    Connection* operator->() const noexcept { return connection_.get(); }
    Connection& operator*() const noexcept { return *connection_; }
    Connection* get() const noexcept { return connection_.get(); }
    explicit operator bool() const noexcept { return static_cast<bool>(connection_); }

    void reset() noexcept {
        if (provider_ && connection_) {
            provider_->release(std::move(connection_));
        }
        provider_.reset();
        connection_.reset();
    }

private:
    std::shared_ptr<ConnectionProvider> provider_;
    std::shared_ptr<Connection> connection_;
};

} // namespace core
} // namespace rdbcpp
