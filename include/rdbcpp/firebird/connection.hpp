#pragma once

#include "rdbcpp/firebird/environment.hpp"
#include "rdbcpp/core/driver.hpp"
#include <memory>
#include <string>

namespace rdbcpp {
namespace firebird {

struct ConnectionParams {
    std::string database;               // "server:path" or a local path
    std::string user = "SYSDBA";
    std::string password = "masterkey";
    std::string charset = "UTF8";
    std::string role;
    int sql_dialect = 3;

    // Built from util::Config::db()
    static ConnectionParams fromConfig();
};

/**
 * One Firebird attachment.
 *
 * At most one explicit transaction is open per connection. Statements issued
 * while it is open join it; otherwise each statement runs in an implicit
 * transaction that the connection commits after DML, or when the query
 * cursor is closed.
 * A connection is used by one thread at a time.
 */
class FirebirdConnection : public core::Connection,
                           public std::enable_shared_from_this<FirebirdConnection> {
public:
    explicit FirebirdConnection(const ConnectionParams& params);
    ~FirebirdConnection() override;

    FirebirdConnection(const FirebirdConnection&) = delete;
    FirebirdConnection& operator=(const FirebirdConnection&) = delete;

    std::unique_ptr<core::Cursor> executeStatement(const std::string& sql,
                                                   const core::Bindings& bindings) override;

    /** @throws FirebirdException when a transaction is already open on this connection */
    std::unique_ptr<core::TransactionHandle> beginTransaction(core::IsolationLevel isolation,
                                                              bool readOnly) override;

    // Runs DDL in its own transaction and commits it
    void executeDDL(const std::string& ddl);

    bool isConnected() const;
    bool inTransaction() const noexcept { return activeTransaction_ != nullptr; }

    Firebird::IAttachment* getAttachment() const { return attachment_; }
    const ConnectionParams& getParams() const noexcept { return params_; }

    static void createDatabase(const ConnectionParams& params);
    static bool databaseExists(const ConnectionParams& params);

private:
    friend class FirebirdTransactionHandle;

    Firebird::ThrowStatusWrapper& status() const {
        statusWrapper_.init();
        return statusWrapper_;
    }

    void connect();
    void disconnect() noexcept;
    Firebird::ITransaction* startTransaction(core::IsolationLevel isolation, bool readOnly);
    void transactionFinished(Firebird::ITransaction* transaction) noexcept;

    ConnectionParams params_;
    Firebird::IAttachment* attachment_ = nullptr;
    Firebird::ITransaction* activeTransaction_ = nullptr;
    Environment& env_;
    Firebird::IStatus* status_;
    mutable Firebird::ThrowStatusWrapper statusWrapper_{nullptr};
};

} // namespace firebird
} // namespace rdbcpp
