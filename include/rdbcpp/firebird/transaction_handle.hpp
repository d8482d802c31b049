#pragma once

#include "rdbcpp/firebird/connection.hpp"
#include <memory>

namespace rdbcpp {
namespace firebird {

/**
 * Explicit Firebird transaction opened by FirebirdConnection::beginTransaction.
 *
 * The handle keeps its connection alive; release() rolls back a transaction
 * that was neither committed nor rolled back.
 */
class FirebirdTransactionHandle : public core::TransactionHandle {
public:
    FirebirdTransactionHandle(std::shared_ptr<FirebirdConnection> connection,
                              Firebird::ITransaction* transaction);
    ~FirebirdTransactionHandle() override;

    FirebirdTransactionHandle(const FirebirdTransactionHandle&) = delete;
    FirebirdTransactionHandle& operator=(const FirebirdTransactionHandle&) = delete;

    void commit() override;
    void rollback() override;
    void release() noexcept override;

    bool isActive() const noexcept { return transaction_ != nullptr; }

private:
    Firebird::ThrowStatusWrapper& status() const {
        statusWrapper_.init();
        return statusWrapper_;
    }

    std::shared_ptr<FirebirdConnection> connection_;
    Firebird::ITransaction* transaction_;
    Firebird::ITransaction* registered_;   // the pointer the connection tracks
    Firebird::IStatus* status_;
    mutable Firebird::ThrowStatusWrapper statusWrapper_{nullptr};
};

} // namespace firebird
} // namespace rdbcpp
