#include "rdbcpp/firebird/transaction_handle.hpp"
#include "rdbcpp/firebird/firebird_exception.hpp"
#include "rdbcpp_util/logging.h"

namespace rdbcpp {
namespace firebird {

FirebirdTransactionHandle::FirebirdTransactionHandle(std::shared_ptr<FirebirdConnection> connection,
                                                     Firebird::ITransaction* transaction)
    : connection_(std::move(connection))
    , transaction_(transaction)
    , registered_(transaction)
    , status_(Environment::getInstance().getMaster()->getStatus())
    , statusWrapper_(status_) {
    if (!transaction_) {
        statusWrapper_.dispose();
        throw FirebirdException("Invalid transaction pointer");
    }
}

FirebirdTransactionHandle::~FirebirdTransactionHandle() {
    release();
    statusWrapper_.dispose();
}

void FirebirdTransactionHandle::commit() {
    auto logger = util::Logging::get();
    if (!transaction_) {
        if (logger) logger->error("Commit requested on inactive transaction");
        throw FirebirdException("Transaction is not active");
    }

    try {
        auto& st = status();
        transaction_->commit(&st);
        transaction_ = nullptr;
        if (logger) logger->debug("Firebird transaction committed");
    }
    catch (const Firebird::FbException& e) {
        if (logger) logger->error("Commit failed (Firebird exception)");
        throw FirebirdException(e);
    }
}

void FirebirdTransactionHandle::rollback() {
    auto logger = util::Logging::get();
    if (!transaction_) {
        if (logger) logger->error("Rollback requested on inactive transaction");
        throw FirebirdException("Transaction is not active");
    }

    try {
        auto& st = status();
        transaction_->rollback(&st);
        transaction_ = nullptr;
        if (logger) logger->debug("Firebird transaction rolled back");
    }
    catch (const Firebird::FbException& e) {
        if (logger) logger->error("Rollback failed (Firebird exception)");
        throw FirebirdException(e);
    }
}

void FirebirdTransactionHandle::release() noexcept {
    if (transaction_) {
        auto logger = util::Logging::get();
        if (logger) logger->warn("Transaction handle released while still active; rolling back");
        try {
            auto& st = status();
            transaction_->rollback(&st);
        }
        catch (const Firebird::FbException& e) {
            transaction_->release();
            if (logger) logger->warn("Rollback on release failed (ignored): {}", FirebirdException(e).what());
        }
        transaction_ = nullptr;
    }
    if (connection_) {
        connection_->transactionFinished(registered_);
        connection_.reset();
    }
}

} // namespace firebird
} // namespace rdbcpp
