#include "rdbcpp/core/transaction_context.hpp"
#include "rdbcpp/core/exception.hpp"
#include "rdbcpp_util/logging.h"
#include <algorithm>
#include <atomic>

namespace rdbcpp {
namespace core {

namespace {
std::atomic<std::uint64_t> g_nextContextId{1};
} // namespace

std::string_view toString(TransactionState state) noexcept {
    switch (state) {
        case TransactionState::None:       return "NONE";
        case TransactionState::Active:     return "ACTIVE";
        case TransactionState::Committed:  return "COMMITTED";
        case TransactionState::RolledBack: return "ROLLED_BACK";
    }
    return "UNKNOWN";
}

/**
 * Cursor of a statement run inside the context. Every call takes the
 * context lock so that no two statements touch the handle concurrently.
 * The context keeps a pointer to each live cursor and closes it when the
 * transaction ends.
 */
class TransactionContext::GuardedCursor : public Cursor {
public:
    GuardedCursor(std::shared_ptr<TransactionContext> context, std::unique_ptr<Cursor> cursor)
        : context_(std::move(context)), cursor_(std::move(cursor)) {}

    ~GuardedCursor() override {
        std::lock_guard<std::mutex> lock(context_->mutex_);
        closeLocked();
        auto& open = context_->openCursors_;
        open.erase(std::remove(open.begin(), open.end(), this), open.end());
    }

    std::optional<RawRow> next() override {
        std::lock_guard<std::mutex> lock(context_->mutex_);
        if (!cursor_) {
            if (invalidated_) {
                context_->requireActive("fetch");
            }
            return std::nullopt;
        }
        context_->requireActive("fetch");
        return cursor_->next();
    }

    const std::vector<ColumnMetadata>& columns() const override {
        return columns_.empty() && cursor_ ? cursor_->columns() : columns_;
    }

    std::uint64_t affectedRows() const override {
        return cursor_ ? cursor_->affectedRows() : affected_;
    }

    void close() override {
        std::lock_guard<std::mutex> lock(context_->mutex_);
        closeLocked();
    }

    // Caller holds the context lock
    void invalidate() noexcept {
        invalidated_ = true;
        closeLocked();
    }

private:
    void closeLocked() noexcept {
        if (!cursor_) {
            return;
        }
        try {
            columns_ = cursor_->columns();
            affected_ = cursor_->affectedRows();
            cursor_->close();
        }
        catch (const std::exception& e) {
            auto logger = util::Logging::get();
            if (logger) {
                logger->warn("Transaction {}: closing cursor failed: {}", context_->id_, e.what());
            }
        }
        cursor_.reset();
    }

    std::shared_ptr<TransactionContext> context_;
    std::unique_ptr<Cursor> cursor_;
    std::vector<ColumnMetadata> columns_;
    std::uint64_t affected_ = 0;
    bool invalidated_ = false;
};

std::shared_ptr<TransactionContext> TransactionContext::create(std::shared_ptr<ConnectionProvider> provider,
                                                               TransactionDefinition definition) {
    return std::shared_ptr<TransactionContext>(
        new TransactionContext(std::move(provider), std::move(definition)));
}

TransactionContext::TransactionContext(std::shared_ptr<ConnectionProvider> provider,
                                       TransactionDefinition definition)
    : id_(g_nextContextId.fetch_add(1))
    , definition_(std::move(definition))
    , provider_(std::move(provider)) {
    if (!provider_) {
        throw InvalidSpecification("Transaction context needs a connection provider");
    }
}

TransactionContext::~TransactionContext() {
    if (state_ == TransactionState::Active) {
        auto logger = util::Logging::get();
        if (logger) {
            logger->warn("Transaction {} destroyed while still active; rolling back", id_);
        }
        try {
            handle_->rollback();
        }
        catch (const std::exception& e) {
            if (logger) {
                logger->warn("Transaction {}: rollback in destructor failed: {}", id_, e.what());
            }
        }
        releaseHandle();
    }
}

TransactionState TransactionContext::getState() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool TransactionContext::isRollbackOnly() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rollbackOnly_;
}

void TransactionContext::requireActive(std::string_view operation) const {
    if (state_ != TransactionState::Active) {
        throw TransactionInactive("Cannot " + std::string(operation) + ": transaction " +
                                  std::to_string(id_) + " is " + std::string(toString(state_)));
    }
}

void TransactionContext::begin() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto logger = util::Logging::get();

    if (state_ == TransactionState::Active) {
        throw TransactionAlreadyActive("Transaction " + std::to_string(id_) + " is already active");
    }
    if (state_ != TransactionState::None) {
        throw TransactionInactive("Transaction " + std::to_string(id_) + " is " +
                                  std::string(toString(state_)) + " and cannot be restarted");
    }

    try {
        lease_ = ConnectionLease::acquire(provider_);
        handle_ = lease_->beginTransaction(definition_.isolation, definition_.readOnly);
    }
    catch (...) {
        handle_.reset();
        lease_.reset();
        if (logger) {
            logger->error("Transaction {}: begin failed", id_);
        }
        rethrowAsExecutionFailed("Cannot begin transaction");
    }

    state_ = TransactionState::Active;
    if (logger) {
        logger->info("Transaction {} started (isolation {}, {}{})", id_,
                     toString(definition_.isolation),
                     definition_.readOnly ? "read-only" : "read-write",
                     definition_.name.empty() ? "" : ", " + definition_.name);
    }
}

void TransactionContext::commit() {
    std::lock_guard<std::mutex> lock(mutex_);
    requireActive("commit");

    if (rollbackOnly_) {
        finish(false);
        throw UnexpectedRollback("Transaction " + std::to_string(id_) +
                                 " was marked rollback-only and has been rolled back");
    }
    finish(true);
}

void TransactionContext::rollback() {
    std::lock_guard<std::mutex> lock(mutex_);
    requireActive("rollback");
    finish(false);
}

void TransactionContext::setRollbackOnly() {
    std::lock_guard<std::mutex> lock(mutex_);
    requireActive("mark rollback-only");
    rollbackOnly_ = true;

    auto logger = util::Logging::get();
    if (logger) {
        logger->debug("Transaction {} marked rollback-only", id_);
    }
}

void TransactionContext::finish(bool commit) {
    auto logger = util::Logging::get();
    std::exception_ptr failure;

    closeOpenCursors();

    try {
        if (commit) {
            handle_->commit();
        } else {
            handle_->rollback();
        }
    }
    catch (...) {
        failure = std::current_exception();
    }

    state_ = (commit && !failure) ? TransactionState::Committed : TransactionState::RolledBack;
    releaseHandle();

    const char* action = commit ? "commit" : "rollback";
    if (failure) {
        if (logger) {
            logger->error("Transaction {}: {} failed", id_, action);
        }
        throw ExecutionFailed::wrap(failure, "Transaction " + std::to_string(id_) + " " + action + " failed");
    }
    if (logger) {
        logger->info("Transaction {} {}", id_, commit ? "committed" : "rolled back");
    }
}

void TransactionContext::closeOpenCursors() noexcept {
    if (openCursors_.empty()) {
        return;
    }
    auto logger = util::Logging::get();
    if (logger) {
        logger->debug("Transaction {}: closing {} open cursor(s)", id_, openCursors_.size());
    }
    for (GuardedCursor* cursor : openCursors_) {
        cursor->invalidate();
    }
    openCursors_.clear();
}

void TransactionContext::releaseHandle() noexcept {
    if (handle_) {
        handle_->release();
        handle_.reset();
    }
    lease_.reset();
}

std::unique_ptr<Cursor> TransactionContext::executeStatement(const std::string& sql, const Bindings& bindings) {
    std::lock_guard<std::mutex> lock(mutex_);
    requireActive("execute statement");

    auto logger = util::Logging::get();
    if (logger) {
        logger->debug("Transaction {}: executing {}", id_, sql);
    }
    std::unique_ptr<Cursor> cursor;
    try {
        cursor = lease_->executeStatement(sql, bindings);
    }
    catch (...) {
        rethrowAsExecutionFailed("Statement failed in transaction " + std::to_string(id_));
    }

    openCursors_.reserve(openCursors_.size() + 1);
    auto guarded = std::make_unique<GuardedCursor>(shared_from_this(), std::move(cursor));
    openCursors_.push_back(guarded.get());
    return guarded;
}

} // namespace core
} // namespace rdbcpp
