#pragma once

#include "rdbcpp/core/driver.hpp"
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace rdbcpp {
namespace core {

enum class TransactionState {
    None,
    Active,
    Committed,
    RolledBack
};

std::string_view toString(TransactionState state) noexcept;

enum class Propagation {
    Required,      // join the ambient transaction if there is one
    RequiresNew    // always open a new scope and transaction
};

struct TransactionDefinition {
    IsolationLevel isolation = IsolationLevel::Default;
    bool readOnly = false;
    std::string name;
    Propagation propagation = Propagation::Required;
};

/**
 * @brief One logical unit of work on one leased connection
 *
 * State machine NONE -> ACTIVE -> {COMMITTED, ROLLED_BACK}. The context owns
 * the leased connection and the driver transaction handle; both are released
 * exactly once when it reaches a terminal state, whether or not the driver
 * reported an error while committing or rolling back.
 *
 * Statements issued through the context are serialized: one at a time on the
 * handle, cursor pulls included. Cursors still open when the context leaves
 * ACTIVE are closed before the connection goes back to the provider.
 */
class TransactionContext : public std::enable_shared_from_this<TransactionContext> {
public:
    static std::shared_ptr<TransactionContext> create(std::shared_ptr<ConnectionProvider> provider,
                                                      TransactionDefinition definition = {});

    // Rolls back if still active
    ~TransactionContext();

    TransactionContext(const TransactionContext&) = delete;
    TransactionContext& operator=(const TransactionContext&) = delete;

    std::uint64_t getId() const noexcept { return id_; }
    TransactionState getState() const;
    bool isActive() const { return getState() == TransactionState::Active; }
    bool isRollbackOnly() const;
    const TransactionDefinition& getDefinition() const noexcept { return definition_; }

    /**
     * @brief Acquire a connection and open the driver transaction
     * @throws TransactionAlreadyActive if ACTIVE
     * @throws TransactionInactive if already terminal
     * @throws ExecutionFailed if the driver cannot begin
     */
    void begin();

    /**
     * @throws TransactionInactive unless ACTIVE
     * @throws UnexpectedRollback if marked rollback-only (rolled back instead)
     * @throws ExecutionFailed if the driver commit fails; the context is
     *         terminal and its handle released regardless
     */
    void commit();

    void rollback();

    // Commit will roll back instead
    void setRollbackOnly();

    /**
     * @brief Run a statement inside this transaction
     *
     * The returned cursor locks the context on every pull and fails with
     * TransactionInactive once the context has left ACTIVE. Commit and
     * rollback close it on the driver first.
     */
    std::unique_ptr<Cursor> executeStatement(const std::string& sql, const Bindings& bindings);

private:
    class GuardedCursor;

    TransactionContext(std::shared_ptr<ConnectionProvider> provider, TransactionDefinition definition);

    void requireActive(std::string_view operation) const;
    void finish(bool commit);
    void closeOpenCursors() noexcept;
    void releaseHandle() noexcept;

    const std::uint64_t id_;
    const TransactionDefinition definition_;
    std::shared_ptr<ConnectionProvider> provider_;

    mutable std::mutex mutex_;
    TransactionState state_ = TransactionState::None;
    bool rollbackOnly_ = false;
    ConnectionLease lease_;
    std::unique_ptr<TransactionHandle> handle_;
    std::vector<GuardedCursor*> openCursors_;    // registered and removed under mutex_
};

} // namespace core
} // namespace rdbcpp
