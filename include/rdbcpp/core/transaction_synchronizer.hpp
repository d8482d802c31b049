#pragma once

#include "rdbcpp/core/transaction_context.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <unordered_map>

namespace rdbcpp {
namespace core {

using ScopeId = std::uint64_t;

class TransactionSynchronizer;

namespace detail {
// Owned by the SynchronizationScope; keeps the bound context alive
struct ScopeState {
    std::shared_ptr<TransactionContext> context;
};
} // namespace detail

/**
 * @brief Association between one call chain and at most one transaction
 *
 * Created by TransactionSynchronizer::openScope(), which also activates it on
 * the calling thread. Destroying the scope tears it down: a still-active
 * context is rolled back, the registry entry removed and the activation
 * undone. Move-only.
 */
class SynchronizationScope {
public:
    /**
     * @brief Makes a scope ambient on the current thread while alive
     */
    class Activation {
    public:
        Activation(const TransactionSynchronizer* synchronizer, ScopeId id);
        ~Activation();

        Activation(Activation&& other) noexcept;
        Activation& operator=(Activation&&) = delete;
        Activation(const Activation&) = delete;
        Activation& operator=(const Activation&) = delete;

    private:
        const TransactionSynchronizer* synchronizer_;
        ScopeId id_;
    };

    SynchronizationScope(SynchronizationScope&& other) noexcept;
    SynchronizationScope& operator=(SynchronizationScope&& other) noexcept;
    SynchronizationScope(const SynchronizationScope&) = delete;
    SynchronizationScope& operator=(const SynchronizationScope&) = delete;

    ~SynchronizationScope() { close(); }

    ScopeId getId() const noexcept { return id_; }
    bool isOpen() const noexcept { return synchronizer_ != nullptr; }

    // Context currently bound to the scope, in any state
    std::shared_ptr<TransactionContext> getContext() const;

    // Continue the chain on another thread
    Activation activate() const;

    // Tear down now; idempotent
    void close() noexcept;

private:
    friend class TransactionSynchronizer;

    SynchronizationScope(std::shared_ptr<TransactionSynchronizer> synchronizer,
                         ScopeId id,
                         std::shared_ptr<detail::ScopeState> state,
                         bool activateHere);

    std::shared_ptr<TransactionSynchronizer> synchronizer_;
    ScopeId id_ = 0;
    std::shared_ptr<detail::ScopeState> state_;
    std::optional<Activation> activation_;
};

/**
 * @brief Registry of synchronization scopes
 *
 * Lets independently built statements find the transaction of the chain they
 * run in. The registry keeps weak references only; scopes own their entries.
 * Reads take a shared lock, registration and binding an exclusive one.
 */
class TransactionSynchronizer : public std::enable_shared_from_this<TransactionSynchronizer> {
public:
    static std::shared_ptr<TransactionSynchronizer> create();

    /**
     * @brief Register a new scope
     * @param activateHere make it ambient on the calling thread until closed
     */
    SynchronizationScope openScope(bool activateHere = true);

    // Innermost scope of this synchronizer activated on the calling thread
    std::optional<ScopeId> currentScope() const;

    // Context of the current scope if it is ACTIVE
    std::shared_ptr<TransactionContext> currentContext() const;

    std::shared_ptr<TransactionContext> boundContext(ScopeId scope) const;

    /**
     * @throws SynchronizationNotEnabled if the scope is not registered
     * @throws TransactionAlreadyActive if the scope already has an active context
     */
    void bind(ScopeId scope, std::shared_ptr<TransactionContext> context);

    // Remove the association if it still points at contextId
    void unbind(ScopeId scope, std::uint64_t contextId) noexcept;

    bool isRegistered(ScopeId scope) const;
    size_t scopeCount() const;

    // Activations of this synchronizer recorded on the calling thread
    size_t activationCount() const;

private:
    friend class SynchronizationScope;

    struct Entry {
        std::weak_ptr<detail::ScopeState> owner;
        std::weak_ptr<TransactionContext> context;
        std::uint64_t contextId = 0;
    };

    TransactionSynchronizer() = default;

    void teardown(ScopeId scope) noexcept;

    // Drop this thread's activations of scopes closed elsewhere
    void pruneActivations() const;
    void pruneActivationsLocked() const;

    mutable std::shared_mutex mutex_;
    std::unordered_map<ScopeId, Entry> scopes_;
};

} // namespace core
} // namespace rdbcpp
