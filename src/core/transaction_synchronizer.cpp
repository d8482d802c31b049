#include "rdbcpp/core/transaction_synchronizer.hpp"
#include "rdbcpp/core/exception.hpp"
#include "rdbcpp_util/logging.h"
#include <algorithm>
#include <atomic>
#include <mutex>
#include <utility>
#include <vector>

namespace rdbcpp {
namespace core {

namespace {

std::atomic<ScopeId> g_nextScopeId{1};

// Scopes activated on this thread, innermost last
thread_local std::vector<std::pair<const TransactionSynchronizer*, ScopeId>> t_activeScopes;

} // namespace

// ============================================================================
// Activation
// ============================================================================

SynchronizationScope::Activation::Activation(const TransactionSynchronizer* synchronizer, ScopeId id)
    : synchronizer_(synchronizer), id_(id) {
    t_activeScopes.emplace_back(synchronizer_, id_);

    auto logger = util::Logging::get();
    if (logger) {
        logger->debug("Synchronization scope {} activated", id_);
    }
}

SynchronizationScope::Activation::Activation(Activation&& other) noexcept
    : synchronizer_(other.synchronizer_), id_(other.id_) {
    other.synchronizer_ = nullptr;
}

SynchronizationScope::Activation::~Activation() {
    if (!synchronizer_) {
        return;
    }
    auto entry = std::make_pair(synchronizer_, id_);
    auto it = std::find(t_activeScopes.rbegin(), t_activeScopes.rend(), entry);
    if (it != t_activeScopes.rend()) {
        t_activeScopes.erase(std::next(it).base());
    }
}

// ============================================================================
// SynchronizationScope
// ============================================================================

SynchronizationScope::SynchronizationScope(std::shared_ptr<TransactionSynchronizer> synchronizer,
                                           ScopeId id,
                                           std::shared_ptr<detail::ScopeState> state,
                                           bool activateHere)
    : synchronizer_(std::move(synchronizer))
    , id_(id)
    , state_(std::move(state)) {
    if (activateHere) {
        synchronizer_->pruneActivations();
        activation_.emplace(synchronizer_.get(), id_);
    }
}

SynchronizationScope::SynchronizationScope(SynchronizationScope&& other) noexcept
    : synchronizer_(std::move(other.synchronizer_))
    , id_(other.id_)
    , state_(std::move(other.state_)) {
    if (other.activation_) {
        activation_.emplace(std::move(*other.activation_));
        other.activation_.reset();
    }
}

SynchronizationScope& SynchronizationScope::operator=(SynchronizationScope&& other) noexcept {
    if (this != &other) {
        close();
        synchronizer_ = std::move(other.synchronizer_);
        id_ = other.id_;
        state_ = std::move(other.state_);
        if (other.activation_) {
            activation_.emplace(std::move(*other.activation_));
            other.activation_.reset();
        }
    }
    return *this;
}

std::shared_ptr<TransactionContext> SynchronizationScope::getContext() const {
    if (!synchronizer_) {
        return nullptr;
    }
    return synchronizer_->boundContext(id_);
}

SynchronizationScope::Activation SynchronizationScope::activate() const {
    if (!synchronizer_) {
        throw SynchronizationNotEnabled("Synchronization scope has been closed");
    }
    synchronizer_->pruneActivations();
    return Activation(synchronizer_.get(), id_);
}

void SynchronizationScope::close() noexcept {
    if (!synchronizer_) {
        return;
    }
    synchronizer_->teardown(id_);
    activation_.reset();
    state_.reset();
    synchronizer_.reset();
}

// ============================================================================
// TransactionSynchronizer
// ============================================================================

std::shared_ptr<TransactionSynchronizer> TransactionSynchronizer::create() {
    return std::shared_ptr<TransactionSynchronizer>(new TransactionSynchronizer());
}

SynchronizationScope TransactionSynchronizer::openScope(bool activateHere) {
    ScopeId id = g_nextScopeId.fetch_add(1);
    auto state = std::make_shared<detail::ScopeState>();
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        scopes_[id] = Entry{state, {}, 0};
    }

    auto logger = util::Logging::get();
    if (logger) {
        logger->debug("Synchronization scope {} opened", id);
    }
    return SynchronizationScope(shared_from_this(), id, std::move(state), activateHere);
}

std::optional<ScopeId> TransactionSynchronizer::currentScope() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    pruneActivationsLocked();
    for (auto it = t_activeScopes.rbegin(); it != t_activeScopes.rend(); ++it) {
        if (it->first == this) {
            return it->second;
        }
    }
    return std::nullopt;
}

void TransactionSynchronizer::pruneActivations() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    pruneActivationsLocked();
}

// A scope closed on another thread cannot reach this thread's list
void TransactionSynchronizer::pruneActivationsLocked() const {
    t_activeScopes.erase(
        std::remove_if(t_activeScopes.begin(), t_activeScopes.end(),
                       [this](const auto& entry) {
                           return entry.first == this && scopes_.count(entry.second) == 0;
                       }),
        t_activeScopes.end());
}

size_t TransactionSynchronizer::activationCount() const {
    return static_cast<size_t>(std::count_if(t_activeScopes.begin(), t_activeScopes.end(),
                                             [this](const auto& entry) { return entry.first == this; }));
}

std::shared_ptr<TransactionContext> TransactionSynchronizer::currentContext() const {
    auto scope = currentScope();
    if (!scope) {
        return nullptr;
    }
    auto context = boundContext(*scope);
    if (context && context->isActive()) {
        return context;
    }
    return nullptr;
}

std::shared_ptr<TransactionContext> TransactionSynchronizer::boundContext(ScopeId scope) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = scopes_.find(scope);
    if (it == scopes_.end()) {
        return nullptr;
    }
    return it->second.context.lock();
}

void TransactionSynchronizer::bind(ScopeId scope, std::shared_ptr<TransactionContext> context) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = scopes_.find(scope);
    if (it == scopes_.end()) {
        throw SynchronizationNotEnabled("Synchronization scope " + std::to_string(scope) + " is not open");
    }
    auto owner = it->second.owner.lock();
    if (!owner) {
        throw SynchronizationNotEnabled("Synchronization scope " + std::to_string(scope) + " has been torn down");
    }
    auto existing = it->second.context.lock();
    if (existing && existing != context && existing->isActive()) {
        throw TransactionAlreadyActive("Scope " + std::to_string(scope) + " already has active transaction " +
                                       std::to_string(existing->getId()));
    }

    it->second.context = context;
    it->second.contextId = context ? context->getId() : 0;
    owner->context = std::move(context);

    auto logger = util::Logging::get();
    if (logger) {
        logger->debug("Transaction {} bound to scope {}", it->second.contextId, scope);
    }
}

void TransactionSynchronizer::unbind(ScopeId scope, std::uint64_t contextId) noexcept {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = scopes_.find(scope);
    if (it == scopes_.end() || it->second.contextId != contextId) {
        return;
    }
    it->second.context.reset();
    it->second.contextId = 0;
    if (auto owner = it->second.owner.lock()) {
        owner->context.reset();
    }
}

bool TransactionSynchronizer::isRegistered(ScopeId scope) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return scopes_.count(scope) > 0;
}

size_t TransactionSynchronizer::scopeCount() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return scopes_.size();
}

void TransactionSynchronizer::teardown(ScopeId scope) noexcept {
    std::shared_ptr<TransactionContext> context;
    std::shared_ptr<detail::ScopeState> owner;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = scopes_.find(scope);
        if (it == scopes_.end()) {
            return;
        }
        context = it->second.context.lock();
        owner = it->second.owner.lock();
        scopes_.erase(it);
    }

    auto logger = util::Logging::get();
    if (context && context->isActive()) {
        if (logger) {
            logger->warn("Scope {} torn down with transaction {} still active; rolling back",
                         scope, context->getId());
        }
        try {
            context->rollback();
        }
        catch (const std::exception& e) {
            if (logger) {
                logger->warn("Rollback on teardown of scope {} failed: {}", scope, e.what());
            }
        }
    }
    if (owner) {
        owner->context.reset();
    }
    if (logger) {
        logger->debug("Synchronization scope {} closed", scope);
    }
}

} // namespace core
} // namespace rdbcpp
