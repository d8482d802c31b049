#include "rdbcpp/core/database_client.hpp"
#include "rdbcpp_util/config.h"
#include "rdbcpp_util/logging.h"
#include <algorithm>
#include <cctype>

namespace rdbcpp {
namespace core {

namespace {

FailurePrecedence parsePrecedence(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (lower.empty() || lower == "rollback") {
        return FailurePrecedence::Rollback;
    }
    if (lower == "original") {
        return FailurePrecedence::Original;
    }
    throw InvalidSpecification("Unknown rollback failure precedence: " + name);
}

} // namespace

ClientOptions ClientOptions::fromConfig() {
    const auto& cfg = util::Config::client();

    ClientOptions options;
    options.dialect = cfg.dialect;
    options.defaultDefinition.isolation = parseIsolationLevel(cfg.defaultIsolation);
    options.defaultDefinition.readOnly = cfg.defaultReadOnly;
    options.rollbackFailurePrecedence = parsePrecedence(cfg.rollbackFailurePrecedence);
    return options;
}

namespace detail {

ClientCore::ClientCore(std::shared_ptr<ConnectionProvider> connectionProvider, ClientOptions clientOptions)
    : provider(std::move(connectionProvider))
    , synchronizer(TransactionSynchronizer::create())
    , engine(Dialect::fromName(clientOptions.dialect))
    , options(std::move(clientOptions)) {
    if (!provider) {
        throw InvalidSpecification("Database client needs a connection provider");
    }
}

ExecutionTarget ClientCore::resolveTarget() const {
    if (auto context = synchronizer->currentContext()) {
        return ExecutionTarget::of(std::move(context));
    }
    return ExecutionTarget::of(provider);
}

ResultConsumer ClientCore::execute(const StatementSpec& spec) const {
    auto self = shared_from_this();
    return engine.execute([self]() { return self->resolveTarget(); }, spec);
}

void logUnitOfWorkFailure(std::uint64_t contextId, std::exception_ptr original,
                          std::exception_ptr rollbackFailure) noexcept {
    auto logger = util::Logging::get();
    if (!logger) {
        return;
    }
    auto describe = [](std::exception_ptr error) -> std::string {
        try {
            std::rethrow_exception(error);
        }
        catch (const std::exception& e) {
            return e.what();
        }
        catch (...) {
            return "unknown error";
        }
    };
    logger->error("Transaction {}: unit of work failed ({}) and rollback failed as well ({})",
                  contextId, describe(original), describe(rollbackFailure));
}

void markRollbackOnlyQuietly(TransactionContext& context) noexcept {
    try {
        context.setRollbackOnly();
    }
    catch (const std::exception& e) {
        auto logger = util::Logging::get();
        if (logger) {
            logger->warn("Transaction {}: cannot mark rollback-only: {}", context.getId(), e.what());
        }
    }
}

} // namespace detail

// ============================================================================
// Builders
// ============================================================================

GenericExecuteSpec GenericExecuteSpec::bindNull(const std::string& name, SqlType type) const {
    GenericExecuteSpec next = *this;
    next.binder_.bindNull(name, type);
    return next;
}

GenericExecuteSpec GenericExecuteSpec::bindNull(size_t index, SqlType type) const {
    GenericExecuteSpec next = *this;
    next.binder_.bindNull(index, type);
    return next;
}

SelectSpec SelectSpec::project(std::vector<std::string> columns) const {
    SelectSpec next = *this;
    next.model_.columns = std::move(columns);
    return next;
}

SelectSpec SelectSpec::matching(Criteria criteria) const {
    SelectSpec next = *this;
    next.model_.criteria = std::move(criteria);
    return next;
}

SelectSpec SelectSpec::withOrdering(std::vector<SortOrder> orders) const {
    SelectSpec next = *this;
    for (auto& order : orders) {
        next.model_.ordering.push_back(std::move(order));
    }
    return next;
}

SelectSpec SelectSpec::page(std::int64_t offset, std::int64_t limit) const {
    SelectSpec next = *this;
    next.model_.paging = PagingWindow::of(offset, limit);
    return next;
}

InsertSpec InsertSpec::withValue(std::string column, Parameter parameter) const {
    InsertSpec next = *this;
    auto& values = next.model_.values;
    auto it = std::find_if(values.begin(), values.end(),
                           [&column](const auto& entry) { return entry.first == column; });
    if (it != values.end()) {
        it->second = std::move(parameter);
    } else {
        values.emplace_back(std::move(column), std::move(parameter));
    }
    return next;
}

// ============================================================================
// Clients
// ============================================================================

DatabaseClient::DatabaseClient(std::shared_ptr<ConnectionProvider> provider, ClientOptions options)
    : core_(std::make_shared<detail::ClientCore>(std::move(provider), std::move(options))) {
}

TransactionalDatabaseClient::TransactionalDatabaseClient(std::shared_ptr<ConnectionProvider> provider,
                                                         ClientOptions options)
    : DatabaseClient(std::move(provider), std::move(options)) {
}

SynchronizationScope TransactionalDatabaseClient::enableTransactionSynchronization() const {
    return core_->synchronizer->openScope();
}

void TransactionalDatabaseClient::beginTransaction(TransactionDefinition definition) const {
    auto scope = core_->synchronizer->currentScope();
    if (!scope) {
        throw SynchronizationNotEnabled(
            "beginTransaction() requires enableTransactionSynchronization() on the calling chain");
    }

    auto existing = core_->synchronizer->boundContext(*scope);
    if (existing && existing->isActive()) {
        throw TransactionAlreadyActive("Scope " + std::to_string(*scope) + " already has active transaction " +
                                       std::to_string(existing->getId()));
    }

    auto context = TransactionContext::create(core_->provider, std::move(definition));
    context->begin();
    try {
        core_->synchronizer->bind(*scope, context);
    }
    catch (...) {
        try {
            context->rollback();
        }
        catch (const std::exception& e) {
            auto logger = util::Logging::get();
            if (logger) {
                logger->warn("Transaction {}: rollback after failed bind failed: {}", context->getId(), e.what());
            }
        }
        throw;
    }
}

void TransactionalDatabaseClient::commitTransaction() const {
    finishTransaction(true);
}

void TransactionalDatabaseClient::rollbackTransaction() const {
    finishTransaction(false);
}

void TransactionalDatabaseClient::finishTransaction(bool commit) const {
    const char* operation = commit ? "commitTransaction()" : "rollbackTransaction()";

    auto scope = core_->synchronizer->currentScope();
    if (!scope) {
        throw SynchronizationNotEnabled(std::string(operation) +
                                        " requires enableTransactionSynchronization() on the calling chain");
    }

    auto context = core_->synchronizer->boundContext(*scope);
    if (!context) {
        throw TransactionInactive(std::string(operation) + ": no transaction is bound to scope " +
                                  std::to_string(*scope));
    }

    // The association ends with this call whatever the outcome
    try {
        if (commit) {
            context->commit();
        } else {
            context->rollback();
        }
    }
    catch (...) {
        core_->synchronizer->unbind(*scope, context->getId());
        throw;
    }
    core_->synchronizer->unbind(*scope, context->getId());
}

std::shared_ptr<TransactionContext> TransactionalDatabaseClient::currentTransaction() const {
    return core_->synchronizer->currentContext();
}

} // namespace core
} // namespace rdbcpp
