#pragma once

#include "rdbcpp/core/dialect.hpp"
#include "rdbcpp/core/driver.hpp"
#include "rdbcpp/core/result_consumer.hpp"
#include "rdbcpp/core/statement_spec.hpp"
#include "rdbcpp/core/transaction_context.hpp"
#include <functional>
#include <memory>
#include <variant>

namespace rdbcpp {
namespace core {

/**
 * @brief Where a statement runs: inside a transaction context, or on an
 *        ad-hoc auto-commit connection leased from a provider
 */
class ExecutionTarget {
public:
    static ExecutionTarget of(std::shared_ptr<TransactionContext> context);
    static ExecutionTarget of(std::shared_ptr<ConnectionProvider> provider);

    bool isTransactional() const noexcept {
        return std::holds_alternative<std::shared_ptr<TransactionContext>>(target_);
    }

    std::unique_ptr<Cursor> open(const std::string& sql, const Bindings& bindings) const;

private:
    using Target = std::variant<std::shared_ptr<TransactionContext>, std::shared_ptr<ConnectionProvider>>;

    explicit ExecutionTarget(Target target) : target_(std::move(target)) {}

    Target target_;
};

// Picks the target when the statement is subscribed
using TargetResolver = std::function<ExecutionTarget()>;

/**
 * @brief Sends statements; keeps no state between calls
 *
 * execute() never talks to the database. The statement is sent once, when
 * the returned consumer's sequence is subscribed; failures surface there.
 * Nothing is retried.
 */
class ExecutionEngine {
public:
    explicit ExecutionEngine(std::shared_ptr<const Dialect> dialect);

    ResultConsumer execute(ExecutionTarget target, const StatementSpec& spec) const;
    ResultConsumer execute(TargetResolver resolver, const StatementSpec& spec) const;

    const Dialect& getDialect() const noexcept { return *dialect_; }

private:
    std::shared_ptr<const Dialect> dialect_;
};

} // namespace core
} // namespace rdbcpp
