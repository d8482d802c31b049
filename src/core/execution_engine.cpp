#include "rdbcpp/core/execution_engine.hpp"
#include "rdbcpp/core/exception.hpp"
#include "rdbcpp_util/logging.h"

namespace rdbcpp {
namespace core {

namespace {

/**
 * Cursor of an auto-commit statement. Owns the leased connection and gives
 * it back to the provider once the driver cursor is closed and destroyed.
 */
class LeasedCursor : public Cursor {
public:
    LeasedCursor(std::unique_ptr<Cursor> cursor, ConnectionLease lease)
        : lease_(std::move(lease)), cursor_(std::move(cursor)) {}

    ~LeasedCursor() override {
        if (cursor_) {
            detail::closeQuietly(*cursor_, "auto-commit statement");
        }
    }

    std::optional<RawRow> next() override {
        return cursor_ ? cursor_->next() : std::nullopt;
    }

    const std::vector<ColumnMetadata>& columns() const override {
        return cursor_ ? cursor_->columns() : columns_;
    }

    std::uint64_t affectedRows() const override { return cursor_ ? cursor_->affectedRows() : affected_; }

    void close() override {
        if (!cursor_) {
            return;
        }
        columns_ = cursor_->columns();
        affected_ = cursor_->affectedRows();
        try {
            cursor_->close();
        }
        catch (...) {
            cursor_.reset();
            lease_.reset();
            throw;
        }
        cursor_.reset();
        lease_.reset();
    }

private:
    // Declared first: destroyed after the cursor
    ConnectionLease lease_;
    std::unique_ptr<Cursor> cursor_;
    std::vector<ColumnMetadata> columns_;
    std::uint64_t affected_ = 0;
};

} // namespace

ExecutionTarget ExecutionTarget::of(std::shared_ptr<TransactionContext> context) {
    if (!context) {
        throw InvalidSpecification("Execution target context must not be null");
    }
    return ExecutionTarget(Target{std::move(context)});
}

ExecutionTarget ExecutionTarget::of(std::shared_ptr<ConnectionProvider> provider) {
    if (!provider) {
        throw InvalidSpecification("Execution target provider must not be null");
    }
    return ExecutionTarget(Target{std::move(provider)});
}

std::unique_ptr<Cursor> ExecutionTarget::open(const std::string& sql, const Bindings& bindings) const {
    if (auto* context = std::get_if<std::shared_ptr<TransactionContext>>(&target_)) {
        return (*context)->executeStatement(sql, bindings);
    }

    auto lease = ConnectionLease::acquire(std::get<std::shared_ptr<ConnectionProvider>>(target_));
    auto cursor = lease->executeStatement(sql, bindings);
    return std::make_unique<LeasedCursor>(std::move(cursor), std::move(lease));
}

ExecutionEngine::ExecutionEngine(std::shared_ptr<const Dialect> dialect)
    : dialect_(std::move(dialect)) {
    if (!dialect_) {
        throw InvalidSpecification("Execution engine needs a dialect");
    }
}

ResultConsumer ExecutionEngine::execute(ExecutionTarget target, const StatementSpec& spec) const {
    return execute([target]() { return target; }, spec);
}

ResultConsumer ExecutionEngine::execute(TargetResolver resolver, const StatementSpec& spec) const {
    auto rendered = std::make_shared<const RenderedStatement>(spec.render(*dialect_));
    std::string description = spec.describe();

    auto logger = util::Logging::get();
    if (logger) {
        logger->debug("Prepared {}: {}", description, rendered->sql);
    }

    return ResultConsumer(
        [resolver = std::move(resolver), rendered]() {
            ExecutionTarget target = resolver();
            auto logger = util::Logging::get();
            if (logger) {
                logger->debug("Sending statement ({}): {}",
                              target.isTransactional() ? "transactional" : "auto-commit", rendered->sql);
            }
            return target.open(rendered->sql, rendered->bindings);
        },
        std::move(description));
}

} // namespace core
} // namespace rdbcpp
