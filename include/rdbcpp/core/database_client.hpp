#pragma once

#include "rdbcpp/core/criteria.hpp"
#include "rdbcpp/core/dialect.hpp"
#include "rdbcpp/core/driver.hpp"
#include "rdbcpp/core/entity_mapper.hpp"
#include "rdbcpp/core/exception.hpp"
#include "rdbcpp/core/execution_engine.hpp"
#include "rdbcpp/core/fetch_spec.hpp"
#include "rdbcpp/core/parameter.hpp"
#include "rdbcpp/core/result_stream.hpp"
#include "rdbcpp/core/row.hpp"
#include "rdbcpp/core/statement_spec.hpp"
#include "rdbcpp/core/transaction_context.hpp"
#include "rdbcpp/core/transaction_synchronizer.hpp"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace rdbcpp {
namespace core {

// Which error surfaces when a unit of work fails and its rollback fails too
enum class FailurePrecedence {
    Rollback,   // rollback error, original attached as suppressed
    Original    // original error, rollback error attached as suppressed
};

struct ClientOptions {
    std::string dialect = "firebird";
    TransactionDefinition defaultDefinition;
    FailurePrecedence rollbackFailurePrecedence = FailurePrecedence::Rollback;

    /**
     * @brief Options from util::Config::client()
     * @throws InvalidSpecification for unknown isolation or precedence names
     */
    static ClientOptions fromConfig();
};

namespace detail {

struct ClientCore : std::enable_shared_from_this<ClientCore> {
    ClientCore(std::shared_ptr<ConnectionProvider> provider, ClientOptions options);

    // Ambient ACTIVE context of the calling thread, else auto-commit
    ExecutionTarget resolveTarget() const;

    ResultConsumer execute(const StatementSpec& spec) const;

    std::shared_ptr<ConnectionProvider> provider;
    std::shared_ptr<TransactionSynchronizer> synchronizer;
    ExecutionEngine engine;
    ClientOptions options;
};

inline FetchSpec<Row> rowFetch(ResultConsumer consumer) {
    return FetchSpec<Row>(std::move(consumer), [](const ResultConsumer& c) { return c.rows(); });
}

template<typename T>
FetchSpec<T> entityFetch(ResultConsumer consumer, std::shared_ptr<const EntityMapper<T>> mapper) {
    return FetchSpec<T>(std::move(consumer), [mapper](const ResultConsumer& c) { return c.as<T>(mapper); });
}

template<typename F>
auto extractorFetch(ResultConsumer consumer, F extractor) {
    using R = std::invoke_result_t<F&, const RawRow&, const std::vector<ColumnMetadata>&>;
    return FetchSpec<R>(std::move(consumer), [extractor](const ResultConsumer& c) { return c.map(extractor); });
}

} // namespace detail

/**
 * @brief Raw SQL statement being assembled
 *
 * Every call returns a new value; the statement is validated by fetch().
 */
class GenericExecuteSpec {
public:
    template<typename T>
    GenericExecuteSpec bind(const std::string& name, T&& value) const {
        GenericExecuteSpec next = *this;
        next.binder_.bind(name, Parameter::from(std::forward<T>(value)));
        return next;
    }

    template<typename T>
    GenericExecuteSpec bind(size_t index, T&& value) const {
        GenericExecuteSpec next = *this;
        next.binder_.bind(index, Parameter::from(std::forward<T>(value)));
        return next;
    }

    // A null needs a declared type: use bindNull
    GenericExecuteSpec bind(const std::string& name, std::nullopt_t) const = delete;
    GenericExecuteSpec bind(const std::string& name, std::nullptr_t) const = delete;
    GenericExecuteSpec bind(size_t index, std::nullopt_t) const = delete;
    GenericExecuteSpec bind(size_t index, std::nullptr_t) const = delete;

    GenericExecuteSpec bindNull(const std::string& name, SqlType type) const;
    GenericExecuteSpec bindNull(size_t index, SqlType type) const;

    StatementSpec toSpec() const { return StatementSpec::raw(sql_, binder_); }

    FetchSpec<Row> fetch() const { return detail::rowFetch(core_->execute(toSpec())); }

    template<typename T>
    FetchSpec<T> as(std::shared_ptr<const EntityMapper<T>> mapper) const {
        return detail::entityFetch<T>(core_->execute(toSpec()), std::move(mapper));
    }

    template<typename T>
        requires DescribedEntity<T>
    FetchSpec<T> as() const {
        return as<T>(defaultMapper<T>());
    }

    // extractor(const RawRow&, const std::vector<ColumnMetadata>&)
    template<typename F>
    auto map(F extractor) const {
        return detail::extractorFetch(core_->execute(toSpec()), std::move(extractor));
    }

    // Run for side effects only
    Single<void> then() const { return fetch().rowsUpdated().then(); }

private:
    friend class ExecuteEntry;

    GenericExecuteSpec(std::shared_ptr<const detail::ClientCore> core, std::string sql)
        : core_(std::move(core)), sql_(std::move(sql)) {}

    std::shared_ptr<const detail::ClientCore> core_;
    std::string sql_;
    ParameterBinder binder_;
};

class ExecuteEntry {
public:
    GenericExecuteSpec sql(std::string sql) const { return GenericExecuteSpec(core_, std::move(sql)); }

private:
    friend class DatabaseClient;

    explicit ExecuteEntry(std::shared_ptr<const detail::ClientCore> core) : core_(std::move(core)) {}

    std::shared_ptr<const detail::ClientCore> core_;
};

/**
 * @brief Generated SELECT being assembled
 */
class SelectSpec {
public:
    SelectSpec project(std::vector<std::string> columns) const;
    SelectSpec matching(Criteria criteria) const;

    // Appends sort keys: orderBy(desc("id"), asc("name"))
    template<typename... More>
    SelectSpec orderBy(SortOrder first, More... more) const {
        return withOrdering({std::move(first), SortOrder(std::move(more))...});
    }

    // @throws InvalidSpecification for a negative offset or limit
    SelectSpec page(std::int64_t offset, std::int64_t limit) const;

    StatementSpec toSpec() const { return StatementSpec::select(model_); }

    FetchSpec<Row> fetch() const { return detail::rowFetch(core_->execute(toSpec())); }

    template<typename T>
    FetchSpec<T> as(std::shared_ptr<const EntityMapper<T>> mapper) const {
        return detail::entityFetch<T>(core_->execute(toSpec()), std::move(mapper));
    }

    template<typename T>
        requires DescribedEntity<T>
    FetchSpec<T> as() const {
        return as<T>(defaultMapper<T>());
    }

    template<typename F>
    auto map(F extractor) const {
        return detail::extractorFetch(core_->execute(toSpec()), std::move(extractor));
    }

private:
    friend class SelectEntry;

    SelectSpec(std::shared_ptr<const detail::ClientCore> core, std::string table)
        : core_(std::move(core)) {
        model_.table = std::move(table);
    }

    SelectSpec withOrdering(std::vector<SortOrder> orders) const;

    std::shared_ptr<const detail::ClientCore> core_;
    SelectModel model_;
};

class SelectEntry {
public:
    SelectSpec from(std::string table) const { return SelectSpec(core_, std::move(table)); }

private:
    friend class DatabaseClient;

    explicit SelectEntry(std::shared_ptr<const detail::ClientCore> core) : core_(std::move(core)) {}

    std::shared_ptr<const detail::ClientCore> core_;
};

/**
 * @brief Generated INSERT being assembled
 */
class InsertSpec {
public:
    template<typename T>
    InsertSpec value(std::string column, T&& v) const {
        return withValue(std::move(column), Parameter::from(std::forward<T>(v)));
    }

    InsertSpec value(std::string column, std::nullopt_t) const = delete;
    InsertSpec value(std::string column, std::nullptr_t) const = delete;

    InsertSpec nullValue(std::string column, SqlType type) const {
        return withValue(std::move(column), Parameter::null(type));
    }

    // Columns of entity as reported by the mapper
    template<typename T>
    InsertSpec entity(const T& object, std::shared_ptr<const EntityMapper<T>> mapper) const {
        if (!mapper) {
            throw InvalidSpecification("Entity mapper must not be null");
        }
        InsertSpec next = *this;
        for (auto& [column, parameter] : mapper->entityToColumns(object)) {
            next = next.withValue(std::move(column), std::move(parameter));
        }
        return next;
    }

    template<typename T>
        requires DescribedEntity<T>
    InsertSpec entity(const T& value) const {
        return entity<T>(value, defaultMapper<T>());
    }

    StatementSpec toSpec() const { return StatementSpec::insert(model_); }

    FetchSpec<Row> fetch() const { return detail::rowFetch(core_->execute(toSpec())); }

    Single<void> then() const { return fetch().rowsUpdated().then(); }

private:
    friend class InsertEntry;

    InsertSpec(std::shared_ptr<const detail::ClientCore> core, std::string table)
        : core_(std::move(core)) {
        model_.table = std::move(table);
    }

    // Setting a column twice keeps the last value
    InsertSpec withValue(std::string column, Parameter parameter) const;

    std::shared_ptr<const detail::ClientCore> core_;
    InsertModel model_;
};

class InsertEntry {
public:
    InsertSpec into(std::string table) const { return InsertSpec(core_, std::move(table)); }

private:
    friend class DatabaseClient;

    explicit InsertEntry(std::shared_ptr<const detail::ClientCore> core) : core_(std::move(core)) {}

    std::shared_ptr<const detail::ClientCore> core_;
};

/**
 * @brief Entry point for statements
 *
 * Builders are values that keep the client's internals alive, so results can
 * outlive the client object. Each statement runs in the ambient transaction
 * of the thread that subscribes to it, or in auto-commit mode when there is
 * none.
 */
class DatabaseClient {
public:
    explicit DatabaseClient(std::shared_ptr<ConnectionProvider> provider,
                            ClientOptions options = ClientOptions::fromConfig());

    virtual ~DatabaseClient() = default;

    ExecuteEntry execute() const { return ExecuteEntry(core_); }
    SelectEntry select() const { return SelectEntry(core_); }
    InsertEntry insert() const { return InsertEntry(core_); }

    const Dialect& getDialect() const noexcept { return core_->engine.getDialect(); }
    const ClientOptions& getOptions() const noexcept { return core_->options; }
    std::shared_ptr<TransactionSynchronizer> getSynchronizer() const noexcept { return core_->synchronizer; }

protected:
    friend class TransactionalDatabaseClient;

    explicit DatabaseClient(std::shared_ptr<detail::ClientCore> core) : core_(std::move(core)) {}

    std::shared_ptr<detail::ClientCore> core_;
};

namespace detail {

template<typename S>
struct is_result_stream : std::false_type {};
template<typename S>
struct is_result_stream<ResultStream<S>> : std::true_type {};

template<typename S>
struct is_single : std::false_type {};
template<typename S>
struct is_single<Single<S>> : std::true_type {};

// Marker item for units of work that produce no value
struct Completed {};

template<typename T>
class SingleSource : public Source<T> {
public:
    explicit SingleSource(Single<T> single) : single_(std::move(single)) {}

    std::optional<T> next() override {
        if (fired_) {
            return std::nullopt;
        }
        fired_ = true;
        return single_.get();
    }

    void cancel() noexcept override { fired_ = true; }

private:
    Single<T> single_;
    bool fired_ = false;
};

template<>
class SingleSource<void> : public Source<Completed> {
public:
    explicit SingleSource(Single<void> single) : single_(std::move(single)) {}

    std::optional<Completed> next() override {
        if (fired_) {
            return std::nullopt;
        }
        fired_ = true;
        single_.get();
        return Completed{};
    }

    void cancel() noexcept override { fired_ = true; }

private:
    Single<void> single_;
    bool fired_ = false;
};

void logUnitOfWorkFailure(std::uint64_t contextId, std::exception_ptr original,
                          std::exception_ptr rollbackFailure) noexcept;
void markRollbackOnlyQuietly(TransactionContext& context) noexcept;

/**
 * Runs a unit of work inside a transaction.
 *
 * Joins the ambient transaction (propagation Required) or opens its own scope
 * and context. An owned context is committed when the inner stream completes
 * and rolled back when it fails; a joined one is only marked rollback-only on
 * failure. The owned scope is active on the pulling thread only while a pull
 * is in progress, and is torn down (rolling back) when the subscription is
 * dropped early.
 */
template<typename T>
class TransactionalSource : public Source<T> {
public:
    using Work = std::function<ResultStream<T>(DatabaseClient&)>;

    TransactionalSource(DatabaseClient client, std::shared_ptr<ClientCore> core,
                        TransactionDefinition definition, Work work)
        : client_(std::move(client))
        , core_(std::move(core))
        , work_(std::move(work)) {
        auto ambient = core_->synchronizer->currentContext();
        if (definition.propagation == Propagation::Required && ambient) {
            joined_ = std::move(ambient);
            try {
                inner_.emplace(work_(client_).subscribe());
            }
            catch (...) {
                fail(std::current_exception());
            }
            return;
        }

        scope_.emplace(core_->synchronizer->openScope(false));
        auto activation = scope_->activate();
        try {
            context_ = TransactionContext::create(core_->provider, std::move(definition));
            context_->begin();
            core_->synchronizer->bind(scope_->getId(), context_);
            inner_.emplace(work_(client_).subscribe());
        }
        catch (...) {
            fail(std::current_exception());
        }
    }

    ~TransactionalSource() override { cancel(); }

    std::optional<T> next() override {
        if (done_) {
            return std::nullopt;
        }

        std::optional<T> item;
        {
            std::optional<SynchronizationScope::Activation> activation;
            if (scope_) {
                activation.emplace(scope_->activate());
            }
            try {
                item = inner_->next();
            }
            catch (...) {
                done_ = true;
                activation.reset();
                fail(std::current_exception());
            }
        }
        if (item) {
            return item;
        }

        done_ = true;
        inner_.reset();
        complete();
        return std::nullopt;
    }

    void cancel() noexcept override {
        inner_.reset();
        if (!done_) {
            done_ = true;
            closeScope();
        }
    }

private:
    void complete() {
        if (!context_) {
            return;
        }
        try {
            context_->commit();
        }
        catch (...) {
            closeScope();
            throw;
        }
        closeScope();
    }

    [[noreturn]] void fail(std::exception_ptr error) {
        done_ = true;
        inner_.reset();

        if (joined_) {
            markRollbackOnlyQuietly(*joined_);
            std::rethrow_exception(error);
        }

        std::exception_ptr rollbackFailure;
        if (context_ && context_->isActive()) {
            try {
                context_->rollback();
            }
            catch (...) {
                rollbackFailure = std::current_exception();
            }
        }
        closeScope();

        if (!rollbackFailure) {
            std::rethrow_exception(error);
        }
        logUnitOfWorkFailure(context_->getId(), error, rollbackFailure);
        if (core_->options.rollbackFailurePrecedence == FailurePrecedence::Rollback) {
            rethrowWithSuppressed(rollbackFailure, error);
        }
        rethrowWithSuppressed(error, rollbackFailure);
    }

    void closeScope() noexcept {
        if (scope_) {
            scope_->close();
            scope_.reset();
        }
    }

    DatabaseClient client_;
    std::shared_ptr<ClientCore> core_;
    Work work_;
    std::shared_ptr<TransactionContext> joined_;
    std::shared_ptr<TransactionContext> context_;
    std::optional<SynchronizationScope> scope_;
    std::optional<Subscription<T>> inner_;
    bool done_ = false;
};

} // namespace detail

/**
 * @brief DatabaseClient with transaction control
 *
 * Grouped mode:
 * @code
 * auto inserted = client.inTransaction([](DatabaseClient& db) {
 *     return db.execute().sql("INSERT INTO legoset(id, name) VALUES(:id, :name)")
 *              .bind("id", 42).bind("name", "X-Wing")
 *              .fetch().rowsUpdated();
 * });
 * inserted.get();   // begins, runs, commits
 * @endcode
 *
 * Application-controlled mode:
 * @code
 * auto scope = client.enableTransactionSynchronization();
 * client.beginTransaction();
 * ...statements subscribed on this thread enlist...
 * client.commitTransaction();
 * @endcode
 */
class TransactionalDatabaseClient : public DatabaseClient {
public:
    explicit TransactionalDatabaseClient(std::shared_ptr<ConnectionProvider> provider,
                                         ClientOptions options = ClientOptions::fromConfig());

    /**
     * @brief Run unitOfWork in a transaction when the result is consumed
     *
     * unitOfWork is called as unitOfWork(DatabaseClient&) and returns a
     * ResultStream<T> or a Single<T>; the result has the same shape.
     */
    template<typename F>
    auto inTransaction(F unitOfWork) const {
        return inTransaction(std::move(unitOfWork), core_->options.defaultDefinition);
    }

    template<typename F>
    auto inTransaction(F unitOfWork, TransactionDefinition definition) const {
        using Result = std::invoke_result_t<F&, DatabaseClient&>;
        static_assert(detail::is_result_stream<Result>::value || detail::is_single<Result>::value,
                      "Unit of work must return a ResultStream or a Single");

        if constexpr (detail::is_result_stream<Result>::value) {
            using T = typename Result::value_type;
            return transactional<T>(std::move(definition),
                                    [unitOfWork](DatabaseClient& db) mutable { return unitOfWork(db); });
        } else {
            using T = typename Result::value_type;
            if constexpr (std::is_void_v<T>) {
                auto stream = transactional<detail::Completed>(
                    std::move(definition),
                    [unitOfWork](DatabaseClient& db) mutable {
                        Single<void> single = unitOfWork(db);
                        return ResultStream<detail::Completed>(
                            [single]() -> std::unique_ptr<Source<detail::Completed>> {
                                return std::make_unique<detail::SingleSource<void>>(single);
                            });
                    });
                return stream.then();
            } else {
                auto stream = transactional<T>(
                    std::move(definition),
                    [unitOfWork](DatabaseClient& db) mutable {
                        Single<T> single = unitOfWork(db);
                        return ResultStream<T>([single]() -> std::unique_ptr<Source<T>> {
                            return std::make_unique<detail::SingleSource<T>>(single);
                        });
                    });
                return Single<T>([stream]() -> T {
                    auto subscription = stream.subscribe();
                    auto value = subscription.next();
                    // Pull to completion so the transaction commits
                    while (subscription.next()) {
                    }
                    if (!value) {
                        throw ExecutionFailed("Unit of work completed without a value");
                    }
                    return std::move(*value);
                });
            }
        }
    }

    /**
     * @brief Install a synchronization scope for the calling chain
     *
     * Required before beginTransaction(). The scope is active on the calling
     * thread until destroyed; destroying it rolls back a transaction still
     * left open.
     */
    SynchronizationScope enableTransactionSynchronization() const;

    /**
     * @throws SynchronizationNotEnabled without an active scope
     * @throws TransactionAlreadyActive if the scope already has one
     */
    void beginTransaction() const { beginTransaction(core_->options.defaultDefinition); }
    void beginTransaction(TransactionDefinition definition) const;

    /**
     * @throws SynchronizationNotEnabled without an active scope
     * @throws TransactionInactive if no transaction is bound to the scope
     */
    void commitTransaction() const;
    void rollbackTransaction() const;

    // Ambient active transaction of the calling thread, if any
    std::shared_ptr<TransactionContext> currentTransaction() const;

private:
    template<typename T>
    ResultStream<T> transactional(TransactionDefinition definition,
                                  typename detail::TransactionalSource<T>::Work work) const {
        auto core = core_;
        return ResultStream<T>([core, definition, work]() -> std::unique_ptr<Source<T>> {
            return std::make_unique<detail::TransactionalSource<T>>(
                DatabaseClient(core), core, definition, work);
        });
    }

    void finishTransaction(bool commit) const;
};

} // namespace core
} // namespace rdbcpp
