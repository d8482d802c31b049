#pragma once

#include "rdbcpp/core/criteria.hpp"
#include "rdbcpp/core/dialect.hpp"
#include "rdbcpp/core/parameter.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace rdbcpp {
namespace core {

enum class OperationKind {
    RawSql,
    GenericSelect,
    GenericInsert
};

std::string_view toString(OperationKind kind) noexcept;

enum class SortDirection {
    Ascending,
    Descending
};

struct SortOrder {
    std::string column;
    SortDirection direction = SortDirection::Ascending;
};

inline SortOrder asc(std::string column) { return SortOrder{std::move(column), SortDirection::Ascending}; }
inline SortOrder desc(std::string column) { return SortOrder{std::move(column), SortDirection::Descending}; }

struct PagingWindow {
    std::uint64_t offset = 0;
    std::uint64_t limit = 0;

    /** @throws InvalidSpecification if offset or limit is negative */
    static PagingWindow of(std::int64_t offset, std::int64_t limit);
};

struct RawSqlModel {
    std::string sql;
    Bindings bindings;
};

struct SelectModel {
    std::string table;
    std::vector<std::string> columns;       // empty means all columns
    Criteria criteria;
    std::vector<SortOrder> ordering;
    std::optional<PagingWindow> paging;
};

struct InsertModel {
    std::string table;
    std::vector<std::pair<std::string, Parameter>> values;
};

using StatementModel = std::variant<RawSqlModel, SelectModel, InsertModel>;

// SQL text and bindings ready for Connection::executeStatement
struct RenderedStatement {
    std::string sql;
    Bindings bindings;
};

/**
 * @brief Immutable description of one SQL operation
 *
 * Factories validate the model and throw InvalidSpecification; a constructed
 * spec is always executable as far as the client can tell.
 */
class StatementSpec {
public:
    static StatementSpec raw(std::string sql, const ParameterBinder& binder);
    static StatementSpec select(SelectModel model);
    static StatementSpec insert(InsertModel model);

    OperationKind getKind() const noexcept { return static_cast<OperationKind>(model_.index()); }
    const StatementModel& getModel() const noexcept { return model_; }

    RenderedStatement render(const Dialect& dialect) const;

    // Short form for log messages
    std::string describe() const;

private:
    explicit StatementSpec(StatementModel model) : model_(std::move(model)) {}

    StatementModel model_;
};

} // namespace core
} // namespace rdbcpp
