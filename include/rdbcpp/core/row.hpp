#pragma once

#include "rdbcpp/core/driver.hpp"
#include "rdbcpp/core/exception.hpp"
#include "rdbcpp/core/types.hpp"
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace rdbcpp {
namespace core {

using ColumnSet = std::shared_ptr<const std::vector<ColumnMetadata>>;

/**
 * @brief One result row: fields in driver column order
 *
 * Rows of one result share the same ColumnSet. Column lookup by name is
 * case-insensitive since Firebird reports unquoted names in upper case.
 */
class Row {
public:
    Row(ColumnSet columns, RawRow fields, size_t index = 0);

    size_t size() const noexcept { return fields_.size(); }
    size_t getIndex() const noexcept { return index_; }
    const std::vector<ColumnMetadata>& getColumns() const noexcept { return *columns_; }
    const ColumnSet& getColumnSet() const noexcept { return columns_; }
    const RawRow& getFields() const noexcept { return fields_; }

    std::optional<size_t> findColumn(const std::string& name) const;
    bool hasColumn(const std::string& name) const { return findColumn(name).has_value(); }

    const Field& operator[](size_t position) const;
    const Field& operator[](const std::string& name) const;

    bool isNull(size_t position) const { return !(*this)[position].has_value(); }
    bool isNull(const std::string& name) const { return !(*this)[name].has_value(); }

    /**
     * @brief Typed access; T may be std::optional<U> for nullable columns
     * @throws MappingFailed for a missing column, NULL into a non-optional,
     *         or a value that does not convert to T
     */
    template<typename T>
    T get(const std::string& name) const {
        auto position = findColumn(name);
        if (!position) {
            throw MappingFailed("Column '" + name + "' is not in the result", index_);
        }
        return get<T>(*position);
    }

    template<typename T>
    T get(size_t position) const {
        const Field& field = (*this)[position];
        if constexpr (is_optional<T>::value) {
            if (!field) {
                return std::nullopt;
            }
            return convert<typename T::value_type>(*field, position);
        } else {
            if (!field) {
                throw MappingFailed("Column '" + columnName(position) + "' is NULL", index_);
            }
            return convert<T>(*field, position);
        }
    }

    // Keys keep column order
    nlohmann::ordered_json toJson() const;
    std::string toString() const;

    bool operator==(const Row& other) const;

private:
    template<typename T>
    struct is_optional : std::false_type {};
    template<typename T>
    struct is_optional<std::optional<T>> : std::true_type {};

    template<typename T>
    T convert(const Value& value, size_t position) const {
        if constexpr (std::is_same_v<T, Value>) {
            return value;
        } else {
            T out{};
            if (!convertValue(value, out)) {
                throw MappingFailed("Column '" + columnName(position) + "' holds " +
                                    std::string(core::toString(typeOf(value))) +
                                    ", cannot convert", index_);
            }
            return out;
        }
    }

    std::string columnName(size_t position) const;

    ColumnSet columns_;
    RawRow fields_;
    size_t index_;
};

} // namespace core
} // namespace rdbcpp
