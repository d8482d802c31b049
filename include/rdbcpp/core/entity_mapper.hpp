#pragma once

#include "rdbcpp/core/exception.hpp"
#include "rdbcpp/core/parameter.hpp"
#include "rdbcpp/core/row.hpp"
#include <memory>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

namespace rdbcpp {
namespace core {

using ColumnValues = std::vector<std::pair<std::string, Parameter>>;

/**
 * @brief Converts between rows and domain values of type T
 */
template<typename T>
class EntityMapper {
public:
    virtual ~EntityMapper() = default;

    /** @throws MappingFailed on missing columns or type mismatches */
    virtual T rowToEntity(const Row& row) const = 0;

    /** @brief Column/value pairs used for generic inserts */
    virtual ColumnValues entityToColumns(const T& entity) const = 0;
};

// Forward declaration
template<typename T>
struct EntityDescriptor;

namespace detail {

template<typename T, typename FieldType>
struct FieldDescriptor {
    using struct_type = T;
    using field_type = FieldType;
    using member_ptr_type = FieldType T::*;

    const char* column;
    member_ptr_type memberPtr;

    constexpr auto& access(T& obj) const noexcept { return obj.*memberPtr; }
    constexpr const auto& access(const T& obj) const noexcept { return obj.*memberPtr; }
};

template<typename T, typename = void>
struct has_entity_descriptor : std::false_type {};

template<typename T>
struct has_entity_descriptor<
    T,
    std::void_t<
        decltype(EntityDescriptor<T>::is_specialized),
        decltype(EntityDescriptor<T>::fields)
    >
> : std::bool_constant<EntityDescriptor<T>::is_specialized> {};

template<typename T>
inline constexpr bool has_entity_descriptor_v = has_entity_descriptor<T>::value;

} // namespace detail

/**
 * @brief Bind a struct member to a column name
 */
template<typename T, typename FieldType>
constexpr detail::FieldDescriptor<T, FieldType> makeField(FieldType T::* memberPtr, const char* column) {
    return detail::FieldDescriptor<T, FieldType>{column, memberPtr};
}

/**
 * @brief Column layout of a domain struct (not specialized)
 *
 * Specialize for each struct used with as<T>() or insert().entity():
 *
 * @code
 * struct LegoSet {
 *     int32_t id;
 *     std::string name;
 *     std::optional<int32_t> manual;
 * };
 *
 * template<>
 * struct rdbcpp::core::EntityDescriptor<LegoSet> {
 *     static constexpr bool is_specialized = true;
 *     static constexpr const char* name = "LEGOSET";
 *
 *     static constexpr auto fields = std::make_tuple(
 *         makeField(&LegoSet::id,     "ID"),
 *         makeField(&LegoSet::name,   "NAME"),
 *         makeField(&LegoSet::manual, "MANUAL")
 *     );
 * };
 * @endcode
 */
template<typename T>
struct EntityDescriptor {
    static constexpr bool is_specialized = false;
};

template<typename T>
concept DescribedEntity = detail::has_entity_descriptor_v<T> && std::is_default_constructible_v<T>;

/**
 * @brief EntityMapper driven by EntityDescriptor<T>
 *
 * Every described column must be present in the row; extra row columns are
 * ignored. Optional members accept NULL, others reject it.
 */
template<typename T>
    requires DescribedEntity<T>
class DescriptorMapper : public EntityMapper<T> {
public:
    T rowToEntity(const Row& row) const override {
        T result{};
        std::apply([&](const auto&... field) {
            (readField(row, result, field), ...);
        }, EntityDescriptor<T>::fields);
        return result;
    }

    ColumnValues entityToColumns(const T& entity) const override {
        ColumnValues columns;
        std::apply([&](const auto&... field) {
            (columns.emplace_back(field.column, Parameter::from(field.access(entity))), ...);
        }, EntityDescriptor<T>::fields);
        return columns;
    }

private:
    template<typename Field>
    static void readField(const Row& row, T& result, const Field& field) {
        using FieldType = typename Field::field_type;
        if (!row.hasColumn(field.column)) {
            throw MappingFailed(std::string("Column '") + field.column + "' required by " +
                                EntityDescriptor<T>::name + " is not in the result",
                                row.getIndex());
        }
        field.access(result) = row.template get<FieldType>(std::string(field.column));
    }
};

template<typename T>
    requires DescribedEntity<T>
std::shared_ptr<const EntityMapper<T>> defaultMapper() {
    static const auto mapper = std::make_shared<const DescriptorMapper<T>>();
    return mapper;
}

} // namespace core
} // namespace rdbcpp
