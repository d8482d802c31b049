#pragma once

#include "rdbcpp/core/types.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace rdbcpp {
namespace core {

/**
 * @brief A bound value, or a null that still carries its declared type
 *
 * A null always carries a type: the driver chooses the wire representation
 * from it even when no value is present.
 */
class Parameter {
public:
    static Parameter of(Value value) {
        SqlType type = typeOf(value);
        return Parameter(std::move(value), type);
    }

    static Parameter null(SqlType type) {
        return Parameter(std::nullopt, type);
    }

    template<typename T>
    static Parameter from(T&& input) {
        using U = std::decay_t<T>;
        if constexpr (std::is_same_v<U, Parameter>) {
            return std::forward<T>(input);
        } else if constexpr (std::is_same_v<U, Value>) {
            return of(std::forward<T>(input));
        } else if constexpr (is_optional<U>::value) {
            using Inner = typename U::value_type;
            if (!input.has_value()) {
                return null(sqlTypeOf<Inner>);
            }
            return of(toValue(*std::forward<T>(input)));
        } else {
            return of(toValue(std::forward<T>(input)));
        }
    }

    bool isNull() const noexcept { return !value_.has_value(); }
    SqlType getType() const noexcept { return type_; }
    const std::optional<Value>& getValue() const noexcept { return value_; }

    bool operator==(const Parameter& other) const {
        return type_ == other.type_ && value_ == other.value_;
    }

private:
    template<typename T>
    struct is_optional : std::false_type {};
    template<typename T>
    struct is_optional<std::optional<T>> : std::true_type {};

    Parameter(std::optional<Value> value, SqlType type)
        : value_(std::move(value)), type_(type) {}

    std::optional<Value> value_;
    SqlType type_;
};

// Named placeholder ("$1", "id") or 0-based position
using Placeholder = std::variant<std::string, size_t>;

std::string toString(const Placeholder& placeholder);

/**
 * @brief Canonical form of a placeholder name
 *
 * ":id", "@id" and "id" all address the same marker and compare
 * case-insensitively; "$1"-style names are kept verbatim.
 */
std::string normalizePlaceholderName(const std::string& name);

struct Binding {
    Placeholder placeholder;
    Parameter parameter;

    bool operator==(const Binding& other) const {
        return placeholder == other.placeholder && parameter == other.parameter;
    }
};

using Bindings = std::vector<Binding>;

/**
 * @brief Accumulates bindings for one statement
 *
 * Either every binding is addressed by name or every binding is addressed by
 * index; the first bind decides. Rebinding a placeholder replaces the previous
 * value in place.
 */
class ParameterBinder {
public:
    enum class Addressing {
        None,
        ByName,
        ByIndex
    };

    void bind(const std::string& name, Parameter parameter);
    void bind(size_t index, Parameter parameter);

    void bindNull(const std::string& name, SqlType type) { bind(name, Parameter::null(type)); }
    void bindNull(size_t index, SqlType type) { bind(index, Parameter::null(type)); }

    const Parameter* find(const std::string& name) const;
    const Parameter* find(size_t index) const;

    const Bindings& getBindings() const noexcept { return bindings_; }
    Addressing getAddressing() const noexcept { return addressing_; }
    bool empty() const noexcept { return bindings_.empty(); }
    size_t size() const noexcept { return bindings_.size(); }

private:
    void checkAddressing(Addressing requested);
    void upsert(Placeholder placeholder, Parameter parameter);

    Bindings bindings_;
    Addressing addressing_ = Addressing::None;
};

} // namespace core
} // namespace rdbcpp
