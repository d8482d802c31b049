#pragma once

#include "rdbcpp/core/exception.hpp"
#include <chrono>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace rdbcpp {
namespace core {

/**
 * @brief Declared SQL type of a value or column
 *
 * Enumerator order matches the alternative order of Value.
 */
enum class SqlType : unsigned {
    Boolean = 0,
    SmallInt,
    Integer,
    BigInt,
    Float,
    Double,
    Text,
    Binary,
    Date,
    Time,
    Timestamp
};

using Bytes = std::vector<std::uint8_t>;
using Date = std::chrono::year_month_day;
using Time = std::chrono::microseconds;     // time of day, since midnight
using Timestamp = std::chrono::sys_time<std::chrono::microseconds>;

using Value = std::variant<bool,
                           std::int16_t,
                           std::int32_t,
                           std::int64_t,
                           float,
                           double,
                           std::string,
                           Bytes,
                           Date,
                           Time,
                           Timestamp>;

// A nullable column value as produced by a cursor
using Field = std::optional<Value>;

inline SqlType typeOf(const Value& value) noexcept {
    return static_cast<SqlType>(value.index());
}

std::string_view toString(SqlType type) noexcept;

// Human readable rendering used for logging and Row::toString
std::string toString(const Value& value);
std::string toString(const Field& field);

// Traits mapping C++ types to their declared SQL type
template<typename T, typename = void>
struct SqlTypeTraits {};

template<>
struct SqlTypeTraits<bool> {
    static constexpr SqlType sql_type = SqlType::Boolean;
    static constexpr const char* type_name = "BOOLEAN";
};

template<typename T>
struct SqlTypeTraits<T, std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>>> {
    // Unsigned types widen to the next signed type so every value fits
    static constexpr size_t width = std::is_signed_v<T> ? sizeof(T) : sizeof(T) * 2;
    static constexpr SqlType sql_type = width <= 2 ? SqlType::SmallInt
                                      : width <= 4 ? SqlType::Integer
                                                   : SqlType::BigInt;
    static constexpr const char* type_name = width <= 2 ? "SMALLINT"
                                           : width <= 4 ? "INTEGER"
                                                        : "BIGINT";
};

template<>
struct SqlTypeTraits<float> {
    static constexpr SqlType sql_type = SqlType::Float;
    static constexpr const char* type_name = "FLOAT";
};

template<>
struct SqlTypeTraits<double> {
    static constexpr SqlType sql_type = SqlType::Double;
    static constexpr const char* type_name = "DOUBLE PRECISION";
};

template<>
struct SqlTypeTraits<std::string> {
    static constexpr SqlType sql_type = SqlType::Text;
    static constexpr const char* type_name = "VARCHAR";
};

template<>
struct SqlTypeTraits<std::string_view> : SqlTypeTraits<std::string> {};

template<>
struct SqlTypeTraits<const char*> : SqlTypeTraits<std::string> {};

template<>
struct SqlTypeTraits<Bytes> {
    static constexpr SqlType sql_type = SqlType::Binary;
    static constexpr const char* type_name = "VARBINARY";
};

template<>
struct SqlTypeTraits<Date> {
    static constexpr SqlType sql_type = SqlType::Date;
    static constexpr const char* type_name = "DATE";
};

template<>
struct SqlTypeTraits<Time> {
    static constexpr SqlType sql_type = SqlType::Time;
    static constexpr const char* type_name = "TIME";
};

template<typename Duration>
struct SqlTypeTraits<std::chrono::sys_time<Duration>> {
    static constexpr SqlType sql_type = SqlType::Timestamp;
    static constexpr const char* type_name = "TIMESTAMP";
};

template<typename T, typename = void>
struct is_sql_type : std::false_type {};

template<typename T>
struct is_sql_type<T, std::void_t<decltype(SqlTypeTraits<T>::sql_type)>> : std::true_type {};

template<typename T>
inline constexpr bool is_sql_type_v = is_sql_type<std::decay_t<T>>::value;

template<typename T>
inline constexpr SqlType sqlTypeOf = SqlTypeTraits<std::decay_t<T>>::sql_type;

/**
 * @brief Convert a supported C++ value into a Value
 * @throws InvalidSpecification for an unsigned value above the BIGINT range
 */
template<typename T>
Value toValue(T&& input) {
    using U = std::decay_t<T>;
    static_assert(is_sql_type_v<U>, "Type has no SQL mapping");

    if constexpr (std::is_same_v<U, bool>) {
        return Value{input};
    } else if constexpr (std::is_integral_v<U>) {
        constexpr SqlType type = sqlTypeOf<U>;
        if constexpr (type == SqlType::SmallInt) {
            return Value{static_cast<std::int16_t>(input)};
        } else if constexpr (type == SqlType::Integer) {
            return Value{static_cast<std::int32_t>(input)};
        } else {
            if constexpr (!std::is_signed_v<U> && sizeof(U) >= sizeof(std::int64_t)) {
                if (input > static_cast<U>(std::numeric_limits<std::int64_t>::max())) {
                    throw InvalidSpecification("Unsigned value " + std::to_string(input) +
                                               " does not fit BIGINT");
                }
            }
            return Value{static_cast<std::int64_t>(input)};
        }
    } else if constexpr (std::is_same_v<U, float> || std::is_same_v<U, double>) {
        return Value{input};
    } else if constexpr (std::is_same_v<U, std::string_view> || std::is_same_v<U, const char*>) {
        return Value{std::string(input)};
    } else if constexpr (std::is_same_v<U, std::string> || std::is_same_v<U, Bytes> ||
                         std::is_same_v<U, Date> || std::is_same_v<U, Time>) {
        return Value{std::forward<T>(input)};
    } else {
        return Value{std::chrono::time_point_cast<std::chrono::microseconds>(input)};
    }
}

/**
 * @brief Convert a Value into T
 *
 * Integers convert between widths when the value fits, integers and floats
 * convert to floating point, every other alternative must match exactly.
 * @return false when the stored alternative cannot represent a T
 */
template<typename T>
bool convertValue(const Value& value, T& out) {
    if constexpr (std::is_same_v<T, bool>) {
        if (auto* b = std::get_if<bool>(&value)) {
            out = *b;
            return true;
        }
        return false;
    } else if constexpr (std::is_integral_v<T>) {
        std::int64_t wide = 0;
        if (auto* v16 = std::get_if<std::int16_t>(&value)) wide = *v16;
        else if (auto* v32 = std::get_if<std::int32_t>(&value)) wide = *v32;
        else if (auto* v64 = std::get_if<std::int64_t>(&value)) wide = *v64;
        else return false;

        if constexpr (std::is_signed_v<T>) {
            if (wide < static_cast<std::int64_t>(std::numeric_limits<T>::min()) ||
                wide > static_cast<std::int64_t>(std::numeric_limits<T>::max())) {
                return false;
            }
        } else {
            if (wide < 0 ||
                static_cast<std::uint64_t>(wide) > static_cast<std::uint64_t>(std::numeric_limits<T>::max())) {
                return false;
            }
        }
        out = static_cast<T>(wide);
        return true;
    } else if constexpr (std::is_floating_point_v<T>) {
        return std::visit([&out](const auto& v) {
            using V = std::decay_t<decltype(v)>;
            if constexpr (std::is_arithmetic_v<V> && !std::is_same_v<V, bool>) {
                out = static_cast<T>(v);
                return true;
            } else {
                return false;
            }
        }, value);
    } else if constexpr (std::is_same_v<T, std::string> || std::is_same_v<T, Bytes> ||
                         std::is_same_v<T, Date> || std::is_same_v<T, Time> ||
                         std::is_same_v<T, Timestamp>) {
        if (auto* v = std::get_if<T>(&value)) {
            out = *v;
            return true;
        }
        return false;
    } else {
        static_assert(is_sql_type_v<T>, "Type has no SQL mapping");
        return false;
    }
}

} // namespace core
} // namespace rdbcpp
