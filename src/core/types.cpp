#include "rdbcpp/core/types.hpp"
#include <cstdio>
#include <iomanip>
#include <sstream>

namespace rdbcpp {
namespace core {

namespace {

void appendDate(std::ostringstream& oss, const Date& date) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u",
                  static_cast<int>(date.year()),
                  static_cast<unsigned>(date.month()),
                  static_cast<unsigned>(date.day()));
    oss << buf;
}

void appendTime(std::ostringstream& oss, Time time) {
    using namespace std::chrono;
    auto h = duration_cast<hours>(time);
    auto m = duration_cast<minutes>(time - h);
    auto s = duration_cast<seconds>(time - h - m);
    auto us = time - h - m - s;
    char buf[24];
    std::snprintf(buf, sizeof(buf), "%02lld:%02lld:%02lld.%06lld",
                  static_cast<long long>(h.count()),
                  static_cast<long long>(m.count()),
                  static_cast<long long>(s.count()),
                  static_cast<long long>(us.count()));
    oss << buf;
}

} // namespace

std::string_view toString(SqlType type) noexcept {
    switch (type) {
        case SqlType::Boolean:   return "BOOLEAN";
        case SqlType::SmallInt:  return "SMALLINT";
        case SqlType::Integer:   return "INTEGER";
        case SqlType::BigInt:    return "BIGINT";
        case SqlType::Float:     return "FLOAT";
        case SqlType::Double:    return "DOUBLE PRECISION";
        case SqlType::Text:      return "VARCHAR";
        case SqlType::Binary:    return "VARBINARY";
        case SqlType::Date:      return "DATE";
        case SqlType::Time:      return "TIME";
        case SqlType::Timestamp: return "TIMESTAMP";
    }
    return "UNKNOWN";
}

std::string toString(const Value& value) {
    std::ostringstream oss;
    std::visit([&oss](const auto& v) {
        using V = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<V, bool>) {
            oss << (v ? "true" : "false");
        } else if constexpr (std::is_same_v<V, std::string>) {
            oss << '\'' << v << '\'';
        } else if constexpr (std::is_same_v<V, Bytes>) {
            oss << "0x";
            for (auto byte : v) {
                oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<unsigned>(byte);
            }
        } else if constexpr (std::is_same_v<V, Date>) {
            appendDate(oss, v);
        } else if constexpr (std::is_same_v<V, Time>) {
            appendTime(oss, v);
        } else if constexpr (std::is_same_v<V, Timestamp>) {
            auto day = std::chrono::floor<std::chrono::days>(v);
            appendDate(oss, Date{day});
            oss << 'T';
            appendTime(oss, v - day);
        } else {
            oss << v;
        }
    }, value);
    return oss.str();
}

std::string toString(const Field& field) {
    return field ? toString(*field) : std::string("NULL");
}

} // namespace core
} // namespace rdbcpp
