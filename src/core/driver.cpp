#include "rdbcpp/core/driver.hpp"
#include "rdbcpp/core/exception.hpp"
#include <algorithm>
#include <cctype>

namespace rdbcpp {
namespace core {

std::string_view toString(IsolationLevel level) noexcept {
    switch (level) {
        case IsolationLevel::Default:         return "default";
        case IsolationLevel::ReadUncommitted: return "read_uncommitted";
        case IsolationLevel::ReadCommitted:   return "read_committed";
        case IsolationLevel::RepeatableRead:  return "repeatable_read";
        case IsolationLevel::Serializable:    return "serializable";
    }
    return "default";
}

IsolationLevel parseIsolationLevel(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return c == '-' || c == ' ' ? '_' : std::tolower(c); });

    if (lower.empty() || lower == "default") return IsolationLevel::Default;
    if (lower == "read_uncommitted") return IsolationLevel::ReadUncommitted;
    if (lower == "read_committed") return IsolationLevel::ReadCommitted;
    if (lower == "repeatable_read") return IsolationLevel::RepeatableRead;
    if (lower == "serializable") return IsolationLevel::Serializable;
    throw InvalidSpecification("Unknown isolation level: " + name);
}

} // namespace core
} // namespace rdbcpp
