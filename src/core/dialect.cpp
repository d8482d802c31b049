#include "rdbcpp/core/dialect.hpp"
#include "rdbcpp/core/exception.hpp"
#include <algorithm>
#include <cctype>

namespace rdbcpp {
namespace core {

std::shared_ptr<const Dialect> Dialect::fromName(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lower == "postgres" || lower == "postgresql") {
        return std::make_shared<PostgresDialect>();
    }
    if (lower == "firebird") {
        return std::make_shared<FirebirdDialect>();
    }
    if (lower == "ansi") {
        return std::make_shared<AnsiDialect>();
    }
    throw InvalidSpecification("Unknown SQL dialect: " + name);
}

std::string PostgresDialect::bindMarker(size_t index) const {
    return "$" + std::to_string(index + 1);
}

Placeholder PostgresDialect::bindingKey(size_t index) const {
    return Placeholder{bindMarker(index)};
}

std::string PostgresDialect::renderPaging(std::uint64_t offset, std::uint64_t limit) const {
    std::string clause = "LIMIT " + std::to_string(limit);
    if (offset > 0) {
        clause += " OFFSET " + std::to_string(offset);
    }
    return clause;
}

std::string AnsiDialect::bindMarker(size_t) const {
    return "?";
}

Placeholder AnsiDialect::bindingKey(size_t index) const {
    return Placeholder{index};
}

std::string AnsiDialect::renderPaging(std::uint64_t offset, std::uint64_t limit) const {
    return "OFFSET " + std::to_string(offset) + " ROWS FETCH NEXT " +
           std::to_string(limit) + " ROWS ONLY";
}

} // namespace core
} // namespace rdbcpp
