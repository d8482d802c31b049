#include "rdbcpp/core/named_param_parser.hpp"
#include "rdbcpp/core/exception.hpp"
#include <algorithm>
#include <cctype>
#include <iterator>

namespace rdbcpp {
namespace core {

bool NamedParamParser::ParseResult::references(const Placeholder& placeholder) const {
    return std::find(distinct.begin(), distinct.end(), placeholder) != distinct.end();
}

bool NamedParamParser::isIdentifierStart(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool NamedParamParser::isIdentifierPart(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

NamedParamParser::ParseResult NamedParamParser::parse(const std::string& sql) {
    ParseResult result;
    result.convertedSql.reserve(sql.size());

    size_t markerPosition = 0;
    size_t positionalIndex = 0;
    char currentQuote = '\0';
    bool inSingleLineComment = false;
    bool inMultiLineComment = false;

    auto addMarker = [&](Placeholder placeholder, size_t offset) {
        if (!result.references(placeholder)) {
            result.distinct.push_back(placeholder);
        }
        result.markers.push_back(PlaceholderRef{std::move(placeholder), markerPosition++, offset});
        result.convertedSql += '?';
    };

    for (size_t i = 0; i < sql.size(); ++i) {
        char ch = sql[i];
        char nextCh = (i + 1 < sql.size()) ? sql[i + 1] : '\0';

        // Inside a string literal or quoted identifier
        if (currentQuote != '\0') {
            result.convertedSql += ch;
            if (ch == currentQuote) {
                if (nextCh == currentQuote) {
                    result.convertedSql += nextCh;
                    ++i;
                } else {
                    currentQuote = '\0';
                }
            }
            continue;
        }

        if (inSingleLineComment) {
            result.convertedSql += ch;
            if (ch == '\n' || ch == '\r') {
                inSingleLineComment = false;
            }
            continue;
        }

        if (inMultiLineComment) {
            result.convertedSql += ch;
            if (ch == '*' && nextCh == '/') {
                result.convertedSql += nextCh;
                ++i;
                inMultiLineComment = false;
            }
            continue;
        }

        if (ch == '\'' || ch == '"') {
            currentQuote = ch;
            result.convertedSql += ch;
            continue;
        }

        if (ch == '-' && nextCh == '-') {
            inSingleLineComment = true;
            result.convertedSql += ch;
            continue;
        }

        if (ch == '/' && nextCh == '*') {
            inMultiLineComment = true;
            result.convertedSql += ch;
            continue;
        }

        // Type cast (value::integer), not a marker
        if (ch == ':' && nextCh == ':') {
            result.convertedSql += "::";
            ++i;
            continue;
        }

        if ((ch == ':' || ch == '@') && isIdentifierStart(nextCh)) {
            size_t nameEnd = i + 1;
            while (nameEnd < sql.size() && isIdentifierPart(sql[nameEnd])) {
                ++nameEnd;
            }
            std::string name = sql.substr(i + 1, nameEnd - i - 1);
            addMarker(Placeholder{normalizePlaceholderName(name)}, i);
            result.hasNamedParams = true;
            i = nameEnd - 1;
            continue;
        }

        if (ch == '$' && std::isdigit(static_cast<unsigned char>(nextCh))) {
            size_t nameEnd = i + 1;
            while (nameEnd < sql.size() && std::isdigit(static_cast<unsigned char>(sql[nameEnd]))) {
                ++nameEnd;
            }
            addMarker(Placeholder{sql.substr(i, nameEnd - i)}, i);
            result.hasNamedParams = true;
            i = nameEnd - 1;
            continue;
        }

        if (ch == '?') {
            addMarker(Placeholder{positionalIndex++}, i);
            result.hasPositionalParams = true;
            continue;
        }

        result.convertedSql += ch;
    }

    return result;
}

namespace {

const Parameter* findBinding(const Bindings& bindings, const Placeholder& key) {
    for (const auto& binding : bindings) {
        if (binding.placeholder == key) {
            return &binding.parameter;
        }
    }
    return nullptr;
}

// Index of the distinct placeholder a marker refers to
size_t distinctIndex(const NamedParamParser::ParseResult& parsed, const Placeholder& placeholder) {
    auto it = std::find(parsed.distinct.begin(), parsed.distinct.end(), placeholder);
    return static_cast<size_t>(std::distance(parsed.distinct.begin(), it));
}

bool bindsByIndex(const Bindings& bindings) {
    return !bindings.empty() && std::holds_alternative<size_t>(bindings.front().placeholder);
}

} // namespace

void NamedParamParser::validate(const ParseResult& parsed, const Bindings& bindings) {
    if (bindsByIndex(bindings)) {
        for (const auto& binding : bindings) {
            size_t index = std::get<size_t>(binding.placeholder);
            if (index >= parsed.distinct.size()) {
                throw InvalidSpecification("Binding #" + std::to_string(index) +
                                           " is not referenced; statement has " +
                                           std::to_string(parsed.distinct.size()) + " placeholder(s)");
            }
        }
        for (size_t i = 0; i < parsed.distinct.size(); ++i) {
            if (!findBinding(bindings, Placeholder{i})) {
                throw InvalidSpecification("No binding for placeholder " + toString(parsed.distinct[i]) +
                                           " (index " + std::to_string(i) + ")");
            }
        }
        return;
    }

    for (const auto& placeholder : parsed.distinct) {
        if (std::holds_alternative<size_t>(placeholder)) {
            throw InvalidSpecification("Positional '?' markers must be bound by index");
        }
        if (!findBinding(bindings, placeholder)) {
            throw InvalidSpecification("No binding for placeholder " + toString(placeholder));
        }
    }
    for (const auto& binding : bindings) {
        if (!parsed.references(binding.placeholder)) {
            throw InvalidSpecification("Binding " + toString(binding.placeholder) +
                                       " is not referenced by the statement");
        }
    }
}

std::vector<Parameter> NamedParamParser::arrange(const ParseResult& parsed, const Bindings& bindings) {
    bool byIndex = bindsByIndex(bindings);

    std::vector<Parameter> ordered;
    ordered.reserve(parsed.markers.size());
    for (const auto& marker : parsed.markers) {
        Placeholder key = byIndex ? Placeholder{distinctIndex(parsed, marker.placeholder)}
                                  : marker.placeholder;
        const Parameter* parameter = findBinding(bindings, key);
        if (!parameter) {
            throw InvalidSpecification("No binding for placeholder " + toString(marker.placeholder));
        }
        ordered.push_back(*parameter);
    }
    return ordered;
}

} // namespace core
} // namespace rdbcpp
