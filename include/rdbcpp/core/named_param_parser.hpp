#pragma once

#include "rdbcpp/core/parameter.hpp"
#include <string>
#include <vector>

namespace rdbcpp {
namespace core {

/**
 * @brief One placeholder occurrence in SQL text
 */
struct PlaceholderRef {
    Placeholder placeholder;   // normalized name, or index for '?' markers
    size_t position;           // position among all markers (0-based)
    size_t sqlOffset;          // offset in the original SQL string
};

/**
 * @brief Scanner for bind markers in SQL statements
 *
 * Recognizes :name, @name, $1 and ? markers and rewrites all of them to ?.
 * String literals, quoted identifiers, comments and "::" casts are skipped.
 * Named markers compare case-insensitively; the same name may appear several
 * times and then maps to several positions.
 */
class NamedParamParser {
public:
    struct ParseResult {
        std::string convertedSql;                 // SQL with ? for every marker
        std::vector<PlaceholderRef> markers;      // every marker in order
        std::vector<Placeholder> distinct;        // distinct placeholders in order of first use
        bool hasNamedParams = false;
        bool hasPositionalParams = false;

        bool references(const Placeholder& placeholder) const;
    };

    static ParseResult parse(const std::string& sql);

    /**
     * @brief Check bindings against the placeholders referenced by the SQL
     *
     * Index i addresses the i-th distinct placeholder in order of first use.
     * @throws InvalidSpecification for an unbound placeholder, a binding the
     *         SQL never references, or named bindings against ? markers
     */
    static void validate(const ParseResult& parsed, const Bindings& bindings);

    /**
     * @brief Parameters in marker order, one per ? of convertedSql
     * @throws InvalidSpecification when a marker has no binding
     */
    static std::vector<Parameter> arrange(const ParseResult& parsed, const Bindings& bindings);

private:
    static bool isIdentifierStart(char c);
    static bool isIdentifierPart(char c);
};

} // namespace core
} // namespace rdbcpp
