#pragma once

#include "rdbcpp/core/parameter.hpp"
#include <cstdint>
#include <memory>
#include <string>

namespace rdbcpp {
namespace core {

/**
 * @brief SQL flavour used when generating statements
 *
 * Raw SQL is never touched by a dialect; only generic select/insert
 * statements are rendered through it.
 */
class Dialect {
public:
    virtual ~Dialect() = default;

    virtual std::string getName() const = 0;

    /** @brief Marker text for the index-th (0-based) generated parameter */
    virtual std::string bindMarker(size_t index) const = 0;

    /** @brief Binding key matching bindMarker(index) */
    virtual Placeholder bindingKey(size_t index) const = 0;

    /** @brief Paging clause appended after ORDER BY */
    virtual std::string renderPaging(std::uint64_t offset, std::uint64_t limit) const = 0;

    /**
     * @brief Look up a dialect by configuration name
     * @param name "postgres", "firebird" or "ansi" (case-insensitive)
     * @throws InvalidSpecification for an unknown name
     */
    static std::shared_ptr<const Dialect> fromName(const std::string& name);
};

// $1, $2 ... markers addressed by name, LIMIT/OFFSET paging
class PostgresDialect : public Dialect {
public:
    std::string getName() const override { return "postgres"; }
    std::string bindMarker(size_t index) const override;
    Placeholder bindingKey(size_t index) const override;
    std::string renderPaging(std::uint64_t offset, std::uint64_t limit) const override;
};

// ? markers addressed by index, SQL:2008 OFFSET/FETCH paging
class AnsiDialect : public Dialect {
public:
    std::string getName() const override { return "ansi"; }
    std::string bindMarker(size_t index) const override;
    Placeholder bindingKey(size_t index) const override;
    std::string renderPaging(std::uint64_t offset, std::uint64_t limit) const override;
};

// Firebird 3+ accepts the SQL:2008 form
class FirebirdDialect : public AnsiDialect {
public:
    std::string getName() const override { return "firebird"; }
};

} // namespace core
} // namespace rdbcpp
