#pragma once

#include "rdbcpp/core/parameter.hpp"
#include <initializer_list>
#include <string>
#include <vector>

namespace rdbcpp {
namespace core {

class CriteriaStep;

/**
 * @brief Conjunction of column predicates for generated SELECT statements
 *
 * Immutable: every call returns a new Criteria.
 * @code
 * auto c = Criteria::where("name").like("Lego%").andWhere("id").greaterThan(10);
 * @endcode
 */
class Criteria {
public:
    enum class Comparator {
        Is,
        IsNot,
        GreaterThan,
        GreaterThanOrEquals,
        LessThan,
        LessThanOrEquals,
        Like,
        In,
        IsNull,
        IsNotNull
    };

    struct Predicate {
        std::string column;
        Comparator comparator;
        std::vector<Parameter> values;
    };

    Criteria() = default;

    static Criteria empty() { return Criteria(); }
    static CriteriaStep where(std::string column);

    CriteriaStep andWhere(std::string column) const;

    bool isEmpty() const noexcept { return predicates_.empty(); }
    const std::vector<Predicate>& getPredicates() const noexcept { return predicates_; }

private:
    friend class CriteriaStep;

    Criteria with(Predicate predicate) const;

    std::vector<Predicate> predicates_;
};

/**
 * @brief Pending predicate on one column; picking a comparator completes it
 */
class CriteriaStep {
public:
    template<typename T>
    Criteria is(T&& value) const { return complete(Criteria::Comparator::Is, {Parameter::from(std::forward<T>(value))}); }

    template<typename T>
    Criteria isNot(T&& value) const { return complete(Criteria::Comparator::IsNot, {Parameter::from(std::forward<T>(value))}); }

    template<typename T>
    Criteria greaterThan(T&& value) const { return complete(Criteria::Comparator::GreaterThan, {Parameter::from(std::forward<T>(value))}); }

    template<typename T>
    Criteria greaterThanOrEquals(T&& value) const { return complete(Criteria::Comparator::GreaterThanOrEquals, {Parameter::from(std::forward<T>(value))}); }

    template<typename T>
    Criteria lessThan(T&& value) const { return complete(Criteria::Comparator::LessThan, {Parameter::from(std::forward<T>(value))}); }

    template<typename T>
    Criteria lessThanOrEquals(T&& value) const { return complete(Criteria::Comparator::LessThanOrEquals, {Parameter::from(std::forward<T>(value))}); }

    Criteria like(std::string pattern) const {
        return complete(Criteria::Comparator::Like, {Parameter::from(std::move(pattern))});
    }

    template<typename T>
    Criteria in(const std::vector<T>& values) const {
        std::vector<Parameter> params;
        params.reserve(values.size());
        for (const auto& v : values) {
            params.push_back(Parameter::from(v));
        }
        return complete(Criteria::Comparator::In, std::move(params));
    }

    template<typename T>
    Criteria in(std::initializer_list<T> values) const {
        return in(std::vector<T>(values));
    }

    Criteria isNull() const { return complete(Criteria::Comparator::IsNull, {}); }
    Criteria isNotNull() const { return complete(Criteria::Comparator::IsNotNull, {}); }

private:
    friend class Criteria;

    CriteriaStep(Criteria base, std::string column)
        : base_(std::move(base)), column_(std::move(column)) {}

    Criteria complete(Criteria::Comparator comparator, std::vector<Parameter> values) const;

    Criteria base_;
    std::string column_;
};

} // namespace core
} // namespace rdbcpp
