#include "rdbcpp/core/criteria.hpp"
#include "rdbcpp/core/exception.hpp"

namespace rdbcpp {
namespace core {

CriteriaStep Criteria::where(std::string column) {
    return CriteriaStep(Criteria(), std::move(column));
}

CriteriaStep Criteria::andWhere(std::string column) const {
    return CriteriaStep(*this, std::move(column));
}

Criteria Criteria::with(Predicate predicate) const {
    Criteria next = *this;
    next.predicates_.push_back(std::move(predicate));
    return next;
}

Criteria CriteriaStep::complete(Criteria::Comparator comparator, std::vector<Parameter> values) const {
    if (column_.empty()) {
        throw InvalidSpecification("Criteria column name must not be empty");
    }
    if (comparator == Criteria::Comparator::In && values.empty()) {
        throw InvalidSpecification("IN criteria on '" + column_ + "' needs at least one value");
    }
    return base_.with(Criteria::Predicate{column_, comparator, std::move(values)});
}

} // namespace core
} // namespace rdbcpp
