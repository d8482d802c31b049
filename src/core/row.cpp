#include "rdbcpp/core/row.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <sstream>

namespace rdbcpp {
namespace core {

namespace {

bool equalsIgnoreCase(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

nlohmann::ordered_json valueToJson(const Value& value) {
    return std::visit([&value](const auto& v) -> nlohmann::ordered_json {
        using V = std::decay_t<decltype(v)>;
        if constexpr (std::is_arithmetic_v<V> || std::is_same_v<V, std::string>) {
            return v;
        } else {
            // Bytes and temporal values are rendered as text
            return core::toString(value);
        }
    }, value);
}

} // namespace

Row::Row(ColumnSet columns, RawRow fields, size_t index)
    : columns_(std::move(columns))
    , fields_(std::move(fields))
    , index_(index) {
    if (!columns_) {
        columns_ = std::make_shared<const std::vector<ColumnMetadata>>();
    }
}

std::optional<size_t> Row::findColumn(const std::string& name) const {
    const auto& columns = *columns_;
    for (size_t i = 0; i < columns.size(); ++i) {
        if (equalsIgnoreCase(columns[i].name, name)) {
            return i;
        }
    }
    return std::nullopt;
}

const Field& Row::operator[](size_t position) const {
    if (position >= fields_.size()) {
        throw MappingFailed("Column position " + std::to_string(position) +
                            " out of range (row has " + std::to_string(fields_.size()) + " columns)",
                            index_);
    }
    return fields_[position];
}

const Field& Row::operator[](const std::string& name) const {
    auto position = findColumn(name);
    if (!position) {
        throw MappingFailed("Column '" + name + "' is not in the result", index_);
    }
    return (*this)[*position];
}

std::string Row::columnName(size_t position) const {
    const auto& columns = *columns_;
    return position < columns.size() ? columns[position].name : "#" + std::to_string(position);
}

nlohmann::ordered_json Row::toJson() const {
    nlohmann::ordered_json obj = nlohmann::ordered_json::object();
    for (size_t i = 0; i < fields_.size(); ++i) {
        obj[columnName(i)] = fields_[i] ? valueToJson(*fields_[i]) : nlohmann::ordered_json(nullptr);
    }
    return obj;
}

std::string Row::toString() const {
    std::ostringstream oss;
    oss << '{';
    for (size_t i = 0; i < fields_.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << columnName(i) << ": " << core::toString(fields_[i]);
    }
    oss << '}';
    return oss.str();
}

bool Row::operator==(const Row& other) const {
    if (fields_ != other.fields_ || columns_->size() != other.columns_->size()) {
        return false;
    }
    for (size_t i = 0; i < columns_->size(); ++i) {
        if ((*columns_)[i].name != (*other.columns_)[i].name) {
            return false;
        }
    }
    return true;
}

} // namespace core
} // namespace rdbcpp
