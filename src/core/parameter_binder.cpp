#include "rdbcpp/core/parameter.hpp"
#include "rdbcpp/core/exception.hpp"
#include <algorithm>
#include <cctype>

namespace rdbcpp {
namespace core {

std::string toString(const Placeholder& placeholder) {
    if (auto* name = std::get_if<std::string>(&placeholder)) {
        return *name;
    }
    return "#" + std::to_string(std::get<size_t>(placeholder));
}

std::string normalizePlaceholderName(const std::string& name) {
    if (name.empty() || name[0] == '$') {
        return name;
    }
    std::string result = (name[0] == ':' || name[0] == '@') ? name.substr(1) : name;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

void ParameterBinder::bind(const std::string& name, Parameter parameter) {
    std::string normalized = normalizePlaceholderName(name);
    if (normalized.empty() || normalized == "$") {
        throw InvalidSpecification("Placeholder name must not be empty");
    }
    checkAddressing(Addressing::ByName);
    upsert(Placeholder{std::move(normalized)}, std::move(parameter));
}

void ParameterBinder::bind(size_t index, Parameter parameter) {
    checkAddressing(Addressing::ByIndex);
    upsert(Placeholder{index}, std::move(parameter));
}

const Parameter* ParameterBinder::find(const std::string& name) const {
    Placeholder key{normalizePlaceholderName(name)};
    for (const auto& binding : bindings_) {
        if (binding.placeholder == key) {
            return &binding.parameter;
        }
    }
    return nullptr;
}

const Parameter* ParameterBinder::find(size_t index) const {
    Placeholder key{index};
    for (const auto& binding : bindings_) {
        if (binding.placeholder == key) {
            return &binding.parameter;
        }
    }
    return nullptr;
}

void ParameterBinder::checkAddressing(Addressing requested) {
    if (addressing_ == Addressing::None) {
        addressing_ = requested;
        return;
    }
    if (addressing_ != requested) {
        throw InvalidSpecification(
            requested == Addressing::ByName
                ? "Cannot bind by name: this statement already binds parameters by index"
                : "Cannot bind by index: this statement already binds parameters by name");
    }
}

void ParameterBinder::upsert(Placeholder placeholder, Parameter parameter) {
    auto it = std::find_if(bindings_.begin(), bindings_.end(),
                           [&](const Binding& b) { return b.placeholder == placeholder; });
    if (it != bindings_.end()) {
        it->parameter = std::move(parameter);
        return;
    }
    bindings_.push_back(Binding{std::move(placeholder), std::move(parameter)});
}

} // namespace core
} // namespace rdbcpp
