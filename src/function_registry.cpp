/**
 * @file function_registry.cpp
 * @brief Implementation of FunctionRegistry
 */

#include "function_registry.hpp"
#include "builtin_functions.hpp"
#include "logger.hpp"
#include <stdexcept>

namespace reportcalc {

FunctionRegistry::FunctionRegistry(bool include_builtins) {
    if (include_builtins) {
        register_builtin_functions(*this);
    }
}

void FunctionRegistry::register_function(const std::string& name, CalcFunction fn) {
    if (name.empty()) {
        throw std::invalid_argument("Function name must not be empty");
    }
    if (!fn) {
        throw std::invalid_argument("Function '" + name + "' has no callable");
    }

    bool replaced = registry_.find(name) != registry_.end();
    registry_[name] = std::move(fn);
    Logger::get_instance().log_registration("functions", name, replaced);
}

const FunctionRegistry::CalcFunction* FunctionRegistry::get(const std::string& name) const {
    auto it = registry_.find(name);
    if (it == registry_.end()) {
        return nullptr;
    }
    return &it->second;
}

bool FunctionRegistry::has_function(const std::string& name) const {
    return registry_.find(name) != registry_.end();
}

std::vector<std::string> FunctionRegistry::list_functions() const {
    std::vector<std::string> names;
    names.reserve(registry_.size());
    for (const auto& pair : registry_) {
        names.push_back(pair.first);
    }
    return names;
}

} // namespace reportcalc
