#include "path_navigator.hpp"

namespace reportcalc {

std::vector<std::string> split_path(const std::string& path) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t dot = path.find('.', start);
        if (dot == std::string::npos) {
            parts.push_back(path.substr(start));
            break;
        }
        parts.push_back(path.substr(start, dot - start));
        start = dot + 1;
    }
    return parts;
}

const nlohmann::json* PathNavigator::get(const nlohmann::json& data, const std::string& path) {
    if (path.empty()) {
        return nullptr;
    }

    const nlohmann::json* current = &data;
    for (const auto& part : split_path(path)) {
        if (!current->is_object()) {
            return nullptr;
        }
        auto it = current->find(part);
        if (it == current->end()) {
            return nullptr;
        }
        current = &(*it);
    }
    return current;
}

nlohmann::json* PathNavigator::get(nlohmann::json& data, const std::string& path) {
    const nlohmann::json& const_data = data;
    return const_cast<nlohmann::json*>(get(const_data, path));
}

void PathNavigator::set(nlohmann::json& data, const std::string& path, nlohmann::json value) {
    if (path.empty()) {
        throw PathError("Cannot set value at an empty path");
    }

    std::vector<std::string> parts = split_path(path);
    nlohmann::json* current = &data;

    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        if (current->is_null()) {
            *current = nlohmann::json::object();
        }
        if (!current->is_object()) {
            throw PathError("Cannot set '" + path + "': segment '" + parts[i] +
                            "' is inside a non-object value");
        }
        auto it = current->find(parts[i]);
        if (it == current->end()) {
            it = current->emplace(parts[i], nlohmann::json::object()).first;
        }
        current = &(*it);
    }

    if (current->is_null()) {
        *current = nlohmann::json::object();
    }
    if (!current->is_object()) {
        throw PathError("Cannot set '" + path + "': parent of '" + parts.back() +
                        "' is not an object");
    }
    (*current)[parts.back()] = std::move(value);
}

} // namespace reportcalc
