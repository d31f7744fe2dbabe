#ifndef REPORTCALC_PATH_NAVIGATOR_HPP
#define REPORTCALC_PATH_NAVIGATOR_HPP

#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <vector>

namespace reportcalc {

// Thrown when a value cannot be written at a path
class PathError : public std::runtime_error {
public:
    explicit PathError(const std::string& message)
        : std::runtime_error(message) {}
};

// Split "extracted_data.rated_wattage" into {"extracted_data", "rated_wattage"}.
// Empty segments are kept so that malformed paths never match.
std::vector<std::string> split_path(const std::string& path);

// PathNavigator: dot-separated get/set over nested JSON objects
class PathNavigator {
public:
    // Locate the value at path. Returns nullptr if the path is empty,
    // a segment is missing, or an intermediate value is not an object.
    // Never throws.
    static const nlohmann::json* get(const nlohmann::json& data, const std::string& path);
    static nlohmann::json* get(nlohmann::json& data, const std::string& path);

    static bool contains(const nlohmann::json& data, const std::string& path) {
        return get(data, path) != nullptr;
    }

    // Assign value at path, creating empty objects for missing intermediate
    // segments. Throws PathError for an empty path or when an existing
    // intermediate value is not an object.
    static void set(nlohmann::json& data, const std::string& path, nlohmann::json value);
};

} // namespace reportcalc

#endif // REPORTCALC_PATH_NAVIGATOR_HPP
