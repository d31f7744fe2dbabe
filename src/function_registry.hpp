/**
 * @file function_registry.hpp
 * @brief Named calculation functions for derived report fields
 *
 * Design Pattern: Registry of factory-style callables
 * - Built-in functions are registered by the constructor
 * - Callers register extensions by name before computing fields
 * - The Field Calculator looks functions up by the name in a mapping
 */

#ifndef REPORTCALC_FUNCTION_REGISTRY_HPP
#define REPORTCALC_FUNCTION_REGISTRY_HPP

#include <nlohmann/json.hpp>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace reportcalc {

/**
 * @brief Registry of scalar calculation functions
 *
 * The registry is populated during start-up and read afterwards; concurrent
 * registration while fields are being calculated is not supported.
 *
 * Usage Example:
 *   @code
 *   FunctionRegistry registry;
 *   registry.register_function("double_it", [](const std::vector<nlohmann::json>& args) {
 *       return nlohmann::json(args.at(0).get<double>() * 2);
 *   });
 *   @endcode
 */
class FunctionRegistry {
public:
    /**
     * @brief Calculation function type
     *
     * Receives already-resolved (and coerced) argument values, returns a
     * scalar. May throw; the calculator wraps failures.
     */
    using CalcFunction = std::function<nlohmann::json(const std::vector<nlohmann::json>&)>;

    /**
     * @brief Constructor
     *
     * @param include_builtins Register the built-in functions
     */
    explicit FunctionRegistry(bool include_builtins = true);

    /**
     * @brief Register a function, replacing any existing entry of that name
     *
     * @throws std::invalid_argument If name is empty or fn is empty
     */
    void register_function(const std::string& name, CalcFunction fn);

    /**
     * @brief Look up a function
     *
     * @return Pointer to the function, or nullptr if not registered
     */
    const CalcFunction* get(const std::string& name) const;

    bool has_function(const std::string& name) const;

    /**
     * @brief Get registered names in sorted order
     */
    std::vector<std::string> list_functions() const;

    size_t size() const { return registry_.size(); }

private:
    std::map<std::string, CalcFunction> registry_;
};

} // namespace reportcalc

#endif // REPORTCALC_FUNCTION_REGISTRY_HPP
