/**
 * @file logger.hpp
 * @brief Structured logging for field calculation and table transforms
 *
 * The Logger provides structured logging capabilities with:
 * - Multiple log levels (DEBUG, INFO, WARN, ERROR)
 * - JSON-formatted output for easy parsing
 * - Context tracking (component, target field or table, step index)
 * - Per-field and per-cell failure events
 *
 * Design Pattern: Singleton logger with structured event emission
 */

#ifndef REPORTCALC_LOGGER_HPP
#define REPORTCALC_LOGGER_HPP

#include <string>
#include <map>
#include <memory>
#include <chrono>
#include <ostream>
#include <fstream>
#include <sstream>
#include <iomanip>

namespace reportcalc {

/**
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,   ///< Step traces, registrations
    INFO,    ///< Calculated fields, batch summaries
    WARN,    ///< Isolated per-field or per-cell failures
    ERROR    ///< Failures that abort a batch
};

/**
 * @brief Convert log level to string
 */
inline std::string level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Parse log level from string
 */
inline LogLevel string_to_level(const std::string& level_str) {
    if (level_str == "DEBUG") return LogLevel::DEBUG;
    if (level_str == "INFO") return LogLevel::INFO;
    if (level_str == "WARN") return LogLevel::WARN;
    if (level_str == "ERROR") return LogLevel::ERROR;
    return LogLevel::INFO;  // default
}

/**
 * @brief Where a log event comes from
 */
struct LogContext {
    std::string component;           ///< "calculator", "transformer", "custom_transformer", ...
    std::string target;              ///< Template field, target path or table name
    size_t step_index;               ///< Position of the transform step in its pipeline

    LogContext()
        : component(""), target(""), step_index(0) {}

    LogContext(const std::string& component_, const std::string& target_ = "")
        : component(component_), target(target_), step_index(0) {}
};

/**
 * @brief Logger configuration
 */
struct LoggerConfig {
    LogLevel min_level;              ///< Minimum log level to output
    bool enable_console;             ///< Log to console (stderr)
    bool enable_file;                ///< Log to file
    std::string log_file_path;       ///< File path for logs
    bool enable_json;                ///< Output as JSON (vs. plain text)

    LoggerConfig()
        : min_level(LogLevel::INFO),
          enable_console(true),
          enable_file(false),
          log_file_path("reportcalc.log"),
          enable_json(true) {}
};

/**
 * @brief Structured logger with JSON output
 *
 * Usage Example:
 *   @code
 *   LoggerConfig config;
 *   config.min_level = LogLevel::DEBUG;
 *   Logger::get_instance().configure(config);
 *
 *   LogContext ctx("calculator", "energy_class");
 *   Logger::get_instance().log_field_calculated(ctx, "calculated_data.energy_class", "A+");
 *   @endcode
 */
class Logger {
public:
    /**
     * @brief Get singleton logger instance
     */
    static Logger& get_instance();

    /**
     * @brief Configure logger with new settings
     *
     * @param config Logger configuration
     */
    void configure(const LoggerConfig& config);

    /**
     * @brief Log a successfully calculated field
     *
     * @param ctx Log context (target = template field)
     * @param target_path Path the result was written to
     * @param value Display form of the result
     */
    void log_field_calculated(
        const LogContext& ctx,
        const std::string& target_path,
        const std::string& value
    );

    /**
     * @brief Log a field mapping that could not be calculated
     *
     * @param ctx Log context (target = template field)
     * @param error_kind Error class name ("field_not_found", ...)
     * @param error_message Error message
     * @param fatal Whether the failure aborts the batch
     */
    void log_field_failed(
        const LogContext& ctx,
        const std::string& error_kind,
        const std::string& error_message,
        bool fatal
    );

    /**
     * @brief Log one executed transform step
     *
     * @param ctx Log context (step_index set)
     * @param step_type Step type name
     * @param rows_in Rows entering the step
     * @param rows_out Rows leaving the step
     */
    void log_transform_step(
        const LogContext& ctx,
        const std::string& step_type,
        size_t rows_in,
        size_t rows_out
    );

    /**
     * @brief Log a cell left unchanged after a failed evaluation
     */
    void log_cell_failed(
        const LogContext& ctx,
        size_t row,
        size_t column,
        const std::string& expression,
        const std::string& error_message
    );

    /**
     * @brief Log a registry entry being added or replaced
     *
     * @param registry Registry name ("functions", "transformers")
     * @param name Registered name
     * @param replaced Whether an existing entry was overwritten
     */
    void log_registration(
        const std::string& registry,
        const std::string& name,
        bool replaced
    );

    /**
     * @brief Log error with context
     */
    void log_error(
        const LogContext& ctx,
        const std::string& error_message
    );

    /**
     * @brief Log warning message
     */
    void log_warning(
        const LogContext& ctx,
        const std::string& warning_message
    );

    /**
     * @brief Flush all log outputs
     */
    void flush();

    void set_min_level(LogLevel level) { config_.min_level = level; }
    LogLevel get_min_level() const { return config_.min_level; }

private:
    Logger();
    ~Logger();

    // Disable copy and move
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    LoggerConfig config_;
    std::unique_ptr<std::ofstream> file_stream_;

    // Helper methods
    void log(LogLevel level, const std::string& message, const std::map<std::string, std::string>& fields);
    std::map<std::string, std::string> context_fields(const std::string& event, const LogContext& ctx) const;
    std::string get_timestamp() const;
    std::string format_json(const std::map<std::string, std::string>& fields) const;
    std::string escape_json_string(const std::string& str) const;
    void write_output(const std::string& output);
};

} // namespace reportcalc

#endif // REPORTCALC_LOGGER_HPP
