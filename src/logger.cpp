/**
 * @file logger.cpp
 * @brief Implementation of structured logger
 */

#include "logger.hpp"
#include <iostream>
#include <sstream>
#include <iomanip>
#include <ctime>

namespace reportcalc {

Logger& Logger::get_instance() {
    static Logger instance;
    return instance;
}

Logger::Logger() {
    // Default configuration
    config_ = LoggerConfig();
}

Logger::~Logger() {
    flush();
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->close();
    }
}

void Logger::configure(const LoggerConfig& config) {
    config_ = config;
    file_stream_.reset();

    // Open log file if enabled
    if (config_.enable_file) {
        file_stream_ = std::make_unique<std::ofstream>(config_.log_file_path, std::ios::app);
        if (!file_stream_->is_open()) {
            std::cerr << "Warning: Failed to open log file: " << config_.log_file_path << std::endl;
        }
    }
}

std::map<std::string, std::string> Logger::context_fields(
    const std::string& event,
    const LogContext& ctx
) const {
    std::map<std::string, std::string> fields;
    fields["event"] = event;
    fields["component"] = ctx.component;
    if (!ctx.target.empty()) {
        fields["target"] = ctx.target;
    }
    return fields;
}

void Logger::log_field_calculated(
    const LogContext& ctx,
    const std::string& target_path,
    const std::string& value
) {
    auto fields = context_fields("field_calculated", ctx);
    fields["target_path"] = target_path;
    fields["value"] = value;

    log(LogLevel::INFO, "Field calculated", fields);
}

void Logger::log_field_failed(
    const LogContext& ctx,
    const std::string& error_kind,
    const std::string& error_message,
    bool fatal
) {
    auto fields = context_fields("field_failed", ctx);
    fields["error_kind"] = error_kind;
    fields["error_message"] = error_message;
    fields["fatal"] = fatal ? "true" : "false";

    log(fatal ? LogLevel::ERROR : LogLevel::WARN, "Failed to calculate field", fields);
}

void Logger::log_transform_step(
    const LogContext& ctx,
    const std::string& step_type,
    size_t rows_in,
    size_t rows_out
) {
    auto fields = context_fields("transform_step", ctx);
    fields["step_index"] = std::to_string(ctx.step_index);
    fields["step_type"] = step_type;
    fields["rows_in"] = std::to_string(rows_in);
    fields["rows_out"] = std::to_string(rows_out);

    log(LogLevel::DEBUG, "Transform step applied", fields);
}

void Logger::log_cell_failed(
    const LogContext& ctx,
    size_t row,
    size_t column,
    const std::string& expression,
    const std::string& error_message
) {
    auto fields = context_fields("cell_failed", ctx);
    fields["step_index"] = std::to_string(ctx.step_index);
    fields["row"] = std::to_string(row);
    fields["column"] = std::to_string(column);
    fields["expression"] = expression;
    fields["error_message"] = error_message;

    log(LogLevel::WARN, "Cell left unchanged", fields);
}

void Logger::log_registration(
    const std::string& registry,
    const std::string& name,
    bool replaced
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "registration";
    fields["registry"] = registry;
    fields["name"] = name;
    fields["replaced"] = replaced ? "true" : "false";

    log(LogLevel::DEBUG, "Registered " + name, fields);
}

void Logger::log_error(
    const LogContext& ctx,
    const std::string& error_message
) {
    auto fields = context_fields("error", ctx);
    fields["error_message"] = error_message;

    log(LogLevel::ERROR, error_message, fields);
}

void Logger::log_warning(
    const LogContext& ctx,
    const std::string& warning_message
) {
    auto fields = context_fields("warning", ctx);
    fields["warning"] = warning_message;

    log(LogLevel::WARN, warning_message, fields);
}

void Logger::flush() {
    if (config_.enable_console) {
        std::cerr.flush();
    }
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->flush();
    }
}

void Logger::log(
    LogLevel level,
    const std::string& message,
    const std::map<std::string, std::string>& fields
) {
    // Skip if below minimum level
    if (level < config_.min_level) {
        return;
    }

    std::string output;

    if (config_.enable_json) {
        std::map<std::string, std::string> json_fields = fields;
        json_fields["timestamp"] = get_timestamp();
        json_fields["level"] = level_to_string(level);
        json_fields["message"] = message;
        output = format_json(json_fields);
    } else {
        std::ostringstream oss;
        oss << get_timestamp() << " [" << level_to_string(level) << "] " << message;

        if (!fields.empty()) {
            oss << " {";
            bool first = true;
            for (const auto& [key, value] : fields) {
                if (!first) oss << ", ";
                oss << key << "=" << value;
                first = false;
            }
            oss << "}";
        }

        output = oss.str();
    }

    write_output(output);
}

std::string Logger::get_timestamp() const {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()
    ) % 1000;

    std::tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &time_t_now);
#else
    localtime_r(&time_t_now, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count();

    return oss.str();
}

std::string Logger::format_json(const std::map<std::string, std::string>& fields) const {
    std::ostringstream oss;
    oss << "{";

    bool first = true;
    for (const auto& [key, value] : fields) {
        if (!first) oss << ",";
        oss << "\"" << escape_json_string(key) << "\":\"" << escape_json_string(value) << "\"";
        first = false;
    }

    oss << "}";
    return oss.str();
}

std::string Logger::escape_json_string(const std::string& str) const {
    std::ostringstream oss;
    for (char c : str) {
        switch (c) {
            case '"':  oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (c >= 0 && c < 32) {
                    // Escape control characters
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c);
                } else {
                    oss << c;
                }
        }
    }
    return oss.str();
}

void Logger::write_output(const std::string& output) {
    if (config_.enable_console) {
        std::cerr << output << std::endl;
    }

    if (config_.enable_file && file_stream_ && file_stream_->is_open()) {
        *file_stream_ << output << std::endl;
    }
}

} // namespace reportcalc
