/**
 * @file test_logger.cpp
 * @brief Unit tests for Logger
 */

#include <catch2/catch_test_macros.hpp>
#include "../src/logger.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <vector>

using namespace reportcalc;
using json = nlohmann::json;

namespace {

void log_to_file(const std::string& path, LogLevel level = LogLevel::DEBUG) {
    std::filesystem::remove(path);
    LoggerConfig config;
    config.min_level = level;
    config.enable_console = false;
    config.enable_file = true;
    config.log_file_path = path;
    Logger::get_instance().configure(config);
}

std::vector<json> read_log(const std::string& path) {
    Logger::get_instance().flush();

    std::vector<json> records;
    std::ifstream file(path);
    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty()) {
            records.push_back(json::parse(line));
        }
    }
    return records;
}

void finish(const std::string& path) {
    LoggerConfig config;
    config.enable_console = false;
    Logger::get_instance().configure(config);
    std::filesystem::remove(path);
}

} // namespace

TEST_CASE("Logger Configuration", "[logger]") {
    Logger& logger = Logger::get_instance();

    SECTION("Default configuration") {
        LoggerConfig config;

        REQUIRE(config.min_level == LogLevel::INFO);
        REQUIRE(config.enable_console == true);
        REQUIRE(config.enable_file == false);
        REQUIRE(config.enable_json == true);
    }

    SECTION("Log level filtering") {
        const std::string path = "test_levels.log";
        log_to_file(path, LogLevel::WARN);
        REQUIRE(logger.get_min_level() == LogLevel::WARN);

        LogContext ctx("calculator", "energy_class");
        logger.log_field_calculated(ctx, "calculated_data.energy_class", "A");
        logger.log_warning(ctx, "kept");

        auto records = read_log(path);
        REQUIRE(records.size() == 1);
        REQUIRE(records[0]["warning"] == "kept");

        finish(path);
    }

    SECTION("Level names") {
        REQUIRE(level_to_string(LogLevel::WARN) == "WARN");
        REQUIRE(string_to_level("ERROR") == LogLevel::ERROR);
        REQUIRE(string_to_level("bogus") == LogLevel::INFO);
    }
}

TEST_CASE("Logger Field Events", "[logger]") {
    Logger& logger = Logger::get_instance();
    const std::string path = "test_field_events.log";
    log_to_file(path);

    LogContext ctx("calculator", "energy_class");

    SECTION("Calculated") {
        logger.log_field_calculated(ctx, "calculated_data.energy_class", "A+");
        auto records = read_log(path);

        REQUIRE(records.size() == 1);
        REQUIRE(records[0]["event"] == "field_calculated");
        REQUIRE(records[0]["level"] == "INFO");
        REQUIRE(records[0]["component"] == "calculator");
        REQUIRE(records[0]["target"] == "energy_class");
        REQUIRE(records[0]["value"] == "A+");
        REQUIRE(records[0].contains("timestamp"));
    }

    SECTION("Failed, isolated and fatal") {
        logger.log_field_failed(ctx, "field_not_found", "Field not found: x", false);
        logger.log_field_failed(ctx, "function_not_found", "Function not found: f", true);
        auto records = read_log(path);

        REQUIRE(records.size() == 2);
        REQUIRE(records[0]["level"] == "WARN");
        REQUIRE(records[0]["fatal"] == "false");
        REQUIRE(records[1]["level"] == "ERROR");
        REQUIRE(records[1]["error_kind"] == "function_not_found");
    }

    finish(path);
}

TEST_CASE("Logger Transform Events", "[logger]") {
    Logger& logger = Logger::get_instance();
    const std::string path = "test_transform_events.log";
    log_to_file(path);

    LogContext ctx("transformer", "photometric");
    ctx.step_index = 3;

    logger.log_transform_step(ctx, "calculate", 5, 5);
    logger.log_cell_failed(ctx, 2, 4, "B{row}/A{row}", "Invalid syntax");
    logger.log_registration("transformers", "zone_table_transformer", true);

    auto records = read_log(path);
    REQUIRE(records.size() == 3);

    REQUIRE(records[0]["event"] == "transform_step");
    REQUIRE(records[0]["step_index"] == "3");
    REQUIRE(records[0]["step_type"] == "calculate");
    REQUIRE(records[0]["rows_out"] == "5");

    REQUIRE(records[1]["event"] == "cell_failed");
    REQUIRE(records[1]["row"] == "2");
    REQUIRE(records[1]["column"] == "4");
    REQUIRE(records[1]["expression"] == "B{row}/A{row}");

    REQUIRE(records[2]["event"] == "registration");
    REQUIRE(records[2]["registry"] == "transformers");
    REQUIRE(records[2]["replaced"] == "true");

    finish(path);
}

TEST_CASE("Logger JSON Escaping", "[logger]") {
    Logger& logger = Logger::get_instance();
    const std::string path = "test_escape.log";
    log_to_file(path);

    LogContext ctx("test");
    logger.log_error(ctx, "Error with \"quotes\" and \nnewlines\tand tabs");

    std::ifstream file(path);
    std::string line;
    std::getline(file, line);
    file.close();

    REQUIRE(line.find("\\\"") != std::string::npos);
    REQUIRE(line.find("\\n") != std::string::npos);
    REQUIRE(line.find("\\t") != std::string::npos);

    auto records = read_log(path);
    REQUIRE(records[0]["error_message"] == "Error with \"quotes\" and \nnewlines\tand tabs");

    finish(path);
}
