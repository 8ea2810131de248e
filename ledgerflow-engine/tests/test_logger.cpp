/**
 * @file test_logger.cpp
 * @brief Unit tests for Logger
 */

#include <catch2/catch_test_macros.hpp>
#include "logger.hpp"
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

using namespace ledgerflow;
using json = nlohmann::json;

namespace {

// Route log output to a fresh file only
void log_to_file(const std::string& path, LogLevel min_level = LogLevel::DEBUG, bool as_json = true) {
    std::filesystem::remove(path);

    LoggerConfig config;
    config.min_level = min_level;
    config.enable_console = false;
    config.enable_file = true;
    config.log_file_path = path;
    config.enable_json = as_json;
    Logger::get_instance().configure(config);
}

std::vector<std::string> read_lines(const std::string& path) {
    Logger::get_instance().flush();

    std::vector<std::string> lines;
    std::ifstream file(path);
    std::string line;
    while (std::getline(file, line)) {
        lines.push_back(line);
    }
    return lines;
}

// Back to the default console configuration
void reset_logger(const std::string& path) {
    Logger::get_instance().configure(LoggerConfig());
    std::filesystem::remove(path);
}

} // anonymous namespace

TEST_CASE("Logger Configuration", "[logger]") {
    Logger& logger = Logger::get_instance();

    SECTION("Default configuration") {
        LoggerConfig config;

        REQUIRE(config.min_level == LogLevel::INFO);
        REQUIRE(config.enable_console == true);
        REQUIRE(config.enable_file == false);
        REQUIRE(config.enable_json == true);
        REQUIRE(config.log_file_path == "ledgerflow.log");
    }

    SECTION("Custom configuration") {
        LoggerConfig config;
        config.min_level = LogLevel::ERROR;
        config.enable_console = false;
        logger.configure(config);

        REQUIRE(logger.get_min_level() == LogLevel::ERROR);

        logger.set_min_level(LogLevel::WARN);
        REQUIRE(logger.get_min_level() == LogLevel::WARN);

        logger.configure(LoggerConfig());
    }

    SECTION("Level names") {
        REQUIRE(level_to_string(LogLevel::WARN) == "WARN");
        REQUIRE(string_to_level("DEBUG") == LogLevel::DEBUG);
        REQUIRE(string_to_level("ERROR") == LogLevel::ERROR);
        REQUIRE(string_to_level("verbose") == LogLevel::INFO);
    }
}

TEST_CASE("Logger Workflow Events", "[logger]") {
    const std::string path = "test_logger_workflow.log";
    Logger& logger = Logger::get_instance();
    log_to_file(path);

    ExecutionContext ctx("receivables", "aging", "AgingCalculatorNode");

    logger.log_workflow_start("receivables", "pipeline", 4, 3);
    logger.log_node_start(ctx, 3);
    logger.log_node_complete(ctx, 1.5, 3, 3);
    logger.log_node_failure(ctx, "bad \"date\"\nvalue");
    logger.log_workflow_complete("receivables", false, 1, 12.0, "NodeExecution");

    auto lines = read_lines(path);
    REQUIRE(lines.size() == 5);

    SECTION("Every line is a JSON object with timestamp and level") {
        for (const std::string& line : lines) {
            json entry = json::parse(line);
            REQUIRE(entry.contains("timestamp"));
            REQUIRE(entry.contains("level"));
            REQUIRE(entry.contains("message"));
            REQUIRE(entry["timestamp"].get<std::string>().back() == 'Z');
        }
    }

    SECTION("Workflow start") {
        json entry = json::parse(lines[0]);

        REQUIRE(entry["event"] == "workflow_start");
        REQUIRE(entry["level"] == "INFO");
        REQUIRE(entry["workflow"] == "receivables");
        REQUIRE(entry["mode"] == "pipeline");
        REQUIRE(entry["node_count"] == "4");
        REQUIRE(entry["input_records"] == "3");
    }

    SECTION("Node events") {
        json start = json::parse(lines[1]);
        json complete = json::parse(lines[2]);

        REQUIRE(start["event"] == "node_start");
        REQUIRE(start["level"] == "DEBUG");
        REQUIRE(complete["event"] == "node_complete");
        REQUIRE(complete["node_id"] == "aging");
        REQUIRE(complete["node_type"] == "AgingCalculatorNode");
        REQUIRE(std::stod(complete["duration_ms"].get<std::string>()) == 1.5);
        REQUIRE(complete["output_records"] == "3");
    }

    SECTION("Failure messages are escaped") {
        json failure = json::parse(lines[3]);

        REQUIRE(failure["level"] == "ERROR");
        REQUIRE(failure["error_message"] == "bad \"date\"\nvalue");
    }

    SECTION("Failed workflow carries the error kind") {
        json done = json::parse(lines[4]);

        REQUIRE(done["success"] == "false");
        REQUIRE(done["error_kind"] == "NodeExecution");
        REQUIRE(done["level"] == "ERROR");
    }

    reset_logger(path);
}

TEST_CASE("Logger Level Filtering", "[logger]") {
    const std::string path = "test_logger_filtering.log";
    Logger& logger = Logger::get_instance();
    log_to_file(path, LogLevel::WARN);

    ExecutionContext ctx("", "AgingCalculatorNode");
    logger.log_node_registered("AgingCalculatorNode");
    logger.log_workflow_start("receivables", "graph", 2, 0);
    logger.log_warning(ctx, "Record INV-9 has no invoice date, setting Unknown bucket");

    auto lines = read_lines(path);
    REQUIRE(lines.size() == 1);

    json warning = json::parse(lines[0]);
    REQUIRE(warning["event"] == "warning");
    REQUIRE(warning["level"] == "WARN");
    REQUIRE(warning["node_type"] == "AgingCalculatorNode");
    REQUIRE_FALSE(warning.contains("node_id"));
    REQUIRE_FALSE(warning.contains("workflow"));

    reset_logger(path);
}

TEST_CASE("Logger Text Format", "[logger]") {
    const std::string path = "test_logger_text.log";
    Logger& logger = Logger::get_instance();
    log_to_file(path, LogLevel::DEBUG, false);

    logger.log_debug("Plan computed", {{"waves", "3"}});

    auto lines = read_lines(path);
    REQUIRE(lines.size() == 1);
    REQUIRE(lines[0].find("[DEBUG] Plan computed") != std::string::npos);
    REQUIRE(lines[0].find("waves=3") != std::string::npos);

    reset_logger(path);
}
