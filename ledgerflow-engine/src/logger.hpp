/**
 * @file logger.hpp
 * @brief Structured logging for workflow execution
 *
 * The Logger provides structured logging capabilities with:
 * - Multiple log levels (DEBUG, INFO, WARN, ERROR)
 * - JSON-formatted output for easy parsing
 * - Context tracking (workflow, node id, node type)
 * - Per-node timing and record counts
 *
 * Design Pattern: Singleton logger with structured event emission.
 * Writes are serialized, so nodes running in a parallel wave may log.
 */

#ifndef LEDGERFLOW_LOGGER_HPP
#define LEDGERFLOW_LOGGER_HPP

#include <cstddef>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace ledgerflow {

/**
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,   ///< Detailed debugging information (parameters, plan details)
    INFO,    ///< Informational messages (workflow and node start/end)
    WARN,    ///< Warning messages (per-record degradations)
    ERROR    ///< Error messages (node failures, timeouts)
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
 * @brief Execution context for logging
 */
struct ExecutionContext {
    std::string workflow;            ///< Workflow name
    std::string node_id;             ///< Node or step identifier
    std::string node_type;           ///< Registered node type

    ExecutionContext() = default;

    ExecutionContext(const std::string& id, const std::string& type)
        : node_id(id), node_type(type) {}

    ExecutionContext(const std::string& workflow_, const std::string& id, const std::string& type)
        : workflow(workflow_), node_id(id), node_type(type) {}
};

/**
 * @brief Logger configuration
 */
struct LoggerConfig {
    LogLevel min_level;              ///< Minimum log level to output
    bool enable_console;             ///< Log to console (stderr)
    bool enable_file;                ///< Log to file
    std::string log_file_path;       ///< File path for logs (append mode)
    bool enable_json;                ///< Output as JSON (vs. plain text)

    LoggerConfig()
        : min_level(LogLevel::INFO),
          enable_console(true),
          enable_file(false),
          log_file_path("ledgerflow.log"),
          enable_json(true) {}
};

/**
 * @brief Structured logger with JSON output
 *
 * Usage Example:
 *   @code
 *   LoggerConfig config;
 *   config.min_level = LogLevel::DEBUG;
 *   config.enable_file = true;
 *   config.log_file_path = "ledgerflow.log";
 *
 *   Logger& logger = Logger::get_instance();
 *   logger.configure(config);
 *
 *   ExecutionContext ctx("aging_report", "aging", "AgingCalculatorNode");
 *   logger.log_node_start(ctx, 120);
 *   logger.log_node_complete(ctx, 3.2, 120, 120);
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
     * @brief Log a node type being added to a registry
     */
    void log_node_registered(const std::string& node_type);

    /**
     * @brief Log workflow start
     *
     * @param workflow Workflow name
     * @param mode "pipeline" or "graph"
     * @param node_count Number of steps or nodes
     * @param input_records Records in the initial input
     */
    void log_workflow_start(
        const std::string& workflow,
        const std::string& mode,
        size_t node_count,
        size_t input_records
    );

    /**
     * @brief Log node execution start
     *
     * @param ctx Execution context
     * @param input_records Records routed to the node
     */
    void log_node_start(const ExecutionContext& ctx, size_t input_records);

    /**
     * @brief Log node execution completion
     *
     * @param ctx Execution context
     * @param duration_ms Wall time of run()
     * @param input_records Records routed to the node
     * @param output_records Records in the node output
     */
    void log_node_complete(
        const ExecutionContext& ctx,
        double duration_ms,
        size_t input_records,
        size_t output_records
    );

    /**
     * @brief Log a node failure
     *
     * @param ctx Execution context
     * @param error_message Error message
     */
    void log_node_failure(const ExecutionContext& ctx, const std::string& error_message);

    /**
     * @brief Log workflow completion
     *
     * @param workflow Workflow name
     * @param success Whether every node completed
     * @param nodes_completed Number of trace entries
     * @param duration_ms Total wall time
     * @param error_kind Error kind when the run failed
     */
    void log_workflow_complete(
        const std::string& workflow,
        bool success,
        size_t nodes_completed,
        double duration_ms,
        const std::string& error_kind = ""
    );

    /**
     * @brief Log warning message
     *
     * @param ctx Execution context
     * @param warning_message Warning message
     */
    void log_warning(
        const ExecutionContext& ctx,
        const std::string& warning_message
    );

    /**
     * @brief Log debug message with arbitrary fields
     */
    void log_debug(const std::string& message, const std::map<std::string, std::string>& fields);

    /**
     * @brief Flush all log outputs
     */
    void flush();

    void set_min_level(LogLevel level);
    LogLevel get_min_level() const;

private:
    Logger();
    ~Logger();

    // Disable copy and move
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    mutable std::mutex mutex_;
    LoggerConfig config_;
    std::unique_ptr<std::ofstream> file_stream_;

    // Helper methods
    void log(LogLevel level, const std::string& message, const std::map<std::string, std::string>& fields);
    std::string get_timestamp() const;
    std::string format_json(const std::map<std::string, std::string>& fields) const;
    std::string escape_json_string(const std::string& str) const;
    void write_output(const std::string& output);
};

} // namespace ledgerflow

#endif // LEDGERFLOW_LOGGER_HPP
