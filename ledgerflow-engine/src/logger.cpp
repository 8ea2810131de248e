/**
 * @file logger.cpp
 * @brief Implementation of structured logger
 */

#include "logger.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace ledgerflow {

Logger& Logger::get_instance() {
    static Logger instance;
    return instance;
}

Logger::Logger() = default;

Logger::~Logger() {
    flush();
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->close();
    }
}

void Logger::configure(const LoggerConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
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

void Logger::log_node_registered(const std::string& node_type) {
    std::map<std::string, std::string> fields;
    fields["event"] = "node_registered";
    fields["node_type"] = node_type;

    log(LogLevel::DEBUG, "Node type registered", fields);
}

void Logger::log_workflow_start(
    const std::string& workflow,
    const std::string& mode,
    size_t node_count,
    size_t input_records
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "workflow_start";
    fields["workflow"] = workflow;
    fields["mode"] = mode;
    fields["node_count"] = std::to_string(node_count);
    fields["input_records"] = std::to_string(input_records);

    log(LogLevel::INFO, "Starting workflow", fields);
}

void Logger::log_node_start(const ExecutionContext& ctx, size_t input_records) {
    std::map<std::string, std::string> fields;
    fields["event"] = "node_start";
    fields["workflow"] = ctx.workflow;
    fields["node_id"] = ctx.node_id;
    fields["node_type"] = ctx.node_type;
    fields["input_records"] = std::to_string(input_records);

    log(LogLevel::DEBUG, "Starting node", fields);
}

void Logger::log_node_complete(
    const ExecutionContext& ctx,
    double duration_ms,
    size_t input_records,
    size_t output_records
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "node_complete";
    fields["workflow"] = ctx.workflow;
    fields["node_id"] = ctx.node_id;
    fields["node_type"] = ctx.node_type;
    fields["duration_ms"] = std::to_string(duration_ms);
    fields["input_records"] = std::to_string(input_records);
    fields["output_records"] = std::to_string(output_records);

    log(LogLevel::INFO, "Node completed", fields);
}

void Logger::log_node_failure(const ExecutionContext& ctx, const std::string& error_message) {
    std::map<std::string, std::string> fields;
    fields["event"] = "node_failure";
    fields["workflow"] = ctx.workflow;
    fields["node_id"] = ctx.node_id;
    fields["node_type"] = ctx.node_type;
    fields["error_message"] = error_message;

    log(LogLevel::ERROR, "Node failed", fields);
}

void Logger::log_workflow_complete(
    const std::string& workflow,
    bool success,
    size_t nodes_completed,
    double duration_ms,
    const std::string& error_kind
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "workflow_complete";
    fields["workflow"] = workflow;
    fields["success"] = success ? "true" : "false";
    fields["nodes_completed"] = std::to_string(nodes_completed);
    fields["duration_ms"] = std::to_string(duration_ms);
    if (!success) {
        fields["error_kind"] = error_kind;
    }

    log(success ? LogLevel::INFO : LogLevel::ERROR, "Workflow completed", fields);
}

void Logger::log_warning(
    const ExecutionContext& ctx,
    const std::string& warning_message
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "warning";
    if (!ctx.workflow.empty()) {
        fields["workflow"] = ctx.workflow;
    }
    if (!ctx.node_id.empty()) {
        fields["node_id"] = ctx.node_id;
    }
    fields["node_type"] = ctx.node_type;
    fields["warning"] = warning_message;

    log(LogLevel::WARN, warning_message, fields);
}

void Logger::log_debug(const std::string& message, const std::map<std::string, std::string>& fields) {
    log(LogLevel::DEBUG, message, fields);
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (config_.enable_console) {
        std::cerr.flush();
    }
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->flush();
    }
}

void Logger::set_min_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.min_level = level;
}

LogLevel Logger::get_min_level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.min_level;
}

void Logger::log(
    LogLevel level,
    const std::string& message,
    const std::map<std::string, std::string>& fields
) {
    std::lock_guard<std::mutex> lock(mutex_);

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
    gmtime_s(&tm_buf, &time_t_now);
#else
    gmtime_r(&time_t_now, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count() << "Z";

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
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c)
                        << std::dec;
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

} // namespace ledgerflow
