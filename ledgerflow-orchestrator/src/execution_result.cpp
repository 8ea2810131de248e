#include "execution_result.hpp"

using json = nlohmann::json;

namespace ledgerflow {

void WorkflowResult::throw_if_failed() const {
    if (success) {
        return;
    }

    switch (error_kind) {
        case ErrorKind::Timeout:
            throw TimeoutError(error_message);
        case ErrorKind::Structural:
            throw StructuralError(error_message);
        case ErrorKind::NodeNotFound:
            throw NodeNotFoundError(error_message);
        case ErrorKind::Registration:
            throw RegistrationError(error_message);
        case ErrorKind::NodeExecution:
        default:
            throw NodeExecutionError(failed_node, error_message);
    }
}

void to_json(json& j, const TraceEntry& entry) {
    j = json{
        {"node_id", entry.node_id},
        {"type", entry.type},
        {"duration_ms", entry.duration_ms},
        {"input_size", entry.input_size},
        {"output_size", entry.output_size}
    };
}

void to_json(json& j, const WorkflowResult& result) {
    j = json::object();
    j["status"] = result.status();
    j["output"] = result.success ? json(result.output) : json();
    j["trace"] = result.trace;

    if (!result.success) {
        j["error_detail"] = {
            {"kind", error_kind_to_string(result.error_kind)},
            {"failed_node", result.failed_node.empty() ? json() : json(result.failed_node)},
            {"message", result.error_message}
        };
    }

    if (!result.node_outputs.empty()) {
        json outputs = json::object();
        for (const auto& [node_id, payload] : result.node_outputs) {
            outputs[node_id] = payload;
        }
        j["node_outputs"] = std::move(outputs);
    }

    j["execution_time_ms"] = result.total_execution_time_ms;
}

} // namespace ledgerflow
