/**
 * @file execution_result.hpp
 * @brief Outcome of a pipeline or graph run
 */

#ifndef LEDGERFLOW_EXECUTION_RESULT_HPP
#define LEDGERFLOW_EXECUTION_RESULT_HPP

#include "record.hpp"
#include "workflow_error.hpp"
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace ledgerflow {

/**
 * @brief One completed node in an execution trace
 *
 * Sizes are record counts (fan-in inputs are summed over predecessors).
 */
struct TraceEntry {
    std::string node_id;        ///< Step or node id
    std::string type;           ///< Registered node type
    double duration_ms;         ///< Wall time of run()
    size_t input_size;          ///< Records routed to the node
    size_t output_size;         ///< Records in the node output

    TraceEntry() : duration_ms(0.0), input_size(0), output_size(0) {}
    TraceEntry(const std::string& id, const std::string& type_, double duration,
               size_t input, size_t output)
        : node_id(id), type(type_), duration_ms(duration), input_size(input), output_size(output) {}
};

/**
 * @brief Workflow execution result
 *
 * On success `output` holds the final payload. On failure `output` is empty,
 * `error_kind`, `failed_node` and `error_message` describe the failure and
 * `trace` lists the nodes that completed before it.
 */
struct WorkflowResult {
    bool success;                                 ///< True if every node completed
    Payload output;                               ///< Final (terminal) payload
    std::vector<TraceEntry> trace;                ///< Completed nodes in execution order
    std::map<std::string, Payload> node_outputs;  ///< Per-node outputs (graph runs)
    ErrorKind error_kind;                         ///< Failure category
    std::string failed_node;                      ///< Node that failed (if applicable)
    std::string error_message;                    ///< Failure description
    double total_execution_time_ms;               ///< Total run time

    WorkflowResult()
        : success(true), error_kind(ErrorKind::None), total_execution_time_ms(0.0) {}

    std::string status() const { return success ? "success" : "error"; }

    /**
     * @brief Rethrow a failed result as the matching exception
     *
     * @throws NodeExecutionError, TimeoutError, StructuralError, NodeNotFoundError
     *         or RegistrationError depending on error_kind
     */
    void throw_if_failed() const;
};

void to_json(nlohmann::json& j, const TraceEntry& entry);

/**
 * @brief Encode a result as {status, output, trace, error_detail?, node_outputs?}
 */
void to_json(nlohmann::json& j, const WorkflowResult& result);

} // namespace ledgerflow

#endif // LEDGERFLOW_EXECUTION_RESULT_HPP
