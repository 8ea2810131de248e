#ifndef LEDGERFLOW_NODE_RUNNER_HPP
#define LEDGERFLOW_NODE_RUNNER_HPP

#include "execution_result.hpp"
#include "logger.hpp"
#include "node_registry.hpp"
#include "workflow_definition.hpp"
#include <chrono>
#include <functional>
#include <string>
#include <nlohmann/json.hpp>

namespace ledgerflow {

// Outcome of one node invocation, shared by both executors
struct NodeRun {
    bool success = false;
    Payload output;
    TraceEntry trace;
    std::string error_message;
};

// Instantiates the node, merges its parameters with overrides[node.id], runs it
// and times it. Exceptions thrown while building the input or running the node
// are caught and reported in the NodeRun; nothing escapes.
NodeRun run_node(
    const NodeRegistry& registry,
    const orchestrator::NodeDefinition& node,
    const std::function<Payload()>& make_input,
    const nlohmann::json& overrides,
    const std::string& workflow,
    Logger& logger
);

// Milliseconds elapsed since start
double elapsed_ms(std::chrono::steady_clock::time_point start);

} // namespace ledgerflow

#endif // LEDGERFLOW_NODE_RUNNER_HPP
