/**
 * @file graph_executor.hpp
 * @brief Runs a dependency graph of nodes in topological order
 *
 * The GraphExecutor is responsible for:
 * - Validating the graph (endpoints, cycles, node types) before anything runs
 * - Executing nodes in topological order, ties broken by declaration order
 * - Routing inputs: roots get the initial input, single-predecessor nodes
 *   get that predecessor's output, fan-in nodes get a map of predecessor
 *   outputs keyed by predecessor id
 * - Optionally running each wave of independent nodes concurrently (OpenMP)
 * - Reporting the terminal output, every node's output and the trace
 *
 * Parallel runs produce the same output, node outputs and trace as a
 * sequential run, on success and on a node failure: slots are written once
 * per node, the trace is ordered by topological rank, not completion time, and
 * a failure first runs the nodes ranked before it. Deadlines are checked per
 * wave, so a timed-out parallel run keeps every completed wave.
 */

#ifndef LEDGERFLOW_GRAPH_EXECUTOR_HPP
#define LEDGERFLOW_GRAPH_EXECUTOR_HPP

#include "execution_result.hpp"
#include "logger.hpp"
#include "node_registry.hpp"
#include "workflow_definition.hpp"
#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace ledgerflow {

/**
 * @brief Graph executor configuration
 */
struct GraphExecutorConfig {
    int64_t timeout_ms;           ///< Deadline for the whole run (0 = none)
    bool parallel;                ///< Run independent nodes of a wave concurrently
    std::string terminal_node;    ///< Overrides the definition's terminal node when set

    GraphExecutorConfig() : timeout_ms(0), parallel(false) {}
};

/**
 * @brief Dependency-graph executor
 *
 * Usage Example:
 *   @code
 *   GraphDefinition graph = parse_workflow_from_file("receivables.json").graph;
 *
 *   GraphExecutorConfig config;
 *   config.parallel = true;
 *   GraphExecutor executor(graph, default_registry(), config);
 *
 *   WorkflowResult result = executor.execute(Envelope(records));
 *   const Payload& summary = result.node_outputs.at("summary");
 *   @endcode
 */
class GraphExecutor {
public:
    /**
     * @brief Validate the graph, resolve node types and compute the plan
     *
     * @param graph Graph definition (copied)
     * @param registry Node registry; must outlive the executor
     * @param config Executor configuration
     * @param logger Logger instance (optional, uses default if nullptr)
     *
     * @throws StructuralError If the graph is malformed or cyclic
     * @throws NodeNotFoundError If a node type is not registered
     */
    explicit GraphExecutor(
        const orchestrator::GraphDefinition& graph,
        const NodeRegistry& registry = default_registry(),
        const GraphExecutorConfig& config = GraphExecutorConfig(),
        Logger* logger = nullptr
    );

    /**
     * @brief Execute the graph
     *
     * @param initial_input Input of every root node
     * @param overrides Per-node parameter overrides: {node_id: {key: value}}
     *
     * @return Result with the terminal node's output and all node outputs, or
     *         the first failure (by rank) with the outputs and trace of the
     *         nodes ranked before it
     */
    WorkflowResult execute(const Payload& initial_input,
                           const nlohmann::json& overrides = nlohmann::json::object()) const;

    const orchestrator::ExecutionPlan& plan() const { return plan_; }
    const std::string& terminal_node() const { return terminal_node_; }
    const orchestrator::GraphDefinition& definition() const { return graph_; }

private:
    orchestrator::GraphDefinition graph_;
    const NodeRegistry& registry_;
    GraphExecutorConfig config_;
    Logger* logger_;

    orchestrator::ExecutionPlan plan_;
    std::map<std::string, size_t> node_index_;  // Node id -> position in graph_.nodes
    std::string terminal_node_;

    using TimePoint = std::chrono::steady_clock::time_point;

    void execute_sequential(WorkflowResult& result, const Payload& initial_input,
                            const nlohmann::json& overrides, TimePoint start) const;
    void execute_waves(WorkflowResult& result, const Payload& initial_input,
                       const nlohmann::json& overrides, TimePoint start) const;

    // Input of a node given the outputs computed so far (indexed by rank)
    Payload route_input(const std::string& node_id, const Payload& initial_input,
                        const std::vector<Payload>& outputs) const;

    bool deadline_passed(TimePoint start) const;
    void fail_node(WorkflowResult& result, const std::string& node_id, const std::string& message) const;
    void fail_timeout(WorkflowResult& result, const std::string& next_node) const;

    // Copies outputs and trace entries of completed nodes ranked below `limit`
    // into the result, and the terminal output on success
    void finish(WorkflowResult& result, std::vector<Payload>& outputs,
                const std::vector<TraceEntry>& traces, const std::vector<bool>& done,
                size_t limit) const;
};

} // namespace ledgerflow

#endif // LEDGERFLOW_GRAPH_EXECUTOR_HPP
