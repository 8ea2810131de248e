#ifndef LEDGERFLOW_ORCHESTRATOR_WORKFLOW_DEFINITION_HPP
#define LEDGERFLOW_ORCHESTRATOR_WORKFLOW_DEFINITION_HPP

#include "workflow_error.hpp"
#include <map>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace ledgerflow {
namespace orchestrator {

/**
 * @brief Scheduling hint carried by an edge
 *
 * Informational: the executors derive concurrency from the dependency
 * structure, never from the hint.
 */
enum class ExecutionHint {
    Sequential,
    ParallelEligible
};

std::string execution_hint_to_string(ExecutionHint hint);
ExecutionHint string_to_execution_hint(const std::string& value);

/**
 * @brief One node of a workflow
 */
struct NodeDefinition {
    std::string id;                                          // e.g., "aging"
    std::string type;                                        // Registry type: "AgingCalculatorNode"
    nlohmann::json parameters = nlohmann::json::object();    // Declared parameters
    nlohmann::json metadata = nlohmann::json::object();      // e.g., editor position; never read by executors

    NodeDefinition() = default;
    NodeDefinition(const std::string& id_, const std::string& type_,
                   nlohmann::json parameters_ = nlohmann::json::object())
        : id(id_), type(type_), parameters(std::move(parameters_)) {}
};

/**
 * @brief Directed dependency: target consumes source's output
 */
struct EdgeDefinition {
    std::string source;
    std::string target;
    ExecutionHint hint = ExecutionHint::Sequential;

    EdgeDefinition() = default;
    EdgeDefinition(const std::string& source_, const std::string& target_,
                   ExecutionHint hint_ = ExecutionHint::Sequential)
        : source(source_), target(target_), hint(hint_) {}
};

/**
 * @brief Linear pipeline: steps run in list order, each fed the previous output
 */
struct PipelineDefinition {
    std::string name;
    std::vector<std::string> steps;                   // Step ids in execution order
    std::map<std::string, NodeDefinition> node_defs;  // Step id -> definition

    PipelineDefinition() = default;
};

/**
 * @brief Dependency graph of nodes
 */
struct GraphDefinition {
    std::string name;
    std::vector<NodeDefinition> nodes;    // Declaration order breaks ordering ties
    std::vector<EdgeDefinition> edges;
    std::string terminal_node;            // Empty: last node in topological order

    GraphDefinition() = default;
};

enum class WorkflowForm {
    Pipeline,
    Graph
};

/**
 * @brief Parsed workflow of either form
 */
struct WorkflowDefinition {
    WorkflowForm form = WorkflowForm::Pipeline;
    PipelineDefinition pipeline;    // Set when form == Pipeline
    GraphDefinition graph;          // Set when form == Graph

    const std::string& name() const {
        return form == WorkflowForm::Pipeline ? pipeline.name : graph.name;
    }
};

/**
 * @brief Validates a pipeline definition
 *
 * Validates:
 * - At least one step
 * - Every step has a node definition with a non-empty type
 *
 * @throws StructuralError if validation fails
 */
void validate_pipeline_definition(const PipelineDefinition& pipeline);

/**
 * @brief Validates a graph definition
 *
 * Validates:
 * - At least one node
 * - Node ids are non-empty and unique, types are non-empty
 * - Every edge endpoint is a declared node
 * - The terminal node, if designated, is declared
 * - No cycles
 *
 * @throws StructuralError if validation fails
 */
void validate_graph_definition(const GraphDefinition& graph);

/**
 * @brief Topological schedule of a graph
 *
 * Node ids are resolved once into an index arena; `order` is Kahn's order with
 * ties broken by declaration order, `rank` is each node's position in it.
 */
struct ExecutionPlan {
    std::vector<std::string> order;
    std::map<std::string, size_t> rank;
    std::map<std::string, std::vector<std::string>> predecessors;  // In rank order
    std::map<std::string, std::vector<std::string>> successors;    // In rank order

    // Independently executable subsets: every predecessor of a node in
    // waves[k] sits in an earlier wave. Each wave is in rank order.
    std::vector<std::vector<std::string>> waves;

    /**
     * @brief Nodes whose predecessors have all completed and that have not
     * completed themselves, in rank order
     */
    std::vector<std::string> ready_after(const std::set<std::string>& completed) const;
};

/**
 * @brief Computes the execution plan for a validated graph
 *
 * @throws StructuralError if an edge references an unknown node or the graph
 *         is cyclic (the message names the nodes left unprocessed)
 */
ExecutionPlan compute_execution_plan(const GraphDefinition& graph);

/**
 * @brief Node ids in execution order
 *
 * @throws StructuralError as compute_execution_plan
 */
std::vector<std::string> compute_execution_order(const GraphDefinition& graph);

} // namespace orchestrator
} // namespace ledgerflow

#endif // LEDGERFLOW_ORCHESTRATOR_WORKFLOW_DEFINITION_HPP
