#include "workflow_definition.hpp"
#include <algorithm>
#include <functional>
#include <queue>
#include <sstream>

namespace ledgerflow {
namespace orchestrator {

std::string execution_hint_to_string(ExecutionHint hint) {
    return hint == ExecutionHint::ParallelEligible ? "parallel" : "sequential";
}

ExecutionHint string_to_execution_hint(const std::string& value) {
    if (value == "parallel" || value == "parallel_eligible") {
        return ExecutionHint::ParallelEligible;
    }
    if (value.empty() || value == "sequential") {
        return ExecutionHint::Sequential;
    }
    throw StructuralError("Unknown edge hint: " + value);
}

void validate_pipeline_definition(const PipelineDefinition& pipeline) {
    // Check: At least one step exists
    if (pipeline.steps.empty()) {
        throw StructuralError("pipeline must contain at least one step");
    }

    for (const std::string& step : pipeline.steps) {
        if (step.empty()) {
            throw StructuralError("pipeline step id cannot be empty");
        }
        auto it = pipeline.node_defs.find(step);
        if (it == pipeline.node_defs.end()) {
            throw StructuralError("pipeline step '" + step + "' has no node definition");
        }
        if (it->second.type.empty()) {
            throw StructuralError("node type cannot be empty for step: " + step);
        }
    }
}

void validate_graph_definition(const GraphDefinition& graph) {
    // Check: At least one node exists
    if (graph.nodes.empty()) {
        throw StructuralError("graph must contain at least one node");
    }

    // Check: All node IDs are unique and types are set
    std::set<std::string> node_ids;
    for (const auto& node : graph.nodes) {
        if (node.id.empty()) {
            throw StructuralError("node ID cannot be empty");
        }
        if (!node_ids.insert(node.id).second) {
            throw StructuralError("duplicate node ID: " + node.id);
        }
        if (node.type.empty()) {
            throw StructuralError("node type cannot be empty for node: " + node.id);
        }
    }

    if (!graph.terminal_node.empty() && node_ids.find(graph.terminal_node) == node_ids.end()) {
        throw StructuralError("terminal node '" + graph.terminal_node + "' is not declared");
    }

    // Endpoints and cycles
    compute_execution_plan(graph);
}

ExecutionPlan compute_execution_plan(const GraphDefinition& graph) {
    const size_t n = graph.nodes.size();

    // Resolve ids to declaration indices once
    std::map<std::string, size_t> index_of;
    for (size_t i = 0; i < n; ++i) {
        index_of.emplace(graph.nodes[i].id, i);
    }

    std::vector<std::set<size_t>> successors(n);
    std::vector<std::set<size_t>> predecessors(n);
    for (const auto& edge : graph.edges) {
        auto source = index_of.find(edge.source);
        if (source == index_of.end()) {
            throw StructuralError("edge references unknown source node: " + edge.source);
        }
        auto target = index_of.find(edge.target);
        if (target == index_of.end()) {
            throw StructuralError("edge references unknown target node: " + edge.target);
        }
        // Parallel duplicate edges collapse into one dependency
        successors[source->second].insert(target->second);
        predecessors[target->second].insert(source->second);
    }

    std::vector<size_t> in_degree(n);
    for (size_t i = 0; i < n; ++i) {
        in_degree[i] = predecessors[i].size();
    }

    // Kahn's algorithm; the min-heap keeps ties in declaration order
    std::priority_queue<size_t, std::vector<size_t>, std::greater<size_t>> ready_queue;
    for (size_t i = 0; i < n; ++i) {
        if (in_degree[i] == 0) {
            ready_queue.push(i);
        }
    }

    std::vector<size_t> order;
    order.reserve(n);
    while (!ready_queue.empty()) {
        size_t current = ready_queue.top();
        ready_queue.pop();
        order.push_back(current);

        for (size_t next : successors[current]) {
            if (--in_degree[next] == 0) {
                ready_queue.push(next);
            }
        }
    }

    // Check for circular dependencies
    if (order.size() != n) {
        std::ostringstream oss;
        oss << "cyclic workflow, nodes not in execution order:";
        for (size_t i = 0; i < n; ++i) {
            if (in_degree[i] > 0) {
                oss << " " << graph.nodes[i].id;
            }
        }
        throw StructuralError(oss.str());
    }

    ExecutionPlan plan;
    std::vector<size_t> rank(n);
    for (size_t r = 0; r < n; ++r) {
        rank[order[r]] = r;
        plan.order.push_back(graph.nodes[order[r]].id);
        plan.rank[graph.nodes[order[r]].id] = r;
    }

    auto by_rank = [&](const std::set<size_t>& indices) {
        std::vector<size_t> sorted(indices.begin(), indices.end());
        std::sort(sorted.begin(), sorted.end(), [&](size_t a, size_t b) { return rank[a] < rank[b]; });
        std::vector<std::string> ids;
        ids.reserve(sorted.size());
        for (size_t i : sorted) {
            ids.push_back(graph.nodes[i].id);
        }
        return ids;
    };

    for (size_t i = 0; i < n; ++i) {
        plan.predecessors[graph.nodes[i].id] = by_rank(predecessors[i]);
        plan.successors[graph.nodes[i].id] = by_rank(successors[i]);
    }

    // Wave of a node = longest path from a root; visiting in order means every
    // predecessor's wave is known first
    std::vector<size_t> wave(n, 0);
    for (size_t current : order) {
        for (size_t pred : predecessors[current]) {
            wave[current] = std::max(wave[current], wave[pred] + 1);
        }
        if (plan.waves.size() <= wave[current]) {
            plan.waves.resize(wave[current] + 1);
        }
        plan.waves[wave[current]].push_back(graph.nodes[current].id);
    }

    return plan;
}

std::vector<std::string> compute_execution_order(const GraphDefinition& graph) {
    return compute_execution_plan(graph).order;
}

std::vector<std::string> ExecutionPlan::ready_after(const std::set<std::string>& completed) const {
    std::vector<std::string> ready;
    for (const std::string& id : order) {
        if (completed.count(id)) {
            continue;
        }
        const auto& preds = predecessors.at(id);
        bool satisfied = std::all_of(preds.begin(), preds.end(), [&](const std::string& p) {
            return completed.count(p) > 0;
        });
        if (satisfied) {
            ready.push_back(id);
        }
    }
    return ready;
}

} // namespace orchestrator
} // namespace ledgerflow
