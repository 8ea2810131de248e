/**
 * @file graph_executor.cpp
 * @brief Implementation of GraphExecutor
 */

#include "graph_executor.hpp"
#include "node_runner.hpp"
#ifdef HAVE_OPENMP
#include <omp.h>
#endif

using json = nlohmann::json;

namespace ledgerflow {

GraphExecutor::GraphExecutor(
    const orchestrator::GraphDefinition& graph,
    const NodeRegistry& registry,
    const GraphExecutorConfig& config,
    Logger* logger
)
    : graph_(graph),
      registry_(registry),
      config_(config),
      logger_(logger) {

    if (!logger_) {
        logger_ = &Logger::get_instance();
    }

    orchestrator::validate_graph_definition(graph_);

    // Every type must resolve before anything runs
    for (size_t i = 0; i < graph_.nodes.size(); ++i) {
        registry_.require_registered(graph_.nodes[i].type);
        node_index_[graph_.nodes[i].id] = i;
    }

    plan_ = orchestrator::compute_execution_plan(graph_);

    terminal_node_ = !config_.terminal_node.empty() ? config_.terminal_node
                   : !graph_.terminal_node.empty() ? graph_.terminal_node
                   : plan_.order.back();
    if (node_index_.find(terminal_node_) == node_index_.end()) {
        throw StructuralError("terminal node '" + terminal_node_ + "' is not declared");
    }
}

WorkflowResult GraphExecutor::execute(const Payload& initial_input, const json& overrides) const {
    WorkflowResult result;
    auto start_time = std::chrono::steady_clock::now();

    logger_->log_workflow_start(graph_.name, config_.parallel ? "graph-parallel" : "graph",
                                graph_.nodes.size(), initial_input.record_count());

    if (config_.parallel) {
        execute_waves(result, initial_input, overrides, start_time);
    } else {
        execute_sequential(result, initial_input, overrides, start_time);
    }

    result.total_execution_time_ms = elapsed_ms(start_time);
    logger_->log_workflow_complete(graph_.name, result.success, result.trace.size(),
                                   result.total_execution_time_ms,
                                   error_kind_to_string(result.error_kind));

    return result;
}

void GraphExecutor::execute_sequential(
    WorkflowResult& result,
    const Payload& initial_input,
    const json& overrides,
    TimePoint start
) const {
    const size_t n = plan_.order.size();
    std::vector<Payload> outputs(n);
    std::vector<TraceEntry> traces(n);
    std::vector<bool> done(n, false);

    for (size_t r = 0; r < n; ++r) {
        const std::string& id = plan_.order[r];

        if (deadline_passed(start)) {
            fail_timeout(result, id);
            finish(result, outputs, traces, done, r);
            return;
        }

        const orchestrator::NodeDefinition& node = graph_.nodes[node_index_.at(id)];
        NodeRun run = run_node(
            registry_, node,
            [&]() { return route_input(id, initial_input, outputs); },
            overrides, graph_.name, *logger_
        );

        if (!run.success) {
            fail_node(result, id, run.error_message);
            finish(result, outputs, traces, done, r);
            return;
        }

        outputs[r] = std::move(run.output);
        traces[r] = run.trace;
        done[r] = true;
    }

    finish(result, outputs, traces, done, n);
}

void GraphExecutor::execute_waves(
    WorkflowResult& result,
    const Payload& initial_input,
    const json& overrides,
    TimePoint start
) const {
    const size_t n = plan_.order.size();
    std::vector<Payload> outputs(n);
    std::vector<TraceEntry> traces(n);
    std::vector<bool> done(n, false);

    for (const auto& wave : plan_.waves) {
        if (deadline_passed(start)) {
            fail_timeout(result, wave.front());
            finish(result, outputs, traces, done, n);
            return;
        }

        // One slot per wave member; predecessors' outputs are only read here
        std::vector<NodeRun> runs(wave.size());
        const long wave_size = static_cast<long>(wave.size());

#ifdef HAVE_OPENMP
        #pragma omp parallel for schedule(dynamic)
        for (long i = 0; i < wave_size; ++i) {
            const std::string& id = wave[static_cast<size_t>(i)];
            runs[static_cast<size_t>(i)] = run_node(
                registry_, graph_.nodes[node_index_.at(id)],
                [&]() { return route_input(id, initial_input, outputs); },
                overrides, graph_.name, *logger_
            );
        }
#else
        // Single-threaded fallback when OpenMP not available
        for (long i = 0; i < wave_size; ++i) {
            const std::string& id = wave[static_cast<size_t>(i)];
            runs[static_cast<size_t>(i)] = run_node(
                registry_, graph_.nodes[node_index_.at(id)],
                [&]() { return route_input(id, initial_input, outputs); },
                overrides, graph_.name, *logger_
            );
        }
#endif

        // Waves are in rank order, so the first failure found is the lowest-ranked one
        for (size_t i = 0; i < wave.size(); ++i) {
            size_t r = plan_.rank.at(wave[i]);
            if (!runs[i].success) {
                // A sequential run would still have reached the lower-ranked
                // nodes of later waves; run them before reporting
                for (size_t p = 0; p < r; ++p) {
                    if (done[p]) {
                        continue;
                    }
                    const std::string& id = plan_.order[p];
                    if (deadline_passed(start)) {
                        fail_timeout(result, id);
                        finish(result, outputs, traces, done, p);
                        return;
                    }
                    NodeRun run = run_node(
                        registry_, graph_.nodes[node_index_.at(id)],
                        [&]() { return route_input(id, initial_input, outputs); },
                        overrides, graph_.name, *logger_
                    );
                    if (!run.success) {
                        fail_node(result, id, run.error_message);
                        finish(result, outputs, traces, done, p);
                        return;
                    }
                    outputs[p] = std::move(run.output);
                    traces[p] = run.trace;
                    done[p] = true;
                }

                fail_node(result, wave[i], runs[i].error_message);
                finish(result, outputs, traces, done, r);
                return;
            }
            outputs[r] = std::move(runs[i].output);
            traces[r] = runs[i].trace;
            done[r] = true;
        }
    }

    finish(result, outputs, traces, done, n);
}

Payload GraphExecutor::route_input(
    const std::string& node_id,
    const Payload& initial_input,
    const std::vector<Payload>& outputs
) const {
    const auto& predecessors = plan_.predecessors.at(node_id);

    if (predecessors.empty()) {
        return initial_input;
    }
    if (predecessors.size() == 1) {
        return outputs[plan_.rank.at(predecessors.front())];
    }

    std::map<std::string, Envelope> upstream;
    for (const std::string& pred : predecessors) {
        upstream.emplace(pred, outputs[plan_.rank.at(pred)].envelope());
    }
    return Payload::fan_in(std::move(upstream));
}

bool GraphExecutor::deadline_passed(TimePoint start) const {
    return config_.timeout_ms > 0 && elapsed_ms(start) >= static_cast<double>(config_.timeout_ms);
}

void GraphExecutor::fail_node(WorkflowResult& result, const std::string& node_id,
                              const std::string& message) const {
    result.success = false;
    result.error_kind = ErrorKind::NodeExecution;
    result.failed_node = node_id;
    result.error_message = message;
}

void GraphExecutor::fail_timeout(WorkflowResult& result, const std::string& next_node) const {
    result.success = false;
    result.error_kind = ErrorKind::Timeout;
    result.failed_node = next_node;
    result.error_message = "deadline of " + std::to_string(config_.timeout_ms) +
                           " ms passed before node '" + next_node + "' was launched";

    const auto& node = graph_.nodes[node_index_.at(next_node)];
    logger_->log_warning(ExecutionContext(graph_.name, node.id, node.type), result.error_message);
}

void GraphExecutor::finish(
    WorkflowResult& result,
    std::vector<Payload>& outputs,
    const std::vector<TraceEntry>& traces,
    const std::vector<bool>& done,
    size_t limit
) const {
    for (size_t r = 0; r < limit && r < outputs.size(); ++r) {
        if (!done[r]) {
            continue;
        }
        result.trace.push_back(traces[r]);
        result.node_outputs[plan_.order[r]] = outputs[r];
    }

    if (result.success) {
        result.output = std::move(outputs[plan_.rank.at(terminal_node_)]);
    }
}

} // namespace ledgerflow
