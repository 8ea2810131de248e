/**
 * @file receivables_example.cpp
 * @brief Example running a receivables report as a pipeline and as a graph
 *
 * This example shows how to:
 * - Configure the Logger for DEBUG output
 * - Build a pipeline in code and run it with run-time overrides
 * - Build a fan-out graph and run it with independent nodes in parallel
 * - Read the trace and per-node outputs
 */

#include "../src/graph_executor.hpp"
#include "../src/node_registry.hpp"
#include "../src/pipeline_executor.hpp"
#include "logger.hpp"
#include <iostream>

using namespace ledgerflow;
using nlohmann::json;

namespace {

Envelope sample_invoices() {
    json invoices = json::array({
        {{"id", "INV-1"}, {"customer_name", "Acme"}, {"invoice_number", "A-100"},
         {"invoice_date", "2025-01-15"}, {"due_date", "2025-01-30"},
         {"total_amount", 1000.0}, {"paid_amount", 0.0}},
        {{"id", "INV-2"}, {"customer_name", "Globex"}, {"invoice_number", "G-200"},
         {"invoice_date", "2024-10-01"}, {"due_date", "2024-10-31"},
         {"total_amount", 500.0}, {"paid_amount", 500.0}},
        {{"id", "INV-3"}, {"customer_name", "Initech"}, {"invoice_number", "I-300"},
         {"invoice_date", "2024-09-15"}, {"due_date", "2024-10-15"},
         {"total_amount", 1000.0}, {"paid_amount", 0.0}}
    });
    return invoices.get<Envelope>();
}

void print_trace(const WorkflowResult& result) {
    for (const TraceEntry& entry : result.trace) {
        std::cout << "  " << entry.node_id << " (" << entry.type << "): "
                  << entry.input_size << " -> " << entry.output_size << " records, "
                  << entry.duration_ms << " ms\n";
    }
}

} // anonymous namespace

int main() {
    LoggerConfig log_config;
    log_config.min_level = LogLevel::DEBUG;  // Show all logs
    log_config.enable_json = false;          // Plain text for reading along
    Logger::get_instance().configure(log_config);

    // Pipeline: outstanding -> aging -> grouping -> summary
    orchestrator::PipelineDefinition pipeline;
    pipeline.name = "receivables_report";
    pipeline.steps = {"outstanding", "aging", "grouping", "summary"};
    pipeline.node_defs["outstanding"] = orchestrator::NodeDefinition("outstanding", "OutstandingCalculatorNode");
    pipeline.node_defs["aging"] = orchestrator::NodeDefinition("aging", "AgingCalculatorNode");
    pipeline.node_defs["grouping"] = orchestrator::NodeDefinition(
        "grouping", "GroupingNode", json{{"group_by", "aging_bucket"}});
    pipeline.node_defs["summary"] = orchestrator::NodeDefinition("summary", "SummaryNode");

    PipelineExecutor pipeline_executor(pipeline);
    WorkflowResult report = pipeline_executor.execute(
        sample_invoices(), json{{"aging", {{"as_of_date", "2025-01-30"}}}});

    std::cout << "\nPipeline " << report.status() << "\n";
    print_trace(report);
    if (!report.success) {
        std::cerr << report.error_message << "\n";
        return 1;
    }
    std::cout << json(report.output).dump(2) << "\n";

    // Graph: outstanding fans out to aging and duplicate detection
    orchestrator::GraphDefinition graph;
    graph.name = "receivables_checks";
    graph.nodes = {
        orchestrator::NodeDefinition("outstanding", "OutstandingCalculatorNode"),
        orchestrator::NodeDefinition("aging", "AgingCalculatorNode", json{{"as_of_date", "2025-01-30"}}),
        orchestrator::NodeDefinition("duplicates", "DuplicateDetectorNode"),
        orchestrator::NodeDefinition("sla", "SLACheckerNode", json{{"as_of_date", "2025-01-30"}})
    };
    graph.edges = {
        orchestrator::EdgeDefinition("outstanding", "aging", orchestrator::ExecutionHint::ParallelEligible),
        orchestrator::EdgeDefinition("outstanding", "duplicates", orchestrator::ExecutionHint::ParallelEligible),
        orchestrator::EdgeDefinition("aging", "sla")
    };

    GraphExecutorConfig config;
    config.parallel = true;
    GraphExecutor graph_executor(graph, default_registry(), config);
    WorkflowResult checks = graph_executor.execute(sample_invoices());

    std::cout << "\nGraph " << checks.status() << " (terminal: " << graph_executor.terminal_node() << ")\n";
    print_trace(checks);
    if (!checks.success) {
        std::cerr << checks.error_message << "\n";
        return 1;
    }

    const Envelope& duplicates = checks.node_outputs.at("duplicates").envelope();
    std::cout << "Exact duplicates: " << duplicates.duplicates->exact.size()
              << ", fuzzy duplicates: " << duplicates.duplicates->fuzzy.size() << "\n";

    Logger::get_instance().flush();
    return 0;
}
