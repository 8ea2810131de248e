/**
 * @file pipeline_executor.cpp
 * @brief Implementation of PipelineExecutor
 */

#include "pipeline_executor.hpp"
#include "node_runner.hpp"
#include <chrono>

namespace ledgerflow {

PipelineExecutor::PipelineExecutor(
    const orchestrator::PipelineDefinition& pipeline,
    const NodeRegistry& registry,
    const PipelineExecutorConfig& config,
    Logger* logger
)
    : pipeline_(pipeline),
      registry_(registry),
      config_(config),
      logger_(logger) {

    if (!logger_) {
        logger_ = &Logger::get_instance();
    }

    orchestrator::validate_pipeline_definition(pipeline_);

    // Every type must resolve before anything runs
    for (const std::string& step : pipeline_.steps) {
        registry_.require_registered(pipeline_.node_defs.at(step).type);
    }
}

WorkflowResult PipelineExecutor::execute(const Payload& initial_input, const nlohmann::json& overrides) const {
    WorkflowResult result;
    auto start_time = std::chrono::steady_clock::now();

    logger_->log_workflow_start(pipeline_.name, "pipeline", pipeline_.steps.size(),
                                initial_input.record_count());

    Payload data = initial_input;

    for (const std::string& step : pipeline_.steps) {
        if (config_.timeout_ms > 0 && elapsed_ms(start_time) >= static_cast<double>(config_.timeout_ms)) {
            result.success = false;
            result.error_kind = ErrorKind::Timeout;
            result.failed_node = step;
            result.error_message = "deadline of " + std::to_string(config_.timeout_ms) +
                                   " ms passed before step '" + step + "' was launched";
            logger_->log_warning(ExecutionContext(pipeline_.name, step, pipeline_.node_defs.at(step).type),
                                 result.error_message);
            break;
        }

        const orchestrator::NodeDefinition& node = pipeline_.node_defs.at(step);

        // Step ids may differ from the id stored in the definition; the step id wins
        orchestrator::NodeDefinition step_node = node;
        step_node.id = step;

        NodeRun run = run_node(registry_, step_node, [&data]() { return data; },
                               overrides, pipeline_.name, *logger_);

        if (!run.success) {
            result.success = false;
            result.error_kind = ErrorKind::NodeExecution;
            result.failed_node = step;
            result.error_message = run.error_message;
            break;
        }

        data = std::move(run.output);
        result.trace.push_back(run.trace);
    }

    if (result.success) {
        result.output = std::move(data);
    }

    result.total_execution_time_ms = elapsed_ms(start_time);
    logger_->log_workflow_complete(pipeline_.name, result.success, result.trace.size(),
                                   result.total_execution_time_ms,
                                   error_kind_to_string(result.error_kind));

    return result;
}

} // namespace ledgerflow
