/**
 * @file pipeline_executor.hpp
 * @brief Runs a linear pipeline of nodes
 *
 * Each step receives the previous step's output (the first step receives the
 * initial input). Parameters are the step's declared parameters merged with
 * the run-time override for that step, the override winning on collisions.
 * The first failing step aborts the run.
 */

#ifndef LEDGERFLOW_PIPELINE_EXECUTOR_HPP
#define LEDGERFLOW_PIPELINE_EXECUTOR_HPP

#include "execution_result.hpp"
#include "logger.hpp"
#include "node_registry.hpp"
#include "workflow_definition.hpp"
#include <cstdint>
#include <nlohmann/json.hpp>

namespace ledgerflow {

/**
 * @brief Pipeline executor configuration
 */
struct PipelineExecutorConfig {
    int64_t timeout_ms;     ///< Deadline for the whole run, checked before each step (0 = none)

    PipelineExecutorConfig() : timeout_ms(0) {}
};

/**
 * @brief Sequential pipeline executor
 *
 * Usage Example:
 *   @code
 *   PipelineDefinition pipeline = parse_workflow_from_file("aging.json").pipeline;
 *   PipelineExecutor executor(pipeline);
 *
 *   WorkflowResult result = executor.execute(Envelope(records),
 *                                             {{"aging", {{"as_of_date", "2025-01-30"}}}});
 *   if (!result.success) {
 *       std::cerr << result.failed_node << ": " << result.error_message << std::endl;
 *   }
 *   @endcode
 */
class PipelineExecutor {
public:
    /**
     * @brief Validate the pipeline and resolve every step's node type
     *
     * @param pipeline Pipeline definition (copied)
     * @param registry Node registry; must outlive the executor
     * @param config Executor configuration
     * @param logger Logger instance (optional, uses default if nullptr)
     *
     * @throws StructuralError If the pipeline is malformed
     * @throws NodeNotFoundError If a step's type is not registered
     */
    explicit PipelineExecutor(
        const orchestrator::PipelineDefinition& pipeline,
        const NodeRegistry& registry = default_registry(),
        const PipelineExecutorConfig& config = PipelineExecutorConfig(),
        Logger* logger = nullptr
    );

    /**
     * @brief Run every step in order
     *
     * @param initial_input Input of the first step
     * @param overrides Per-step parameter overrides: {step_id: {key: value}}
     *
     * @return Result with the last step's output, or the failure and the
     *         trace of the steps that completed
     */
    WorkflowResult execute(const Payload& initial_input,
                           const nlohmann::json& overrides = nlohmann::json::object()) const;

    const orchestrator::PipelineDefinition& definition() const { return pipeline_; }

private:
    orchestrator::PipelineDefinition pipeline_;
    const NodeRegistry& registry_;
    PipelineExecutorConfig config_;
    Logger* logger_;
};

} // namespace ledgerflow

#endif // LEDGERFLOW_PIPELINE_EXECUTOR_HPP
