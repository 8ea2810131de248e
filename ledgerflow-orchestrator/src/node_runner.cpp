#include "node_runner.hpp"
#include "node_parameters.hpp"

using json = nlohmann::json;

namespace ledgerflow {

double elapsed_ms(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
}

NodeRun run_node(
    const NodeRegistry& registry,
    const orchestrator::NodeDefinition& node,
    const std::function<Payload()>& make_input,
    const json& overrides,
    const std::string& workflow,
    Logger& logger
) {
    NodeRun run;
    ExecutionContext ctx(workflow, node.id, node.type);
    size_t input_size = 0;

    try {
        Payload input = make_input();
        input_size = input.record_count();

        json override_params;
        if (overrides.is_object()) {
            auto it = overrides.find(node.id);
            if (it != overrides.end()) {
                override_params = *it;
            }
        }
        json parameters = merge_parameters(node.parameters, override_params);

        logger.log_node_start(ctx, input_size);

        auto instance = registry.create_node(node.type);
        auto start = std::chrono::steady_clock::now();
        run.output = instance->run(input, parameters);
        double duration = elapsed_ms(start);

        run.trace = TraceEntry(node.id, node.type, duration, input_size, run.output.record_count());
        run.success = true;

        logger.log_node_complete(ctx, duration, input_size, run.trace.output_size);
    } catch (const std::exception& e) {
        run.success = false;
        run.output = Payload();
        run.error_message = e.what();
        logger.log_node_failure(ctx, run.error_message);
    }

    return run;
}

} // namespace ledgerflow
