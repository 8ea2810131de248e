#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>
#include "execution_result.hpp"
#include "graph_executor.hpp"
#include "logger.hpp"
#include "node_registry.hpp"
#include "pipeline_executor.hpp"
#include "workflow_parser.hpp"
#include "io/json_writer.hpp"
#include "io/record_loader.hpp"

#include <nlohmann/json.hpp>
using json = nlohmann::json;

namespace {

// Process exit codes
constexpr int EXIT_OK = 0;
constexpr int EXIT_WORKFLOW_FAILED = 1;
constexpr int EXIT_USAGE = 2;

struct CLIArgs {
    std::string workflow_path;
    std::string input_path;
    std::string overrides_path;
    std::string output_path;
    std::string terminal_node;
    long long timeout_ms = 0;
    bool parallel = false;
    std::string log_level = "INFO";
    std::string log_file;
    bool log_text = false;
    bool list_nodes = false;
    bool help = false;
};

void print_usage(const char* program_name) {
    std::cerr << "LedgerFlow v1.0.0\n\n";
    std::cerr << "Usage: " << program_name << " --workflow <path> [options]\n\n";
    std::cerr << "Workflow options:\n";
    std::cerr << "  --workflow <path>           JSON workflow definition (pipeline or graph)\n";
    std::cerr << "  --input <path>              Initial records (.json, .csv or .parquet)\n";
    std::cerr << "                              (default: empty record set)\n";
    std::cerr << "  --overrides <path>          JSON parameter overrides keyed by node id\n";
    std::cerr << "  --terminal <node>           Report this graph node's output instead of the last one\n\n";
    std::cerr << "Execution options:\n";
    std::cerr << "  --timeout-ms <ms>           Deadline for the whole run (default: none)\n";
    std::cerr << "  --parallel                  Run independent graph nodes concurrently\n\n";
    std::cerr << "Output options:\n";
    std::cerr << "  --output <path>             JSON result file (default: stdout)\n\n";
    std::cerr << "Logging options:\n";
    std::cerr << "  --log-level <level>         DEBUG, INFO, WARN or ERROR (default: INFO)\n";
    std::cerr << "  --log-file <path>           Also append log lines to this file\n";
    std::cerr << "  --log-text                  Plain text log lines instead of JSON\n\n";
    std::cerr << "Other options:\n";
    std::cerr << "  --list-nodes                Print the node catalog as JSON and exit\n";
    std::cerr << "  --help                      Show this help message\n\n";
    std::cerr << "Exit codes: 0 success, 1 workflow failed, 2 usage or configuration error\n\n";
    std::cerr << "Example:\n";
    std::cerr << "  " << program_name << " --workflow examples/receivables_graph.json \\\n";
    std::cerr << "      --input examples/invoices.json --parallel --output result.json\n";
}

bool file_exists(const std::string& path) {
    std::ifstream f(path);
    return f.good();
}

bool parse_args(int argc, char* argv[], CLIArgs& args) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            args.help = true;
            return true;
        } else if (arg == "--workflow" && i + 1 < argc) {
            args.workflow_path = argv[++i];
        } else if (arg == "--input" && i + 1 < argc) {
            args.input_path = argv[++i];
        } else if (arg == "--overrides" && i + 1 < argc) {
            args.overrides_path = argv[++i];
        } else if (arg == "--output" && i + 1 < argc) {
            args.output_path = argv[++i];
        } else if (arg == "--terminal" && i + 1 < argc) {
            args.terminal_node = argv[++i];
        } else if (arg == "--timeout-ms" && i + 1 < argc) {
            try {
                args.timeout_ms = std::stoll(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Error: --timeout-ms expects an integer, got " << argv[i] << "\n\n";
                return false;
            }
        } else if (arg == "--parallel") {
            args.parallel = true;
        } else if (arg == "--log-level" && i + 1 < argc) {
            args.log_level = argv[++i];
        } else if (arg == "--log-file" && i + 1 < argc) {
            args.log_file = argv[++i];
        } else if (arg == "--log-text") {
            args.log_text = true;
        } else if (arg == "--list-nodes") {
            args.list_nodes = true;
        } else {
            std::cerr << "Error: Unknown option or missing argument: " << arg << "\n\n";
            return false;
        }
    }
    return true;
}

bool validate_args(const CLIArgs& args) {
    bool valid = true;

    if (args.workflow_path.empty()) {
        std::cerr << "Error: --workflow is required\n";
        valid = false;
    } else if (!file_exists(args.workflow_path)) {
        std::cerr << "Error: Workflow file not found: " << args.workflow_path << "\n";
        valid = false;
    }

    if (!args.input_path.empty() && !file_exists(args.input_path)) {
        std::cerr << "Error: Input file not found: " << args.input_path << "\n";
        valid = false;
    }

    if (!args.overrides_path.empty() && !file_exists(args.overrides_path)) {
        std::cerr << "Error: Overrides file not found: " << args.overrides_path << "\n";
        valid = false;
    }

    if (args.timeout_ms < 0) {
        std::cerr << "Error: --timeout-ms must be non-negative\n";
        valid = false;
    }

    if (args.log_level != "DEBUG" && args.log_level != "INFO" &&
        args.log_level != "WARN" && args.log_level != "ERROR") {
        std::cerr << "Error: --log-level must be DEBUG, INFO, WARN or ERROR\n";
        valid = false;
    }

    return valid;
}

void configure_logging(const CLIArgs& args) {
    ledgerflow::LoggerConfig config;
    config.min_level = ledgerflow::string_to_level(args.log_level);
    config.enable_json = !args.log_text;
    if (!args.log_file.empty()) {
        config.enable_file = true;
        config.log_file_path = args.log_file;
    }
    ledgerflow::Logger::get_instance().configure(config);
}

void write_result(const CLIArgs& args, const json& document) {
    if (args.output_path.empty()) {
        ledgerflow::io::write_json_document(std::cout, document);
    } else {
        ledgerflow::io::write_json_document(args.output_path, document);
    }
}

// Result document for a workflow rejected before any node ran
json rejected_workflow_document(const ledgerflow::WorkflowError& e) {
    ledgerflow::WorkflowResult result;
    result.success = false;
    result.error_kind = e.kind();
    result.error_message = e.what();
    return result;
}

// Reports the rejection on stderr and as the result document
int reject_workflow(const CLIArgs& args, const ledgerflow::WorkflowError& e) {
    std::cerr << "Error [" << ledgerflow::error_kind_to_string(e.kind()) << "]: " << e.what() << "\n";
    try {
        write_result(args, rejected_workflow_document(e));
    } catch (const std::exception& write_error) {
        std::cerr << "Error: " << write_error.what() << "\n";
    }
    return EXIT_USAGE;
}

json list_nodes_document(const ledgerflow::NodeRegistry& registry) {
    json catalog = json::object();
    for (const auto& pair : registry.describe_by_category()) {
        catalog[pair.first] = pair.second;
    }
    return catalog;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    CLIArgs args;

    if (!parse_args(argc, argv, args)) {
        print_usage(argv[0]);
        return EXIT_USAGE;
    }

    if (args.help) {
        print_usage(argv[0]);
        return EXIT_OK;
    }

    if (args.list_nodes) {
        try {
            write_result(args, list_nodes_document(ledgerflow::default_registry()));
        } catch (const std::exception& e) {
            std::cerr << "Error: " << e.what() << "\n";
            return EXIT_USAGE;
        }
        return EXIT_OK;
    }

    if (!validate_args(args)) {
        std::cerr << "\nUse --help for usage information.\n";
        return EXIT_USAGE;
    }

    configure_logging(args);

    ledgerflow::orchestrator::WorkflowDefinition workflow;
    json overrides = json::object();
    ledgerflow::Envelope input;

    // Everything up to the first node launch is configuration
    try {
        workflow = ledgerflow::orchestrator::parse_workflow_from_file(args.workflow_path);
        if (!args.overrides_path.empty()) {
            overrides = ledgerflow::orchestrator::parse_overrides_from_file(args.overrides_path);
        }
        if (!args.input_path.empty()) {
            input = ledgerflow::io::load_records(args.input_path);
        }
    } catch (const ledgerflow::WorkflowError& e) {
        return reject_workflow(args, e);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return EXIT_USAGE;
    }

    if (!args.terminal_node.empty() && workflow.form != ledgerflow::orchestrator::WorkflowForm::Graph) {
        std::cerr << "Error: --terminal only applies to graph workflows\n";
        return EXIT_USAGE;
    }

    ledgerflow::WorkflowResult result;
    try {
        if (workflow.form == ledgerflow::orchestrator::WorkflowForm::Graph) {
            ledgerflow::GraphExecutorConfig config;
            config.timeout_ms = args.timeout_ms;
            config.parallel = args.parallel;
            config.terminal_node = args.terminal_node;
            ledgerflow::GraphExecutor executor(workflow.graph, ledgerflow::default_registry(), config);
            result = executor.execute(input, overrides);
        } else {
            ledgerflow::PipelineExecutorConfig config;
            config.timeout_ms = args.timeout_ms;
            ledgerflow::PipelineExecutor executor(workflow.pipeline, ledgerflow::default_registry(), config);
            result = executor.execute(input, overrides);
        }
    } catch (const ledgerflow::WorkflowError& e) {
        return reject_workflow(args, e);
    }

    try {
        write_result(args, result);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return EXIT_USAGE;
    }

    ledgerflow::Logger::get_instance().flush();

    if (!result.success) {
        std::cerr << "Workflow failed [" << ledgerflow::error_kind_to_string(result.error_kind) << "]";
        if (!result.failed_node.empty()) {
            std::cerr << " at node '" << result.failed_node << "'";
        }
        std::cerr << ": " << result.error_message << "\n";
        return EXIT_WORKFLOW_FAILED;
    }

    return EXIT_OK;
}
