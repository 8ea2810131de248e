#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>
#include <sys/wait.h>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>

using json = nlohmann::json;

#ifndef LEDGERFLOW_CLI_PATH
#define LEDGERFLOW_CLI_PATH "./ledgerflow"
#endif

#ifndef LEDGERFLOW_EXAMPLES_DIR
#define LEDGERFLOW_EXAMPLES_DIR "ledgerflow-orchestrator/examples"
#endif

namespace {

// Helper to run the CLI and capture its output
struct CommandResult {
    int exit_code;
    std::string stdout_output;
    std::string stderr_output;
};

std::string read_file(const std::string& path) {
    std::ifstream stream(path);
    std::ostringstream ss;
    if (stream) {
        ss << stream.rdbuf();
    }
    return ss.str();
}

CommandResult run_cli(const std::string& arguments) {
    const std::string stdout_file = "ledgerflow_cli_stdout.txt";
    const std::string stderr_file = "ledgerflow_cli_stderr.txt";

    std::string full_cmd = std::string(LEDGERFLOW_CLI_PATH) + " " + arguments +
                           " >" + stdout_file + " 2>" + stderr_file;
    int status = std::system(full_cmd.c_str());

    CommandResult result;
    result.exit_code = WEXITSTATUS(status);
    result.stdout_output = read_file(stdout_file);
    result.stderr_output = read_file(stderr_file);
    return result;
}

std::string write_workflow(const std::string& name, const json& workflow) {
    const std::string path = name + ".json";
    std::ofstream out(path);
    out << workflow.dump(2);
    return path;
}

bool contains(const std::string& text, const std::string& needle) {
    return text.find(needle) != std::string::npos;
}

const std::string EXAMPLES = LEDGERFLOW_EXAMPLES_DIR;

} // anonymous namespace

TEST_CASE("CLI help shows usage", "[cli]") {
    auto result = run_cli("--help");
    REQUIRE(result.exit_code == 0);
    REQUIRE(contains(result.stderr_output, "Usage:"));
    REQUIRE(contains(result.stderr_output, "--workflow"));
    REQUIRE(contains(result.stderr_output, "--list-nodes"));
}

TEST_CASE("CLI usage errors exit with 2", "[cli]") {
    SECTION("Missing workflow") {
        auto result = run_cli("");
        REQUIRE(result.exit_code == 2);
        REQUIRE(contains(result.stderr_output, "--workflow is required"));
    }

    SECTION("Workflow file not found") {
        auto result = run_cli("--workflow nonexistent_workflow.json");
        REQUIRE(result.exit_code == 2);
        REQUIRE(contains(result.stderr_output, "not found"));
    }

    SECTION("Unknown option") {
        auto result = run_cli("--unknown-option");
        REQUIRE(result.exit_code == 2);
        REQUIRE(contains(result.stderr_output, "Unknown option"));
    }

    SECTION("Bad log level") {
        auto result = run_cli("--workflow " + EXAMPLES + "/receivables_graph.json --log-level LOUD");
        REQUIRE(result.exit_code == 2);
        REQUIRE(contains(result.stderr_output, "--log-level"));
    }
}

TEST_CASE("CLI lists the node catalog", "[cli]") {
    auto result = run_cli("--list-nodes");
    REQUIRE(result.exit_code == 0);

    json catalog = json::parse(result.stdout_output);
    REQUIRE(catalog.contains("source"));
    REQUIRE(catalog.contains("calculation"));
    REQUIRE(catalog.contains("aggregation"));

    bool found_aging = false;
    for (const auto& info : catalog["calculation"]) {
        REQUIRE(info["category"] == "calculation");
        if (info["type"] == "AgingCalculatorNode") {
            found_aging = true;
        }
    }
    REQUIRE(found_aging);
}

TEST_CASE("CLI runs a graph workflow", "[cli][integration]") {
    const std::string output = "ledgerflow_cli_result.json";
    auto result = run_cli("--workflow " + EXAMPLES + "/receivables_graph.json"
                          " --input " + EXAMPLES + "/invoices.json"
                          " --parallel --log-level ERROR --output " + output);
    REQUIRE(result.exit_code == 0);

    json document = json::parse(read_file(output));
    REQUIRE(document["status"] == "success");
    REQUIRE(document["output"]["summary"]["total_records"] == 4);
    REQUIRE(document["trace"].size() == 8);
    REQUIRE_FALSE(document.contains("error_detail"));
}

TEST_CASE("CLI reports a failing node with exit code 1", "[cli][integration]") {
    std::string workflow = write_workflow("ledgerflow_cli_failing", {
        {"name", "failing_sla"},
        {"steps", {"outstanding", "sla"}},
        {"node_defs", {
            {"outstanding", {{"type", "OutstandingCalculatorNode"}}},
            {"sla", {{"type", "SLACheckerNode"}, {"parameters", {{"sla_days", -1}}}}}
        }}
    });

    auto result = run_cli("--workflow " + workflow + " --log-level ERROR");
    REQUIRE(result.exit_code == 1);
    REQUIRE(contains(result.stderr_output, "at node 'sla'"));

    json document = json::parse(result.stdout_output);
    REQUIRE(document["status"] == "error");
    REQUIRE(document["error_detail"]["kind"] == "NodeExecution");
    REQUIRE(document["error_detail"]["failed_node"] == "sla");
    REQUIRE(document["trace"].size() == 1);
}

TEST_CASE("CLI writes an error document for rejected workflows", "[cli]") {
    SECTION("Cycle") {
        std::string workflow = write_workflow("ledgerflow_cli_cycle", {
            {"nodes", json::array({
                {{"id", "a"}, {"type", "SummaryNode"}},
                {{"id", "b"}, {"type", "SummaryNode"}}
            })},
            {"edges", json::array({
                {{"source", "a"}, {"target", "b"}},
                {{"source", "b"}, {"target", "a"}}
            })}
        });

        auto result = run_cli("--workflow " + workflow);
        REQUIRE(result.exit_code == 2);

        json document = json::parse(result.stdout_output);
        REQUIRE(document["status"] == "error");
        REQUIRE(document["error_detail"]["kind"] == "Structural");
        REQUIRE(document["trace"].empty());
    }

    SECTION("Unknown node type") {
        std::string workflow = write_workflow("ledgerflow_cli_unknown", {
            {"steps", {"mystery"}},
            {"node_defs", {{"mystery", {{"type", "NoSuchNode"}}}}}
        });

        const std::string output = "ledgerflow_cli_rejected.json";
        auto result = run_cli("--workflow " + workflow + " --output " + output);
        REQUIRE(result.exit_code == 2);
        REQUIRE(contains(result.stderr_output, "NodeNotFound"));

        json document = json::parse(read_file(output));
        REQUIRE(document["status"] == "error");
        REQUIRE(document["error_detail"]["kind"] == "NodeNotFound");
        REQUIRE(document["output"].is_null());
    }
}
