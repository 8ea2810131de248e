#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "../src/workflow_parser.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace ledgerflow;
using namespace ledgerflow::orchestrator;
using Catch::Matchers::ContainsSubstring;

TEST_CASE("Environment variable expansion", "[workflow_parser]") {
    SECTION("Expand ${VAR}") {
        setenv("LEDGERFLOW_TEST_VAR", "2025-01-30", 1);
        auto result = expand_environment_variables("as_of_${LEDGERFLOW_TEST_VAR}_end");
        REQUIRE(result == "as_of_2025-01-30_end");
        unsetenv("LEDGERFLOW_TEST_VAR");
    }

    SECTION("Expand $VAR") {
        setenv("LEDGERFLOW_TEST_VAR", "EMEA", 1);
        auto result = expand_environment_variables("region=$LEDGERFLOW_TEST_VAR");
        REQUIRE(result == "region=EMEA");
        unsetenv("LEDGERFLOW_TEST_VAR");
    }

    SECTION("Undefined variable expands to empty string") {
        REQUIRE(expand_environment_variables("${LEDGERFLOW_UNDEFINED_VAR}") == "");
    }

    SECTION("Lone dollar and unclosed brace stay literal") {
        REQUIRE(expand_environment_variables("cost $ 5") == "cost $ 5");
        REQUIRE(expand_environment_variables("${OPEN") == "${OPEN");
        REQUIRE(expand_environment_variables("trailing$") == "trailing$");
    }

    SECTION("Nested parameters") {
        setenv("LEDGERFLOW_TEST_VAR", "Open", 1);
        nlohmann::json params = {
            {"conditions", nlohmann::json::array({
                {{"field", "status"}, {"value", "${LEDGERFLOW_TEST_VAR}"}}})},
            {"threshold", 30}};

        auto expanded = expand_parameters(params);

        REQUIRE(expanded["conditions"][0]["value"] == "Open");
        REQUIRE(expanded["threshold"] == 30);
        unsetenv("LEDGERFLOW_TEST_VAR");
    }
}

TEST_CASE("Pipeline form parsing", "[workflow_parser]") {
    SECTION("Steps and node definitions") {
        auto workflow = parse_workflow_from_string(R"({
            "name": "receivables",
            "steps": ["outstanding", "aging"],
            "node_defs": {
                "outstanding": {"type": "OutstandingCalculatorNode"},
                "aging": {"type": "AgingCalculatorNode", "parameters": {"as_of_date": "2025-01-30"}}
            }
        })");

        REQUIRE(workflow.form == WorkflowForm::Pipeline);
        REQUIRE(workflow.name() == "receivables");
        REQUIRE(workflow.pipeline.steps == std::vector<std::string>{"outstanding", "aging"});
        REQUIRE(workflow.pipeline.node_defs.at("aging").type == "AgingCalculatorNode");
        REQUIRE(workflow.pipeline.node_defs.at("aging").parameters["as_of_date"] == "2025-01-30");
        REQUIRE(workflow.pipeline.node_defs.at("outstanding").parameters.empty());
    }

    SECTION("Aliases") {
        auto workflow = parse_workflow_from_string(R"({
            "id": "aliased",
            "pipeline": ["sla"],
            "nodes": {"sla": {"node_type": "SLACheckerNode", "params": {"sla_days": 15}}}
        })");

        REQUIRE(workflow.form == WorkflowForm::Pipeline);
        REQUIRE(workflow.name() == "aliased");
        REQUIRE(workflow.pipeline.node_defs.at("sla").type == "SLACheckerNode");
        REQUIRE(workflow.pipeline.node_defs.at("sla").parameters["sla_days"] == 15);
    }

    SECTION("Inline steps") {
        auto workflow = parse_workflow_from_string(R"({
            "steps": [
                {"id": "sort", "type": "SortNode"},
                {"id": "summary", "type": "SummaryNode"}
            ]
        })");

        REQUIRE(workflow.pipeline.steps == std::vector<std::string>{"sort", "summary"});
        REQUIRE(workflow.pipeline.node_defs.at("summary").type == "SummaryNode");
    }

    SECTION("Missing steps") {
        REQUIRE_THROWS_AS(parse_workflow_from_string(R"({"name": "x"})"), WorkflowParseError);
    }

    SECTION("Step with no definition is structural") {
        REQUIRE_THROWS_AS(parse_workflow_from_string(R"({"steps": ["ghost"]})"), StructuralError);
    }

    SECTION("Empty pipeline is structural") {
        REQUIRE_THROWS_AS(parse_workflow_from_string(R"({"steps": []})"), StructuralError);
    }
}

TEST_CASE("Graph form parsing", "[workflow_parser]") {
    SECTION("Nodes, edges and terminal node") {
        auto workflow = parse_workflow_from_string(R"({
            "name": "dag",
            "nodes": [
                {"id": "aging", "type": "AgingCalculatorNode", "position": {"x": 10, "y": 20}},
                {"id": "dupes", "type": "DuplicateDetectorNode"},
                {"id": "merge", "type": "RecordUnionNode"}
            ],
            "edges": [
                {"source": "aging", "target": "merge", "hint": "parallel"},
                {"source": "dupes", "target": "merge"}
            ],
            "terminal_node": "merge"
        })");

        REQUIRE(workflow.form == WorkflowForm::Graph);
        REQUIRE(workflow.name() == "dag");
        REQUIRE(workflow.graph.nodes.size() == 3);
        REQUIRE(workflow.graph.edges.size() == 2);
        REQUIRE(workflow.graph.edges[0].hint == ExecutionHint::ParallelEligible);
        REQUIRE(workflow.graph.edges[1].hint == ExecutionHint::Sequential);
        REQUIRE(workflow.graph.terminal_node == "merge");
    }

    SECTION("Extra node keys become metadata") {
        auto workflow = parse_workflow_from_string(R"({
            "nodes": [{"id": "a", "type": "SummaryNode", "position": {"x": 1}, "label": "Totals"}]
        })");

        const auto& node = workflow.graph.nodes[0];
        REQUIRE(workflow.form == WorkflowForm::Graph);
        REQUIRE(node.metadata["position"]["x"] == 1);
        REQUIRE(node.metadata["label"] == "Totals");
        REQUIRE_FALSE(node.metadata.contains("type"));
    }

    SECTION("output_node alias") {
        auto workflow = parse_workflow_from_string(R"({
            "nodes": [{"id": "a", "type": "SummaryNode"}, {"id": "b", "type": "SortNode"}],
            "edges": [],
            "output_node": "a"
        })");

        REQUIRE(workflow.graph.terminal_node == "a");
    }

    SECTION("Cycle is structural") {
        REQUIRE_THROWS_WITH(parse_workflow_from_string(R"({
            "nodes": [{"id": "a", "type": "SortNode"}, {"id": "b", "type": "SortNode"}],
            "edges": [{"source": "a", "target": "b"}, {"source": "b", "target": "a"}]
        })"), ContainsSubstring("cyclic workflow"));
    }

    SECTION("Unknown edge endpoint is structural") {
        REQUIRE_THROWS_AS(parse_workflow_from_string(R"({
            "nodes": [{"id": "a", "type": "SortNode"}],
            "edges": [{"source": "a", "target": "missing"}]
        })"), StructuralError);
    }

    SECTION("Unknown hint is structural") {
        REQUIRE_THROWS_AS(parse_workflow_from_string(R"({
            "nodes": [{"id": "a", "type": "SortNode"}, {"id": "b", "type": "SortNode"}],
            "edges": [{"source": "a", "target": "b", "hint": "eager"}]
        })"), StructuralError);
    }

    SECTION("Malformed nodes and edges") {
        REQUIRE_THROWS_AS(parse_workflow_from_string(R"({"nodes": [{"type": "SortNode"}], "edges": []})"),
                          WorkflowParseError);
        REQUIRE_THROWS_AS(parse_workflow_from_string(R"({"nodes": [{"id": "a"}], "edges": []})"),
                          WorkflowParseError);
        REQUIRE_THROWS_AS(parse_workflow_from_string(R"({"nodes": [{"id": "a", "type": "SortNode"}],
                                                         "edges": [{"source": "a"}]})"),
                          WorkflowParseError);
        REQUIRE_THROWS_AS(parse_workflow_from_string(R"({"edges": []})"), WorkflowParseError);
    }

    SECTION("Parameters are expanded") {
        setenv("LEDGERFLOW_TEST_AS_OF", "2025-03-31", 1);
        auto workflow = parse_workflow_from_string(R"({
            "nodes": [{"id": "aging", "type": "AgingCalculatorNode",
                       "parameters": {"as_of_date": "${LEDGERFLOW_TEST_AS_OF}"}}]
        })");
        unsetenv("LEDGERFLOW_TEST_AS_OF");

        REQUIRE(workflow.graph.nodes[0].parameters["as_of_date"] == "2025-03-31");
    }
}

TEST_CASE("Workflow parse errors", "[workflow_parser]") {
    SECTION("Invalid JSON") {
        REQUIRE_THROWS_WITH(parse_workflow_from_string("{not json"), ContainsSubstring("JSON parse error"));
    }

    SECTION("Not an object") {
        REQUIRE_THROWS_AS(parse_workflow_from_string("[1, 2]"), WorkflowParseError);
    }

    SECTION("Wrong value type") {
        REQUIRE_THROWS_AS(parse_workflow_from_string(R"({"steps": ["a"], "node_defs": {"a": {"type": 5}}})"),
                          WorkflowParseError);
    }

    SECTION("Parameters must be an object") {
        REQUIRE_THROWS_AS(parse_workflow_from_string(R"({"nodes": [{"id": "a", "type": "SortNode", "parameters": [1]}]})"),
                          WorkflowParseError);
    }

    SECTION("Missing file") {
        REQUIRE_THROWS_WITH(parse_workflow_from_file("no_such_workflow.json"),
                            ContainsSubstring("Failed to open workflow file"));
    }
}

TEST_CASE("Workflow file parsing", "[workflow_parser]") {
    const std::string path = "test_workflow_parser_file.json";
    {
        std::ofstream out(path);
        out << R"({"name": "from_file", "steps": [{"id": "summary", "type": "SummaryNode"}]})";
    }

    auto workflow = parse_workflow_from_file(path);
    REQUIRE(workflow.name() == "from_file");
    REQUIRE(workflow.pipeline.steps.size() == 1);

    std::filesystem::remove(path);
}

TEST_CASE("Overrides parsing", "[workflow_parser]") {
    SECTION("Object of objects") {
        auto overrides = parse_overrides_from_string(R"({"aging": {"as_of_date": "2025-02-28"}})");
        REQUIRE(overrides["aging"]["as_of_date"] == "2025-02-28");
    }

    SECTION("Rejected shapes") {
        REQUIRE_THROWS_AS(parse_overrides_from_string("[]"), WorkflowParseError);
        REQUIRE_THROWS_AS(parse_overrides_from_string(R"({"aging": 5})"), WorkflowParseError);
        REQUIRE_THROWS_AS(parse_overrides_from_string("{"), WorkflowParseError);
        REQUIRE_THROWS_AS(parse_overrides_from_file("no_such_overrides.json"), WorkflowParseError);
    }
}
