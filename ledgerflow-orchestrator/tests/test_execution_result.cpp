#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "../src/execution_result.hpp"

using namespace ledgerflow;
using Catch::Matchers::ContainsSubstring;
using json = nlohmann::json;

TEST_CASE("WorkflowResult JSON", "[execution_result]") {
    Record r;
    r.id = "INV-1";
    r.total_amount = 250.0;

    SECTION("Successful run") {
        WorkflowResult result;
        result.output = Envelope({r});
        result.trace.push_back(TraceEntry("aging", "AgingCalculatorNode", 0.5, 1, 1));
        result.total_execution_time_ms = 2.0;

        json j = result;

        REQUIRE(j["status"] == "success");
        REQUIRE(j["output"]["records"][0]["id"] == "INV-1");
        REQUIRE(j["trace"].size() == 1);
        REQUIRE(j["trace"][0]["node_id"] == "aging");
        REQUIRE(j["trace"][0]["type"] == "AgingCalculatorNode");
        REQUIRE(j["trace"][0]["input_size"] == 1);
        REQUIRE_FALSE(j.contains("error_detail"));
        REQUIRE_FALSE(j.contains("node_outputs"));
    }

    SECTION("Failed run") {
        WorkflowResult result;
        result.success = false;
        result.error_kind = ErrorKind::NodeExecution;
        result.failed_node = "sla";
        result.error_message = "Invalid parameter 'sla_days': must be non-negative, got -1";

        json j = result;

        REQUIRE(j["status"] == "error");
        REQUIRE(j["output"].is_null());
        REQUIRE(j["trace"].empty());
        REQUIRE(j["error_detail"]["kind"] == "NodeExecution");
        REQUIRE(j["error_detail"]["failed_node"] == "sla");
        REQUIRE_THAT(j["error_detail"]["message"].get<std::string>(), ContainsSubstring("sla_days"));
    }

    SECTION("Graph runs carry node outputs") {
        WorkflowResult result;
        result.output = Envelope({r});
        result.node_outputs["source"] = Envelope({r});

        json j = result;

        REQUIRE(j["node_outputs"]["source"]["records"].size() == 1);
    }
}

TEST_CASE("WorkflowResult rethrows failures by kind", "[execution_result]") {
    WorkflowResult result;

    SECTION("Success does not throw") {
        REQUIRE_NOTHROW(result.throw_if_failed());
    }

    result.success = false;
    result.failed_node = "aging";
    result.error_message = "boom";

    SECTION("Node execution") {
        result.error_kind = ErrorKind::NodeExecution;
        try {
            result.throw_if_failed();
            FAIL("expected NodeExecutionError");
        } catch (const NodeExecutionError& e) {
            REQUIRE(e.node_id() == "aging");
            REQUIRE(std::string(e.what()) == "Node 'aging' failed: boom");
        }
    }

    SECTION("Timeout") {
        result.error_kind = ErrorKind::Timeout;
        REQUIRE_THROWS_AS(result.throw_if_failed(), TimeoutError);
    }

    SECTION("Registry lookups") {
        result.error_kind = ErrorKind::NodeNotFound;
        REQUIRE_THROWS_AS(result.throw_if_failed(), NodeNotFoundError);
    }

    SECTION("Error kind names") {
        REQUIRE(error_kind_to_string(ErrorKind::Structural) == "Structural");
        REQUIRE(error_kind_to_string(ErrorKind::Timeout) == "Timeout");
        REQUIRE(error_kind_to_string(ErrorKind::None) == "None");
    }
}
