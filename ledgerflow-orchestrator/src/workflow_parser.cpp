#include "workflow_parser.hpp"
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace ledgerflow {
namespace orchestrator {

namespace {

const json* find_either(const json& j, const char* key, const char* alias) {
    auto it = j.find(key);
    if (it != j.end() && !it->is_null()) {
        return &(*it);
    }
    it = j.find(alias);
    if (it != j.end() && !it->is_null()) {
        return &(*it);
    }
    return nullptr;
}

json parse_parameters(const json& node_json, const std::string& node_id) {
    const json* params = find_either(node_json, "parameters", "params");
    if (!params) {
        return json::object();
    }
    if (!params->is_object()) {
        throw WorkflowParseError("Parameters of node '" + node_id + "' must be an object");
    }
    return expand_parameters(*params);
}

NodeDefinition parse_node(const json& node_json, const std::string& fallback_id) {
    if (!node_json.is_object()) {
        throw WorkflowParseError("Node definition must be an object");
    }

    NodeDefinition node;
    if (node_json.contains("id")) {
        node.id = node_json["id"].get<std::string>();
    } else if (!fallback_id.empty()) {
        node.id = fallback_id;
    } else {
        throw WorkflowParseError("Node missing required field: id");
    }

    const json* type = find_either(node_json, "type", "node_type");
    if (!type) {
        throw WorkflowParseError("Node '" + node.id + "' missing required field: type");
    }
    node.type = type->get<std::string>();

    node.parameters = parse_parameters(node_json, node.id);

    // Anything else (position, label, ...) is carried along untouched
    for (auto it = node_json.begin(); it != node_json.end(); ++it) {
        const std::string& key = it.key();
        if (key != "id" && key != "type" && key != "node_type" &&
            key != "parameters" && key != "params") {
            node.metadata[key] = it.value();
        }
    }

    return node;
}

PipelineDefinition parse_pipeline(const json& j) {
    PipelineDefinition pipeline;

    const json* steps = find_either(j, "steps", "pipeline");
    if (!steps) {
        throw WorkflowParseError("Missing required field: steps");
    }
    if (!steps->is_array()) {
        throw WorkflowParseError("Field 'steps' must be an array");
    }

    const json* node_defs = find_either(j, "node_defs", "nodes");
    if (node_defs) {
        if (!node_defs->is_object()) {
            throw WorkflowParseError("Field 'node_defs' must be an object keyed by step id");
        }
        for (auto it = node_defs->begin(); it != node_defs->end(); ++it) {
            NodeDefinition node = parse_node(it.value(), it.key());
            node.id = it.key();
            pipeline.node_defs[it.key()] = std::move(node);
        }
    }

    for (const auto& step : *steps) {
        if (step.is_string()) {
            pipeline.steps.push_back(step.get<std::string>());
        } else if (step.is_object()) {
            // Inline step: {"id", "type", "parameters"}
            NodeDefinition node = parse_node(step, "");
            pipeline.steps.push_back(node.id);
            pipeline.node_defs[node.id] = std::move(node);
        } else {
            throw WorkflowParseError("Pipeline steps must be step ids or node objects");
        }
    }

    validate_pipeline_definition(pipeline);
    return pipeline;
}

GraphDefinition parse_graph(const json& j) {
    GraphDefinition graph;

    if (!j.contains("nodes")) {
        throw WorkflowParseError("Missing required field: nodes");
    }
    if (!j["nodes"].is_array()) {
        throw WorkflowParseError("Field 'nodes' must be an array");
    }
    for (const auto& node_json : j["nodes"]) {
        graph.nodes.push_back(parse_node(node_json, ""));
    }

    if (j.contains("edges")) {
        if (!j["edges"].is_array()) {
            throw WorkflowParseError("Field 'edges' must be an array");
        }
        for (const auto& edge_json : j["edges"]) {
            if (!edge_json.contains("source") || !edge_json.contains("target")) {
                throw WorkflowParseError("Edge missing required field: source/target");
            }
            EdgeDefinition edge;
            edge.source = edge_json["source"].get<std::string>();
            edge.target = edge_json["target"].get<std::string>();
            if (edge_json.contains("hint")) {
                edge.hint = string_to_execution_hint(edge_json["hint"].get<std::string>());
            }
            graph.edges.push_back(edge);
        }
    }

    if (const json* terminal = find_either(j, "terminal_node", "output_node")) {
        graph.terminal_node = terminal->get<std::string>();
    }

    validate_graph_definition(graph);
    return graph;
}

std::string read_file(const std::string& file_path, const std::string& what) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw WorkflowParseError("Failed to open " + what + " file: " + file_path);
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

} // anonymous namespace

std::string expand_environment_variables(const std::string& value) {
    std::string result;
    result.reserve(value.size());
    size_t pos = 0;

    while (pos < value.size()) {
        if (value[pos] != '$') {
            result += value[pos++];
            continue;
        }

        size_t cursor = pos + 1;

        // Check for ${VAR} syntax
        bool braces = cursor < value.size() && value[cursor] == '{';
        if (braces) {
            cursor++;
        }

        // Extract variable name
        size_t name_start = cursor;
        while (cursor < value.size() &&
               (std::isalnum(static_cast<unsigned char>(value[cursor])) || value[cursor] == '_')) {
            cursor++;
        }
        std::string var_name = value.substr(name_start, cursor - name_start);

        if (var_name.empty() || (braces && (cursor >= value.size() || value[cursor] != '}'))) {
            // Not a reference; keep the '$' literally
            result += value[pos++];
            continue;
        }
        if (braces) {
            cursor++;  // Skip '}'
        }

        const char* env_value = std::getenv(var_name.c_str());
        result += env_value ? env_value : "";
        pos = cursor;
    }

    return result;
}

json expand_parameters(const json& parameters) {
    if (parameters.is_string()) {
        return expand_environment_variables(parameters.get<std::string>());
    }
    if (parameters.is_object()) {
        json expanded = json::object();
        for (auto it = parameters.begin(); it != parameters.end(); ++it) {
            expanded[it.key()] = expand_parameters(it.value());
        }
        return expanded;
    }
    if (parameters.is_array()) {
        json expanded = json::array();
        for (const auto& item : parameters) {
            expanded.push_back(expand_parameters(item));
        }
        return expanded;
    }
    return parameters;
}

WorkflowDefinition parse_workflow(const json& j) {
    WorkflowDefinition workflow;

    try {
        if (!j.is_object()) {
            throw WorkflowParseError("Workflow document must be a JSON object");
        }

        const bool is_graph = j.contains("edges") || (j.contains("nodes") && j["nodes"].is_array());
        workflow.form = is_graph ? WorkflowForm::Graph : WorkflowForm::Pipeline;

        std::string name;
        if (const json* value = find_either(j, "name", "id")) {
            name = value->get<std::string>();
        }

        if (is_graph) {
            workflow.graph = parse_graph(j);
            workflow.graph.name = name;
        } else {
            workflow.pipeline = parse_pipeline(j);
            workflow.pipeline.name = name;
        }
    } catch (const json::type_error& e) {
        throw WorkflowParseError(std::string("JSON type error: ") + e.what());
    }

    return workflow;
}

WorkflowDefinition parse_workflow_from_string(const std::string& json_string) {
    json j;
    try {
        j = json::parse(json_string);
    } catch (const json::parse_error& e) {
        throw WorkflowParseError(std::string("JSON parse error: ") + e.what());
    }
    return parse_workflow(j);
}

WorkflowDefinition parse_workflow_from_file(const std::string& file_path) {
    return parse_workflow_from_string(read_file(file_path, "workflow"));
}

json parse_overrides_from_string(const std::string& json_string) {
    json j;
    try {
        j = json::parse(json_string);
    } catch (const json::parse_error& e) {
        throw WorkflowParseError(std::string("JSON parse error in overrides: ") + e.what());
    }

    if (!j.is_object()) {
        throw WorkflowParseError("Overrides must be an object keyed by node id");
    }
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (!it.value().is_object()) {
            throw WorkflowParseError("Overrides for node '" + it.key() + "' must be an object");
        }
    }
    return expand_parameters(j);
}

json parse_overrides_from_file(const std::string& file_path) {
    return parse_overrides_from_string(read_file(file_path, "overrides"));
}

} // namespace orchestrator
} // namespace ledgerflow
