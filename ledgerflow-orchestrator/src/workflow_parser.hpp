#ifndef LEDGERFLOW_ORCHESTRATOR_WORKFLOW_PARSER_HPP
#define LEDGERFLOW_ORCHESTRATOR_WORKFLOW_PARSER_HPP

#include "workflow_definition.hpp"
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

namespace ledgerflow {
namespace orchestrator {

/**
 * @brief Exception thrown when workflow or overrides parsing fails
 */
class WorkflowParseError : public std::runtime_error {
public:
    explicit WorkflowParseError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Parses a workflow definition from a JSON string
 *
 * Pipeline form:
 *   {"name", "steps": [ids], "node_defs": {id: {"type", "parameters"}}}
 *   ("pipeline"/"nodes" and "node_type"/"params" are accepted as aliases)
 * Graph form:
 *   {"name", "nodes": [{"id", "type", "parameters", "position"}],
 *    "edges": [{"source", "target", "hint"}], "terminal_node"}
 *
 * A document with "edges" or an array of "nodes" is a graph. String values
 * inside parameters have environment variables expanded.
 *
 * @throws WorkflowParseError if the JSON is invalid or required fields are missing
 * @throws StructuralError if the definition fails validation
 */
WorkflowDefinition parse_workflow_from_string(const std::string& json_string);

/**
 * @brief Parses a workflow definition from a JSON file
 *
 * @throws WorkflowParseError if the file cannot be read or parsed
 * @throws StructuralError if the definition fails validation
 */
WorkflowDefinition parse_workflow_from_file(const std::string& file_path);

/**
 * @brief Parses a workflow definition from an already-parsed document
 */
WorkflowDefinition parse_workflow(const nlohmann::json& document);

/**
 * @brief Parses run-time parameter overrides: {node_id: {key: value}}
 *
 * @throws WorkflowParseError if the JSON is invalid or not an object of objects
 */
nlohmann::json parse_overrides_from_string(const std::string& json_string);
nlohmann::json parse_overrides_from_file(const std::string& file_path);

/**
 * @brief Expands environment variable references in a string
 *
 * Supports syntax: ${VAR_NAME} or $VAR_NAME. Unset variables expand to "".
 */
std::string expand_environment_variables(const std::string& value);

/**
 * @brief Expands environment variables in every string of a JSON value
 */
nlohmann::json expand_parameters(const nlohmann::json& parameters);

} // namespace orchestrator
} // namespace ledgerflow

#endif // LEDGERFLOW_ORCHESTRATOR_WORKFLOW_PARSER_HPP
