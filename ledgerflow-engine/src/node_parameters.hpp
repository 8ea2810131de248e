#ifndef LEDGERFLOW_NODE_PARAMETERS_HPP
#define LEDGERFLOW_NODE_PARAMETERS_HPP

#include "date_utils.hpp"
#include <string>
#include <nlohmann/json.hpp>

namespace ledgerflow {

// Typed accessors over a node's merged parameter object. Missing or null
// parameters yield the fallback; present values of the wrong type throw
// InvalidParameterError.
std::string string_param(const nlohmann::json& params, const std::string& name,
                         const std::string& fallback);
double number_param(const nlohmann::json& params, const std::string& name, double fallback);
int int_param(const nlohmann::json& params, const std::string& name, int fallback);

// Resolves "as_of_date" to a day number, defaulting to today (UTC).
dates::DayNumber as_of_date_param(const nlohmann::json& params);

// Shallow merge: override keys replace declared keys, other keys are added.
// A null override leaves the declared parameters untouched.
nlohmann::json merge_parameters(const nlohmann::json& declared, const nlohmann::json& override_params);

} // namespace ledgerflow

#endif // LEDGERFLOW_NODE_PARAMETERS_HPP
