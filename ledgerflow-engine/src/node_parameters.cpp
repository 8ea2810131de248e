#include "node_parameters.hpp"
#include "node_error.hpp"
#include <cmath>
#include <limits>

using json = nlohmann::json;

namespace ledgerflow {

namespace {

const json* find_param(const json& params, const std::string& name) {
    if (!params.is_object()) {
        return nullptr;
    }
    auto it = params.find(name);
    if (it == params.end() || it->is_null()) {
        return nullptr;
    }
    return &(*it);
}

} // anonymous namespace

std::string string_param(const json& params, const std::string& name, const std::string& fallback) {
    const json* value = find_param(params, name);
    if (!value) {
        return fallback;
    }
    if (!value->is_string()) {
        throw InvalidParameterError(name, "expected a string, got " + std::string(value->type_name()));
    }
    return value->get<std::string>();
}

double number_param(const json& params, const std::string& name, double fallback) {
    const json* value = find_param(params, name);
    if (!value) {
        return fallback;
    }
    if (!value->is_number()) {
        throw InvalidParameterError(name, "expected a number, got " + std::string(value->type_name()));
    }
    return value->get<double>();
}

int int_param(const json& params, const std::string& name, int fallback) {
    const json* value = find_param(params, name);
    if (!value) {
        return fallback;
    }
    if (!value->is_number() || std::floor(value->get<double>()) != value->get<double>()) {
        throw InvalidParameterError(name, "expected an integer, got " + value->dump());
    }

    // Whole numbers of any JSON kind are compared as doubles; int is exact there
    const double number = value->get<double>();
    if (number < static_cast<double>(std::numeric_limits<int>::min()) ||
        number > static_cast<double>(std::numeric_limits<int>::max())) {
        throw InvalidParameterError(name, "out of range, got " + value->dump());
    }
    return static_cast<int>(number);
}

dates::DayNumber as_of_date_param(const json& params) {
    std::string text = string_param(params, "as_of_date", "");
    if (text.empty()) {
        return dates::today();
    }
    auto parsed = dates::parse_iso_date(text);
    if (!parsed) {
        throw InvalidParameterError("as_of_date", "not an ISO date (YYYY-MM-DD): " + text);
    }
    return *parsed;
}

json merge_parameters(const json& declared, const json& override_params) {
    json merged = declared.is_object() ? declared : json::object();
    if (override_params.is_null()) {
        return merged;
    }
    if (!override_params.is_object()) {
        throw InvalidParameterError("<override>", "parameter overrides must be an object");
    }
    for (auto it = override_params.begin(); it != override_params.end(); ++it) {
        merged[it.key()] = it.value();
    }
    return merged;
}

} // namespace ledgerflow
