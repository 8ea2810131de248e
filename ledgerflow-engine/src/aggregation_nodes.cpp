#include "aggregation_nodes.hpp"
#include "calculation_nodes.hpp"
#include "node_parameters.hpp"
#include <algorithm>
#include <map>

using json = nlohmann::json;

namespace ledgerflow {

namespace {

int type_rank(const json& value) {
    if (value.is_null()) return 0;
    if (value.is_boolean()) return 1;
    if (value.is_number()) return 2;
    if (value.is_string()) return 3;
    return 4;
}

std::string group_name_of(const json& value) {
    if (value.is_null()) return AgingBucket::UNKNOWN;
    if (value.is_string()) {
        const auto& text = value.get_ref<const std::string&>();
        return text.empty() ? AgingBucket::UNKNOWN : text;
    }
    return value.dump();
}

int aging_bucket_rank(const std::string& name) {
    static const std::map<std::string, int> order = {
        {AgingBucket::DAYS_0_30, 1},
        {AgingBucket::DAYS_31_60, 2},
        {AgingBucket::DAYS_61_90, 3},
        {AgingBucket::DAYS_90_PLUS, 4},
        {AgingBucket::UNKNOWN, 5},
    };
    auto it = order.find(name);
    return it != order.end() ? it->second : 999;
}

// Values comparable by a filter operator: both numbers, both strings or both booleans
bool same_kind(const json& a, const json& b) {
    return (a.is_number() && b.is_number()) ||
           (a.is_string() && b.is_string()) ||
           (a.is_boolean() && b.is_boolean());
}

bool condition_holds(const json& actual, const std::string& op, const json& expected) {
    if (actual.is_null()) {
        return false;
    }

    if (op == "in") {
        for (const auto& candidate : expected) {
            if (same_kind(actual, candidate) && compare_field_values(actual, candidate) == 0) {
                return true;
            }
        }
        return false;
    }

    if (!same_kind(actual, expected)) {
        return false;
    }

    int cmp = compare_field_values(actual, expected);
    if (op == "=" || op == "==") return cmp == 0;
    if (op == "!=") return cmp != 0;
    if (op == ">") return cmp > 0;
    if (op == "<") return cmp < 0;
    if (op == ">=") return cmp >= 0;
    return cmp <= 0;  // "<="
}

struct Condition {
    std::string field;
    std::string op;
    json value;
};

std::vector<Condition> parse_conditions(const json& parameters) {
    std::vector<Condition> conditions;
    auto it = parameters.find("conditions");
    if (it == parameters.end() || it->is_null()) {
        return conditions;
    }
    if (!it->is_array()) {
        throw InvalidParameterError("conditions", "expected an array of {field, operator, value}");
    }

    static const std::vector<std::string> known_ops = {"=", "==", "!=", ">", "<", ">=", "<=", "in"};

    for (const auto& entry : *it) {
        if (!entry.is_object() || !entry.contains("field") || !entry["field"].is_string()) {
            throw InvalidParameterError("conditions", "each condition needs a string 'field'");
        }
        Condition condition;
        condition.field = entry["field"].get<std::string>();
        condition.op = entry.value("operator", std::string("="));
        condition.value = entry.contains("value") ? entry["value"] : json();

        if (std::find(known_ops.begin(), known_ops.end(), condition.op) == known_ops.end()) {
            throw InvalidParameterError("conditions", "unknown operator '" + condition.op + "'");
        }
        if (condition.op == "in" && !condition.value.is_array()) {
            throw InvalidParameterError("conditions", "operator 'in' needs an array value");
        }
        conditions.push_back(std::move(condition));
    }
    return conditions;
}

} // anonymous namespace

int compare_field_values(const json& a, const json& b) {
    int ra = type_rank(a);
    int rb = type_rank(b);
    if (ra != rb) {
        return ra < rb ? -1 : 1;
    }

    switch (ra) {
        case 0:
            return 0;
        case 1: {
            bool va = a.get<bool>();
            bool vb = b.get<bool>();
            return va == vb ? 0 : (va ? 1 : -1);
        }
        case 2: {
            double va = a.get<double>();
            double vb = b.get<double>();
            return va < vb ? -1 : (vb < va ? 1 : 0);
        }
        case 3:
            return a.get_ref<const std::string&>().compare(b.get_ref<const std::string&>());
        default:
            return a.dump().compare(b.dump());
    }
}

// ============================================================================
// GroupingNode
// ============================================================================

NodeInfo GroupingNode::get_info() const {
    return NodeInfo(
        AggregationNodeType::GROUPING,
        "Group Records",
        NodeCategory::AGGREGATION,
        "Groups records by specified field and calculates subtotals",
        json{{"records", "array"}, {"group_by", "string"}},
        json{{"groups", "array"}}
    );
}

Payload GroupingNode::run(const Payload& input, const json& parameters) {
    const std::string group_by = string_param(parameters, "group_by", "aging_bucket");

    Envelope output = input.envelope();

    // Groups in first-seen order; the index maps a name to its position
    std::vector<Group> groups;
    std::map<std::string, size_t> index;

    for (const Record& record : output.records) {
        std::string name = group_name_of(record.field(group_by));

        auto it = index.find(name);
        if (it == index.end()) {
            it = index.emplace(name, groups.size()).first;
            Group group;
            group.group_name = name;
            groups.push_back(std::move(group));
        }

        Group& group = groups[it->second];
        group.records.push_back(record);
        group.count++;
        group.total_amount += record.total_amount;
        group.total_outstanding += record.outstanding_or_derived();
    }

    for (Group& group : groups) {
        group.total_amount = round_currency(group.total_amount);
        group.total_outstanding = round_currency(group.total_outstanding);
    }

    if (group_by == "aging_bucket") {
        std::stable_sort(groups.begin(), groups.end(), [](const Group& a, const Group& b) {
            return aging_bucket_rank(a.group_name) < aging_bucket_rank(b.group_name);
        });
    } else {
        std::stable_sort(groups.begin(), groups.end(), [](const Group& a, const Group& b) {
            return a.group_name < b.group_name;
        });
    }

    output.groups = std::move(groups);
    return output;
}

// ============================================================================
// FilterNode
// ============================================================================

NodeInfo FilterNode::get_info() const {
    return NodeInfo(
        AggregationNodeType::FILTER,
        "Filter Records",
        NodeCategory::AGGREGATION,
        "Filters records based on conditions",
        json{{"records", "array"}, {"conditions", "array"}},
        json{{"records", "array"}}
    );
}

Payload FilterNode::run(const Payload& input, const json& parameters) {
    const std::vector<Condition> conditions = parse_conditions(parameters);
    const Envelope& source = input.envelope();

    if (conditions.empty()) {
        return source;
    }

    Envelope output;
    for (const Record& record : source.records) {
        bool keep = std::all_of(conditions.begin(), conditions.end(), [&](const Condition& c) {
            return condition_holds(record.field(c.field), c.op, c.value);
        });
        if (keep) {
            output.records.push_back(record);
        }
    }
    return output;
}

// ============================================================================
// SortNode
// ============================================================================

NodeInfo SortNode::get_info() const {
    return NodeInfo(
        AggregationNodeType::SORT,
        "Sort Records",
        NodeCategory::AGGREGATION,
        "Sorts records by specified fields",
        json{{"records", "array"}, {"sort_by", "array"}},
        json{{"records", "array"}}
    );
}

Payload SortNode::run(const Payload& input, const json& parameters) {
    json sort_by = json::array({json{{"field", "invoice_date"}, {"order", "desc"}}});
    auto it = parameters.find("sort_by");
    if (it != parameters.end() && !it->is_null()) {
        if (!it->is_array()) {
            throw InvalidParameterError("sort_by", "expected an array of {field, order}");
        }
        sort_by = *it;
    }

    // Validate every key before touching the records
    std::vector<std::pair<std::string, bool>> keys;  // field, descending
    for (const auto& entry : sort_by) {
        if (!entry.is_object() || !entry.contains("field") || !entry["field"].is_string()) {
            throw InvalidParameterError("sort_by", "each key needs a string 'field'");
        }
        std::string order = entry.value("order", std::string("asc"));
        if (order != "asc" && order != "desc") {
            throw InvalidParameterError("sort_by", "order must be 'asc' or 'desc', got '" + order + "'");
        }
        keys.emplace_back(entry["field"].get<std::string>(), order == "desc");
    }

    Envelope output = input.envelope();
    auto& records = output.records;

    for (auto key = keys.rbegin(); key != keys.rend(); ++key) {
        const std::string& field = key->first;
        const bool descending = key->second;
        std::stable_sort(records.begin(), records.end(), [&](const Record& a, const Record& b) {
            int cmp = compare_field_values(a.field(field), b.field(field));
            return descending ? cmp > 0 : cmp < 0;
        });
    }

    return output;
}

// ============================================================================
// SummaryNode
// ============================================================================

NodeInfo SummaryNode::get_info() const {
    return NodeInfo(
        AggregationNodeType::SUMMARY,
        "Calculate Summary",
        NodeCategory::AGGREGATION,
        "Calculates summary statistics (total, average, min, max)",
        json{{"records", "array"}, {"groups", "array"}, {"amount_field", "string"}},
        json{{"summary", "object"}}
    );
}

Payload SummaryNode::run(const Payload& input, const json& parameters) {
    const std::string amount_field = string_param(parameters, "amount_field", "total_amount");

    Envelope output = input.envelope();
    Summary summary;

    if (output.groups) {
        // Aggregate the subtotals without rescanning the records
        double total_amount = 0.0;
        double total_outstanding = 0.0;
        for (const Group& group : *output.groups) {
            summary.total_records += group.count;
            total_amount += group.total_amount;
            total_outstanding += group.total_outstanding;
        }
        summary.total_amount = round_currency(total_amount);
        summary.total_outstanding = round_currency(total_outstanding);
        summary.average_amount = summary.total_records > 0
            ? round_currency(total_amount / static_cast<double>(summary.total_records))
            : 0.0;
        summary.total_groups = output.groups->size();

        output.summary = summary;
        return output;
    }

    const auto& records = output.records;
    summary.total_records = records.size();
    if (records.empty()) {
        output.summary = summary;
        return output;
    }

    double total_amount = 0.0;
    double total_outstanding = 0.0;
    double min_amount = 0.0;
    double max_amount = 0.0;
    for (size_t i = 0; i < records.size(); ++i) {
        json value = records[i].field(amount_field);
        double amount = value.is_number() ? value.get<double>() : 0.0;

        total_amount += amount;
        total_outstanding += records[i].outstanding_or_derived();
        if (i == 0 || amount < min_amount) min_amount = amount;
        if (i == 0 || amount > max_amount) max_amount = amount;
    }

    const double count = static_cast<double>(records.size());
    summary.total_amount = round_currency(total_amount);
    summary.total_outstanding = round_currency(total_outstanding);
    summary.average_amount = round_currency(total_amount / count);
    summary.min_amount = min_amount;
    summary.max_amount = max_amount;
    summary.average_outstanding = round_currency(total_outstanding / count);

    output.summary = summary;
    return output;
}

} // namespace ledgerflow
