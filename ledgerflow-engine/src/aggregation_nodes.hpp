#ifndef LEDGERFLOW_AGGREGATION_NODES_HPP
#define LEDGERFLOW_AGGREGATION_NODES_HPP

#include "node_interface.hpp"
#include <string>

namespace ledgerflow {

namespace AggregationNodeType {
    constexpr const char* GROUPING = "GroupingNode";
    constexpr const char* FILTER = "FilterNode";
    constexpr const char* SORT = "SortNode";
    constexpr const char* SUMMARY = "SummaryNode";
}

// Orders field values for sorting: null < boolean < number < string < anything else.
// Returns <0, 0 or >0.
int compare_field_values(const nlohmann::json& a, const nlohmann::json& b);

/**
 * @brief Groups records by a field with per-group subtotals
 *
 * Parameters: group_by (default "aging_bucket").
 * Records without a value land in group "Unknown". Aging buckets come out in
 * bucket order, any other field in lexical order of the group name.
 */
class GroupingNode : public INode {
public:
    NodeInfo get_info() const override;
    Payload run(const Payload& input, const nlohmann::json& parameters) override;
};

/**
 * @brief Keeps records matching every condition
 *
 * Parameters: conditions, an array of {field, operator, value}.
 * Operators: =, ==, !=, >, <, >=, <=, in. A missing field or a type mismatch
 * fails the condition. Aggregates computed upstream are dropped since they no
 * longer describe the record set.
 */
class FilterNode : public INode {
public:
    NodeInfo get_info() const override;
    Payload run(const Payload& input, const nlohmann::json& parameters) override;
};

/**
 * @brief Stable multi-key sort
 *
 * Parameters: sort_by, an array of {field, order} with order "asc" or "desc"
 * (default [{invoice_date, desc}]).
 */
class SortNode : public INode {
public:
    NodeInfo get_info() const override;
    Payload run(const Payload& input, const nlohmann::json& parameters) override;
};

/**
 * @brief Summary statistics over records or groups
 *
 * Parameters: amount_field (default "total_amount").
 * With groups present the group subtotals are aggregated; otherwise count, sum,
 * average, min and max of the amount field are computed over the records.
 */
class SummaryNode : public INode {
public:
    NodeInfo get_info() const override;
    Payload run(const Payload& input, const nlohmann::json& parameters) override;
};

} // namespace ledgerflow

#endif // LEDGERFLOW_AGGREGATION_NODES_HPP
