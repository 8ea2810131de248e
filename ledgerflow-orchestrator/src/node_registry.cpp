/**
 * @file node_registry.cpp
 * @brief Implementation of NodeRegistry
 */

#include "node_registry.hpp"
#include "aggregation_nodes.hpp"
#include "calculation_nodes.hpp"
#include "logger.hpp"
#include "source_nodes.hpp"

namespace ledgerflow {

namespace {

template <typename NodeT>
std::unique_ptr<INode> make_node() {
    return std::make_unique<NodeT>();
}

} // anonymous namespace

void NodeRegistry::register_node(const std::string& type_id, FactoryFunction factory_fn) {
    if (type_id.empty()) {
        throw RegistrationError("Node type identifier cannot be empty");
    }
    if (!factory_fn) {
        throw RegistrationError("Node type '" + type_id + "' registered without a factory");
    }
    if (registry_.find(type_id) != registry_.end()) {
        throw RegistrationError("Node type already registered: " + type_id);
    }
    registry_[type_id] = std::move(factory_fn);

    Logger::get_instance().log_node_registered(type_id);
}

std::unique_ptr<INode> NodeRegistry::create_node(const std::string& type_id) const {
    require_registered(type_id);
    return registry_.at(type_id)();
}

void NodeRegistry::require_registered(const std::string& type_id) const {
    if (registry_.find(type_id) != registry_.end()) {
        return;
    }

    std::string types;
    for (const auto& pair : registry_) {
        if (!types.empty()) types += ", ";
        types += pair.first;
    }
    throw NodeNotFoundError("Unknown node type: " + type_id +
                            ". Available types: " + (types.empty() ? "(none)" : types));
}

bool NodeRegistry::is_registered(const std::string& type_id) const {
    return registry_.find(type_id) != registry_.end();
}

std::vector<std::string> NodeRegistry::list_node_types() const {
    std::vector<std::string> types;
    types.reserve(registry_.size());
    for (const auto& pair : registry_) {
        types.push_back(pair.first);
    }
    return types;
}

std::vector<NodeInfo> NodeRegistry::describe_nodes() const {
    std::vector<NodeInfo> infos;
    infos.reserve(registry_.size());
    for (const auto& pair : registry_) {
        infos.push_back(pair.second()->get_info());
    }
    return infos;
}

std::map<std::string, std::vector<NodeInfo>> NodeRegistry::describe_by_category() const {
    std::map<std::string, std::vector<NodeInfo>> by_category;
    for (NodeInfo& info : describe_nodes()) {
        by_category[info.category].push_back(std::move(info));
    }
    return by_category;
}

void register_builtin_nodes(NodeRegistry& registry) {
    // Sources
    registry.register_node(SourceNodeType::STATIC_RECORDS, make_node<StaticRecordsNode>);
    registry.register_node(SourceNodeType::RECORD_UNION, make_node<RecordUnionNode>);

    // Calculations
    registry.register_node(CalculationNodeType::AGING, make_node<AgingCalculatorNode>);
    registry.register_node(CalculationNodeType::OUTSTANDING, make_node<OutstandingCalculatorNode>);
    registry.register_node(CalculationNodeType::SLA, make_node<SLACheckerNode>);
    registry.register_node(CalculationNodeType::DUPLICATES, make_node<DuplicateDetectorNode>);
    registry.register_node(CalculationNodeType::TOTALS, make_node<TotalsCalculationNode>);

    // Aggregations
    registry.register_node(AggregationNodeType::GROUPING, make_node<GroupingNode>);
    registry.register_node(AggregationNodeType::FILTER, make_node<FilterNode>);
    registry.register_node(AggregationNodeType::SORT, make_node<SortNode>);
    registry.register_node(AggregationNodeType::SUMMARY, make_node<SummaryNode>);
}

const NodeRegistry& default_registry() {
    static const NodeRegistry instance = [] {
        NodeRegistry registry;
        register_builtin_nodes(registry);
        return registry;
    }();
    return instance;
}

} // namespace ledgerflow
