/**
 * @file node_registry.hpp
 * @brief Registry mapping node type identifiers to factories
 *
 * Workflows name their nodes by type identifier ("AgingCalculatorNode"); the
 * registry turns that identifier into a fresh node instance.
 *
 * Design Pattern: Factory Method with Registry
 * - Each node type registers a factory function, explicitly, at start-up
 * - Executors request nodes by string identifier
 * - A fresh instance is created per request; nothing is cached
 *
 * A registry is populated once and then only read, so any number of executors
 * (and parallel waves) may share it.
 */

#ifndef LEDGERFLOW_NODE_REGISTRY_HPP
#define LEDGERFLOW_NODE_REGISTRY_HPP

#include "node_interface.hpp"
#include "workflow_error.hpp"
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace ledgerflow {

/**
 * @brief Registry of node factories
 *
 * Usage Example:
 *   @code
 *   NodeRegistry registry;
 *   register_builtin_nodes(registry);
 *   registry.register_node("MyNode", [] { return std::make_unique<MyNode>(); });
 *
 *   auto node = registry.create_node("AgingCalculatorNode");
 *   @endcode
 */
class NodeRegistry {
public:
    /**
     * @brief Factory function type for creating nodes
     */
    using FactoryFunction = std::function<std::unique_ptr<INode>()>;

    NodeRegistry() = default;

    /**
     * @brief Register a node type
     *
     * @param type_id Type identifier (must be unique)
     * @param factory_fn Function that creates node instances
     *
     * @throws RegistrationError If type_id is empty or already registered
     */
    void register_node(const std::string& type_id, FactoryFunction factory_fn);

    /**
     * @brief Create a fresh node instance by type
     *
     * @throws NodeNotFoundError If the type is unknown (message lists the
     *         available types)
     */
    std::unique_ptr<INode> create_node(const std::string& type_id) const;

    bool is_registered(const std::string& type_id) const;

    /**
     * @brief Throw NodeNotFoundError (listing the available types) unless
     * type_id is registered
     */
    void require_registered(const std::string& type_id) const;

    /**
     * @brief Registered type identifiers, sorted
     */
    std::vector<std::string> list_node_types() const;

    /**
     * @brief Metadata of every registered node, sorted by type
     */
    std::vector<NodeInfo> describe_nodes() const;

    /**
     * @brief Node metadata grouped by category
     */
    std::map<std::string, std::vector<NodeInfo>> describe_by_category() const;

    size_t size() const { return registry_.size(); }

private:
    std::map<std::string, FactoryFunction> registry_;
};

/**
 * @brief Register every built-in node (source, calculation, aggregation)
 *
 * @throws RegistrationError If any built-in type is already present
 */
void register_builtin_nodes(NodeRegistry& registry);

/**
 * @brief Process-wide registry holding the built-in nodes
 *
 * Populated on first use and never mutated afterwards.
 */
const NodeRegistry& default_registry();

} // namespace ledgerflow

#endif // LEDGERFLOW_NODE_REGISTRY_HPP
