/**
 * @file node_interface.hpp
 * @brief Abstract interface for workflow nodes
 *
 * Every processing unit the executors can run (calculations, aggregations,
 * sources) implements INode. The executors never look at the concrete type:
 * they resolve a node by its type identifier, hand it the routed input and its
 * merged parameters, and record what comes back.
 *
 * Design Principles:
 * - Pure: same input and parameters produce the same output
 * - Stateless between calls: a fresh instance is created per execution
 * - No partial results: a node either returns a complete Payload or throws
 */

#ifndef LEDGERFLOW_NODE_INTERFACE_HPP
#define LEDGERFLOW_NODE_INTERFACE_HPP

#include "node_error.hpp"
#include "record.hpp"
#include <memory>
#include <string>
#include <nlohmann/json.hpp>

namespace ledgerflow {

/**
 * @brief Node category identifiers
 */
namespace NodeCategory {
    constexpr const char* SOURCE = "source";
    constexpr const char* CALCULATION = "calculation";
    constexpr const char* AGGREGATION = "aggregation";
}

/**
 * @brief Descriptive node metadata
 *
 * Used for validation messages and for listing the node catalog. It is never
 * consulted for dispatch.
 */
struct NodeInfo {
    std::string type;            ///< Registry type identifier (e.g., "AgingCalculatorNode")
    std::string title;           ///< Human-readable name (e.g., "Calculate Aging Days")
    std::string category;        ///< One of NodeCategory
    std::string description;
    nlohmann::json input_shape;  ///< Declared input fields and parameters
    nlohmann::json output_shape; ///< Declared output fields

    NodeInfo() = default;
    NodeInfo(
        const std::string& type_,
        const std::string& title_,
        const std::string& category_,
        const std::string& description_,
        nlohmann::json input_shape_ = nlohmann::json::object(),
        nlohmann::json output_shape_ = nlohmann::json::object()
    ) : type(type_), title(title_), category(category_), description(description_),
        input_shape(std::move(input_shape_)), output_shape(std::move(output_shape_)) {}
};

void to_json(nlohmann::json& j, const NodeInfo& info);

/**
 * @brief Abstract interface for workflow nodes
 *
 * Usage Example:
 *   @code
 *   auto node = std::make_unique<AgingCalculatorNode>();
 *   nlohmann::json params = {{"as_of_date", "2025-01-30"}};
 *
 *   Payload output = node->run(Envelope(records), params);
 *   for (const auto& record : output.envelope().records) {
 *       std::cout << record.aging_bucket << std::endl;
 *   }
 *   @endcode
 */
class INode {
public:
    virtual ~INode() = default;

    /**
     * @brief Get node metadata
     */
    virtual NodeInfo get_info() const = 0;

    /**
     * @brief Transform the input into a new payload
     *
     * @param input Initial workflow payload, a single predecessor's output, or
     *              a fan-in map of predecessor outputs
     * @param parameters Merged node parameters (declared + run-time override)
     *
     * @return Output payload consumed by successor nodes
     *
     * @throws NodeError If the node cannot complete
     * @throws InvalidParameterError If a parameter is malformed
     */
    virtual Payload run(const Payload& input, const nlohmann::json& parameters) = 0;
};

} // namespace ledgerflow

#endif // LEDGERFLOW_NODE_INTERFACE_HPP
