#ifndef LEDGERFLOW_SOURCE_NODES_HPP
#define LEDGERFLOW_SOURCE_NODES_HPP

#include "node_interface.hpp"

namespace ledgerflow {

namespace SourceNodeType {
    constexpr const char* STATIC_RECORDS = "StaticRecordsNode";
    constexpr const char* RECORD_UNION = "RecordUnionNode";
}

// Emits the records given in its "records" parameter and ignores its input.
// Stands in for a data-fetch step in tests and canned workflows.
class StaticRecordsNode : public INode {
public:
    NodeInfo get_info() const override;
    Payload run(const Payload& input, const nlohmann::json& parameters) override;
};

// Concatenates the records of a fan-in payload in predecessor-id order.
// A single envelope passes through unchanged.
class RecordUnionNode : public INode {
public:
    NodeInfo get_info() const override;
    Payload run(const Payload& input, const nlohmann::json& parameters) override;
};

} // namespace ledgerflow

#endif // LEDGERFLOW_SOURCE_NODES_HPP
