#include "source_nodes.hpp"
#include <stdexcept>

using json = nlohmann::json;

namespace ledgerflow {

NodeInfo StaticRecordsNode::get_info() const {
    return NodeInfo(
        SourceNodeType::STATIC_RECORDS,
        "Static Records",
        NodeCategory::SOURCE,
        "Emits a fixed record set supplied as a parameter",
        json{{"records", "array"}},
        json{{"records", "array"}}
    );
}

Payload StaticRecordsNode::run(const Payload& /*input*/, const json& parameters) {
    if (!parameters.is_object() || !parameters.contains("records")) {
        throw InvalidParameterError("records", "required");
    }

    const json& records = parameters["records"];
    if (!records.is_array()) {
        throw InvalidParameterError("records", "expected an array of records");
    }

    try {
        return records.get<Envelope>();
    } catch (const json::exception& e) {
        throw InvalidParameterError("records", e.what());
    } catch (const std::invalid_argument& e) {
        throw InvalidParameterError("records", e.what());
    }
}

NodeInfo RecordUnionNode::get_info() const {
    return NodeInfo(
        SourceNodeType::RECORD_UNION,
        "Union Records",
        NodeCategory::SOURCE,
        "Combines the records of several upstream nodes",
        json{{"upstream", "map"}},
        json{{"records", "array"}}
    );
}

Payload RecordUnionNode::run(const Payload& input, const json& /*parameters*/) {
    if (!input.is_fan_in()) {
        return input;
    }

    Envelope output;
    for (const auto& [predecessor, envelope] : input.upstream()) {
        output.records.insert(output.records.end(), envelope.records.begin(), envelope.records.end());
    }
    return output;
}

} // namespace ledgerflow
