#include "node_interface.hpp"

namespace ledgerflow {

void to_json(nlohmann::json& j, const NodeInfo& info) {
    j = nlohmann::json{
        {"type", info.type},
        {"title", info.title},
        {"category", info.category},
        {"description", info.description},
        {"input_shape", info.input_shape},
        {"output_shape", info.output_shape}
    };
}

} // namespace ledgerflow
