#include "json_writer.hpp"
#include <fstream>
#include <stdexcept>

namespace ledgerflow {
namespace io {

void write_json_document(std::ostream& os, const nlohmann::json& document, bool pretty_print) {
    os << document.dump(pretty_print ? 2 : -1) << "\n";
    if (!os) {
        throw std::runtime_error("Failed to write JSON output");
    }
}

void write_json_document(const std::string& filepath, const nlohmann::json& document,
                         bool pretty_print) {
    std::ofstream file(filepath);
    if (!file) {
        throw std::runtime_error("Failed to open output file: " + filepath);
    }
    write_json_document(file, document, pretty_print);
}

void write_payload_json(std::ostream& os, const Payload& payload, bool pretty_print) {
    write_json_document(os, nlohmann::json(payload), pretty_print);
}

} // namespace io
} // namespace ledgerflow
