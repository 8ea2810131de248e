#ifndef LEDGERFLOW_IO_JSON_WRITER_HPP
#define LEDGERFLOW_IO_JSON_WRITER_HPP

#include "../record.hpp"
#include <ostream>
#include <string>
#include <nlohmann/json.hpp>

namespace ledgerflow {
namespace io {

// Write a JSON document, two-space indented when pretty_print is set
void write_json_document(std::ostream& os, const nlohmann::json& document,
                         bool pretty_print = true);

// Write a JSON document to file; throws std::runtime_error if it cannot be opened
void write_json_document(const std::string& filepath, const nlohmann::json& document,
                         bool pretty_print = true);

// Write a node payload (records plus any groups, summary, duplicates, totals)
void write_payload_json(std::ostream& os, const Payload& payload, bool pretty_print = true);

} // namespace io
} // namespace ledgerflow

#endif // LEDGERFLOW_IO_JSON_WRITER_HPP
