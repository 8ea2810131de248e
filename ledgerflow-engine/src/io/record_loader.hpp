#ifndef LEDGERFLOW_IO_RECORD_LOADER_HPP
#define LEDGERFLOW_IO_RECORD_LOADER_HPP

#include "../record.hpp"
#include <istream>
#include <string>

namespace ledgerflow {
namespace io {

// Load records from JSON: either an array of record objects or an object with
// a "records" (or "invoices") array. Field aliases are resolved on decode.
// Throws std::runtime_error on malformed input.
Envelope load_records_from_json(std::istream& is);
Envelope load_records_from_json(const std::string& filepath);

// Load records from CSV. The header row names the fields; empty cells are
// treated as absent. Columns that are not record fields become extensions.
Envelope load_records_from_csv(std::istream& is, char delimiter = ',');
Envelope load_records_from_csv(const std::string& filepath, char delimiter = ',');

/**
 * Load records from a Parquet file.
 *
 * Supported column types: string, double, float, int32, int64, boolean,
 * date32 (rendered as YYYY-MM-DD). Columns of other types are skipped.
 *
 * @throws std::runtime_error if the file cannot be read, or if the build has
 *         no Arrow support
 */
Envelope load_records_from_parquet(const std::string& filepath);

// Dispatch on the file extension (.json, .csv, .parquet).
Envelope load_records(const std::string& filepath);

} // namespace io
} // namespace ledgerflow

#endif // LEDGERFLOW_IO_RECORD_LOADER_HPP
