#include "record_loader.hpp"
#include "csv_reader.hpp"
#include "../date_utils.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>
#include <vector>

#ifdef HAVE_ARROW
#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/reader.h>
#endif

using json = nlohmann::json;

namespace ledgerflow {
namespace io {

namespace {

Envelope decode_envelope(const json& document, const std::string& source) {
    try {
        return document.get<Envelope>();
    } catch (const json::exception& e) {
        throw std::runtime_error("Invalid record data in " + source + ": " + e.what());
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error("Invalid record data in " + source + ": " + e.what());
    }
}

std::string extension_of(const std::string& filepath) {
    auto dot = filepath.find_last_of('.');
    if (dot == std::string::npos) {
        return "";
    }
    std::string ext = filepath.substr(dot + 1);
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return ext;
}

} // anonymous namespace

Envelope load_records_from_json(std::istream& is) {
    json document;
    try {
        document = json::parse(is);
    } catch (const json::parse_error& e) {
        throw std::runtime_error(std::string("Invalid JSON record input: ") + e.what());
    }
    return decode_envelope(document, "JSON input");
}

Envelope load_records_from_json(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file) {
        throw std::runtime_error("Cannot open record file: " + filepath);
    }
    return load_records_from_json(file);
}

Envelope load_records_from_csv(std::istream& is, char delimiter) {
    CsvReader reader(is, delimiter);

    std::vector<std::string> header = reader.read_row();
    if (header.empty() || (header.size() == 1 && header[0].empty())) {
        throw std::runtime_error("CSV record input has no header row");
    }

    json rows = json::array();
    size_t line_number = 1;
    while (reader.has_more()) {
        std::vector<std::string> row = reader.read_row();
        ++line_number;

        if (row.empty() || (row.size() == 1 && row[0].empty())) {
            continue;  // blank line
        }
        if (row.size() > header.size()) {
            throw std::runtime_error("CSV line " + std::to_string(line_number) + " has " +
                std::to_string(row.size()) + " cells, header has " + std::to_string(header.size()));
        }

        json object = json::object();
        for (size_t col = 0; col < row.size(); ++col) {
            if (!row[col].empty()) {
                object[header[col]] = row[col];
            }
        }
        rows.push_back(std::move(object));
    }

    return decode_envelope(rows, "CSV input");
}

Envelope load_records_from_csv(const std::string& filepath, char delimiter) {
    std::ifstream file(filepath);
    if (!file) {
        throw std::runtime_error("Cannot open record file: " + filepath);
    }
    return load_records_from_csv(file, delimiter);
}

#ifdef HAVE_ARROW

namespace {

json cell_value(const arrow::Array& array, int64_t i) {
    if (array.IsNull(i)) {
        return json();
    }
    switch (array.type_id()) {
        case arrow::Type::STRING:
            return static_cast<const arrow::StringArray&>(array).GetString(i);
        case arrow::Type::LARGE_STRING:
            return static_cast<const arrow::LargeStringArray&>(array).GetString(i);
        case arrow::Type::DOUBLE:
            return static_cast<const arrow::DoubleArray&>(array).Value(i);
        case arrow::Type::FLOAT:
            return static_cast<double>(static_cast<const arrow::FloatArray&>(array).Value(i));
        case arrow::Type::INT64:
            return static_cast<const arrow::Int64Array&>(array).Value(i);
        case arrow::Type::INT32:
            return static_cast<const arrow::Int32Array&>(array).Value(i);
        case arrow::Type::BOOL:
            return static_cast<const arrow::BooleanArray&>(array).Value(i);
        case arrow::Type::DATE32:
            return dates::format_iso_date(static_cast<const arrow::Date32Array&>(array).Value(i));
        default:
            return json();
    }
}

} // anonymous namespace

Envelope load_records_from_parquet(const std::string& filepath) {
    // Open Parquet file
    auto infile_result = arrow::io::ReadableFile::Open(filepath, arrow::default_memory_pool());
    if (!infile_result.ok()) {
        throw std::runtime_error("Cannot open Parquet file: " + filepath + " - " +
                                 infile_result.status().ToString());
    }
    std::shared_ptr<arrow::io::ReadableFile> infile = *infile_result;

    // Create Parquet reader
    std::unique_ptr<parquet::arrow::FileReader> arrow_reader;
    auto status = parquet::arrow::OpenFile(infile, arrow::default_memory_pool(), &arrow_reader);
    if (!status.ok()) {
        throw std::runtime_error("Cannot create Parquet reader: " + status.ToString());
    }

    // Read entire table into memory
    std::shared_ptr<arrow::Table> table;
    status = arrow_reader->ReadTable(&table);
    if (!status.ok()) {
        throw std::runtime_error("Cannot read Parquet table: " + status.ToString());
    }

    auto schema = table->schema();
    json rows = json::array();
    for (int64_t i = 0; i < table->num_rows(); ++i) {
        rows.push_back(json::object());
    }

    for (int col_idx = 0; col_idx < schema->num_fields(); ++col_idx) {
        const std::string col_name = schema->field(col_idx)->name();
        auto column = table->column(col_idx);

        int64_t row_offset = 0;
        for (const auto& chunk : column->chunks()) {
            for (int64_t i = 0; i < chunk->length(); ++i) {
                json value = cell_value(*chunk, i);
                if (!value.is_null()) {
                    rows[static_cast<size_t>(row_offset + i)][col_name] = std::move(value);
                }
            }
            row_offset += chunk->length();
        }
    }

    return decode_envelope(rows, filepath);
}

#else // !HAVE_ARROW

Envelope load_records_from_parquet(const std::string& filepath) {
    (void)filepath;  // Suppress unused parameter warning
    throw std::runtime_error("Apache Arrow not available. Rebuild with -DHAVE_ARROW to enable Parquet support.");
}

#endif // HAVE_ARROW

Envelope load_records(const std::string& filepath) {
    const std::string ext = extension_of(filepath);
    if (ext == "json") return load_records_from_json(filepath);
    if (ext == "csv") return load_records_from_csv(filepath);
    if (ext == "parquet") return load_records_from_parquet(filepath);
    throw std::runtime_error("Unsupported record file type '" + ext + "': " + filepath +
                             " (expected .json, .csv or .parquet)");
}

} // namespace io
} // namespace ledgerflow
