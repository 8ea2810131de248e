#ifndef LEDGERFLOW_CSV_READER_HPP
#define LEDGERFLOW_CSV_READER_HPP

#include <istream>
#include <string>
#include <vector>

namespace ledgerflow {

// Line-oriented CSV reader. Cells may be wrapped in double quotes to carry the
// delimiter; a doubled quote inside a quoted cell is a literal quote.
// Unquoted cells are trimmed.
class CsvReader {
public:
    explicit CsvReader(std::istream& is, char delimiter = ',');

    std::vector<std::string> read_row();
    bool has_more() const;

private:
    std::istream& is_;
    char delimiter_;

    std::vector<std::string> split(const std::string& line) const;
    static std::string trim(const std::string& s);
};

} // namespace ledgerflow

#endif // LEDGERFLOW_CSV_READER_HPP
