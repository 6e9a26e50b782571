#ifndef VALUCALC_IO_CSV_READER_HPP
#define VALUCALC_IO_CSV_READER_HPP

#include <cstddef>
#include <istream>
#include <string>
#include <vector>

namespace valucalc {
namespace io {

// Line-oriented CSV reader
// Cells are trimmed; double-quoted cells may contain the delimiter and ""
// escapes. Empty cells (including a trailing one) are kept as "".
class CsvReader {
public:
    explicit CsvReader(std::istream& is, char delimiter = ',');

    std::vector<std::string> read_row();
    bool has_more() const;

    // 1-based number of the line last returned by read_row()
    size_t line_number() const { return line_number_; }

private:
    std::istream& is_;
    char delimiter_;
    size_t line_number_ = 0;

    std::vector<std::string> split(const std::string& line) const;
    static std::string trim(const std::string& s);
};

} // namespace io
} // namespace valucalc

#endif // VALUCALC_IO_CSV_READER_HPP
