#include "csv_reader.hpp"
#include <algorithm>
#include <cctype>

namespace valucalc {
namespace io {

CsvReader::CsvReader(std::istream& is, char delimiter)
    : is_(is), delimiter_(delimiter) {}

std::vector<std::string> CsvReader::read_row() {
    std::string line;

    if (!std::getline(is_, line)) {
        return {};
    }
    ++line_number_;

    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return split(line);
}

bool CsvReader::has_more() const {
    return is_.good() && is_.peek() != EOF;
}

std::vector<std::string> CsvReader::split(const std::string& line) const {
    std::vector<std::string> row;
    std::string cell;
    bool in_quotes = false;
    bool was_quoted = false;

    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    cell += '"';
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                cell += c;
            }
        } else if (c == '"') {
            in_quotes = true;
            was_quoted = true;
        } else if (c == delimiter_) {
            row.push_back(was_quoted ? cell : trim(cell));
            cell.clear();
            was_quoted = false;
        } else {
            cell += c;
        }
    }

    if (!line.empty()) {
        row.push_back(was_quoted ? cell : trim(cell));
    }
    return row;
}

std::string CsvReader::trim(const std::string& s) {
    auto start = std::find_if_not(s.begin(), s.end(), [](unsigned char c) {
        return std::isspace(c);
    });
    auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) {
        return std::isspace(c);
    }).base();

    return (start < end) ? std::string(start, end) : std::string();
}

} // namespace io
} // namespace valucalc
