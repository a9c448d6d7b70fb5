#include "csv_reader.hpp"
#include <algorithm>
#include <cctype>

namespace sipcalc {

CsvReader::CsvReader(std::istream& is, char delimiter)
    : is_(is), delimiter_(delimiter) {}

std::vector<std::string> CsvReader::read_row() {
    std::vector<std::string> row;
    std::string line;

    if (!std::getline(is_, line)) {
        return row;
    }
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }

    // Split on the delimiter outside quoted sections
    std::string cell;
    bool in_quotes = false;
    bool quoted = false;
    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (c == '"') {
            if (in_quotes && i + 1 < line.size() && line[i + 1] == '"') {
                cell += '"';
                ++i;
            } else {
                in_quotes = !in_quotes;
                quoted = true;
            }
        } else if (c == delimiter_ && !in_quotes) {
            row.push_back(quoted ? cell : trim(cell));
            cell.clear();
            quoted = false;
        } else {
            cell += c;
        }
    }
    if (!line.empty()) {
        row.push_back(quoted ? cell : trim(cell));
    }

    return row;
}

bool CsvReader::has_more() const {
    return is_.good() && is_.peek() != EOF;
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

} // namespace sipcalc
