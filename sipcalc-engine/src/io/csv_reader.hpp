#ifndef SIPCALC_CSV_READER_HPP
#define SIPCALC_CSV_READER_HPP

#include <string>
#include <vector>
#include <istream>

namespace sipcalc {

// Line-oriented CSV reader. Cells are trimmed; a cell wrapped in double
// quotes has the quotes removed and doubled quotes collapsed.
class CsvReader {
public:
    explicit CsvReader(std::istream& is, char delimiter = ',');

    std::vector<std::string> read_row();
    bool has_more() const;

private:
    std::istream& is_;
    char delimiter_;

    static std::string trim(const std::string& s);
};

} // namespace sipcalc

#endif // SIPCALC_CSV_READER_HPP
