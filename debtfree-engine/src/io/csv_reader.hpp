#ifndef DEBTFREE_CSV_READER_HPP
#define DEBTFREE_CSV_READER_HPP

#include <string>
#include <vector>
#include <istream>

namespace debtfree {

// Line-oriented reader for simple delimited files. Cells are trimmed; quoted
// fields are not supported.
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

} // namespace debtfree

#endif // DEBTFREE_CSV_READER_HPP
