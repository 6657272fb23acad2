#ifndef CSVTABLEPARSER_HPP
#define CSVTABLEPARSER_HPP

#include <optional>
#include <string>
#include <vector>

#include "TableParseOutcome.hpp"

// Turns a delimited text file into a TableRecord: first row is the header,
// total-like rows go to the footer, every other row is a body group without sub-items.
class CsvTableParser {
public:
    static TableParseOutcome parseFile(const std::string& path);
    static TableParseOutcome parse(const std::string& content);

    // Most frequent of ';' ',' '\t' '|' outside quotes; ';' when none occur.
    static char detectDelimiter(const std::string& header_line);
    static std::vector<std::string> parseLine(const std::string& line, char delimiter, char quote = '"');
    static bool isFooterRow(const TableRow& row);

private:
    static std::vector<std::string> splitRecords(const std::string& content, char quote);
};

#endif // CSVTABLEPARSER_HPP
