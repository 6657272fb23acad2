#include <algorithm>
#include <array>
#include <fstream>
#include <sstream>

#include "CsvTableParser.hpp"
#include "../utils/Utils.hpp"

namespace {
    constexpr std::array<char, 4> CANDIDATE_DELIMITERS = {';', ',', '\t', '|'};
    constexpr char DEFAULT_DELIMITER = ';';
    constexpr size_t MAX_FIELDS = 1000;

    const std::vector<std::string>& footerKeywords() {
        static const std::vector<std::string> keywords = {
            "total", "soma", "subtotal", "geral", "consolidado", "m\xC3\xA9" "dia", "media"
        };
        return keywords;
    }
}

TableParseOutcome CsvTableParser::parseFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return TableParseOutcome{std::nullopt, "cannot open " + path};
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        return TableParseOutcome{std::nullopt, "read error on " + path};
    }
    return parse(buffer.str());
}

TableParseOutcome CsvTableParser::parse(const std::string& raw_content) {
    std::string content = raw_content;
    if (content.compare(0, 3, "\xEF\xBB\xBF") == 0) {
        content.erase(0, 3);
    }
    if (!Utils::isValidUtf8(content)) {
        content = Utils::latin1ToUtf8(content);
    }
    if (Utils::trim(content).empty()) {
        return TableParseOutcome{std::nullopt, "file is empty"};
    }

    std::vector<std::string> records = splitRecords(content, '"');
    auto first = std::find_if(records.begin(), records.end(),
                              [](const std::string& r) { return !Utils::trim(r).empty(); });
    if (first == records.end()) {
        return TableParseOutcome{std::nullopt, "file is empty"};
    }

    const char delimiter = detectDelimiter(*first);

    // Columns with a blank header name are dropped
    std::vector<std::string> header_cells = parseLine(*first, delimiter);
    std::vector<size_t> columns;
    TableRow header;
    for (size_t i = 0; i < header_cells.size(); ++i) {
        std::string name = Utils::trim(header_cells[i]);
        if (!name.empty()) {
            columns.push_back(i);
            header.push_back(name);
        }
    }
    if (header.empty()) {
        return TableParseOutcome{std::nullopt, "header row has no column names"};
    }

    TableRecord record;
    record.header.push_back(header);

    for (auto it = std::next(first); it != records.end(); ++it) {
        std::vector<std::string> cells = parseLine(*it, delimiter);
        TableRow row;
        row.reserve(columns.size());
        bool has_data = false;
        for (size_t column : columns) {
            std::string value = column < cells.size() ? Utils::trim(cells[column]) : "";
            has_data = has_data || !value.empty();
            row.push_back(std::move(value));
        }
        if (!has_data) {
            continue;
        }

        if (isFooterRow(row)) {
            record.footer.push_back(std::move(row));
        } else {
            record.body.push_back(TableGroup{std::move(row), {}});
        }
    }

    if (record.body.empty() && record.footer.empty()) {
        return TableParseOutcome{std::nullopt, "no data rows"};
    }
    return TableParseOutcome{std::move(record), ""};
}

char CsvTableParser::detectDelimiter(const std::string& header_line) {
    std::array<size_t, CANDIDATE_DELIMITERS.size()> counts{};
    bool in_quotes = false;
    for (char c : header_line) {
        if (c == '"') {
            in_quotes = !in_quotes;
            continue;
        }
        if (in_quotes) continue;
        for (size_t i = 0; i < CANDIDATE_DELIMITERS.size(); ++i) {
            if (c == CANDIDATE_DELIMITERS[i]) {
                ++counts[i];
            }
        }
    }

    size_t best = 0;
    for (size_t i = 1; i < counts.size(); ++i) {
        if (counts[i] > counts[best]) {
            best = i;
        }
    }
    return counts[best] > 0 ? CANDIDATE_DELIMITERS[best] : DEFAULT_DELIMITER;
}

std::vector<std::string> CsvTableParser::parseLine(const std::string& line, char delimiter, char quote) {
    std::vector<std::string> fields;
    if (line.empty()) {
        return fields;
    }

    std::string field;
    bool in_quotes = false;

    for (size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];

        if (c == quote) {
            if (in_quotes && i + 1 < line.size() && line[i + 1] == quote) {
                // Doubled quote inside a quoted field
                field += quote;
                ++i;
            } else {
                in_quotes = !in_quotes;
            }
        } else if (c == delimiter && !in_quotes) {
            fields.push_back(std::move(field));
            field.clear();
            if (fields.size() >= MAX_FIELDS) {
                return fields;
            }
        } else if (c == '\r') {
            // Skip carriage return
        } else {
            field += c;
        }
    }
    fields.push_back(std::move(field));
    return fields;
}

bool CsvTableParser::isFooterRow(const TableRow& row) {
    if (row.empty()) {
        return false;
    }
    std::string first = Utils::toLower(Utils::trim(row.front()));
    for (const auto& keyword : footerKeywords()) {
        if (first.find(keyword) != std::string::npos) {
            return true;
        }
    }
    return false;
}

// Physical lines are joined while a quoted field is still open.
std::vector<std::string> CsvTableParser::splitRecords(const std::string& content, char quote) {
    std::vector<std::string> records;
    std::string current;
    bool in_quotes = false;
    for (char c : content) {
        if (c == quote) {
            in_quotes = !in_quotes;
        }
        if (c == '\n' && !in_quotes) {
            records.push_back(std::move(current));
            current.clear();
            continue;
        }
        current += c;
    }
    if (!current.empty()) {
        records.push_back(std::move(current));
    }
    return records;
}
