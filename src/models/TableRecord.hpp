#ifndef TABLERECORD_HPP
#define TABLERECORD_HPP

#include <sstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

using TableRow = std::vector<std::string>;

// One grouped body entry: a "tb_item" row followed by its "tb_subitem" rows.
struct TableGroup {
    TableRow item_data;
    std::vector<TableRow> sub_items;

    bool operator==(const TableGroup& other) const {
        return item_data == other.item_data && sub_items == other.sub_items;
    }
};

// --- Structured statistics table, as scraped or as loaded from a static file ---
class TableRecord {
public:
    std::vector<TableRow> header;
    std::vector<TableGroup> body;
    std::vector<TableRow> footer;

    bool empty() const {
        return header.empty() && body.empty() && footer.empty();
    }

    bool operator==(const TableRecord& other) const {
        return header == other.header && body == other.body && footer == other.footer;
    }

    std::string to_string() const {
        std::ostringstream oss;
        oss << "TableRecord {\n";
        oss << "  Header rows: " << header.size() << "\n";
        oss << "  Body groups: " << body.size() << "\n";
        oss << "  Footer rows: " << footer.size() << "\n";
        oss << "}";
        return oss.str();
    }
};

inline void to_json(json& j, const TableGroup& group) {
    j = json{{"item_data", group.item_data}, {"sub_items", group.sub_items}};
}

inline void from_json(const json& j, TableGroup& group) {
    j.at("item_data").get_to(group.item_data);
    j.at("sub_items").get_to(group.sub_items);
}

inline void to_json(json& j, const TableRecord& record) {
    j = json{{"header", record.header}, {"body", record.body}, {"footer", record.footer}};
}

// Missing sections are read as empty; wrong types throw json::type_error.
inline void from_json(const json& j, TableRecord& record) {
    record.header = j.value("header", std::vector<TableRow>{});
    record.body = j.value("body", std::vector<TableGroup>{});
    record.footer = j.value("footer", std::vector<TableRow>{});
}

#endif // TABLERECORD_HPP
