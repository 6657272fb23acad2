#include <memory>
#include <sstream>

#include "HtmlTableParser.hpp"
#include "../utils/Utils.hpp"

namespace {
    struct GumboOutputDeleter {
        void operator()(GumboOutput* output) const {
            gumbo_destroy_output(&kGumboDefaultOptions, output);
        }
    };

    using GumboOutputPtr = std::unique_ptr<GumboOutput, GumboOutputDeleter>;

    bool isElement(const GumboNode* node, GumboTag tag) {
        return node != nullptr && node->type == GUMBO_NODE_ELEMENT && node->v.element.tag == tag;
    }

    // Elements the tree builder created without a tag in the source, like the <tbody>
    // wrapped around bare <tr> rows.
    bool isImplied(const GumboNode* node) {
        return (node->parse_flags & GUMBO_INSERTION_IMPLIED) != 0;
    }

    // gumbo decodes &nbsp; to U+00A0, which trim() does not treat as blank
    std::string replaceNoBreakSpaces(std::string text) {
        static const std::string nbsp = "\xC2\xA0";
        size_t pos = 0;
        while ((pos = text.find(nbsp, pos)) != std::string::npos) {
            text.replace(pos, nbsp.size(), " ");
            ++pos;
        }
        return text;
    }
}

TableParseOutcome HtmlTableParser::parse(const std::string& raw_html) {
    if (Utils::trim(raw_html).empty()) {
        return TableParseOutcome{std::nullopt, "empty page"};
    }
    // gumbo only accepts UTF-8
    const std::string html = Utils::isValidUtf8(raw_html) ? raw_html : Utils::latin1ToUtf8(raw_html);

    GumboOutputPtr output(gumbo_parse_with_options(&kGumboDefaultOptions, html.data(), html.size()));
    if (!output) {
        return TableParseOutcome{std::nullopt, "page could not be parsed"};
    }

    const GumboNode* table = findDataTable(output->root);
    if (table == nullptr) {
        return TableParseOutcome{std::nullopt, "no table with class 'tb_base tb_dados' found"};
    }

    TableRecord record;
    for (const GumboNode* thead : childElements(table, GUMBO_TAG_THEAD)) {
        for (const GumboNode* row : rowsOf(thead)) {
            record.header.push_back(rowText(row));
        }
    }
    for (const GumboNode* tfoot : childElements(table, GUMBO_TAG_TFOOT)) {
        for (const GumboNode* row : rowsOf(tfoot)) {
            record.footer.push_back(rowText(row));
        }
    }

    std::vector<const GumboNode*> bodies = childElements(table, GUMBO_TAG_TBODY);
    bool explicit_tbody = false;
    for (const GumboNode* tbody : bodies) {
        explicit_tbody = explicit_tbody || !isImplied(tbody);
    }

    if (!explicit_tbody) {
        // No <tbody> in the source: every row outside <thead> and <tfoot> is its own group
        for (const GumboNode* tbody : bodies) {
            for (const GumboNode* row : rowsOf(tbody)) {
                record.body.push_back(TableGroup{rowText(row), {}});
            }
        }
        return TableParseOutcome{std::move(record), ""};
    }

    std::vector<const GumboNode*> rows;
    for (const GumboNode* tbody : bodies) {
        for (const GumboNode* row : rowsOf(tbody)) {
            rows.push_back(row);
        }
    }

    // Index into record.body; -1 until an ungrouped row shows up
    long default_group = -1;
    size_t i = 0;
    while (i < rows.size()) {
        if (rowHasClass(rows[i], "tb_item")) {
            TableGroup group;
            group.item_data = rowText(rows[i]);
            ++i;
            while (i < rows.size() && rowHasClass(rows[i], "tb_subitem")) {
                group.sub_items.push_back(rowText(rows[i]));
                ++i;
            }
            record.body.push_back(std::move(group));
        } else {
            if (default_group < 0) {
                record.body.push_back(TableGroup{});
                default_group = static_cast<long>(record.body.size()) - 1;
            }
            record.body[static_cast<size_t>(default_group)].sub_items.push_back(rowText(rows[i]));
            ++i;
        }
    }

    return TableParseOutcome{std::move(record), ""};
}

const GumboNode* HtmlTableParser::findDataTable(const GumboNode* node) {
    if (node == nullptr || (node->type != GUMBO_NODE_ELEMENT && node->type != GUMBO_NODE_DOCUMENT)) {
        return nullptr;
    }
    if (isElement(node, GUMBO_TAG_TABLE) && hasClass(node, "tb_base") && hasClass(node, "tb_dados")) {
        return node;
    }
    const GumboVector& children = node->type == GUMBO_NODE_DOCUMENT ? node->v.document.children
                                                                    : node->v.element.children;
    for (unsigned int i = 0; i < children.length; ++i) {
        if (const GumboNode* found = findDataTable(static_cast<const GumboNode*>(children.data[i]))) {
            return found;
        }
    }
    return nullptr;
}

std::vector<const GumboNode*> HtmlTableParser::childElements(const GumboNode* node, GumboTag tag) {
    std::vector<const GumboNode*> matches;
    const GumboVector& children = node->v.element.children;
    for (unsigned int i = 0; i < children.length; ++i) {
        const GumboNode* child = static_cast<const GumboNode*>(children.data[i]);
        if (isElement(child, tag)) {
            matches.push_back(child);
        }
    }
    return matches;
}

// Rows holding at least one cell.
std::vector<const GumboNode*> HtmlTableParser::rowsOf(const GumboNode* section) {
    std::vector<const GumboNode*> rows;
    for (const GumboNode* row : childElements(section, GUMBO_TAG_TR)) {
        if (!childElements(row, GUMBO_TAG_TD).empty() || !childElements(row, GUMBO_TAG_TH).empty()) {
            rows.push_back(row);
        }
    }
    return rows;
}

TableRow HtmlTableParser::rowText(const GumboNode* row) {
    TableRow cells;
    const GumboVector& children = row->v.element.children;
    for (unsigned int i = 0; i < children.length; ++i) {
        const GumboNode* child = static_cast<const GumboNode*>(children.data[i]);
        if (isElement(child, GUMBO_TAG_TD) || isElement(child, GUMBO_TAG_TH)) {
            cells.push_back(nodeText(child));
        }
    }
    return cells;
}

// The upstream site marks groups on the first cell of a row.
bool HtmlTableParser::rowHasClass(const GumboNode* row, const std::string& wanted) {
    const GumboVector& children = row->v.element.children;
    for (unsigned int i = 0; i < children.length; ++i) {
        const GumboNode* child = static_cast<const GumboNode*>(children.data[i]);
        if (isElement(child, GUMBO_TAG_TD) || isElement(child, GUMBO_TAG_TH)) {
            return hasClass(child, wanted);
        }
    }
    return false;
}

bool HtmlTableParser::hasClass(const GumboNode* node, const std::string& wanted) {
    const GumboAttribute* css_class = gumbo_get_attribute(&node->v.element.attributes, "class");
    if (css_class == nullptr) {
        return false;
    }
    std::istringstream tokens(css_class->value);
    std::string token;
    while (tokens >> token) {
        if (token == wanted) {
            return true;
        }
    }
    return false;
}

std::string HtmlTableParser::nodeText(const GumboNode* node) {
    std::string text;
    appendText(node, text);
    return text;
}

void HtmlTableParser::appendText(const GumboNode* node, std::string& out) {
    switch (node->type) {
        case GUMBO_NODE_TEXT:
        case GUMBO_NODE_CDATA:
            out += Utils::trim(replaceNoBreakSpaces(node->v.text.text));
            return;
        case GUMBO_NODE_ELEMENT: {
            const GumboVector& children = node->v.element.children;
            for (unsigned int i = 0; i < children.length; ++i) {
                appendText(static_cast<const GumboNode*>(children.data[i]), out);
            }
            return;
        }
        default:
            return;
    }
}
