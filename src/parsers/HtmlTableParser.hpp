#ifndef HTMLTABLEPARSER_HPP
#define HTMLTABLEPARSER_HPP

#include <string>
#include <vector>

#include <gumbo.h>

#include "TableParseOutcome.hpp"

// Extracts the statistics table (<table class="tb_base tb_dados">) from an upstream page.
// Body rows are grouped: a "tb_item" row opens a group and the "tb_subitem" rows after it
// become its sub-items; other rows collect under one default group with empty item_data.
class HtmlTableParser {
public:
    static TableParseOutcome parse(const std::string& html);

private:
    static const GumboNode* findDataTable(const GumboNode* node);
    static std::vector<const GumboNode*> childElements(const GumboNode* node, GumboTag tag);
    static std::vector<const GumboNode*> rowsOf(const GumboNode* section);
    static TableRow rowText(const GumboNode* row);
    static bool rowHasClass(const GumboNode* row, const std::string& wanted);
    static bool hasClass(const GumboNode* node, const std::string& wanted);

    // Concatenated, trimmed text nodes under node; comments are skipped.
    static std::string nodeText(const GumboNode* node);
    static void appendText(const GumboNode* node, std::string& out);
};

#endif // HTMLTABLEPARSER_HPP
