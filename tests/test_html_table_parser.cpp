// tests/test_html_table_parser.cpp
#include <string>

#include "gtest/gtest.h"

#include "../src/parsers/HtmlTableParser.hpp"

namespace {
    const std::string kProducaoPage = R"(
<html><body>
<table class="tb_base tb_header"><tr><td>menu</td></tr></table>
<table class="tb_base tb_dados">
  <thead><tr><th>Produto</th><th>Quantidade (L.)</th></tr></thead>
  <tbody>
    <tr><td class="tb_item">VINHO DE MESA</td><td class="tb_item">169.762.429</td></tr>
    <tr><td class="tb_subitem">Tinto</td><td class="tb_subitem">139.320.884</td></tr>
    <tr><td class="tb_subitem">Branco</td><td class="tb_subitem">27.910.299</td></tr>
    <tr><td class="tb_item">SUCO DE UVA</td><td class="tb_item">1.000</td></tr>
  </tbody>
  <tfoot class="tb_total"><tr><td>Total</td><td>170.762.429</td></tr></tfoot>
</table>
</body></html>)";
}

TEST(HtmlTableParserTest, ParsesHeaderGroupsAndFooter) {
    TableParseOutcome outcome = HtmlTableParser::parse(kProducaoPage);
    ASSERT_TRUE(outcome.ok()) << outcome.error;
    const TableRecord& record = *outcome.record;

    ASSERT_EQ(record.header.size(), 1);
    EXPECT_EQ(record.header[0], (TableRow{"Produto", "Quantidade (L.)"}));

    ASSERT_EQ(record.body.size(), 2);
    EXPECT_EQ(record.body[0].item_data, (TableRow{"VINHO DE MESA", "169.762.429"}));
    ASSERT_EQ(record.body[0].sub_items.size(), 2);
    EXPECT_EQ(record.body[0].sub_items[0], (TableRow{"Tinto", "139.320.884"}));
    EXPECT_EQ(record.body[0].sub_items[1], (TableRow{"Branco", "27.910.299"}));
    EXPECT_EQ(record.body[1].item_data, (TableRow{"SUCO DE UVA", "1.000"}));
    EXPECT_TRUE(record.body[1].sub_items.empty());

    ASSERT_EQ(record.footer.size(), 1);
    EXPECT_EQ(record.footer[0], (TableRow{"Total", "170.762.429"}));
}

TEST(HtmlTableParserTest, MissingDataTableIsAnError) {
    TableParseOutcome outcome = HtmlTableParser::parse("<html><table class=\"tb_base\"><tr><td>x</td></tr></table></html>");
    EXPECT_FALSE(outcome.ok());
    EXPECT_NE(outcome.error.find("tb_dados"), std::string::npos);
}

TEST(HtmlTableParserTest, EmptyPageIsAnError) {
    TableParseOutcome outcome = HtmlTableParser::parse("   \n");
    EXPECT_FALSE(outcome.ok());
    EXPECT_EQ(outcome.error, "empty page");
}

TEST(HtmlTableParserTest, UngroupedRowsCollectInDefaultGroup) {
    const std::string page =
        "<table class='tb_dados tb_base'><tbody>"
        "<tr><td>Argentina</td><td>10</td></tr>"
        "<tr><td>Chile</td><td>20</td></tr>"
        "</tbody></table>";
    TableParseOutcome outcome = HtmlTableParser::parse(page);
    ASSERT_TRUE(outcome.ok());
    ASSERT_EQ(outcome.record->body.size(), 1);
    EXPECT_TRUE(outcome.record->body[0].item_data.empty());
    ASSERT_EQ(outcome.record->body[0].sub_items.size(), 2);
    EXPECT_EQ(outcome.record->body[0].sub_items[1], (TableRow{"Chile", "20"}));
    EXPECT_TRUE(outcome.record->header.empty());
    EXPECT_TRUE(outcome.record->footer.empty());
}

TEST(HtmlTableParserTest, RowsWithoutTbodyBecomeGroups) {
    const std::string page =
        "<table class=\"tb_base tb_dados\">"
        "<thead><tr><th>Pais</th></tr></thead>"
        "<tr><td>Brasil</td></tr>"
        "<tr><td>Uruguai</td></tr>"
        "<tfoot><tr><td>Total</td></tr></tfoot>"
        "</table>";
    TableParseOutcome outcome = HtmlTableParser::parse(page);
    ASSERT_TRUE(outcome.ok());
    ASSERT_EQ(outcome.record->body.size(), 2);
    EXPECT_EQ(outcome.record->body[0].item_data, (TableRow{"Brasil"}));
    EXPECT_EQ(outcome.record->body[1].item_data, (TableRow{"Uruguai"}));
    EXPECT_EQ(outcome.record->header.size(), 1);
    EXPECT_EQ(outcome.record->footer.size(), 1);
}

TEST(HtmlTableParserTest, CellTextStripsMarkupAndDecodesEntities) {
    const std::string page =
        "<table class=\"tb_base tb_dados\"><tbody>"
        "<tr><td class=\"tb_item\">  <b>Produ&ccedil;&atilde;o</b> <!-- note --> </td>"
        "<td class=\"tb_item\">A &amp; B&nbsp;&#65;&#x42;</td></tr>"
        "</tbody></table>";
    TableParseOutcome outcome = HtmlTableParser::parse(page);
    ASSERT_TRUE(outcome.ok()) << outcome.error;
    ASSERT_EQ(outcome.record->body.size(), 1);
    EXPECT_EQ(outcome.record->body[0].item_data, (TableRow{"Produ\xC3\xA7\xC3\xA3o", "A & B AB"}));
}

TEST(HtmlTableParserTest, QuotedGreaterThanInAttributeKeepsRowClass) {
    const std::string page =
        "<table class=\"tb_base tb_dados\"><tbody>"
        "<tr><td title=\"a>b\" class=\"tb_item\">Espumantes</td><td class=\"tb_item\">5</td></tr>"
        "<tr><td class=\"tb_subitem\">Moscatel</td><td class=\"tb_subitem\">2</td></tr>"
        "</tbody></table>";
    TableParseOutcome outcome = HtmlTableParser::parse(page);
    ASSERT_TRUE(outcome.ok()) << outcome.error;
    ASSERT_EQ(outcome.record->body.size(), 1);
    EXPECT_EQ(outcome.record->body[0].item_data, (TableRow{"Espumantes", "5"}));
    ASSERT_EQ(outcome.record->body[0].sub_items.size(), 1);
    EXPECT_EQ(outcome.record->body[0].sub_items[0], (TableRow{"Moscatel", "2"}));
}

TEST(HtmlTableParserTest, CommentedOutTableIsIgnored) {
    const std::string page =
        "<html><body>"
        "<!-- <table class=\"tb_base tb_dados\"><tbody><tr><td>old</td></tr></tbody></table> -->"
        "<table class=\"tb_base tb_dados\"><tbody>"
        "<tr><td class=\"tb_item\">current</td></tr>"
        "</tbody></table>"
        "</body></html>";
    TableParseOutcome outcome = HtmlTableParser::parse(page);
    ASSERT_TRUE(outcome.ok()) << outcome.error;
    ASSERT_EQ(outcome.record->body.size(), 1);
    EXPECT_EQ(outcome.record->body[0].item_data, (TableRow{"current"}));
}

TEST(HtmlTableParserTest, CommentedOutTableAloneIsAnError) {
    TableParseOutcome outcome = HtmlTableParser::parse(
        "<html><!-- <table class=\"tb_base tb_dados\"><tr><td>old</td></tr></table> --></html>");
    EXPECT_FALSE(outcome.ok());
}

TEST(HtmlTableParserTest, NullCharacterReferenceNeverYieldsNulByte) {
    const std::string page =
        "<table class=\"tb_base tb_dados\"><tbody>"
        "<tr><td class=\"tb_item\">a&#0;b</td></tr>"
        "</tbody></table>";
    TableParseOutcome outcome = HtmlTableParser::parse(page);
    ASSERT_TRUE(outcome.ok()) << outcome.error;
    const std::string& cell = outcome.record->body[0].item_data[0];
    EXPECT_EQ(cell.find('\0'), std::string::npos);
    EXPECT_EQ(cell.front(), 'a');
    EXPECT_EQ(cell.back(), 'b');
}

TEST(HtmlTableParserTest, Latin1PageIsConverted) {
    const std::string page =
        "<table class=\"tb_base tb_dados\"><tbody>"
        "<tr><td class=\"tb_item\">Produ\xE7\xE3o</td></tr>"
        "</tbody></table>";
    TableParseOutcome outcome = HtmlTableParser::parse(page);
    ASSERT_TRUE(outcome.ok());
    EXPECT_EQ(outcome.record->body[0].item_data[0], "Produ\xC3\xA7\xC3\xA3o");
}
