// tests/test_csv_table_parser.cpp
#include <string>
#include <vector>

#include "gtest/gtest.h"

#include "../src/parsers/CsvTableParser.hpp"

TEST(CsvTableParserTest, ParsesHeaderBodyAndFooter) {
    const std::string content =
        "Produto;Quantidade (L.)\n"
        "VINHO DE MESA;169.762.429\n"
        "SUCO;1.234\n"
        "Total;170.996.663\n";

    TableParseOutcome outcome = CsvTableParser::parse(content);
    ASSERT_TRUE(outcome.ok()) << outcome.error;
    const TableRecord& record = *outcome.record;

    ASSERT_EQ(record.header.size(), 1);
    EXPECT_EQ(record.header[0], (TableRow{"Produto", "Quantidade (L.)"}));
    ASSERT_EQ(record.body.size(), 2);
    EXPECT_EQ(record.body[0].item_data, (TableRow{"VINHO DE MESA", "169.762.429"}));
    EXPECT_TRUE(record.body[0].sub_items.empty());
    ASSERT_EQ(record.footer.size(), 1);
    EXPECT_EQ(record.footer[0], (TableRow{"Total", "170.996.663"}));
}

TEST(CsvTableParserTest, DetectsDelimiter) {
    EXPECT_EQ(CsvTableParser::detectDelimiter("a;b;c"), ';');
    EXPECT_EQ(CsvTableParser::detectDelimiter("a,b,c"), ',');
    EXPECT_EQ(CsvTableParser::detectDelimiter("a\tb\tc"), '\t');
    EXPECT_EQ(CsvTableParser::detectDelimiter("a|b|c"), '|');
    EXPECT_EQ(CsvTableParser::detectDelimiter("\"x;y;z\",b"), ',');
    EXPECT_EQ(CsvTableParser::detectDelimiter("single"), ';');
}

TEST(CsvTableParserTest, ParseLineHandlesQuotes) {
    auto fields = CsvTableParser::parseLine("\"a,b\",\"say \"\"hi\"\"\",c\r", ',');
    ASSERT_EQ(fields.size(), 3);
    EXPECT_EQ(fields[0], "a,b");
    EXPECT_EQ(fields[1], "say \"hi\"");
    EXPECT_EQ(fields[2], "c");
}

TEST(CsvTableParserTest, ParseLineKeepsEmptyFields) {
    auto fields = CsvTableParser::parseLine("a,,c,", ',');
    EXPECT_EQ(fields, (std::vector<std::string>{"a", "", "c", ""}));
}

TEST(CsvTableParserTest, QuotedFieldMaySpanLines) {
    const std::string content = "id,notes\n1,\"first\nsecond\"\n";
    TableParseOutcome outcome = CsvTableParser::parse(content);
    ASSERT_TRUE(outcome.ok()) << outcome.error;
    ASSERT_EQ(outcome.record->body.size(), 1);
    EXPECT_EQ(outcome.record->body[0].item_data[1], "first\nsecond");
}

TEST(CsvTableParserTest, SkipsBlankRowsAndTrimsCells) {
    const std::string content = "a ; b \r\n\r\n ; \r\n x ; y \r\n";
    TableParseOutcome outcome = CsvTableParser::parse(content);
    ASSERT_TRUE(outcome.ok()) << outcome.error;
    EXPECT_EQ(outcome.record->header[0], (TableRow{"a", "b"}));
    ASSERT_EQ(outcome.record->body.size(), 1);
    EXPECT_EQ(outcome.record->body[0].item_data, (TableRow{"x", "y"}));
}

TEST(CsvTableParserTest, DropsColumnsWithBlankHeader) {
    const std::string content = "id;;produto\n1;ignored;Vinho\n";
    TableParseOutcome outcome = CsvTableParser::parse(content);
    ASSERT_TRUE(outcome.ok()) << outcome.error;
    EXPECT_EQ(outcome.record->header[0], (TableRow{"id", "produto"}));
    EXPECT_EQ(outcome.record->body[0].item_data, (TableRow{"1", "Vinho"}));
}

TEST(CsvTableParserTest, ShortRowsArePadded) {
    TableParseOutcome outcome = CsvTableParser::parse("a;b;c\n1\n");
    ASSERT_TRUE(outcome.ok()) << outcome.error;
    EXPECT_EQ(outcome.record->body[0].item_data, (TableRow{"1", "", ""}));
}

TEST(CsvTableParserTest, StripsBomAndConvertsLatin1) {
    const std::string utf8_bom = "\xEF\xBB\xBFProduto;Ano\nVinho;2023\n";
    TableParseOutcome with_bom = CsvTableParser::parse(utf8_bom);
    ASSERT_TRUE(with_bom.ok()) << with_bom.error;
    EXPECT_EQ(with_bom.record->header[0][0], "Produto");

    const std::string latin1 = "Produ\xE7\xE3o;Ano\nVinho;2023\n";
    TableParseOutcome converted = CsvTableParser::parse(latin1);
    ASSERT_TRUE(converted.ok()) << converted.error;
    EXPECT_EQ(converted.record->header[0][0], "Produ\xC3\xA7\xC3\xA3o");
}

TEST(CsvTableParserTest, FooterKeywords) {
    EXPECT_TRUE(CsvTableParser::isFooterRow({"TOTAL GERAL", "1"}));
    EXPECT_TRUE(CsvTableParser::isFooterRow({"Subtotal", "1"}));
    EXPECT_TRUE(CsvTableParser::isFooterRow({"M\xC3\xA9" "dia anual", "1"}));
    EXPECT_TRUE(CsvTableParser::isFooterRow({"media", "1"}));
    EXPECT_FALSE(CsvTableParser::isFooterRow({"Vinho de mesa", "1"}));
    EXPECT_FALSE(CsvTableParser::isFooterRow({}));
}

TEST(CsvTableParserTest, EmptyInputsAreErrors) {
    EXPECT_FALSE(CsvTableParser::parse("").ok());
    EXPECT_FALSE(CsvTableParser::parse(" \n\n").ok());
    EXPECT_FALSE(CsvTableParser::parse(";;\n1;2\n").ok());
    TableParseOutcome header_only = CsvTableParser::parse("a;b\n");
    EXPECT_FALSE(header_only.ok());
    EXPECT_FALSE(header_only.error.empty());
}

TEST(CsvTableParserTest, MissingFileIsError) {
    TableParseOutcome outcome = CsvTableParser::parseFile("/nonexistent/dir/Producao.csv");
    EXPECT_FALSE(outcome.ok());
    EXPECT_NE(outcome.error.find("cannot open"), std::string::npos);
}
