/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-NC-4.0
 *
 * Unit tests for the CSV helpers
 */

#include <gtest/gtest.h>
#include <Csv.hpp>
#include <sstream>
#include <stdexcept>

using namespace flight_seg;

TEST(CsvSplitTest, PlainFields) {
    auto fields = csv::splitLine("a,b,,d");
    ASSERT_EQ(4u, fields.size());
    EXPECT_EQ("a", fields[0]);
    EXPECT_EQ("", fields[2]);
    EXPECT_EQ("d", fields[3]);
}

TEST(CsvSplitTest, TrailingEmptyField) {
    auto fields = csv::splitLine("a,b,");
    ASSERT_EQ(3u, fields.size());
    EXPECT_EQ("", fields[2]);
}

TEST(CsvSplitTest, QuotedSeparatorAndEscapedQuote) {
    auto fields = csv::splitLine("1,\"LONDON, HEATHROW\",\"say \"\"hi\"\"\"");
    ASSERT_EQ(3u, fields.size());
    EXPECT_EQ("LONDON, HEATHROW", fields[1]);
    EXPECT_EQ("say \"hi\"", fields[2]);
}

TEST(CsvSplitTest, StripsCarriageReturn) {
    auto fields = csv::splitLine("a,b\r");
    ASSERT_EQ(2u, fields.size());
    EXPECT_EQ("b", fields[1]);
}

TEST(CsvSplitTest, UnterminatedQuoteThrows) {
    EXPECT_THROW(csv::splitLine("a,\"open"), std::invalid_argument);
}

TEST(CsvEscapeTest, QuotesOnlyWhenNeeded) {
    EXPECT_EQ("EGLL", csv::escapeField("EGLL"));
    EXPECT_EQ("\"a,b\"", csv::escapeField("a,b"));
    EXPECT_EQ("\"a \"\"b\"\"\"", csv::escapeField("a \"b\""));
    EXPECT_EQ("\" padded\"", csv::escapeField(" padded"));
}

TEST(CsvJoinTest, JoinedLineSplitsBack) {
    std::vector<std::string> fields{"2024-03-01 00:00:00.000 UTC", "abc123", "x,y", "", "q\"q"};
    EXPECT_EQ(fields, csv::splitLine(csv::joinLine(fields)));
}

TEST(CsvColumnTest, FindColumn) {
    std::vector<std::string> header{"timestamp", "icao_address", "latitude"};
    EXPECT_EQ(1u, csv::findColumn(header, "icao_address").value());
    EXPECT_FALSE(csv::findColumn(header, "longitude").has_value());
}

TEST(CsvReadLineTest, HandlesCrLf) {
    std::istringstream in("one\r\ntwo\n");
    std::string line;
    ASSERT_TRUE(csv::readLine(in, line));
    EXPECT_EQ("one", line);
    ASSERT_TRUE(csv::readLine(in, line));
    EXPECT_EQ("two", line);
    EXPECT_FALSE(csv::readLine(in, line));
}

TEST(CsvReadRecordTest, QuotedLineBreaksStayInOneRecord) {
    std::istringstream in("a,\"first\n\nthird\",b\r\nnext,row\n");
    std::string record;
    ASSERT_TRUE(csv::readRecord(in, record));
    EXPECT_EQ("a,\"first\n\nthird\",b", record);

    auto fields = csv::splitLine(record);
    ASSERT_EQ(3u, fields.size());
    EXPECT_EQ("first\n\nthird", fields[1]);

    ASSERT_TRUE(csv::readRecord(in, record));
    EXPECT_EQ("next,row", record);
    EXPECT_FALSE(csv::readRecord(in, record));
}

TEST(CsvReadRecordTest, EscapedFieldReadsBack) {
    std::string field = "say \"hi\"\r\nbye";
    std::istringstream in(csv::joinLine({"x", field}) + "\n");
    std::string record;
    ASSERT_TRUE(csv::readRecord(in, record));
    auto fields = csv::splitLine(record);
    ASSERT_EQ(2u, fields.size());
    EXPECT_EQ(field, fields[1]);
}
