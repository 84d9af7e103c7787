// EN: Unit tests for CsvReader and CsvWriter
// FR: Tests unitaires pour CsvReader et CsvWriter

#include <gtest/gtest.h>
#include "tnorm/csv/csv_codec.hpp"

using namespace TNORM::CSV;

class CsvCodecTest : public ::testing::Test {};

// EN: Reading
// FR: Lecture

TEST_F(CsvCodecTest, ReadsSimpleRecordsWithAnyLineEnding) {
    const auto records = CsvReader::readAll("a,b\r\nc,d\ne,f\rg,h");
    ASSERT_EQ(records.size(), 4u);
    EXPECT_EQ(records[0], (Record{"a", "b"}));
    EXPECT_EQ(records[1], (Record{"c", "d"}));
    EXPECT_EQ(records[2], (Record{"e", "f"}));
    EXPECT_EQ(records[3], (Record{"g", "h"}));
}

TEST_F(CsvCodecTest, QuotedFieldsKeepDelimitersNewlinesAndDoubledQuotes) {
    const auto records = CsvReader::readAll("\"a,1\",\"line1\r\nline2\",\"say \"\"hi\"\"\"\n");
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0], (Record{"a,1", "line1\r\nline2", "say \"hi\""}));
}

TEST_F(CsvCodecTest, QuoteInsideUnquotedFieldIsLiteral) {
    const auto records = CsvReader::readAll("ab\"c,d\n");
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0], (Record{"ab\"c", "d"}));
}

TEST_F(CsvCodecTest, BlankLineYieldsEmptyRecordAndEmptyFieldsSurvive) {
    const auto records = CsvReader::readAll("a,b\n\n,\n\"\"\n");
    ASSERT_EQ(records.size(), 4u);
    EXPECT_TRUE(records[1].empty());
    EXPECT_EQ(records[2], (Record{"", ""}));
    EXPECT_EQ(records[3], (Record{""}));
}

TEST_F(CsvCodecTest, RecordNumbersCountPhysicalRecords) {
    CsvReader reader("h\n\"x\ny\"\nz\n");
    Record record;
    ASSERT_TRUE(reader.next(record));
    EXPECT_EQ(reader.recordNumber(), 1u);
    ASSERT_TRUE(reader.next(record));
    EXPECT_EQ(record, Record{"x\ny"});
    EXPECT_EQ(reader.recordNumber(), 2u);
    ASSERT_TRUE(reader.next(record));
    EXPECT_EQ(reader.recordNumber(), 3u);
    EXPECT_FALSE(reader.next(record));
}

TEST_F(CsvCodecTest, UnterminatedQuoteIsReported) {
    CsvReader reader("a,\"open\nstill open");
    Record record;
    ASSERT_TRUE(reader.next(record));
    EXPECT_EQ(record, (Record{"a", "open\nstill open"}));
    EXPECT_TRUE(reader.endedInsideQuotes());
    EXPECT_FALSE(reader.next(record));
}

TEST_F(CsvCodecTest, CustomDelimiterAndQuote) {
    const auto records = CsvReader::readAll("'a;b';c\n", ';', '\'');
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0], (Record{"a;b", "c"}));
}

// EN: Writing
// FR: Écriture

TEST_F(CsvCodecTest, MinimalQuoting) {
    EXPECT_EQ(CsvWriter::escapeField("plain"), "plain");
    EXPECT_EQ(CsvWriter::escapeField("a,b"), "\"a,b\"");
    EXPECT_EQ(CsvWriter::escapeField("say \"hi\""), "\"say \"\"hi\"\"\"");
    EXPECT_EQ(CsvWriter::escapeField("two\nlines"), "\"two\nlines\"");
    EXPECT_EQ(CsvWriter::escapeField("cr\r"), "\"cr\r\"");
}

TEST_F(CsvCodecTest, QuoteAllAndCustomDelimiter) {
    WriteOptions options;
    options.quote_all = true;
    EXPECT_EQ(CsvWriter::formatRow({"a", ""}, options), "\"a\",\"\"");

    WriteOptions tabs;
    tabs.delimiter = '\t';
    EXPECT_EQ(CsvWriter::formatRow({"a,b", "c\td"}, tabs), "a,b\t\"c\td\"");
}

TEST_F(CsvCodecTest, SingleEmptyFieldIsQuoted) {
    EXPECT_EQ(CsvWriter::formatRow({""}), "\"\"");
    EXPECT_EQ(CsvWriter::formatRow({}), "");
}

TEST_F(CsvCodecTest, FormatRowsAppendsNewlineAfterEveryRecord) {
    EXPECT_EQ(CsvWriter::formatRows({{"h1", "h2"}, {"1", "2"}}, "\r\n"), "h1,h2\r\n1,2\r\n");
    EXPECT_EQ(CsvWriter::formatRows({}, "\n"), "");
}

TEST_F(CsvCodecTest, WrittenTextReadsBack) {
    const std::vector<Record> rows = {{"id", "note"}, {"1", "a,\"b\"\nc"}, {"2", ""}};
    EXPECT_EQ(CsvReader::readAll(CsvWriter::formatRows(rows, "\r\n")), rows);
}
