/**
 * @file ReportFormatTest.cpp
 * @brief Unit tests for diff report rendering
 */

#include <gtest/gtest.h>

#include <string>

#include <ypbank/compare/ReportFormat.hpp>

#include "fixtures/SampleRecords.hpp"

using namespace YpBank;
using YpBank::testing::makeRecord;
using YpBank::testing::sampleFields;

TEST(ReportFormatTest, RecordLine) {
    EXPECT_EQ(formatRecordLine(makeRecord("TX-1")),
              R"("TX-1" 2024-03-01T09:30:00 -12.50 EUR "Cafe Central" "coffee" DEBIT)");
}

TEST(ReportFormatTest, FreeTextIsEscaped) {
    EXPECT_EQ(formatReportValue(Field::Description, "a \"b\"\nc"), R"("a \"b\"\nc")");
    EXPECT_EQ(formatReportValue(Field::Counterparty, ""), R"("")");
    EXPECT_EQ(formatReportValue(Field::Amount, "1.00"), "1.00");
}

TEST(ReportFormatTest, IdWithSpacesStaysOneToken) {
    EXPECT_EQ(formatReportValue(Field::Id, "TX 1 \"x\""), R"("TX 1 \"x\"")");

    RecordSequence left{makeRecord("TX 1")};
    RecordFields changed = sampleFields("TX 1");
    changed.amount = 0;
    RecordSequence right{makeRecord(changed), makeRecord("TX 2 EUR")};

    DiffReport report;
    Error err;
    ASSERT_TRUE(compare(left, right, report, err));

    const std::string text = formatDiffReport(report, {"l", "r"});
    EXPECT_NE(text.find("+ \"TX 2 EUR\" 2024-03-01T09:30:00 "), std::string::npos) << text;
    EXPECT_NE(text.find("~ \"TX 1\"\n"), std::string::npos) << text;
}

TEST(ReportFormatTest, IdenticalSentence) {
    DiffReport report;
    report.unchangedCount = 3;
    EXPECT_EQ(formatDiffReport(report, {"a.csv", "b.bin"}),
              "The records in 'a.csv' and 'b.bin' are identical (3 records).\n");
}

TEST(ReportFormatTest, FullReport) {
    RecordSequence left{makeRecord("A"), makeRecord("K")};
    RecordFields k = sampleFields("K");
    k.amount = 100;
    k.description = "two\nlines";
    RecordSequence right{makeRecord(k), makeRecord("Z")};

    DiffReport report;
    Error err;
    ASSERT_TRUE(compare(left, right, report, err));

    EXPECT_EQ(formatDiffReport(report, {"left.csv", "right.txt"}),
              "The records in 'left.csv' and 'right.txt' differ: 1 removed, 1 added, 1 changed, "
              "0 unchanged.\n"
              "- \"A\" 2024-03-01T09:30:00 -12.50 EUR \"Cafe Central\" \"coffee\" DEBIT\n"
              "+ \"Z\" 2024-03-01T09:30:00 -12.50 EUR \"Cafe Central\" \"coffee\" DEBIT\n"
              "~ \"K\"\n"
              "    AMOUNT: -12.50 -> 1.00\n"
              "    DESCRIPTION: \"coffee\" -> \"two\\nlines\"\n");
}
