/**
 * @file CsvCodecTest.cpp
 * @brief Unit tests for the csv codec
 */

#include <gtest/gtest.h>

#include <string>

#include <ypbank/codec/CsvCodec.hpp>

#include "fixtures/SampleRecords.hpp"

using namespace YpBank;
using YpBank::testing::makeRecord;
using YpBank::testing::sampleFields;

namespace {

const std::string kHeader = "ID,OCCURRED_AT,AMOUNT,CURRENCY,COUNTERPARTY,DESCRIPTION,OPERATION_TYPE\n";

} // namespace

class CsvCodecTest : public ::testing::Test {
  protected:
    bool decode(const std::string& text) { return codec_.decode(text, records_, err_); }

    CsvCodec codec_;
    RecordSequence records_;
    Error err_;
};

// =============================================================================
// Decode
// =============================================================================

TEST_F(CsvCodecTest, DecodeSimpleRows) {
    ASSERT_TRUE(decode(kHeader + "TX-1,2024-03-01T09:30:00,-12.50,EUR,Cafe Central,coffee,DEBIT\n"
                                 "TX-2,2024-03-02,1200,JPY,,,CREDIT\n"))
        << err_.message();
    ASSERT_EQ(records_.size(), 2u);

    EXPECT_EQ(records_[0], makeRecord("TX-1"));
    EXPECT_EQ(records_[0].description(), "coffee");
    EXPECT_EQ(records_[1].amount(), 1200);
    EXPECT_EQ(records_[1].currency(), "JPY");
    EXPECT_TRUE(records_[1].counterparty().empty());
    EXPECT_FALSE(records_[1].occurredAt().seconds.has_value());
}

TEST_F(CsvCodecTest, HeaderOnlyIsEmptySequence) {
    ASSERT_TRUE(decode(kHeader)) << err_.message();
    EXPECT_TRUE(records_.empty());
}

TEST_F(CsvCodecTest, QuotedFields) {
    ASSERT_TRUE(decode(kHeader + "TX-1,2024-03-01,1.00,EUR,\"Smith, J.\",\"say \"\"hi\"\"\nnext line\","
                                 "DEBIT\n"))
        << err_.message();
    ASSERT_EQ(records_.size(), 1u);
    EXPECT_EQ(records_[0].counterparty(), "Smith, J.");
    EXPECT_EQ(records_[0].description(), "say \"hi\"\nnext line");
}

TEST_F(CsvCodecTest, CrLfAndBlankLinesAndBom) {
    std::string text = "\xEF\xBB\xBF"
                       "ID,OCCURRED_AT,AMOUNT,CURRENCY,COUNTERPARTY,DESCRIPTION,OPERATION_TYPE\r\n"
                       "\r\n"
                       "TX-1,2024-03-01,1.00,EUR,a,\"x\r\ny\",DEBIT\r\n"
                       "\n"
                       "TX-2,2024-03-01,2.00,EUR,b,z,FEE";
    ASSERT_TRUE(decode(text)) << err_.message();
    ASSERT_EQ(records_.size(), 2u);
    EXPECT_EQ(records_[0].description(), "x\ny");
    EXPECT_EQ(records_[1].operationType(), OperationType::Fee);
}

TEST_F(CsvCodecTest, MissingHeaderColumnFailsAtLineOne) {
    EXPECT_FALSE(decode("ID,OCCURRED_AT,AMOUNT,CURRENCY,COUNTERPARTY,DESCRIPTION\n"
                        "TX-1,2024-03-01,1.00,EUR,a,b\n"));
    EXPECT_EQ(err_.code, errc::bad_header);
    EXPECT_TRUE(err_.code == ErrorKind::parse_error);
    EXPECT_EQ(err_.locationKind, LocationKind::Line);
    EXPECT_EQ(err_.location, 1u);
    EXPECT_TRUE(records_.empty());
}

TEST_F(CsvCodecTest, MisorderedHeader) {
    EXPECT_FALSE(decode("OCCURRED_AT,ID,AMOUNT,CURRENCY,COUNTERPARTY,DESCRIPTION,OPERATION_TYPE\n"));
    EXPECT_EQ(err_.code, errc::bad_header);
    EXPECT_EQ(err_.reason, "column 1 is 'OCCURRED_AT', expected 'ID'");
}

TEST_F(CsvCodecTest, EmptyInputHasNoHeader) {
    EXPECT_FALSE(decode(""));
    EXPECT_EQ(err_.code, errc::bad_header);
    EXPECT_EQ(err_.reason, "missing header");
}

TEST_F(CsvCodecTest, WrongFieldCount) {
    EXPECT_FALSE(decode(kHeader + "TX-1,2024-03-01,1.00,EUR,a,b,DEBIT\n"
                                  "TX-2,2024-03-01,1.00,EUR,a,DEBIT\n"));
    EXPECT_EQ(err_.code, errc::syntax_error);
    EXPECT_EQ(err_.location, 3u);
    EXPECT_EQ(err_.reason, "expected 7 fields, got 6");
}

TEST_F(CsvCodecTest, ValidationErrorCarriesLineAndField) {
    EXPECT_FALSE(decode(kHeader + "TX-1,2024-03-01,1.001,EUR,a,b,DEBIT\n"));
    EXPECT_EQ(err_.code, errc::invalid_value);
    EXPECT_TRUE(err_.code == ErrorKind::validation_error);
    EXPECT_EQ(err_.location, 2u);
    EXPECT_EQ(err_.field, "AMOUNT");
    EXPECT_EQ(err_.message(), "line 2: AMOUNT: too many decimal places for EUR");
}

TEST_F(CsvCodecTest, LineNumbersCountPhysicalLines) {
    EXPECT_FALSE(decode(kHeader + "TX-1,2024-03-01,1.00,EUR,a,\"multi\nline\nvalue\",DEBIT\n"
                                  "TX-2,2024-03-01,1.00,EUR,a,b,BOGUS\n"));
    EXPECT_EQ(err_.location, 5u);
    EXPECT_EQ(err_.field, "OPERATION_TYPE");
}

TEST_F(CsvCodecTest, QuoteSyntaxErrors) {
    EXPECT_FALSE(decode(kHeader + "TX-1,2024-03-01,1.00,EUR,a\"b,c,DEBIT\n"));
    EXPECT_EQ(err_.code, errc::syntax_error);
    EXPECT_EQ(err_.reason, "unexpected quote in unquoted field");

    EXPECT_FALSE(decode(kHeader + "TX-1,2024-03-01,1.00,EUR,\"a\"b,c,DEBIT\n"));
    EXPECT_EQ(err_.reason, "unexpected character after closing quote");

    EXPECT_FALSE(decode(kHeader + "\nTX-1,2024-03-01,1.00,EUR,\"open,c,DEBIT\nmore\n"));
    EXPECT_EQ(err_.reason, "unterminated quoted field");
    EXPECT_EQ(err_.location, 3u);
}

TEST_F(CsvCodecTest, DuplicateIdRejected) {
    EXPECT_FALSE(decode(kHeader + "TX-1,2024-03-01,1.00,EUR,a,b,DEBIT\n"
                                  "TX-1,2024-03-02,2.00,EUR,a,b,DEBIT\n"));
    EXPECT_EQ(err_.code, errc::duplicate_id);
    EXPECT_TRUE(err_.code == ErrorKind::duplicate_key);
    EXPECT_EQ(err_.location, 3u);
}

// =============================================================================
// Encode
// =============================================================================

TEST_F(CsvCodecTest, EncodeQuotesOnlyWhenNeeded) {
    RecordFields f = sampleFields("TX-1");
    f.counterparty = "Smith, J.";
    f.description = "say \"hi\"";
    RecordSequence seq{makeRecord(f), makeRecord("TX-2")};

    EXPECT_EQ(codec_.encode(seq),
              kHeader + "TX-1,2024-03-01T09:30:00,-12.50,EUR,\"Smith, J.\",\"say \"\"hi\"\"\",DEBIT\n"
                        "TX-2,2024-03-01T09:30:00,-12.50,EUR,Cafe Central,coffee,DEBIT\n");
}

TEST_F(CsvCodecTest, EncodeEmptySequenceIsHeaderOnly) {
    EXPECT_EQ(codec_.encode({}), kHeader);
    EXPECT_EQ(CsvCodec::header() + "\n", kHeader);
}

TEST_F(CsvCodecTest, RoundTripAwkwardText) {
    const RecordSequence seq = YpBank::testing::awkwardRecords();
    ASSERT_TRUE(decode(codec_.encode(seq))) << err_.message();
    EXPECT_EQ(records_, seq);
}
