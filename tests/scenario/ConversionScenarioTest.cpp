/**
 * @file ConversionScenarioTest.cpp
 * @brief Scenario tests for conversion chains across all registered formats
 */

#include <gtest/gtest.h>

#include <string>
#include <type_traits>
#include <vector>

#include <ypbank/compare/Comparer.hpp>
#include <ypbank/convert/Converter.hpp>

#include "fixtures/SampleRecords.hpp"

using namespace YpBank;

namespace {

const char* kStatementCsv =
    "ID,OCCURRED_AT,AMOUNT,CURRENCY,COUNTERPARTY,DESCRIPTION,OPERATION_TYPE\n"
    "TX-1001,2024-03-01T09:30:00,-4.20,EUR,Cafe Central,\"espresso, croissant\",DEBIT\n"
    "TX-1002,2024-03-01,2500.00,EUR,ACME GmbH,\"salary\nMarch\",CREDIT\n"
    "TX-1003,2024-03-02,-1500,JPY,Tokyo Metro,,FEE\n";

static_assert(std::is_constructible<Converter, const FormatRegistry&>::value,
              "converter binds to a named registry");
static_assert(!std::is_constructible<Converter, FormatRegistry&&>::value,
              "converter must not bind to a temporary registry");
static_assert(!std::is_constructible<Converter, FormatRegistry>::value,
              "converter must not bind to a temporary registry");

} // namespace

class ConversionScenarioTest : public ::testing::Test {
  protected:
    ConversionScenarioTest() : registry_(FormatRegistry::builtin()), converter_(registry_) {}

    std::string convert(const std::string& input, const char* from, const char* to) {
        std::string out;
        EXPECT_TRUE(converter_.convert(input, from, to, out, err_))
            << from << " -> " << to << ": " << err_.message();
        return out;
    }

    RecordSequence decode(const std::string& input, const char* format) {
        RecordSequence out;
        EXPECT_TRUE(converter_.decode(input, format, out, err_))
            << format << ": " << err_.message();
        return out;
    }

    FormatRegistry registry_;
    Converter converter_;
    Error err_;
};

// =============================================================================
// Chains
// =============================================================================

TEST_F(ConversionScenarioTest, CsvToBinToTxtComparesEqual) {
    const std::string bin = convert(kStatementCsv, "csv", "bin");
    const std::string txt = convert(bin, "bin", "txt");

    const RecordSequence original = decode(kStatementCsv, "csv");
    const RecordSequence roundTripped = decode(txt, "txt");
    ASSERT_EQ(original.size(), 3u);

    DiffReport report;
    ASSERT_TRUE(compare(original, roundTripped, report, err_)) << err_.message();
    EXPECT_TRUE(report.identical());
    EXPECT_EQ(report.unchangedCount, 3u);
}

TEST_F(ConversionScenarioTest, EveryPairPreservesRecords) {
    const RecordSequence seq = YpBank::testing::awkwardRecords();
    const std::vector<const char*> formats = {"csv", "txt", "bin"};

    for (const char* from : formats) {
        const std::string input = registry_.find(from)->encode(seq);
        for (const char* to : formats) {
            const std::string out = convert(input, from, to);
            EXPECT_EQ(decode(out, to), seq) << from << " -> " << to;
        }
    }
}

TEST_F(ConversionScenarioTest, SameFormatConversionIsCanonical) {
    // 비정규 입력(순서 바뀐 label, 짧은 소수부, 주석)은 정규 형태로 다시 쓰인다.
    const std::string txt = "# exported\n"
                            "OPERATION_TYPE: CREDIT\n"
                            "ID: A-1\n"
                            "AMOUNT: 5.5\n"
                            "CURRENCY: USD\n"
                            "OCCURRED_AT: 2024-01-31\n"
                            "COUNTERPARTY: Bank\n"
                            "DESCRIPTION: interest\n";
    EXPECT_EQ(convert(txt, "txt", "text"), "ID: A-1\n"
                                           "OCCURRED_AT: 2024-01-31\n"
                                           "AMOUNT: 5.50\n"
                                           "CURRENCY: USD\n"
                                           "COUNTERPARTY: Bank\n"
                                           "DESCRIPTION: interest\n"
                                           "OPERATION_TYPE: CREDIT\n");
}

TEST_F(ConversionScenarioTest, BinaryEncodingIsStable) {
    const std::string first = convert(kStatementCsv, "csv", "binary");
    const std::string again = convert(convert(first, "bin", "txt"), "txt", "bin");
    EXPECT_EQ(first, again);
}

// =============================================================================
// Failures
// =============================================================================

TEST_F(ConversionScenarioTest, UnknownFormatFailsBeforeDecoding) {
    std::string out = "stale";
    EXPECT_FALSE(converter_.convert("not csv at all", "csv", "xml", out, err_));
    EXPECT_EQ(err_.code, errc::unknown_format);
    EXPECT_TRUE(out.empty());

    EXPECT_FALSE(converter_.convert("", "yaml", "csv", out, err_));
    EXPECT_EQ(err_.code, errc::unknown_format);
}

TEST_F(ConversionScenarioTest, DecodeErrorPropagates) {
    std::string out;
    EXPECT_FALSE(converter_.convert("garbage", "bin", "csv", out, err_));
    EXPECT_EQ(err_.code, errc::bad_magic);
    EXPECT_TRUE(out.empty());
}

TEST_F(ConversionScenarioTest, ReadingTheWrongFormatFails) {
    const std::string bin = convert(kStatementCsv, "csv", "bin");
    RecordSequence out;
    EXPECT_FALSE(converter_.decode(bin, "txt", out, err_));
    EXPECT_TRUE(err_.code == ErrorKind::parse_error);
    EXPECT_FALSE(converter_.decode(kStatementCsv, "bin", out, err_));
    EXPECT_EQ(err_.code, errc::bad_magic);
}
