#include <string>

#include <fmt/core.h>

#include "ypbank/ypbank.hpp"

using namespace YpBank;

// =============================================================================
// Helper Macros for Example Output
// =============================================================================

#define EXAMPLE_SECTION(name) fmt::print("\n=== {} ===\n", name)
#define CHECK_ERR(ok, err, context)                                                                \
    if (!(ok)) {                                                                                   \
        fmt::print(stderr, "[FAIL] {}: {}\n", context, (err).message());                           \
        return 1;                                                                                  \
    }

namespace {

const char* kStatement = "ID,OCCURRED_AT,AMOUNT,CURRENCY,COUNTERPARTY,DESCRIPTION,OPERATION_TYPE\n"
                         "TX-1001,2024-03-01T09:30:00,-4.20,EUR,Cafe Central,\"espresso, croissant\",DEBIT\n"
                         "TX-1002,2024-03-01,2500.00,EUR,ACME GmbH,\"salary\nMarch\",CREDIT\n"
                         "TX-1003,2024-03-02,-1500,JPY,Tokyo Metro,,FEE\n";

} // namespace

int main() {
    const FormatRegistry registry = FormatRegistry::builtin();
    Converter converter(registry);
    Error err;

    // =========================================================================
    // 1. csv -> txt
    // =========================================================================
    EXAMPLE_SECTION("csv -> txt");
    std::string text;
    CHECK_ERR(converter.convert(kStatement, "csv", "txt", text, err), err, "convert csv->txt");
    fmt::print("{}", text);

    // =========================================================================
    // 2. txt -> bin -> csv
    // =========================================================================
    EXAMPLE_SECTION("txt -> bin -> csv");
    std::string bytes;
    CHECK_ERR(converter.convert(text, "txt", "bin", bytes, err), err, "convert txt->bin");
    fmt::print("binary size: {} bytes\n", bytes.size());

    std::string csv;
    CHECK_ERR(converter.convert(bytes, "bin", "csv", csv, err), err, "convert bin->csv");
    fmt::print("{}", csv);

    // =========================================================================
    // 3. Compare an edited copy
    // =========================================================================
    EXAMPLE_SECTION("compare");
    RecordSequence original;
    CHECK_ERR(converter.decode(kStatement, "csv", original, err), err, "decode original");

    RecordSequence edited;
    for (const auto& r : original) {
        if (r.id() == "TX-1003")
            continue; // removed
        RecordFields f = r.fields();
        if (r.id() == "TX-1001")
            f.amount = -450;
        auto rec = Record::create(std::move(f), err);
        CHECK_ERR(rec.has_value(), err, "edit record");
        edited.push_back(std::move(*rec));
    }

    RecordFields added;
    added.id = "TX-1004";
    added.occurredAt = OccurredAt::fromCivil(2024, 3, 3, 18, 5, 0);
    added.amount = 10000;
    added.currency = "EUR";
    added.counterparty = "Savings";
    added.operationType = OperationType::Transfer;
    auto rec = Record::create(std::move(added), err);
    CHECK_ERR(rec.has_value(), err, "create record");
    edited.push_back(std::move(*rec));

    DiffReport report;
    CHECK_ERR(compare(original, edited, report, err), err, "compare");
    fmt::print("{}", formatDiffReport(report, ReportLabels{"statement.csv", "edited"}));

    // =========================================================================
    // 4. Error reporting
    // =========================================================================
    EXAMPLE_SECTION("error reporting");
    RecordSequence ignored;
    if (!converter.decode("ID: TX-1\nAMOUNT: 1.234\n", "txt", ignored, err))
        fmt::print("txt: {} (parse error: {})\n", err.message(),
                   err.code == ErrorKind::parse_error);
    if (!converter.decode("YPBN\x02", "bin", ignored, err))
        fmt::print("bin: {} (unsupported version: {})\n", err.message(),
                   err.code == ErrorKind::unsupported_version);

    return 0;
}
