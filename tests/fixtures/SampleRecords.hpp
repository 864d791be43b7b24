#pragma once
/// @file SampleRecords.hpp
/// @brief Record builders shared by the unit and scenario tests

#include <gtest/gtest.h>

#include <string>

#include <ypbank/record/RecordSequence.hpp>

namespace YpBank::testing {

/// @brief Fields of a plain valid record with the given id
inline RecordFields sampleFields(const std::string& id) {
    RecordFields f;
    f.id = id;
    f.occurredAt = OccurredAt::fromCivil(2024, 3, 1, 9, 30, 0);
    f.amount = -1250;
    f.currency = "EUR";
    f.counterparty = "Cafe Central";
    f.description = "coffee";
    f.operationType = OperationType::Debit;
    return f;
}

/// @brief Build a record, failing the current test when validation rejects it
inline Record makeRecord(RecordFields fields) {
    Error err;
    auto r = Record::create(std::move(fields), err);
    EXPECT_TRUE(r.has_value()) << err.message();
    if (!r)
        return *Record::create(sampleFields("INVALID"), err);
    return std::move(*r);
}

inline Record makeRecord(const std::string& id) { return makeRecord(sampleFields(id)); }

/// @brief Three records covering date-only values, text needing quoting and a
///        zero-scale currency
inline RecordSequence threeRecords() {
    RecordSequence seq;

    RecordFields a = sampleFields("TX-1");
    a.description = "espresso, \"double\"";
    seq.push_back(makeRecord(a));

    RecordFields b = sampleFields("TX-2");
    b.occurredAt = OccurredAt::fromCivil(2024, 3, 2);
    b.amount = 250000;
    b.counterparty = "ACME GmbH";
    b.description = "salary\nMarch 2024";
    b.operationType = OperationType::Credit;
    seq.push_back(makeRecord(b));

    RecordFields c = sampleFields("TX-3");
    c.occurredAt = OccurredAt::fromCivil(1999, 12, 31, 23, 59, 59);
    c.amount = -1500;
    c.currency = "JPY";
    c.counterparty = "";
    c.description = "";
    c.operationType = OperationType::Fee;
    seq.push_back(makeRecord(c));

    return seq;
}

/// @brief Records whose text needs every escaping rule the text formats have
inline RecordSequence awkwardRecords() {
    RecordSequence seq;

    RecordFields a = sampleFields("Q-1");
    a.counterparty = "  leading and trailing  ";
    a.description = "line one\n  indented line\n\n.dot\n \t \nafter blank, with \"quotes\"";
    seq.push_back(makeRecord(a));

    RecordFields b = sampleFields("Q-2");
    b.counterparty = "M\xC3\xBCller & S\xC3\xB6hne"; // Müller & Söhne
    b.description = "# not a comment\ttab";
    b.amount = 0;
    b.currency = "KWD";
    b.operationType = OperationType::Withdrawal;
    seq.push_back(makeRecord(b));

    RecordFields c = sampleFields("Q-3");
    c.description = "\n";
    c.counterparty = ",";
    c.amount = INT64_MIN;
    c.operationType = OperationType::Adjustment;
    seq.push_back(makeRecord(c));

    return seq;
}

} // namespace YpBank::testing
