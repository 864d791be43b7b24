/**
 * @file ComparerTest.cpp
 * @brief Unit tests for key-aligned record comparison
 */

#include <gtest/gtest.h>

#include <algorithm>
#include <string>

#include <ypbank/compare/Comparer.hpp>

#include "fixtures/SampleRecords.hpp"

using namespace YpBank;
using YpBank::testing::makeRecord;
using YpBank::testing::sampleFields;

TEST(ComparerTest, IdenticalSequences) {
    const RecordSequence seq = YpBank::testing::threeRecords();
    DiffReport report;
    Error err;
    ASSERT_TRUE(compare(seq, seq, report, err)) << err.message();
    EXPECT_TRUE(report.identical());
    EXPECT_EQ(report.unchangedCount, 3u);
}

TEST(ComparerTest, EmptySequences) {
    DiffReport report;
    Error err;
    ASSERT_TRUE(compare({}, {}, report, err));
    EXPECT_TRUE(report.identical());
    EXPECT_EQ(report.unchangedCount, 0u);
}

TEST(ComparerTest, OrderDoesNotMatter) {
    RecordSequence a = YpBank::testing::threeRecords();
    RecordSequence b = a;
    std::reverse(b.begin(), b.end());

    DiffReport report;
    Error err;
    ASSERT_TRUE(compare(a, b, report, err));
    EXPECT_TRUE(report.identical());
}

TEST(ComparerTest, SingleAmountChange) {
    RecordSequence a = YpBank::testing::threeRecords();
    RecordFields f = a[1].fields();
    f.amount += 1;
    RecordSequence b = a;
    b[1] = makeRecord(f);

    DiffReport report;
    Error err;
    ASSERT_TRUE(compare(a, b, report, err));
    EXPECT_TRUE(report.added.empty());
    EXPECT_TRUE(report.removed.empty());
    ASSERT_EQ(report.changed.size(), 1u);
    EXPECT_EQ(report.unchangedCount, 2u);

    const ChangedRecord& c = report.changed[0];
    EXPECT_EQ(c.id, "TX-2");
    ASSERT_EQ(c.fields.size(), 1u);
    EXPECT_EQ(c.fields[0].field, Field::Amount);
    EXPECT_EQ(c.fields[0].left, "2500.00");
    EXPECT_EQ(c.fields[0].right, "2500.01");
}

TEST(ComparerTest, AddedRemovedChangedSortedById) {
    RecordSequence left{makeRecord("C"), makeRecord("A"), makeRecord("K"), makeRecord("B")};

    RecordFields k = sampleFields("K");
    k.description = "changed";
    k.operationType = OperationType::Fee;
    RecordSequence right{makeRecord("Z"), makeRecord(k), makeRecord("B"), makeRecord("D")};

    DiffReport report;
    Error err;
    ASSERT_TRUE(compare(left, right, report, err));

    ASSERT_EQ(report.removed.size(), 2u);
    EXPECT_EQ(report.removed[0].id(), "A");
    EXPECT_EQ(report.removed[1].id(), "C");

    ASSERT_EQ(report.added.size(), 2u);
    EXPECT_EQ(report.added[0].id(), "D");
    EXPECT_EQ(report.added[1].id(), "Z");

    ASSERT_EQ(report.changed.size(), 1u);
    EXPECT_EQ(report.changed[0].id, "K");
    ASSERT_EQ(report.changed[0].fields.size(), 2u);
    EXPECT_EQ(report.changed[0].fields[0].field, Field::Description);
    EXPECT_EQ(report.changed[0].fields[1].field, Field::OperationType);
    EXPECT_EQ(report.changed[0].fields[1].right, "FEE");

    EXPECT_EQ(report.unchangedCount, 1u);
    EXPECT_FALSE(report.identical());
}

TEST(ComparerTest, SwappingInputsSwapsSides) {
    RecordSequence left{makeRecord("A"), makeRecord("K")};
    RecordFields k = sampleFields("K");
    k.amount = 0;
    RecordSequence right{makeRecord(k), makeRecord("Z")};

    DiffReport ab;
    DiffReport ba;
    Error err;
    ASSERT_TRUE(compare(left, right, ab, err));
    ASSERT_TRUE(compare(right, left, ba, err));

    EXPECT_EQ(ab.added, ba.removed);
    EXPECT_EQ(ab.removed, ba.added);
    ASSERT_EQ(ab.changed.size(), 1u);
    ASSERT_EQ(ba.changed.size(), 1u);
    EXPECT_EQ(ab.changed[0].fields[0].left, ba.changed[0].fields[0].right);
    EXPECT_EQ(ab.changed[0].fields[0].right, ba.changed[0].fields[0].left);
}

TEST(ComparerTest, DuplicateIdFails) {
    RecordSequence left{makeRecord("A"), makeRecord("B"), makeRecord("A")};
    RecordSequence right{makeRecord("A")};

    DiffReport report;
    Error err;
    EXPECT_FALSE(compare(left, right, report, err));
    EXPECT_EQ(err.code, errc::duplicate_id);
    EXPECT_TRUE(err.code == ErrorKind::duplicate_key);
    EXPECT_EQ(err.locationKind, LocationKind::Record);
    EXPECT_EQ(err.location, 3u);
    EXPECT_EQ(err.reason, "duplicate id 'A' in left sequence");

    EXPECT_FALSE(compare(right, left, report, err));
    EXPECT_EQ(err.reason, "duplicate id 'A' in right sequence");
}
