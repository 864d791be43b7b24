#pragma once
/// @file Comparer.hpp
/// @brief Key-aligned, field-level comparison of two record sequences

#include "../error/Error.hpp"
#include "../record/RecordSequence.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace YpBank {

/// @brief One differing field of a record present on both sides
struct FieldDiff {
    Field field;
    std::string left;  ///< field text form on the left side
    std::string right; ///< field text form on the right side
};

/// @brief Record present on both sides with at least one differing field
struct ChangedRecord {
    std::string id;
    std::vector<FieldDiff> fields; ///< canonical field order
};

/// @brief Result of compare()
/// @details added, removed and changed are sorted by id (byte-wise), independent of
///          input order.
struct DiffReport {
    std::vector<Record> added;   ///< right only
    std::vector<Record> removed; ///< left only
    std::vector<ChangedRecord> changed;
    std::size_t unchangedCount = 0;

    bool identical() const noexcept { return added.empty() && removed.empty() && changed.empty(); }
};

/// @brief Align two sequences by id and diff the common records field by field
/// @param[out] report Filled on success
/// @param[out] err errc::duplicate_id (LocationKind::Record, 1-based position of the second
///                 occurrence) when an id repeats within one side
/// @return true on success
bool compare(const RecordSequence& left, const RecordSequence& right, DiffReport& report,
             Error& err);

} // namespace YpBank
