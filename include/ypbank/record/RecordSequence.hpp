#pragma once
/// @file RecordSequence.hpp
/// @brief Ordered record sequence and the id-unique builder used by decoders

#include "Record.hpp"

#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace YpBank {

/// @brief Ordered list of records (order matters for display and encoding)
using RecordSequence = std::vector<Record>;

/// @brief Largest sequence any codec accepts (the binary header stores the count as u32)
constexpr std::size_t MAX_RECORD_COUNT = 0xFFFFFFFFu;

/// @brief Accumulates decoded records and enforces id uniqueness and the record limit
class SequenceBuilder {
  public:
    explicit SequenceBuilder(std::size_t maxRecords = MAX_RECORD_COUNT) noexcept
        : maxRecords_(maxRecords) {}

    /// @brief Append a record
    /// @param location Where the record came from (line or offset), reported on errors
    /// @param[out] err errc::duplicate_id when the id was already appended,
    ///                 errc::too_many_records when the limit is reached
    bool append(Record record, LocationKind kind, std::size_t location, Error& err) {
        if (records_.size() >= maxRecords_) {
            return fail(err, errc::too_many_records, kind, location,
                        "more than " + std::to_string(maxRecords_) + " records");
        }
        // 동일 id 가 두 번 나오면 비교 결과가 정의되지 않으므로 디코딩 단계에서 바로 거부한다.
        if (!ids_.insert(record.id()).second) {
            return fail(err, errc::duplicate_id, kind, location,
                        "duplicate id '" + record.id() + "'", fieldName(Field::Id));
        }
        records_.push_back(std::move(record));
        return true;
    }

    std::size_t size() const noexcept { return records_.size(); }

    void reserve(std::size_t n) { records_.reserve(n); }

    /// @brief Move the accumulated records out
    RecordSequence take() {
        ids_.clear();
        return std::move(records_);
    }

  private:
    std::size_t maxRecords_;
    std::unordered_set<std::string> ids_;
    RecordSequence records_;
};

} // namespace YpBank
