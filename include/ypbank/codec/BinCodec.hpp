#pragma once
/// @file BinCodec.hpp
/// @brief Compact binary representation with magic and version header

#include "RecordCodec.hpp"

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace YpBank {

/// @brief Bin codec (layout version 1, all integers little-endian)
/// @details
/// Header (9 bytes):
/// | offset | size | content                  |
/// |--------|------|--------------------------|
/// | 0      | 4    | magic "YPBN"             |
/// | 4      | 1    | version (1)              |
/// | 5      | 4    | record count (unsigned)  |
///
/// The u32 count bounds every sequence to MAX_RECORD_COUNT records.
///
/// Record:
/// - id: u16 length + bytes
/// - occurred_at: i32 days since 1970-01-01, i32 seconds since midnight (-1 = date only)
/// - amount: i64 minor units
/// - currency: 3 bytes
/// - operation_type: u8 tag
/// - counterparty, description: u16 length + UTF-8 bytes
///
/// Errors carry the byte offset of the failing read.
class BinCodec final : public RecordCodec {
  public:
    static constexpr std::string_view MAGIC = "YPBN";
    static constexpr std::uint8_t VERSION = 1;
    static constexpr std::size_t HEADER_SIZE = 9;
    /// @brief Smallest encoded record (all strings empty)
    static constexpr std::size_t MIN_RECORD_SIZE = 2 + 4 + 4 + 8 + 3 + 1 + 2 + 2;
    /// @brief seconds value stored for a date-only occurred_at
    static constexpr std::int32_t NO_TIME = -1;

    const char* name() const override { return "bin"; }
    bool decode(std::string_view input, RecordSequence& out, Error& err) const override;
    std::string encode(const RecordSequence& records) const override;
};

} // namespace YpBank
