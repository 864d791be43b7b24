#pragma once
/// @file RecordCodec.hpp
/// @brief Common decode/encode interface of every on-disk representation

#include "../error/Error.hpp"
#include "../record/RecordSequence.hpp"

#include <string>
#include <string_view>

namespace YpBank {

/// @brief Codec interface
/// @details Implementations are stateless; a single instance may be shared and called
///          concurrently on different inputs.
class RecordCodec {
  public:
    virtual ~RecordCodec() = default;

    /// @brief Registry name, e.g. "csv"
    virtual const char* name() const = 0;

    /// @brief Decode a fully-resident buffer
    /// @param input Raw file contents (text or bytes)
    /// @param[out] out Decoded records in input order; left empty on failure
    /// @param[out] err First error encountered (fail-fast)
    /// @return true on success
    virtual bool decode(std::string_view input, RecordSequence& out, Error& err) const = 0;

    /// @brief Encode records in sequence order
    /// @details Cannot fail: Record validation already guarantees that every field value
    ///          fits every format.
    /// @pre records.size() <= MAX_RECORD_COUNT (true for any decoded sequence)
    virtual std::string encode(const RecordSequence& records) const = 0;
};

} // namespace YpBank
