#pragma once
/// @file CsvCodec.hpp
/// @brief Delimited tabular text representation (RFC 4180 quoting)

#include "RecordCodec.hpp"

namespace YpBank {

/// @brief Csv codec
/// @details
/// - Header row: `ID,OCCURRED_AT,AMOUNT,CURRENCY,COUNTERPARTY,DESCRIPTION,OPERATION_TYPE`
/// - Values containing `,` `"` or a line break are quoted, embedded quotes doubled.
/// - Errors carry the 1-based physical line of the offending row.
class CsvCodec final : public RecordCodec {
  public:
    static constexpr char DELIMITER = ',';
    static constexpr char QUOTE = '"';

    const char* name() const override { return "csv"; }
    bool decode(std::string_view input, RecordSequence& out, Error& err) const override;
    std::string encode(const RecordSequence& records) const override;

    /// @brief The canonical header line (without line terminator)
    static std::string header();
};

} // namespace YpBank
