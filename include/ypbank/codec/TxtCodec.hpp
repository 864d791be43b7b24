#pragma once
/// @file TxtCodec.hpp
/// @brief Descriptive text representation: one labeled block per record

#include "RecordCodec.hpp"

namespace YpBank {

/// @brief Txt codec
/// @details Block format (blocks separated by one blank line):
/// @code
/// ID: TX-1
/// OCCURRED_AT: 2024-03-01T09:30:00
/// AMOUNT: -12.50
/// CURRENCY: EUR
/// COUNTERPARTY: Cafe Central
/// DESCRIPTION: first line
///   second line
/// OPERATION_TYPE: DEBIT
/// @endcode
/// Continuation lines start with whitespace; the encoder indents them by two spaces. A line
/// holding only whitespace is a blank line and ends the block, so an empty or whitespace-only
/// continuation segment, or one starting with '.', is written with a leading '.' that the
/// decoder drops (`  .` is an empty line of the value). Lines starting with '#' are comments.
class TxtCodec final : public RecordCodec {
  public:
    static constexpr std::string_view CONTINUATION_INDENT = "  ";
    static constexpr char COMMENT = '#';
    static constexpr char STUFFING = '.';

    const char* name() const override { return "txt"; }
    bool decode(std::string_view input, RecordSequence& out, Error& err) const override;
    std::string encode(const RecordSequence& records) const override;
};

} // namespace YpBank
