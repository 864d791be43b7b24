#pragma once
/// @file FieldText.hpp
/// @brief Text form of record fields, shared by the csv and txt codecs and the report

#include "Record.hpp"

#include <array>
#include <optional>
#include <string>

namespace YpBank {

/// @brief Text values of the seven fields, indexed by Field in canonical order
using FieldValues = std::array<std::string, kFieldCount>;

inline std::string& valueOf(FieldValues& values, Field field) {
    return values[static_cast<std::size_t>(field)];
}

inline const std::string& valueOf(const FieldValues& values, Field field) {
    return values[static_cast<std::size_t>(field)];
}

/// @brief Canonical text of one field (amount with the currency's scale, ISO date, ...)
std::string formatField(const Record& record, Field field);

/// @brief Serialize a record to its seven text values
/// @details Counterpart of parseRecord; the pair round-trips every valid record.
FieldValues toFieldValues(const Record& record);

/// @brief Parse seven text values and validate them into a Record
/// @param[out] err ValidationError with Error::field naming the offending field. No location
///                 is attached; the calling codec knows the line.
std::optional<Record> parseRecord(const FieldValues& values, Error& err);

} // namespace YpBank
