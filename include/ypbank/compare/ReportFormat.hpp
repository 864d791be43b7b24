#pragma once
/// @file ReportFormat.hpp
/// @brief Human-readable rendering of a DiffReport

#include "Comparer.hpp"

#include <string>

namespace YpBank {

/// @brief Names shown for the two compared inputs (usually file paths)
struct ReportLabels {
    std::string left;
    std::string right;
};

/// @brief One-line summary of a record, id and free text quoted and escaped
/// @details e.g. `"TX-1" 2024-03-01 -12.50 EUR "Cafe" "coffee" DEBIT`
std::string formatRecordLine(const Record& record);

/// @brief Field value as shown in a report (quoted and escaped for id and free-text fields)
std::string formatReportValue(Field field, const std::string& text);

/// @brief Render the report, one '\n'-terminated line per entry
/// @details Identical inputs give a single sentence. Otherwise a summary line is followed
///          by `- ` (removed), `+ ` (added) and `~ "id"` (changed) lines; each changed record
///          lists its fields as `    LABEL: left -> right`.
std::string formatDiffReport(const DiffReport& report, const ReportLabels& labels);

} // namespace YpBank
