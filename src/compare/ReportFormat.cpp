#include "ypbank/compare/ReportFormat.hpp"
#include "ypbank/record/FieldText.hpp"
#include "ypbank/util/textFormatUtil.hpp"

#include <fmt/format.h>

#include <iterator>

namespace YpBank {

namespace {

// id 에도 공백이 들어갈 수 있으므로 자유 텍스트와 같이 따옴표로 감싼다.
bool isQuoted(Field field) {
    return field == Field::Id || field == Field::Counterparty || field == Field::Description;
}

} // namespace

std::string formatReportValue(Field field, const std::string& text) {
    if (isQuoted(field))
        return fmt::format("\"{}\"", util::escapeString(text));
    return text;
}

std::string formatRecordLine(const Record& record) {
    std::string out;
    for (Field f : kAllFields) {
        if (!out.empty())
            out.push_back(' ');
        out += formatReportValue(f, formatField(record, f));
    }
    return out;
}

std::string formatDiffReport(const DiffReport& report, const ReportLabels& labels) {
    fmt::memory_buffer buf;
    auto out = std::back_inserter(buf);

    if (report.identical()) {
        fmt::format_to(out, "The records in '{}' and '{}' are identical ({} records).\n",
                       labels.left, labels.right, report.unchangedCount);
        return fmt::to_string(buf);
    }

    fmt::format_to(out,
                   "The records in '{}' and '{}' differ: {} removed, {} added, {} changed, "
                   "{} unchanged.\n",
                   labels.left, labels.right, report.removed.size(), report.added.size(),
                   report.changed.size(), report.unchangedCount);

    for (const auto& r : report.removed)
        fmt::format_to(out, "- {}\n", formatRecordLine(r));
    for (const auto& r : report.added)
        fmt::format_to(out, "+ {}\n", formatRecordLine(r));
    for (const auto& c : report.changed) {
        fmt::format_to(out, "~ {}\n", formatReportValue(Field::Id, c.id));
        for (const auto& d : c.fields) {
            fmt::format_to(out, "    {}: {} -> {}\n", fieldName(d.field),
                           formatReportValue(d.field, d.left), formatReportValue(d.field, d.right));
        }
    }
    return fmt::to_string(buf);
}

} // namespace YpBank
