#include "ypbank/compare/Comparer.hpp"
#include "ypbank/record/FieldText.hpp"

#include <fmt/format.h>

#include <map>
#include <string_view>

namespace YpBank {

namespace {

using RecordIndex = std::map<std::string_view, const Record*>;

bool buildIndex(const RecordSequence& records, const char* side, RecordIndex& index,
                Error& err) {
    for (std::size_t i = 0; i < records.size(); ++i) {
        const Record& r = records[i];
        if (!index.emplace(r.id(), &r).second) {
            return fail(err, errc::duplicate_id, LocationKind::Record, i + 1,
                        fmt::format("duplicate id '{}' in {} sequence", r.id(), side),
                        fieldName(Field::Id));
        }
    }
    return true;
}

ChangedRecord diffRecords(const Record& left, const Record& right) {
    ChangedRecord changed;
    changed.id = left.id();
    for (Field f : left.differingFields(right))
        changed.fields.push_back(FieldDiff{f, formatField(left, f), formatField(right, f)});
    return changed;
}

} // namespace

bool compare(const RecordSequence& left, const RecordSequence& right, DiffReport& report,
             Error& err) {
    report = DiffReport{};
    err.clear();

    RecordIndex l;
    RecordIndex r;
    if (!buildIndex(left, "left", l, err) || !buildIndex(right, "right", r, err))
        return false;

    // 두 인덱스 모두 id 순으로 정렬되어 있으므로 병합하면서 분류한다.
    auto li = l.begin();
    auto ri = r.begin();
    while (li != l.end() || ri != r.end()) {
        if (ri == r.end() || (li != l.end() && li->first < ri->first)) {
            report.removed.push_back(*li->second);
            ++li;
        } else if (li == l.end() || ri->first < li->first) {
            report.added.push_back(*ri->second);
            ++ri;
        } else {
            if (*li->second == *ri->second)
                ++report.unchangedCount;
            else
                report.changed.push_back(diffRecords(*li->second, *ri->second));
            ++li;
            ++ri;
        }
    }
    return true;
}

} // namespace YpBank
