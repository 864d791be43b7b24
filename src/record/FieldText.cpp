#include "ypbank/record/FieldText.hpp"
#include "ypbank/record/Currency.hpp"
#include "ypbank/util/textFormatUtil.hpp"

#include <fmt/format.h>

namespace YpBank {

std::string formatField(const Record& record, Field field) {
    switch (field) {
    case Field::Id:
        return record.id();
    case Field::OccurredAt:
        return formatOccurredAt(record.occurredAt());
    case Field::Amount:
        return util::formatAmount(record.amount(), record.scale());
    case Field::Currency:
        return record.currency();
    case Field::Counterparty:
        return record.counterparty();
    case Field::Description:
        return record.description();
    case Field::OperationType:
        return toString(record.operationType());
    }
    return {};
}

FieldValues toFieldValues(const Record& record) {
    FieldValues out;
    for (Field f : kAllFields)
        valueOf(out, f) = formatField(record, f);
    return out;
}

std::optional<Record> parseRecord(const FieldValues& values, Error& err) {
    err.clear();
    RecordFields f;
    std::string reason;

    f.id = valueOf(values, Field::Id);

    if (!parseOccurredAt(valueOf(values, Field::OccurredAt), f.occurredAt, reason)) {
        fail(err, errc::invalid_value, LocationKind::None, 0, reason,
             fieldName(Field::OccurredAt));
        return std::nullopt;
    }

    // amount 의 scale 은 currency 에 의해 결정되므로 currency 를 먼저 검증한다.
    f.currency = valueOf(values, Field::Currency);
    if (!isCurrencyCode(f.currency)) {
        fail(err, errc::invalid_value, LocationKind::None, 0, "must be three uppercase letters",
             fieldName(Field::Currency));
        return std::nullopt;
    }
    if (!util::parseAmount(valueOf(values, Field::Amount), currencyScale(f.currency), f.amount,
                           reason)) {
        fail(err, errc::invalid_value, LocationKind::None, 0,
             fmt::format("{} for {}", reason, f.currency), fieldName(Field::Amount));
        return std::nullopt;
    }

    f.counterparty = valueOf(values, Field::Counterparty);
    f.description = valueOf(values, Field::Description);

    auto type = operationTypeFromString(valueOf(values, Field::OperationType));
    if (!type) {
        fail(err, errc::invalid_value, LocationKind::None, 0,
             fmt::format("unknown operation type '{}'", valueOf(values, Field::OperationType)),
             fieldName(Field::OperationType));
        return std::nullopt;
    }
    f.operationType = *type;

    return Record::create(std::move(f), err);
}

} // namespace YpBank
