#include "ypbank/record/Record.hpp"
#include "ypbank/record/Currency.hpp"
#include "ypbank/util/textFormatUtil.hpp"

namespace YpBank {

namespace {

bool invalid(Error& err, Field field, const char* reason) {
    return fail(err, errc::invalid_value, LocationKind::None, 0, reason, fieldName(field));
}

// 자유 텍스트(counterparty/description) 공통 규칙:
// - UTF-8 형식이어야 하고 바이너리 길이 prefix(2바이트)에 들어가야 한다.
// - '\r' 과 NUL 은 어떤 텍스트 포맷에서도 손실 없이 왕복할 수 없으므로 거부한다.
bool checkFreeText(const std::string& value, Field field, Error& err) {
    if (value.size() > MAX_TEXT_FIELD_LEN)
        return invalid(err, field, "longer than 65535 bytes");
    if (!util::isValidUtf8(value))
        return invalid(err, field, "invalid UTF-8");
    for (char c : value) {
        if (c == '\r')
            return invalid(err, field, "carriage return not allowed");
        if (c == '\0')
            return invalid(err, field, "NUL character not allowed");
    }
    return true;
}

} // namespace

const char* fieldName(Field field) noexcept {
    switch (field) {
    case Field::Id:
        return "ID";
    case Field::OccurredAt:
        return "OCCURRED_AT";
    case Field::Amount:
        return "AMOUNT";
    case Field::Currency:
        return "CURRENCY";
    case Field::Counterparty:
        return "COUNTERPARTY";
    case Field::Description:
        return "DESCRIPTION";
    case Field::OperationType:
        return "OPERATION_TYPE";
    }
    return "";
}

std::optional<Field> fieldFromName(std::string_view name) {
    for (Field f : kAllFields) {
        if (name == fieldName(f))
            return f;
    }
    return std::nullopt;
}

bool Record::validate(const RecordFields& f, Error& err) {
    err.clear();

    if (f.id.empty())
        return invalid(err, Field::Id, "must not be empty");
    if (f.id.size() > MAX_TEXT_FIELD_LEN)
        return invalid(err, Field::Id, "longer than 65535 bytes");
    if (!util::isValidUtf8(f.id))
        return invalid(err, Field::Id, "invalid UTF-8");
    for (char c : f.id) {
        const auto u = static_cast<unsigned char>(c);
        if (u < 0x20 || u == 0x7F)
            return invalid(err, Field::Id, "control characters not allowed");
    }

    if (!f.occurredAt.valid())
        return invalid(err, Field::OccurredAt, "not a valid date in 0001-01-01..9999-12-31");

    if (!isCurrencyCode(f.currency))
        return invalid(err, Field::Currency, "must be three uppercase letters");

    if (!checkFreeText(f.counterparty, Field::Counterparty, err))
        return false;
    if (!checkFreeText(f.description, Field::Description, err))
        return false;

    // enum class 라도 static_cast 로 범위 밖 값이 들어올 수 있으므로 tag 범위를 다시 확인한다.
    if (!operationTypeFromTag(toTag(f.operationType)))
        return invalid(err, Field::OperationType, "unknown operation type");

    return true;
}

std::optional<Record> Record::create(RecordFields fields, Error& err) {
    if (!validate(fields, err))
        return std::nullopt;
    return Record(std::move(fields));
}

int Record::scale() const noexcept { return currencyScale(f_.currency); }

bool Record::sameField(const Record& other, Field field) const noexcept {
    const RecordFields& a = f_;
    const RecordFields& b = other.f_;
    switch (field) {
    case Field::Id:
        return a.id == b.id;
    case Field::OccurredAt:
        return a.occurredAt == b.occurredAt;
    case Field::Amount:
        return a.amount == b.amount;
    case Field::Currency:
        return a.currency == b.currency;
    case Field::Counterparty:
        return a.counterparty == b.counterparty;
    case Field::Description:
        return a.description == b.description;
    case Field::OperationType:
        return a.operationType == b.operationType;
    }
    return false;
}

std::vector<Field> Record::differingFields(const Record& other) const {
    std::vector<Field> out;
    for (Field f : kAllFields) {
        if (!sameField(other, f))
            out.push_back(f);
    }
    return out;
}

bool operator==(const Record& a, const Record& b) noexcept {
    for (Field f : kAllFields) {
        if (!a.sameField(b, f))
            return false;
    }
    return true;
}

} // namespace YpBank
