#include "ypbank/codec/BinCodec.hpp"
#include "ypbank/record/Currency.hpp"
#include "ypbank/util/ByteOrder.hpp"

#include <fmt/format.h>

#include <algorithm>

namespace YpBank {

namespace {

bool truncated(Error& err, std::size_t offset) {
    return fail(err, errc::unexpected_eof, LocationKind::Offset, offset,
                "unexpected end of input");
}

bool readString(util::ByteReader& in, std::string& out, Error& err) {
    std::uint16_t len = 0;
    if (!in.readU16LE(len))
        return truncated(err, in.offset());
    if (!in.readBytes(len, out))
        return truncated(err, in.offset());
    return true;
}

void putString(std::string& out, const std::string& s) {
    // Record 검증에서 MAX_TEXT_FIELD_LEN 이하가 보장된다.
    util::putU16LE(out, static_cast<std::uint16_t>(s.size()));
    out += s;
}

/// @brief Read one record starting at the reader's current offset
bool readRecord(util::ByteReader& in, SequenceBuilder& builder, Error& err) {
    const std::size_t start = in.offset();
    RecordFields f;
    std::int32_t seconds = 0;
    std::uint8_t tag = 0;

    if (!readString(in, f.id, err))
        return false;
    if (!in.readI32LE(f.occurredAt.days))
        return truncated(err, in.offset());
    if (!in.readI32LE(seconds))
        return truncated(err, in.offset());
    if (seconds != BinCodec::NO_TIME)
        f.occurredAt.seconds = seconds;
    if (!in.readI64LE(f.amount))
        return truncated(err, in.offset());
    if (!in.readBytes(CURRENCY_CODE_LEN, f.currency))
        return truncated(err, in.offset());

    const std::size_t tagOffset = in.offset();
    if (!in.readU8(tag))
        return truncated(err, tagOffset);
    auto type = operationTypeFromTag(tag);
    if (!type)
        return fail(err, errc::invalid_value, LocationKind::Offset, tagOffset,
                    fmt::format("unknown operation type tag {}", tag),
                    fieldName(Field::OperationType));
    f.operationType = *type;

    if (!readString(in, f.counterparty, err))
        return false;
    if (!readString(in, f.description, err))
        return false;

    auto record = Record::create(std::move(f), err);
    if (!record) {
        err.at(LocationKind::Offset, start);
        return false;
    }
    return builder.append(std::move(*record), LocationKind::Offset, start, err);
}

} // namespace

bool BinCodec::decode(std::string_view input, RecordSequence& out, Error& err) const {
    out.clear();
    err.clear();

    util::ByteReader in(input);
    std::string magic;
    if (!in.readBytes(MAGIC.size(), magic)) {
        // magic 의 앞부분만 있는 입력은 잘린 파일로 본다.
        if (MAGIC.substr(0, input.size()) == input)
            return truncated(err, 0);
        return fail(err, errc::bad_magic, LocationKind::Offset, 0, "bad magic");
    }
    if (magic != MAGIC)
        return fail(err, errc::bad_magic, LocationKind::Offset, 0, "bad magic");

    std::uint8_t version = 0;
    if (!in.readU8(version))
        return truncated(err, in.offset());
    if (version != VERSION)
        return fail(err, errc::unsupported_version, LocationKind::Offset, 0,
                    "unsupported version");

    std::uint32_t count = 0;
    if (!in.readU32LE(count))
        return truncated(err, in.offset());

    SequenceBuilder builder;
    // count 는 신뢰할 수 없는 값이므로 남은 바이트로 만들 수 있는 최대 개수로 제한한다.
    builder.reserve(std::min<std::size_t>(count, in.remaining() / MIN_RECORD_SIZE));

    for (std::uint32_t i = 0; i < count; ++i) {
        if (!readRecord(in, builder, err))
            return false;
    }
    if (!in.atEnd())
        return fail(err, errc::trailing_data, LocationKind::Offset, in.offset(), "trailing data");

    out = builder.take();
    return true;
}

std::string BinCodec::encode(const RecordSequence& records) const {
    std::string out;
    out.reserve(HEADER_SIZE + records.size() * (MIN_RECORD_SIZE + 32));

    out += MAGIC;
    util::putU8(out, VERSION);
    // 디코더가 만든 시퀀스는 MAX_RECORD_COUNT 를 넘지 않는다.
    util::putU32LE(out, static_cast<std::uint32_t>(records.size()));

    for (const auto& r : records) {
        const OccurredAt& at = r.occurredAt();
        putString(out, r.id());
        util::putI32LE(out, at.days);
        util::putI32LE(out, at.seconds ? *at.seconds : NO_TIME);
        util::putI64LE(out, r.amount());
        out += r.currency();
        util::putU8(out, toTag(r.operationType()));
        putString(out, r.counterparty());
        putString(out, r.description());
    }
    return out;
}

} // namespace YpBank
