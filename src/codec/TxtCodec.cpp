#include "ypbank/codec/TxtCodec.hpp"
#include "ypbank/record/FieldText.hpp"
#include "ypbank/util/textFormatUtil.hpp"

#include <array>
#include <optional>

namespace YpBank {

namespace {

std::size_t indexOf(Field f) { return static_cast<std::size_t>(f); }

bool isBlankChar(char c) { return c == ' ' || c == '\t'; }

bool isWhitespaceOnly(std::string_view line) {
    for (char c : line) {
        if (!isBlankChar(c))
            return false;
    }
    return true;
}

/// @brief Continuation content: indent removed, then one stuffing dot if present
std::string_view continuationText(std::string_view line) {
    if (line.substr(0, TxtCodec::CONTINUATION_INDENT.size()) == TxtCodec::CONTINUATION_INDENT)
        line.remove_prefix(TxtCodec::CONTINUATION_INDENT.size());
    else
        line.remove_prefix(1);
    if (!line.empty() && line.front() == TxtCodec::STUFFING)
        line.remove_prefix(1);
    return line;
}

/// @brief True when a continuation segment must carry a leading dot
/// @details Empty or whitespace-only lines read as blank lines, and a leading dot would be
///          taken for the stuffing dot.
bool needsStuffing(std::string_view segment) {
    return isWhitespaceOnly(segment) || segment.front() == TxtCodec::STUFFING;
}

std::string_view trimRight(std::string_view s) {
    while (!s.empty() && isBlankChar(s.back()))
        s.remove_suffix(1);
    return s;
}

/// @brief Labels collected for the record being read
struct Block {
    std::array<std::optional<std::string>, kFieldCount> values;
    std::array<std::size_t, kFieldCount> lines{};
    std::size_t startLine = 0;   ///< 0 while no block is open
    std::optional<Field> last;   ///< field that continuation lines extend

    bool open() const { return startLine != 0; }
};

bool finishBlock(Block& block, SequenceBuilder& builder, Error& err) {
    FieldValues values;
    for (Field f : kAllFields) {
        auto& v = block.values[indexOf(f)];
        if (!v)
            return fail(err, errc::missing_field, LocationKind::Line, block.startLine,
                        "missing field", fieldName(f));
        valueOf(values, f) = std::move(*v);
    }

    auto record = parseRecord(values, err);
    if (!record) {
        // 검증 실패 위치는 해당 필드 label 이 있던 줄로 보고한다.
        auto f = fieldFromName(err.field);
        err.at(LocationKind::Line, f ? block.lines[indexOf(*f)] : block.startLine);
        return false;
    }
    if (!builder.append(std::move(*record), LocationKind::Line, block.startLine, err))
        return false;

    block = Block{};
    return true;
}

void appendField(std::string& out, Field field, const std::string& value) {
    out += fieldName(field);
    out.push_back(':');

    std::size_t start = 0;
    std::size_t nl = value.find('\n');
    std::string_view first = std::string_view(value).substr(0, nl);
    if (!first.empty()) {
        out.push_back(' ');
        out += first;
    }
    out.push_back('\n');

    // 이후 줄은 들여쓰기된 continuation line 으로 기록한다.
    while (nl != std::string::npos) {
        start = nl + 1;
        nl = value.find('\n', start);
        const std::string_view segment =
            std::string_view(value).substr(start, nl == std::string::npos ? nl : nl - start);
        out += TxtCodec::CONTINUATION_INDENT;
        if (needsStuffing(segment))
            out.push_back(TxtCodec::STUFFING);
        out += segment;
        out.push_back('\n');
    }
}

} // namespace

bool TxtCodec::decode(std::string_view input, RecordSequence& out, Error& err) const {
    out.clear();
    err.clear();

    SequenceBuilder builder;
    Block block;
    std::size_t lineNo = 0;
    std::size_t pos = 0;

    while (pos < input.size()) {
        const std::size_t nl = input.find('\n', pos);
        std::string_view line =
            input.substr(pos, nl == std::string_view::npos ? std::string_view::npos : nl - pos);
        pos = (nl == std::string_view::npos) ? input.size() : nl + 1;
        ++lineNo;
        line = util::stripCr(line);

        // 공백만 있는 줄도 빈 줄과 같이 블록을 끝낸다.
        if (isWhitespaceOnly(line)) {
            if (block.open() && !finishBlock(block, builder, err))
                return false;
            continue;
        }
        if (line.front() == COMMENT)
            continue;

        if (isBlankChar(line.front())) {
            if (!block.open())
                return fail(err, errc::syntax_error, LocationKind::Line, lineNo,
                            "continuation line outside a record");
            auto& value = block.values[indexOf(*block.last)];
            value->push_back('\n');
            value->append(continuationText(line));
            continue;
        }

        const std::size_t colon = line.find(':');
        if (colon == std::string_view::npos)
            return fail(err, errc::syntax_error, LocationKind::Line, lineNo,
                        "expected 'LABEL: value'");

        const std::string_view key = trimRight(line.substr(0, colon));
        const auto field = fieldFromName(key);
        if (!field)
            return fail(err, errc::unknown_field, LocationKind::Line, lineNo, "unknown field",
                        std::string(key));

        if (!block.open())
            block.startLine = lineNo;

        auto& slot = block.values[indexOf(*field)];
        if (slot)
            return fail(err, errc::duplicate_field, LocationKind::Line, lineNo,
                        "duplicate field", std::string(key));

        std::string_view value = line.substr(colon + 1);
        if (!value.empty() && value.front() == ' ')
            value.remove_prefix(1);
        slot = std::string(value);
        block.lines[indexOf(*field)] = lineNo;
        block.last = field;
    }

    if (block.open() && !finishBlock(block, builder, err))
        return false;

    out = builder.take();
    return true;
}

std::string TxtCodec::encode(const RecordSequence& records) const {
    std::string out;
    for (std::size_t i = 0; i < records.size(); ++i) {
        if (i > 0)
            out.push_back('\n');
        const FieldValues values = toFieldValues(records[i]);
        for (Field f : kAllFields)
            appendField(out, f, valueOf(values, f));
    }
    return out;
}

} // namespace YpBank
