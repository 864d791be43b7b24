#include "ypbank/codec/CsvCodec.hpp"
#include "ypbank/record/FieldText.hpp"

#include <fmt/format.h>

#include <vector>

namespace YpBank {

namespace {

constexpr std::string_view UTF8_BOM = "\xEF\xBB\xBF";

/// @brief One csv row with the physical line it starts on
struct CsvRow {
    std::vector<std::string> cells;
    std::size_t line = 0;
};

/// @brief Pull parser over the whole input
/// @details Rows may span several physical lines when a quoted cell contains line breaks,
///          so splitting on '\n' first is not an option.
class CsvReader {
  public:
    explicit CsvReader(std::string_view input) : in_(input) {
        if (in_.substr(0, UTF8_BOM.size()) == UTF8_BOM)
            pos_ = UTF8_BOM.size();
    }

    /// @brief Read the next non-blank row
    /// @return false at end of input (err clear) or on a syntax error (err set)
    bool next(CsvRow& row, Error& err) {
        err.clear();
        skipBlankLines();
        if (pos_ >= in_.size())
            return false;

        row.cells.clear();
        row.line = line_;

        std::string cell;
        while (true) {
            if (peek() == CsvCodec::QUOTE) {
                if (!readQuoted(cell, err))
                    return false;
            } else if (!readPlain(cell, err)) {
                return false;
            }
            row.cells.push_back(std::move(cell));
            cell.clear();

            if (peek() == CsvCodec::DELIMITER) {
                ++pos_;
                continue;
            }
            consumeLineBreak();
            return true;
        }
    }

  private:
    char peek() const { return pos_ < in_.size() ? in_[pos_] : '\0'; }

    bool atLineBreak() const {
        if (pos_ >= in_.size())
            return true;
        if (in_[pos_] == '\n')
            return true;
        return in_[pos_] == '\r' && (pos_ + 1 == in_.size() || in_[pos_ + 1] == '\n');
    }

    void consumeLineBreak() {
        if (pos_ < in_.size() && in_[pos_] == '\r')
            ++pos_;
        if (pos_ < in_.size() && in_[pos_] == '\n') {
            ++pos_;
            ++line_;
        }
    }

    void skipBlankLines() {
        while (pos_ < in_.size() && atLineBreak())
            consumeLineBreak();
    }

    bool readPlain(std::string& cell, Error& err) {
        while (pos_ < in_.size() && in_[pos_] != CsvCodec::DELIMITER && !atLineBreak()) {
            if (in_[pos_] == CsvCodec::QUOTE)
                return fail(err, errc::syntax_error, LocationKind::Line, line_,
                            "unexpected quote in unquoted field");
            cell.push_back(in_[pos_++]);
        }
        return true;
    }

    bool readQuoted(std::string& cell, Error& err) {
        const std::size_t openLine = line_;
        ++pos_; // opening quote

        while (true) {
            if (pos_ >= in_.size())
                return fail(err, errc::syntax_error, LocationKind::Line, openLine,
                            "unterminated quoted field");
            char c = in_[pos_++];
            if (c == CsvCodec::QUOTE) {
                if (peek() == CsvCodec::QUOTE) {
                    cell.push_back(CsvCodec::QUOTE);
                    ++pos_;
                    continue;
                }
                break;
            }
            // 인용 필드 내부의 CRLF 는 LF 로 정규화한다.
            if (c == '\r' && peek() == '\n')
                continue;
            if (c == '\n')
                ++line_;
            cell.push_back(c);
        }

        if (peek() != CsvCodec::DELIMITER && !atLineBreak())
            return fail(err, errc::syntax_error, LocationKind::Line, line_,
                        "unexpected character after closing quote");
        return true;
    }

    std::string_view in_;
    std::size_t pos_ = 0;
    std::size_t line_ = 1;
};

bool needsQuoting(const std::string& value) {
    return value.find_first_of(",\"\r\n") != std::string::npos;
}

void appendCell(std::string& out, const std::string& value) {
    if (!needsQuoting(value)) {
        out += value;
        return;
    }
    out.push_back(CsvCodec::QUOTE);
    for (char c : value) {
        if (c == CsvCodec::QUOTE)
            out.push_back(CsvCodec::QUOTE);
        out.push_back(c);
    }
    out.push_back(CsvCodec::QUOTE);
}

bool checkHeader(const CsvRow& row, Error& err) {
    if (row.cells.size() != kFieldCount) {
        return fail(err, errc::bad_header, LocationKind::Line, row.line,
                    fmt::format("expected {} columns, got {}", kFieldCount, row.cells.size()));
    }
    for (std::size_t i = 0; i < kFieldCount; ++i) {
        const char* expected = fieldName(kAllFields[i]);
        if (row.cells[i] != expected) {
            return fail(err, errc::bad_header, LocationKind::Line, row.line,
                        fmt::format("column {} is '{}', expected '{}'", i + 1, row.cells[i],
                                    expected));
        }
    }
    return true;
}

} // namespace

std::string CsvCodec::header() {
    std::string out;
    for (std::size_t i = 0; i < kFieldCount; ++i) {
        if (i > 0)
            out.push_back(DELIMITER);
        out += fieldName(kAllFields[i]);
    }
    return out;
}

bool CsvCodec::decode(std::string_view input, RecordSequence& out, Error& err) const {
    out.clear();
    err.clear();

    CsvReader reader(input);
    CsvRow row;

    if (!reader.next(row, err)) {
        if (err)
            return false;
        return fail(err, errc::bad_header, LocationKind::Line, 1, "missing header");
    }
    if (!checkHeader(row, err))
        return false;

    SequenceBuilder builder;
    while (reader.next(row, err)) {
        if (row.cells.size() != kFieldCount) {
            return fail(err, errc::syntax_error, LocationKind::Line, row.line,
                        fmt::format("expected {} fields, got {}", kFieldCount, row.cells.size()));
        }

        FieldValues values;
        for (std::size_t i = 0; i < kFieldCount; ++i)
            values[i] = std::move(row.cells[i]);

        auto record = parseRecord(values, err);
        if (!record) {
            err.at(LocationKind::Line, row.line);
            return false;
        }
        if (!builder.append(std::move(*record), LocationKind::Line, row.line, err))
            return false;
    }
    if (err)
        return false;

    out = builder.take();
    return true;
}

std::string CsvCodec::encode(const RecordSequence& records) const {
    std::string out = header();
    out.push_back('\n');

    for (const auto& r : records) {
        FieldValues values = toFieldValues(r);
        for (std::size_t i = 0; i < kFieldCount; ++i) {
            if (i > 0)
                out.push_back(DELIMITER);
            appendCell(out, values[i]);
        }
        out.push_back('\n');
    }
    return out;
}

} // namespace YpBank
