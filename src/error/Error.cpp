#include "ypbank/error/Error.hpp"

#include <fmt/format.h>

namespace YpBank {

namespace {

class YpBankCategory final : public std::error_category {
  public:
    const char* name() const noexcept override { return "ypbank"; }

    std::string message(int value) const override {
        switch (static_cast<errc>(value)) {
        case errc::success:
            return "success";
        case errc::syntax_error:
            return "syntax error";
        case errc::bad_header:
            return "bad header";
        case errc::unknown_field:
            return "unknown field";
        case errc::missing_field:
            return "missing field";
        case errc::duplicate_field:
            return "duplicate field";
        case errc::unexpected_eof:
            return "unexpected end of input";
        case errc::trailing_data:
            return "trailing data";
        case errc::bad_magic:
            return "bad magic";
        case errc::unsupported_version:
            return "unsupported version";
        case errc::invalid_value:
            return "invalid value";
        case errc::duplicate_id:
            return "duplicate id";
        case errc::too_many_records:
            return "too many records";
        case errc::unknown_format:
            return "unknown format";
        }
        return "unknown ypbank error";
    }

    // 하나의 code가 여러 condition에 동시에 속할 수 있다.
    // (예: unsupported_version 은 parse_error 이면서 unsupported_version)
    bool equivalent(int value, const std::error_condition& cond) const noexcept override {
        if (cond.category() != ypbank_kind_category())
            return false;

        const auto e = static_cast<errc>(value);
        switch (static_cast<ErrorKind>(cond.value())) {
        case ErrorKind::parse_error:
            return e == errc::syntax_error || e == errc::bad_header || e == errc::unknown_field ||
                   e == errc::missing_field || e == errc::duplicate_field ||
                   e == errc::unexpected_eof || e == errc::trailing_data ||
                   e == errc::bad_magic || e == errc::unsupported_version;
        case ErrorKind::validation_error:
            return e == errc::invalid_value || e == errc::duplicate_id ||
                   e == errc::too_many_records;
        case ErrorKind::duplicate_key:
            return e == errc::duplicate_id;
        case ErrorKind::unsupported_version:
            return e == errc::unsupported_version;
        }
        return false;
    }
};

class YpBankKindCategory final : public std::error_category {
  public:
    const char* name() const noexcept override { return "ypbank-kind"; }

    std::string message(int value) const override {
        switch (static_cast<ErrorKind>(value)) {
        case ErrorKind::parse_error:
            return "parse error";
        case ErrorKind::validation_error:
            return "validation error";
        case ErrorKind::duplicate_key:
            return "duplicate key";
        case ErrorKind::unsupported_version:
            return "unsupported version";
        }
        return "unknown error kind";
    }
};

const char* locationLabel(LocationKind kind) {
    switch (kind) {
    case LocationKind::Line:
        return "line";
    case LocationKind::Offset:
        return "offset";
    case LocationKind::Record:
        return "record";
    case LocationKind::None:
        break;
    }
    return "";
}

} // namespace

const std::error_category& ypbank_category() noexcept {
    static const YpBankCategory instance;
    return instance;
}

const std::error_category& ypbank_kind_category() noexcept {
    static const YpBankKindCategory instance;
    return instance;
}

std::string Error::message() const {
    if (!code)
        return "success";

    std::string out;
    if (locationKind != LocationKind::None)
        out = fmt::format("{} {}: ", locationLabel(locationKind), location);
    if (!field.empty())
        out += fmt::format("{}: ", field);
    out += reason.empty() ? code.message() : reason;

    // errno 기반 I/O 오류는 원인 문자열(strerror)을 덧붙여야 진단이 가능하다.
    if (code.category() != ypbank_category() && !reason.empty())
        out += fmt::format(" ({})", code.message());
    return out;
}

} // namespace YpBank
