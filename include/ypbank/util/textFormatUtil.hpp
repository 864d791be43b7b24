#pragma once
/// @file textFormatUtil.hpp
/// @brief Strict text helpers shared by the text codecs and the report renderer

#include <cstdint>
#include <limits>
#include <string>
#include <string_view>

namespace YpBank::util {

/// @brief Powers of ten for currency scales 0..4
inline std::int64_t pow10(int scale) noexcept {
    std::int64_t v = 1;
    for (int i = 0; i < scale; ++i)
        v *= 10;
    return v;
}

/// @brief Absolute value of an int64 as uint64, safe for INT64_MIN
inline std::uint64_t absValue(std::int64_t v) noexcept {
    // INT64_MIN 절대값 처리 시 overflow를 피하기 위해 unsigned 경유 계산을 사용한다.
    return (v >= 0) ? static_cast<std::uint64_t>(v) : static_cast<std::uint64_t>(-(v + 1)) + 1;
}

/// @brief Parse a decimal amount into minor units
/// @details Accepts optional sign, at least one integer digit, and for scale > 0 an optional
///          '.' followed by 1..scale digits. Anything else (spaces, exponents, extra fraction
///          digits, overflow) fails.
/// @param[out] reason Set on failure
inline bool parseAmount(std::string_view s, int scale, std::int64_t& out, std::string& reason) {
    std::size_t p = 0;
    bool negative = false;
    if (p < s.size() && (s[p] == '-' || s[p] == '+')) {
        negative = s[p] == '-';
        ++p;
    }

    // 정수부와 소수부를 모두 unsigned로 누적한 뒤 마지막에 부호와 범위를 검증한다.
    std::uint64_t magnitude = 0;
    const std::uint64_t limit =
        negative ? static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()) + 1
                 : static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());

    auto push = [&](char c) {
        const std::uint64_t digit = static_cast<std::uint64_t>(c - '0');
        if (magnitude > (limit - digit) / 10)
            return false;
        magnitude = magnitude * 10 + digit;
        return true;
    };

    const std::size_t intStart = p;
    while (p < s.size() && s[p] >= '0' && s[p] <= '9') {
        if (!push(s[p])) {
            reason = "amount out of range";
            return false;
        }
        ++p;
    }
    if (p == intStart) {
        reason = "expected a decimal number";
        return false;
    }

    int fraction = 0;
    if (p < s.size() && s[p] == '.') {
        if (scale == 0) {
            reason = "currency has no minor unit";
            return false;
        }
        ++p;
        const std::size_t fracStart = p;
        while (p < s.size() && s[p] >= '0' && s[p] <= '9') {
            if (fraction == scale) {
                reason = "too many decimal places";
                return false;
            }
            if (!push(s[p])) {
                reason = "amount out of range";
                return false;
            }
            ++fraction;
            ++p;
        }
        if (p == fracStart) {
            reason = "expected digits after '.'";
            return false;
        }
    }
    if (p != s.size()) {
        reason = "expected a decimal number";
        return false;
    }

    for (; fraction < scale; ++fraction) {
        if (!push('0')) {
            reason = "amount out of range";
            return false;
        }
    }

    if (negative) {
        out = (magnitude == limit) ? std::numeric_limits<std::int64_t>::min()
                                   : -static_cast<std::int64_t>(magnitude);
    } else {
        out = static_cast<std::int64_t>(magnitude);
    }
    return true;
}

/// @brief Render minor units as a decimal string with exactly `scale` fraction digits
/// @details 12345 at scale 2 -> "123.45", -5 at scale 2 -> "-0.05", 1200 at scale 0 -> "1200"
inline std::string formatAmount(std::int64_t minor, int scale) {
    const std::uint64_t absVal = absValue(minor);
    const std::uint64_t unit = static_cast<std::uint64_t>(pow10(scale));

    std::string out;
    if (minor < 0)
        out.push_back('-');
    out += std::to_string(absVal / unit);
    if (scale > 0) {
        std::string frac = std::to_string(absVal % unit);
        out.push_back('.');
        out.append(static_cast<std::size_t>(scale) - frac.size(), '0');
        out += frac;
    }
    return out;
}

/// @brief Escape characters that would break a single-line display of free text
inline std::string escapeString(std::string_view in) {
    std::string o;
    o.reserve(in.size() + 4);
    for (char c : in) {
        if (c == '"' || c == '\\') {
            o.push_back('\\');
            o.push_back(c);
        } else if (c == '\n')
            o += "\\n";
        else if (c == '\t')
            o += "\\t";
        else
            o.push_back(c);
    }
    return o;
}

/// @brief Well-formed UTF-8 check (no overlongs, no surrogates, max U+10FFFF)
inline bool isValidUtf8(std::string_view s) noexcept {
    std::size_t i = 0;
    while (i < s.size()) {
        const auto c = static_cast<unsigned char>(s[i]);
        std::size_t len = 0;
        std::uint32_t cp = 0;
        if (c < 0x80) {
            ++i;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            len = 2;
            cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            len = 3;
            cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            len = 4;
            cp = c & 0x07;
        } else {
            return false;
        }
        if (i + len > s.size())
            return false;
        for (std::size_t k = 1; k < len; ++k) {
            const auto cc = static_cast<unsigned char>(s[i + k]);
            if ((cc & 0xC0) != 0x80)
                return false;
            cp = (cp << 6) | (cc & 0x3F);
        }
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000))
            return false;
        if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
            return false;
        i += len;
    }
    return true;
}

/// @brief Drop one trailing '\r' (CRLF input)
inline std::string_view stripCr(std::string_view line) noexcept {
    if (!line.empty() && line.back() == '\r')
        line.remove_suffix(1);
    return line;
}

/// @brief ASCII lowercase copy
inline std::string toLowerAscii(std::string_view s) {
    std::string o(s);
    for (char& c : o) {
        if (c >= 'A' && c <= 'Z')
            c = static_cast<char>(c - 'A' + 'a');
    }
    return o;
}

} // namespace YpBank::util
