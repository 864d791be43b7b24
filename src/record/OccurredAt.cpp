#include "ypbank/record/OccurredAt.hpp"

#include <fmt/format.h>

namespace YpBank {

namespace {

constexpr int MIN_YEAR = 1;
constexpr int MAX_YEAR = 9999;

bool isLeap(int y) noexcept { return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0; }

unsigned lastDayOfMonth(int y, unsigned m) noexcept {
    static constexpr unsigned kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    return (m == 2 && isLeap(y)) ? 29u : kDays[m - 1];
}

// 고정 폭 숫자 필드만 허용한다. 부호/공백이 섞이면 즉시 실패.
bool readDigits(std::string_view s, std::size_t pos, std::size_t len, int& out) {
    if (pos + len > s.size())
        return false;
    int v = 0;
    for (std::size_t i = pos; i < pos + len; ++i) {
        char c = s[i];
        if (c < '0' || c > '9')
            return false;
        v = v * 10 + (c - '0');
    }
    out = v;
    return true;
}

} // namespace

std::int32_t daysFromCivil(int y, unsigned m, unsigned d) noexcept {
    y -= m <= 2;
    const int era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int>(doe) - 719468;
}

void civilFromDays(std::int32_t z, int& year, unsigned& month, unsigned& day) noexcept {
    z += 719468;
    const int era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const int y = static_cast<int>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    day = doy - (153 * mp + 2) / 5 + 1;
    month = mp < 10 ? mp + 3 : mp - 9;
    year = y + (month <= 2);
}

bool isValidCivilDate(int year, unsigned month, unsigned day) noexcept {
    if (year < MIN_YEAR || year > MAX_YEAR)
        return false;
    if (month < 1 || month > 12)
        return false;
    return day >= 1 && day <= lastDayOfMonth(year, month);
}

OccurredAt OccurredAt::fromCivil(int year, unsigned month, unsigned day) {
    OccurredAt v;
    v.days = daysFromCivil(year, month, day);
    return v;
}

OccurredAt OccurredAt::fromCivil(int year, unsigned month, unsigned day, int hour, int minute,
                                 int second) {
    OccurredAt v = fromCivil(year, month, day);
    v.seconds = hour * 3600 + minute * 60 + second;
    return v;
}

bool OccurredAt::valid() const noexcept {
    if (days < daysFromCivil(MIN_YEAR, 1, 1) || days > daysFromCivil(MAX_YEAR, 12, 31))
        return false;
    if (seconds && (*seconds < 0 || *seconds >= SECONDS_PER_DAY))
        return false;
    return true;
}

bool parseOccurredAt(std::string_view text, OccurredAt& out, std::string& reason) {
    // 허용 형식: YYYY-MM-DD (10자) 또는 YYYY-MM-DDTHH:MM:SS (19자)
    if (text.size() != 10 && text.size() != 19) {
        reason = "expected YYYY-MM-DD or YYYY-MM-DDTHH:MM:SS";
        return false;
    }

    int y = 0, m = 0, d = 0;
    if (!readDigits(text, 0, 4, y) || text[4] != '-' || !readDigits(text, 5, 2, m) ||
        text[7] != '-' || !readDigits(text, 8, 2, d)) {
        reason = "expected YYYY-MM-DD or YYYY-MM-DDTHH:MM:SS";
        return false;
    }
    if (!isValidCivilDate(y, static_cast<unsigned>(m), static_cast<unsigned>(d))) {
        reason = "not a valid calendar date";
        return false;
    }

    OccurredAt v = OccurredAt::fromCivil(y, static_cast<unsigned>(m), static_cast<unsigned>(d));

    if (text.size() == 19) {
        int hh = 0, mm = 0, ss = 0;
        if (text[10] != 'T' || !readDigits(text, 11, 2, hh) || text[13] != ':' ||
            !readDigits(text, 14, 2, mm) || text[16] != ':' || !readDigits(text, 17, 2, ss)) {
            reason = "expected YYYY-MM-DD or YYYY-MM-DDTHH:MM:SS";
            return false;
        }
        if (hh > 23 || mm > 59 || ss > 59) {
            reason = "not a valid time of day";
            return false;
        }
        v.seconds = hh * 3600 + mm * 60 + ss;
    }

    out = v;
    return true;
}

std::string formatOccurredAt(const OccurredAt& value) {
    int y = 0;
    unsigned m = 0, d = 0;
    civilFromDays(value.days, y, m, d);
    if (!value.seconds)
        return fmt::format("{:04}-{:02}-{:02}", y, m, d);

    const int s = *value.seconds;
    return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}", y, m, d, s / 3600, (s / 60) % 60,
                       s % 60);
}

} // namespace YpBank
