#pragma once
/// @file OccurredAt.hpp
/// @brief Calendar date with optional time of day

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace YpBank {

/// @brief Seconds in one day
constexpr std::int32_t SECONDS_PER_DAY = 86400;

/// @brief When an operation took place
/// @details Stored as days since 1970-01-01 (proleptic Gregorian) and, when the source gave
///          a time, seconds since midnight. Text form: `YYYY-MM-DD` or `YYYY-MM-DDTHH:MM:SS`.
struct OccurredAt {
    std::int32_t days = 0;               ///< days since 1970-01-01, may be negative
    std::optional<std::int32_t> seconds; ///< seconds since midnight, absent for date-only

    /// @brief Build from civil date and optional time; no range checking
    static OccurredAt fromCivil(int year, unsigned month, unsigned day);
    static OccurredAt fromCivil(int year, unsigned month, unsigned day, int hour, int minute,
                                int second);

    /// @brief True when the value lies in 0001-01-01 .. 9999-12-31 and seconds are in range
    bool valid() const noexcept;

    friend bool operator==(const OccurredAt& a, const OccurredAt& b) {
        return a.days == b.days && a.seconds == b.seconds;
    }
    friend bool operator!=(const OccurredAt& a, const OccurredAt& b) { return !(a == b); }

    /// @brief Total order: day first, date-only before timed values of the same day
    friend bool operator<(const OccurredAt& a, const OccurredAt& b) {
        if (a.days != b.days)
            return a.days < b.days;
        return a.seconds < b.seconds; // nullopt < any value
    }
};

/// @brief Days since 1970-01-01 for a civil date (Howard Hinnant's days_from_civil)
std::int32_t daysFromCivil(int year, unsigned month, unsigned day) noexcept;

/// @brief Inverse of daysFromCivil
void civilFromDays(std::int32_t days, int& year, unsigned& month, unsigned& day) noexcept;

/// @brief True for an existing Gregorian calendar day
bool isValidCivilDate(int year, unsigned month, unsigned day) noexcept;

/// @brief Parse `YYYY-MM-DD` or `YYYY-MM-DDTHH:MM:SS`
/// @param[out] reason Set on failure
bool parseOccurredAt(std::string_view text, OccurredAt& out, std::string& reason);

/// @brief Canonical text form
std::string formatOccurredAt(const OccurredAt& value);

} // namespace YpBank
