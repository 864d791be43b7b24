#pragma once
/// @file Error.hpp
/// @brief Error codes, error conditions and the structured Error value

#include <cstddef>
#include <string>
#include <system_error>
#include <type_traits>
#include <utility>

namespace YpBank {

/// @brief Library error codes (YpBank error category)
/// @details Fine-grained codes. Callers usually test the coarser ErrorKind
///          conditions instead: `err.code == ErrorKind::parse_error`.
enum class errc {
    success = 0,
    syntax_error,        ///< malformed row/line structure
    bad_header,          ///< csv header row missing or not the canonical one
    unknown_field,       ///< txt label not recognized
    missing_field,       ///< txt block lacks a required label
    duplicate_field,     ///< txt label repeated within one block
    unexpected_eof,      ///< binary input truncated
    trailing_data,       ///< bytes left after the last binary record
    bad_magic,           ///< binary magic constant mismatch
    unsupported_version, ///< binary version not supported
    invalid_value,       ///< field value failed Record validation
    duplicate_id,        ///< id repeated within one sequence
    too_many_records,    ///< sequence longer than MAX_RECORD_COUNT
    unknown_format,      ///< no codec registered under the requested name
};

/// @brief Error conditions grouping errc values into the public taxonomy
enum class ErrorKind {
    parse_error = 1,
    validation_error,
    duplicate_key,
    unsupported_version,
};

/// @brief Category for errc codes
const std::error_category& ypbank_category() noexcept;

/// @brief Category for ErrorKind conditions
const std::error_category& ypbank_kind_category() noexcept;

inline std::error_code make_error_code(errc e) noexcept {
    return {static_cast<int>(e), ypbank_category()};
}

inline std::error_condition make_error_condition(ErrorKind k) noexcept {
    return {static_cast<int>(k), ypbank_kind_category()};
}

/// @brief What Error::location counts
enum class LocationKind {
    None,   ///< no location
    Line,   ///< 1-based physical line (text formats)
    Offset, ///< 0-based byte offset (binary format)
    Record, ///< 1-based position within a record sequence
};

/// @brief Structured error filled by every fallible operation
/// @details Follows the `bool f(..., std::error_code& ec)` convention: functions return
///          false (or an empty optional) and describe the failure here.
struct Error {
    std::error_code code;                       ///< errc value, or errno in generic_category
    LocationKind locationKind = LocationKind::None;
    std::size_t location = 0;                   ///< meaning given by locationKind
    std::string field;                          ///< label of the offending field, if any
    std::string reason;                         ///< short reason, e.g. "unknown field"

    explicit operator bool() const noexcept { return static_cast<bool>(code); }

    void clear() {
        code.clear();
        locationKind = LocationKind::None;
        location = 0;
        field.clear();
        reason.clear();
    }

    /// @brief Attach a location to an error raised without one
    Error& at(LocationKind kind, std::size_t where) {
        locationKind = kind;
        location = where;
        return *this;
    }

    /// @brief Human-readable form, e.g. "line 3: AMOUNT: too many decimal places for USD"
    std::string message() const;
};

/// @brief Fill err and return false
/// @details Lets codec code write `return fail(err, errc::syntax_error, ...);`
inline bool fail(Error& err, errc code, LocationKind kind, std::size_t location,
                 std::string reason, std::string field = {}) {
    err.code = make_error_code(code);
    err.locationKind = kind;
    err.location = location;
    err.reason = std::move(reason);
    err.field = std::move(field);
    return false;
}

/// @brief Fill err from an I/O failure (errno value)
inline bool failIo(Error& err, std::error_code ec, std::string reason) {
    err.code = ec;
    err.locationKind = LocationKind::None;
    err.location = 0;
    err.field.clear();
    err.reason = std::move(reason);
    return false;
}

} // namespace YpBank

namespace std {
template <> struct is_error_code_enum<YpBank::errc> : true_type {};
template <> struct is_error_condition_enum<YpBank::ErrorKind> : true_type {};
} // namespace std
