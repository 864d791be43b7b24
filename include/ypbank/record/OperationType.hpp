#pragma once
/// @file OperationType.hpp
/// @brief Closed set of bank operation categories

#include <cstdint>
#include <optional>
#include <string_view>

namespace YpBank {

/// @brief Operation category. The enumerator value is the binary tag.
enum class OperationType : std::uint8_t {
    Debit = 0,
    Credit = 1,
    Fee = 2,
    Transfer = 3,
    Adjustment = 4,
    Deposit = 5,
    Withdrawal = 6,
};

/// @brief Number of operation types (tags are 0 .. kOperationTypeCount - 1)
constexpr std::uint8_t kOperationTypeCount = 7;

/// @brief Text form used by csv, txt and reports
inline const char* toString(OperationType type) noexcept {
    switch (type) {
    case OperationType::Debit:
        return "DEBIT";
    case OperationType::Credit:
        return "CREDIT";
    case OperationType::Fee:
        return "FEE";
    case OperationType::Transfer:
        return "TRANSFER";
    case OperationType::Adjustment:
        return "ADJUSTMENT";
    case OperationType::Deposit:
        return "DEPOSIT";
    case OperationType::Withdrawal:
        return "WITHDRAWAL";
    }
    return "";
}

/// @brief Parse the exact uppercase text form
inline std::optional<OperationType> operationTypeFromString(std::string_view s) {
    for (std::uint8_t tag = 0; tag < kOperationTypeCount; ++tag) {
        auto type = static_cast<OperationType>(tag);
        if (s == toString(type))
            return type;
    }
    return std::nullopt;
}

/// @brief Map a binary tag to a type; nullopt for tags outside the closed set
inline std::optional<OperationType> operationTypeFromTag(std::uint8_t tag) {
    if (tag >= kOperationTypeCount)
        return std::nullopt;
    return static_cast<OperationType>(tag);
}

inline std::uint8_t toTag(OperationType type) noexcept { return static_cast<std::uint8_t>(type); }

} // namespace YpBank
