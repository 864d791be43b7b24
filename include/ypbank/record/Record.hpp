#pragma once
/// @file Record.hpp
/// @brief Canonical bank operation record and its validation rules

#include "../error/Error.hpp"
#include "OccurredAt.hpp"
#include "OperationType.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace YpBank {

/// @brief Maximum byte length of id, counterparty and description
/// @details Bound by the 2-byte length prefix of the binary layout.
constexpr std::size_t MAX_TEXT_FIELD_LEN = 0xFFFF;

/// @brief The seven record fields, in canonical order
enum class Field : std::uint8_t {
    Id,
    OccurredAt,
    Amount,
    Currency,
    Counterparty,
    Description,
    OperationType,
};

constexpr std::size_t kFieldCount = 7;

constexpr std::array<Field, kFieldCount> kAllFields = {
    Field::Id,           Field::OccurredAt,  Field::Amount,       Field::Currency,
    Field::Counterparty, Field::Description, Field::OperationType};

/// @brief Stable label of a field (csv header column, txt label)
const char* fieldName(Field field) noexcept;

/// @brief Reverse of fieldName; exact match
std::optional<Field> fieldFromName(std::string_view name);

/// @brief Raw field values accepted by Record::create
struct RecordFields {
    std::string id;
    OccurredAt occurredAt;
    std::int64_t amount = 0; ///< minor units at currencyScale(currency)
    std::string currency;
    std::string counterparty;
    std::string description;
    YpBank::OperationType operationType = YpBank::OperationType::Debit;
};

/// @brief One bank operation
/// @details Immutable: the only way to obtain a Record is the validating factory, and all
///          accessors are const. Equality is field-wise.
class Record {
  public:
    /// @brief Validate raw values and build a Record
    /// @param[out] err ValidationError (errc::invalid_value, field = label) on failure
    /// @return The record, or nullopt on failure
    static std::optional<Record> create(RecordFields fields, Error& err);

    /// @brief Run the validation rules without constructing
    static bool validate(const RecordFields& fields, Error& err);

    const std::string& id() const noexcept { return f_.id; }
    const OccurredAt& occurredAt() const noexcept { return f_.occurredAt; }
    std::int64_t amount() const noexcept { return f_.amount; }
    const std::string& currency() const noexcept { return f_.currency; }
    const std::string& counterparty() const noexcept { return f_.counterparty; }
    const std::string& description() const noexcept { return f_.description; }
    YpBank::OperationType operationType() const noexcept { return f_.operationType; }

    /// @brief All values at once
    const RecordFields& fields() const noexcept { return f_; }

    /// @brief Decimal places of the amount (from the currency)
    int scale() const noexcept;

    /// @brief Fields whose values differ from other, in canonical order
    std::vector<Field> differingFields(const Record& other) const;

    /// @brief Compare a single field
    bool sameField(const Record& other, Field field) const noexcept;

    friend bool operator==(const Record& a, const Record& b) noexcept;
    friend bool operator!=(const Record& a, const Record& b) { return !(a == b); }

  private:
    explicit Record(RecordFields fields) : f_(std::move(fields)) {}

    RecordFields f_;
};

} // namespace YpBank
