#pragma once
/// @file Currency.hpp
/// @brief Currency code checks and minor-unit scale

#include <array>
#include <cstddef>
#include <string_view>

namespace YpBank {

/// @brief Length of a currency code
constexpr std::size_t CURRENCY_CODE_LEN = 3;

/// @brief True for exactly three ASCII uppercase letters
inline bool isCurrencyCode(std::string_view code) noexcept {
    if (code.size() != CURRENCY_CODE_LEN)
        return false;
    for (char c : code) {
        if (c < 'A' || c > 'Z')
            return false;
    }
    return true;
}

/// @brief Number of decimal places of the currency's minor unit
/// @details ISO 4217 exponents for the codes that differ from 2. Codes are not checked
///          against the full registry, so anything unlisted uses 2.
inline int currencyScale(std::string_view code) noexcept {
    static constexpr std::array<std::string_view, 17> kScale0 = {
        "BIF", "CLP", "DJF", "GNF", "ISK", "JPY", "KMF", "KRW", "PYG",
        "RWF", "UGX", "UYI", "VND", "VUV", "XAF", "XOF", "XPF"};
    static constexpr std::array<std::string_view, 7> kScale3 = {"BHD", "IQD", "JOD", "KWD",
                                                                "LYD", "OMR", "TND"};
    static constexpr std::array<std::string_view, 2> kScale4 = {"CLF", "UYW"};

    for (auto c : kScale0) {
        if (c == code)
            return 0;
    }
    for (auto c : kScale3) {
        if (c == code)
            return 3;
    }
    for (auto c : kScale4) {
        if (c == code)
            return 4;
    }
    return 2;
}

} // namespace YpBank
