#pragma once
/// @file Converter.hpp
/// @brief Decode-then-encode pipeline between registered formats

#include "../codec/FormatRegistry.hpp"

#include <string>
#include <string_view>

namespace YpBank {

/// @brief Format conversion over a FormatRegistry
/// @details Holds a reference; the registry must outlive the converter.
class Converter {
  public:
    explicit Converter(const FormatRegistry& registry) noexcept : registry_(registry) {}
    Converter(FormatRegistry&&) = delete; // 임시 registry 참조 금지

    /// @brief Convert input from sourceFormat to targetFormat
    /// @details Both format names are resolved before any decoding. Records pass through
    ///          unchanged.
    /// @param[out] output Encoded target representation (left empty on failure)
    /// @param[out] err unknown_format, or the decoder's error
    bool convert(std::string_view input, std::string_view sourceFormat,
                 std::string_view targetFormat, std::string& output, Error& err) const;

    /// @brief Decode input with the named format
    bool decode(std::string_view input, std::string_view format, RecordSequence& out,
                Error& err) const;

  private:
    const FormatRegistry& registry_;
};

} // namespace YpBank
