#pragma once
/// @file FormatRegistry.hpp
/// @brief Name -> codec lookup shared by the converter and the comparer

#include "RecordCodec.hpp"

#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace YpBank {

/// @brief Registry of record codecs
/// @details Names are matched case-insensitively. The registry owns its codecs and is
///          meant to be filled once and then only read.
class FormatRegistry {
  public:
    FormatRegistry() = default;

    FormatRegistry(const FormatRegistry&) = delete;
    FormatRegistry& operator=(const FormatRegistry&) = delete;
    FormatRegistry(FormatRegistry&&) = default;
    FormatRegistry& operator=(FormatRegistry&&) = default;

    /// @brief Registry holding csv, txt and bin plus the aliases "text" and "binary"
    static FormatRegistry builtin();

    /// @brief Register a codec under codec->name()
    /// @return false when the name (or an alias of that name) is already taken
    bool add(std::unique_ptr<RecordCodec> codec);

    /// @brief Make alias resolve to the codec registered as target
    /// @return false when target is unknown or alias is already taken
    bool addAlias(std::string_view alias, std::string_view target);

    /// @brief Codec for name or alias, nullptr when unknown
    const RecordCodec* find(std::string_view name) const;

    /// @brief Like find, but fills err (errc::unknown_format) on a miss
    const RecordCodec* lookup(std::string_view name, Error& err) const;

    /// @brief Canonical codec names, sorted (aliases excluded)
    std::vector<std::string> names() const;

  private:
    std::vector<std::unique_ptr<RecordCodec>> codecs_;
    std::map<std::string, const RecordCodec*> byName_; ///< lower-case name or alias -> codec
};

} // namespace YpBank
