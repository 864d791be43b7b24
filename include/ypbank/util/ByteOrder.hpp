#pragma once
/// @file ByteOrder.hpp
/// @brief Little-endian byte writing and a bounds-checked byte reader

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace YpBank::util {

inline void putU8(std::string& out, std::uint8_t v) { out.push_back(static_cast<char>(v)); }

inline void putU16LE(std::string& out, std::uint16_t v) {
    out.push_back(static_cast<char>(v & 0xFF));
    out.push_back(static_cast<char>((v >> 8) & 0xFF));
}

inline void putU32LE(std::string& out, std::uint32_t v) {
    for (int i = 0; i < 4; ++i)
        out.push_back(static_cast<char>((v >> (8 * i)) & 0xFF));
}

inline void putU64LE(std::string& out, std::uint64_t v) {
    for (int i = 0; i < 8; ++i)
        out.push_back(static_cast<char>((v >> (8 * i)) & 0xFF));
}

inline void putI32LE(std::string& out, std::int32_t v) {
    putU32LE(out, static_cast<std::uint32_t>(v));
}

inline void putI64LE(std::string& out, std::int64_t v) {
    putU64LE(out, static_cast<std::uint64_t>(v));
}

/// @brief Sequential reader over an immutable byte buffer
/// @details Every read either consumes exactly the requested bytes and returns true, or
///          consumes nothing and returns false. offset() then still points at the failed read.
class ByteReader {
  public:
    explicit ByteReader(std::string_view data) noexcept : data_(data) {}

    std::size_t offset() const noexcept { return pos_; }
    std::size_t remaining() const noexcept { return data_.size() - pos_; }
    bool atEnd() const noexcept { return pos_ == data_.size(); }

    bool readU8(std::uint8_t& v) noexcept {
        if (remaining() < 1)
            return false;
        v = byteAt(pos_++);
        return true;
    }

    bool readU16LE(std::uint16_t& v) noexcept {
        std::uint64_t tmp = 0;
        if (!readLE(2, tmp))
            return false;
        v = static_cast<std::uint16_t>(tmp);
        return true;
    }

    bool readU32LE(std::uint32_t& v) noexcept {
        std::uint64_t tmp = 0;
        if (!readLE(4, tmp))
            return false;
        v = static_cast<std::uint32_t>(tmp);
        return true;
    }

    bool readI32LE(std::int32_t& v) noexcept {
        std::uint32_t tmp = 0;
        if (!readU32LE(tmp))
            return false;
        v = static_cast<std::int32_t>(tmp);
        return true;
    }

    bool readI64LE(std::int64_t& v) noexcept {
        std::uint64_t tmp = 0;
        if (!readLE(8, tmp))
            return false;
        v = static_cast<std::int64_t>(tmp);
        return true;
    }

    /// @brief Read n raw bytes
    bool readBytes(std::size_t n, std::string& out) {
        if (remaining() < n)
            return false;
        out.assign(data_.data() + pos_, n);
        pos_ += n;
        return true;
    }

  private:
    std::uint8_t byteAt(std::size_t i) const noexcept {
        return static_cast<std::uint8_t>(data_[i]);
    }

    bool readLE(std::size_t width, std::uint64_t& v) noexcept {
        if (remaining() < width)
            return false;
        v = 0;
        for (std::size_t i = 0; i < width; ++i)
            v |= static_cast<std::uint64_t>(byteAt(pos_ + i)) << (8 * i);
        pos_ += width;
        return true;
    }

    std::string_view data_;
    std::size_t pos_ = 0;
};

} // namespace YpBank::util
