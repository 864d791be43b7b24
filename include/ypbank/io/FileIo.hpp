#pragma once
/// @file FileIo.hpp
/// @brief Whole-file read and full write over POSIX file descriptors

#include <string>
#include <string_view>
#include <system_error>

namespace YpBank::io {

/// @brief Read everything from fd until EOF (retries on EINTR)
/// @param[out] out Replaced with the data read
/// @param[out] ec errno in generic_category on failure
bool readFd(int fd, std::string& out, std::error_code& ec);

/// @brief Read a whole file; "-" reads standard input
bool readFile(const std::string& path, std::string& out, std::error_code& ec);

/// @brief Write all of data to fd (handles short writes and EINTR)
bool writeAll(int fd, std::string_view data, std::error_code& ec);

/// @brief Create or truncate path (mode 0644), write data and fsync; "-" writes standard output
bool writeFile(const std::string& path, std::string_view data, std::error_code& ec);

} // namespace YpBank::io
