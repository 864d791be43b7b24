#pragma once
/// @file UniqueFd.hpp
/// @brief RAII owner of a POSIX file descriptor

#include <unistd.h>

namespace YpBank {
namespace detail {

/// @brief Closes the descriptor on destruction; move-only
class UniqueFd {
  public:
    UniqueFd() noexcept = default;
    explicit UniqueFd(int fd) noexcept : fd_(fd) {}
    ~UniqueFd() { reset(); }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    UniqueFd(UniqueFd&& other) noexcept : fd_(other.release()) {}
    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other)
            reset(other.release());
        return *this;
    }

    int get() const noexcept { return fd_; }
    explicit operator bool() const noexcept { return fd_ >= 0; }

    int release() noexcept {
        int tmp = fd_;
        fd_ = -1;
        return tmp;
    }

    void reset(int newFd = -1) noexcept {
        if (fd_ >= 0)
            ::close(fd_);
        fd_ = newFd;
    }

  private:
    int fd_ = -1;
};

} // namespace detail
} // namespace YpBank
