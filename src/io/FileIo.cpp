#include "ypbank/io/FileIo.hpp"
#include "ypbank/io/UniqueFd.hpp"

#include <cerrno>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace YpBank::io {

namespace {

constexpr std::string_view STDIO_PATH = "-";

std::error_code lastError() { return std::error_code(errno, std::generic_category()); }

} // namespace

bool readFd(int fd, std::string& out, std::error_code& ec) {
    ec.clear();
    out.clear();

    char buf[64 * 1024];
    while (true) {
        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR)
                continue;
            ec = lastError();
            out.clear();
            return false;
        }
        if (n == 0)
            return true;
        out.append(buf, static_cast<std::size_t>(n));
    }
}

bool readFile(const std::string& path, std::string& out, std::error_code& ec) {
    if (path == STDIO_PATH)
        return readFd(STDIN_FILENO, out, ec);

    int flags = O_RDONLY;
#ifdef O_CLOEXEC
    flags |= O_CLOEXEC;
#endif
    detail::UniqueFd fd(::open(path.c_str(), flags));
    if (!fd) {
        ec = lastError();
        out.clear();
        return false;
    }

    // 크기를 알 수 있으면 미리 확보해 재할당을 줄인다.
    struct stat st {};
    if (::fstat(fd.get(), &st) == 0 && S_ISREG(st.st_mode) && st.st_size > 0) {
        std::string data;
        data.reserve(static_cast<std::size_t>(st.st_size));
        if (!readFd(fd.get(), data, ec))
            return false;
        out = std::move(data);
        return true;
    }
    return readFd(fd.get(), out, ec);
}

bool writeAll(int fd, std::string_view data, std::error_code& ec) {
    ec.clear();
    const char* p = data.data();
    std::size_t left = data.size();
    while (left > 0) {
        ssize_t w = ::write(fd, p, left);
        if (w < 0) {
            if (errno == EINTR)
                continue;
            ec = lastError();
            return false;
        }
        if (w == 0) {
            ec = std::make_error_code(std::errc::io_error);
            return false;
        }
        p += w;
        left -= static_cast<std::size_t>(w);
    }
    return true;
}

bool writeFile(const std::string& path, std::string_view data, std::error_code& ec) {
    if (path == STDIO_PATH)
        return writeAll(STDOUT_FILENO, data, ec);

    int flags = O_WRONLY | O_CREAT | O_TRUNC;
#ifdef O_CLOEXEC
    flags |= O_CLOEXEC;
#endif
    detail::UniqueFd fd(::open(path.c_str(), flags, 0644));
    if (!fd) {
        ec = lastError();
        return false;
    }
    if (!writeAll(fd.get(), data, ec))
        return false;
    if (::fsync(fd.get()) < 0) {
        ec = lastError();
        return false;
    }
    // close 실패도 쓰기 실패로 보고한다.
    if (::close(fd.release()) < 0) {
        ec = lastError();
        return false;
    }
    return true;
}

} // namespace YpBank::io
