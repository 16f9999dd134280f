#pragma once

#include <cerrno>
#include <cstddef>
#include <filesystem>
#include <string>
#include <system_error>
#include <utility>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace pasture {

namespace file {

namespace detail {

class unique_fd
{
public:
    explicit unique_fd(int fd) noexcept : fd_(fd) {}
    ~unique_fd() { if (fd_ != -1) ::close(fd_); }

    unique_fd(const unique_fd&) = delete;
    unique_fd& operator=(const unique_fd&) = delete;

    int get() const noexcept { return fd_; }

private:
    int fd_;
};

} // namespace detail

/// Read the whole of a regular file into memory.
///
/// On failure `ec` holds the errno of the call that failed (EISDIR when
/// `path` is a directory) and the returned string is empty.
inline std::string read_file(const std::filesystem::path& path, std::error_code& ec) {
    ec.clear();
    detail::unique_fd fd{::open(path.c_str(), O_RDONLY | O_CLOEXEC)};
    if (fd.get() == -1) {
        ec.assign(errno, std::generic_category());
        return {};
    }

    struct stat st{};
    if (::fstat(fd.get(), &st) == -1) {
        ec.assign(errno, std::generic_category());
        return {};
    }
    if (S_ISDIR(st.st_mode)) {
        ec = std::make_error_code(std::errc::is_a_directory);
        return {};
    }

    std::string content;
    if (st.st_size > 0)
        content.reserve(static_cast<std::size_t>(st.st_size));

    char chunk[64 * 1024];
    while (true) {
        auto n = ::read(fd.get(), chunk, sizeof(chunk));
        if (n == -1) {
            if (errno == EINTR) continue;
            ec.assign(errno, std::generic_category());
            return {};
        }
        if (n == 0) break;
        content.append(chunk, static_cast<std::size_t>(n));
    }
    return content;
}

} // namespace file

} // namespace pasture
