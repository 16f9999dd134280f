#pragma once

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>
#include <sys/socket.h>
#include <unistd.h>
#include <utility>

#include "net/address.hpp"

namespace pasture {

namespace net {

/// Owning wrapper of a TCP socket descriptor.
class Socket
{
public:
    static constexpr int kBACK_LOG = 128;

    Socket() = default;

    explicit Socket(int fd) noexcept : fd_(fd) {}

    ~Socket() {
        if (fd_ != -1) ::close(fd_);
        fd_ = -1;
    }

    Socket(const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;

    Socket(Socket&& other) noexcept {
        fd_ = std::exchange(other.fd_, -1);
    }

    Socket& operator=(Socket&& rhs) noexcept {
        if (this == &rhs) return *this;
        if (fd_ != -1) ::close(fd_);
        fd_ = std::exchange(rhs.fd_, -1);
        return *this;
    }

    int fd() const noexcept { return fd_; }

    void bind(Address& serve_addr, bool reusable = true) {
        if (fd_ == -1) {
            create_socket();
        }
        if (reusable)
            set_reusable();
        if (::bind(fd_, serve_addr.sockaddr(), *serve_addr.len()) == -1) {
            int err = errno;
            throw_error(err, "bind() " + serve_addr.to_string());
        }
    }

    void listen() {
        if (fd_ == -1)
            throw std::logic_error("Socket: listen() on a socket that is not bound");
        if (::listen(fd_, kBACK_LOG) == -1)
            throw_error(errno, "listen()");
    }

    /// Returns the connected descriptor, or -errno. Accept failures are
    /// about one pending connection and must not stop the listener.
    int accept(Address& addr) noexcept {
        *addr.len() = sizeof(sockaddr_in);
        int client_fd = ::accept4(fd_, addr.sockaddr(), addr.len(), SOCK_CLOEXEC);
        if (client_fd == -1) [[unlikely]]
            return -errno;
        return client_fd;
    }

    void set_reusable() {
        int ok = 1;
        if (::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &ok, sizeof(ok)) == -1)
            throw_error(errno, "set_reusable()");
    }

private:
    void create_socket() {
        fd_ = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
        if (fd_ == -1)
            throw_error(errno, "create socket");
    }

    [[noreturn]] static void throw_error(int err, const std::string& what) {
        throw std::logic_error("Socket: " + what + " error: " + std::strerror(err));
    }

    int fd_{-1};
};


}


}
