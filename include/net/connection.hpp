#pragma once

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstddef>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string_view>

#include "buffer.hpp"
#include "io_service.hpp"
#include "task.hpp"
#include "timeout.hpp"
#include "net/socket.hpp"

namespace pasture {


namespace net {


/// One accepted client.
///
/// Reads accumulate in a buffer that grows up to `max_request_size`. Every
/// single recv and send is bounded by `io_timeout`; an operation that times
/// out completes with -ECANCELED.
class Connection
{
public:
    static constexpr std::size_t kREAD_CHUNK_SIZE = 1024;

    Connection(std::unique_ptr<Socket> conn_socket, std::size_t max_request_size,
               std::chrono::milliseconds io_timeout)
        : sock_(std::move(conn_socket))
        , read_buf_(std::make_unique<Buffer>(kREAD_CHUNK_SIZE, max_request_size))
        , timeout_(duration_to_timespec(io_timeout))
    {
    }

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    void set_client_addr(const net::Address& addr) noexcept {
        addr_ = addr;
    }
    const net::Address& client_addr() const noexcept { return addr_; }

    int get_fd() const noexcept { return sock_->fd(); }

    Buffer* read_buf() noexcept { return read_buf_.get(); }

    void set_io_service(io_service* ios) noexcept { ios_ = ios; }
    io_service* get_io_service() noexcept { return ios_; }

    /// Append at most one chunk to the read buffer.
    /// \return bytes read, 0 on orderly shutdown by the peer, -ENOBUFS when
    /// the buffer reached its maximum size, otherwise -errno.
    task<int> recv() {
        if (ios_ == nullptr)
            throw std::logic_error("Connection: recv() before an io_service was bound");
        auto dst = read_buf_->prepare(kREAD_CHUNK_SIZE);
        auto room = std::min(kREAD_CHUNK_SIZE, read_buf_->writable_size());
        if (room == 0)
            co_return -ENOBUFS;

        int bytes_read = co_await ios_->recv(get_fd(), dst, room, 0, &timeout_);
        if (bytes_read > 0)
            read_buf_->commit(static_cast<std::size_t>(bytes_read));
        co_return bytes_read;
    }

    /// Write all of `data`, looping over short sends.
    /// \return bytes sent, or -errno of the send that failed.
    task<int> send(std::string_view data) {
        if (ios_ == nullptr)
            throw std::logic_error("Connection: send() before an io_service was bound");
        std::size_t sent = 0;
        while (sent < data.size()) {
            int n = co_await ios_->send(
                get_fd(), data.data() + sent, data.size() - sent, MSG_NOSIGNAL, &timeout_);
            if (n < 0)
                co_return n;
            if (n == 0)
                co_return -EPIPE;
            sent += static_cast<std::size_t>(n);
        }
        co_return static_cast<int>(std::min<std::size_t>(sent, std::numeric_limits<int>::max()));
    }

private:
    std::unique_ptr<Socket> sock_;
    net::Address addr_;
    std::unique_ptr<Buffer> read_buf_;
    // read by the kernel when each linked timeout is submitted
    __kernel_timespec timeout_;
    io_service* ios_{nullptr};
};

} // namespace net

} // namespace pasture
