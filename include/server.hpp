#pragma once

#include <cstring>
#include <functional>
#include <memory>
#include <stdexcept>
#include <utility>

#include "io_service_pool.hpp"
#include "log/log.hpp"
#include "net/address.hpp"
#include "net/connection.hpp"
#include "net/socket.hpp"
#include "options.hpp"
#include "task.hpp"
#include "thread_pool.hpp"
#include "types.hpp"

namespace pasture {


/// TCP server that turns every accepted connection into a session coroutine
/// and hands it to the worker pool.
class Server
{
public:
    using handler_t = std::function<task<>(std::unique_ptr<net::Connection>)>;

    /// Binds and listens right away; throws when either fails or the
    /// io_uring instances cannot be set up.
    Server(net::Address listen_addr, const ServerOptions& options)
        : listen_addr_(listen_addr)
        , options_(options)
        , io_services_(static_cast<std::size_t>(options.worker_threads))
        , thread_pool_(options.worker_threads, io_services_)
    {
        listen_sock_.bind(listen_addr_, true);
        listen_sock_.listen();
    }

    void set_handler(handler_t h) {
        client_handler_ = std::move(h);
    }

    /// Accept connections forever. Only a missing handler makes it throw;
    /// accept errors are logged and skipped.
    void serve() {
        if (!client_handler_)
            throw std::logic_error("Server: serve() without a handler");

        auto& logger = log::logger();
        thread_pool_.start();
        logger.log_info("listening on {} with {} workers", listen_addr_.to_string(), thread_pool_.size());

        while (true)
        {
            net::Address client_addr;
            auto client_fd = listen_sock_.accept(client_addr);
            if (client_fd < 0) {
                logger.log_warn("accept() failed: {}", std::strerror(-client_fd));
                continue;
            }
            logger.log_debug("accepted client: {}", client_addr.to_string());

            auto client_sock = std::make_unique<net::Socket>(client_fd);
            auto conn = std::make_unique<net::Connection>(
                std::move(client_sock), options_.max_request_size, options_.io_timeout);
            conn->set_client_addr(client_addr);
            auto pconn = conn.get();
            auto session = client_handler_(std::move(conn));

            thread_pool_.submit(session_wrapper{session.detach(), pconn});
        }
    }

private:
    net::Address listen_addr_;
    ServerOptions options_;
    net::Socket listen_sock_;
    io_service_pool io_services_;
    thread_pool thread_pool_;
    handler_t client_handler_;
};


}
