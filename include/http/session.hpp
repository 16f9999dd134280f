#pragma once

#include <cerrno>
#include <cstring>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "guarded_task.hpp"
#include "http/file_server.hpp"
#include "http/request_framer.hpp"
#include "http/response.hpp"
#include "log/log.hpp"
#include "net/connection.hpp"
#include "options.hpp"
#include "task.hpp"

namespace pasture {

namespace http {

namespace detail {

inline Response make_error_response(Status status) {
    Response response{Version::Http11, status, reason_phrase(status)};
    response.set_body({});
    return response;
}

inline task<> exchange(net::Connection& conn, const FileServer& server,
                       const ServerOptions& options, const std::string& peer)
{
    auto& logger = log::logger();
    auto* buf = conn.read_buf();

    RequestFramer framer{options};
    std::optional<Response> response;

    while (!response)
    {
        int bytes_read = co_await conn.recv();
        auto decision = framer.on_read(bytes_read, buf->to_string());

        switch (decision.action) {
        case ReadAction::Continue:
            continue;
        case ReadAction::Close:
            if (bytes_read < 0 && bytes_read != -ECANCELED)
                logger.log_warn("{}: recv failed: {}", peer, std::strerror(-bytes_read));
            else
                logger.log_debug("{}: closed without sending a request", peer);
            co_return;
        case ReadAction::Respond:
            logger.log_info("{}: rejected after {} bytes", peer, buf->size());
            response = make_error_response(decision.status);
            break;
        case ReadAction::Process:
            logger.log_debug("{}: received {} bytes", peer, buf->size());
            try {
                response = server.handle_raw(buf->to_string());
            } catch (const std::exception& e) {
                logger.log_error("{}: handler failed: {}", peer, e.what());
                response = make_error_response(Status::InternalServerError);
            }
            break;
        }
    }

    logger.log_info("{}: {}", peer, response->summary());

    auto wire = response->serialize();
    int sent = co_await conn.send(wire);
    if (sent < 0)
        logger.log_warn("{}: send failed: {}", peer, std::strerror(-sent));
}

} // namespace detail

/// Serve one request on `conn` and return, which closes the connection.
///
/// Reads until RequestFramer decides the request is complete, over a limit
/// (431, 413), timed out (408) or abandoned. Socket errors are logged and
/// end the session without a response, as does any exception the session
/// ends with.
inline task<> serve_connection(std::unique_ptr<net::Connection> conn,
                               const FileServer& server,
                               const ServerOptions& options)
{
    auto peer = conn->client_addr().to_string();
    co_await guarded(detail::exchange(*conn, server, options, peer), peer);
}

} // namespace http

} // namespace pasture
