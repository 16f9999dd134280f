#pragma once

#include <coroutine>
#include <cstdint>

namespace pasture {

namespace net {
class Connection;
}

struct thread_meta
{
    std::uint16_t thread_id;
};


// A connection coroutine that has not started yet, together with the
// connection it serves. The worker that picks it up binds its io_service to
// the connection before the first resume.
struct session_wrapper
{
    std::coroutine_handle<> coro;
    net::Connection* conn;
};

}
