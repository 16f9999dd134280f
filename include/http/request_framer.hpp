#pragma once

#include <cerrno>
#include <cstddef>
#include <string_view>

#include "http/request_parser.hpp"
#include "http/response.hpp"
#include "options.hpp"

namespace pasture {

namespace http {

enum class ReadAction
{
    Continue,   // read another chunk
    Process,    // hand what was buffered to the request handlers
    Respond,    // answer with `status` without parsing
    Close,      // close without a response
};

struct ReadDecision
{
    ReadAction action{ReadAction::Continue};
    Status status{Status::OK};
};

/// Decides after every socket read whether a request is complete, over a
/// limit, or abandoned.
///
/// `read_result` is what Connection::recv() returned: bytes read, 0 when
/// the peer shut down, -ECANCELED when the read timed out, -ENOBUFS when the
/// buffer is at its maximum, or another -errno.
class RequestFramer
{
public:
    RequestFramer(std::size_t max_header_size, std::size_t max_request_size) noexcept
        : max_header_size_(max_header_size)
        , max_request_size_(max_request_size)
    {}

    explicit RequestFramer(const ServerOptions& options) noexcept
        : RequestFramer(options.max_header_size, options.max_request_size)
    {}

    ReadDecision on_read(int read_result, std::string_view buffered) {
        if (read_result == -ECANCELED) {
            if (buffered.empty())
                return {ReadAction::Close};
            return {ReadAction::Respond, Status::RequestTimeout};
        }
        if (read_result == -ENOBUFS)
            return {ReadAction::Respond, Status::PayloadTooLarge};
        if (read_result < 0)
            return {ReadAction::Close};
        if (read_result == 0)
            return {buffered.empty() ? ReadAction::Close : ReadAction::Process};

        auto state = parser_.probe(frame_, buffered);
        if (frame_.header_size > max_header_size_)
            return {ReadAction::Respond, Status::RequestHeaderFieldsTooLarge};
        if (frame_.expected_size > max_request_size_)
            return {ReadAction::Respond, Status::PayloadTooLarge};
        if (state == RequestParseResult::Completed)
            return {ReadAction::Process};
        // the buffer cannot take another byte of what is still missing
        if (buffered.size() >= max_request_size_)
            return {ReadAction::Respond, Status::PayloadTooLarge};
        return {ReadAction::Continue};
    }

    const RequestFrame& frame() const noexcept { return frame_; }

private:
    std::size_t max_header_size_;
    std::size_t max_request_size_;
    RequestParser parser_;
    RequestFrame frame_;
};

} // namespace http

} // namespace pasture
