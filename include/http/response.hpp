#pragma once

#include <algorithm>
#include <cctype>
#include <iterator>
#include <map>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

#include "http/request.hpp"

namespace pasture {

namespace http {


enum class Status
{
    OK,
    BadRequest,
    Forbidden,
    NotFound,
    RequestTimeout,
    PayloadTooLarge,
    RequestHeaderFieldsTooLarge,
    InternalServerError,
};

inline int status_code(Status status) noexcept {
    switch (status) {
    case Status::OK: return 200;
    case Status::BadRequest: return 400;
    case Status::Forbidden: return 403;
    case Status::NotFound: return 404;
    case Status::RequestTimeout: return 408;
    case Status::PayloadTooLarge: return 413;
    case Status::RequestHeaderFieldsTooLarge: return 431;
    case Status::InternalServerError: return 500;
    }
    return 500;
}

inline std::string_view reason_phrase(Status status) noexcept {
    switch (status) {
    case Status::OK: return "OK";
    case Status::BadRequest: return "Bad Request";
    case Status::Forbidden: return "Forbidden";
    case Status::NotFound: return "Not Found";
    case Status::RequestTimeout: return "Request Timeout";
    case Status::PayloadTooLarge: return "Payload Too Large";
    case Status::RequestHeaderFieldsTooLarge: return "Request Header Fields Too Large";
    case Status::InternalServerError: return "Internal Server Error";
    }
    return "Internal Server Error";
}


/// A response under construction.
///
/// Header names are stored lowercase, so adding a header twice under any
/// spelling replaces the first value. Every response advertises
/// "accept-ranges: bytes", and set_body() keeps "content-length" equal to
/// the body size.
class Response
{
public:
    using Headers = std::map<std::string, std::string>;

    /// `path` names the resource the response was built for and is kept for
    /// the log only. Leading slashes are dropped.
    Response(Version version, Status status, std::string_view path)
        : version_(version)
        , status_(status)
    {
        while (!path.empty() && path.front() == '/')
            path.remove_prefix(1);
        path_ = std::string(path);
        add_header("Accept-Ranges", "bytes");
    }

    void add_header(std::string_view name, std::string_view value) {
        std::string key(name);
        std::transform(key.begin(), key.end(), key.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        headers_.insert_or_assign(std::move(key), std::string(value));
    }

    void set_body(std::string body) {
        body_ = std::move(body);
        add_header("Content-Length", std::to_string(body_.size()));
    }

    void set_status(Status status) noexcept { status_ = status; }

    Version version() const noexcept { return version_; }
    Status status() const noexcept { return status_; }
    const Headers& headers() const noexcept { return headers_; }
    const std::string& body() const noexcept { return body_; }
    const std::string& path() const noexcept { return path_; }

    const std::string* header(std::string_view name) const {
        std::string key(name);
        std::transform(key.begin(), key.end(), key.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        auto it = headers_.find(key);
        return it == headers_.end() ? nullptr : &it->second;
    }

    /// Status line, one line per header (sorted by name), an empty line and
    /// the body as is.
    std::string serialize() const {
        fmt::memory_buffer out;
        fmt::format_to(std::back_inserter(out), "{} {} {}\r\n",
                       to_string(version_), status_code(status_), reason_phrase(status_));
        for (const auto& [name, value] : headers_)
            fmt::format_to(std::back_inserter(out), "{}: {}\r\n", name, value);
        out.append(std::string_view{"\r\n"});
        out.append(body_);
        return fmt::to_string(out);
    }

    /// One line for the log, the body itself is left out.
    std::string summary() const {
        auto content_length = header("content-length");
        auto accept_ranges = header("accept-ranges");
        return fmt::format(
            "{} {} {}, content-length: {}, accept-ranges: {}, body: <{} bytes>, path: \"{}\"",
            to_string(version_), status_code(status_), reason_phrase(status_),
            content_length ? *content_length : std::string("0"),
            accept_ranges ? *accept_ranges : std::string("none"),
            body_.size(), path_);
    }

private:
    Version version_;
    Status status_;
    Headers headers_;
    std::string body_;
    std::string path_;
};


}

} // namespace pasture
