#pragma once

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace pasture {

namespace http {

enum class Method
{
    Get,
    Post,
    Put,
    Delete,
    Head,
    Options,
    Trace,
    Connect,
    Patch,
};

enum class Version
{
    Http11,
    Http20,
};

inline std::string_view to_string(Method method) noexcept {
    switch (method) {
    case Method::Get: return "GET";
    case Method::Post: return "POST";
    case Method::Put: return "PUT";
    case Method::Delete: return "DELETE";
    case Method::Head: return "HEAD";
    case Method::Options: return "OPTIONS";
    case Method::Trace: return "TRACE";
    case Method::Connect: return "CONNECT";
    case Method::Patch: return "PATCH";
    }
    return "UNKNOWN";
}

inline std::string_view to_string(Version version) noexcept {
    switch (version) {
    case Version::Http11: return "HTTP/1.1";
    case Version::Http20: return "HTTP/2.0";
    }
    return "HTTP/1.1";
}

/// Case-insensitive match against the known methods.
inline std::optional<Method> parse_method(std::string_view token) {
    std::string upper(token);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    for (auto m : {Method::Get, Method::Post, Method::Put, Method::Delete, Method::Head,
                   Method::Options, Method::Trace, Method::Connect, Method::Patch}) {
        if (upper == to_string(m))
            return m;
    }
    return std::nullopt;
}

/// Only the exact tokens "HTTP/1.1" and "HTTP/2.0" are accepted.
inline std::optional<Version> parse_version(std::string_view token) noexcept {
    if (token == "HTTP/1.1") return Version::Http11;
    if (token == "HTTP/2.0") return Version::Http20;
    return std::nullopt;
}


struct Request
{
    using Headers = std::unordered_map<std::string, std::string>;

    const std::string* header(const std::string& name) const {
        auto it = headers.find(name);
        return it == headers.end() ? nullptr : &it->second;
    }

    Method method{Method::Get};
    // request target with one leading '/' removed, still percent-encoded
    std::string route;
    Version version{Version::Http11};
    // names as received; a repeated name keeps the last value
    Headers headers;
    std::string body;
};


} // namespace http


} // namespace pasture
