#pragma once

#include <cctype>
#include <charconv>
#include <cstddef>
#include <limits>
#include <string_view>
#include <utility>

#include "http/request.hpp"


namespace pasture {

namespace http {

enum class RequestParseResult
{
    InCompleted,
    Completed,
    Error
};

// Where the header block of a buffered request ends and how many bytes the
// whole request occupies, as far as can be told from what arrived so far.
struct RequestFrame
{
    std::size_t header_size{0};
    std::size_t expected_size{0};
};

inline std::string_view trim(std::string_view s) noexcept {
    auto is_space = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
    while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
    while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
    return s;
}

inline bool iequals(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i])))
            return false;
    }
    return true;
}

class RequestParser
{
public:
    static constexpr std::string_view kCRLF{"\r\n"};
    static constexpr std::string_view kBLANK_LINE{"\r\n\r\n"};

    /// Parse a complete request held in `buf`.
    ///
    /// The request line is the text before the first '\n' (a trailing '\r'
    /// is dropped) and must consist of exactly three whitespace separated
    /// tokens. Header lines follow the first CRLF, up to the first empty
    /// line, and each needs a colon. The body is everything after the first
    /// CRLFCRLF. On Error `req` is left untouched.
    RequestParseResult parse(Request& req, std::string_view buf) const
    {
        auto first_line = buf.substr(0, buf.find('\n'));
        if (!first_line.empty() && first_line.back() == '\r')
            first_line.remove_suffix(1);

        std::string_view tokens[3];
        std::size_t token_count = 0;
        while (true) {
            first_line = trim_front(first_line);
            if (first_line.empty())
                break;
            if (token_count == 3)
                return RequestParseResult::Error;
            auto token_end = std::size_t{0};
            while (token_end < first_line.size() && !is_space(first_line[token_end]))
                ++token_end;
            tokens[token_count++] = first_line.substr(0, token_end);
            first_line.remove_prefix(token_end);
        }
        if (token_count != 3)
            return RequestParseResult::Error;

        Request parsed;

        auto method = parse_method(tokens[0]);
        if (!method)
            return RequestParseResult::Error;
        parsed.method = *method;

        auto version = parse_version(tokens[2]);
        if (!version)
            return RequestParseResult::Error;
        parsed.version = *version;

        auto target = tokens[1];
        if (!target.empty() && target.front() == '/')
            target.remove_prefix(1);
        parsed.route = std::string(target);

        if (!parse_headers(parsed.headers, buf))
            return RequestParseResult::Error;

        auto blank = buf.find(kBLANK_LINE);
        if (blank != std::string_view::npos)
            parsed.body = std::string(buf.substr(blank + kBLANK_LINE.size()));

        req = std::move(parsed);
        return RequestParseResult::Completed;
    }

    /// Decide whether `buf` already holds a whole request: the header block
    /// must be terminated, and when it declares a valid Content-Length that
    /// many body bytes must follow it. Never returns Error; a request that
    /// is complete but malformed is left to parse().
    RequestParseResult probe(RequestFrame& frame, std::string_view buf) const
    {
        auto blank = buf.find(kBLANK_LINE);
        if (blank == std::string_view::npos) {
            frame.header_size = buf.size();
            frame.expected_size = 0;
            return RequestParseResult::InCompleted;
        }

        frame.header_size = blank + kBLANK_LINE.size();
        auto content_length = find_content_length(buf.substr(0, blank));
        if (content_length > std::numeric_limits<std::size_t>::max() - frame.header_size)
            frame.expected_size = std::numeric_limits<std::size_t>::max();
        else
            frame.expected_size = frame.header_size + content_length;

        return buf.size() >= frame.expected_size
            ? RequestParseResult::Completed
            : RequestParseResult::InCompleted;
    }

private:
    static bool is_space(char c) noexcept {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    }

    static std::string_view trim_front(std::string_view s) noexcept {
        while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
        return s;
    }

    // one header per CRLF terminated line after the request line, stopping
    // at the first empty line
    static bool parse_headers(Request::Headers& headers, std::string_view buf)
    {
        auto first_crlf = buf.find(kCRLF);
        if (first_crlf == std::string_view::npos)
            return false;

        auto rest = buf.substr(first_crlf + kCRLF.size());
        while (!rest.empty()) {
            auto line_end = rest.find(kCRLF);
            auto line = rest.substr(0, line_end);
            if (line.empty())
                break;

            auto colon = line.find(':');
            if (colon == std::string_view::npos)
                return false;
            headers.insert_or_assign(std::string(trim(line.substr(0, colon))),
                                     std::string(trim(line.substr(colon + 1))));

            if (line_end == std::string_view::npos)
                break;
            rest.remove_prefix(line_end + kCRLF.size());
        }
        return true;
    }

    // 0 when absent or not a plain decimal number
    static std::size_t find_content_length(std::string_view header_block)
    {
        std::size_t content_length = 0;
        auto line_start = header_block.find(kCRLF);
        while (line_start != std::string_view::npos) {
            line_start += kCRLF.size();
            auto line_end = header_block.find(kCRLF, line_start);
            auto line = header_block.substr(line_start, line_end == std::string_view::npos
                                                            ? std::string_view::npos
                                                            : line_end - line_start);
            auto colon = line.find(':');
            if (colon != std::string_view::npos && iequals(trim(line.substr(0, colon)), "Content-Length")) {
                auto value = trim(line.substr(colon + 1));
                std::size_t parsed = 0;
                auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
                content_length = (ec == std::errc{} && ptr == value.data() + value.size()) ? parsed : 0;
            }
            line_start = line_end;
        }
        return content_length;
    }
};


} // namespace http

} // namespace pasture
