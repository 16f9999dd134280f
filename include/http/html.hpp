#pragma once

#include <string>
#include <string_view>

namespace pasture {

namespace http {

/// Escape text for HTML element content and double or single quoted
/// attribute values.
inline std::string escape_html(std::string_view in) {
    std::string out;
    out.reserve(in.size());
    for (char c : in) {
        switch (c) {
        case '&': out += "&amp;"; break;
        case '<': out += "&lt;"; break;
        case '>': out += "&gt;"; break;
        case '"': out += "&quot;"; break;
        case '\'': out += "&#39;"; break;
        default: out.push_back(c);
        }
    }
    return out;
}

} // namespace http

} // namespace pasture
