#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>

namespace pasture {

namespace file {

static constexpr std::string_view kDEFAULT_CONTENT_TYPE{"application/octet-stream"};

namespace detail {

inline bool starts_with(std::string_view bytes, std::string_view magic, std::size_t offset = 0) noexcept {
    return bytes.size() >= offset + magic.size() && bytes.substr(offset, magic.size()) == magic;
}

inline bool istarts_with(std::string_view bytes, std::string_view prefix) noexcept {
    if (bytes.size() < prefix.size()) return false;
    return std::equal(prefix.begin(), prefix.end(), bytes.begin(), [](char a, char b) {
        return std::toupper(static_cast<unsigned char>(a)) == std::toupper(static_cast<unsigned char>(b));
    });
}

inline std::string_view skip_whitespace(std::string_view bytes) noexcept {
    while (!bytes.empty() && (bytes.front() == ' ' || bytes.front() == '\t'
                              || bytes.front() == '\n' || bytes.front() == '\r'))
        bytes.remove_prefix(1);
    return bytes;
}

// a tag name from the list, followed by a space or '>'
inline bool looks_like_html(std::string_view bytes) noexcept {
    static constexpr std::string_view tags[] = {
        "<!DOCTYPE HTML", "<HTML", "<HEAD", "<SCRIPT", "<IFRAME", "<H1", "<DIV",
        "<FONT", "<TABLE", "<A", "<STYLE", "<TITLE", "<B", "<BODY", "<BR", "<P", "<!--",
    };
    bytes = skip_whitespace(bytes);
    for (auto tag : tags) {
        if (!istarts_with(bytes, tag) || bytes.size() == tag.size())
            continue;
        char next = bytes[tag.size()];
        if (next == ' ' || next == '>')
            return true;
    }
    return false;
}

// ISO base media files (mp4 and relatives) by the major brand of their
// ftyp box; "" for brands we do not know
inline std::string_view iso_media_type(std::string_view brand) noexcept {
    static constexpr std::string_view mp4_brands[] = {
        "avc1", "dash", "iso2", "iso3", "iso4", "iso5", "iso6", "isom", "mmp4",
        "mp41", "mp42", "mp4v", "mp71", "MSNV", "NDAS", "NDSC", "NSDC", "NSDH",
        "NDSM", "NDSP", "NDSS", "NDXC", "NDXH", "NDXM", "NDXP", "NDXS", "F4V ", "F4P ",
    };
    static constexpr std::string_view heif_brands[] = {
        "heic", "heix", "hevc", "hevx", "mif1", "msf1",
    };

    if (brand.size() != 4) return {};
    if (brand == "avif" || brand == "avis") return "image/avif";
    for (auto b : heif_brands)
        if (brand == b) return "image/heif";
    if (brand == "M4A ") return "audio/m4a";
    if (brand == "M4V " || brand == "M4VH" || brand == "M4VP") return "video/x-m4v";
    if (brand == "qt  ") return "video/quicktime";
    if (brand.substr(0, 3) == "3gp") return "video/3gpp";
    for (auto b : mp4_brands)
        if (brand == b) return "video/mp4";
    return {};
}

} // namespace detail

/// Content type recognised from the leading bytes of a file, or "" when
/// the bytes match no known signature.
inline std::string_view sniff_content_type(std::string_view bytes) noexcept {
    using detail::starts_with;

    if (starts_with(bytes, "\x89PNG\r\n\x1a\n")) return "image/png";
    if (starts_with(bytes, "\xFF\xD8\xFF")) return "image/jpeg";
    if (starts_with(bytes, "GIF87a") || starts_with(bytes, "GIF89a")) return "image/gif";
    if (starts_with(bytes, "RIFF") && starts_with(bytes, "WEBP", 8)) return "image/webp";
    if (starts_with(bytes, "RIFF") && starts_with(bytes, "WAVE", 8)) return "audio/x-wav";
    if (starts_with(bytes, "BM")) return "image/bmp";
    if (starts_with(bytes, std::string_view("\x00\x00\x01\x00", 4))) return "image/x-icon";
    if (starts_with(bytes, "%PDF")) return "application/pdf";
    if (starts_with(bytes, "ftyp", 4)) {
        auto brand = detail::iso_media_type(bytes.substr(8, 4));
        if (!brand.empty()) return brand;
    }
    if (starts_with(bytes, "\x1A\x45\xDF\xA3")) return "video/webm";
    if (starts_with(bytes, "OggS")) return "audio/ogg";
    if (starts_with(bytes, "ID3") || starts_with(bytes, "\xFF\xFB")) return "audio/mpeg";
    if (starts_with(bytes, "fLaC")) return "audio/x-flac";
    if (starts_with(bytes, std::string_view("PK\x03\x04", 4))) return "application/zip";
    if (starts_with(bytes, "\x1F\x8B")) return "application/gzip";
    if (starts_with(bytes, std::string_view("\x00" "asm", 4))) return "application/wasm";
    if (starts_with(bytes, "\x7F" "ELF")) return "application/x-executable";
    if (starts_with(bytes, "wOFF")) return "application/font-woff";
    if (starts_with(bytes, "wOF2")) return "application/font-woff";

    if (starts_with(bytes, "<?xml")) return "text/xml";
    if (detail::looks_like_html(bytes)) return "text/html";
    if (starts_with(bytes, "#!")) return "text/x-shellscript";
    return {};
}

/// Content type by file extension, compared case-insensitively. Unknown
/// extensions map to application/octet-stream.
inline std::string_view content_type_for_extension(const std::filesystem::path& path) {
    auto ext = path.extension().string();
    if (!ext.empty() && ext.front() == '.')
        ext.erase(0, 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (ext == "html" || ext == "htm") return "text/html";
    if (ext == "css") return "text/css";
    if (ext == "js") return "application/javascript";
    if (ext == "json") return "application/json";
    if (ext == "txt") return "text/plain";
    if (ext == "png") return "image/png";
    if (ext == "jpg" || ext == "jpeg") return "image/jpeg";
    if (ext == "gif") return "image/gif";
    if (ext == "svg") return "image/svg+xml";
    if (ext == "pdf") return "application/pdf";
    if (ext == "mp4") return "video/mp4";
    if (ext == "webm") return "video/webm";
    if (ext == "ogg") return "video/ogg";
    return kDEFAULT_CONTENT_TYPE;
}

/// The default classifier used by the file handler: sniff the content,
/// fall back to the extension.
inline std::string classify_content(const std::filesystem::path& path, std::string_view bytes) {
    auto sniffed = sniff_content_type(bytes);
    if (!sniffed.empty())
        return std::string(sniffed);
    return std::string(content_type_for_extension(path));
}

} // namespace file

} // namespace pasture
