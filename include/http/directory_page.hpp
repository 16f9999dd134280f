#pragma once

#include <algorithm>
#include <filesystem>
#include <iterator>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <fmt/format.h>

#include "http/html.hpp"
#include "http/url.hpp"

namespace pasture {

namespace http {

struct DirectoryEntry
{
    std::string name;
    bool is_directory{false};
};

/// Entries of `dir` sorted by name. Symlinks are classified by their target.
/// On failure `ec` is set and whatever was read before the failure is
/// returned.
inline std::vector<DirectoryEntry> list_directory(const std::filesystem::path& dir, std::error_code& ec) {
    namespace fs = std::filesystem;
    std::vector<DirectoryEntry> entries;

    fs::directory_iterator it{dir, ec};
    for (; !ec && it != fs::directory_iterator{}; it.increment(ec)) {
        std::error_code type_ec;
        bool is_dir = it->is_directory(type_ec);
        entries.push_back(DirectoryEntry{it->path().filename().string(), is_dir && !type_ec});
    }

    std::sort(entries.begin(), entries.end(),
              [](const DirectoryEntry& a, const DirectoryEntry& b) { return a.name < b.name; });
    return entries;
}


/// HTML listing of one directory.
///
/// `location` is the directory relative to the served root, "" for the root
/// itself. Links are absolute so they work with or without a trailing '/'
/// in the address the browser shows.
class DirectoryPage
{
public:
    explicit DirectoryPage(std::string_view location)
        : location_(location)
    {
        while (!location_.empty() && location_.back() == '/')
            location_.pop_back();
        fmt::format_to(std::back_inserter(out_), "{}<h1>Directory listing for /{}</h1><ul>",
                       kPAGE_HEAD, escape_html(location_));
    }

    bool has_parent() const noexcept { return !location_.empty(); }

    void add_parent_link() {
        auto slash = location_.rfind('/');
        auto parent = slash == std::string::npos ? std::string{"/"}
                                                 : "/" + location_.substr(0, slash) + "/";
        fmt::format_to(std::back_inserter(out_),
                       R"(<li><a href="{}" class="parent-dir"><span class="folder-icon"></span>Parent Directory</a></li>)",
                       escape_html(percent_encode_path(parent)));
    }

    void add_entry(const DirectoryEntry& entry) {
        auto href = (location_.empty() ? "/" : "/" + location_ + "/") + entry.name;
        if (entry.is_directory)
            href.push_back('/');
        fmt::format_to(std::back_inserter(out_),
                       R"(<li><a href="{}"><span class="{}"></span>{}</a></li>)",
                       escape_html(percent_encode_path(href)),
                       entry.is_directory ? "folder-icon" : "file-icon",
                       escape_html(entry.name));
    }

    /// A paragraph after the list, e.g. ("Access denied", reason).
    void add_error(std::string_view label, std::string_view message) {
        errors_.push_back(fmt::format("<p>{}: {}</p>", label, escape_html(message)));
    }

    std::string finish() {
        out_.append(std::string_view{"</ul>"});
        for (const auto& p : errors_)
            out_.append(p);
        out_.append(std::string_view{"</body></html>"});
        return fmt::to_string(out_);
    }

private:
    static constexpr std::string_view kPAGE_HEAD{R"(<!DOCTYPE html>
<html lang="en">
<head>
    <meta charset="utf-8">
    <meta name="viewport" content="width=device-width, initial-scale=1.0">
    <title>Directory listing</title>
    <style>
    body {
        font-family: Arial, sans-serif;
        line-height: 1.6;
        color: #333;
        max-width: 800px;
        margin: 0 auto;
        padding: 20px;
        background-color: #f4f4f4;
    }
    h1 {
        color: #2c3e50;
        border-bottom: 2px solid #3498db;
        padding-bottom: 10px;
    }
    ul {
        list-style-type: none;
        padding: 0;
    }
    li {
        margin-bottom: 10px;
        background-color: #fff;
        border-radius: 4px;
        overflow: hidden;
    }
    li a {
        display: block;
        padding: 10px 15px;
        color: #2980b9;
        text-decoration: none;
        transition: background-color 0.3s ease;
    }
    li a:hover {
        background-color: #ecf0f1;
    }
    .parent-dir {
        font-weight: bold;
    }
    .file-icon, .folder-icon {
        margin-right: 10px;
    }
    .file-icon::before {
        content: "\01F4C4";
    }
    .folder-icon::before {
        content: "\01F4C1";
    }
    </style>
</head>
<body>)"};

    std::string location_;
    fmt::memory_buffer out_;
    std::vector<std::string> errors_;
};

} // namespace http

} // namespace pasture
