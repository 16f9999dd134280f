#pragma once

#include <algorithm>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "http/url.hpp"

namespace pasture {

namespace file {

enum class PathSafety
{
    Safe,
    Unsafe,
    ResolutionError,
};

inline std::string_view to_string(PathSafety safety) noexcept {
    switch (safety) {
    case PathSafety::Safe: return "safe";
    case PathSafety::Unsafe: return "unsafe";
    case PathSafety::ResolutionError: return "resolution error";
    }
    return "unknown";
}

struct ResolvedPath
{
    // root joined with the decoded route
    std::filesystem::path path;
    // canonical form of `path`, empty unless it exists and is Safe
    std::filesystem::path canonical;
    // canonical form of the root, empty on ResolutionError
    std::filesystem::path canonical_root;
    PathSafety safety{PathSafety::Unsafe};
    // set on ResolutionError
    std::error_code error;

    /// `canonical` relative to the root, "" for the root itself.
    std::string relative() const {
        if (canonical.empty()) return {};
        auto rel = canonical.lexically_relative(canonical_root).generic_string();
        return rel == "." ? std::string{} : rel;
    }
};

/// Maps request routes onto paths under a root directory and decides
/// whether they stay inside it.
class PathResolver
{
public:
    explicit PathResolver(std::filesystem::path root)
        : root_(std::move(root))
    {}

    const std::filesystem::path& root() const noexcept { return root_; }

    /// `route` is the request target as received, minus at most one leading
    /// '/'. The query and fragment are dropped, escapes decoded and every
    /// leading '/' removed before the rest is joined onto the root. A route
    /// that decodes to a NUL byte is Unsafe.
    ResolvedPath resolve(std::string_view route) const {
        ResolvedPath resolved;
        auto decoded = http::percent_decode(http::strip_query(route));
        if (decoded.find('\0') != std::string::npos) {
            resolved.path = root_;
            resolved.safety = PathSafety::Unsafe;
            return resolved;
        }

        std::string_view relative{decoded};
        while (!relative.empty() && relative.front() == '/')
            relative.remove_prefix(1);
        resolved.path = root_ / std::filesystem::path(relative);

        check(resolved);
        return resolved;
    }

private:
    // Canonicalize the root, then the candidate when it exists or its parent
    // when it does not, and require the root to be a component-wise prefix.
    void check(ResolvedPath& resolved) const {
        namespace fs = std::filesystem;

        resolved.canonical_root = fs::canonical(root_, resolved.error);
        if (resolved.error) {
            resolved.canonical_root.clear();
            resolved.safety = PathSafety::ResolutionError;
            return;
        }

        std::error_code ec;
        bool exists = fs::exists(resolved.path, ec);
        if (ec) {
            resolved.error = ec;
            resolved.safety = PathSafety::ResolutionError;
            return;
        }

        fs::path target;
        if (exists) {
            target = fs::canonical(resolved.path, ec);
        } else {
            auto parent = resolved.path.parent_path();
            if (parent.empty()) {
                resolved.safety = PathSafety::Unsafe;
                return;
            }
            target = fs::canonical(parent, ec);
        }
        if (ec) {
            resolved.error = ec;
            resolved.safety = PathSafety::ResolutionError;
            return;
        }

        if (!is_within(resolved.canonical_root, target)) {
            resolved.safety = PathSafety::Unsafe;
            return;
        }
        resolved.safety = PathSafety::Safe;
        if (exists)
            resolved.canonical = std::move(target);
    }

    static bool is_within(const std::filesystem::path& root, const std::filesystem::path& p) {
        auto [r, _] = std::mismatch(root.begin(), root.end(), p.begin(), p.end());
        return r == root.end();
    }

    std::filesystem::path root_;
};

} // namespace file

} // namespace pasture
