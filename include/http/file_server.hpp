#pragma once

#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include <fmt/format.h>

#include "file/file_reader.hpp"
#include "file/mime_types.hpp"
#include "file/path_resolver.hpp"
#include "http/directory_page.hpp"
#include "http/html.hpp"
#include "http/request.hpp"
#include "http/request_parser.hpp"
#include "http/response.hpp"
#include "log/log.hpp"

namespace pasture {

namespace http {

/// Request handlers over a root directory.
///
/// GET serves files and directory listings under the root, POST echoes the
/// request body, every other method is rejected with 400. Handlers never
/// throw for filesystem conditions; those become 403, 404 or 500 responses.
class FileServer
{
public:
    // maps a file path and its content to a Content-Type value
    using Classifier = std::function<std::string(const std::filesystem::path&, std::string_view)>;

    static constexpr std::string_view kINVALID_REQUEST_PATH{"Invalid Request"};

    explicit FileServer(std::filesystem::path root, Classifier classifier = file::classify_content)
        : resolver_(std::move(root))
        , classifier_(std::move(classifier))
    {}

    const std::filesystem::path& root() const noexcept { return resolver_.root(); }

    /// Parse `raw` and dispatch it. A request that does not parse gets a 400
    /// with an empty body.
    Response handle_raw(std::string_view raw) const {
        auto& logger = log::logger();
        Request req;
        if (parser_.parse(req, raw) != RequestParseResult::Completed) {
            logger.log_info("failed to parse request of {} bytes", raw.size());
            Response response{Version::Http11, Status::BadRequest, kINVALID_REQUEST_PATH};
            response.set_body({});
            return response;
        }
        logger.log_debug("parsed request: {} /{} {}, {} headers, {} body bytes",
                         to_string(req.method), req.route, to_string(req.version),
                         req.headers.size(), req.body.size());
        return handle(req);
    }

    Response handle(const Request& req) const {
        switch (req.method) {
        case Method::Get:
            return handle_get(req);
        case Method::Post:
            return handle_post(req);
        default:
            break;
        }
        log::logger().log_info("unsupported method: {}", to_string(req.method));
        Response response{req.version, Status::BadRequest, req.route};
        response.set_body({});
        return response;
    }

    Response handle_get(const Request& req) const {
        auto& logger = log::logger();
        auto resolved = resolver_.resolve(req.route);
        logger.log_debug("requested path: {} ({})", resolved.path.string(), file::to_string(resolved.safety));

        switch (resolved.safety) {
        case file::PathSafety::Safe: {
            std::error_code ec;
            if (std::filesystem::is_directory(resolved.path, ec))
                return serve_directory(req, resolved);
            if (std::filesystem::is_regular_file(resolved.path, ec))
                return serve_file(req, resolved.path);
            logger.log_info("path not found: {}", resolved.path.string());
            return not_found(req);
        }
        case file::PathSafety::Unsafe:
            logger.log_warn("unsafe path access attempted: {}", resolved.path.string());
            return Response{req.version, Status::Forbidden, "Forbidden"};
        case file::PathSafety::ResolutionError:
            logger.log_info("error checking path safety of {}: {}",
                            resolved.path.string(), resolved.error.message());
            break;
        }
        return not_found(req);
    }

    /// Listing of the directory `resolved` points at. A directory that
    /// cannot be read still gets a page, with status 403 or 500 and the
    /// reason below the (empty) list.
    Response serve_directory(const Request& req, const file::ResolvedPath& resolved) const {
        auto location = resolved.relative();
        Response response{req.version, Status::OK, "/" + location};
        response.add_header("Content-Type", "text/html");

        DirectoryPage page{location};
        if (page.has_parent())
            page.add_parent_link();

        std::error_code ec;
        auto entries = list_directory(resolved.path, ec);
        if (ec) {
            log::logger().log_warn("cannot list {}: {}", resolved.path.string(), ec.message());
            if (ec == std::errc::permission_denied) {
                response.set_status(Status::Forbidden);
                page.add_error("Access denied", ec.message());
            } else {
                response.set_status(Status::InternalServerError);
                page.add_error("An error occurred", ec.message());
            }
        } else {
            for (const auto& entry : entries)
                page.add_entry(entry);
        }

        response.set_body(page.finish());
        return response;
    }

    Response serve_file(const Request& req, const std::filesystem::path& path) const {
        std::error_code ec;
        auto content = file::read_file(path, ec);
        if (ec) {
            log::logger().log_info("cannot read {}: {}", path.string(), ec.message());
            if (ec == std::errc::permission_denied) {
                Response response{req.version, Status::Forbidden, path.string()};
                response.add_header("Content-Type", "text/plain");
                response.set_body("Access denied: " + ec.message());
                return response;
            }
            if (ec == std::errc::no_such_file_or_directory) {
                Response response{req.version, Status::NotFound, path.string()};
                response.add_header("Content-Type", "text/plain");
                response.set_body("File not found");
                return response;
            }
            Response response{req.version, Status::InternalServerError, path.string()};
            response.add_header("Content-Type", "text/plain");
            response.set_body("An error occurred: " + ec.message());
            return response;
        }

        Response response{req.version, Status::OK, path.string()};
        response.add_header("Content-Type", classifier_(path, content));
        response.set_body(std::move(content));
        return response;
    }

    Response handle_post(const Request& req) const {
        Response response{req.version, Status::OK, req.route};
        response.add_header("Content-Type", "text/html");
        response.set_body(fmt::format(
            "<html><body><h1>Received POST request</h1><p>Body: {}</p></body></html>",
            escape_html(req.body)));
        return response;
    }

private:
    static Response not_found(const Request& req) {
        Response response{req.version, Status::NotFound, "Not Found"};
        response.add_header("Content-Type", "text/plain");
        response.set_body("File not found");
        return response;
    }

    file::PathResolver resolver_;
    Classifier classifier_;
    RequestParser parser_;
};

} // namespace http

} // namespace pasture
