#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

#include "log/loglevel.hpp"

namespace pasture {

struct ServerOptions
{
    static constexpr uint16_t kDEFAULT_PORT = 5500;
    static constexpr std::size_t kDEFAULT_MAX_REQUEST_SIZE = 1024 * 1024;
    static constexpr std::size_t kDEFAULT_MAX_HEADER_SIZE = 8 * 1024;

    std::filesystem::path root_dir;
    uint16_t port{kDEFAULT_PORT};
    int worker_threads{default_worker_threads()};

    // a request is read in chunks into a buffer that grows up to this size
    std::size_t max_request_size{kDEFAULT_MAX_REQUEST_SIZE};
    // limit for the request line plus headers
    std::size_t max_header_size{kDEFAULT_MAX_HEADER_SIZE};
    // applies to every single socket read or write
    std::chrono::milliseconds io_timeout{std::chrono::seconds(30)};

    log::LogLevel log_level{log::INFO};

    // arguments the command line carried but we do not understand
    std::vector<std::string> ignored_args;

    static int default_worker_threads() noexcept {
        auto n = std::thread::hardware_concurrency();
        return n == 0 ? 1 : static_cast<int>(n);
    }
};

/// pasture_server [root-dir]
///
/// The root directory defaults to the working directory and must exist.
/// Throws std::invalid_argument when it does not, or is not a directory.
inline ServerOptions parse_command_line(int argc, const char* const argv[]) {
    ServerOptions options;

    if (argc > 1) {
        options.root_dir = argv[1];
    } else {
        std::error_code ec;
        options.root_dir = std::filesystem::current_path(ec);
        if (ec)
            throw std::invalid_argument("cannot determine working directory: " + ec.message());
    }

    for (int i = 2; i < argc; ++i)
        options.ignored_args.emplace_back(argv[i]);

    std::error_code ec;
    if (!std::filesystem::is_directory(options.root_dir, ec)) {
        throw std::invalid_argument(
            "root directory '" + options.root_dir.string() + "' is not a directory"
            + (ec ? ": " + ec.message() : std::string{}));
    }

    return options;
}

} // namespace pasture
