#include <exception>
#include <memory>
#include <utility>

#include "http/file_server.hpp"
#include "http/session.hpp"
#include "log/log.hpp"
#include "net/address.hpp"
#include "net/connection.hpp"
#include "options.hpp"
#include "server.hpp"
#include "task.hpp"

using namespace pasture;

// pasture_server [root-dir]
//
// Serves root-dir (default: the working directory) on 127.0.0.1:5500.
int main(int argc, char* argv[]) {
    auto& logger = log::logger();

    try {
        auto options = parse_command_line(argc, argv);
        logger.setLogLevel(options.log_level);
        for (const auto& arg : options.ignored_args)
            logger.log_warn("ignoring extra argument: {}", arg);

        http::FileServer file_server{options.root_dir};
        logger.log_info("serving {}", options.root_dir.string());

        Server server{net::make_loopback_v4(options.port), options};
        server.set_handler([&file_server, &options](std::unique_ptr<net::Connection> conn) {
            return http::serve_connection(std::move(conn), file_server, options);
        });

        server.serve();
    } catch (const std::exception& e) {
        logger.log_error("fatal: {}", e.what());
        logger.flush();
        return 1;
    }

    logger.flush();
    return 0;
}
