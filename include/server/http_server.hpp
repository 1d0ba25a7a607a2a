#pragma once

#include "config/config_types.hpp"
#include "core/error.hpp"
#include <atomic>
#include <memory>
#include <string>

// Forward-declare httplib types (avoids pulling in massive header-only library)
namespace httplib {
struct Request;
struct Response;
class Server;
}

namespace dbgate {

class CommandDispatcher;

/**
 * @brief Local HTTP/JSON command surface
 *
 * POST /api/<command> with a JSON object body runs one command;
 * GET /health answers {"status":"ok"}.
 */
class HttpServer {
public:
    HttpServer(std::shared_ptr<CommandDispatcher> dispatcher, ServerConfig config);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Blocks until stop(); throws if the listener cannot be bound
    void start();

    void stop();

    // HTTP status used for an error envelope of the given category
    [[nodiscard]] static int status_for(ErrorCategory category);

private:
    void handle_command(const httplib::Request& req, httplib::Response& res);

    std::shared_ptr<CommandDispatcher> dispatcher_;
    ServerConfig config_;

    std::atomic<httplib::Server*> server_{nullptr};  // set while start() runs
};

} // namespace dbgate
