#include "server/http_server.hpp"
#include "server/command_dispatcher.hpp"
#include "core/json.hpp"
#include "core/utils.hpp"

#include <httplib.h>

#include <format>
#include <stdexcept>

namespace dbgate {

namespace {
constexpr const char* kJsonContentType = "application/json";
} // anonymous namespace

HttpServer::HttpServer(std::shared_ptr<CommandDispatcher> dispatcher, ServerConfig config)
    : dispatcher_(std::move(dispatcher)),
      config_(std::move(config)) {}

HttpServer::~HttpServer() {
    stop();
}

int HttpServer::status_for(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE:             return 200;
        case ErrorCategory::INVALID_REQUEST:  return 400;
        case ErrorCategory::AUTH_UNSUPPORTED: return 400;
        case ErrorCategory::NOT_CONNECTED:    return 409;
        case ErrorCategory::QUERY_ERROR:      return 422;
        case ErrorCategory::CONNECT_ERROR:    return 502;
        case ErrorCategory::TIMEOUT_ERROR:    return 504;
        case ErrorCategory::INTERNAL_ERROR:   return 500;
    }
    return 500;
}

// ============================================================================
// start() - creates server, registers routes, listens
// ============================================================================

void HttpServer::start() {
    httplib::Server svr;

    const size_t pool_size = config_.thread_pool_size;
    svr.new_task_queue = [pool_size] {
        return new httplib::ThreadPool(pool_size);
    };
    svr.set_payload_max_length(config_.max_body_bytes);

    svr.Get("/health", [](const httplib::Request&, httplib::Response& res) {
        res.set_content(R"({"status":"ok"})", kJsonContentType);
    });

    svr.Post(R"(/api/([A-Za-z0-9_]+))", [this](const httplib::Request& req, httplib::Response& res) {
        handle_command(req, res);
    });

    if (!svr.bind_to_port(config_.host, config_.port)) {
        throw std::runtime_error(std::format("Failed to bind HTTP server to {}:{}",
            config_.host, config_.port));
    }

    server_.store(&svr);

    utils::log::info(std::format("dbgate listening on http://{}:{} ({} threads)",
        config_.host, config_.port, config_.thread_pool_size));

    const bool clean = svr.listen_after_bind();

    server_.store(nullptr);

    if (!clean) {
        throw std::runtime_error("HTTP server stopped unexpectedly");
    }
    utils::log::info("Server stopped");
}

void HttpServer::stop() {
    if (auto* svr = server_.load()) {
        svr->stop();
    }
}

void HttpServer::handle_command(const httplib::Request& req, httplib::Response& res) {
    const std::string command = req.matches[1];

    Json args = Json::object();
    if (!req.body.empty()) {
        args = Json::parse(req.body, nullptr, false);
        if (args.is_discarded()) {
            const auto err = Result<Json>::error(ErrorCategory::INVALID_REQUEST, "Request body is not valid JSON");
            res.status = status_for(err.error_category());
            res.set_content(CommandDispatcher::envelope(err).dump(), kJsonContentType);
            return;
        }
    }

    utils::Timer timer;
    const auto result = dispatcher_->dispatch(command, args);

    if (result.is_ok()) {
        utils::log::debug(std::format("{} ok ({}ms)", command, timer.elapsed_ms().count()));
        res.status = 200;
    } else {
        utils::log::debug(std::format("{} failed ({}ms): [{}] {}", command, timer.elapsed_ms().count(),
            error_category_to_string(result.error_category()), result.error_message()));
        res.status = status_for(result.error_category());
    }

    // Invalid UTF-8 from a driver is already replaced; keep dump() from throwing regardless
    res.set_content(CommandDispatcher::envelope(result).dump(-1, ' ', false, Json::error_handler_t::replace),
        kJsonContentType);
}

} // namespace dbgate
