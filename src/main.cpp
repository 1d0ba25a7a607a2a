#include "core/utils.hpp"
#include "config/config_loader.hpp"
#include "gateway/gateway.hpp"
#include "server/command_dispatcher.hpp"
#include "server/http_server.hpp"

#include <csignal>
#include <cstring>
#include <filesystem>
#include <format>
#include <iostream>
#include <memory>

using namespace dbgate;

// Global instances for signal handling
std::shared_ptr<HttpServer> g_server;

void signal_handler(int signal) {
    utils::log::info(std::format("Received signal {}, shutting down...", signal));
    if (g_server) {
        g_server->stop();
    }
}

namespace {

void print_usage(const char* argv0) {
    std::cerr << std::format("Usage: {} [--config <path>]\n", argv0);
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    try {
        std::string config_file;
        for (int i = 1; i < argc; ++i) {
            if ((std::strcmp(argv[i], "--config") == 0 || std::strcmp(argv[i], "-c") == 0) && i + 1 < argc) {
                config_file = argv[++i];
            } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
                print_usage(argv[0]);
                return 0;
            } else {
                print_usage(argv[0]);
                return 2;
            }
        }

        AppConfig config;
        if (!config_file.empty()) {
            auto loaded = ConfigLoader::load_from_file(config_file);
            if (!loaded.success) {
                utils::log::error(loaded.error_message);
                return 1;
            }
            config = std::move(loaded.config);
        } else if (std::filesystem::exists("config/dbgate.toml")) {
            auto loaded = ConfigLoader::load_from_file("config/dbgate.toml");
            if (!loaded.success) {
                utils::log::error(loaded.error_message);
                return 1;
            }
            config_file = "config/dbgate.toml";
            config = std::move(loaded.config);
        }

        utils::log::set_level(config.logging.level);
        utils::log::info(std::format("dbgate starting ({})",
            config_file.empty() ? "built-in defaults" : config_file));

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);
        // A peer closing a tunnel socket must not kill the process
        std::signal(SIGPIPE, SIG_IGN);

        auto gateway = std::make_shared<Gateway>(config.gateway,
            GatewayDependencies::defaults(config.gateway, config.tunnel));
        auto dispatcher = std::make_shared<CommandDispatcher>(gateway);
        g_server = std::make_shared<HttpServer>(dispatcher, config.server);

        // Blocks until a signal stops the server
        g_server->start();

        gateway->shutdown();
        g_server.reset();

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return 1;
    }

    return 0;
}
