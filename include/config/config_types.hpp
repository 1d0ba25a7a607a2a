#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace dbgate {

// ============================================================================
// Configuration Types
// ============================================================================

struct ServerConfig {
    std::string host;
    uint16_t port;
    size_t thread_pool_size;
    size_t max_body_bytes;

    ServerConfig()
        : host("127.0.0.1"),
          port(7420),
          thread_pool_size(4),
          max_body_bytes(16 * 1024 * 1024) {}
};

struct LoggingConfig {
    std::string level = "info";
};

/**
 * @brief Connect and pool settings applied to every backend
 */
struct GatewayConfig {
    std::chrono::milliseconds connect_timeout{5000};
    size_t pool_min_connections = 1;
    size_t pool_max_connections = 5;
    std::chrono::milliseconds pool_acquire_timeout{5000};
    std::chrono::milliseconds pool_idle_timeout{300000};
    std::chrono::seconds pool_max_lifetime{3600};  // 0 = disabled
    std::chrono::milliseconds redis_reply_timeout{30000};
};

struct TunnelConfig {
    std::chrono::milliseconds handshake_timeout{5000};
};

struct AppConfig {
    ServerConfig server;
    LoggingConfig logging;
    GatewayConfig gateway;
    TunnelConfig tunnel;
};

} // namespace dbgate
