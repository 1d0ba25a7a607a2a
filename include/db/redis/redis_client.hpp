#pragma once

#include "core/error.hpp"
#include "db/connect_params.hpp"
#include "db/redis/resp.hpp"
#include "net/tcp_socket.hpp"

#include <atomic>
#include <chrono>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace dbgate {

/**
 * @brief Sends one command and returns its reply
 *
 * Error replies come back as RespValue::Type::ERROR; a Result error means
 * the exchange itself failed.
 */
class IRedisCommander {
public:
    virtual ~IRedisCommander() = default;

    [[nodiscard]] virtual Result<RespValue> command(const std::vector<std::string>& args) = 0;

    // Where the client is connected ("host:port")
    [[nodiscard]] virtual std::string endpoint() const = 0;
};

/**
 * @brief Single-connection pipelined RESP2 client
 *
 * Callers never wait on each other for the socket: command() writes its
 * request and queues a pending reply, and a reader thread completes queued
 * replies in wire order. Only the write itself is serialized. A reply that
 * does not arrive within reply_timeout fails with TIMEOUT_ERROR and breaks
 * the connection, which fails every other pending request too. Once broken
 * the client refuses new commands.
 */
class RedisClient : public IRedisCommander {
public:
    static constexpr std::chrono::milliseconds kDefaultReplyTimeout{30000};

    /**
     * @brief Connect, AUTH when a password is given, SELECT a non-zero
     *        database, then PING
     */
    [[nodiscard]] static Result<std::shared_ptr<RedisClient>> connect(
        const RedisConnectParams& params,
        std::chrono::milliseconds connect_timeout,
        std::chrono::milliseconds reply_timeout = kDefaultReplyTimeout);

    RedisClient(net::TcpSocket socket, std::string endpoint,
                std::chrono::milliseconds reply_timeout = kDefaultReplyTimeout);
    ~RedisClient() override;

    RedisClient(const RedisClient&) = delete;
    RedisClient& operator=(const RedisClient&) = delete;

    Result<RespValue> command(const std::vector<std::string>& args) override;

    std::string endpoint() const override { return endpoint_; }

    [[nodiscard]] bool is_broken() const { return broken_.load(); }

private:
    using PendingReply = std::shared_ptr<std::promise<Result<RespValue>>>;

    Result<RespValue> exchange(const std::vector<std::string>& args,
                               std::chrono::milliseconds timeout);
    void read_loop();
    // False when nothing was waiting for the reply
    bool deliver(RespValue value);
    // Marks the client broken and fails every queued reply with message
    void fail_pending(const std::string& message);

    net::TcpSocket socket_;
    std::string endpoint_;
    std::chrono::milliseconds reply_timeout_;
    std::atomic<bool> broken_{false};

    // Held across one request write so queue order matches wire order
    std::mutex write_mutex_;

    std::mutex pending_mutex_;
    std::deque<PendingReply> pending_;

    std::jthread reader_;
};

} // namespace dbgate
