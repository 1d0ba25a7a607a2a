#include "db/redis/redis_client.hpp"
#include "core/utils.hpp"

#include <format>

namespace dbgate {

RedisClient::RedisClient(net::TcpSocket socket, std::string endpoint,
                         std::chrono::milliseconds reply_timeout)
    : socket_(std::move(socket)),
      endpoint_(std::move(endpoint)),
      reply_timeout_(reply_timeout) {
    reader_ = std::jthread([this](std::stop_token) { read_loop(); });
}

RedisClient::~RedisClient() {
    {
        std::lock_guard lock(pending_mutex_);
        broken_.store(true);
    }
    socket_.shutdown();
    if (reader_.joinable()) {
        reader_.join();
    }
}

Result<std::shared_ptr<RedisClient>> RedisClient::connect(
    const RedisConnectParams& params,
    std::chrono::milliseconds connect_timeout,
    std::chrono::milliseconds reply_timeout) {
    using R = Result<std::shared_ptr<RedisClient>>;

    auto sock = net::TcpSocket::connect(params.host, params.port, connect_timeout);
    if (sock.is_error()) {
        return R::error_from(sock);
    }

    auto client = std::make_shared<RedisClient>(
        std::move(sock.value()), std::format("{}:{}", params.host, params.port), reply_timeout);

    // Handshake replies must not be errors
    const auto expect_ok = [&client, connect_timeout](const std::vector<std::string>& args) -> Result<void> {
        auto reply = client->exchange(args, connect_timeout);
        if (reply.is_error()) {
            return Result<void>::error(ErrorCategory::CONNECT_ERROR, reply.error_message());
        }
        if (reply.value().is_error()) {
            return Result<void>::error(ErrorCategory::CONNECT_ERROR, reply.value().str);
        }
        return Result<void>::ok();
    };

    if (params.password && !params.password->empty()) {
        if (auto r = expect_ok({"AUTH", *params.password}); r.is_error()) {
            return R::error_from(r);
        }
    }
    if (params.database != 0) {
        if (auto r = expect_ok({"SELECT", std::to_string(params.database)}); r.is_error()) {
            return R::error_from(r);
        }
    }
    if (auto r = expect_ok({"PING"}); r.is_error()) {
        return R::error_from(r);
    }

    return R::ok(std::move(client));
}

Result<RespValue> RedisClient::command(const std::vector<std::string>& args) {
    return exchange(args, reply_timeout_);
}

Result<RespValue> RedisClient::exchange(const std::vector<std::string>& args,
                                        std::chrono::milliseconds timeout) {
    std::string request;
    resp::encode_command_into(request, args);

    auto reply = std::make_shared<std::promise<Result<RespValue>>>();
    auto future = reply->get_future();

    {
        std::lock_guard write_lock(write_mutex_);
        {
            std::lock_guard lock(pending_mutex_);
            if (broken_.load()) {
                return Result<RespValue>::error(ErrorCategory::QUERY_ERROR,
                    std::format("Connection to {} is closed", endpoint_));
            }
            pending_.push_back(reply);
        }
        if (!socket_.send_all(request)) {
            // Fails our queued reply along with the rest
            fail_pending(std::format("Failed to send to {}", endpoint_));
        }
    }

    if (future.wait_for(timeout) == std::future_status::timeout) {
        fail_pending(std::format("Connection to {} closed after a reply timeout", endpoint_));
        return Result<RespValue>::error(ErrorCategory::TIMEOUT_ERROR,
            std::format("No reply from {} within {}ms", endpoint_, timeout.count()));
    }
    return future.get();
}

void RedisClient::read_loop() {
    std::string buffer;
    char chunk[16384];

    while (true) {
        while (!buffer.empty()) {
            RespValue value;
            size_t consumed = 0;
            const auto r = resp::parse_reply(buffer, value, consumed);
            if (r == resp::parse_result::incomplete) {
                break;
            }
            if (r == resp::parse_result::error) {
                fail_pending(std::format("Protocol error from {}", endpoint_));
                return;
            }
            buffer.erase(0, consumed);
            if (!deliver(std::move(value))) {
                fail_pending(std::format("Unsolicited reply from {}", endpoint_));
                return;
            }
        }

        const long n = socket_.recv_some(chunk, sizeof(chunk));
        if (n <= 0) {
            fail_pending(std::format("Connection to {} lost", endpoint_));
            return;
        }
        buffer.append(chunk, static_cast<size_t>(n));
    }
}

bool RedisClient::deliver(RespValue value) {
    PendingReply reply;
    {
        std::lock_guard lock(pending_mutex_);
        if (pending_.empty()) {
            return false;
        }
        reply = std::move(pending_.front());
        pending_.pop_front();
    }
    reply->set_value(Result<RespValue>::ok(std::move(value)));
    return true;
}

void RedisClient::fail_pending(const std::string& message) {
    std::deque<PendingReply> failed;
    bool was_broken = false;
    {
        std::lock_guard lock(pending_mutex_);
        was_broken = broken_.exchange(true);
        failed.swap(pending_);
    }
    if (!was_broken) {
        utils::log::warn(message);
    }

    // Wakes the reader; the descriptor itself is closed on destruction
    socket_.shutdown();
    for (auto& reply : failed) {
        reply->set_value(Result<RespValue>::error(ErrorCategory::QUERY_ERROR, message));
    }
}

} // namespace dbgate
