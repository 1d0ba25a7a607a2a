#pragma once

#include "core/error.hpp"
#include "core/json.hpp"
#include "db/connect_params.hpp"
#include "net/tcp_socket.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace dbgate {

/**
 * @brief Runs one database command and returns the reply document
 *
 * A reply with ok != 1 is reported as QUERY_ERROR carrying errmsg.
 */
class IDocumentClient {
public:
    virtual ~IDocumentClient() = default;

    [[nodiscard]] virtual Result<Json> run_command(const std::string& database, Json command) = 0;

    [[nodiscard]] virtual std::string endpoint() const = 0;
};

/**
 * @brief Single-connection MongoDB client speaking OP_MSG
 */
class MongoClient : public IDocumentClient {
public:
    static constexpr int32_t kOpMsg = 2013;

    /**
     * @brief Connect, send hello, authenticate with SCRAM-SHA-256 when a
     *        username and password are both given
     */
    [[nodiscard]] static Result<std::shared_ptr<MongoClient>> connect(
        const MongoConnectParams& params,
        std::chrono::milliseconds connect_timeout);

    MongoClient(net::TcpSocket socket, std::string endpoint);

    Result<Json> run_command(const std::string& database, Json command) override;

    std::string endpoint() const override { return endpoint_; }

private:
    Result<void> authenticate(const std::string& username,
                              const std::string& password,
                              const std::string& auth_database);

    Result<Json> round_trip(const std::string& message, int32_t request_id);

    net::TcpSocket socket_;
    std::string endpoint_;
    int32_t next_request_id_ = 1;
    bool broken_ = false;
    std::mutex mutex_;
};

/**
 * @brief Encode an OP_MSG carrying one body section
 */
[[nodiscard]] Result<std::string> encode_op_msg(const Json& body, int32_t request_id);

/**
 * @brief Extract the body document from a complete OP_MSG reply
 *        (header included)
 */
[[nodiscard]] Result<Json> decode_op_msg(std::string_view message);

} // namespace dbgate
