#include "db/mongodb/mongo_client.hpp"
#include "db/mongodb/bson.hpp"
#include "auth/scram_sha256.hpp"
#include "core/utils.hpp"

#include <format>
#include <optional>

namespace dbgate {

namespace {

constexpr size_t kHeaderSize = 16;
constexpr int32_t kMaxMessageSize = 48 * 1024 * 1024;
constexpr uint32_t kChecksumPresent = 1u;

bool reply_ok(const Json& reply) {
    const auto it = reply.find("ok");
    if (it == reply.end()) return false;
    if (it->is_number()) return it->get<double>() == 1.0;
    if (it->is_boolean()) return it->get<bool>();
    return false;
}

std::string reply_error(const Json& reply) {
    if (const auto it = reply.find("errmsg"); it != reply.end() && it->is_string()) {
        return it->get<std::string>();
    }
    return std::format("Command failed: {}", reply.dump());
}

Json binary_payload(std::string_view text) {
    Json::binary_t::container_type bytes(text.begin(), text.end());
    return Json::binary(std::move(bytes), 0);
}

std::string payload_text(const Json& reply) {
    const auto it = reply.find("payload");
    if (it == reply.end()) return {};
    if (it->is_binary()) {
        const auto& bin = it->get_binary();
        return std::string(bin.begin(), bin.end());
    }
    if (it->is_string()) return it->get<std::string>();
    return {};
}

} // anonymous namespace

// ============================================================================
// OP_MSG codec
// ============================================================================

Result<std::string> encode_op_msg(const Json& body, int32_t request_id) {
    auto doc = bson::encode(body);
    if (doc.is_error()) {
        return doc;
    }

    std::string out;
    out.reserve(kHeaderSize + 5 + doc.value().size());
    bson::append_int32(out, 0);  // length, patched below
    bson::append_int32(out, request_id);
    bson::append_int32(out, 0);  // responseTo
    bson::append_int32(out, MongoClient::kOpMsg);
    bson::append_int32(out, 0);  // flagBits
    out += '\0';                 // section kind 0: body
    out += doc.value();

    std::string length;
    bson::append_int32(length, static_cast<int32_t>(out.size()));
    out.replace(0, 4, length);
    return Result<std::string>::ok(std::move(out));
}

Result<Json> decode_op_msg(std::string_view message) {
    using R = Result<Json>;

    if (message.size() < kHeaderSize + 5) {
        return R::error(ErrorCategory::QUERY_ERROR, "OP_MSG reply truncated");
    }
    const int32_t op_code = bson::read_int32(message.data() + 12);
    if (op_code != MongoClient::kOpMsg) {
        return R::error(ErrorCategory::QUERY_ERROR,
            std::format("Unexpected reply opcode {}", op_code));
    }

    const auto flags = static_cast<uint32_t>(bson::read_int32(message.data() + kHeaderSize));
    size_t end = message.size();
    if (flags & kChecksumPresent) {
        end -= 4;
    }

    size_t pos = kHeaderSize + 4;
    std::optional<Json> body;
    while (pos < end) {
        const char kind = message[pos++];
        if (pos + 4 > end) {
            return R::error(ErrorCategory::QUERY_ERROR, "OP_MSG section truncated");
        }
        const int32_t size = bson::read_int32(message.data() + pos);
        if (size < 5 || pos + static_cast<size_t>(size) > end) {
            return R::error(ErrorCategory::QUERY_ERROR, "OP_MSG section size out of range");
        }
        if (kind == 0) {
            auto doc = bson::decode(message.substr(pos, static_cast<size_t>(size)));
            if (doc.is_error()) {
                return doc;
            }
            body = std::move(doc.value());
        } else if (kind != 1) {
            return R::error(ErrorCategory::QUERY_ERROR,
                std::format("Unknown OP_MSG section kind {}", static_cast<int>(kind)));
        }
        // Kind 1 document sequences are not used in replies we request
        pos += static_cast<size_t>(size);
    }

    if (!body) {
        return R::error(ErrorCategory::QUERY_ERROR, "OP_MSG reply has no body section");
    }
    return R::ok(std::move(*body));
}

// ============================================================================
// MongoClient
// ============================================================================

MongoClient::MongoClient(net::TcpSocket socket, std::string endpoint)
    : socket_(std::move(socket)),
      endpoint_(std::move(endpoint)) {}

Result<std::shared_ptr<MongoClient>> MongoClient::connect(
    const MongoConnectParams& params,
    std::chrono::milliseconds connect_timeout) {
    using R = Result<std::shared_ptr<MongoClient>>;

    auto sock = net::TcpSocket::connect(params.host, params.port, connect_timeout);
    if (sock.is_error()) {
        return R::error_from(sock);
    }

    auto client = std::make_shared<MongoClient>(
        std::move(sock.value()), std::format("{}:{}", params.host, params.port));

    Json hello = {
        {"hello", 1},
        {"client", {
            {"application", {{"name", "dbgate"}}},
            {"driver", {{"name", "dbgate"}, {"version", "1.0"}}},
            {"os", {{"type", "Linux"}}}
        }}
    };
    auto hello_reply = client->run_command("admin", std::move(hello));
    if (hello_reply.is_error()) {
        return R::error(ErrorCategory::CONNECT_ERROR, hello_reply.error_message());
    }

    const bool has_user = params.username && !params.username->empty();
    const bool has_password = params.password && !params.password->empty();
    if (has_user && has_password) {
        auto auth = client->authenticate(*params.username, *params.password,
            params.auth_database.empty() ? "admin" : params.auth_database);
        if (auth.is_error()) {
            return R::error(ErrorCategory::CONNECT_ERROR,
                std::format("Authentication failed: {}", auth.error_message()));
        }
    }

    return R::ok(std::move(client));
}

Result<void> MongoClient::authenticate(const std::string& username,
                                       const std::string& password,
                                       const std::string& auth_database) {
    const auto nonce = scram::generate_nonce();
    if (!nonce) {
        return Result<void>::error(ErrorCategory::INTERNAL_ERROR, "Failed to generate SCRAM nonce");
    }
    ScramSha256Client scram(username, password, *nonce);

    Json start = {
        {"saslStart", 1},
        {"mechanism", "SCRAM-SHA-256"},
        {"payload", binary_payload(scram.client_first())},
        {"autoAuthorize", 1},
        {"options", {{"skipEmptyExchange", true}}}
    };
    auto first = run_command(auth_database, std::move(start));
    if (first.is_error()) {
        return Result<void>::error_from(first);
    }

    auto final_message = scram.client_final(payload_text(first.value()));
    if (final_message.is_error()) {
        return Result<void>::error_from(final_message);
    }

    const Json conversation_id = first.value().value("conversationId", Json(1));
    Json cont = {
        {"saslContinue", 1},
        {"conversationId", conversation_id},
        {"payload", binary_payload(final_message.value())}
    };
    auto second = run_command(auth_database, std::move(cont));
    if (second.is_error()) {
        return Result<void>::error_from(second);
    }

    auto verified = scram.verify_server_final(payload_text(second.value()));
    if (verified.is_error()) {
        return verified;
    }

    // Servers without skipEmptyExchange want one more empty round
    if (!second.value().value("done", false)) {
        Json empty = {
            {"saslContinue", 1},
            {"conversationId", conversation_id},
            {"payload", binary_payload("")}
        };
        auto third = run_command(auth_database, std::move(empty));
        if (third.is_error()) {
            return Result<void>::error_from(third);
        }
    }

    utils::log::debug(std::format("MongoDB {}: authenticated as '{}'", endpoint_, username));
    return Result<void>::ok();
}

Result<Json> MongoClient::run_command(const std::string& database, Json command) {
    std::lock_guard lock(mutex_);

    if (broken_ || !socket_.is_open()) {
        return Result<Json>::error(ErrorCategory::QUERY_ERROR,
            std::format("Connection to {} is closed", endpoint_));
    }

    command["$db"] = database;
    const int32_t request_id = next_request_id_++;
    auto message = encode_op_msg(command, request_id);
    if (message.is_error()) {
        return Result<Json>::error_from(message);
    }

    auto reply = round_trip(message.value(), request_id);
    if (reply.is_error()) {
        return reply;
    }
    if (!reply_ok(reply.value())) {
        return Result<Json>::error(ErrorCategory::QUERY_ERROR, reply_error(reply.value()));
    }
    return reply;
}

Result<Json> MongoClient::round_trip(const std::string& message, int32_t request_id) {
    if (!socket_.send_all(message)) {
        broken_ = true;
        return Result<Json>::error(ErrorCategory::QUERY_ERROR,
            std::format("Failed to send to {}", endpoint_));
    }

    std::string header(kHeaderSize, '\0');
    if (!socket_.recv_exact(header.data(), header.size())) {
        broken_ = true;
        return Result<Json>::error(ErrorCategory::QUERY_ERROR,
            std::format("Connection to {} lost", endpoint_));
    }

    const int32_t length = bson::read_int32(header.data());
    const int32_t response_to = bson::read_int32(header.data() + 8);
    if (length < static_cast<int32_t>(kHeaderSize) || length > kMaxMessageSize) {
        broken_ = true;
        return Result<Json>::error(ErrorCategory::QUERY_ERROR,
            std::format("Invalid reply length {} from {}", length, endpoint_));
    }

    std::string full = std::move(header);
    full.resize(static_cast<size_t>(length));
    if (!socket_.recv_exact(full.data() + kHeaderSize, full.size() - kHeaderSize)) {
        broken_ = true;
        return Result<Json>::error(ErrorCategory::QUERY_ERROR,
            std::format("Connection to {} lost", endpoint_));
    }

    if (response_to != request_id) {
        broken_ = true;
        return Result<Json>::error(ErrorCategory::QUERY_ERROR,
            std::format("Reply to request {} arrived for {}", response_to, request_id));
    }
    return decode_op_msg(full);
}

} // namespace dbgate
