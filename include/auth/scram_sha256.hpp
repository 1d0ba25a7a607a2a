#pragma once

#include "core/error.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dbgate {

// SCRAM-SHA-256 primitives (RFC 5802 / RFC 7677)
namespace scram {

// Cryptographically secure random nonce, base64-encoded; nullopt when the RNG fails
[[nodiscard]] std::optional<std::string> generate_nonce(size_t byte_count = 24);

// PBKDF2-HMAC-SHA-256 (Hi in RFC 5802); empty on failure
[[nodiscard]] std::vector<uint8_t> hi(
    std::string_view password,
    const std::vector<uint8_t>& salt,
    uint32_t iterations);

[[nodiscard]] std::vector<uint8_t> hmac_sha256(
    const std::vector<uint8_t>& key,
    std::string_view message);

[[nodiscard]] std::vector<uint8_t> sha256(const std::vector<uint8_t>& data);

[[nodiscard]] std::string base64_encode(const std::vector<uint8_t>& data);
[[nodiscard]] std::optional<std::vector<uint8_t>> base64_decode(std::string_view encoded);

// XOR of two equal-length byte vectors; empty when the lengths differ
[[nodiscard]] std::vector<uint8_t> xor_bytes(
    const std::vector<uint8_t>& a,
    const std::vector<uint8_t>& b);

// "n=user" escaping: '=' -> "=3D", ',' -> "=2C"
[[nodiscard]] std::string escape_username(std::string_view username);

struct ServerFirstMessage {
    std::string nonce;
    std::vector<uint8_t> salt;
    uint32_t iterations = 0;
};

// Parse "r=<nonce>,s=<salt>,i=<iterations>"
[[nodiscard]] Result<ServerFirstMessage> parse_server_first(std::string_view message);

} // namespace scram

/**
 * @brief Client side of one SCRAM-SHA-256 conversation
 *
 * client_first() -> server-first -> client_final() -> server-final.
 * The server signature is checked before the conversation counts as done.
 */
class ScramSha256Client {
public:
    ScramSha256Client(std::string username, std::string password, std::string client_nonce);

    // "n,,n=<user>,r=<nonce>"
    [[nodiscard]] std::string client_first() const;

    // Consumes server-first, returns "c=biws,r=<nonce>,p=<proof>"
    [[nodiscard]] Result<std::string> client_final(std::string_view server_first);

    // Checks "v=<signature>" against the expected server signature
    [[nodiscard]] Result<void> verify_server_final(std::string_view server_final) const;

private:
    std::string client_first_bare() const;

    std::string username_;
    std::string password_;
    std::string client_nonce_;
    std::vector<uint8_t> expected_server_signature_;
};

} // namespace dbgate
