#include "auth/scram_sha256.hpp"
#include "core/utils.hpp"

#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>
#include <openssl/sha.h>
#include <format>

namespace dbgate {

namespace {

// Walk "a=value,b=value" and hand each attribute to fn
template<typename Fn>
void for_each_attribute(std::string_view message, Fn&& fn) {
    size_t pos = 0;
    while (pos + 2 <= message.size() && message[pos + 1] == '=') {
        const char attr = message[pos];
        const size_t value_start = pos + 2;
        const size_t value_end = message.find(',', value_start);
        const std::string_view value = (value_end == std::string_view::npos)
            ? message.substr(value_start)
            : message.substr(value_start, value_end - value_start);
        fn(attr, value);
        if (value_end == std::string_view::npos) break;
        pos = value_end + 1;
    }
}

} // anonymous namespace

namespace scram {

// ============================================================================
// Low-level crypto primitives
// ============================================================================

std::optional<std::string> generate_nonce(size_t byte_count) {
    std::vector<uint8_t> bytes(byte_count);
    if (RAND_bytes(bytes.data(), static_cast<int>(byte_count)) != 1) {
        return std::nullopt;
    }
    return base64_encode(bytes);
}

std::vector<uint8_t> hi(
    std::string_view password,
    const std::vector<uint8_t>& salt,
    uint32_t iterations) {
    std::vector<uint8_t> result(SHA256_DIGEST_LENGTH);
    if (PKCS5_PBKDF2_HMAC(
            password.data(), static_cast<int>(password.size()),
            salt.data(), static_cast<int>(salt.size()),
            static_cast<int>(iterations),
            EVP_sha256(),
            SHA256_DIGEST_LENGTH, result.data()) != 1) {
        return {};
    }
    return result;
}

std::vector<uint8_t> hmac_sha256(
    const std::vector<uint8_t>& key,
    std::string_view message) {
    std::vector<uint8_t> result(SHA256_DIGEST_LENGTH);
    unsigned int len = 0;
    if (!HMAC(EVP_sha256(),
              key.data(), static_cast<int>(key.size()),
              reinterpret_cast<const uint8_t*>(message.data()),
              message.size(),
              result.data(), &len)) {
        return {};
    }
    result.resize(len);
    return result;
}

std::vector<uint8_t> sha256(const std::vector<uint8_t>& data) {
    std::vector<uint8_t> result(SHA256_DIGEST_LENGTH);
    SHA256(data.data(), data.size(), result.data());
    return result;
}

std::vector<uint8_t> xor_bytes(
    const std::vector<uint8_t>& a,
    const std::vector<uint8_t>& b) {
    if (a.size() != b.size()) {
        return {};
    }
    std::vector<uint8_t> result(a.size());
    for (size_t i = 0; i < a.size(); ++i) {
        result[i] = a[i] ^ b[i];
    }
    return result;
}

// ============================================================================
// Base64
// ============================================================================

std::string base64_encode(const std::vector<uint8_t>& data) {
    const size_t out_len = ((data.size() + 2) / 3) * 4;
    std::string result(out_len + 1, '\0');

    const int encoded = EVP_EncodeBlock(
        reinterpret_cast<uint8_t*>(result.data()),
        data.data(), static_cast<int>(data.size()));

    result.resize(encoded < 0 ? 0 : static_cast<size_t>(encoded));
    return result;
}

std::optional<std::vector<uint8_t>> base64_decode(std::string_view encoded) {
    if (encoded.empty()) return std::vector<uint8_t>{};
    if (encoded.size() % 4 != 0) return std::nullopt;

    std::vector<uint8_t> result((encoded.size() / 4) * 3);
    const int decoded = EVP_DecodeBlock(
        result.data(),
        reinterpret_cast<const uint8_t*>(encoded.data()),
        static_cast<int>(encoded.size()));

    if (decoded < 0) {
        return std::nullopt;
    }

    // EVP_DecodeBlock counts padding as output bytes
    size_t actual = static_cast<size_t>(decoded);
    if (encoded[encoded.size() - 1] == '=') --actual;
    if (encoded[encoded.size() - 2] == '=') --actual;
    result.resize(actual);
    return result;
}

std::string escape_username(std::string_view username) {
    std::string out;
    out.reserve(username.size());
    for (const char c : username) {
        if (c == '=') out += "=3D";
        else if (c == ',') out += "=2C";
        else out += c;
    }
    return out;
}

// ============================================================================
// Message parsing
// ============================================================================

Result<ServerFirstMessage> parse_server_first(std::string_view message) {
    using R = Result<ServerFirstMessage>;

    ServerFirstMessage result;
    std::string salt_b64;
    std::string iterations;
    std::string server_error;

    for_each_attribute(message, [&](char attr, std::string_view value) {
        switch (attr) {
            case 'r': result.nonce = std::string(value); break;
            case 's': salt_b64 = std::string(value); break;
            case 'i': iterations = std::string(value); break;
            case 'e': server_error = std::string(value); break;
            default: break;
        }
    });

    if (!server_error.empty()) {
        return R::error(ErrorCategory::CONNECT_ERROR,
            std::format("SCRAM server error: {}", server_error));
    }
    if (result.nonce.empty() || salt_b64.empty() || iterations.empty()) {
        return R::error(ErrorCategory::CONNECT_ERROR, "Malformed SCRAM server-first message");
    }

    auto salt = base64_decode(salt_b64);
    if (!salt) {
        return R::error(ErrorCategory::CONNECT_ERROR, "Malformed SCRAM salt");
    }
    result.salt = std::move(*salt);

    const auto count = utils::try_parse_int<uint32_t>(iterations);
    if (!count || *count == 0) {
        return R::error(ErrorCategory::CONNECT_ERROR,
            std::format("Invalid SCRAM iteration count '{}'", iterations));
    }
    result.iterations = *count;
    return R::ok(std::move(result));
}

} // namespace scram

// ============================================================================
// ScramSha256Client
// ============================================================================

ScramSha256Client::ScramSha256Client(std::string username, std::string password,
                                     std::string client_nonce)
    : username_(std::move(username)),
      password_(std::move(password)),
      client_nonce_(std::move(client_nonce)) {}

std::string ScramSha256Client::client_first_bare() const {
    return std::format("n={},r={}", scram::escape_username(username_), client_nonce_);
}

std::string ScramSha256Client::client_first() const {
    return "n,," + client_first_bare();
}

Result<std::string> ScramSha256Client::client_final(std::string_view server_first) {
    using R = Result<std::string>;

    auto parsed = scram::parse_server_first(server_first);
    if (parsed.is_error()) {
        return R::error_from(parsed);
    }
    const auto& first = parsed.value();

    if (!first.nonce.starts_with(client_nonce_)) {
        return R::error(ErrorCategory::CONNECT_ERROR, "SCRAM server nonce does not extend the client nonce");
    }

    // "biws" is base64("n,,")
    const std::string without_proof = std::format("c=biws,r={}", first.nonce);
    const std::string auth_message = std::format("{},{},{}",
        client_first_bare(), server_first, without_proof);

    const auto salted = scram::hi(password_, first.salt, first.iterations);
    if (salted.empty()) {
        return R::error(ErrorCategory::INTERNAL_ERROR, "PBKDF2 key derivation failed");
    }

    const auto client_key = scram::hmac_sha256(salted, "Client Key");
    const auto stored_key = scram::sha256(client_key);
    const auto client_signature = scram::hmac_sha256(stored_key, auth_message);
    const auto proof = scram::xor_bytes(client_key, client_signature);
    if (proof.empty()) {
        return R::error(ErrorCategory::INTERNAL_ERROR, "HMAC computation failed");
    }

    const auto server_key = scram::hmac_sha256(salted, "Server Key");
    expected_server_signature_ = scram::hmac_sha256(server_key, auth_message);

    return R::ok(std::format("{},p={}", without_proof, scram::base64_encode(proof)));
}

Result<void> ScramSha256Client::verify_server_final(std::string_view server_final) const {
    std::string verifier;
    std::string server_error;
    for_each_attribute(server_final, [&](char attr, std::string_view value) {
        if (attr == 'v') verifier = std::string(value);
        else if (attr == 'e') server_error = std::string(value);
    });

    if (!server_error.empty()) {
        return Result<void>::error(ErrorCategory::CONNECT_ERROR,
            std::format("SCRAM server error: {}", server_error));
    }

    const auto signature = scram::base64_decode(verifier);
    if (verifier.empty() || !signature || expected_server_signature_.empty() ||
        *signature != expected_server_signature_) {
        return Result<void>::error(ErrorCategory::CONNECT_ERROR,
            "SCRAM server signature mismatch");
    }
    return Result<void>::ok();
}

} // namespace dbgate
