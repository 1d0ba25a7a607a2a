#include <catch2/catch_test_macros.hpp>
#include "auth/scram_sha256.hpp"

using namespace dbgate;

namespace {

// RFC 7677 section 3 example exchange
constexpr const char* kUser = "user";
constexpr const char* kPassword = "pencil";
constexpr const char* kClientNonce = "rOprNGfwEbeRWgbNEkqO";
constexpr const char* kServerFirst =
    "r=rOprNGfwEbeRWgbNEkqO%hvYDpWUa2RaTCAfuxFIlj)hNlF$k0,"
    "s=W22ZaJ0SNY7soEsUEjb6gQ==,i=4096";
constexpr const char* kClientFinal =
    "c=biws,r=rOprNGfwEbeRWgbNEkqO%hvYDpWUa2RaTCAfuxFIlj)hNlF$k0,"
    "p=dHzbZapWIk4jUhN+Ute9ytag9zjfMHgsqmmiz7AndVQ=";
constexpr const char* kServerFinal = "v=6rriTRBi23WpRR/wtup+mMhUZUn/dB5nLTJRsjl95G4=";

} // anonymous namespace

TEST_CASE("Scram: base64 encode/decode", "[scram]") {
    REQUIRE(scram::base64_encode(std::vector<uint8_t>{}).empty());

    const std::vector<uint8_t> data = {'H', 'e', 'l', 'l', 'o'};
    REQUIRE(scram::base64_encode(data) == "SGVsbG8=");

    const auto decoded = scram::base64_decode("SGVsbG8=");
    REQUIRE(decoded.has_value());
    REQUIRE(*decoded == data);

    const std::vector<uint8_t> binary = {0x00, 0xFF, 0x80, 0x7F, 0x01};
    const auto rt = scram::base64_decode(scram::base64_encode(binary));
    REQUIRE(rt.has_value());
    REQUIRE(*rt == binary);
}

TEST_CASE("Scram: base64 rejects malformed input", "[scram]") {
    CHECK_FALSE(scram::base64_decode("abc").has_value());
    CHECK_FALSE(scram::base64_decode("ab!d").has_value());
}

TEST_CASE("Scram: nonce generation", "[scram]") {
    const auto nonce1 = scram::generate_nonce();
    const auto nonce2 = scram::generate_nonce();

    REQUIRE(nonce1.has_value());
    REQUIRE(nonce2.has_value());
    REQUIRE(!nonce1->empty());
    REQUIRE(*nonce1 != *nonce2);
    // No ',' so it can sit inside an attribute list
    CHECK(nonce1->find(',') == std::string::npos);
}

TEST_CASE("Scram: SHA-256 and HMAC", "[scram]") {
    // SHA-256("") = e3b0c442...7852b855
    const auto hash = scram::sha256({});
    REQUIRE(hash.size() == 32);
    CHECK(hash[0] == 0xe3);
    CHECK(hash[31] == 0x55);

    // RFC 4231 test case 1
    const std::vector<uint8_t> key(20, 0x0b);
    const auto mac = scram::hmac_sha256(key, "Hi There");
    REQUIRE(mac.size() == 32);
    CHECK(mac[0] == 0xb0);
    CHECK(mac[1] == 0x34);
    CHECK(mac[31] == 0xf7);
}

TEST_CASE("Scram: XOR bytes", "[scram]") {
    const std::vector<uint8_t> a = {0xFF, 0x00, 0xAA};
    const std::vector<uint8_t> b = {0x0F, 0xF0, 0x55};
    CHECK(scram::xor_bytes(a, b) == std::vector<uint8_t>{0xF0, 0xF0, 0xFF});
    CHECK(scram::xor_bytes(a, {0x01}).empty());
}

TEST_CASE("Scram: username escaping", "[scram]") {
    CHECK(scram::escape_username("plain") == "plain");
    CHECK(scram::escape_username("a=b,c") == "a=3Db=2Cc");
}

TEST_CASE("Scram: parse server-first", "[scram]") {
    auto first = scram::parse_server_first(kServerFirst);
    REQUIRE(first.is_ok());
    CHECK(first.value().nonce == "rOprNGfwEbeRWgbNEkqO%hvYDpWUa2RaTCAfuxFIlj)hNlF$k0");
    CHECK(first.value().iterations == 4096);
    CHECK(first.value().salt.size() == 16);

    SECTION("server error attribute") {
        auto err = scram::parse_server_first("e=unknown-user");
        REQUIRE(err.is_error());
        CHECK(err.error_category() == ErrorCategory::CONNECT_ERROR);
    }

    SECTION("missing iteration count") {
        CHECK(scram::parse_server_first("r=abc,s=W22ZaJ0SNY7soEsUEjb6gQ==").is_error());
    }

    SECTION("bad salt") {
        CHECK(scram::parse_server_first("r=abc,s=***,i=4096").is_error());
    }
}

TEST_CASE("Scram: RFC 7677 client conversation", "[scram]") {
    ScramSha256Client client(kUser, kPassword, kClientNonce);

    CHECK(client.client_first() == "n,,n=user,r=rOprNGfwEbeRWgbNEkqO");

    auto final_msg = client.client_final(kServerFirst);
    REQUIRE(final_msg.is_ok());
    CHECK(final_msg.value() == kClientFinal);

    CHECK(client.verify_server_final(kServerFinal).is_ok());
}

TEST_CASE("Scram: forged server signature is rejected", "[scram]") {
    ScramSha256Client client(kUser, kPassword, kClientNonce);
    REQUIRE(client.client_final(kServerFirst).is_ok());

    auto bad = client.verify_server_final("v=AAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAA=");
    REQUIRE(bad.is_error());
    CHECK(bad.error_category() == ErrorCategory::CONNECT_ERROR);

    CHECK(client.verify_server_final("e=other-error").is_error());
}

TEST_CASE("Scram: server nonce must extend the client nonce", "[scram]") {
    ScramSha256Client client(kUser, kPassword, kClientNonce);

    auto r = client.client_final("r=somethingElse123,s=W22ZaJ0SNY7soEsUEjb6gQ==,i=4096");
    REQUIRE(r.is_error());
    CHECK(r.error_category() == ErrorCategory::CONNECT_ERROR);
}

TEST_CASE("Scram: verify before client_final fails", "[scram]") {
    ScramSha256Client client(kUser, kPassword, kClientNonce);
    CHECK(client.verify_server_final(kServerFinal).is_error());
}
