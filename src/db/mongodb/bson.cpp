#include "db/mongodb/bson.hpp"

#include <cstring>
#include <format>
#include <optional>
#include <vector>

namespace dbgate::bson {

int32_t read_int32(const char* p) {
    const auto* u = reinterpret_cast<const unsigned char*>(p);
    return static_cast<int32_t>(
        static_cast<uint32_t>(u[0]) |
        (static_cast<uint32_t>(u[1]) << 8) |
        (static_cast<uint32_t>(u[2]) << 16) |
        (static_cast<uint32_t>(u[3]) << 24));
}

void append_int32(std::string& out, int32_t value) {
    const auto v = static_cast<uint32_t>(value);
    out += static_cast<char>(v & 0xFF);
    out += static_cast<char>((v >> 8) & 0xFF);
    out += static_cast<char>((v >> 16) & 0xFF);
    out += static_cast<char>((v >> 24) & 0xFF);
}

namespace {

uint64_t read_uint64(const char* p) {
    const auto* u = reinterpret_cast<const unsigned char*>(p);
    uint64_t v = 0;
    for (int i = 7; i >= 0; --i) {
        v = (v << 8) | u[i];
    }
    return v;
}

std::string to_hex(std::string_view bytes) {
    std::string out;
    out.reserve(bytes.size() * 2);
    for (const char c : bytes) {
        out += std::format("{:02x}", static_cast<unsigned int>(static_cast<unsigned char>(c)));
    }
    return out;
}

class Reader {
public:
    explicit Reader(std::string_view data) : data_(data) {}

    Result<Json> document(bool as_array, int depth) {
        if (depth > kMaxDepth) {
            return fail("BSON nesting too deep");
        }
        if (remaining() < 5) {
            return fail("BSON document truncated");
        }
        const int32_t size = read_int32(data_.data() + pos_);
        if (size < 5 || static_cast<size_t>(size) > remaining()) {
            return fail(std::format("Invalid BSON document size {}", size));
        }
        const size_t end = pos_ + static_cast<size_t>(size) - 1;
        if (data_[end] != '\0') {
            return fail("BSON document missing terminator");
        }
        pos_ += 4;

        Json out = as_array ? Json::array() : Json::object();
        while (pos_ < end) {
            const auto type = static_cast<unsigned char>(data_[pos_++]);
            auto name = cstring();
            if (!name) {
                return fail("BSON element name truncated");
            }
            auto value = element(type, depth);
            if (value.is_error()) {
                return value;
            }
            if (as_array) {
                out.push_back(std::move(value.value()));
            } else {
                out[*name] = std::move(value.value());
            }
        }
        if (pos_ != end) {
            return fail("BSON element overruns its document");
        }
        ++pos_;
        return Result<Json>::ok(std::move(out));
    }

    size_t position() const { return pos_; }

private:
    static constexpr int kMaxDepth = 100;

    size_t remaining() const { return data_.size() - pos_; }

    static Result<Json> fail(std::string message) {
        return Result<Json>::error(ErrorCategory::QUERY_ERROR, std::move(message));
    }

    std::optional<std::string> cstring() {
        const size_t nul = data_.find('\0', pos_);
        if (nul == std::string_view::npos) return std::nullopt;
        std::string s(data_.substr(pos_, nul - pos_));
        pos_ = nul + 1;
        return s;
    }

    std::optional<std::string_view> take(size_t n) {
        if (remaining() < n) return std::nullopt;
        const auto out = data_.substr(pos_, n);
        pos_ += n;
        return out;
    }

    Result<Json> element(unsigned char type, int depth) {
        switch (type) {
            case 0x01: {  // double
                auto raw = take(8);
                if (!raw) return fail("BSON double truncated");
                const uint64_t bits = read_uint64(raw->data());
                double d;
                std::memcpy(&d, &bits, sizeof(d));
                return Result<Json>::ok(d);
            }
            case 0x02:    // string
            case 0x0D:    // JavaScript code
            case 0x0E: {  // symbol
                auto len_raw = take(4);
                if (!len_raw) return fail("BSON string truncated");
                const int32_t len = read_int32(len_raw->data());
                if (len < 1) return fail("Invalid BSON string length");
                auto body = take(static_cast<size_t>(len));
                if (!body || body->back() != '\0') return fail("BSON string truncated");
                return Result<Json>::ok(std::string(body->substr(0, body->size() - 1)));
            }
            case 0x03:
                return document(false, depth + 1);
            case 0x04:
                return document(true, depth + 1);
            case 0x05: {  // binary
                auto len_raw = take(4);
                if (!len_raw) return fail("BSON binary truncated");
                const int32_t len = read_int32(len_raw->data());
                if (len < 0) return fail("Invalid BSON binary length");
                auto subtype = take(1);
                auto body = take(static_cast<size_t>(len));
                if (!subtype || !body) return fail("BSON binary truncated");
                Json::binary_t::container_type bytes(body->begin(), body->end());
                return Result<Json>::ok(Json::binary(std::move(bytes),
                    static_cast<std::uint8_t>((*subtype)[0])));
            }
            case 0x06:    // undefined
            case 0x0A:    // null
                return Result<Json>::ok(nullptr);
            case 0x07: {  // ObjectId
                auto raw = take(12);
                if (!raw) return fail("BSON ObjectId truncated");
                return Result<Json>::ok(Json{{"$oid", to_hex(*raw)}});
            }
            case 0x08: {
                auto raw = take(1);
                if (!raw) return fail("BSON boolean truncated");
                return Result<Json>::ok((*raw)[0] != 0);
            }
            case 0x09: {  // UTC datetime
                auto raw = take(8);
                if (!raw) return fail("BSON datetime truncated");
                return Result<Json>::ok(Json{{"$date", static_cast<int64_t>(read_uint64(raw->data()))}});
            }
            case 0x0B: {  // regex
                auto pattern = cstring();
                auto options = cstring();
                if (!pattern || !options) return fail("BSON regex truncated");
                return Result<Json>::ok(Json{{"$regex", *pattern}, {"$options", *options}});
            }
            case 0x10: {
                auto raw = take(4);
                if (!raw) return fail("BSON int32 truncated");
                return Result<Json>::ok(read_int32(raw->data()));
            }
            case 0x11: {  // internal timestamp
                auto raw = take(8);
                if (!raw) return fail("BSON timestamp truncated");
                return Result<Json>::ok(Json{{"$timestamp", read_uint64(raw->data())}});
            }
            case 0x12: {
                auto raw = take(8);
                if (!raw) return fail("BSON int64 truncated");
                return Result<Json>::ok(static_cast<int64_t>(read_uint64(raw->data())));
            }
            case 0x13: {
                auto raw = take(16);
                if (!raw) return fail("BSON decimal128 truncated");
                return Result<Json>::ok(Json{{"$numberDecimal", to_hex(*raw)}});
            }
            case 0xFF:
                return Result<Json>::ok(Json{{"$minKey", 1}});
            case 0x7F:
                return Result<Json>::ok(Json{{"$maxKey", 1}});
            default:
                return fail(std::format("Unsupported BSON element type 0x{:02x}", type));
        }
    }

    std::string_view data_;
    size_t pos_ = 0;
};

} // anonymous namespace

Result<std::string> encode(const Json& document) {
    if (!document.is_object()) {
        return Result<std::string>::error(ErrorCategory::INVALID_REQUEST,
            "BSON documents must be JSON objects");
    }

    std::vector<std::uint8_t> bytes;
    try {
        Json::to_bson(document, bytes);
    } catch (const Json::exception& e) {
        return Result<std::string>::error(ErrorCategory::INVALID_REQUEST,
            std::format("BSON encoding failed: {}", e.what()));
    }
    return Result<std::string>::ok(std::string(bytes.begin(), bytes.end()));
}

Result<Json> decode(std::string_view bytes) {
    Reader reader(bytes);
    auto doc = reader.document(false, 0);
    if (doc.is_ok() && reader.position() != bytes.size()) {
        return Result<Json>::error(ErrorCategory::QUERY_ERROR, "Trailing bytes after BSON document");
    }
    return doc;
}

} // namespace dbgate::bson
