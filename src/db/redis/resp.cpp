#include "db/redis/resp.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace dbgate::resp {

namespace {

constexpr int kMaxDepth = 32;

// Reads the CRLF-terminated header after the type byte
parse_result read_line(std::string_view buf, size_t pos, std::string_view& line, size_t& next) {
    const size_t crlf = buf.find("\r\n", pos);
    if (crlf == std::string_view::npos) {
        return parse_result::incomplete;
    }
    line = buf.substr(pos, crlf - pos);
    next = crlf + 2;
    return parse_result::complete;
}

parse_result parse_at(std::string_view buf, size_t pos, RespValue& out, size_t& next, int depth) {
    if (depth > kMaxDepth) {
        return parse_result::error;
    }
    if (pos >= buf.size()) {
        return parse_result::incomplete;
    }

    const char type = buf[pos];
    std::string_view line;
    size_t after = 0;
    if (const auto r = read_line(buf, pos + 1, line, after); r != parse_result::complete) {
        return r;
    }

    switch (type) {
        case '+':
            out = RespValue::simple(std::string(line));
            next = after;
            return parse_result::complete;

        case '-':
            out = RespValue::error(std::string(line));
            next = after;
            return parse_result::complete;

        case ':': {
            const auto v = utils::try_parse_int<int64_t>(line);
            if (!v) return parse_result::error;
            out = RespValue::from_integer(*v);
            next = after;
            return parse_result::complete;
        }

        case '$': {
            const auto len = utils::try_parse_int<int64_t>(line);
            if (!len || *len < -1) return parse_result::error;
            if (*len == -1) {
                out = RespValue::nil();
                next = after;
                return parse_result::complete;
            }
            const auto n = static_cast<size_t>(*len);
            if (buf.size() < after + n + 2) {
                return parse_result::incomplete;
            }
            if (buf.substr(after + n, 2) != "\r\n") {
                return parse_result::error;
            }
            out = RespValue::bulk(std::string(buf.substr(after, n)));
            next = after + n + 2;
            return parse_result::complete;
        }

        case '*': {
            const auto count = utils::try_parse_int<int64_t>(line);
            if (!count || *count < -1) return parse_result::error;
            if (*count == -1) {
                out = RespValue::nil();
                next = after;
                return parse_result::complete;
            }
            std::vector<RespValue> items;
            items.reserve(static_cast<size_t>(std::min<int64_t>(*count, 1024)));
            size_t cursor = after;
            for (int64_t i = 0; i < *count; ++i) {
                RespValue item;
                const auto r = parse_at(buf, cursor, item, cursor, depth + 1);
                if (r != parse_result::complete) return r;
                items.push_back(std::move(item));
            }
            out = RespValue::array(std::move(items));
            next = cursor;
            return parse_result::complete;
        }

        default:
            return parse_result::error;
    }
}

} // anonymous namespace

void encode_command_into(std::string& out, const std::vector<std::string>& args) {
    out += std::format("*{}\r\n", args.size());
    for (const auto& arg : args) {
        out += std::format("${}\r\n", arg.size());
        out += arg;
        out += "\r\n";
    }
}

parse_result parse_reply(std::string_view buf, RespValue& out, size_t& consumed) {
    size_t next = 0;
    const auto r = parse_at(buf, 0, out, next, 0);
    if (r == parse_result::complete) {
        consumed = next;
    }
    return r;
}

std::string format_reply(const RespValue& value) {
    switch (value.type) {
        case RespValue::Type::NIL:
            return "(nil)";
        case RespValue::Type::INTEGER:
            return std::to_string(value.integer);
        case RespValue::Type::BULK:
            return utils::lossy_utf8(value.str);
        case RespValue::Type::SIMPLE:
            return value.str;
        case RespValue::Type::ERROR:
            return std::format("Error(\"{}\")", value.str);
        case RespValue::Type::ARRAY: {
            std::string out = "[";
            for (size_t i = 0; i < value.elements.size(); ++i) {
                if (i > 0) out += ", ";
                out += format_reply(value.elements[i]);
            }
            out += "]";
            return out;
        }
    }
    return {};
}

} // namespace dbgate::resp
