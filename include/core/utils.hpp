#pragma once

#include <string>
#include <string_view>
#include <cctype>
#include <charconv>
#include <ctime>
#include <limits>
#include <chrono>
#include <cstdint>
#include <format>
#include <iostream>
#include <atomic>
#include <mutex>
#include <optional>
#include <type_traits>
#include <vector>

namespace dbgate::utils {

// ============================================================================
// Type-Safe Range Check (eliminates impossible comparisons at compile time)
// ============================================================================

template<auto Lo, auto Hi, typename T>
constexpr bool in_range(T value) {
    using Common = std::common_type_t<T, decltype(Lo), decltype(Hi)>;
    bool below = false;
    bool above = false;
    if constexpr (static_cast<Common>(std::numeric_limits<T>::min()) >= static_cast<Common>(Lo)) {
        (void)value; // T can never be below Lo
    } else {
        below = static_cast<Common>(value) < static_cast<Common>(Lo);
    }
    if constexpr (static_cast<Common>(std::numeric_limits<T>::max()) <= static_cast<Common>(Hi)) {
        (void)value; // T can never exceed Hi
    } else {
        above = static_cast<Common>(value) > static_cast<Common>(Hi);
    }
    return !below && !above;
}

// ============================================================================
// Numeric Parsing (std::from_chars, locale independent)
// ============================================================================

// Parse integer, returns std::nullopt on failure or trailing garbage
template<typename T>
    requires std::is_integral_v<T>
[[nodiscard]] inline std::optional<T> try_parse_int(std::string_view sv) {
    T result{};
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), result);
    if (ec != std::errc{} || ptr != sv.data() + sv.size()) return std::nullopt;
    return result;
}

// Parse integer from string_view, returns default_val on failure
template<typename T>
    requires std::is_integral_v<T>
[[nodiscard]] inline T parse_int(std::string_view sv, T default_val = T{}) {
    return try_parse_int<T>(sv).value_or(default_val);
}

[[nodiscard]] inline std::optional<double> try_parse_double(std::string_view sv) {
    double result{};
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), result);
    if (ec != std::errc{} || ptr != sv.data() + sv.size()) return std::nullopt;
    return result;
}

// ============================================================================
// String Utilities
// ============================================================================

inline std::string to_lower(std::string_view str) {
    std::string result(str);
    for (char& c : result) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return result;
}

inline std::string to_upper(std::string_view str) {
    std::string result(str);
    for (char& c : result) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return result;
}

inline std::string trim(std::string_view str) {
    const auto start = str.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string_view::npos) {
        return "";
    }
    const auto end = str.find_last_not_of(" \t\n\r\f\v");
    return std::string(str.substr(start, end - start + 1));
}

// Split on runs of ASCII whitespace, dropping empty tokens
inline std::vector<std::string> split_whitespace(std::string_view str) {
    std::vector<std::string> tokens;
    size_t i = 0;
    while (i < str.size()) {
        while (i < str.size() && std::isspace(static_cast<unsigned char>(str[i]))) ++i;
        const size_t start = i;
        while (i < str.size() && !std::isspace(static_cast<unsigned char>(str[i]))) ++i;
        if (i > start) tokens.emplace_back(str.substr(start, i - start));
    }
    return tokens;
}

// First word of a statement, upper-cased; leading whitespace and '(' skipped
inline std::string leading_keyword(std::string_view sql) {
    size_t i = 0;
    while (i < sql.size() &&
           (std::isspace(static_cast<unsigned char>(sql[i])) || sql[i] == '(')) {
        ++i;
    }
    const size_t start = i;
    while (i < sql.size() &&
           (std::isalnum(static_cast<unsigned char>(sql[i])) || sql[i] == '_')) {
        ++i;
    }
    return to_upper(sql.substr(start, i - start));
}

/**
 * @brief Convert arbitrary bytes into valid UTF-8.
 *
 * Every maximal invalid subsequence is replaced with U+FFFD, matching the
 * behaviour of the usual "lossy" decoders. Overlong encodings and surrogates
 * are rejected.
 */
[[nodiscard]] inline std::string lossy_utf8(std::string_view bytes) {
    static constexpr std::string_view kReplacement = "\xEF\xBF\xBD";

    std::string out;
    out.reserve(bytes.size());

    const auto* s = reinterpret_cast<const unsigned char*>(bytes.data());
    const size_t n = bytes.size();
    size_t i = 0;

    while (i < n) {
        const unsigned char c = s[i];
        if (c < 0x80) {
            out += static_cast<char>(c);
            ++i;
            continue;
        }

        size_t len = 0;
        unsigned char lo = 0x80;
        unsigned char hi = 0xBF;
        if (c >= 0xC2 && c <= 0xDF) {
            len = 2;
        } else if (c >= 0xE0 && c <= 0xEF) {
            len = 3;
            if (c == 0xE0) lo = 0xA0;
            if (c == 0xED) hi = 0x9F;
        } else if (c >= 0xF0 && c <= 0xF4) {
            len = 4;
            if (c == 0xF0) lo = 0x90;
            if (c == 0xF4) hi = 0x8F;
        } else {
            out += kReplacement;
            ++i;
            continue;
        }

        size_t j = 1;
        for (; j < len && i + j < n; ++j) {
            const unsigned char cc = s[i + j];
            const unsigned char min = (j == 1) ? lo : 0x80;
            const unsigned char max = (j == 1) ? hi : 0xBF;
            if (cc < min || cc > max) break;
        }

        if (j == len) {
            out.append(bytes.substr(i, len));
        } else {
            out += kReplacement;
        }
        i += j;
    }
    return out;
}

// Percent-decode a URI component ("%40" -> "@"); malformed escapes are kept verbatim
[[nodiscard]] inline std::string percent_decode(std::string_view in) {
    std::string out;
    out.reserve(in.size());
    for (size_t i = 0; i < in.size(); ++i) {
        if (in[i] == '%' && i + 2 < in.size()) {
            unsigned int val{};
            const auto [ptr, ec] = std::from_chars(in.data() + i + 1, in.data() + i + 3, val, 16);
            if (ec == std::errc{} && ptr == in.data() + i + 3) {
                out += static_cast<char>(val);
                i += 2;
                continue;
            }
        }
        out += in[i];
    }
    return out;
}

// Percent-encode everything outside the URI "unreserved" set
[[nodiscard]] inline std::string percent_encode(std::string_view in) {
    std::string out;
    out.reserve(in.size());
    for (const char ch : in) {
        const auto c = static_cast<unsigned char>(ch);
        if (std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~') {
            out += ch;
        } else {
            out += std::format("%{:02X}", static_cast<unsigned int>(c));
        }
    }
    return out;
}

// ============================================================================
// Performance Timer
// ============================================================================

class Timer {
public:
    Timer() : start_(std::chrono::steady_clock::now()) {}

    template<typename Duration = std::chrono::microseconds>
    Duration elapsed() const {
        const auto end = std::chrono::steady_clock::now();
        return std::chrono::duration_cast<Duration>(end - start_);
    }

    std::chrono::milliseconds elapsed_ms() const {
        return elapsed<std::chrono::milliseconds>();
    }

private:
    std::chrono::steady_clock::time_point start_;
};

// ============================================================================
// Logging (thread-safe, stderr, level-tagged)
// ============================================================================

namespace log {

enum class Level { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3 };

namespace detail {
    inline std::mutex& log_mutex() {
        static std::mutex m;
        return m;
    }

    inline std::atomic<int>& min_level() {
        static std::atomic<int> level{static_cast<int>(Level::INFO)};
        return level;
    }

    inline void write(Level level, const std::string& msg) {
        if (static_cast<int>(level) < min_level().load(std::memory_order_relaxed)) {
            return;
        }

        const char* tag = "";
        switch (level) {
            case Level::DEBUG: tag = "DEBUG"; break;
            case Level::INFO:  tag = "INFO "; break;
            case Level::WARN:  tag = "WARN "; break;
            case Level::ERROR: tag = "ERROR"; break;
        }

        const auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf;
        ::localtime_r(&time, &tm_buf);

        char time_buf[16];
        std::strftime(time_buf, sizeof(time_buf), "%H:%M:%S", &tm_buf);

        const auto formatted = std::format("{}.{:03d} [{}] {}\n",
            time_buf, static_cast<int>(ms.count()), tag, msg);

        std::lock_guard<std::mutex> lock(log_mutex());
        std::cerr << formatted;
    }
} // namespace detail

inline void set_level(Level level) {
    detail::min_level().store(static_cast<int>(level), std::memory_order_relaxed);
}

// Accepts "debug", "info", "warn"/"warning", "error"; unknown names keep the current level
inline bool set_level(std::string_view name) {
    const std::string lower = to_lower(name);
    if (lower == "debug") { set_level(Level::DEBUG); return true; }
    if (lower == "info") { set_level(Level::INFO); return true; }
    if (lower == "warn" || lower == "warning") { set_level(Level::WARN); return true; }
    if (lower == "error") { set_level(Level::ERROR); return true; }
    return false;
}

inline void debug(const std::string& msg) {
    detail::write(Level::DEBUG, msg);
}

inline void info(const std::string& msg) {
    detail::write(Level::INFO, msg);
}

inline void warn(const std::string& msg) {
    detail::write(Level::WARN, msg);
}

inline void error(const std::string& msg) {
    detail::write(Level::ERROR, msg);
}

} // namespace log

} // namespace dbgate::utils
