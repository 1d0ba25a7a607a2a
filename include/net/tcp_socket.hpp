#pragma once

#include "core/error.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace dbgate::net {

/**
 * @brief Owning wrapper around a connected TCP socket fd
 *
 * Move-only. The fd is closed on destruction.
 */
class TcpSocket {
public:
    TcpSocket() = default;
    explicit TcpSocket(int fd) : fd_(fd) {}
    ~TcpSocket();

    TcpSocket(TcpSocket&& other) noexcept;
    TcpSocket& operator=(TcpSocket&& other) noexcept;

    TcpSocket(const TcpSocket&) = delete;
    TcpSocket& operator=(const TcpSocket&) = delete;

    /**
     * @brief Resolve host and connect with a bounded wait
     *
     * Tries every address getaddrinfo returns. Errors are CONNECT_ERROR,
     * or TIMEOUT_ERROR when the last attempt timed out.
     */
    [[nodiscard]] static Result<TcpSocket> connect(const std::string& host, uint16_t port,
                                                   std::chrono::milliseconds timeout);

    // Write the whole buffer; false on error or peer close
    [[nodiscard]] bool send_all(std::string_view data);

    // Read exactly n bytes; false on error or EOF before n bytes
    [[nodiscard]] bool recv_exact(char* out, size_t n);

    // Read whatever is available (blocking); 0 on EOF, -1 on error
    [[nodiscard]] long recv_some(char* out, size_t n);

    [[nodiscard]] bool is_open() const { return fd_ >= 0; }
    [[nodiscard]] int fd() const { return fd_; }

    // Shut down both directions so a blocked reader wakes up
    void shutdown();
    void close();

    // Hand the fd to someone else
    [[nodiscard]] int release();

private:
    int fd_ = -1;
};

} // namespace dbgate::net
