#include "net/tcp_socket.hpp"

#include <format>
#include <memory>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace dbgate::net {

namespace {

struct AddrInfoDeleter {
    void operator()(addrinfo* p) const { if (p) freeaddrinfo(p); }
};
using AddrInfoPtr = std::unique_ptr<addrinfo, AddrInfoDeleter>;

bool set_blocking(int fd, bool blocking) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0) return false;
    const int next = blocking ? (flags & ~O_NONBLOCK) : (flags | O_NONBLOCK);
    return fcntl(fd, F_SETFL, next) == 0;
}

} // anonymous namespace

TcpSocket::~TcpSocket() {
    close();
}

TcpSocket::TcpSocket(TcpSocket&& other) noexcept : fd_(other.fd_) {
    other.fd_ = -1;
}

TcpSocket& TcpSocket::operator=(TcpSocket&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

Result<TcpSocket> TcpSocket::connect(const std::string& host, uint16_t port,
                                     std::chrono::milliseconds timeout) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* raw = nullptr;
    const std::string service = std::to_string(port);
    const int rc = getaddrinfo(host.c_str(), service.c_str(), &hints, &raw);
    if (rc != 0) {
        return Result<TcpSocket>::error(ErrorCategory::CONNECT_ERROR,
            std::format("Failed to resolve {}: {}", host, gai_strerror(rc)));
    }
    AddrInfoPtr addrs(raw);

    std::string last_error = "no addresses";
    bool timed_out = false;

    for (const addrinfo* ai = addrs.get(); ai != nullptr; ai = ai->ai_next) {
        TcpSocket sock(::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol));
        if (!sock.is_open()) {
            last_error = strerror(errno);
            continue;
        }

        if (!set_blocking(sock.fd(), false)) {
            last_error = strerror(errno);
            continue;
        }

        int res = ::connect(sock.fd(), ai->ai_addr, ai->ai_addrlen);
        if (res < 0 && errno != EINPROGRESS) {
            last_error = strerror(errno);
            continue;
        }

        if (res < 0) {
            pollfd pfd{sock.fd(), POLLOUT, 0};
            res = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
            if (res == 0) {
                timed_out = true;
                last_error = "connection timed out";
                continue;
            }
            if (res < 0) {
                last_error = strerror(errno);
                continue;
            }
            int so_error = 0;
            socklen_t len = sizeof(so_error);
            getsockopt(sock.fd(), SOL_SOCKET, SO_ERROR, &so_error, &len);
            if (so_error != 0) {
                timed_out = false;
                last_error = strerror(so_error);
                continue;
            }
        }

        if (!set_blocking(sock.fd(), true)) {
            last_error = strerror(errno);
            continue;
        }

        int one = 1;
        setsockopt(sock.fd(), IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
        return Result<TcpSocket>::ok(std::move(sock));
    }

    return Result<TcpSocket>::error(
        timed_out ? ErrorCategory::TIMEOUT_ERROR : ErrorCategory::CONNECT_ERROR,
        std::format("Failed to connect to {}:{}: {}", host, port, last_error));
}

bool TcpSocket::send_all(std::string_view data) {
    size_t sent = 0;
    while (sent < data.size()) {
        const ssize_t n = ::send(fd_, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        sent += static_cast<size_t>(n);
    }
    return true;
}

bool TcpSocket::recv_exact(char* out, size_t n) {
    size_t got = 0;
    while (got < n) {
        const ssize_t r = ::recv(fd_, out + got, n - got, 0);
        if (r < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        if (r == 0) return false;
        got += static_cast<size_t>(r);
    }
    return true;
}

long TcpSocket::recv_some(char* out, size_t n) {
    while (true) {
        const ssize_t r = ::recv(fd_, out, n, 0);
        if (r < 0 && errno == EINTR) continue;
        return static_cast<long>(r);
    }
}

void TcpSocket::shutdown() {
    if (fd_ >= 0) {
        ::shutdown(fd_, SHUT_RDWR);
    }
}

void TcpSocket::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

int TcpSocket::release() {
    const int fd = fd_;
    fd_ = -1;
    return fd;
}

} // namespace dbgate::net
