#include <catch2/catch_test_macros.hpp>
#include "net/tcp_socket.hpp"
#include "tunnel/port_forwarder.hpp"
#include "tunnel/ssh_session.hpp"
#include "tunnel/tunnel_manager.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstring>
#include <format>
#include <mutex>
#include <thread>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

using namespace dbgate;

namespace {

constexpr std::chrono::milliseconds kConnectTimeout{1000};

// Channel that answers every write with the upper-cased bytes
class UpperEchoChannel : public IForwardChannel {
public:
    explicit UpperEchoChannel(std::shared_ptr<std::atomic<int>> closed)
        : closed_(std::move(closed)) {}

    long read(char* buf, size_t n) override {
        if (eof_) return -1;
        if (buffer_.empty()) return 0;
        const size_t take = std::min(n, buffer_.size());
        std::memcpy(buf, buffer_.data(), take);
        buffer_.erase(0, take);
        return static_cast<long>(take);
    }

    long write(const char* buf, size_t n) override {
        for (size_t i = 0; i < n; ++i) {
            if (buf[i] == '!') {
                // Remote end hangs up after a '!'
                eof_ = true;
                return static_cast<long>(n);
            }
            buffer_ += static_cast<char>(std::toupper(static_cast<unsigned char>(buf[i])));
        }
        return static_cast<long>(n);
    }

    void close() override { closed_->fetch_add(1); }

private:
    std::shared_ptr<std::atomic<int>> closed_;
    std::string buffer_;
    bool eof_ = false;
};

class FakeOpener : public IChannelOpener {
public:
    Result<std::unique_ptr<IForwardChannel>> open_channel(
        const std::string& remote_host, uint16_t remote_port,
        const std::string& origin_host, uint16_t /*origin_port*/) override {
        {
            std::lock_guard lock(mutex_);
            last_remote_ = std::format("{}:{}", remote_host, remote_port);
            last_origin_ = origin_host;
        }
        opened_.fetch_add(1);
        if (refuse_) {
            return Result<std::unique_ptr<IForwardChannel>>::error(
                ErrorCategory::CONNECT_ERROR, "administratively prohibited");
        }
        return Result<std::unique_ptr<IForwardChannel>>::ok(
            std::make_unique<UpperEchoChannel>(closed_));
    }

    std::string last_remote() const {
        std::lock_guard lock(mutex_);
        return last_remote_;
    }
    std::string last_origin() const {
        std::lock_guard lock(mutex_);
        return last_origin_;
    }

    std::atomic<bool> refuse_{false};
    std::atomic<int> opened_{0};
    std::shared_ptr<std::atomic<int>> closed_ = std::make_shared<std::atomic<int>>(0);

private:
    mutable std::mutex mutex_;
    std::string last_remote_;
    std::string last_origin_;
};

// Holds back the channel for the first client until released
class StallingOpener : public FakeOpener {
public:
    Result<std::unique_ptr<IForwardChannel>> open_channel(
        const std::string& remote_host, uint16_t remote_port,
        const std::string& origin_host, uint16_t origin_port) override {
        if (calls_.fetch_add(1) == 0) {
            const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
            while (!released_.load() && std::chrono::steady_clock::now() < deadline) {
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
            }
        }
        return FakeOpener::open_channel(remote_host, remote_port, origin_host, origin_port);
    }

    std::atomic<int> calls_{0};
    std::atomic<bool> released_{false};
};

// Loopback listener that answers one client with a non-SSH banner and hangs up
class NotSshServer {
public:
    NotSshServer() {
        fd_ = socket(AF_INET, SOCK_STREAM, 0);
        REQUIRE(fd_ >= 0);
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        REQUIRE(bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);
        REQUIRE(listen(fd_, 1) == 0);
        socklen_t len = sizeof(addr);
        REQUIRE(getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len) == 0);
        port_ = ntohs(addr.sin_port);

        thread_ = std::thread([fd = fd_] {
            const int client = accept(fd, nullptr, nullptr);
            if (client < 0) return;
            const std::string banner = "HTTP/1.1 400 Bad Request\r\n\r\n";
            (void)send(client, banner.data(), banner.size(), MSG_NOSIGNAL);
            ::close(client);
        });
    }

    ~NotSshServer() {
        shutdown(fd_, SHUT_RDWR);
        thread_.join();
        ::close(fd_);
    }

    uint16_t port() const { return port_; }

private:
    int fd_ = -1;
    uint16_t port_ = 0;
    std::thread thread_;
};

net::TcpSocket connect_local(uint16_t port) {
    auto sock = net::TcpSocket::connect("127.0.0.1", port, kConnectTimeout);
    REQUIRE(sock.is_ok());
    return std::move(sock.value());
}

std::string read_n(net::TcpSocket& sock, size_t n) {
    std::string out(n, '\0');
    REQUIRE(sock.recv_exact(out.data(), n));
    return out;
}

template<typename Pred>
bool wait_until(Pred pred, std::chrono::milliseconds limit = std::chrono::milliseconds(2000)) {
    const auto deadline = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return pred();
}

} // anonymous namespace

TEST_CASE("PortForwarder: binds an ephemeral loopback port", "[tunnel][forwarder]") {
    auto opener = std::make_shared<FakeOpener>();
    PortForwarder forwarder(opener, "db.internal", 5432);

    auto port = forwarder.start();
    REQUIRE(port.is_ok());
    CHECK(port.value() != 0);
    CHECK(forwarder.local_port() == port.value());

    // Starting twice keeps the same listener
    auto again = forwarder.start();
    REQUIRE(again.is_ok());
    CHECK(again.value() == port.value());

    forwarder.stop();
}

TEST_CASE("PortForwarder: bytes flow both ways through the channel", "[tunnel][forwarder]") {
    auto opener = std::make_shared<FakeOpener>();
    PortForwarder forwarder(opener, "db.internal", 5432);
    auto port = forwarder.start();
    REQUIRE(port.is_ok());

    auto client = connect_local(port.value());
    REQUIRE(client.send_all("ping"));
    CHECK(read_n(client, 4) == "PING");

    REQUIRE(client.send_all("second round"));
    CHECK(read_n(client, 12) == "SECOND ROUND");

    CHECK(opener->last_remote() == "db.internal:5432");
    CHECK(opener->last_origin() == "127.0.0.1");
    CHECK(forwarder.active_connections() == 1);

    forwarder.stop();
}

TEST_CASE("PortForwarder: each client gets its own channel", "[tunnel][forwarder]") {
    auto opener = std::make_shared<FakeOpener>();
    PortForwarder forwarder(opener, "cache", 6379);
    auto port = forwarder.start();
    REQUIRE(port.is_ok());

    auto a = connect_local(port.value());
    auto b = connect_local(port.value());
    REQUIRE(a.send_all("aa"));
    REQUIRE(b.send_all("bbb"));
    CHECK(read_n(b, 3) == "BBB");
    CHECK(read_n(a, 2) == "AA");

    CHECK(wait_until([&] { return opener->opened_.load() == 2; }));
    forwarder.stop();
}

TEST_CASE("PortForwarder: refused channel closes the client", "[tunnel][forwarder]") {
    auto opener = std::make_shared<FakeOpener>();
    opener->refuse_ = true;
    PortForwarder forwarder(opener, "db", 3306);
    auto port = forwarder.start();
    REQUIRE(port.is_ok());

    auto client = connect_local(port.value());
    char c;
    CHECK(client.recv_some(&c, 1) <= 0);

    // The listener keeps accepting after a failed channel
    opener->refuse_ = false;
    auto next = connect_local(port.value());
    REQUIRE(next.send_all("ok"));
    CHECK(read_n(next, 2) == "OK");

    forwarder.stop();
}

TEST_CASE("PortForwarder: remote hang-up closes the client", "[tunnel][forwarder]") {
    auto opener = std::make_shared<FakeOpener>();
    PortForwarder forwarder(opener, "db", 3306);
    auto port = forwarder.start();
    REQUIRE(port.is_ok());

    auto client = connect_local(port.value());
    REQUIRE(client.send_all("!"));
    char c;
    CHECK(client.recv_some(&c, 1) == 0);

    CHECK(wait_until([&] { return forwarder.active_connections() == 0; }));
    CHECK(opener->closed_->load() == 1);
    forwarder.stop();
}

TEST_CASE("PortForwarder: finished client threads are joined", "[tunnel][forwarder]") {
    auto opener = std::make_shared<FakeOpener>();
    PortForwarder forwarder(opener, "db", 3306);
    auto port = forwarder.start();
    REQUIRE(port.is_ok());

    for (int i = 0; i < 40; ++i) {
        auto client = connect_local(port.value());
        REQUIRE(client.send_all("!"));
        char c;
        CHECK(client.recv_some(&c, 1) == 0);
    }
    REQUIRE(wait_until([&] { return forwarder.active_connections() == 0; }));

    // The next accept joins all forty
    auto client = connect_local(port.value());
    REQUIRE(client.send_all("x"));
    CHECK(read_n(client, 1) == "X");
    CHECK(forwarder.worker_count() == 1);

    forwarder.stop();
    CHECK(forwarder.worker_count() == 0);
}

TEST_CASE("PortForwarder: a slow channel open does not hold up other clients", "[tunnel][forwarder]") {
    auto opener = std::make_shared<StallingOpener>();
    PortForwarder forwarder(opener, "db", 5432);
    auto port = forwarder.start();
    REQUIRE(port.is_ok());

    auto stalled = connect_local(port.value());
    REQUIRE(wait_until([&] { return opener->calls_.load() == 1; }));

    auto next = connect_local(port.value());
    REQUIRE(next.send_all("fast"));
    CHECK(read_n(next, 4) == "FAST");
    CHECK(forwarder.active_connections() == 2);

    opener->released_ = true;
    REQUIRE(stalled.send_all("slow"));
    CHECK(read_n(stalled, 4) == "SLOW");

    forwarder.stop();
}

TEST_CASE("PortForwarder: stop ends active sessions", "[tunnel][forwarder]") {
    auto opener = std::make_shared<FakeOpener>();
    PortForwarder forwarder(opener, "db", 3306);
    auto port = forwarder.start();
    REQUIRE(port.is_ok());

    auto client = connect_local(port.value());
    REQUIRE(client.send_all("x"));
    CHECK(read_n(client, 1) == "X");

    forwarder.stop();
    CHECK(forwarder.active_connections() == 0);
    CHECK(opener->closed_->load() == 1);

    char c;
    CHECK(client.recv_some(&c, 1) <= 0);

    // Nothing listens any more
    auto refused = net::TcpSocket::connect("127.0.0.1", port.value(), kConnectTimeout);
    CHECK(refused.is_error());
}

TEST_CASE("TunnelManager: password is required before any network call", "[tunnel]") {
    TunnelManager manager(std::chrono::milliseconds(200));

    SshTarget target;
    target.host = "203.0.113.1";  // TEST-NET-3, never answers
    target.username = "deploy";

    auto tunnel = manager.open_tunnel(target, "db", 5432);
    REQUIRE(tunnel.is_error());
    CHECK(tunnel.error_category() == ErrorCategory::AUTH_UNSUPPORTED);

    target.password = "";
    auto empty = manager.open_tunnel(target, "db", 5432);
    REQUIRE(empty.is_error());
    CHECK(empty.error_category() == ErrorCategory::AUTH_UNSUPPORTED);
}

TEST_CASE("SshSession: a peer that is not an SSH server fails the handshake", "[tunnel][ssh]") {
    NotSshServer server;

    SshTarget target;
    target.host = "127.0.0.1";
    target.port = server.port();
    target.username = "deploy";
    target.password = "secret";

    auto session = SshSession::connect(target, std::chrono::milliseconds(2000));
    REQUIRE(session.is_error());
    CHECK(session.error_category() == ErrorCategory::CONNECT_ERROR);
    CHECK(session.error_message().find("handshake") != std::string::npos);
}

TEST_CASE("TunnelManager: forward wires a session to a listener", "[tunnel]") {
    auto opener = std::make_shared<FakeOpener>();
    uint16_t port = 0;
    {
        auto tunnel = TunnelManager::forward(opener, "db.internal", 5432);
        REQUIRE(tunnel.is_ok());
        port = tunnel.value()->local_port();
        REQUIRE(port != 0);
        CHECK(tunnel.value()->session() == opener);

        auto client = connect_local(port);
        REQUIRE(client.send_all("hi"));
        CHECK(read_n(client, 2) == "HI");
    }

    // Dropping the last reference stopped the listener
    auto refused = net::TcpSocket::connect("127.0.0.1", port, kConnectTimeout);
    CHECK(refused.is_error());
}
