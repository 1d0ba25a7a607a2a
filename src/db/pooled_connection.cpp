#include "db/pooled_connection.hpp"

#include <utility>

namespace dbgate {

PooledConnection::PooledConnection(std::unique_ptr<IDbConnection> conn, Releaser release)
    : conn_(std::move(conn)), release_(std::move(release)) {}

PooledConnection::~PooledConnection() {
    give_back();
}

PooledConnection::PooledConnection(PooledConnection&& other) noexcept
    : conn_(std::exchange(other.conn_, nullptr)),
      release_(std::exchange(other.release_, nullptr)) {}

PooledConnection& PooledConnection::operator=(PooledConnection&& other) noexcept {
    if (this != &other) {
        give_back();
        conn_ = std::exchange(other.conn_, nullptr);
        release_ = std::exchange(other.release_, nullptr);
    }
    return *this;
}

void PooledConnection::give_back() {
    if (conn_ && release_) {
        std::exchange(release_, nullptr)(std::move(conn_));
    }
}

} // namespace dbgate
