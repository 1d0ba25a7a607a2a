#pragma once

#include "db/idb_connection.hpp"
#include <functional>
#include <memory>

namespace dbgate {

/**
 * @brief Connection checked out of a pool for the length of one operation
 *
 * The releaser runs exactly once, on destruction or when the handle is
 * overwritten by a move. A moved-from handle holds nothing.
 */
class PooledConnection {
public:
    using Releaser = std::function<void(std::unique_ptr<IDbConnection>)>;

    PooledConnection(std::unique_ptr<IDbConnection> conn, Releaser release);
    ~PooledConnection();

    PooledConnection(PooledConnection&& other) noexcept;
    PooledConnection& operator=(PooledConnection&& other) noexcept;

    PooledConnection(const PooledConnection&) = delete;
    PooledConnection& operator=(const PooledConnection&) = delete;

    IDbConnection* get() const { return conn_.get(); }
    IDbConnection* operator->() const { return conn_.get(); }

    // False once the driver session dropped; the pool will close it on release
    bool is_valid() const { return conn_ && conn_->is_connected(); }

private:
    void give_back();

    std::unique_ptr<IDbConnection> conn_;
    Releaser release_;
};

} // namespace dbgate
