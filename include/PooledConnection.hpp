#pragma once

/**
 * @file PooledConnection.hpp
 * @brief RAII lease on a session borrowed from a ConnectionPool.
 */

#include "Connection.hpp"
#include <memory>

namespace mcpdb {

class ConnectionPool;

/**
 * @class PooledConnection
 * @brief Scoped ownership of a borrowed session.
 *
 * When the lease goes out of scope the session is returned to its pool,
 * or closed if markBroken() was called. The lease keeps its pool alive so
 * a late release after shutdown is still safe.
 *
 * Usage:
 * @code
 *   auto conn = pool->acquire();
 *   try {
 *       auto result = conn->execute("SELECT 1", {}, 0);
 *   } catch (const GatewayError&) {
 *       conn.markBroken();
 *       throw;
 *   }  // session returned or discarded here
 * @endcode
 */
class PooledConnection {
public:
    PooledConnection() = default;
    PooledConnection(std::shared_ptr<ConnectionPool> pool, std::unique_ptr<Connection> conn);

    // Releases the session back to the pool
    ~PooledConnection();

    // Non-copyable to prevent double-release
    PooledConnection(const PooledConnection&) = delete;
    PooledConnection& operator=(const PooledConnection&) = delete;

    // Movable for transfer of ownership
    PooledConnection(PooledConnection&& other) noexcept;
    PooledConnection& operator=(PooledConnection&& other) noexcept;

    Connection* get() const { return m_conn.get(); }
    Connection* operator->() const { return m_conn.get(); }
    Connection& operator*() const { return *m_conn; }

    bool isValid() const { return m_conn != nullptr; }
    explicit operator bool() const { return isValid(); }

    // Close the session on release instead of pooling it
    void markBroken() { m_broken = true; }
    bool isBroken() const { return m_broken; }

    // Return the session now; the lease becomes empty
    void release();

private:
    std::shared_ptr<ConnectionPool> m_pool;  ///< Owning pool
    std::unique_ptr<Connection> m_conn;      ///< Borrowed session
    bool m_broken = false;
};

}  // namespace mcpdb
