/**
 * @file PooledConnection.cpp
 * @brief Implementation of the RAII pool lease.
 */

#include "PooledConnection.hpp"
#include "ConnectionPool.hpp"

namespace mcpdb {

// ============================================================================
// Construction and Destruction
// ============================================================================

PooledConnection::PooledConnection(std::shared_ptr<ConnectionPool> pool,
                                   std::unique_ptr<Connection> conn)
    : m_pool(std::move(pool)), m_conn(std::move(conn)), m_broken(false) {
}

PooledConnection::~PooledConnection() {
    release();
}

// ============================================================================
// Move Operations
// ============================================================================

PooledConnection::PooledConnection(PooledConnection&& other) noexcept
    : m_pool(std::move(other.m_pool))
    , m_conn(std::move(other.m_conn))
    , m_broken(other.m_broken) {
    other.m_broken = false;
}

PooledConnection& PooledConnection::operator=(PooledConnection&& other) noexcept {
    if (this != &other) {
        // Release current session before taking ownership of the new one
        release();
        m_pool = std::move(other.m_pool);
        m_conn = std::move(other.m_conn);
        m_broken = other.m_broken;
        other.m_broken = false;
    }
    return *this;
}

// ============================================================================
// Connection Pool Integration
// ============================================================================

void PooledConnection::release() {
    if (m_conn && m_pool) {
        m_pool->releaseConnection(std::move(m_conn), !m_broken);
    }
    m_conn.reset();
    m_pool.reset();
    m_broken = false;
}

}  // namespace mcpdb
