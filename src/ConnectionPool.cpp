#include "ConnectionPool.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <vector>

namespace mcpdb {

ConnectionPool::ConnectionPool(std::string name,
                               ConnectionFactory factory,
                               size_t maxSize,
                               std::chrono::milliseconds acquireTimeout)
    : m_name(std::move(name))
    , m_factory(std::move(factory))
    , m_maxSize(maxSize == 0 ? 1 : maxSize)
    , m_acquireTimeout(acquireTimeout) {
}

ConnectionPool::~ConnectionPool() {
    shutdown(std::chrono::milliseconds(0));
}

PooledConnection ConnectionPool::acquire() {
    std::unique_lock<std::mutex> lock(m_mutex);

    m_waitingCount++;

    auto deadline = std::chrono::steady_clock::now() + m_acquireTimeout;

    while (true) {
        if (m_shutdown) {
            m_waitingCount--;
            throw PoolExhaustedError("Connection pool '" + m_name + "' is shut down");
        }

        if (!m_available.empty()) {
            std::unique_ptr<Connection> conn = std::move(m_available.front());
            m_available.pop();
            m_leased.insert(conn.get());
            m_waitingCount--;
            lock.unlock();

            if (conn->ping()) {
                return PooledConnection(shared_from_this(), std::move(conn));
            }

            // Stale session: close it and reuse its slot for a fresh one
            spdlog::debug("Pool '{}': idle connection failed validation, replacing", m_name);
            lock.lock();
            m_leased.erase(conn.get());
            lock.unlock();
            conn.reset();

            return PooledConnection(shared_from_this(), createForSlot());
        }

        // Try to create a new connection if under limit
        if (m_total < m_maxSize) {
            ++m_total;
            m_waitingCount--;
            lock.unlock();
            return PooledConnection(shared_from_this(), createForSlot());
        }

        // Wait for a connection to be released
        if (m_cv.wait_until(lock, deadline) == std::cv_status::timeout &&
            m_available.empty() && m_total >= m_maxSize && !m_shutdown) {
            size_t others = --m_waitingCount;
            throw PoolExhaustedError("Timeout waiting for a connection from pool '" + m_name +
                                     "' (" + std::to_string(m_maxSize) + " in use, " +
                                     std::to_string(others) + " other caller(s) waiting)");
        }
    }
}

std::unique_ptr<Connection> ConnectionPool::createForSlot() {
    std::unique_ptr<Connection> conn;
    try {
        conn = m_factory();
    } catch (...) {
        std::lock_guard<std::mutex> lock(m_mutex);
        freeSlotLocked();
        throw;
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!conn) {
            freeSlotLocked();
            throw ExecutionError(0, "Connection factory for pool '" + m_name + "' returned nothing");
        }
        if (!m_shutdown) {
            m_leased.insert(conn.get());
            spdlog::debug("Pool '{}': opened connection (total: {})", m_name, m_total);
            return conn;
        }
        freeSlotLocked();
    }

    conn.reset();
    throw PoolExhaustedError("Connection pool '" + m_name + "' is shut down");
}

void ConnectionPool::freeSlotLocked() {
    if (m_total > 0) {
        --m_total;
    }
    m_cv.notify_all();
}

size_t ConnectionPool::warmUp(size_t count) {
    size_t opened = 0;

    for (size_t i = 0; i < count; ++i) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_shutdown || m_total >= m_maxSize) {
                break;
            }
            ++m_total;
        }

        std::unique_ptr<Connection> conn;
        try {
            conn = m_factory();
        } catch (const std::exception& e) {
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                freeSlotLocked();
            }
            if (opened == 0) {
                throw;
            }
            spdlog::warn("Pool '{}': failed to pre-create connection: {}", m_name, e.what());
            break;
        }

        std::lock_guard<std::mutex> lock(m_mutex);
        if (!conn || m_shutdown) {
            freeSlotLocked();
            break;
        }
        m_available.push(std::move(conn));
        ++opened;
        m_cv.notify_one();
    }

    spdlog::info("Pool '{}' initialized with {} connection(s)", m_name, opened);
    return opened;
}

void ConnectionPool::releaseConnection(std::unique_ptr<Connection> conn, bool reusable) {
    if (!conn) return;

    std::unique_ptr<Connection> doomed;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_leased.erase(conn.get());

        if (m_shutdown || !reusable) {
            freeSlotLocked();
            doomed = std::move(conn);
        } else {
            m_available.push(std::move(conn));
            m_cv.notify_one();
        }
    }

    if (doomed) {
        doomed.reset();
        spdlog::debug("Pool '{}': discarded connection", m_name);
    }
}

void ConnectionPool::shutdown(std::chrono::milliseconds drainTimeout) {
    std::queue<std::unique_ptr<Connection>> idle;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_shutdown.exchange(true)) {
            return;
        }
        idle.swap(m_available);
        m_total -= std::min(m_total, idle.size());
        m_cv.notify_all();
    }

    size_t closed = idle.size();
    while (!idle.empty()) {
        idle.pop();
    }

    std::vector<CancelHandle> stuck;
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        bool drained = m_cv.wait_for(lock, drainTimeout, [this] { return m_leased.empty(); });
        if (!drained) {
            spdlog::warn("Pool '{}': {} connection(s) still in use after {} ms, cancelling",
                         m_name, m_leased.size(), drainTimeout.count());
            // A lease cannot destroy its session while the lock is held
            for (Connection* conn : m_leased) {
                stuck.push_back(conn->cancelHandle());
            }
        }
    }

    for (const auto& cancel : stuck) {
        try {
            cancel();
        } catch (const std::exception& e) {
            spdlog::warn("Pool '{}': cancel failed: {}", m_name, e.what());
        }
    }

    spdlog::info("Pool '{}' drained ({} idle connection(s) closed)", m_name, closed);
}

size_t ConnectionPool::availableCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_available.size();
}

size_t ConnectionPool::totalCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_total;
}

size_t ConnectionPool::inUseCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_leased.size();
}

}  // namespace mcpdb
