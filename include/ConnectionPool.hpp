#pragma once

/**
 * @file ConnectionPool.hpp
 * @brief Thread-safe bounded pool of database sessions for one server.
 *
 * The pool does not know which driver it manages: connections are built
 * by a ConnectionFactory, so tests can run it against in-memory sessions.
 */

#include "Connection.hpp"
#include "PooledConnection.hpp"
#include <memory>
#include <queue>
#include <unordered_set>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <chrono>
#include <string>
#include <atomic>

namespace mcpdb {

// Opens a new session; throws ExecutionError/TimeoutError on failure
using ConnectionFactory = std::function<std::unique_ptr<Connection>()>;

/**
 * @class ConnectionPool
 * @brief Bounded pool of reusable sessions to one server/credential pair.
 *
 * Key features:
 * - Lazy creation up to maxSize live sessions (idle + leased)
 * - Idle sessions are pinged before being handed out; dead ones replaced
 * - acquire() blocks until a release or the acquire timeout elapses
 * - Broken leases are closed instead of pooled, freeing their slot
 * - shutdown() closes idle sessions, waits for leases, then cancels them
 *
 * Thread Safety:
 * - All public methods are thread-safe
 * - The mutex is not held while sessions open, ping, close or run queries
 */
class ConnectionPool : public std::enable_shared_from_this<ConnectionPool> {
public:
    /**
     * @brief Create a pool. No session is opened until warmUp()/acquire().
     * @param name Label used in log lines (never contains credentials).
     * @param factory Opens new sessions.
     * @param maxSize Upper bound on live sessions.
     * @param acquireTimeout How long acquire() waits for a free session.
     */
    ConnectionPool(std::string name,
                   ConnectionFactory factory,
                   size_t maxSize,
                   std::chrono::milliseconds acquireTimeout);

    ~ConnectionPool();

    // Non-copyable, non-movable
    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    /**
     * @brief Borrow a session, blocking while the pool is at capacity.
     * @throws PoolExhaustedError on timeout or after shutdown.
     * @throws ExecutionError/TimeoutError if a new session cannot be opened.
     */
    PooledConnection acquire();

    /**
     * @brief Open up to `count` idle sessions ahead of first use.
     * @return Number of sessions opened.
     * @throws whatever the factory throws for the first session.
     */
    size_t warmUp(size_t count);

    /**
     * @brief Close the pool.
     * @param drainTimeout How long to wait for leased sessions to return.
     *
     * Idempotent. Sessions still leased after the timeout are cancelled and
     * closed by their lease on release.
     */
    void shutdown(std::chrono::milliseconds drainTimeout);

    // Statistics
    size_t availableCount() const;
    size_t totalCount() const;
    size_t inUseCount() const;
    size_t maxSize() const { return m_maxSize; }
    bool isShutdown() const { return m_shutdown.load(); }
    const std::string& name() const { return m_name; }

private:
    friend class PooledConnection;  // For releaseConnection access

    /**
     * @brief Return a session. Called once per lease.
     * @param conn The session.
     * @param reusable false if the session's state is unknown.
     */
    void releaseConnection(std::unique_ptr<Connection> conn, bool reusable);

    // Open a session for a slot already counted in m_total
    std::unique_ptr<Connection> createForSlot();

    // Give up a slot counted in m_total (caller holds the lock)
    void freeSlotLocked();

    std::string m_name;
    ConnectionFactory m_factory;
    size_t m_maxSize;
    std::chrono::milliseconds m_acquireTimeout;

    std::queue<std::unique_ptr<Connection>> m_available;  ///< Idle sessions
    std::unordered_set<Connection*> m_leased;             ///< Sessions out on lease
    size_t m_total = 0;                                   ///< Idle + leased + opening
    std::atomic<size_t> m_waitingCount{0};                ///< Threads blocked in acquire()

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;     ///< Signaled on release and shutdown
    std::atomic<bool> m_shutdown{false};
};

}  // namespace mcpdb
