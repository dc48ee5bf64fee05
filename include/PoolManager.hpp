#pragma once

/**
 * @file PoolManager.hpp
 * @brief One ConnectionPool per distinct server/credential pair.
 */

#include "Config.hpp"
#include "ConnectionPool.hpp"
#include "TargetRegistry.hpp"
#include <functional>
#include <map>
#include <memory>
#include <mutex>

namespace mcpdb {

// Opens a session to the server a target describes
using TargetConnectionFactory = std::function<std::unique_ptr<Connection>(const Target&)>;

/**
 * @class PoolManager
 * @brief Lazily creates, hands out and tears down per-server pools.
 *
 * Targets that share host, port, user, password and charset share a pool.
 * Pools are created on first acquire() (or by initialize()) and destroyed
 * by shutdown(); after shutdown acquire() fails until initialize() runs again.
 */
class PoolManager {
public:
    PoolManager(TargetConnectionFactory factory, PoolConfig config);
    ~PoolManager();

    PoolManager(const PoolManager&) = delete;
    PoolManager& operator=(const PoolManager&) = delete;

    /**
     * @brief Borrow a session for `target`.
     * @throws PoolExhaustedError on acquire timeout or after shutdown.
     * @throws ExecutionError/TimeoutError if the server cannot be reached.
     */
    PooledConnection acquire(const Target& target);

    /**
     * @brief Create and warm the pools of all targets.
     *
     * Each pool is warmed independently: a target that fails is logged and
     * skipped, the others stay usable.
     * @return Number of pools that opened at least one session.
     */
    size_t initialize(const std::vector<Target>& targets);

    // Close every pool. Idempotent.
    void shutdown();

    size_t poolCount() const;
    bool isShutdown() const;

    // Pool serving `target`, created if needed
    std::shared_ptr<ConnectionPool> poolFor(const Target& target);

private:
    TargetConnectionFactory m_factory;
    PoolConfig m_config;

    mutable std::mutex m_mutex;
    std::map<std::string, std::shared_ptr<ConnectionPool>> m_pools;  ///< By poolKey()
    bool m_shutdown = false;
};

}  // namespace mcpdb
