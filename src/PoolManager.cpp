#include "PoolManager.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <set>

namespace mcpdb {

PoolManager::PoolManager(TargetConnectionFactory factory, PoolConfig config)
    : m_factory(std::move(factory))
    , m_config(config) {
}

PoolManager::~PoolManager() {
    shutdown();
}

std::shared_ptr<ConnectionPool> PoolManager::poolFor(const Target& target) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_shutdown) {
        throw PoolExhaustedError("Connection pools are closed");
    }

    const std::string key = poolKey(target);
    auto it = m_pools.find(key);
    if (it != m_pools.end()) {
        return it->second;
    }

    // Each pool captures its own copy of the target
    auto factory = m_factory;
    auto pool = std::make_shared<ConnectionPool>(
        poolLabel(target),
        [factory, target]() { return factory(target); },
        m_config.max_size,
        m_config.acquire_timeout);

    m_pools.emplace(key, pool);
    spdlog::info("Created connection pool '{}' (max {} connections)",
                 pool->name(), m_config.max_size);
    return pool;
}

PooledConnection PoolManager::acquire(const Target& target) {
    return poolFor(target)->acquire();
}

size_t PoolManager::initialize(const std::vector<Target>& targets) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_shutdown = false;
    }

    size_t initialCount = std::max<size_t>(1, std::min(m_config.max_size / 2, size_t(3)));
    std::set<std::string> seen;
    size_t healthy = 0;

    for (const auto& target : targets) {
        if (!seen.insert(poolKey(target)).second) {
            continue;
        }

        auto pool = poolFor(target);
        try {
            if (pool->totalCount() > 0 || pool->warmUp(initialCount) > 0) {
                ++healthy;
            }
        } catch (const GatewayError& e) {
            spdlog::error("Failed to initialize pool '{}': {}", pool->name(), e.what());
        }
    }

    spdlog::info("Connection pools ready: {} of {} server(s) reachable", healthy, seen.size());
    return healthy;
}

void PoolManager::shutdown() {
    std::map<std::string, std::shared_ptr<ConnectionPool>> pools;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_shutdown) {
            return;
        }
        m_shutdown = true;
        pools.swap(m_pools);
    }

    for (auto& [key, pool] : pools) {
        spdlog::debug("Closing pool '{}' ({} idle, {} in use)", pool->name(),
                      pool->availableCount(), pool->inUseCount());
        pool->shutdown(m_config.drain_timeout);
    }

    if (!pools.empty()) {
        spdlog::info("Closed {} connection pool(s)", pools.size());
    }
}

size_t PoolManager::poolCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_pools.size();
}

bool PoolManager::isShutdown() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_shutdown;
}

}  // namespace mcpdb
