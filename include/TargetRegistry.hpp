#pragma once

/**
 * @file TargetRegistry.hpp
 * @brief Resolution of logical database names to connection targets.
 */

#include "Config.hpp"
#include <string>
#include <vector>
#include <cstdint>

namespace mcpdb {

// One configured endpoint. Immutable once the registry is built.
struct Target {
    std::string name;              ///< Logical name; empty = server-wide
    std::string host;
    uint16_t port = 3306;
    std::string user;
    std::string password;
    std::string defaultDatabase;   ///< Schema selected when a call names none
    std::string charset;           ///< Empty = driver default (utf8mb4)

    bool isServerWide() const { return name.empty(); }
};

// Identity of the physical pool a target uses (host|port|user|password|charset)
std::string poolKey(const Target& target);

// Log-safe label for a target's pool, never includes the password
std::string poolLabel(const Target& target);

/**
 * @class TargetRegistry
 * @brief Ordered list of targets built from the parallel config lists.
 *
 * Resolution order for resolve(name):
 * 1. empty name: first configured target
 * 2. first target whose name equals the argument
 * 3. first server-wide target (accepts any database on its server)
 * 4. UnknownTargetError
 */
class TargetRegistry {
public:
    explicit TargetRegistry(std::vector<Target> targets);

    /**
     * @brief Build targets from configuration.
     *
     * Lists holding one entry apply to every target. Multi-entry lists of
     * different lengths are cut to the shortest one, with a warning.
     * @throws std::invalid_argument if no target can be built.
     */
    static TargetRegistry build(const TargetListConfig& config);

    /**
     * @brief Find the target serving `name`.
     * @throws UnknownTargetError if no target accepts it.
     */
    const Target& resolve(const std::string& name) const;

    // Schema a call operates on: `name` if given, else the target default
    std::string databaseFor(const std::string& name, const Target& target) const;

    // True if resolve(name) would succeed
    bool accepts(const std::string& name) const;

    const std::vector<Target>& targets() const { return m_targets; }
    size_t size() const { return m_targets.size(); }

private:
    const Target* find(const std::string& name) const;

    std::vector<Target> m_targets;
};

}  // namespace mcpdb
