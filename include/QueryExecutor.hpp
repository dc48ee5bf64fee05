#pragma once

/**
 * @file QueryExecutor.hpp
 * @brief Safe execution of one SQL statement against a named target.
 */

#include "Config.hpp"
#include "PolicyGuard.hpp"
#include "PoolManager.hpp"
#include "TargetRegistry.hpp"
#include "ValueConverter.hpp"
#include <string>
#include <vector>

namespace mcpdb {

/**
 * @brief Object keys for a result's columns.
 *
 * The first column with a given name keeps it. Later duplicates become
 * `table.name`, with a numeric suffix when that is still taken.
 */
std::vector<std::string> uniqueColumnKeys(const std::vector<ColumnMeta>& columns);

struct QueryResult {
    std::vector<std::string> columns;      ///< Original case and order, unique
    std::vector<std::vector<json>> rows;   ///< Normalized cells
    bool truncated = false;                ///< Rows were dropped at the cap
    uint64_t affectedRows = 0;
    bool hasRows = false;

    // Rows as objects keyed by column name, in column order
    json toJson() const;
};

/**
 * @class QueryExecutor
 * @brief Resolve, gate, bind, execute, normalize and cap one statement.
 *
 * The read-only gate runs before any pool access, so a rejected write
 * never touches a connection. Every successful statement is committed;
 * a failed one is rolled back and its connection discarded. A timed-out
 * connection is discarded without further I/O.
 */
class QueryExecutor {
public:
    QueryExecutor(const TargetRegistry& registry, PoolManager& pools, PolicyConfig policy);

    /**
     * @brief Run `sql` on the target serving `databaseName`.
     * @throws UnknownTargetError, ReadOnlyViolationError, ParameterBindingError,
     *         PoolExhaustedError, TimeoutError, ExecutionError
     */
    QueryResult execute(const std::string& sql,
                        const std::string& databaseName,
                        const std::vector<Parameter>& parameters = {});

    const PolicyConfig& policy() const { return m_policy; }

private:
    const TargetRegistry& m_registry;
    PoolManager& m_pools;
    PolicyConfig m_policy;
};

}  // namespace mcpdb
