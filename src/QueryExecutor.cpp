#include "QueryExecutor.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>
#include <set>

namespace mcpdb {

std::vector<std::string> uniqueColumnKeys(const std::vector<ColumnMeta>& columns) {
    std::vector<std::string> keys;
    std::set<std::string> taken;
    keys.reserve(columns.size());

    for (const auto& column : columns) {
        std::string key = column.name;
        if (taken.count(key)) {
            const std::string base = column.table.empty() ? column.name
                                                          : column.table + "." + column.name;
            key = base;
            for (int n = 2; taken.count(key); ++n) {
                key = base + "_" + std::to_string(n);
            }
        }
        taken.insert(key);
        keys.push_back(std::move(key));
    }
    return keys;
}

json QueryResult::toJson() const {
    json result = json::array();
    for (const auto& row : rows) {
        json obj = json::object();
        for (size_t i = 0; i < columns.size() && i < row.size(); ++i) {
            obj[columns[i]] = row[i];
        }
        result.push_back(std::move(obj));
    }
    return result;
}

QueryExecutor::QueryExecutor(const TargetRegistry& registry, PoolManager& pools, PolicyConfig policy)
    : m_registry(registry)
    , m_pools(pools)
    , m_policy(policy) {
}

QueryResult QueryExecutor::execute(const std::string& sql,
                                   const std::string& databaseName,
                                   const std::vector<Parameter>& parameters) {
    ErrorContext context("execute_sql(" + databaseName + ")");

    const Target& target = m_registry.resolve(databaseName);

    // Gate before touching the pool
    PolicyGuard::enforceReadOnly(sql, m_policy.read_only);
    BoundStatement bound = PolicyGuard::bind(sql, parameters);

    spdlog::debug("[{}] Executing {} statement with {} parameter(s)", ErrorContext::current(),
                  PolicyGuard::kindName(PolicyGuard::classify(bound.sql)), bound.parameters.size());

    ResultSet raw;
    auto conn = m_pools.acquire(target);
    try {
        conn->selectDatabase(m_registry.databaseFor(databaseName, target));
        // One extra row tells a full result from a truncated one
        raw = conn->execute(bound.sql, bound.parameters, m_policy.max_results + 1);
        conn->commit();
    } catch (const TimeoutError& e) {
        // Session state unknown: discard without further I/O
        conn.markBroken();
        spdlog::error("[{}] {}", ErrorContext::current(), e.what());
        throw;
    } catch (const ExecutionError& e) {
        conn.markBroken();
        try {
            conn->rollback();
        } catch (const GatewayError& rollbackError) {
            spdlog::warn("[{}] Rollback failed: {}", ErrorContext::current(), rollbackError.what());
        }
        spdlog::error("[{}] Query failed ({}): {}", ErrorContext::current(), e.errorCode(), e.what());
        throw;
    }
    conn.release();

    QueryResult result;
    result.hasRows = raw.hasRows;
    result.affectedRows = raw.affectedRows;
    result.columns = uniqueColumnKeys(raw.columns);

    result.rows.reserve(raw.rows.size());
    for (const auto& row : raw.rows) {
        result.rows.push_back(ValueConverter::normalizeRow(row, raw.columns));
    }

    result.truncated = PolicyGuard::cap(result.rows, m_policy.max_results);
    if (result.hasRows) {
        result.affectedRows = result.rows.size();
    }
    if (result.truncated) {
        spdlog::warn("[{}] Result truncated to {} rows (MCP_MAX_RESULTS)",
                     ErrorContext::current(), m_policy.max_results);
    }

    return result;
}

}  // namespace mcpdb
