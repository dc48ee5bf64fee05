/**
 * @file MySQLSchemaInspector.cpp
 * @brief INFORMATION_SCHEMA queries behind the schema tools.
 */

#include "MySQLSchemaInspector.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>
#include <exception>
#include <set>

namespace mcpdb {

namespace {

const char* const kListDatabasesSql =
    "SELECT SCHEMA_NAME FROM INFORMATION_SCHEMA.SCHEMATA ORDER BY SCHEMA_NAME";

const char* const kListTablesSql =
    "SELECT TABLE_NAME FROM INFORMATION_SCHEMA.TABLES "
    "WHERE TABLE_SCHEMA = ? "
    "ORDER BY TABLE_NAME";

const char* const kColumnsSql =
    "SELECT COLUMN_NAME, COLUMN_TYPE, IS_NULLABLE, COLUMN_DEFAULT, COLUMN_KEY, EXTRA "
    "FROM INFORMATION_SCHEMA.COLUMNS "
    "WHERE TABLE_SCHEMA = ? AND TABLE_NAME = ? "
    "ORDER BY ORDINAL_POSITION";

const char* const kForeignKeysSql =
    "SELECT CONSTRAINT_NAME, COLUMN_NAME, REFERENCED_TABLE_SCHEMA, "
    "REFERENCED_TABLE_NAME, REFERENCED_COLUMN_NAME "
    "FROM INFORMATION_SCHEMA.KEY_COLUMN_USAGE "
    "WHERE TABLE_SCHEMA = ? AND TABLE_NAME = ? "
    "AND REFERENCED_TABLE_NAME IS NOT NULL "
    "ORDER BY CONSTRAINT_NAME, ORDINAL_POSITION";

std::string cell(const std::vector<SqlValue>& row, size_t index) {
    return index < row.size() && row[index] ? *row[index] : std::string();
}

}  // namespace

MySQLSchemaInspector::MySQLSchemaInspector(const TargetRegistry& registry, PoolManager& pools)
    : m_registry(registry)
    , m_pools(pools) {
}

// ============================================================================
// Helpers
// ============================================================================

ResultSet MySQLSchemaInspector::query(const Target& target, const std::string& sql,
                                      const std::vector<Parameter>& parameters) {
    auto conn = m_pools.acquire(target);
    try {
        ResultSet result = conn->execute(sql, parameters, 0);
        // End the read transaction so the session carries no snapshot
        conn->commit();
        return result;
    } catch (const GatewayError&) {
        conn.markBroken();
        throw;
    }
}

const Target* MySQLSchemaInspector::locate(const std::string& database, std::string& schema) const {
    try {
        const Target& target = m_registry.resolve(database);
        schema = m_registry.databaseFor(database, target);
        return &target;
    } catch (const UnknownTargetError& e) {
        spdlog::debug("{}", e.what());
        return nullptr;
    }
}

// ============================================================================
// Listings
// ============================================================================

std::vector<std::string> MySQLSchemaInspector::listDatabases() {
    std::vector<std::string> databases;
    std::set<std::string> seen;
    std::set<std::string> servers;
    size_t failures = 0;
    std::exception_ptr lastError;

    for (const auto& target : m_registry.targets()) {
        if (!servers.insert(poolKey(target)).second) {
            continue;
        }

        ResultSet result;
        try {
            result = query(target, kListDatabasesSql, {});
        } catch (const GatewayError& e) {
            spdlog::error("Failed to list databases on {}: {}", poolLabel(target), e.what());
            ++failures;
            lastError = std::current_exception();
            continue;
        }

        for (const auto& row : result.rows) {
            std::string name = cell(row, 0);
            if (name.empty() || isSystemSchema(name) || !m_registry.accepts(name)) {
                continue;
            }
            if (seen.insert(name).second) {
                databases.push_back(name);
            }
        }
    }

    if (lastError && failures == servers.size()) {
        std::rethrow_exception(lastError);
    }

    return databases;
}

std::vector<std::string> MySQLSchemaInspector::listTables(const std::string& database) {
    std::vector<std::string> tables;

    std::string schema;
    const Target* target = locate(database, schema);
    if (!target || schema.empty() || isSystemSchema(schema)) {
        return tables;
    }

    ResultSet result = query(*target, kListTablesSql, {schema});
    tables.reserve(result.rows.size());
    for (const auto& row : result.rows) {
        tables.push_back(cell(row, 0));
    }

    return tables;
}

// ============================================================================
// Table Schema
// ============================================================================

SchemaDescriptor MySQLSchemaInspector::getSchema(const std::string& database,
                                                 const std::string& table) {
    SchemaDescriptor descriptor;
    descriptor.table = table;

    const Target* target = locate(database, descriptor.database);
    if (!target || descriptor.database.empty()) {
        return descriptor;
    }

    ResultSet result = query(*target, kColumnsSql, {descriptor.database, table});

    descriptor.columns.reserve(result.rows.size());
    for (const auto& row : result.rows) {
        ColumnDescriptor col;
        col.name = cell(row, 0);
        col.type = cell(row, 1);
        col.nullable = cell(row, 2) == "YES";
        if (row.size() > 3) {
            col.defaultValue = columnDefault(row[3]);
        }
        col.key = cell(row, 4);
        col.extra = cell(row, 5);
        descriptor.columns.push_back(std::move(col));
    }

    if (descriptor.empty()) {
        spdlog::debug("No columns for {}.{}", descriptor.database, table);
    }

    return descriptor;
}

SchemaDescriptor MySQLSchemaInspector::getSchemaWithRelations(const std::string& database,
                                                              const std::string& table) {
    SchemaDescriptor descriptor = getSchema(database, table);
    if (descriptor.empty()) {
        return descriptor;
    }

    const Target& target = m_registry.resolve(database);
    ResultSet result = query(target, kForeignKeysSql, {descriptor.database, table});

    for (const auto& row : result.rows) {
        ForeignKeyInfo fk;
        fk.constraintName = cell(row, 0);
        fk.column = cell(row, 1);
        fk.referencedSchema = cell(row, 2);
        fk.referencedTable = cell(row, 3);
        fk.referencedColumn = cell(row, 4);

        // A column in several constraints keeps the first reference
        for (auto& col : descriptor.columns) {
            if (col.name == fk.column && !col.foreignKey) {
                col.foreignKey = ForeignKeyRef{fk.referencedTable, fk.referencedColumn};
            }
        }

        descriptor.foreignKeys.push_back(std::move(fk));
    }

    return descriptor;
}

}  // namespace mcpdb
