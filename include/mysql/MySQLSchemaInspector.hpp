#pragma once

/**
 * @file MySQLSchemaInspector.hpp
 * @brief MySQL/MariaDB implementation of SchemaInspector.
 *
 * Reads INFORMATION_SCHEMA through pooled sessions on every call; nothing
 * is cached. Catalog queries bind database and table names as statement
 * parameters.
 */

#include "SchemaInspector.hpp"
#include "PoolManager.hpp"
#include "TargetRegistry.hpp"

namespace mcpdb {

/**
 * @class MySQLSchemaInspector
 * @brief Catalog introspection over INFORMATION_SCHEMA.
 *
 * Thread Safety:
 * - Safe to share; each call borrows its own session.
 */
class MySQLSchemaInspector : public SchemaInspector {
public:
    MySQLSchemaInspector(const TargetRegistry& registry, PoolManager& pools);

    /**
     * @brief SCHEMATA of each distinct server, system schemas removed.
     *
     * A server that cannot be queried is logged and skipped; the call
     * fails only if every server fails.
     */
    std::vector<std::string> listDatabases() override;

    std::vector<std::string> listTables(const std::string& database) override;

    /**
     * @brief Columns of `table` in ORDINAL_POSITION order.
     * @return Empty descriptor for unknown databases or tables.
     */
    SchemaDescriptor getSchema(const std::string& database,
                               const std::string& table) override;

    /**
     * @brief getSchema() plus KEY_COLUMN_USAGE foreign keys.
     *
     * Columns that reference another table carry a ForeignKeyRef; the
     * others carry none.
     */
    SchemaDescriptor getSchemaWithRelations(const std::string& database,
                                            const std::string& table) override;

private:
    // Run one catalog query on a pooled session and commit it
    ResultSet query(const Target& target, const std::string& sql,
                    const std::vector<Parameter>& parameters);

    // Target and schema for `database`, nullptr if the registry rejects it
    const Target* locate(const std::string& database, std::string& schema) const;

    const TargetRegistry& m_registry;
    PoolManager& m_pools;
};

}  // namespace mcpdb
