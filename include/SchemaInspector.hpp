#pragma once

#include "Connection.hpp"
#include "ValueConverter.hpp"
#include <optional>
#include <string>
#include <vector>

namespace mcpdb {

struct ForeignKeyRef {
    std::string referencedTable;
    std::string referencedColumn;
};

struct ColumnDescriptor {
    std::string name;
    std::string type;                         // Full COLUMN_TYPE, e.g. "int(11) unsigned"
    bool nullable = true;
    std::optional<std::string> defaultValue;  // nullopt = no default / NULL
    std::string key;                          // PRI, UNI, MUL or empty
    std::string extra;                        // auto_increment, ...
    std::optional<ForeignKeyRef> foreignKey;  // Set by getSchemaWithRelations
};

struct ForeignKeyInfo {
    std::string constraintName;
    std::string column;
    std::string referencedSchema;
    std::string referencedTable;
    std::string referencedColumn;
};

struct SchemaDescriptor {
    std::string database;
    std::string table;
    std::vector<ColumnDescriptor> columns;    // Catalog (ordinal) order
    std::vector<ForeignKeyInfo> foreignKeys;  // Only filled with relations

    bool empty() const { return columns.empty(); }
    const ColumnDescriptor* column(const std::string& name) const;

    // {column: {type, nullable, default, key, extra[, foreign_key]}} in column order
    json toJson() const;

    // {table_name, columns: toJson(), foreign_keys: [constraint...]}
    json relationsToJson() const;
};

// System schemas hidden from listings
bool isSystemSchema(const std::string& database);

/**
 * @brief COLUMN_DEFAULT as a plain value.
 *
 * MariaDB reports an explicit DEFAULT NULL as the text NULL and string
 * literals quoted ('abc', with '' for a quote). MySQL reports both bare.
 * Expressions such as current_timestamp() are kept as written.
 */
SqlValue columnDefault(const SqlValue& catalogValue);

// Abstract base class for catalog introspection.
// Unknown databases and tables yield empty results, never errors.
class SchemaInspector {
public:
    virtual ~SchemaInspector() = default;

    // User databases on every configured server that the registry can resolve
    virtual std::vector<std::string> listDatabases() = 0;

    // Tables and views of a database, by name
    virtual std::vector<std::string> listTables(const std::string& database) = 0;

    virtual SchemaDescriptor getSchema(const std::string& database,
                                       const std::string& table) = 0;

    // getSchema() plus foreign-key annotations
    virtual SchemaDescriptor getSchemaWithRelations(const std::string& database,
                                                    const std::string& table) = 0;

protected:
    SchemaInspector() = default;
};

}  // namespace mcpdb
