#pragma once

/**
 * @file MySQLStatement.hpp
 * @brief RAII wrapper for a MySQL prepared statement.
 *
 * Parameters are bound through MYSQL_BIND so values never become part of
 * the statement text. Result columns are fetched as strings and handed
 * back as driver-neutral cells.
 */

#include "Connection.hpp"
#include "MySQLResultSet.hpp"
#include <mysql/mysql.h>
#include <string>
#include <type_traits>
#include <vector>

namespace mcpdb {

/**
 * @class MySQLStatement
 * @brief Owns a MYSQL_STMT and the buffers bound to it.
 *
 * Usage:
 * @code
 *   MySQLStatement stmt(conn);
 *   if (!stmt.prepare(sql) || !stmt.bindParameters(params) || !stmt.execute()) {
 *       // stmt.errorNumber(), stmt.error()
 *   }
 *   std::vector<SqlValue> row;
 *   while (stmt.fetchRow(row)) { ... }
 * @endcode
 *
 * Not movable: bound buffers are referenced by address.
 */
class MySQLStatement {
public:
    explicit MySQLStatement(MYSQL* conn);
    ~MySQLStatement();

    MySQLStatement(const MySQLStatement&) = delete;
    MySQLStatement& operator=(const MySQLStatement&) = delete;

    MYSQL_STMT* get() const { return m_stmt; }
    explicit operator bool() const { return m_stmt != nullptr; }

    bool prepare(const std::string& sql);

    /**
     * @brief Bind one value per placeholder.
     * @throws ParameterBindingError for arrays, objects and binary values.
     */
    bool bindParameters(const std::vector<Parameter>& parameters);

    bool execute();

    // True if the executed statement produced a result set
    bool hasResult() const { return static_cast<bool>(m_metadata); }

    std::vector<ColumnMeta> columns() const { return m_metadata.columns(); }

    /**
     * @brief Fetch the next row.
     * @return false when no rows remain, or on error (errorNumber() != 0).
     */
    bool fetchRow(std::vector<SqlValue>& row);

    uint64_t affectedRows() const;
    const char* error() const;
    unsigned int errorNumber() const;

private:
    // my_bool in MariaDB Connector/C, bool in MySQL 8
    using BindFlag = std::remove_pointer_t<decltype(MYSQL_BIND::is_null)>;

    struct ParameterBuffer {
        long long integer = 0;
        double real = 0.0;
        std::string text;
        unsigned long length = 0;
    };

    struct ColumnBuffer {
        std::vector<char> data;
        unsigned long length = 0;
        BindFlag isNull = 0;
        BindFlag error = 0;
    };

    bool bindResults();
    void bindColumn(size_t index);

    MYSQL_STMT* m_stmt;
    MySQLResultSet m_metadata;  ///< Result metadata, empty for DML

    std::vector<MYSQL_BIND> m_parameterBinds;
    std::vector<ParameterBuffer> m_parameters;
    std::vector<MYSQL_BIND> m_resultBinds;
    std::vector<ColumnBuffer> m_columns;
};

}  // namespace mcpdb
