#pragma once

/**
 * @file MySQLResultSet.hpp
 * @brief RAII wrapper for MySQL query result sets.
 *
 * Owns a MYSQL_RES handle and turns its rows into driver-neutral cells.
 */

#include "Connection.hpp"
#include <mysql/mysql.h>
#include <string>
#include <vector>

namespace mcpdb {

/**
 * @class MySQLResultSet
 * @brief RAII wrapper for a MYSQL_RES handle.
 *
 * Usage:
 * @code
 *   MySQLResultSet result(mysql_use_result(conn));
 *   auto columns = result.columns();
 *   std::vector<SqlValue> row;
 *   while (result.fetchRow(row)) {
 *       // row[i] is nullopt for SQL NULL
 *   }
 * @endcode
 *
 * For results from mysql_use_result() the connection cannot run another
 * statement until the result set is freed.
 */
class MySQLResultSet {
public:
    /**
     * @brief Construct a result set wrapper.
     * @param res MYSQL_RES handle to manage (takes ownership), or nullptr.
     */
    explicit MySQLResultSet(MYSQL_RES* res = nullptr);

    // Frees the MYSQL_RES handle if still owned
    ~MySQLResultSet();

    // Non-copyable
    MySQLResultSet(const MySQLResultSet&) = delete;
    MySQLResultSet& operator=(const MySQLResultSet&) = delete;

    // Movable
    MySQLResultSet(MySQLResultSet&& other) noexcept;
    MySQLResultSet& operator=(MySQLResultSet&& other) noexcept;

    MYSQL_RES* get() const { return m_res; }

    explicit operator bool() const { return m_res != nullptr; }

    /**
     * @brief Fetch the next row.
     * @param row Replaced with the row's cells; binary-safe via lengths.
     * @return false when no rows remain or fetching failed (check mysql_errno).
     */
    bool fetchRow(std::vector<SqlValue>& row);

    unsigned int numFields() const;

    /**
     * @brief Column names and portable types, in result order.
     */
    std::vector<ColumnMeta> columns() const;

    /**
     * @brief Replace the managed result set.
     * @param res New MYSQL_RES handle (takes ownership), or nullptr to clear.
     */
    void reset(MYSQL_RES* res = nullptr);

private:
    MYSQL_RES* m_res;  ///< MySQL result set handle (owned)
};

}  // namespace mcpdb
