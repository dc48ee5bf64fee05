#pragma once

/**
 * @file Connection.hpp
 * @brief Driver-neutral interface of one live database session.
 *
 * The pool, executor and schema inspector only talk to this interface;
 * MySQLConnection is the libmysqlclient implementation.
 */

#include <nlohmann/json.hpp>
#include <functional>
#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <cstddef>

namespace mcpdb {

// Raw cell as returned by the driver; nullopt is SQL NULL
using SqlValue = std::optional<std::string>;

// Aborts one session from another thread; best effort, never throws
using CancelHandle = std::function<void()>;

// Positional statement argument (JSON scalar)
using Parameter = nlohmann::json;

// Portable classification of a result column
enum class ColumnType {
    Integer,
    UnsignedInteger,
    Float,
    Decimal,
    Boolean,
    Bit,
    Temporal,
    String,
    Json,
    Binary
};

struct ColumnMeta {
    std::string name;
    ColumnType type = ColumnType::String;
    std::string table;  ///< Table alias, empty for expressions
};

// Result of one statement in driver form
struct ResultSet {
    std::vector<ColumnMeta> columns;
    std::vector<std::vector<SqlValue>> rows;
    uint64_t affectedRows = 0;
    bool hasRows = false;  ///< false for statements without a result set
};

/**
 * @class Connection
 * @brief One database session owned by a pool.
 *
 * All methods except cancelHandle() are called by the single thread that holds
 * the lease. Failures are reported as ExecutionError or TimeoutError.
 */
class Connection {
public:
    virtual ~Connection() = default;

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    // Check the session is alive
    virtual bool ping() = 0;

    // Make `database` the default schema of the session
    virtual void selectDatabase(const std::string& database) = 0;

    /**
     * @brief Execute one statement.
     * @param sql Statement text with `?` placeholders.
     * @param parameters One value per placeholder, bound by the driver.
     * @param maxRows Stop fetching after this many rows (0 = no limit).
     */
    virtual ResultSet execute(const std::string& sql,
                              const std::vector<Parameter>& parameters,
                              size_t maxRows) = 0;

    virtual void commit() = 0;
    virtual void rollback() = 0;

    // Callable that aborts this session; it stays valid after the session closes
    virtual CancelHandle cancelHandle() const = 0;

protected:
    Connection() = default;
};

}  // namespace mcpdb
