#pragma once

/**
 * @file MySQLConnection.hpp
 * @brief libmysqlclient implementation of a pooled database session.
 *
 * Wraps one MYSQL handle opened with the connect/read/write timeouts of
 * the configuration and auto-commit disabled. Statements without
 * parameters run through the text protocol; parameterised ones through
 * MySQLStatement.
 */

#include "Config.hpp"
#include "Connection.hpp"
#include "PoolManager.hpp"
#include "TargetRegistry.hpp"
#include <mysql/mysql.h>
#include <chrono>
#include <memory>
#include <string>

namespace mcpdb {

/**
 * @class MySQLConnection
 * @brief One MySQL/MariaDB session.
 *
 * Thread Safety:
 * - Not thread-safe; the lease holder is the only caller. The handle
 *   from cancelHandle() may be run by any thread.
 *
 * Usage:
 * @code
 *   PoolManager pools(MySQLConnection::factory(config.timeouts), config.pool);
 *   auto conn = pools.acquire(target);
 *   conn->selectDatabase("world");
 *   auto result = conn->execute("SELECT * FROM cities WHERE id = ?", {7}, 100);
 * @endcode
 */
class MySQLConnection : public Connection {
public:
    /**
     * @brief Connect to the server described by `target`.
     * @throws ExecutionError if the connection cannot be established.
     */
    MySQLConnection(const Target& target, const TimeoutConfig& timeouts);

    // Closes the MYSQL handle
    ~MySQLConnection() override;

    // Factory used by PoolManager to open sessions
    static TargetConnectionFactory factory(const TimeoutConfig& timeouts);

    /**
     * @brief Value for MYSQL_OPT_READ_TIMEOUT.
     *
     * The client retries a timed-out read up to three times, so the socket
     * option is a third of the query time limit, rounded up.
     */
    static unsigned int socketReadTimeout(std::chrono::seconds readTimeout);

    /**
     * @brief Session statement that bounds query time on the server.
     * @param serverInfo mysql_get_server_info() of the session.
     * @return max_statement_time (MariaDB, seconds) or max_execution_time
     *         (MySQL, milliseconds); empty when no limit is configured.
     */
    static std::string statementLimitSql(const std::string& serverInfo,
                                         std::chrono::seconds readTimeout);

    bool ping() override;
    void selectDatabase(const std::string& database) override;
    ResultSet execute(const std::string& sql,
                      const std::vector<Parameter>& parameters,
                      size_t maxRows) override;
    void commit() override;
    void rollback() override;

    /**
     * @brief Handle that kills this session from a side connection.
     *
     * Issues KILL CONNECTION for the session's thread id; the blocked
     * call in the owning thread then fails with a connection error.
     */
    CancelHandle cancelHandle() const override;

    MYSQL* get() const { return m_conn; }
    unsigned long threadId() const { return m_threadId; }

private:
    // Open and configure a MYSQL handle; throws ExecutionError
    static MYSQL* open(const Target& target, const TimeoutConfig& timeouts);

    static void killSession(const Target& target, unsigned long threadId) noexcept;

    ResultSet executeText(const std::string& sql, size_t maxRows,
                          std::chrono::steady_clock::time_point started);
    ResultSet executePrepared(const std::string& sql,
                              const std::vector<Parameter>& parameters,
                              size_t maxRows,
                              std::chrono::steady_clock::time_point started);

    /**
     * @brief Throw the error for a failed call.
     *
     * Server statement timeouts, and connection losses after the read
     * timeout has elapsed, become TimeoutError; the rest ExecutionError.
     */
    void raiseError(unsigned int error, const std::string& message,
                    std::chrono::steady_clock::time_point started) const;

    Target m_target;           ///< Kept for the cancel side connection
    TimeoutConfig m_timeouts;
    MYSQL* m_conn;             ///< MySQL connection handle (owned)
    unsigned long m_threadId;  ///< Server thread id of this session
};

}  // namespace mcpdb
