/**
 * @file MySQLConnection.cpp
 * @brief Implementation of the libmysqlclient session.
 */

#include "MySQLConnection.hpp"
#include "MySQLResultSet.hpp"
#include "MySQLStatement.hpp"
#include "ErrorHandler.hpp"
#include <mysql/errmsg.h>
#include <spdlog/spdlog.h>
#include <cstdio>
#include <mutex>

namespace mcpdb {

namespace {

constexpr const char* kDefaultCharset = "utf8mb4";

// Connect timeout of the side connection used by killSession()
constexpr unsigned int kCancelConnectTimeout = 5;

void initLibrary() {
    // Initialize MySQL library (thread-safe)
    static std::once_flag mysqlInitFlag;
    std::call_once(mysqlInitFlag, []() {
        mysql_library_init(0, nullptr, nullptr);
    });
}

unsigned int toSeconds(std::chrono::seconds value) {
    return static_cast<unsigned int>(value.count());
}

}  // namespace

// ============================================================================
// Construction and Destruction
// ============================================================================

MySQLConnection::MySQLConnection(const Target& target, const TimeoutConfig& timeouts)
    : m_target(target)
    , m_timeouts(timeouts)
    , m_conn(open(target, timeouts))
    , m_threadId(mysql_thread_id(m_conn)) {
}

MySQLConnection::~MySQLConnection() {
    if (m_conn) {
        mysql_close(m_conn);
    }
}

TargetConnectionFactory MySQLConnection::factory(const TimeoutConfig& timeouts) {
    return [timeouts](const Target& target) -> std::unique_ptr<Connection> {
        return std::make_unique<MySQLConnection>(target, timeouts);
    };
}

MYSQL* MySQLConnection::open(const Target& target, const TimeoutConfig& timeouts) {
    initLibrary();

    MYSQL* conn = mysql_init(nullptr);
    if (!conn) {
        throw ExecutionError(CR_OUT_OF_MEMORY, "Failed to initialize MySQL connection");
    }

    // Set options
    unsigned int connectTimeout = toSeconds(timeouts.connect_timeout);
    mysql_options(conn, MYSQL_OPT_CONNECT_TIMEOUT, &connectTimeout);

    unsigned int readTimeout = socketReadTimeout(timeouts.read_timeout);
    mysql_options(conn, MYSQL_OPT_READ_TIMEOUT, &readTimeout);

    unsigned int writeTimeout = toSeconds(timeouts.write_timeout);
    mysql_options(conn, MYSQL_OPT_WRITE_TIMEOUT, &writeTimeout);

    const std::string charset = target.charset.empty() ? kDefaultCharset : target.charset;
    mysql_options(conn, MYSQL_SET_CHARSET_NAME, charset.c_str());

    // No auto-reconnect: a silently reopened session would lose its
    // transaction, so dead sessions are discarded by the pool instead.
    // No CLIENT_MULTI_STATEMENTS: one statement per call.
    if (!mysql_real_connect(conn,
                            target.host.c_str(),
                            target.user.c_str(),
                            target.password.c_str(),
                            nullptr,
                            target.port,
                            nullptr,
                            0)) {
        unsigned int err = mysql_errno(conn);
        std::string msg = mysql_error(conn);
        mysql_close(conn);
        throw ExecutionError(err, "Failed to connect to MySQL: " + msg);
    }

    if (mysql_autocommit(conn, 0) != 0) {
        unsigned int err = mysql_errno(conn);
        std::string msg = mysql_error(conn);
        mysql_close(conn);
        throw ExecutionError(err, "Failed to disable autocommit: " + msg);
    }

    // Older servers lack the variable; the socket timeout still applies
    const std::string limit = statementLimitSql(mysql_get_server_info(conn), timeouts.read_timeout);
    if (!limit.empty() &&
        mysql_real_query(conn, limit.c_str(), static_cast<unsigned long>(limit.size())) != 0) {
        spdlog::warn("Server-side statement limit not set on {}: {}", poolLabel(target),
                     mysql_error(conn));
    }

    spdlog::debug("Opened MySQL session {} to {}", mysql_thread_id(conn), poolLabel(target));
    return conn;
}

unsigned int MySQLConnection::socketReadTimeout(std::chrono::seconds readTimeout) {
    unsigned int limit = toSeconds(readTimeout);
    if (limit == 0) {
        return 0;
    }
    return (limit + 2) / 3;
}

std::string MySQLConnection::statementLimitSql(const std::string& serverInfo,
                                               std::chrono::seconds readTimeout) {
    if (readTimeout.count() <= 0) {
        return {};
    }
    if (serverInfo.find("MariaDB") != std::string::npos) {
        return "SET SESSION max_statement_time = " + std::to_string(readTimeout.count());
    }
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(readTimeout);
    return "SET SESSION max_execution_time = " + std::to_string(millis.count());
}

// ============================================================================
// Connection State
// ============================================================================

bool MySQLConnection::ping() {
    if (!m_conn) return false;
    if (mysql_ping(m_conn) != 0) {
        spdlog::debug("Connection validation failed: {}", mysql_error(m_conn));
        return false;
    }
    return true;
}

void MySQLConnection::selectDatabase(const std::string& database) {
    if (database.empty()) return;

    auto started = std::chrono::steady_clock::now();
    if (mysql_select_db(m_conn, database.c_str()) != 0) {
        raiseError(mysql_errno(m_conn), mysql_error(m_conn), started);
    }
}

// ============================================================================
// Query Execution
// ============================================================================

ResultSet MySQLConnection::execute(const std::string& sql,
                                   const std::vector<Parameter>& parameters,
                                   size_t maxRows) {
    auto started = std::chrono::steady_clock::now();
    if (parameters.empty()) {
        return executeText(sql, maxRows, started);
    }
    return executePrepared(sql, parameters, maxRows, started);
}

ResultSet MySQLConnection::executeText(const std::string& sql, size_t maxRows,
                                       std::chrono::steady_clock::time_point started) {
    // mysql_real_query() is preferred over mysql_query() for binary safety
    if (mysql_real_query(m_conn, sql.c_str(), sql.size()) != 0) {
        raiseError(mysql_errno(m_conn), mysql_error(m_conn), started);
    }

    ResultSet result;

    // Rows are streamed so at most maxRows are held in memory
    MySQLResultSet rows(mysql_use_result(m_conn));
    if (!rows) {
        if (mysql_field_count(m_conn) != 0) {
            raiseError(mysql_errno(m_conn), mysql_error(m_conn), started);
        }
        result.affectedRows = mysql_affected_rows(m_conn);
        return result;
    }

    result.hasRows = true;
    result.columns = rows.columns();

    std::vector<SqlValue> row;
    while ((maxRows == 0 || result.rows.size() < maxRows) && rows.fetchRow(row)) {
        result.rows.push_back(std::move(row));
    }

    if (mysql_errno(m_conn) != 0) {
        raiseError(mysql_errno(m_conn), mysql_error(m_conn), started);
    }

    result.affectedRows = result.rows.size();
    return result;
}

ResultSet MySQLConnection::executePrepared(const std::string& sql,
                                           const std::vector<Parameter>& parameters,
                                           size_t maxRows,
                                           std::chrono::steady_clock::time_point started) {
    MySQLStatement stmt(m_conn);

    if (!stmt.prepare(sql) || !stmt.bindParameters(parameters) || !stmt.execute()) {
        raiseError(stmt.errorNumber(), stmt.error(), started);
    }

    ResultSet result;
    if (!stmt.hasResult()) {
        result.affectedRows = stmt.affectedRows();
        return result;
    }

    result.hasRows = true;
    result.columns = stmt.columns();

    std::vector<SqlValue> row;
    while ((maxRows == 0 || result.rows.size() < maxRows) && stmt.fetchRow(row)) {
        result.rows.push_back(std::move(row));
    }

    if (stmt.errorNumber() != 0) {
        raiseError(stmt.errorNumber(), stmt.error(), started);
    }

    result.affectedRows = result.rows.size();
    return result;
}

// ============================================================================
// Transactions
// ============================================================================

void MySQLConnection::commit() {
    auto started = std::chrono::steady_clock::now();
    if (mysql_commit(m_conn) != 0) {
        raiseError(mysql_errno(m_conn), mysql_error(m_conn), started);
    }
}

void MySQLConnection::rollback() {
    auto started = std::chrono::steady_clock::now();
    if (mysql_rollback(m_conn) != 0) {
        raiseError(mysql_errno(m_conn), mysql_error(m_conn), started);
    }
}

// ============================================================================
// Cancellation
// ============================================================================

CancelHandle MySQLConnection::cancelHandle() const {
    Target target = m_target;
    unsigned long threadId = m_threadId;
    return [target, threadId]() { killSession(target, threadId); };
}

void MySQLConnection::killSession(const Target& target, unsigned long threadId) noexcept {
    MYSQL* side = mysql_init(nullptr);
    if (!side) return;

    unsigned int timeout = kCancelConnectTimeout;
    mysql_options(side, MYSQL_OPT_CONNECT_TIMEOUT, &timeout);

    if (mysql_real_connect(side, target.host.c_str(), target.user.c_str(),
                           target.password.c_str(), nullptr, target.port, nullptr, 0)) {
        char sql[64];
        int len = std::snprintf(sql, sizeof(sql), "KILL CONNECTION %lu", threadId);
        if (mysql_real_query(side, sql, static_cast<unsigned long>(len)) == 0) {
            spdlog::info("Killed MySQL session {}", threadId);
        } else {
            spdlog::warn("Failed to kill MySQL session {}: {}", threadId, mysql_error(side));
        }
    } else {
        spdlog::warn("Failed to open side connection to kill MySQL session {}: {}",
                     threadId, mysql_error(side));
    }

    mysql_close(side);
}

// ============================================================================
// Error Classification
// ============================================================================

void MySQLConnection::raiseError(unsigned int error, const std::string& message,
                                 std::chrono::steady_clock::time_point started) const {
    auto elapsed = std::chrono::steady_clock::now() - started;
    bool deadlinePassed = m_timeouts.read_timeout.count() > 0 &&
                          elapsed >= m_timeouts.read_timeout;

    if (ErrorHandler::isTimeoutError(error) ||
        (ErrorHandler::isConnectionError(error) && deadlinePassed)) {
        throw TimeoutError("Query exceeded the time limit (" +
                           std::to_string(m_timeouts.read_timeout.count()) + " s): " +
                           ErrorHandler::sanitizeMessage(message));
    }

    throw ExecutionError(error, message.empty() ? ErrorHandler::getErrorMessage(error) : message);
}

}  // namespace mcpdb
