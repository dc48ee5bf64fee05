#include "ErrorHandler.hpp"
#include <mysql/errmsg.h>
#include <mysql/mysqld_error.h>
#include <regex>

namespace mcpdb {

namespace {

// Server-side statement timeouts; the numbers differ between MySQL
// (max_execution_time) and MariaDB (max_statement_time) and neither
// header set defines both.
constexpr unsigned int kMySQLQueryTimeout = 3024;
constexpr unsigned int kMariaDBStatementTimeout = 1969;

}  // namespace

thread_local std::string ErrorContext::s_currentContext;

UnknownTargetError::UnknownTargetError(const std::string& name)
    : GatewayError("Unknown database: '" + name + "'")
    , m_target(name) {
}

ExecutionError::ExecutionError(unsigned int errorCode, const std::string& message)
    : GatewayError(ErrorHandler::sanitizeMessage(message))
    , m_errorCode(errorCode) {
}

bool ErrorHandler::isRetryable(unsigned int mysql_error) {
    switch (mysql_error) {
        case CR_SERVER_GONE_ERROR:
        case CR_SERVER_LOST:
        case CR_SERVER_LOST_EXTENDED:
        case ER_LOCK_WAIT_TIMEOUT:
        case ER_LOCK_DEADLOCK:
        case ER_TOO_MANY_CONCURRENT_TRXS:
            return true;
        default:
            return false;
    }
}

bool ErrorHandler::isConnectionError(unsigned int mysql_error) {
    switch (mysql_error) {
        case CR_CONNECTION_ERROR:
        case CR_CONN_HOST_ERROR:
        case CR_UNKNOWN_HOST:
        case CR_SERVER_GONE_ERROR:
        case CR_SERVER_LOST:
        case CR_SERVER_LOST_EXTENDED:
        case CR_COMMANDS_OUT_OF_SYNC:
        case CR_SOCKET_CREATE_ERROR:
        case CR_IPSOCK_ERROR:
            return true;
        default:
            return false;
    }
}

bool ErrorHandler::isTimeoutError(unsigned int mysql_error) {
    return mysql_error == kMySQLQueryTimeout || mysql_error == kMariaDBStatementTimeout;
}

std::string ErrorHandler::getErrorMessage(unsigned int mysql_error) {
    switch (mysql_error) {
        case 0:
            return "Success";
        case CR_CONNECTION_ERROR:
            return "Connection error";
        case CR_CONN_HOST_ERROR:
            return "Cannot connect to host";
        case CR_UNKNOWN_HOST:
            return "Unknown host";
        case CR_SERVER_GONE_ERROR:
            return "MySQL server has gone away";
        case CR_SERVER_LOST:
            return "Lost connection to MySQL server";
        case ER_ACCESS_DENIED_ERROR:
            return "Access denied";
        case ER_BAD_DB_ERROR:
            return "Unknown database";
        case ER_NO_SUCH_TABLE:
            return "Table does not exist";
        case ER_PARSE_ERROR:
            return "SQL parse error";
        case ER_LOCK_WAIT_TIMEOUT:
            return "Lock wait timeout";
        case ER_LOCK_DEADLOCK:
            return "Deadlock detected";
        case kMySQLQueryTimeout:
        case kMariaDBStatementTimeout:
            return "Statement execution time exceeded";
        default:
            return "MySQL error " + std::to_string(mysql_error);
    }
}

std::string ErrorHandler::sanitizeMessage(const std::string& message, size_t maxLength) {
    static const std::regex kKeyValueSecret(
        R"((password|passwd|pwd|secret|token)(\s*[=:]\s*)[^\s;,'"]+)",
        std::regex_constants::icase);
    static const std::regex kIdentifiedBy(
        R"((IDENTIFIED\s+(?:WITH\s+\S+\s+)?(?:BY|AS)\s+)'[^']*')",
        std::regex_constants::icase);
    static const std::regex kUrlCredentials(R"(([A-Za-z][A-Za-z0-9+.-]*://[^:/@\s]+):[^@\s]+@)");

    std::string result = std::regex_replace(message, kKeyValueSecret, "$1$2***");
    result = std::regex_replace(result, kIdentifiedBy, "$1'***'");
    result = std::regex_replace(result, kUrlCredentials, "$1:***@");

    if (result.size() > maxLength) {
        size_t cut = maxLength;
        // Do not split a UTF-8 sequence
        while (cut > 0 && (static_cast<unsigned char>(result[cut]) & 0xC0) == 0x80) {
            --cut;
        }
        result = result.substr(0, cut) + "...";
    }

    return result;
}

ErrorContext::ErrorContext(const std::string& context)
    : m_previous(s_currentContext) {
    if (s_currentContext.empty()) {
        s_currentContext = context;
    } else {
        s_currentContext = s_currentContext + " > " + context;
    }
}

ErrorContext::~ErrorContext() {
    s_currentContext = m_previous;
}

std::string ErrorContext::current() {
    return s_currentContext;
}

}  // namespace mcpdb
