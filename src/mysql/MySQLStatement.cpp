/**
 * @file MySQLStatement.cpp
 * @brief Implementation of the prepared statement wrapper.
 */

#include "MySQLStatement.hpp"
#include "ErrorHandler.hpp"
#include <mysql/errmsg.h>

namespace mcpdb {

namespace {

// Initial per-column fetch buffer; longer values are re-read in full
constexpr size_t kInitialColumnBuffer = 256;

}  // namespace

// ============================================================================
// Construction and Destruction
// ============================================================================

MySQLStatement::MySQLStatement(MYSQL* conn)
    : m_stmt(conn ? mysql_stmt_init(conn) : nullptr) {
}

MySQLStatement::~MySQLStatement() {
    // Release the metadata before the statement that produced it
    m_metadata.reset();
    if (m_stmt) {
        mysql_stmt_close(m_stmt);
    }
}

// ============================================================================
// Preparation and Binding
// ============================================================================

bool MySQLStatement::prepare(const std::string& sql) {
    if (!m_stmt) return false;
    return mysql_stmt_prepare(m_stmt, sql.c_str(), sql.size()) == 0;
}

bool MySQLStatement::bindParameters(const std::vector<Parameter>& parameters) {
    if (!m_stmt) return false;
    if (parameters.empty()) return true;

    m_parameterBinds.assign(parameters.size(), MYSQL_BIND{});
    m_parameters.assign(parameters.size(), ParameterBuffer{});

    for (size_t i = 0; i < parameters.size(); ++i) {
        const Parameter& value = parameters[i];
        MYSQL_BIND& bind = m_parameterBinds[i];
        ParameterBuffer& buffer = m_parameters[i];

        switch (value.type()) {
            case Parameter::value_t::null:
                bind.buffer_type = MYSQL_TYPE_NULL;
                break;
            case Parameter::value_t::boolean:
                buffer.integer = value.get<bool>() ? 1 : 0;
                bind.buffer_type = MYSQL_TYPE_LONGLONG;
                bind.buffer = &buffer.integer;
                break;
            case Parameter::value_t::number_integer:
                buffer.integer = value.get<long long>();
                bind.buffer_type = MYSQL_TYPE_LONGLONG;
                bind.buffer = &buffer.integer;
                break;
            case Parameter::value_t::number_unsigned:
                buffer.integer = static_cast<long long>(value.get<unsigned long long>());
                bind.buffer_type = MYSQL_TYPE_LONGLONG;
                bind.buffer = &buffer.integer;
                bind.is_unsigned = 1;
                break;
            case Parameter::value_t::number_float:
                buffer.real = value.get<double>();
                bind.buffer_type = MYSQL_TYPE_DOUBLE;
                bind.buffer = &buffer.real;
                break;
            case Parameter::value_t::string:
                buffer.text = value.get<std::string>();
                buffer.length = static_cast<unsigned long>(buffer.text.size());
                bind.buffer_type = MYSQL_TYPE_STRING;
                bind.buffer = buffer.text.data();
                bind.buffer_length = buffer.length;
                bind.length = &buffer.length;
                break;
            default:
                throw ParameterBindingError("Parameter " + std::to_string(i + 1) +
                                            " has unsupported type '" + value.type_name() + "'");
        }
    }

    return mysql_stmt_bind_param(m_stmt, m_parameterBinds.data()) == 0;
}

// ============================================================================
// Execution and Fetching
// ============================================================================

bool MySQLStatement::execute() {
    if (!m_stmt) return false;

    if (mysql_stmt_execute(m_stmt) != 0) {
        return false;
    }

    m_metadata.reset(mysql_stmt_result_metadata(m_stmt));
    return m_metadata ? bindResults() : true;
}

void MySQLStatement::bindColumn(size_t index) {
    ColumnBuffer& column = m_columns[index];
    MYSQL_BIND& bind = m_resultBinds[index];

    bind.buffer_type = MYSQL_TYPE_STRING;
    bind.buffer = column.data.data();
    bind.buffer_length = static_cast<unsigned long>(column.data.size());
    bind.length = &column.length;
    bind.is_null = &column.isNull;
    bind.error = &column.error;
}

bool MySQLStatement::bindResults() {
    unsigned int count = m_metadata.numFields();

    m_resultBinds.assign(count, MYSQL_BIND{});
    m_columns.assign(count, ColumnBuffer{});

    for (size_t i = 0; i < count; ++i) {
        m_columns[i].data.resize(kInitialColumnBuffer);
        bindColumn(i);
    }

    return mysql_stmt_bind_result(m_stmt, m_resultBinds.data()) == 0;
}

bool MySQLStatement::fetchRow(std::vector<SqlValue>& row) {
    if (!m_stmt || !m_metadata) return false;

    int rc = mysql_stmt_fetch(m_stmt);
    if (rc == 1 || rc == MYSQL_NO_DATA) {
        return false;
    }

    bool rebind = false;
    row.clear();
    row.reserve(m_columns.size());

    for (size_t i = 0; i < m_columns.size(); ++i) {
        ColumnBuffer& column = m_columns[i];
        if (column.isNull) {
            row.emplace_back(std::nullopt);
            continue;
        }

        // MYSQL_DATA_TRUNCATED: grow the buffer and read the column again
        if (column.length > column.data.size()) {
            column.data.resize(column.length);
            bindColumn(i);
            if (mysql_stmt_fetch_column(m_stmt, &m_resultBinds[i],
                                        static_cast<unsigned int>(i), 0) != 0) {
                return false;
            }
            rebind = true;
        }

        row.emplace_back(std::string(column.data.data(), column.length));
    }

    // Later rows must land in the grown buffers
    if (rebind && mysql_stmt_bind_result(m_stmt, m_resultBinds.data()) != 0) {
        return false;
    }

    return true;
}

// ============================================================================
// Error and Status Information
// ============================================================================

uint64_t MySQLStatement::affectedRows() const {
    if (!m_stmt) return 0;
    return mysql_stmt_affected_rows(m_stmt);
}

const char* MySQLStatement::error() const {
    if (!m_stmt) return "Failed to initialize MySQL statement";
    return mysql_stmt_error(m_stmt);
}

unsigned int MySQLStatement::errorNumber() const {
    if (!m_stmt) return CR_OUT_OF_MEMORY;
    return mysql_stmt_errno(m_stmt);
}

}  // namespace mcpdb
