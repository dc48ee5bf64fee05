/**
 * @file MySQLResultSet.cpp
 * @brief Implementation of RAII MySQL result set wrapper.
 */

#include "MySQLResultSet.hpp"
#include "MySQLTypeMap.hpp"

namespace mcpdb {

// ============================================================================
// Construction and Destruction
// ============================================================================

MySQLResultSet::MySQLResultSet(MYSQL_RES* res) : m_res(res) {}

MySQLResultSet::~MySQLResultSet() {
    reset();
}

// ============================================================================
// Move Operations
// ============================================================================

MySQLResultSet::MySQLResultSet(MySQLResultSet&& other) noexcept : m_res(other.m_res) {
    other.m_res = nullptr;
}

MySQLResultSet& MySQLResultSet::operator=(MySQLResultSet&& other) noexcept {
    if (this != &other) {
        reset(other.m_res);
        other.m_res = nullptr;
    }
    return *this;
}

// ============================================================================
// Row and Field Access
// ============================================================================

bool MySQLResultSet::fetchRow(std::vector<SqlValue>& row) {
    if (!m_res) return false;

    MYSQL_ROW data = mysql_fetch_row(m_res);
    if (!data) return false;

    unsigned int count = mysql_num_fields(m_res);
    unsigned long* lengths = mysql_fetch_lengths(m_res);

    row.clear();
    row.reserve(count);
    for (unsigned int i = 0; i < count; ++i) {
        if (data[i]) {
            // Use length to handle binary data correctly
            row.emplace_back(std::string(data[i], lengths[i]));
        } else {
            row.emplace_back(std::nullopt);
        }
    }
    return true;
}

unsigned int MySQLResultSet::numFields() const {
    return m_res ? mysql_num_fields(m_res) : 0;
}

std::vector<ColumnMeta> MySQLResultSet::columns() const {
    if (!m_res) return {};
    return MySQLTypeMap::columns(mysql_fetch_fields(m_res), mysql_num_fields(m_res));
}

// ============================================================================
// Resource Management
// ============================================================================

// Freeing a mysql_use_result() handle drains the rows still on the wire
void MySQLResultSet::reset(MYSQL_RES* res) {
    if (m_res) {
        mysql_free_result(m_res);
    }
    m_res = res;
}

}  // namespace mcpdb
