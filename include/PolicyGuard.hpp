#pragma once

/**
 * @file PolicyGuard.hpp
 * @brief Stateless safety predicates applied to every statement.
 *
 * Classification is lexical and heuristic: it reads the leading keyword
 * of each statement after skipping comments and parentheses, and fails
 * closed (WRITE) on anything it does not recognise.
 */

#include "Connection.hpp"
#include <string>
#include <vector>

namespace mcpdb {

enum class StatementKind {
    Read,
    Write
};

// Statement text with `?` placeholders, ready for the driver's binding API
struct BoundStatement {
    std::string sql;
    std::vector<Parameter> parameters;
};

class PolicyGuard {
public:
    /**
     * @brief Classify a statement as READ or WRITE.
     *
     * READ: SELECT, SHOW, DESCRIBE/DESC, EXPLAIN and WITH ... SELECT.
     * WRITE: everything else, including empty text, executable comments
     * (`/*! ... *\/`), SELECT ... INTO OUTFILE/DUMPFILE, and multi-statement
     * text where any statement is a write.
     */
    static StatementKind classify(const std::string& sql);

    static bool isWriteStatement(const std::string& sql) {
        return classify(sql) == StatementKind::Write;
    }

    /**
     * @brief Reject writes when read-only mode is on.
     * @throws ReadOnlyViolationError
     */
    static void enforceReadOnly(const std::string& sql, bool readOnly);

    /**
     * @brief Check the placeholder contract and normalise markers.
     *
     * `?` and `%s` outside literals, quoted identifiers and comments are
     * placeholders; `%s` is rewritten to `?`.
     * @throws ParameterBindingError on count mismatch or array/object values.
     */
    static BoundStatement bind(const std::string& sql, const std::vector<Parameter>& parameters);

    /**
     * @brief Keep at most `limit` rows.
     * @return true if rows were dropped.
     */
    template <typename Row>
    static bool cap(std::vector<Row>& rows, size_t limit) {
        if (rows.size() <= limit) {
            return false;
        }
        rows.erase(rows.begin() + static_cast<std::ptrdiff_t>(limit), rows.end());
        return true;
    }

    static const char* kindName(StatementKind kind);
};

}  // namespace mcpdb
