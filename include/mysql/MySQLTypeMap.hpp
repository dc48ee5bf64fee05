#pragma once

/**
 * @file MySQLTypeMap.hpp
 * @brief Maps MySQL field metadata to portable column types.
 */

#include "Connection.hpp"
#include <mysql/mysql.h>

namespace mcpdb {

class MySQLTypeMap {
public:
    // Charset number libmysqlclient reports for binary strings and blobs
    static constexpr unsigned int kBinaryCharset = 63;

    /**
     * @brief Classify a column.
     * @param type Wire type of the column.
     * @param charsetnr Character set number; 63 marks binary data.
     * @param length Declared display length (BIT(1) is a boolean).
     * @param flags Field flags (UNSIGNED_FLAG selects unsigned integers).
     */
    static ColumnType fromField(enum_field_types type, unsigned int charsetnr,
                                unsigned long length, unsigned int flags);

    static ColumnType fromField(const MYSQL_FIELD& field);

    // Column metadata of a result set, in column order
    static std::vector<ColumnMeta> columns(MYSQL_FIELD* fields, unsigned int count);
};

}  // namespace mcpdb
