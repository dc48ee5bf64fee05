#include "MySQLTypeMap.hpp"

namespace mcpdb {

ColumnType MySQLTypeMap::fromField(enum_field_types type, unsigned int charsetnr,
                                   unsigned long length, unsigned int flags) {
    switch (type) {
        case MYSQL_TYPE_TINY:
        case MYSQL_TYPE_SHORT:
        case MYSQL_TYPE_INT24:
        case MYSQL_TYPE_LONG:
        case MYSQL_TYPE_LONGLONG:
            return (flags & UNSIGNED_FLAG) ? ColumnType::UnsignedInteger : ColumnType::Integer;
        case MYSQL_TYPE_YEAR:
            return ColumnType::Integer;
        case MYSQL_TYPE_FLOAT:
        case MYSQL_TYPE_DOUBLE:
            return ColumnType::Float;
        case MYSQL_TYPE_DECIMAL:
        case MYSQL_TYPE_NEWDECIMAL:
            return ColumnType::Decimal;
        case MYSQL_TYPE_BIT:
            return length == 1 ? ColumnType::Boolean : ColumnType::Bit;
        case MYSQL_TYPE_DATE:
        case MYSQL_TYPE_NEWDATE:
        case MYSQL_TYPE_TIME:
        case MYSQL_TYPE_TIME2:
        case MYSQL_TYPE_DATETIME:
        case MYSQL_TYPE_DATETIME2:
        case MYSQL_TYPE_TIMESTAMP:
        case MYSQL_TYPE_TIMESTAMP2:
            return ColumnType::Temporal;
        case MYSQL_TYPE_JSON:
            return ColumnType::Json;
        case MYSQL_TYPE_TINY_BLOB:
        case MYSQL_TYPE_MEDIUM_BLOB:
        case MYSQL_TYPE_LONG_BLOB:
        case MYSQL_TYPE_BLOB:
        case MYSQL_TYPE_VARCHAR:
        case MYSQL_TYPE_VAR_STRING:
        case MYSQL_TYPE_STRING:
            return charsetnr == kBinaryCharset ? ColumnType::Binary : ColumnType::String;
        case MYSQL_TYPE_GEOMETRY:
            return ColumnType::Binary;
        default:
            return ColumnType::String;
    }
}

ColumnType MySQLTypeMap::fromField(const MYSQL_FIELD& field) {
    return fromField(field.type, field.charsetnr, field.length, field.flags);
}

std::vector<ColumnMeta> MySQLTypeMap::columns(MYSQL_FIELD* fields, unsigned int count) {
    std::vector<ColumnMeta> result;
    if (!fields) return result;

    result.reserve(count);
    for (unsigned int i = 0; i < count; ++i) {
        result.push_back({fields[i].name, fromField(fields[i]),
                          fields[i].table ? fields[i].table : ""});
    }
    return result;
}

}  // namespace mcpdb
