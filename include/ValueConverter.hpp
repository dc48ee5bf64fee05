#pragma once

#include "Connection.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace mcpdb {

// Output documents keep insertion (column/catalog) order
using json = nlohmann::ordered_json;

// Turns driver cells into JSON-representable primitives
class ValueConverter {
public:
    // Convert one cell. Integers stay integers, FLOAT/DOUBLE/DECIMAL become
    // doubles, BIT(1) a boolean, binary data a 0x-prefixed hex string,
    // temporal and text values strings. Unparseable numbers stay strings.
    static json normalize(const SqlValue& value, ColumnType type);

    // Convert a row cell by cell
    static std::vector<json> normalizeRow(const std::vector<SqlValue>& row,
                                          const std::vector<ColumnMeta>& columns);

    // "0x" followed by upper-case hex digits
    static std::string toHex(const std::string& bytes);

    // Big-endian BIT value
    static uint64_t bitValue(const std::string& bytes);
};

}  // namespace mcpdb
