#include "ValueConverter.hpp"
#include <stdexcept>

namespace mcpdb {

json ValueConverter::normalize(const SqlValue& value, ColumnType type) {
    if (!value) {
        return nullptr;
    }

    const std::string& text = *value;

    // Preserve numeric types in JSON output
    try {
        switch (type) {
            case ColumnType::Integer:
                return std::stoll(text);
            case ColumnType::UnsignedInteger:
                return std::stoull(text);
            case ColumnType::Float:
            case ColumnType::Decimal:
                return std::stod(text);
            default:
                break;
        }
    } catch (const std::invalid_argument&) {
        return text;
    } catch (const std::out_of_range&) {
        return text;
    }

    switch (type) {
        case ColumnType::Boolean:
            return bitValue(text) != 0;
        case ColumnType::Bit:
            return bitValue(text);
        case ColumnType::Binary:
            return toHex(text);
        default:
            return text;
    }
}

std::vector<json> ValueConverter::normalizeRow(const std::vector<SqlValue>& row,
                                               const std::vector<ColumnMeta>& columns) {
    std::vector<json> result;
    result.reserve(row.size());
    for (size_t i = 0; i < row.size(); ++i) {
        ColumnType type = i < columns.size() ? columns[i].type : ColumnType::String;
        result.push_back(normalize(row[i], type));
    }
    return result;
}

std::string ValueConverter::toHex(const std::string& bytes) {
    static const char kDigits[] = "0123456789ABCDEF";

    std::string result = "0x";
    result.reserve(2 + bytes.size() * 2);
    for (unsigned char c : bytes) {
        result += kDigits[c >> 4];
        result += kDigits[c & 0x0F];
    }
    return result;
}

uint64_t ValueConverter::bitValue(const std::string& bytes) {
    uint64_t result = 0;
    for (unsigned char c : bytes) {
        result = (result << 8) | c;
    }
    return result;
}

}  // namespace mcpdb
