#include "SchemaInspector.hpp"
#include <algorithm>
#include <cctype>

namespace mcpdb {

bool isSystemSchema(const std::string& database) {
    std::string lower = database;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    return lower == "information_schema" || lower == "mysql" ||
           lower == "performance_schema" || lower == "sys";
}

SqlValue columnDefault(const SqlValue& catalogValue) {
    if (!catalogValue || *catalogValue == "NULL") {
        return std::nullopt;
    }

    const std::string& text = *catalogValue;
    if (text.size() < 2 || text.front() != '\'' || text.back() != '\'') {
        return text;
    }

    std::string value;
    value.reserve(text.size() - 2);
    for (size_t i = 1; i + 1 < text.size(); ++i) {
        value += text[i];
        if (text[i] == '\'' && text[i + 1] == '\'' && i + 2 < text.size()) {
            ++i;
        }
    }
    return value;
}

const ColumnDescriptor* SchemaDescriptor::column(const std::string& name) const {
    for (const auto& col : columns) {
        if (col.name == name) {
            return &col;
        }
    }
    return nullptr;
}

json SchemaDescriptor::toJson() const {
    json result = json::object();

    for (const auto& col : columns) {
        json entry = json::object();
        entry["type"] = col.type;
        entry["nullable"] = col.nullable;
        entry["default"] = col.defaultValue ? json(*col.defaultValue) : json(nullptr);
        entry["key"] = col.key;
        entry["extra"] = col.extra;

        if (col.foreignKey) {
            entry["foreign_key"] = {
                {"referenced_table", col.foreignKey->referencedTable},
                {"referenced_column", col.foreignKey->referencedColumn}};
        }

        result[col.name] = std::move(entry);
    }

    return result;
}

json SchemaDescriptor::relationsToJson() const {
    json constraints = json::array();
    for (const auto& fk : foreignKeys) {
        constraints.push_back({{"constraint_name", fk.constraintName},
                               {"column", fk.column},
                               {"referenced_schema", fk.referencedSchema},
                               {"referenced_table", fk.referencedTable},
                               {"referenced_column", fk.referencedColumn}});
    }

    return {{"table_name", table}, {"columns", toJson()}, {"foreign_keys", std::move(constraints)}};
}

}  // namespace mcpdb
