#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "MySQLSchemaInspector.hpp"
#include "ErrorHandler.hpp"
#include "FakeConnection.hpp"

using namespace mcpdb;
using namespace mcpdb::fake;
using namespace std::chrono_literals;

namespace {

bool contains(const std::string& sql, const char* fragment) {
    return sql.find(fragment) != std::string::npos;
}

SqlValue str(const char* value) {
    return std::string(value);
}

// Catalog of a small "world" database with cities.country_id -> countries.id
ResultSet worldCatalog(const std::string& sql, const std::vector<Parameter>& params) {
    if (contains(sql, "INFORMATION_SCHEMA.SCHEMATA")) {
        return makeRows({"SCHEMA_NAME"}, {{str("information_schema")}, {str("mysql")},
                                          {str("performance_schema")}, {str("sys")},
                                          {str("world")}, {str("shop")}});
    }

    const std::string schema = params.empty() ? "" : params[0].get<std::string>();
    if (schema != "world") {
        return makeRows({"X"}, {});
    }

    if (contains(sql, "INFORMATION_SCHEMA.TABLES")) {
        return makeRows({"TABLE_NAME"}, {{str("cities")}, {str("countries")}});
    }

    const std::string table = params[1].get<std::string>();

    if (contains(sql, "INFORMATION_SCHEMA.COLUMNS")) {
        if (table == "cities") {
            return makeRows({"COLUMN_NAME", "COLUMN_TYPE", "IS_NULLABLE", "COLUMN_DEFAULT",
                             "COLUMN_KEY", "EXTRA"},
                            {{str("id"), str("int(11)"), str("NO"), std::nullopt, str("PRI"),
                              str("auto_increment")},
                             {str("name"), str("varchar(64)"), str("NO"), str(""), str(""),
                              str("")},
                             {str("country_id"), str("int(11)"), str("YES"), std::nullopt,
                              str("MUL"), str("")}});
        }
        if (table == "countries") {
            return makeRows({"COLUMN_NAME", "COLUMN_TYPE", "IS_NULLABLE", "COLUMN_DEFAULT",
                             "COLUMN_KEY", "EXTRA"},
                            {{str("id"), str("int(11)"), str("NO"), std::nullopt, str("PRI"),
                              str("")}});
        }
        return makeRows({"COLUMN_NAME"}, {});
    }

    if (contains(sql, "KEY_COLUMN_USAGE") && table == "cities") {
        return makeRows({"CONSTRAINT_NAME", "COLUMN_NAME", "REFERENCED_TABLE_SCHEMA",
                         "REFERENCED_TABLE_NAME", "REFERENCED_COLUMN_NAME"},
                        {{str("fk_country"), str("country_id"), str("world"), str("countries"),
                          str("id")}});
    }

    return makeRows({"X"}, {});
}

}  // namespace

class SchemaInspectorTest : public ::testing::Test {
protected:
    SchemaInspectorTest()
        : registry_(serverWide())
        , pools_(fakeTargetFactory(server_), poolConfig())
        , inspector_(registry_, pools_) {
        server_->setHandler(worldCatalog);
    }

    static std::vector<Target> serverWide() {
        Target target;
        target.host = "db1";
        target.user = "reader";
        return {target};
    }

    static PoolConfig poolConfig() {
        PoolConfig config;
        config.max_size = 2;
        config.acquire_timeout = 1000ms;
        config.drain_timeout = 50ms;
        return config;
    }

    std::shared_ptr<FakeServer> server_ = std::make_shared<FakeServer>();
    TargetRegistry registry_;
    PoolManager pools_;
    MySQLSchemaInspector inspector_;
};

TEST_F(SchemaInspectorTest, ListDatabasesHidesSystemSchemas) {
    EXPECT_THAT(inspector_.listDatabases(), ::testing::ElementsAre("world", "shop"));
}

TEST_F(SchemaInspectorTest, ListDatabasesOnlyShowsResolvableNames) {
    Target named;
    named.name = "world";
    named.host = "db1";
    named.user = "reader";
    TargetRegistry registry({named});
    MySQLSchemaInspector inspector(registry, pools_);

    EXPECT_THAT(inspector.listDatabases(), ::testing::ElementsAre("world"));
}

TEST_F(SchemaInspectorTest, ListDatabasesQueriesEachServerOnce) {
    Target a;
    a.name = "world";
    a.host = "db1";
    a.user = "reader";
    Target b = a;
    b.name = "shop";
    TargetRegistry registry({a, b});
    MySQLSchemaInspector inspector(registry, pools_);

    EXPECT_THAT(inspector.listDatabases(), ::testing::ElementsAre("world", "shop"));
    EXPECT_EQ(server_->executed().size(), 1u);
}

TEST_F(SchemaInspectorTest, ListDatabasesFailsWhenEveryServerFails) {
    server_->refuseConnections = true;

    EXPECT_THROW(inspector_.listDatabases(), ExecutionError);
}

TEST_F(SchemaInspectorTest, ListTables) {
    EXPECT_THAT(inspector_.listTables("world"), ::testing::ElementsAre("cities", "countries"));

    auto executed = server_->executed();
    ASSERT_EQ(executed.size(), 1u);
    ASSERT_EQ(executed[0].parameters.size(), 1u);
    EXPECT_EQ(executed[0].parameters[0], "world");
}

TEST_F(SchemaInspectorTest, ListTablesOfUnknownDatabaseIsEmpty) {
    EXPECT_TRUE(inspector_.listTables("nonexistent_db").empty());
    EXPECT_TRUE(inspector_.listTables("mysql").empty());
}

TEST_F(SchemaInspectorTest, ListTablesOfUnresolvableDatabaseIsEmpty) {
    Target named;
    named.name = "world";
    named.host = "db1";
    named.user = "reader";
    TargetRegistry registry({named});
    MySQLSchemaInspector inspector(registry, pools_);

    EXPECT_TRUE(inspector.listTables("shop").empty());
    EXPECT_TRUE(server_->executed().empty());
}

TEST_F(SchemaInspectorTest, GetSchemaKeepsCatalogOrder) {
    auto schema = inspector_.getSchema("world", "cities");

    ASSERT_EQ(schema.columns.size(), 3u);
    EXPECT_EQ(schema.columns[0].name, "id");
    EXPECT_EQ(schema.columns[1].name, "name");
    EXPECT_EQ(schema.columns[2].name, "country_id");

    const auto* id = schema.column("id");
    ASSERT_NE(id, nullptr);
    EXPECT_EQ(id->type, "int(11)");
    EXPECT_FALSE(id->nullable);
    EXPECT_FALSE(id->defaultValue.has_value());
    EXPECT_EQ(id->key, "PRI");
    EXPECT_EQ(id->extra, "auto_increment");
    EXPECT_FALSE(id->foreignKey.has_value());
}

TEST_F(SchemaInspectorTest, GetSchemaJsonShape) {
    auto doc = inspector_.getSchema("world", "cities").toJson();

    ASSERT_TRUE(doc.is_object());
    std::vector<std::string> keys;
    for (auto it = doc.begin(); it != doc.end(); ++it) {
        keys.push_back(it.key());
    }
    EXPECT_THAT(keys, ::testing::ElementsAre("id", "name", "country_id"));

    EXPECT_EQ(doc["id"]["type"], "int(11)");
    EXPECT_EQ(doc["id"]["nullable"], false);
    EXPECT_TRUE(doc["id"]["default"].is_null());
    EXPECT_EQ(doc["name"]["default"], "");
    EXPECT_EQ(doc["country_id"]["nullable"], true);
    EXPECT_FALSE(doc["country_id"].contains("foreign_key"));
}

TEST_F(SchemaInspectorTest, GetSchemaOfUnknownTableIsEmpty) {
    EXPECT_TRUE(inspector_.getSchema("world", "nope").empty());
    EXPECT_TRUE(inspector_.getSchema("nonexistent_db", "cities").empty());
    EXPECT_TRUE(inspector_.getSchema("nonexistent_db", "cities").toJson().empty());
}

TEST_F(SchemaInspectorTest, RelationsAnnotateForeignKeys) {
    auto schema = inspector_.getSchemaWithRelations("world", "cities");

    const auto* country = schema.column("country_id");
    ASSERT_NE(country, nullptr);
    ASSERT_TRUE(country->foreignKey.has_value());
    EXPECT_EQ(country->foreignKey->referencedTable, "countries");
    EXPECT_EQ(country->foreignKey->referencedColumn, "id");

    ASSERT_EQ(schema.foreignKeys.size(), 1u);
    EXPECT_EQ(schema.foreignKeys[0].constraintName, "fk_country");

    auto doc = schema.toJson();
    EXPECT_EQ(doc["country_id"]["foreign_key"]["referenced_table"], "countries");
    EXPECT_EQ(doc["country_id"]["foreign_key"]["referenced_column"], "id");
    EXPECT_FALSE(doc["name"].contains("foreign_key"));
    EXPECT_FALSE(doc["id"].contains("foreign_key"));
}

TEST_F(SchemaInspectorTest, RelationsDocumentCarriesColumnsAndConstraints) {
    auto doc = inspector_.getSchemaWithRelations("world", "cities").relationsToJson();

    EXPECT_EQ(doc["table_name"], "cities");
    ASSERT_TRUE(doc.contains("columns"));
    EXPECT_EQ(doc["columns"]["country_id"]["foreign_key"]["referenced_table"], "countries");
    EXPECT_EQ(doc["columns"]["country_id"]["foreign_key"]["referenced_column"], "id");
    EXPECT_FALSE(doc["columns"]["name"].contains("foreign_key"));

    ASSERT_EQ(doc["foreign_keys"].size(), 1u);
    EXPECT_EQ(doc["foreign_keys"][0].dump(),
              R"({"constraint_name":"fk_country","column":"country_id",)"
              R"("referenced_schema":"world","referenced_table":"countries",)"
              R"("referenced_column":"id"})");
}

TEST_F(SchemaInspectorTest, RelationsOfUnknownTableAreEmpty) {
    EXPECT_TRUE(inspector_.getSchemaWithRelations("world", "nope").empty());
    EXPECT_TRUE(inspector_.getSchemaWithRelations("nonexistent_db", "x").empty());
}

TEST_F(SchemaInspectorTest, CatalogQueriesCommit) {
    inspector_.getSchemaWithRelations("world", "cities");

    EXPECT_EQ(server_->commits.load(), 2);
    EXPECT_EQ(server_->created.load(), 1);
}

TEST_F(SchemaInspectorTest, QuotedCatalogDefaultsAreUnwrapped) {
    server_->setHandler([](const std::string& sql, const std::vector<Parameter>&) {
        if (!contains(sql, "INFORMATION_SCHEMA.COLUMNS")) {
            return makeRows({"X"}, {});
        }
        return makeRows({"COLUMN_NAME", "COLUMN_TYPE", "IS_NULLABLE", "COLUMN_DEFAULT",
                         "COLUMN_KEY", "EXTRA"},
                        {{str("note"), str("varchar(20)"), str("YES"), str("NULL"), str(""),
                          str("")},
                         {str("label"), str("varchar(20)"), str("NO"), str("'abc'"), str(""),
                          str("")},
                         {str("created"), str("timestamp"), str("NO"),
                          str("current_timestamp()"), str(""), str("")}});
    });

    auto doc = inspector_.getSchema("world", "cities").toJson();

    EXPECT_TRUE(doc["note"]["default"].is_null());
    EXPECT_EQ(doc["label"]["default"], "abc");
    EXPECT_EQ(doc["created"]["default"], "current_timestamp()");
}

TEST_F(SchemaInspectorTest, ColumnDefaultText) {
    EXPECT_FALSE(columnDefault(std::nullopt).has_value());
    EXPECT_FALSE(columnDefault(str("NULL")).has_value());
    EXPECT_EQ(columnDefault(str("'NULL'")).value_or("<null>"), "NULL");
    EXPECT_EQ(columnDefault(str("'it''s'")).value_or("<null>"), "it's");
    EXPECT_EQ(columnDefault(str("''")).value_or("<null>"), "");
    EXPECT_EQ(columnDefault(str("0")).value_or("<null>"), "0");
    EXPECT_EQ(columnDefault(str("")).value_or("<null>"), "");
}

TEST_F(SchemaInspectorTest, SystemSchemaNames) {
    EXPECT_TRUE(isSystemSchema("information_schema"));
    EXPECT_TRUE(isSystemSchema("PERFORMANCE_SCHEMA"));
    EXPECT_TRUE(isSystemSchema("mysql"));
    EXPECT_TRUE(isSystemSchema("sys"));
    EXPECT_FALSE(isSystemSchema("world"));
}
