#include "Config.hpp"
#include "ErrorHandler.hpp"
#include "GatewayService.hpp"
#include "Logging.hpp"
#include "MySQLConnection.hpp"
#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <iostream>
#include <string>
#include <vector>

using namespace mcpdb;

namespace {

// "-p 42" binds a number, "-p abc" a string, "-p null" NULL
Parameter parseParameter(const std::string& text) {
    Parameter value = Parameter::parse(text, nullptr, false);
    if (value.is_discarded()) {
        return Parameter(text);
    }
    return value;
}

}  // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"mcpdb - MySQL/MariaDB database gateway"};
    app.require_subcommand(1);

    std::string env_file = ".env";
    bool pretty = false;
    app.add_option("--env-file", env_file, "Settings file read before the environment")
        ->default_val(".env");
    app.add_flag("--pretty", pretty, "Indent JSON output");

    std::string database;
    std::string table;
    std::string sql;
    bool relations = false;
    std::vector<std::string> params;

    auto* list_databases = app.add_subcommand("list-databases",
                                              "List databases on every configured server");

    auto* list_tables = app.add_subcommand("list-tables", "List tables and views of a database");
    list_tables->add_option("database", database, "Database name")->required();

    auto* schema = app.add_subcommand("schema", "Describe the columns of a table");
    schema->add_option("database", database, "Database name")->required();
    schema->add_option("table", table, "Table name")->required();
    schema->add_flag("--relations", relations, "Resolve foreign keys");

    auto* query = app.add_subcommand("query", "Execute one SQL statement");
    query->add_option("database", database, "Database name")->required();
    query->add_option("sql", sql, "Statement with ? or %s placeholders")->required();
    query->add_option("-p,--param", params, "Positional parameter (JSON scalar or text)");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    }

    // Parse configuration
    Config config;
    try {
        config = Config::fromEnvironment(env_file);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    // Setup logging
    setupLogging(config.logging);

    // Validate configuration
    if (!config.validate()) {
        return 1;
    }

    try {
        GatewayService service(config, MySQLConnection::factory(config.timeouts));
        service.initializePool();

        json result;
        if (*list_databases) {
            result = service.listDatabases();
        } else if (*list_tables) {
            result = service.listTables(database);
        } else if (*schema) {
            result = relations ? service.getTableSchemaWithRelations(database, table)
                               : service.getTableSchema(database, table);
        } else if (*query) {
            std::vector<Parameter> parameters;
            parameters.reserve(params.size());
            for (const auto& param : params) {
                parameters.push_back(parseParameter(param));
            }
            result = service.executeSql(sql, database, parameters);
        }

        std::cout << GatewayService::dump(result, pretty) << std::endl;
        service.closePool();
        return 0;

    } catch (const GatewayError& e) {
        std::cout << GatewayService::dump(GatewayService::errorToJson(e), pretty) << std::endl;
        return 1;
    } catch (const std::invalid_argument& e) {
        spdlog::error("Invalid configuration: {}", e.what());
        return 1;
    }
}
