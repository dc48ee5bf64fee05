#pragma once

/**
 * @file GatewayService.hpp
 * @brief Tool entry points called by the protocol layer.
 *
 * Each tool takes already-parsed arguments and returns a JSON document;
 * failures are raised as GatewayError subclasses for the caller to turn
 * into error responses.
 */

#include "Config.hpp"
#include "PoolManager.hpp"
#include "QueryExecutor.hpp"
#include "SchemaInspector.hpp"
#include "TargetRegistry.hpp"
#include <memory>
#include <string>
#include <vector>

namespace mcpdb {

class GatewayError;

/**
 * @class GatewayService
 * @brief Owns the registry, pools, executor and inspector of one process.
 *
 * Usage:
 * @code
 *   Config config = Config::fromEnvironment();
 *   GatewayService service(config, MySQLConnection::factory(config.timeouts));
 *   service.initializePool();
 *   auto rows = service.executeSql("SELECT * FROM cities", "world");
 *   service.closePool();
 * @endcode
 */
class GatewayService {
public:
    GatewayService(const Config& config, TargetConnectionFactory factory);
    ~GatewayService();

    GatewayService(const GatewayService&) = delete;
    GatewayService& operator=(const GatewayService&) = delete;

    // Lifecycle
    void initializePool();
    void closePool();

    // list_databases()
    json listDatabases();

    // list_tables(database_name)
    json listTables(const std::string& databaseName);

    // get_table_schema(database_name, table_name)
    json getTableSchema(const std::string& databaseName, const std::string& tableName);

    // get_table_schema_with_relations(database_name, table_name)
    json getTableSchemaWithRelations(const std::string& databaseName,
                                     const std::string& tableName);

    // execute_sql(sql_query, database_name, parameters)
    json executeSql(const std::string& sql,
                    const std::string& databaseName,
                    const std::vector<Parameter>& parameters = {});

    // {"error": message, "type": kind}, plus "code" and "retryable" for driver errors
    static json errorToJson(const GatewayError& error);

    // Serialize for the wire; invalid UTF-8 is replaced, never thrown on
    static std::string dump(const json& document, bool pretty = false);

    const TargetRegistry& registry() const { return m_registry; }
    PoolManager& pools() { return *m_pools; }

private:
    Config m_config;
    TargetRegistry m_registry;
    std::unique_ptr<PoolManager> m_pools;
    std::unique_ptr<QueryExecutor> m_executor;
    std::unique_ptr<SchemaInspector> m_inspector;
};

}  // namespace mcpdb
