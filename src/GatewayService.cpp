#include "GatewayService.hpp"
#include "ErrorHandler.hpp"
#include "MySQLSchemaInspector.hpp"
#include <spdlog/spdlog.h>

namespace mcpdb {

GatewayService::GatewayService(const Config& config, TargetConnectionFactory factory)
    : m_config(config)
    , m_registry(TargetRegistry::build(config.targets))
    , m_pools(std::make_unique<PoolManager>(std::move(factory), config.pool))
    , m_executor(std::make_unique<QueryExecutor>(m_registry, *m_pools, config.policy))
    , m_inspector(std::make_unique<MySQLSchemaInspector>(m_registry, *m_pools)) {

    spdlog::info("Read-only mode: {}", m_config.policy.read_only);
    spdlog::info("Configured {} database target(s), max {} rows per query",
                 m_registry.size(), m_config.policy.max_results);
}

GatewayService::~GatewayService() {
    closePool();
}

// ============================================================================
// Lifecycle
// ============================================================================

void GatewayService::initializePool() {
    m_pools->initialize(m_registry.targets());
}

void GatewayService::closePool() {
    m_pools->shutdown();
}

// ============================================================================
// Tools
// ============================================================================

json GatewayService::listDatabases() {
    ErrorContext context("list_databases");
    json result = json::array();
    for (const auto& name : m_inspector->listDatabases()) {
        result.push_back(name);
    }
    return result;
}

json GatewayService::listTables(const std::string& databaseName) {
    ErrorContext context("list_tables(" + databaseName + ")");
    json result = json::array();
    for (const auto& name : m_inspector->listTables(databaseName)) {
        result.push_back(name);
    }
    return result;
}

json GatewayService::getTableSchema(const std::string& databaseName,
                                    const std::string& tableName) {
    ErrorContext context("get_table_schema(" + databaseName + "." + tableName + ")");
    return m_inspector->getSchema(databaseName, tableName).toJson();
}

json GatewayService::getTableSchemaWithRelations(const std::string& databaseName,
                                                 const std::string& tableName) {
    ErrorContext context("get_table_schema_with_relations(" + databaseName + "." + tableName + ")");
    return m_inspector->getSchemaWithRelations(databaseName, tableName).relationsToJson();
}

json GatewayService::executeSql(const std::string& sql,
                                const std::string& databaseName,
                                const std::vector<Parameter>& parameters) {
    QueryResult result = m_executor->execute(sql, databaseName, parameters);
    if (!result.hasRows) {
        spdlog::info("Statement affected {} row(s)", result.affectedRows);
    }
    return result.toJson();
}

// ============================================================================
// Serialization
// ============================================================================

json GatewayService::errorToJson(const GatewayError& error) {
    json doc = {{"error", error.what()}, {"type", error.kind()}};
    if (const auto* failure = dynamic_cast<const ExecutionError*>(&error)) {
        doc["code"] = failure->errorCode();
        doc["retryable"] = ErrorHandler::isRetryable(failure->errorCode());
    }
    return doc;
}

std::string GatewayService::dump(const json& document, bool pretty) {
    return document.dump(pretty ? 2 : -1, ' ', false, json::error_handler_t::replace);
}

}  // namespace mcpdb
