#pragma once

#include <string>
#include <vector>
#include <map>
#include <chrono>
#include <optional>
#include <filesystem>
#include <cstdint>

namespace mcpdb {

// Parallel per-target lists as configured (DB_HOSTS, DB_PORTS, ...).
// A list holding a single entry applies to every target.
struct TargetListConfig {
    std::vector<std::string> hosts{"localhost"};
    std::vector<uint16_t> ports{3306};
    std::vector<std::string> users{""};
    std::vector<std::string> passwords{""};
    std::vector<std::string> names{""};
    std::vector<std::string> charsets{""};
};

struct TimeoutConfig {
    std::chrono::seconds connect_timeout{10};
    std::chrono::seconds read_timeout{30};
    std::chrono::seconds write_timeout{30};
};

struct PoolConfig {
    size_t max_size = 10;
    std::chrono::milliseconds acquire_timeout{30000};
    std::chrono::milliseconds drain_timeout{10000};
};

struct PolicyConfig {
    bool read_only = true;
    size_t max_results = 10000;
};

struct LoggingConfig {
    std::string level = "info";
    std::string file = "logs/mcpdb.log";
    size_t max_bytes = 10 * 1024 * 1024;  // 10 MB
    size_t backup_count = 5;
};

struct Config {
    TargetListConfig targets;
    TimeoutConfig timeouts;
    PoolConfig pool;
    PolicyConfig policy;
    LoggingConfig logging;

    // Build from a variable map (environment-style keys)
    static Config fromVariables(const std::map<std::string, std::string>& vars);

    // Build from the process environment, seeded by an optional .env file.
    // Real environment variables take precedence over the file.
    static Config fromEnvironment(const std::filesystem::path& envFile = ".env");

    // Parse KEY=VALUE lines; nullopt if the file cannot be opened
    static std::optional<std::map<std::string, std::string>> loadEnvFile(
        const std::filesystem::path& path);

    // Validate configuration
    bool validate() const;
};

// Comma-separated list, whitespace trimmed, empty fields kept so that
// parallel lists stay aligned ("a,,b" has three entries).
std::vector<std::string> splitList(const std::string& value);

// Parse a boolean setting; nullopt if the text is not recognised
std::optional<bool> parseBool(const std::string& value);

}  // namespace mcpdb
