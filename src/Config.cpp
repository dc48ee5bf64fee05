#include "Config.hpp"
#include <spdlog/spdlog.h>
#include <fstream>
#include <cstdlib>
#include <algorithm>
#include <stdexcept>

extern char** environ;

namespace mcpdb {

namespace {

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

// Plural key first (DB_HOSTS), then the legacy single key (DB_HOST)
std::optional<std::string> lookup(const std::map<std::string, std::string>& vars,
                                  const std::string& plural,
                                  const std::string& single) {
    auto it = vars.find(plural);
    if (it != vars.end()) return it->second;
    it = vars.find(single);
    if (it != vars.end()) return it->second;
    return std::nullopt;
}

std::optional<std::string> lookup(const std::map<std::string, std::string>& vars,
                                  const std::string& key) {
    auto it = vars.find(key);
    if (it == vars.end()) return std::nullopt;
    return it->second;
}

unsigned long parseUnsigned(const std::string& key, const std::string& value) {
    std::string text = trim(value);
    if (text.empty() || !std::all_of(text.begin(), text.end(),
                                     [](unsigned char c) { return std::isdigit(c); })) {
        throw std::invalid_argument("Invalid value for " + key + ": '" + value + "'");
    }
    try {
        return std::stoul(text);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument("Value out of range for " + key + ": '" + value + "'");
    }
}

uint16_t parsePort(const std::string& value) {
    unsigned long port = parseUnsigned("DB_PORTS", value.empty() ? "3306" : value);
    if (port == 0 || port > 65535) {
        throw std::invalid_argument("Invalid port: '" + value + "'");
    }
    return static_cast<uint16_t>(port);
}

}  // namespace

std::vector<std::string> splitList(const std::string& value) {
    std::vector<std::string> result;
    std::string current;
    for (char c : value) {
        if (c == ',') {
            result.push_back(trim(current));
            current.clear();
        } else {
            current += c;
        }
    }
    result.push_back(trim(current));
    return result;
}

std::optional<bool> parseBool(const std::string& value) {
    std::string lower = toLower(trim(value));
    if (lower == "true" || lower == "1" || lower == "yes" || lower == "on") return true;
    if (lower == "false" || lower == "0" || lower == "no" || lower == "off") return false;
    return std::nullopt;
}

Config Config::fromVariables(const std::map<std::string, std::string>& vars) {
    Config config;

    // Targets
    if (auto v = lookup(vars, "DB_HOSTS", "DB_HOST")) {
        config.targets.hosts = splitList(*v);
    }
    if (auto v = lookup(vars, "DB_PORTS", "DB_PORT")) {
        config.targets.ports.clear();
        for (const auto& port : splitList(*v)) {
            config.targets.ports.push_back(parsePort(port));
        }
    }
    if (auto v = lookup(vars, "DB_USERS", "DB_USER")) {
        config.targets.users = splitList(*v);
    }
    if (auto v = lookup(vars, "DB_PASSWORDS", "DB_PASSWORD")) {
        config.targets.passwords = splitList(*v);
    }
    if (auto v = lookup(vars, "DB_NAMES", "DB_NAME")) {
        config.targets.names = splitList(*v);
    }
    if (auto v = lookup(vars, "DB_CHARSETS", "DB_CHARSET")) {
        config.targets.charsets = splitList(*v);
    }

    // Timeouts
    if (auto v = lookup(vars, "DB_CONNECT_TIMEOUT")) {
        config.timeouts.connect_timeout = std::chrono::seconds(parseUnsigned("DB_CONNECT_TIMEOUT", *v));
    }
    if (auto v = lookup(vars, "DB_READ_TIMEOUT")) {
        config.timeouts.read_timeout = std::chrono::seconds(parseUnsigned("DB_READ_TIMEOUT", *v));
    }
    if (auto v = lookup(vars, "DB_WRITE_TIMEOUT")) {
        config.timeouts.write_timeout = std::chrono::seconds(parseUnsigned("DB_WRITE_TIMEOUT", *v));
    }

    // Policy
    if (auto v = lookup(vars, "MCP_READ_ONLY")) {
        if (auto flag = parseBool(*v)) {
            config.policy.read_only = *flag;
        } else {
            spdlog::warn("Unrecognised MCP_READ_ONLY value '{}', keeping read-only mode", *v);
        }
    }
    if (auto v = lookup(vars, "MCP_MAX_RESULTS")) {
        config.policy.max_results = parseUnsigned("MCP_MAX_RESULTS", *v);
    }

    // Pool
    if (auto v = lookup(vars, "MCP_MAX_POOL_SIZE")) {
        config.pool.max_size = parseUnsigned("MCP_MAX_POOL_SIZE", *v);
    }
    if (auto v = lookup(vars, "MCP_POOL_ACQUIRE_TIMEOUT")) {
        config.pool.acquire_timeout = std::chrono::seconds(parseUnsigned("MCP_POOL_ACQUIRE_TIMEOUT", *v));
    }
    if (auto v = lookup(vars, "MCP_POOL_DRAIN_TIMEOUT")) {
        config.pool.drain_timeout = std::chrono::seconds(parseUnsigned("MCP_POOL_DRAIN_TIMEOUT", *v));
    }

    // Logging
    if (auto v = lookup(vars, "LOG_LEVEL")) {
        config.logging.level = toLower(trim(*v));
    }
    if (auto v = lookup(vars, "LOG_FILE")) {
        config.logging.file = trim(*v);
    }
    if (auto v = lookup(vars, "LOG_MAX_BYTES")) {
        config.logging.max_bytes = parseUnsigned("LOG_MAX_BYTES", *v);
    }
    if (auto v = lookup(vars, "LOG_BACKUP_COUNT")) {
        config.logging.backup_count = parseUnsigned("LOG_BACKUP_COUNT", *v);
    }

    return config;
}

std::optional<std::map<std::string, std::string>> Config::loadEnvFile(
    const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::map<std::string, std::string> vars;
    std::string line;

    while (std::getline(file, line)) {
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#') {
            continue;
        }

        if (line.rfind("export ", 0) == 0) {
            line = trim(line.substr(7));
        }

        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        // Remove quotes if present
        if (value.size() >= 2 &&
            ((value.front() == '"' && value.back() == '"') ||
             (value.front() == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.size() - 2);
        } else {
            // Unquoted values may carry a trailing comment
            auto hash = value.find(" #");
            if (hash != std::string::npos) {
                value = trim(value.substr(0, hash));
            }
        }

        if (!key.empty()) {
            vars[key] = value;
        }
    }

    return vars;
}

Config Config::fromEnvironment(const std::filesystem::path& envFile) {
    std::map<std::string, std::string> vars;

    if (!envFile.empty()) {
        if (auto file_vars = loadEnvFile(envFile)) {
            vars = std::move(*file_vars);
            spdlog::debug("Loaded {} settings from {}", vars.size(), envFile.string());
        }
    }

    for (char** env = environ; env && *env; ++env) {
        std::string entry(*env);
        auto eq_pos = entry.find('=');
        if (eq_pos == std::string::npos) continue;
        vars[entry.substr(0, eq_pos)] = entry.substr(eq_pos + 1);
    }

    return fromVariables(vars);
}

bool Config::validate() const {
    if (targets.hosts.empty() || (targets.hosts.size() == 1 && targets.hosts[0].empty())) {
        spdlog::error("No database host configured (set DB_HOST or DB_HOSTS)");
        return false;
    }

    bool has_user = std::any_of(targets.users.begin(), targets.users.end(),
                                [](const std::string& u) { return !u.empty(); });
    if (!has_user) {
        spdlog::error("Database credentials (DB_USER, DB_PASSWORD) not found in environment");
        return false;
    }

    if (pool.max_size == 0) {
        spdlog::error("MCP_MAX_POOL_SIZE must be at least 1");
        return false;
    }

    if (policy.max_results == 0) {
        spdlog::error("MCP_MAX_RESULTS must be at least 1");
        return false;
    }

    if (timeouts.read_timeout.count() == 0 || timeouts.write_timeout.count() == 0) {
        spdlog::warn("A zero read/write timeout disables the query deadline");
    }

    return true;
}

}  // namespace mcpdb
