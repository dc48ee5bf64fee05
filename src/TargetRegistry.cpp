#include "TargetRegistry.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <stdexcept>

namespace mcpdb {

namespace {

// Entry `index` of a list; single-entry lists broadcast
template <typename T>
const T& pick(const std::vector<T>& list, size_t index) {
    return list.size() == 1 ? list.front() : list[index];
}

}  // namespace

std::string poolKey(const Target& target) {
    return target.host + "|" + std::to_string(target.port) + "|" + target.user + "|" +
           target.password + "|" + target.charset;
}

std::string poolLabel(const Target& target) {
    return target.user + "@" + target.host + ":" + std::to_string(target.port);
}

TargetRegistry::TargetRegistry(std::vector<Target> targets)
    : m_targets(std::move(targets)) {
    if (m_targets.empty()) {
        throw std::invalid_argument("At least one database target is required");
    }
}

TargetRegistry TargetRegistry::build(const TargetListConfig& config) {
    const std::vector<size_t> lengths = {
        config.hosts.size(), config.ports.size(), config.users.size(),
        config.passwords.size(), config.names.size(), config.charsets.size()};

    if (std::any_of(lengths.begin(), lengths.end(), [](size_t n) { return n == 0; })) {
        throw std::invalid_argument("Database target lists must not be empty");
    }

    size_t longest = 1;
    size_t shortest = 0;
    for (size_t n : lengths) {
        if (n <= 1) continue;
        longest = std::max(longest, n);
        shortest = shortest == 0 ? n : std::min(shortest, n);
    }

    size_t count = longest;
    if (shortest != 0 && shortest != longest) {
        spdlog::warn("Multiple database config length mismatch: DB_HOSTS={}, DB_PORTS={}, "
                     "DB_USERS={}, DB_PASSWORDS={}, DB_NAMES={}, DB_CHARSETS={}. "
                     "Using first {} entries.",
                     lengths[0], lengths[1], lengths[2], lengths[3], lengths[4], lengths[5],
                     shortest);
        count = shortest;
    }

    std::vector<Target> targets;
    targets.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        Target target;
        target.host = pick(config.hosts, i);
        target.port = pick(config.ports, i);
        target.user = pick(config.users, i);
        target.password = pick(config.passwords, i);
        target.name = pick(config.names, i);
        target.defaultDatabase = target.name;
        target.charset = pick(config.charsets, i);

        if (target.host.empty()) {
            target.host = "localhost";
        }

        spdlog::debug("Target {}: '{}' on {}", i, target.name, poolLabel(target));
        targets.push_back(std::move(target));
    }

    return TargetRegistry(std::move(targets));
}

const Target* TargetRegistry::find(const std::string& name) const {
    if (name.empty()) {
        return &m_targets.front();
    }

    for (const auto& target : m_targets) {
        if (target.name == name) {
            return &target;
        }
    }

    for (const auto& target : m_targets) {
        if (target.isServerWide()) {
            return &target;
        }
    }

    return nullptr;
}

const Target& TargetRegistry::resolve(const std::string& name) const {
    const Target* target = find(name);
    if (!target) {
        throw UnknownTargetError(name);
    }
    return *target;
}

bool TargetRegistry::accepts(const std::string& name) const {
    return find(name) != nullptr;
}

std::string TargetRegistry::databaseFor(const std::string& name, const Target& target) const {
    return name.empty() ? target.defaultDatabase : name;
}

}  // namespace mcpdb
