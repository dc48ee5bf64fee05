#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "TargetRegistry.hpp"
#include "ErrorHandler.hpp"

using namespace mcpdb;

class TargetRegistryTest : public ::testing::Test {
protected:
    static TargetListConfig twoTargets() {
        TargetListConfig config;
        config.hosts = {"db1", "db2"};
        config.ports = {3306, 3307};
        config.users = {"u1", "u2"};
        config.passwords = {"p1", "p2"};
        config.names = {"sales", "hr"};
        config.charsets = {""};
        return config;
    }
};

TEST_F(TargetRegistryTest, BuildParallelLists) {
    auto registry = TargetRegistry::build(twoTargets());

    ASSERT_EQ(registry.size(), 2u);
    const auto& hr = registry.targets()[1];
    EXPECT_EQ(hr.name, "hr");
    EXPECT_EQ(hr.host, "db2");
    EXPECT_EQ(hr.port, 3307);
    EXPECT_EQ(hr.user, "u2");
    EXPECT_EQ(hr.password, "p2");
    EXPECT_EQ(hr.defaultDatabase, "hr");
}

TEST_F(TargetRegistryTest, SingleEntryListsBroadcast) {
    TargetListConfig config;
    config.hosts = {"shared"};
    config.users = {"reader"};
    config.names = {"a", "b", "c"};

    auto registry = TargetRegistry::build(config);

    ASSERT_EQ(registry.size(), 3u);
    for (const auto& target : registry.targets()) {
        EXPECT_EQ(target.host, "shared");
        EXPECT_EQ(target.user, "reader");
        EXPECT_EQ(target.port, 3306);
    }
}

TEST_F(TargetRegistryTest, MismatchedListsUseShortest) {
    auto config = twoTargets();
    config.names = {"sales", "hr", "ops"};

    auto registry = TargetRegistry::build(config);

    EXPECT_EQ(registry.size(), 2u);
    EXPECT_FALSE(registry.accepts("ops"));
}

TEST_F(TargetRegistryTest, EmptyListThrows) {
    auto config = twoTargets();
    config.users.clear();

    EXPECT_THROW(TargetRegistry::build(config), std::invalid_argument);
    EXPECT_THROW(TargetRegistry(std::vector<Target>{}), std::invalid_argument);
}

TEST_F(TargetRegistryTest, ResolveByExactName) {
    auto registry = TargetRegistry::build(twoTargets());

    EXPECT_EQ(registry.resolve("hr").host, "db2");
    EXPECT_EQ(registry.resolve("sales").host, "db1");
}

TEST_F(TargetRegistryTest, EmptyNameResolvesToFirstTarget) {
    auto registry = TargetRegistry::build(twoTargets());

    const auto& target = registry.resolve("");
    EXPECT_EQ(target.name, "sales");
    EXPECT_EQ(registry.databaseFor("", target), "sales");
}

TEST_F(TargetRegistryTest, UnknownNameThrows) {
    auto registry = TargetRegistry::build(twoTargets());

    EXPECT_THROW(registry.resolve("nonexistent"), UnknownTargetError);
    EXPECT_FALSE(registry.accepts("nonexistent"));
    // Names are matched exactly
    EXPECT_FALSE(registry.accepts("SALES"));
}

TEST_F(TargetRegistryTest, ServerWideTargetAcceptsAnyDatabase) {
    TargetListConfig config;
    config.hosts = {"localhost"};
    config.users = {"root"};

    auto registry = TargetRegistry::build(config);

    ASSERT_EQ(registry.size(), 1u);
    EXPECT_TRUE(registry.targets()[0].isServerWide());

    const auto& target = registry.resolve("world");
    EXPECT_EQ(registry.databaseFor("world", target), "world");
    EXPECT_EQ(registry.databaseFor("", target), "");
}

TEST_F(TargetRegistryTest, NamedTargetWinsOverServerWide) {
    TargetListConfig config;
    config.hosts = {"wide", "named"};
    config.users = {"root"};
    config.names = {"", "world"};

    auto registry = TargetRegistry::build(config);

    EXPECT_EQ(registry.resolve("world").host, "named");
    EXPECT_EQ(registry.resolve("other").host, "wide");
}

TEST_F(TargetRegistryTest, EmptyHostDefaultsToLocalhost) {
    TargetListConfig config;
    config.hosts = {""};
    config.users = {"root"};

    auto registry = TargetRegistry::build(config);

    EXPECT_EQ(registry.targets()[0].host, "localhost");
}

TEST_F(TargetRegistryTest, PoolKeyGroupsSharedServers) {
    TargetListConfig config;
    config.hosts = {"db1"};
    config.users = {"reader"};
    config.passwords = {"pw"};
    config.names = {"a", "b"};

    auto registry = TargetRegistry::build(config);

    EXPECT_EQ(poolKey(registry.targets()[0]), poolKey(registry.targets()[1]));

    auto other = registry.targets()[0];
    other.user = "writer";
    EXPECT_NE(poolKey(other), poolKey(registry.targets()[0]));
}

TEST_F(TargetRegistryTest, PoolLabelHidesPassword) {
    Target target;
    target.host = "db1";
    target.user = "reader";
    target.password = "hunter2";

    EXPECT_EQ(poolLabel(target), "reader@db1:3306");
}
