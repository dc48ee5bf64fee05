#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "PolicyGuard.hpp"
#include "ErrorHandler.hpp"

using namespace mcpdb;

class PolicyGuardTest : public ::testing::Test {
protected:
    static bool isRead(const std::string& sql) {
        return PolicyGuard::classify(sql) == StatementKind::Read;
    }
};

// Read statements
TEST_F(PolicyGuardTest, SelectIsRead) {
    EXPECT_TRUE(isRead("SELECT * FROM cities"));
    EXPECT_TRUE(isRead("  select id from t where name = 'x'"));
    EXPECT_TRUE(isRead("(SELECT 1) UNION (SELECT 2)"));
    EXPECT_TRUE(isRead("SELECT 1;"));
}

TEST_F(PolicyGuardTest, IntrospectionIsRead) {
    EXPECT_TRUE(isRead("SHOW TABLES"));
    EXPECT_TRUE(isRead("DESCRIBE cities"));
    EXPECT_TRUE(isRead("desc cities"));
    EXPECT_TRUE(isRead("EXPLAIN SELECT * FROM cities"));
}

TEST_F(PolicyGuardTest, ExplainOptionsAreSkipped) {
    EXPECT_TRUE(isRead("EXPLAIN ANALYZE SELECT * FROM cities"));
    EXPECT_TRUE(isRead("EXPLAIN FORMAT=JSON SELECT 1"));
    EXPECT_TRUE(isRead("EXPLAIN EXTENDED SELECT 1"));
    EXPECT_TRUE(isRead("EXPLAIN `cities`"));
    EXPECT_TRUE(isRead("DESCRIBE cities country_id"));
    EXPECT_TRUE(isRead("TABLE cities"));
}

TEST_F(PolicyGuardTest, ExplainedWritesAreWrite) {
    EXPECT_FALSE(isRead("EXPLAIN ANALYZE DELETE FROM cities"));
    EXPECT_FALSE(isRead("EXPLAIN ANALYZE UPDATE cities c JOIN countries co ON co.id = c.country_id "
                        "SET c.name = 'x'"));
    EXPECT_FALSE(isRead("EXPLAIN FORMAT=TREE INSERT INTO t VALUES (1)"));
    EXPECT_FALSE(isRead("DESCRIBE REPLACE INTO t VALUES (1)"));
    EXPECT_FALSE(isRead("EXPLAIN ANALYZE SELECT * FROM t INTO OUTFILE '/tmp/x'"));
    EXPECT_FALSE(isRead("EXPLAIN"));
    EXPECT_FALSE(isRead("ANALYZE DELETE FROM cities"));
}

TEST_F(PolicyGuardTest, LeadingCommentsAreSkipped) {
    EXPECT_TRUE(isRead("-- list\nSELECT 1"));
    EXPECT_TRUE(isRead("# list\nSELECT 1"));
    EXPECT_TRUE(isRead("/* list */ SELECT 1"));
}

TEST_F(PolicyGuardTest, CommonTableExpressionSelectIsRead) {
    EXPECT_TRUE(isRead("WITH c AS (SELECT * FROM cities) SELECT * FROM c"));
    EXPECT_TRUE(isRead("WITH RECURSIVE n (x) AS (SELECT 1 UNION ALL SELECT x + 1 FROM n "
                       "WHERE x < 5) SELECT x FROM n"));
    EXPECT_TRUE(isRead("WITH a AS (SELECT 1), b AS (SELECT 2) SELECT * FROM a, b"));
}

// Write statements
TEST_F(PolicyGuardTest, DataModificationIsWrite) {
    EXPECT_FALSE(isRead("INSERT INTO t VALUES (1)"));
    EXPECT_FALSE(isRead("update t set x = 1"));
    EXPECT_FALSE(isRead("DELETE FROM t"));
    EXPECT_FALSE(isRead("REPLACE INTO t VALUES (1)"));
    EXPECT_FALSE(isRead("TRUNCATE TABLE t"));
}

TEST_F(PolicyGuardTest, SchemaChangesAreWrite) {
    EXPECT_FALSE(isRead("CREATE TABLE t (id INT)"));
    EXPECT_FALSE(isRead("DROP TABLE cities"));
    EXPECT_FALSE(isRead("ALTER TABLE t ADD c INT"));
    EXPECT_FALSE(isRead("GRANT ALL ON *.* TO 'x'@'%'"));
    EXPECT_FALSE(isRead("SET GLOBAL read_only = 0"));
    EXPECT_FALSE(isRead("CALL do_things()"));
}

TEST_F(PolicyGuardTest, EmptyTextIsWrite) {
    EXPECT_FALSE(isRead(""));
    EXPECT_FALSE(isRead("   "));
    EXPECT_FALSE(isRead("-- only a comment"));
    EXPECT_FALSE(isRead(";"));
}

TEST_F(PolicyGuardTest, CommonTableExpressionWriteIsWrite) {
    EXPECT_FALSE(isRead("WITH c AS (SELECT id FROM t) DELETE FROM t WHERE id IN (SELECT id FROM c)"));
    EXPECT_FALSE(isRead("WITH c AS (SELECT 1) UPDATE t SET x = 1"));
    EXPECT_FALSE(isRead("WITH c AS (DELETE FROM t) SELECT 1"));
}

TEST_F(PolicyGuardTest, MalformedCommonTableExpressionIsWrite) {
    EXPECT_FALSE(isRead("WITH"));
    EXPECT_FALSE(isRead("WITH c SELECT 1"));
    EXPECT_FALSE(isRead("WITH c AS (SELECT 1"));
    EXPECT_FALSE(isRead("WITH c AS ("));
}

TEST_F(PolicyGuardTest, SelectIntoFileIsWrite) {
    EXPECT_FALSE(isRead("SELECT * FROM t INTO OUTFILE '/tmp/x'"));
    EXPECT_FALSE(isRead("select * into dumpfile '/tmp/x' from t"));
    // A literal mentioning OUTFILE is harmless
    EXPECT_TRUE(isRead("SELECT 'INTO OUTFILE' FROM t"));
}

TEST_F(PolicyGuardTest, MultiStatementWithAnyWriteIsWrite) {
    EXPECT_FALSE(isRead("SELECT 1; DROP TABLE cities"));
    EXPECT_FALSE(isRead("SELECT 1;DELETE FROM t;"));
    EXPECT_TRUE(isRead("SELECT 1; SHOW TABLES"));
}

TEST_F(PolicyGuardTest, CommentsCannotHideWrites) {
    EXPECT_FALSE(isRead("/* SELECT */ DELETE FROM t"));
    EXPECT_FALSE(isRead("-- SELECT\nDELETE FROM t"));
    // Semicolons inside comments and literals do not split statements
    EXPECT_TRUE(isRead("SELECT ';DROP TABLE t' FROM x"));
    EXPECT_TRUE(isRead("SELECT 1 /* ; DROP TABLE t */"));
}

TEST_F(PolicyGuardTest, DashDashWithoutSpaceIsNotAComment) {
    // MySQL reads "1--1" as 1 - (-1), so the DELETE is live text
    EXPECT_FALSE(isRead("SELECT 1--1\n; DELETE FROM t"));
}

TEST_F(PolicyGuardTest, ExecutableCommentsAreWrite) {
    EXPECT_FALSE(isRead("SELECT 1 /*! , (SELECT 1) */"));
    EXPECT_FALSE(isRead("/*!50000 DROP TABLE t */"));
    EXPECT_FALSE(isRead("SELECT /*M!100000 1 */ 2"));
}

TEST_F(PolicyGuardTest, EscapedQuotesStayInsideLiterals) {
    EXPECT_TRUE(isRead("SELECT 'it''s; DROP TABLE t' FROM x"));
    EXPECT_TRUE(isRead("SELECT 'a\\'; DROP TABLE t' FROM x"));
    EXPECT_TRUE(isRead("SELECT `weird;name` FROM x"));
}

// Read-only enforcement
TEST_F(PolicyGuardTest, EnforceReadOnlyBlocksWrites) {
    EXPECT_THROW(PolicyGuard::enforceReadOnly("DROP TABLE cities", true), ReadOnlyViolationError);
    EXPECT_NO_THROW(PolicyGuard::enforceReadOnly("SELECT 1", true));
    EXPECT_NO_THROW(PolicyGuard::enforceReadOnly("DROP TABLE cities", false));
}

TEST_F(PolicyGuardTest, ReadOnlyMessage) {
    try {
        PolicyGuard::enforceReadOnly("INSERT INTO t VALUES (1)", true);
        FAIL() << "Expected ReadOnlyViolationError";
    } catch (const ReadOnlyViolationError& e) {
        EXPECT_STREQ(e.what(), "Write operations are not allowed in read-only mode");
    }
}

// Parameter binding
TEST_F(PolicyGuardTest, BindQuestionMarks) {
    auto bound = PolicyGuard::bind("SELECT * FROM t WHERE a = ? AND b = ?", {1, "x"});

    EXPECT_EQ(bound.sql, "SELECT * FROM t WHERE a = ? AND b = ?");
    ASSERT_EQ(bound.parameters.size(), 2u);
    EXPECT_EQ(bound.parameters[0], 1);
    EXPECT_EQ(bound.parameters[1], "x");
}

TEST_F(PolicyGuardTest, BindRewritesPercentS) {
    auto bound = PolicyGuard::bind("SELECT * FROM t WHERE a = %s AND b = %s", {1, nullptr});

    EXPECT_EQ(bound.sql, "SELECT * FROM t WHERE a = ? AND b = ?");
}

TEST_F(PolicyGuardTest, PlaceholdersInLiteralsAreNotCounted) {
    auto bound = PolicyGuard::bind("SELECT '?', \"%s\", `a?` FROM t WHERE x = ? -- ?\n", {5});

    EXPECT_EQ(bound.sql, "SELECT '?', \"%s\", `a?` FROM t WHERE x = ? -- ?\n");
    EXPECT_EQ(bound.parameters.size(), 1u);
}

TEST_F(PolicyGuardTest, PlaceholderCountMismatchThrows) {
    EXPECT_THROW(PolicyGuard::bind("SELECT ?", {}), ParameterBindingError);
    EXPECT_THROW(PolicyGuard::bind("SELECT 1", {1}), ParameterBindingError);
    EXPECT_THROW(PolicyGuard::bind("SELECT ?, ?", {1}), ParameterBindingError);
}

TEST_F(PolicyGuardTest, NonScalarParametersThrow) {
    EXPECT_THROW(PolicyGuard::bind("SELECT ?", {Parameter::array({1, 2})}), ParameterBindingError);
    EXPECT_THROW(PolicyGuard::bind("SELECT ?", {Parameter::object({{"a", 1}})}),
                 ParameterBindingError);
}

TEST_F(PolicyGuardTest, NoParametersNoPlaceholders) {
    auto bound = PolicyGuard::bind("SELECT 100 % 7", {});

    EXPECT_EQ(bound.sql, "SELECT 100 % 7");
    EXPECT_TRUE(bound.parameters.empty());
}

// Result capping
TEST_F(PolicyGuardTest, CapTruncatesToLimit) {
    std::vector<int> rows = {1, 2, 3, 4, 5};

    EXPECT_TRUE(PolicyGuard::cap(rows, 3));
    EXPECT_THAT(rows, ::testing::ElementsAre(1, 2, 3));
}

TEST_F(PolicyGuardTest, CapKeepsShortResults) {
    std::vector<int> rows = {1, 2, 3};

    EXPECT_FALSE(PolicyGuard::cap(rows, 3));
    EXPECT_EQ(rows.size(), 3u);
}

TEST_F(PolicyGuardTest, KindNames) {
    EXPECT_STREQ(PolicyGuard::kindName(StatementKind::Read), "READ");
    EXPECT_STREQ(PolicyGuard::kindName(StatementKind::Write), "WRITE");
}
