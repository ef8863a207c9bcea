// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  sqlparse - Query Model Unit Tests                                           ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#include <gtest/gtest.h>

#include "sqlparse/sqlparse.hpp"

using namespace sqlparse;

// ==============================================================================
// Spelling Helpers
// ==============================================================================

TEST(QueryTest, EnumSpellings) {
    EXPECT_STREQ(query_type_to_string(QueryType::Insert), "INSERT INTO");
    EXPECT_STREQ(query_type_to_string(QueryType::Unknown), "UNKNOWN");
    EXPECT_STREQ(operator_to_string(Operator::Gte), ">=");
    EXPECT_STREQ(operator_to_string(Operator::Ne), "!=");
    EXPECT_STREQ(operator_to_string(Operator::Unknown), "");
    EXPECT_STREQ(order_direction_to_string(OrderDirection::Desc), "DESC");
    EXPECT_STREQ(join_type_to_string(JoinType::InnerJoin), "INNER JOIN");
}

TEST(QueryTest, DefaultQuery) {
    Query query;
    EXPECT_EQ(query.type, QueryType::Unknown);
    EXPECT_EQ(query.max_rows, 0u);
    EXPECT_TRUE(query.fields.empty());
    EXPECT_EQ(query.to_string(), "UNKNOWN");
}

TEST(QueryTest, QualifiedTable) {
    Query query;
    query.table = "users";
    EXPECT_EQ(query.qualified_table(), "users");
    query.database = "app";
    EXPECT_EQ(query.qualified_table(), "app.users");
}

// ==============================================================================
// Rendering
// ==============================================================================

TEST(QueryTest, RenderSelect) {
    auto result = parse("select top 5 a.id, b.name from db.a "
                        "join b on a.id = b.a_id and a.x != b.y "
                        "where a.id > 1 and b.name = 'Ann Lee' "
                        "order by a.id desc, b.name");
    ASSERT_TRUE(result);
    EXPECT_EQ(result->to_string(),
              "SELECT TOP 5 a.id, b.name FROM db.a "
              "JOIN b ON a.id = b.a_id AND a.x != b.y "
              "WHERE a.id > 1 AND b.name = 'Ann Lee' "
              "ORDER BY a.id DESC, b.name");
}

TEST(QueryTest, RenderInsert) {
    auto result = parse("INSERT INTO t (a, b) VALUES (1, 'x y'), ('', where)");
    ASSERT_FALSE(result);  // bare `where` is a keyword, not a value

    result = parse("INSERT INTO t (a, b) VALUES (1, 'x y'), ('', 'where')");
    ASSERT_TRUE(result);
    EXPECT_EQ(result->to_string(), "INSERT INTO t (a, b) VALUES (1, 'x y'), ('', 'where')");
}

TEST(QueryTest, RenderUpdate) {
    auto result = parse("UPDATE t SET b = 'two words', a = 1 WHERE id = 3");
    ASSERT_TRUE(result);
    // Assignments come out in field order
    EXPECT_EQ(result->to_string(), "UPDATE t SET a = 1, b = 'two words' WHERE id = 3");
}

TEST(QueryTest, RenderDelete) {
    auto result = parse("delete from `t` where a <= 'AND'");
    ASSERT_TRUE(result);
    EXPECT_EQ(result->to_string(), "DELETE FROM t WHERE a <= 'AND'");
}

TEST(QueryTest, RenderedTextParsesBackToEqualQuery) {
    const char* statements[] = {
        "SELECT * FROM users",
        "SELECT TOP 3 a, b FROM db.t WHERE a = 'x y' AND b >= 2 ORDER BY a DESC, b",
        "SELECT a FROM t LEFT JOIN u ON t.id = u.id RIGHT JOIN v ON u.id = v.id ORDER BY a",
        "INSERT INTO t (a, b) VALUES (1, 2), (3, 'on')",
        "UPDATE db.t SET a = '', b = top_value WHERE id != 7",
        "DELETE FROM t WHERE a < -1",
    };
    for (const char* sql : statements) {
        auto first = parse(sql);
        ASSERT_TRUE(first) << sql;
        auto second = parse(first->to_string());
        ASSERT_TRUE(second) << first->to_string();
        EXPECT_EQ(*first, *second) << sql;
    }
}
