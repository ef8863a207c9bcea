// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  sqlparse - JSON Serialization Unit Tests                                    ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#include <gtest/gtest.h>

#include "sqlparse/json.hpp"
#include "sqlparse/sqlparse.hpp"

using namespace sqlparse;
using nlohmann::json;

TEST(JsonTest, SelectQuery) {
    auto result = parse("SELECT TOP 2 a, b FROM db.t WHERE a >= 'x' ORDER BY b DESC");
    ASSERT_TRUE(result);

    json j = *result;
    EXPECT_EQ(j["type"], "SELECT");
    EXPECT_EQ(j["database"], "db");
    EXPECT_EQ(j["table"], "t");
    EXPECT_EQ(j["fields"], json::array({"a", "b"}));
    EXPECT_EQ(j["max_rows"], 2);

    ASSERT_EQ(j["conditions"].size(), 1u);
    EXPECT_EQ(j["conditions"][0]["operand1"], "a");
    EXPECT_EQ(j["conditions"][0]["operator"], ">=");
    EXPECT_EQ(j["conditions"][0]["operand2"], "x");
    EXPECT_EQ(j["conditions"][0]["operand2_is_field"], false);

    ASSERT_EQ(j["order_by"].size(), 1u);
    EXPECT_EQ(j["order_by"][0]["field"], "b");
    EXPECT_EQ(j["order_by"][0]["direction"], "DESC");
}

TEST(JsonTest, InsertAndUpdateQueries) {
    auto insert = parse("INSERT INTO t (a, b) VALUES (1, 2), (3, 4)");
    ASSERT_TRUE(insert);
    json ji = *insert;
    EXPECT_EQ(ji["type"], "INSERT INTO");
    EXPECT_EQ(ji["inserts"], json::array({json::array({"1", "2"}), json::array({"3", "4"})}));

    auto update = parse("UPDATE t SET a = 1 WHERE b = 2");
    ASSERT_TRUE(update);
    json ju = *update;
    EXPECT_EQ(ju["updates"]["a"], "1");
    EXPECT_TRUE(ju["order_by"].empty());
    EXPECT_TRUE(ju["joins"].empty());
}

TEST(JsonTest, Joins) {
    auto result = parse("SELECT a FROM t INNER JOIN u ON t.id = u.t_id");
    ASSERT_TRUE(result);

    json j = *result;
    ASSERT_EQ(j["joins"].size(), 1u);
    EXPECT_EQ(j["joins"][0]["type"], "INNER JOIN");
    EXPECT_EQ(j["joins"][0]["table"], "u");
    EXPECT_EQ(j["joins"][0]["conditions"][0]["table1"], "t");
    EXPECT_EQ(j["joins"][0]["conditions"][0]["operand2"], "t_id");
}

TEST(JsonTest, ErrorWithPosition) {
    auto result = parse("SELECT a b FROM t");
    ASSERT_FALSE(result);

    json j = result.error();
    EXPECT_EQ(j["code"], 200);
    EXPECT_EQ(j["kind"], "Unexpected token");
    EXPECT_EQ(j["position"], 9);
    EXPECT_EQ(j["message"], "at SELECT: expected comma or FROM, got 'b'");
}

TEST(JsonTest, ErrorWithoutPosition) {
    json j = Error(ErrorCode::InvalidArgument, "bad");
    EXPECT_EQ(j["code"], 900);
    EXPECT_FALSE(j.contains("position"));
}

TEST(JsonTest, ErrorFromNonAsciiStatementSerializes) {
    Parser parser("SELECT \xC3\xA9 FROM t");
    auto status = parser.parse();
    ASSERT_FALSE(status);

    json j = status.error();
    std::string text;
    ASSERT_NO_THROW(text = j.dump());
    EXPECT_NE(text.find("byte 0xC3"), std::string::npos);
}

TEST(JsonTest, InvalidUtf8StatementIsReplacedOnDump) {
    Parser parser("SELECT a FROM t WHERE name = '\xE9t\xE9'");
    ASSERT_TRUE(parser.parse());

    json entry;
    entry["statement"] = parser.sql();
    entry["query"] = parser.query();

    EXPECT_THROW((void)entry.dump(), json::type_error);
    std::string text;
    ASSERT_NO_THROW(text = entry.dump(2, ' ', false, json::error_handler_t::replace));
    EXPECT_NE(text.find("\xEF\xBF\xBD"), std::string::npos);
}
