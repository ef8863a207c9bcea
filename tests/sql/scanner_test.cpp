// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  sqlparse - Scanner Tests                                                    ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#include <gtest/gtest.h>

#include "internal/sql/scanner.hpp"

using namespace sqlparse::sql;

// ==============================================================================
// Reserved Tokens
// ==============================================================================

TEST(ScannerTest, EndOfInput) {
    Token token = scan_token("", 0);
    EXPECT_EQ(token.kind, TokenKind::End);
    EXPECT_TRUE(token.empty());

    token = scan_token("SELECT", 6);
    EXPECT_EQ(token.kind, TokenKind::End);
}

TEST(ScannerTest, KeywordIsCaseInsensitive) {
    Token upper = scan_token("SELECT a", 0);
    Token lower = scan_token("select a", 0);
    Token mixed = scan_token("SeLeCt a", 0);

    for (const auto& token : {upper, lower, mixed}) {
        EXPECT_EQ(token.kind, TokenKind::Keyword);
        EXPECT_EQ(token.text, "SELECT");
        EXPECT_EQ(token.length, 6u);
        EXPECT_TRUE(token.is("SELECT"));
    }
}

TEST(ScannerTest, MultiWordKeywords) {
    EXPECT_EQ(scan_token("insert into t", 0).text, "INSERT INTO");
    EXPECT_EQ(scan_token("Delete From t", 0).text, "DELETE FROM");
    EXPECT_EQ(scan_token("order by a", 0).text, "ORDER BY");
    EXPECT_EQ(scan_token("left join b", 0).text, "LEFT JOIN");
    EXPECT_EQ(scan_token("ON DUPLICATE KEY UPDATE a = 1", 0).text, "ON DUPLICATE KEY UPDATE");
    EXPECT_EQ(scan_token("ON a.id = b.id", 0).text, "ON");
}

TEST(ScannerTest, PunctuationPrefersLongerOperators) {
    Token token = scan_token(">= 1", 0);
    EXPECT_EQ(token.kind, TokenKind::Punctuation);
    EXPECT_EQ(token.text, ">=");
    EXPECT_EQ(token.length, 2u);

    EXPECT_EQ(scan_token("<=1", 0).text, "<=");
    EXPECT_EQ(scan_token("!=1", 0).text, "!=");
    EXPECT_EQ(scan_token(">1", 0).text, ">");
    EXPECT_EQ(scan_token("(a", 0).text, "(");
}

TEST(ScannerTest, KeywordNeedsWordBoundary) {
    Token token = scan_token("ascending", 0);
    EXPECT_EQ(token.kind, TokenKind::Word);
    EXPECT_EQ(token.text, "ascending");

    EXPECT_EQ(scan_token("ONE", 0).kind, TokenKind::Word);
    EXPECT_EQ(scan_token("settings", 0).kind, TokenKind::Word);
    EXPECT_EQ(scan_token("top_score", 0).kind, TokenKind::Word);
    EXPECT_EQ(scan_token("JOIN(", 0).kind, TokenKind::Keyword);
}

TEST(ScannerTest, DottedNameStartingWithKeyword) {
    for (std::string_view sql : {"on.id = t.id", "desc.x", "top.n", "order.total", "select-x"}) {
        Token token = scan_token(sql, 0);
        EXPECT_EQ(token.kind, TokenKind::Word) << sql;
        EXPECT_EQ(token.text, sql.substr(0, sql.find(' '))) << sql;
    }
}

TEST(ScannerTest, ScanIsPure) {
    std::string_view sql = "SELECT a FROM t";
    Token first = scan_token(sql, 7);
    Token second = scan_token(sql, 7);
    EXPECT_EQ(first.text, second.text);
    EXPECT_EQ(first.length, second.length);
}

// ==============================================================================
// Literals and Identifiers
// ==============================================================================

TEST(ScannerTest, QuotedLiteral) {
    Token token = scan_token("'hello world' rest", 0);
    EXPECT_EQ(token.kind, TokenKind::Quoted);
    EXPECT_EQ(token.text, "hello world");
    EXPECT_EQ(token.length, 13u);
    EXPECT_TRUE(token.is_value());
}

TEST(ScannerTest, EmptyQuotedLiteral) {
    Token token = scan_token("''", 0);
    EXPECT_EQ(token.kind, TokenKind::Quoted);
    EXPECT_TRUE(token.text.empty());
    EXPECT_EQ(token.length, 2u);
}

TEST(ScannerTest, UnterminatedQuoteIsInvalid) {
    Token token = scan_token("'open", 0);
    EXPECT_EQ(token.kind, TokenKind::Invalid);
    EXPECT_TRUE(token.empty());
}

TEST(ScannerTest, QualifiedWord) {
    Token token = scan_token("db.users WHERE", 0);
    EXPECT_EQ(token.kind, TokenKind::Word);
    EXPECT_EQ(token.text, "db.users");
    EXPECT_EQ(token.length, 8u);
}

TEST(ScannerTest, WordStopsAtPunctuation) {
    EXPECT_EQ(scan_token("a,b", 0).text, "a");
    EXPECT_EQ(scan_token("id=3", 0).text, "id");
    EXPECT_EQ(scan_token("-42)", 0).text, "-42");
    EXPECT_EQ(scan_token("*", 0).text, "*");
}

TEST(ScannerTest, UnreadableCharacter) {
    Token token = scan_token("@x", 0);
    EXPECT_EQ(token.kind, TokenKind::Invalid);
    EXPECT_TRUE(token.empty());
}

TEST(ScannerTest, SkipSpaces) {
    EXPECT_EQ(skip_spaces("a   b", 1), 4u);
    EXPECT_EQ(skip_spaces("a b", 0), 0u);
    EXPECT_EQ(skip_spaces("a  ", 1), 3u);
}

TEST(ScannerTest, JoinTokens) {
    EXPECT_TRUE(scan_token("JOIN b", 0).is_join());
    EXPECT_TRUE(scan_token("inner join b", 0).is_join());
    EXPECT_FALSE(scan_token("joins", 0).is_join());
    EXPECT_FALSE(scan_token("WHERE", 0).is_join());
}

// ==============================================================================
// Classification
// ==============================================================================

TEST(ScannerTest, ReservedWordCatalogue) {
    EXPECT_TRUE(is_reserved_word("select"));
    EXPECT_TRUE(is_reserved_word("Order By"));
    EXPECT_TRUE(is_reserved_word("ON"));
    EXPECT_FALSE(is_reserved_word("("));
    EXPECT_FALSE(is_reserved_word(">="));
    EXPECT_FALSE(is_reserved_word("users"));
}

TEST(ScannerTest, IsIdentifier) {
    EXPECT_TRUE(is_identifier("users"));
    EXPECT_TRUE(is_identifier("_x"));
    EXPECT_TRUE(is_identifier("db.table"));
    EXPECT_TRUE(is_identifier("a1"));

    EXPECT_FALSE(is_identifier("select"));
    EXPECT_FALSE(is_identifier("123"));
    EXPECT_FALSE(is_identifier(","));
    EXPECT_FALSE(is_identifier("*"));
    EXPECT_FALSE(is_identifier(""));
}

TEST(ScannerTest, IsIdentifierOrAsterisk) {
    EXPECT_TRUE(is_identifier_or_asterisk("*"));
    EXPECT_TRUE(is_identifier_or_asterisk("name"));
    EXPECT_FALSE(is_identifier_or_asterisk("FROM"));
}

TEST(ScannerTest, CaseInsensitiveEquality) {
    EXPECT_TRUE(iequals("and", "AND"));
    EXPECT_TRUE(iequals("", ""));
    EXPECT_FALSE(iequals("and", "ANDY"));
    EXPECT_FALSE(iequals("or", "and"));
}
