// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  sqlparse - Query Model                                                      ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace sqlparse {

// ==============================================================================
// Enumerations
// ==============================================================================

enum class QueryType : std::uint8_t {
    Unknown,
    Select,
    Insert,
    Update,
    Delete,
};

/// Comparison operator of a WHERE or ON condition
enum class Operator : std::uint8_t {
    Unknown,
    Eq,
    Ne,
    Gt,
    Gte,
    Lt,
    Lte,
};

enum class OrderDirection : std::uint8_t {
    Asc,
    Desc,
};

enum class JoinType : std::uint8_t {
    Join,
    LeftJoin,
    RightJoin,
    InnerJoin,
};

/// Statement keyword ("SELECT", "INSERT INTO", ...); "UNKNOWN" for Unknown
[[nodiscard]] constexpr const char* query_type_to_string(QueryType type) noexcept {
    switch (type) {
        case QueryType::Select: return "SELECT";
        case QueryType::Insert: return "INSERT INTO";
        case QueryType::Update: return "UPDATE";
        case QueryType::Delete: return "DELETE FROM";
        default: return "UNKNOWN";
    }
}

/// SQL spelling of the operator; empty for Unknown
[[nodiscard]] constexpr const char* operator_to_string(Operator op) noexcept {
    switch (op) {
        case Operator::Eq: return "=";
        case Operator::Ne: return "!=";
        case Operator::Gt: return ">";
        case Operator::Gte: return ">=";
        case Operator::Lt: return "<";
        case Operator::Lte: return "<=";
        default: return "";
    }
}

[[nodiscard]] constexpr const char* order_direction_to_string(OrderDirection dir) noexcept {
    return dir == OrderDirection::Desc ? "DESC" : "ASC";
}

[[nodiscard]] constexpr const char* join_type_to_string(JoinType type) noexcept {
    switch (type) {
        case JoinType::LeftJoin: return "LEFT JOIN";
        case JoinType::RightJoin: return "RIGHT JOIN";
        case JoinType::InnerJoin: return "INNER JOIN";
        default: return "JOIN";
    }
}

// ==============================================================================
// Clauses
// ==============================================================================

/// WHERE condition: <field> <op> <field-or-literal>
struct Condition {
    std::string operand1;
    bool operand1_is_field{true};
    Operator op{Operator::Unknown};
    std::string operand2;
    bool operand2_is_field{false};

    bool operator==(const Condition&) const = default;
};

/// ON condition: <table1>.<operand1> <op> <table2>.<operand2>
struct JoinCondition {
    std::string table1;
    std::string operand1;
    Operator op{Operator::Unknown};
    std::string table2;
    std::string operand2;

    bool operator==(const JoinCondition&) const = default;
};

struct Join {
    JoinType type{JoinType::Join};
    std::string table;
    std::vector<JoinCondition> conditions;

    bool operator==(const Join&) const = default;
};

// ==============================================================================
// Query
// ==============================================================================

/// Parsed form of a single SELECT / INSERT / UPDATE / DELETE statement.
///
/// `fields` holds the selected columns for SELECT and the target columns for
/// INSERT. `order_fields` and `order_dirs` always have the same length.
struct Query {
    QueryType type{QueryType::Unknown};
    std::string database;
    std::string table;
    std::vector<std::string> fields;
    std::uint64_t max_rows{0};  // 0 = unbounded
    std::vector<Condition> conditions;
    std::map<std::string, std::string> updates;
    std::vector<std::vector<std::string>> inserts;
    std::vector<std::string> order_fields;
    std::vector<OrderDirection> order_dirs;
    std::vector<Join> joins;

    /// "db.table" when a database was given, otherwise the table name
    [[nodiscard]] std::string qualified_table() const;

    /// Canonical SQL text that parses back to an equal Query
    [[nodiscard]] std::string to_string() const;

    bool operator==(const Query&) const = default;
};

} // namespace sqlparse
