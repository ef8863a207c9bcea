// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  sqlparse - Statement Parser                                                 ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#pragma once

#include "sqlparse/query.hpp"
#include "sqlparse/types.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace sqlparse {

namespace sql {
struct Token;
} // namespace sql

/// Single-statement parser.
///
/// Walks the normalized statement once, token by token, filling a Query as it
/// goes. The first grammar error stops the walk; query() then holds whatever
/// was built up to that point and position() points at the offending token.
///
/// A Parser is not thread-safe, but independent Parser instances are.
class Parser {
public:
    // ==========================================================================
    // Construction
    // ==========================================================================

    /// Normalizes `sql` (see sqlparse::normalize) and keeps its own copy
    explicit Parser(std::string_view sql);

    Parser(const Parser&) = delete;
    Parser& operator=(const Parser&) = delete;

    // ==========================================================================
    // Parsing
    // ==========================================================================

    /// Parse and validate the statement. Calling it again restarts from scratch.
    [[nodiscard]] Status parse();

    /// Query built so far; complete only after parse() succeeded
    [[nodiscard]] const Query& query() const noexcept { return query_; }

    /// Move the query out of the parser
    [[nodiscard]] Query release() noexcept { return std::move(query_); }

    // ==========================================================================
    // Diagnostics
    // ==========================================================================

    /// The normalized statement text
    [[nodiscard]] const std::string& sql() const noexcept { return sql_; }

    /// Cursor offset into sql() where parsing stopped
    [[nodiscard]] std::size_t position() const noexcept { return pos_; }

    /// Statement, caret line under the error position, then the message
    [[nodiscard]] std::string diagnostic(const Error& error) const;

private:
    enum class Step : std::uint8_t {
        Type,
        Top,
        SelectField,
        SelectComma,
        SelectFrom,
        SelectFromTable,
        InsertTable,
        InsertFieldsOpeningParens,
        InsertFields,
        InsertFieldsCommaOrClosingParens,
        InsertValuesRWord,
        InsertValuesOpeningParens,
        InsertValues,
        InsertValuesCommaOrClosingParens,
        InsertValuesCommaBeforeOpeningParens,
        UpdateTable,
        UpdateSet,
        UpdateField,
        UpdateEquals,
        UpdateValue,
        UpdateComma,
        DeleteFromTable,
        Where,
        WhereField,
        WhereOperator,
        WhereValue,
        WhereAnd,
        Order,
        OrderField,
        OrderDirectionOrComma,
        Join,
        JoinTable,
        JoinCondition,
        Done,
    };

    [[nodiscard]] Status run();
    [[nodiscard]] Status dispatch();
    [[nodiscard]] bool accepts_end() const noexcept;

    // Step handlers
    [[nodiscard]] Status step_type();
    [[nodiscard]] Status step_top();
    [[nodiscard]] Status step_select_field();
    [[nodiscard]] Status step_select_comma();
    [[nodiscard]] Status step_select_from();
    [[nodiscard]] Status step_select_from_table();
    [[nodiscard]] Status step_insert_table();
    [[nodiscard]] Status step_insert_fields_opening_parens();
    [[nodiscard]] Status step_insert_fields();
    [[nodiscard]] Status step_insert_fields_comma_or_closing_parens();
    [[nodiscard]] Status step_insert_values_rword();
    [[nodiscard]] Status step_insert_values_opening_parens();
    [[nodiscard]] Status step_insert_values();
    [[nodiscard]] Status step_insert_values_comma_or_closing_parens();
    [[nodiscard]] Status step_insert_values_comma_before_opening_parens();
    [[nodiscard]] Status step_update_table();
    [[nodiscard]] Status step_update_set();
    [[nodiscard]] Status step_update_field();
    [[nodiscard]] Status step_update_equals();
    [[nodiscard]] Status step_update_value();
    [[nodiscard]] Status step_update_comma();
    [[nodiscard]] Status step_delete_from_table();
    [[nodiscard]] Status step_where();
    [[nodiscard]] Status step_where_field();
    [[nodiscard]] Status step_where_operator();
    [[nodiscard]] Status step_where_value();
    [[nodiscard]] Status step_where_and();
    [[nodiscard]] Status step_order();
    [[nodiscard]] Status step_order_field();
    [[nodiscard]] Status step_order_direction_or_comma();
    [[nodiscard]] Status step_join();
    [[nodiscard]] Status step_join_table();
    [[nodiscard]] Status step_join_condition();

    // Helpers
    [[nodiscard]] sql::Token peek() const noexcept;
    sql::Token pop() noexcept;
    [[nodiscard]] Status read_table(std::string_view clause);
    [[nodiscard]] Status read_join_operand(std::string& table, std::string& field);
    [[nodiscard]] Status route_clause(std::string_view clause);
    [[nodiscard]] Status fail(std::string_view clause, std::string_view expectation,
                              const sql::Token& found,
                              ErrorCode code = ErrorCode::UnexpectedToken) const;
    [[nodiscard]] std::string describe(const sql::Token& token) const;

    std::string sql_;
    std::size_t pos_{0};
    Step step_{Step::Type};
    Query query_;
    std::string pending_update_field_;
};

} // namespace sqlparse
