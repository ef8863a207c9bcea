// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  sqlparse - Statement Parser Implementation                                  ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#include "sqlparse/parser.hpp"

#include "internal/sql/normalizer.hpp"
#include "internal/sql/scanner.hpp"
#include "internal/sql/validator.hpp"
#include "internal/utils/logger.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <charconv>
#include <optional>

namespace sqlparse {

using sql::Token;
using sql::TokenKind;

namespace {

std::optional<Operator> to_operator(const Token& token) noexcept {
    if (token.kind != TokenKind::Punctuation) return std::nullopt;
    if (token.text == "=") return Operator::Eq;
    if (token.text == ">") return Operator::Gt;
    if (token.text == ">=") return Operator::Gte;
    if (token.text == "<") return Operator::Lt;
    if (token.text == "<=") return Operator::Lte;
    if (token.text == "!=") return Operator::Ne;
    return std::nullopt;
}

JoinType to_join_type(std::string_view keyword) noexcept {
    if (keyword == "LEFT JOIN") return JoinType::LeftJoin;
    if (keyword == "RIGHT JOIN") return JoinType::RightJoin;
    if (keyword == "INNER JOIN") return JoinType::InnerJoin;
    return JoinType::Join;
}

bool is_field(const Token& token) noexcept {
    return token.kind == TokenKind::Word && sql::is_identifier(token.text);
}

bool is_and(const Token& token) noexcept {
    return token.kind == TokenKind::Word && sql::iequals(token.text, "AND");
}

} // anonymous namespace

// ==============================================================================
// Construction
// ==============================================================================

Parser::Parser(std::string_view sql)
    : sql_(sql::normalize(sql)) {}

// ==============================================================================
// Parsing
// ==============================================================================

Status Parser::parse() {
    pos_ = 0;
    step_ = Step::Type;
    query_ = Query{};
    pending_update_field_.clear();

    auto status = run();
    if (status) {
        status = sql::validate(query_, step_ == Step::WhereField);
        if (!status) {
            Error error = status.error();
            error.set_position(pos_);
            status = Err(error);
        }
    }

    if (!status) {
        Logger::debug("Parse failed at position {}: {}", pos_, status.error().message());
        return status;
    }

    Logger::debug("Parsed {} statement on '{}'",
                  query_type_to_string(query_.type), query_.qualified_table());
    return Ok();
}

Status Parser::run() {
    while (step_ != Step::Done) {
        if (pos_ >= sql_.size() && accepts_end()) {
            break;
        }
        if (auto status = dispatch(); !status) {
            return status;
        }
    }
    return Ok();
}

Status Parser::dispatch() {
    switch (step_) {
        case Step::Type: return step_type();
        case Step::Top: return step_top();
        case Step::SelectField: return step_select_field();
        case Step::SelectComma: return step_select_comma();
        case Step::SelectFrom: return step_select_from();
        case Step::SelectFromTable: return step_select_from_table();
        case Step::InsertTable: return step_insert_table();
        case Step::InsertFieldsOpeningParens: return step_insert_fields_opening_parens();
        case Step::InsertFields: return step_insert_fields();
        case Step::InsertFieldsCommaOrClosingParens: return step_insert_fields_comma_or_closing_parens();
        case Step::InsertValuesRWord: return step_insert_values_rword();
        case Step::InsertValuesOpeningParens: return step_insert_values_opening_parens();
        case Step::InsertValues: return step_insert_values();
        case Step::InsertValuesCommaOrClosingParens: return step_insert_values_comma_or_closing_parens();
        case Step::InsertValuesCommaBeforeOpeningParens: return step_insert_values_comma_before_opening_parens();
        case Step::UpdateTable: return step_update_table();
        case Step::UpdateSet: return step_update_set();
        case Step::UpdateField: return step_update_field();
        case Step::UpdateEquals: return step_update_equals();
        case Step::UpdateValue: return step_update_value();
        case Step::UpdateComma: return step_update_comma();
        case Step::DeleteFromTable: return step_delete_from_table();
        case Step::Where: return step_where();
        case Step::WhereField: return step_where_field();
        case Step::WhereOperator: return step_where_operator();
        case Step::WhereValue: return step_where_value();
        case Step::WhereAnd: return step_where_and();
        case Step::Order: return step_order();
        case Step::OrderField: return step_order_field();
        case Step::OrderDirectionOrComma: return step_order_direction_or_comma();
        case Step::Join: return step_join();
        case Step::JoinTable: return step_join_table();
        case Step::JoinCondition: return step_join_condition();
        case Step::Done: return Ok();
    }
    return Err(ErrorCode::InternalError, "unhandled parser step", pos_);
}

// Steps where running out of input is not a grammar error. Whatever is still
// missing at that point is reported by the validator.
bool Parser::accepts_end() const noexcept {
    switch (step_) {
        case Step::Type:
        case Step::SelectFromTable:
        case Step::InsertTable:
        case Step::InsertValuesRWord:
        case Step::InsertValuesCommaBeforeOpeningParens:
        case Step::UpdateTable:
        case Step::UpdateComma:
        case Step::DeleteFromTable:
        case Step::Where:
        case Step::WhereField:
        case Step::WhereAnd:
        case Step::OrderDirectionOrComma:
        case Step::Done:
            return true;
        default:
            return false;
    }
}

// ==============================================================================
// Statement type
// ==============================================================================

Status Parser::step_type() {
    Token token = peek();

    if (token.is("SELECT")) {
        query_.type = QueryType::Select;
        pop();
        step_ = peek().is("TOP") ? Step::Top : Step::SelectField;
    } else if (token.is("INSERT INTO")) {
        query_.type = QueryType::Insert;
        pop();
        step_ = Step::InsertTable;
    } else if (token.is("UPDATE")) {
        query_.type = QueryType::Update;
        pop();
        step_ = Step::UpdateTable;
    } else if (token.is("DELETE FROM")) {
        query_.type = QueryType::Delete;
        pop();
        step_ = Step::DeleteFromTable;
    } else {
        return Err(ErrorCode::InvalidQueryType, "invalid query type", pos_);
    }

    Logger::trace("Classified statement as {}", query_type_to_string(query_.type));
    return Ok();
}

// ==============================================================================
// SELECT
// ==============================================================================

Status Parser::step_top() {
    pop();  // TOP

    Token token = peek();
    std::uint64_t rows = 0;
    if (token.kind == TokenKind::Word) {
        const char* first = token.text.data();
        const char* last = first + token.text.size();
        auto [ptr, ec] = std::from_chars(first, last, rows);
        if (ec == std::errc() && ptr == last) {
            query_.max_rows = rows;
            pop();
            step_ = Step::SelectField;
            return Ok();
        }
    }
    return fail("SELECT TOP", "row count", token, ErrorCode::InvalidRowCount);
}

Status Parser::step_select_field() {
    Token token = peek();
    if (token.kind != TokenKind::Word || !sql::is_identifier_or_asterisk(token.text)) {
        return fail("SELECT", "field to SELECT", token);
    }
    query_.fields.emplace_back(token.text);
    pop();

    step_ = peek().is("FROM") ? Step::SelectFrom : Step::SelectComma;
    return Ok();
}

Status Parser::step_select_comma() {
    Token token = peek();
    if (!token.is(",")) {
        return fail("SELECT", "comma or FROM", token);
    }
    pop();
    step_ = Step::SelectField;
    return Ok();
}

Status Parser::step_select_from() {
    Token token = peek();
    if (!token.is("FROM")) {
        return fail("SELECT", "FROM", token);
    }
    pop();
    step_ = Step::SelectFromTable;
    return Ok();
}

Status Parser::step_select_from_table() {
    if (auto status = read_table("SELECT"); !status) {
        return status;
    }
    return route_clause("SELECT");
}

// ==============================================================================
// INSERT
// ==============================================================================

Status Parser::step_insert_table() {
    if (auto status = read_table("INSERT INTO"); !status) {
        return status;
    }
    step_ = Step::InsertFieldsOpeningParens;
    return Ok();
}

Status Parser::step_insert_fields_opening_parens() {
    Token token = peek();
    if (!token.is("(")) {
        return fail("INSERT INTO", "opening parens", token);
    }
    pop();
    step_ = Step::InsertFields;
    return Ok();
}

Status Parser::step_insert_fields() {
    Token token = peek();
    if (!is_field(token)) {
        return fail("INSERT INTO", "field to insert", token);
    }
    query_.fields.emplace_back(token.text);
    pop();
    step_ = Step::InsertFieldsCommaOrClosingParens;
    return Ok();
}

Status Parser::step_insert_fields_comma_or_closing_parens() {
    Token token = peek();
    if (token.is(",")) {
        pop();
        step_ = Step::InsertFields;
        return Ok();
    }
    if (token.is(")")) {
        pop();
        step_ = Step::InsertValuesRWord;
        return Ok();
    }
    return fail("INSERT INTO", "comma or closing parens", token);
}

Status Parser::step_insert_values_rword() {
    Token token = peek();
    if (!token.is("VALUES")) {
        return fail("INSERT INTO", "'VALUES'", token);
    }
    pop();
    step_ = Step::InsertValuesOpeningParens;
    return Ok();
}

Status Parser::step_insert_values_opening_parens() {
    Token token = peek();
    if (!token.is("(")) {
        return fail("INSERT INTO", "opening parens", token);
    }
    query_.inserts.emplace_back();
    pop();
    step_ = Step::InsertValues;
    return Ok();
}

Status Parser::step_insert_values() {
    Token token = peek();
    if (!token.is_value()) {
        return fail("INSERT INTO", "quoted value", token);
    }
    query_.inserts.back().emplace_back(token.text);
    pop();
    step_ = Step::InsertValuesCommaOrClosingParens;
    return Ok();
}

Status Parser::step_insert_values_comma_or_closing_parens() {
    Token token = peek();
    if (token.is(",")) {
        pop();
        step_ = Step::InsertValues;
        return Ok();
    }
    if (!token.is(")")) {
        return fail("INSERT INTO", "comma or closing parens", token);
    }

    const auto& row = query_.inserts.back();
    if (row.size() != query_.fields.size()) {
        return Err(ErrorCode::ValueCountMismatch,
                   fmt::format("at INSERT INTO: value count doesn't match field count "
                               "(row {} has {} values, {} fields)",
                               query_.inserts.size(), row.size(), query_.fields.size()),
                   pos_);
    }
    pop();
    step_ = Step::InsertValuesCommaBeforeOpeningParens;
    return Ok();
}

Status Parser::step_insert_values_comma_before_opening_parens() {
    Token token = peek();
    if (token.is(",")) {
        pop();
        step_ = Step::InsertValuesOpeningParens;
        return Ok();
    }

    // Trailing clauses such as ON DUPLICATE KEY UPDATE are not supported; the
    // rows read so far are the result.
    if (token.kind == TokenKind::Keyword) {
        Logger::debug("Ignoring unsupported clause '{}' after INSERT rows at position {}",
                      token.text, pos_);
        step_ = Step::Done;
        return Ok();
    }
    return fail("INSERT INTO", "comma", token);
}

// ==============================================================================
// UPDATE
// ==============================================================================

Status Parser::step_update_table() {
    if (auto status = read_table("UPDATE"); !status) {
        return status;
    }
    step_ = Step::UpdateSet;
    return Ok();
}

Status Parser::step_update_set() {
    Token token = peek();
    if (!token.is("SET")) {
        return fail("UPDATE", "'SET'", token);
    }
    pop();
    step_ = Step::UpdateField;
    return Ok();
}

Status Parser::step_update_field() {
    Token token = peek();
    if (!is_field(token)) {
        return fail("UPDATE", "field to update", token);
    }
    pending_update_field_ = std::string(token.text);
    pop();
    step_ = Step::UpdateEquals;
    return Ok();
}

Status Parser::step_update_equals() {
    Token token = peek();
    if (!token.is("=")) {
        return fail("UPDATE", "'='", token);
    }
    pop();
    step_ = Step::UpdateValue;
    return Ok();
}

Status Parser::step_update_value() {
    Token token = peek();
    if (!token.is_value()) {
        return fail("UPDATE", "quoted value", token);
    }
    // Last write wins for a repeated field
    query_.updates.insert_or_assign(std::move(pending_update_field_), std::string(token.text));
    pending_update_field_.clear();
    pop();

    step_ = peek().is("WHERE") ? Step::Where : Step::UpdateComma;
    return Ok();
}

Status Parser::step_update_comma() {
    Token token = peek();
    if (!token.is(",")) {
        return fail("UPDATE", "',' or WHERE", token);
    }
    pop();
    step_ = Step::UpdateField;
    return Ok();
}

// ==============================================================================
// DELETE
// ==============================================================================

Status Parser::step_delete_from_table() {
    if (auto status = read_table("DELETE FROM"); !status) {
        return status;
    }
    step_ = Step::Where;
    return Ok();
}

// ==============================================================================
// WHERE
// ==============================================================================

Status Parser::step_where() {
    Token token = peek();
    if (!token.is("WHERE")) {
        return fail({}, "WHERE", token);
    }
    pop();
    step_ = Step::WhereField;
    return Ok();
}

Status Parser::step_where_field() {
    Token token = peek();
    if (!is_field(token)) {
        return fail("WHERE", "field", token);
    }
    Condition condition;
    condition.operand1 = std::string(token.text);
    condition.operand1_is_field = true;
    query_.conditions.push_back(std::move(condition));
    pop();
    step_ = Step::WhereOperator;
    return Ok();
}

Status Parser::step_where_operator() {
    Token token = peek();
    auto op = to_operator(token);
    if (!op) {
        return fail("WHERE", "comparison operator", token);
    }
    query_.conditions.back().op = *op;
    pop();
    step_ = Step::WhereValue;
    return Ok();
}

Status Parser::step_where_value() {
    Token token = peek();
    if (!token.is_value()) {
        return fail("WHERE", "quoted value", token);
    }
    auto& condition = query_.conditions.back();
    condition.operand2 = std::string(token.text);
    condition.operand2_is_field = false;
    pop();

    if (peek().is("ORDER BY")) {
        pop();
        step_ = Step::OrderField;
    } else {
        step_ = Step::WhereAnd;
    }
    return Ok();
}

Status Parser::step_where_and() {
    Token token = peek();
    if (!is_and(token)) {
        return fail("WHERE", "AND or ORDER BY", token);
    }
    pop();
    step_ = Step::WhereField;
    return Ok();
}

// ==============================================================================
// ORDER BY
// ==============================================================================

Status Parser::step_order() {
    Token token = peek();
    if (!token.is("ORDER BY")) {
        return fail({}, "ORDER BY", token);
    }
    pop();
    step_ = Step::OrderField;
    return Ok();
}

Status Parser::step_order_field() {
    Token token = peek();
    if (!is_field(token)) {
        return fail("ORDER BY", "field to ORDER", token);
    }
    query_.order_fields.emplace_back(token.text);
    query_.order_dirs.push_back(OrderDirection::Asc);
    pop();
    step_ = Step::OrderDirectionOrComma;
    return Ok();
}

Status Parser::step_order_direction_or_comma() {
    Token token = peek();
    if (token.is("ASC") || token.is("DESC")) {
        query_.order_dirs.back() = token.is("DESC") ? OrderDirection::Desc : OrderDirection::Asc;
        pop();
        token = peek();
        if (token.kind == TokenKind::End) {
            step_ = Step::Done;
            return Ok();
        }
        if (!token.is(",")) {
            return fail("ORDER BY", "comma", token);
        }
    }
    if (!token.is(",")) {
        return fail("ORDER BY", "ASC, DESC or comma", token);
    }
    pop();
    step_ = Step::OrderField;
    return Ok();
}

// ==============================================================================
// JOIN
// ==============================================================================

Status Parser::step_join() {
    Token token = peek();
    if (!token.is_join()) {
        return fail({}, "JOIN", token);
    }
    Join join;
    join.type = to_join_type(token.text);
    query_.joins.push_back(std::move(join));
    pop();
    step_ = Step::JoinTable;
    return Ok();
}

Status Parser::step_join_table() {
    Token token = peek();
    if (!is_field(token)) {
        return fail("JOIN", "table name", token);
    }
    query_.joins.back().table = std::string(token.text);
    pop();

    if (peek().is("ON")) {
        step_ = Step::JoinCondition;
        return Ok();
    }
    return route_clause("JOIN");
}

Status Parser::step_join_condition() {
    Token token = peek();
    if (!token.is("ON") && !is_and(token)) {
        return fail("ON", "ON or AND", token);
    }
    pop();

    JoinCondition condition;
    if (auto status = read_join_operand(condition.table1, condition.operand1); !status) {
        return status;
    }

    token = peek();
    auto op = to_operator(token);
    if (!op) {
        return fail("ON", "comparison operator", token);
    }
    condition.op = *op;
    pop();

    if (auto status = read_join_operand(condition.table2, condition.operand2); !status) {
        return status;
    }
    query_.joins.back().conditions.push_back(std::move(condition));

    if (is_and(peek())) {
        step_ = Step::JoinCondition;
        return Ok();
    }
    return route_clause("ON");
}

// ==============================================================================
// Helpers
// ==============================================================================

Token Parser::peek() const noexcept {
    return sql::scan_token(sql_, pos_);
}

Token Parser::pop() noexcept {
    Token token = peek();
    pos_ = sql::skip_spaces(sql_, pos_ + token.length);
    return token;
}

// Table reference of the current statement; "db.table" splits on the first dot
Status Parser::read_table(std::string_view clause) {
    Token token = peek();
    if (!is_field(token)) {
        return fail(clause, "table name", token);
    }

    std::string_view name = token.text;
    auto dot = name.find('.');
    if (dot != std::string_view::npos) {
        std::string_view database = name.substr(0, dot);
        std::string_view table = name.substr(dot + 1);
        if (database.empty() || table.empty()) {
            return fail(clause, "<database>.<table>", token, ErrorCode::InvalidQualifiedName);
        }
        query_.database = std::string(database);
        name = table;
    }

    query_.table = std::string(name);
    pop();
    return Ok();
}

// Join operands must be exactly <table>.<field>
Status Parser::read_join_operand(std::string& table, std::string& field) {
    Token token = peek();
    if (token.kind != TokenKind::Word) {
        return fail("ON", "<tablename>.<fieldname>", token);
    }
    if (std::count(token.text.begin(), token.text.end(), '.') != 1) {
        return fail("ON", "<tablename>.<fieldname>", token, ErrorCode::InvalidQualifiedName);
    }

    auto dot = token.text.find('.');
    std::string_view left = token.text.substr(0, dot);
    std::string_view right = token.text.substr(dot + 1);
    if (left.empty() || right.empty()) {
        return fail("ON", "<tablename>.<fieldname>", token, ErrorCode::InvalidQualifiedName);
    }

    table = std::string(left);
    field = std::string(right);
    pop();
    return Ok();
}

// Pick the clause that follows a table reference or join condition
Status Parser::route_clause(std::string_view clause) {
    Token token = peek();
    if (token.kind == TokenKind::End) {
        step_ = Step::Done;
    } else if (token.is("WHERE")) {
        step_ = Step::Where;
    } else if (token.is("ORDER BY")) {
        step_ = Step::Order;
    } else if (token.is_join()) {
        step_ = Step::Join;
    } else {
        return fail(clause, "WHERE, ORDER BY, JOIN or end of query", token);
    }
    return Ok();
}

Status Parser::fail(std::string_view clause, std::string_view expectation,
                    const Token& found, ErrorCode code) const {
    if (code == ErrorCode::UnexpectedToken && found.kind == TokenKind::End) {
        code = ErrorCode::UnexpectedEnd;
    }

    std::string message = clause.empty()
        ? fmt::format("expected {}, got {}", expectation, describe(found))
        : fmt::format("at {}: expected {}, got {}", clause, expectation, describe(found));
    return Err(code, std::move(message), pos_);
}

std::string Parser::describe(const Token& token) const {
    switch (token.kind) {
        case TokenKind::End:
            return "end of query";
        case TokenKind::Invalid: {
            if (sql_[pos_] == '\'') {
                return "unterminated quoted value";
            }
            // Non-printable and non-ASCII bytes are spelled out so the message
            // stays valid UTF-8
            auto byte = static_cast<unsigned char>(sql_[pos_]);
            if (byte < 0x20 || byte > 0x7E) {
                return fmt::format("byte 0x{:02X}", byte);
            }
            return fmt::format("unexpected character '{}'", sql_[pos_]);
        }
        default:
            return fmt::format("'{}'", token.text);
    }
}

// ==============================================================================
// Diagnostics
// ==============================================================================

std::string Parser::diagnostic(const Error& error) const {
    std::size_t caret = error.has_position() ? std::min(error.position(), sql_.size()) : sql_.size();
    return fmt::format("{}\n{}^\n{}", sql_, std::string(caret, ' '), error.message());
}

} // namespace sqlparse
