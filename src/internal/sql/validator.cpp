// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  sqlparse - Query Validator Implementation                                   ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#include "internal/sql/validator.hpp"

#include <fmt/core.h>

namespace sqlparse::sql {

Status validate(const Query& query, bool where_pending) {
    if (where_pending) {
        return Err(ErrorCode::EmptyWhereClause, "at WHERE: empty WHERE clause");
    }
    if (query.type == QueryType::Unknown) {
        return Err(ErrorCode::MissingQueryType, "query type cannot be empty");
    }
    if (query.table.empty()) {
        return Err(ErrorCode::MissingTableName, "table name cannot be empty");
    }
    if (query.conditions.empty() &&
        (query.type == QueryType::Update || query.type == QueryType::Delete)) {
        return Err(ErrorCode::MissingWhereClause,
                   "at WHERE: WHERE clause is mandatory for UPDATE & DELETE");
    }

    for (const auto& condition : query.conditions) {
        if (condition.op == Operator::Unknown) {
            return Err(ErrorCode::InvalidCondition, "at WHERE: condition without operator");
        }
        if (condition.operand1.empty() && condition.operand1_is_field) {
            return Err(ErrorCode::InvalidCondition, "at WHERE: condition with empty left side operand");
        }
        if (condition.operand2.empty() && condition.operand2_is_field) {
            return Err(ErrorCode::InvalidCondition, "at WHERE: condition with empty right side operand");
        }
    }

    if (query.type == QueryType::Insert) {
        if (query.inserts.empty()) {
            return Err(ErrorCode::MissingInsertRows, "at INSERT INTO: need at least one row to insert");
        }
        for (std::size_t row = 0; row < query.inserts.size(); ++row) {
            if (query.inserts[row].size() != query.fields.size()) {
                return Err(ErrorCode::ValueCountMismatch,
                           fmt::format("at INSERT INTO: value count doesn't match field count "
                                       "(row {} has {} values, {} fields)",
                                       row + 1, query.inserts[row].size(), query.fields.size()));
            }
        }
    }

    return Ok();
}

} // namespace sqlparse::sql
