// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  sqlparse - Query Validator                                                  ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#pragma once

#include "sqlparse/query.hpp"
#include "sqlparse/types.hpp"

namespace sqlparse::sql {

/// Whole-query structural checks run after a grammatically clean parse.
///
/// Checks run in a fixed order and the first failure is returned:
///   1. dangling WHERE / AND (`where_pending`)
///   2. query type set
///   3. table name set
///   4. UPDATE and DELETE carry at least one WHERE condition
///   5. every condition has an operator and non-empty operands
///   6. INSERT has at least one row
///   7. every INSERT row matches the field count
[[nodiscard]] Status validate(const Query& query, bool where_pending);

} // namespace sqlparse::sql
