// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  sqlparse - SQL Subset Parser                                                ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#pragma once

#include "sqlparse/version.hpp"
#include "sqlparse/types.hpp"
#include "sqlparse/query.hpp"
#include "sqlparse/parser.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace sqlparse {

/// Outcome of parse_many: every query parsed before the first failure, and
/// that failure (error.ok() when the whole batch parsed)
struct BatchResult {
    std::vector<Query> queries;
    Error error;

    [[nodiscard]] bool ok() const noexcept { return error.ok(); }
};

/// Normalize, parse and validate one statement
[[nodiscard]] Result<Query> parse(std::string_view sql);

/// Parse statements in order, stopping at the first one that fails
[[nodiscard]] BatchResult parse_many(const std::vector<std::string>& sqls);

/// Strip backticks, collapse whitespace runs to one space, trim
[[nodiscard]] std::string normalize(std::string_view sql);

} // namespace sqlparse
