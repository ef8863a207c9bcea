// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  sqlparse - Statement Normalizer                                             ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#pragma once

#include <string>
#include <string_view>

namespace sqlparse::sql {

/// Prepare raw statement text for the scanner: drop backticks, collapse every
/// whitespace run (space, \t, \n, \r, \f) into one space, trim both ends.
/// Applies inside quoted literals too. Idempotent.
[[nodiscard]] std::string normalize(std::string_view sql);

} // namespace sqlparse::sql
