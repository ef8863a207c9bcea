// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  sqlparse - JSON Serialization                                               ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#pragma once

#include "sqlparse/query.hpp"
#include "sqlparse/types.hpp"

#include <nlohmann/json.hpp>

namespace sqlparse {

// Found by nlohmann::json through ADL. Enums are written with their SQL
// spelling ("SELECT", ">=", "DESC", "LEFT JOIN").
void to_json(nlohmann::json& j, const Condition& condition);
void to_json(nlohmann::json& j, const JoinCondition& condition);
void to_json(nlohmann::json& j, const Join& join);
void to_json(nlohmann::json& j, const Query& query);
void to_json(nlohmann::json& j, const Error& error);

} // namespace sqlparse
