// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  sqlparse - JSON Serialization Implementation                                ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#include "sqlparse/json.hpp"

namespace sqlparse {

void to_json(nlohmann::json& j, const Condition& condition) {
    j = nlohmann::json{
        {"operand1", condition.operand1},
        {"operand1_is_field", condition.operand1_is_field},
        {"operator", operator_to_string(condition.op)},
        {"operand2", condition.operand2},
        {"operand2_is_field", condition.operand2_is_field},
    };
}

void to_json(nlohmann::json& j, const JoinCondition& condition) {
    j = nlohmann::json{
        {"table1", condition.table1},
        {"operand1", condition.operand1},
        {"operator", operator_to_string(condition.op)},
        {"table2", condition.table2},
        {"operand2", condition.operand2},
    };
}

void to_json(nlohmann::json& j, const Join& join) {
    j = nlohmann::json{
        {"type", join_type_to_string(join.type)},
        {"table", join.table},
        {"conditions", join.conditions},
    };
}

void to_json(nlohmann::json& j, const Query& query) {
    nlohmann::json order = nlohmann::json::array();
    for (std::size_t i = 0; i < query.order_fields.size(); ++i) {
        order.push_back(nlohmann::json{
            {"field", query.order_fields[i]},
            {"direction", order_direction_to_string(query.order_dirs[i])},
        });
    }

    j = nlohmann::json{
        {"type", query_type_to_string(query.type)},
        {"database", query.database},
        {"table", query.table},
        {"fields", query.fields},
        {"max_rows", query.max_rows},
        {"conditions", query.conditions},
        {"updates", query.updates},
        {"inserts", query.inserts},
        {"order_by", order},
        {"joins", query.joins},
    };
}

void to_json(nlohmann::json& j, const Error& error) {
    j = nlohmann::json{
        {"code", static_cast<std::uint32_t>(error.code())},
        {"kind", error_code_to_string(error.code())},
        {"message", error.message()},
    };
    if (error.has_position()) {
        j["position"] = error.position();
    }
}

} // namespace sqlparse
