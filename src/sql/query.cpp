// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  sqlparse - Query Rendering                                                  ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#include "sqlparse/query.hpp"

#include "internal/sql/scanner.hpp"

#include <algorithm>
#include <sstream>

namespace sqlparse {

namespace {

// Literals are written bare when they scan back as the same word, otherwise
// single-quoted.
std::string render_value(const std::string& value) {
    bool bare = !value.empty() &&
                std::all_of(value.begin(), value.end(), sql::is_identifier_char) &&
                !sql::is_reserved_word(value) &&
                !sql::iequals(value, "AND");
    return bare ? value : "'" + value + "'";
}

template<typename Range, typename Fn>
void join_into(std::stringstream& ss, const Range& items, Fn&& render) {
    bool first = true;
    for (const auto& item : items) {
        if (!first) ss << ", ";
        render(item);
        first = false;
    }
}

} // anonymous namespace

std::string Query::qualified_table() const {
    if (database.empty()) {
        return table;
    }
    return database + "." + table;
}

std::string Query::to_string() const {
    std::stringstream ss;
    ss << query_type_to_string(type);

    switch (type) {
        case QueryType::Select:
            if (max_rows > 0) {
                ss << " TOP " << max_rows;
            }
            ss << " ";
            join_into(ss, fields, [&](const std::string& field) { ss << field; });
            ss << " FROM " << qualified_table();

            for (const auto& join : joins) {
                ss << " " << join_type_to_string(join.type) << " " << join.table;
                for (std::size_t i = 0; i < join.conditions.size(); ++i) {
                    const auto& c = join.conditions[i];
                    ss << (i == 0 ? " ON " : " AND ")
                       << c.table1 << "." << c.operand1 << " " << operator_to_string(c.op) << " "
                       << c.table2 << "." << c.operand2;
                }
            }
            break;

        case QueryType::Insert:
            ss << " " << qualified_table() << " (";
            join_into(ss, fields, [&](const std::string& field) { ss << field; });
            ss << ") VALUES ";
            join_into(ss, inserts, [&](const std::vector<std::string>& row) {
                ss << "(";
                join_into(ss, row, [&](const std::string& value) { ss << render_value(value); });
                ss << ")";
            });
            break;

        case QueryType::Update:
            ss << " " << qualified_table() << " SET ";
            join_into(ss, updates, [&](const auto& entry) {
                ss << entry.first << " = " << render_value(entry.second);
            });
            break;

        case QueryType::Delete:
            ss << " " << qualified_table();
            break;

        default:
            return ss.str();
    }

    for (std::size_t i = 0; i < conditions.size(); ++i) {
        const auto& c = conditions[i];
        ss << (i == 0 ? " WHERE " : " AND ")
           << c.operand1 << " " << operator_to_string(c.op) << " "
           << (c.operand2_is_field ? c.operand2 : render_value(c.operand2));
    }

    for (std::size_t i = 0; i < order_fields.size(); ++i) {
        ss << (i == 0 ? " ORDER BY " : ", ") << order_fields[i];
        if (i < order_dirs.size() && order_dirs[i] == OrderDirection::Desc) {
            ss << " DESC";
        }
    }

    return ss.str();
}

} // namespace sqlparse
