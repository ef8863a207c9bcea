// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  sqlparse - Embedded Usage Example                                           ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#include "sqlparse/sqlparse.hpp"

#include <fmt/core.h>
#include <fmt/color.h>

#include <string>
#include <vector>

namespace {

void describe(const sqlparse::Query& query) {
    fmt::print("  Type:       {}\n", sqlparse::query_type_to_string(query.type));
    fmt::print("  Table:      {}\n", query.qualified_table());

    if (!query.fields.empty()) {
        fmt::print("  Fields:    ");
        for (const auto& field : query.fields) {
            fmt::print(" {}", field);
        }
        fmt::print("\n");
    }
    if (query.max_rows > 0) {
        fmt::print("  Max rows:   {}\n", query.max_rows);
    }
    for (const auto& join : query.joins) {
        fmt::print("  {} {} ({} condition(s))\n",
            sqlparse::join_type_to_string(join.type), join.table, join.conditions.size());
    }
    for (const auto& c : query.conditions) {
        fmt::print("  Where:      {} {} {}\n", c.operand1, sqlparse::operator_to_string(c.op), c.operand2);
    }
    for (const auto& [field, value] : query.updates) {
        fmt::print("  Set:        {} = {}\n", field, value);
    }
    fmt::print("  Rows:       {}\n", query.inserts.size());
    for (std::size_t i = 0; i < query.order_fields.size(); ++i) {
        fmt::print("  Order by:   {} {}\n", query.order_fields[i],
            sqlparse::order_direction_to_string(query.order_dirs[i]));
    }
    fmt::print("  Canonical:  {}\n\n", query.to_string());
}

} // anonymous namespace

int main() {
    fmt::print(fmt::emphasis::bold, "\n=== sqlparse Embedded Usage Example ===\n\n");

    fmt::print("Version: {}\n", sqlparse::VERSION_STRING);
    fmt::print("Build:   {} ({})\n\n", sqlparse::BUILD_TYPE, sqlparse::COMPILER_ID);

    // Single statements
    const std::vector<std::string> statements = {
        "SELECT TOP 10 id, name FROM app.users WHERE age >= 18 ORDER BY name",
        "select o.id, c.name from orders join customers on o.customer_id = c.id where o.total > 100",
        "INSERT INTO users (id, name) VALUES (1, 'Ann Lee'), (2, 'Bo')",
        "UPDATE users SET name = 'Ann' WHERE id = 1",
        "DELETE FROM users",
    };

    for (const auto& sql : statements) {
        fmt::print(fg(fmt::color::cyan), "{}\n", sql);

        sqlparse::Parser parser(sql);
        auto status = parser.parse();
        if (!status) {
            fmt::print(fg(fmt::color::red), "ERROR: {}\n", status.error().to_string());
            fmt::print("{}\n\n", parser.diagnostic(status.error()));
            continue;
        }
        describe(parser.query());
    }

    // Batch: stops at the first statement that fails
    fmt::print(fmt::emphasis::bold, "Batch parsing\n");
    auto batch = sqlparse::parse_many({
        "SELECT a FROM t",
        "SELECT b FROM u WHERE b = 1",
        "SELECT FROM nowhere",
        "SELECT c FROM v",
    });

    fmt::print("  Parsed {} statement(s)\n", batch.queries.size());
    if (!batch.ok()) {
        fmt::print(fg(fmt::color::yellow), "  Stopped: {}\n", batch.error.to_string());
    }

    fmt::print(fg(fmt::color::green), "\nExample completed.\n\n");
    return 0;
}
