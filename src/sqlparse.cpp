// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  sqlparse - Public Entry Points                                              ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#include "sqlparse/sqlparse.hpp"

#include "internal/sql/normalizer.hpp"
#include "internal/utils/logger.hpp"

namespace sqlparse {

Result<Query> parse(std::string_view sql) {
    Parser parser(sql);
    if (auto status = parser.parse(); !status) {
        return Err<Query>(status.error());
    }
    return parser.release();
}

BatchResult parse_many(const std::vector<std::string>& sqls) {
    BatchResult batch;
    batch.queries.reserve(sqls.size());

    for (std::size_t i = 0; i < sqls.size(); ++i) {
        Parser parser(sqls[i]);
        if (auto status = parser.parse(); !status) {
            Logger::debug("Batch stopped at statement {} of {}: {}",
                          i + 1, sqls.size(), status.error().to_string());
            batch.error = status.error();
            return batch;
        }
        batch.queries.push_back(parser.release());
    }

    return batch;
}

std::string normalize(std::string_view sql) {
    return sql::normalize(sql);
}

} // namespace sqlparse
