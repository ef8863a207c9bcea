// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  sqlparse - Statement Normalizer Implementation                              ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#include "internal/sql/normalizer.hpp"

namespace sqlparse::sql {

namespace {

constexpr bool is_space(char c) noexcept {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f';
}

} // anonymous namespace

std::string normalize(std::string_view sql) {
    std::string out;
    out.reserve(sql.size());

    bool pending_space = false;
    for (char c : sql) {
        if (c == '`') {
            continue;
        }
        if (is_space(c)) {
            pending_space = true;
            continue;
        }
        if (pending_space && !out.empty()) {
            out.push_back(' ');
        }
        pending_space = false;
        out.push_back(c);
    }

    return out;
}

} // namespace sqlparse::sql
