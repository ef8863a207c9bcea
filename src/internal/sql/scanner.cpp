// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  sqlparse - Lexical Scanner Implementation                                   ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#include "internal/sql/scanner.hpp"

#include <algorithm>

namespace sqlparse::sql {

namespace {

constexpr char to_upper(char c) noexcept {
    return (c >= 'a' && c <= 'z') ? static_cast<char>(c - 'a' + 'A') : c;
}

constexpr bool is_alpha(char c) noexcept {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

// A keyword only matches where an identifier would end: "ascending" and
// "on.id" are identifiers, not ASC or ON followed by the rest.
bool matches_reserved(std::string_view rest, std::string_view reserved) noexcept {
    if (rest.size() < reserved.size()) {
        return false;
    }
    if (!iequals(rest.substr(0, reserved.size()), reserved)) {
        return false;
    }
    if (is_alpha(reserved.back()) && rest.size() > reserved.size()) {
        return !is_identifier_char(rest[reserved.size()]);
    }
    return true;
}

Token scan_quoted(std::string_view rest) noexcept {
    auto close = rest.find('\'', 1);
    if (close == std::string_view::npos) {
        return Token{TokenKind::Invalid, {}, 0};
    }
    return Token{TokenKind::Quoted, rest.substr(1, close - 1), close + 1};
}

Token scan_word(std::string_view rest) noexcept {
    auto end = std::find_if_not(rest.begin(), rest.end(), is_identifier_char);
    auto length = static_cast<std::size_t>(end - rest.begin());
    if (length == 0) {
        return Token{TokenKind::Invalid, {}, 0};
    }
    return Token{TokenKind::Word, rest.substr(0, length), length};
}

} // anonymous namespace

// ==============================================================================
// Scanning
// ==============================================================================

Token scan_token(std::string_view sql, std::size_t pos) noexcept {
    if (pos >= sql.size()) {
        return Token{TokenKind::End, {}, 0};
    }

    std::string_view rest = sql.substr(pos);

    for (std::string_view reserved : RESERVED_TOKENS) {
        if (matches_reserved(rest, reserved)) {
            auto kind = is_alpha(reserved.front()) ? TokenKind::Keyword : TokenKind::Punctuation;
            return Token{kind, reserved, reserved.size()};
        }
    }

    if (rest.front() == '\'') {
        return scan_quoted(rest);
    }

    return scan_word(rest);
}

std::size_t skip_spaces(std::string_view sql, std::size_t pos) noexcept {
    while (pos < sql.size() && sql[pos] == ' ') {
        ++pos;
    }
    return pos;
}

// ==============================================================================
// Classification
// ==============================================================================

bool iequals(std::string_view lhs, std::string_view rhs) noexcept {
    return lhs.size() == rhs.size() &&
           std::equal(lhs.begin(), lhs.end(), rhs.begin(),
                      [](char a, char b) { return to_upper(a) == to_upper(b); });
}

bool is_reserved_word(std::string_view text) noexcept {
    return std::any_of(RESERVED_WORDS.begin(), RESERVED_WORDS.end(),
                       [text](std::string_view word) { return iequals(text, word); });
}

bool is_identifier(std::string_view text) noexcept {
    bool reserved = std::any_of(RESERVED_TOKENS.begin(), RESERVED_TOKENS.end(),
                                [text](std::string_view token) { return iequals(text, token); });
    if (reserved) {
        return false;
    }
    return std::any_of(text.begin(), text.end(), [](char c) { return is_alpha(c) || c == '_'; });
}

bool is_identifier_or_asterisk(std::string_view text) noexcept {
    return text == "*" || is_identifier(text);
}

} // namespace sqlparse::sql
