// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  sqlparse - Lexical Scanner                                                  ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace sqlparse::sql {

// ==============================================================================
// Reserved-word catalogues
// ==============================================================================

/// Reserved tokens in match order. The first entry matching the input wins,
/// so multi-character operators precede their one-character prefixes and
/// "ON DUPLICATE KEY UPDATE" precedes "ON".
inline constexpr std::array<std::string_view, 27> RESERVED_TOKENS = {
    "(", ")", ">=", "<=", "!=", ",", "=", ">", "<",
    "SELECT", "TOP", "INSERT INTO", "VALUES", "UPDATE", "DELETE FROM",
    "WHERE", "FROM", "SET", "ON DUPLICATE KEY UPDATE", "ORDER BY",
    "ASC", "DESC", "LEFT JOIN", "RIGHT JOIN", "INNER JOIN", "JOIN", "ON",
};

/// RESERVED_TOKENS without the punctuation entries
inline constexpr std::array<std::string_view, 18> RESERVED_WORDS = {
    "SELECT", "TOP", "INSERT INTO", "VALUES", "UPDATE", "DELETE FROM",
    "WHERE", "FROM", "SET", "ON DUPLICATE KEY UPDATE", "ORDER BY",
    "ASC", "DESC", "LEFT JOIN", "RIGHT JOIN", "INNER JOIN", "JOIN", "ON",
};

// ==============================================================================
// Token
// ==============================================================================

enum class TokenKind : std::uint8_t {
    End,          // end of input
    Invalid,      // nothing readable at the cursor (stray char, open quote)
    Punctuation,  // reserved operator or delimiter
    Keyword,      // reserved word, in canonical upper case
    Quoted,       // '...' literal; text excludes the quotes
    Word,         // identifier-class run: names, numbers, db.table, *
};

[[nodiscard]] constexpr const char* token_kind_to_string(TokenKind kind) noexcept {
    switch (kind) {
        case TokenKind::End: return "end of query";
        case TokenKind::Invalid: return "invalid";
        case TokenKind::Punctuation: return "punctuation";
        case TokenKind::Keyword: return "keyword";
        case TokenKind::Quoted: return "quoted literal";
        case TokenKind::Word: return "identifier";
        default: return "unknown";
    }
}

/// Token view into the scanned text (or into RESERVED_TOKENS for reserved
/// tokens). `length` is the number of input bytes it covers, which differs
/// from text.size() for quoted literals and case-folded keywords.
struct Token {
    TokenKind kind{TokenKind::End};
    std::string_view text;
    std::size_t length{0};

    [[nodiscard]] bool is(std::string_view reserved) const noexcept {
        return (kind == TokenKind::Keyword || kind == TokenKind::Punctuation) && text == reserved;
    }

    [[nodiscard]] bool is_value() const noexcept {
        return kind == TokenKind::Quoted || kind == TokenKind::Word;
    }

    [[nodiscard]] bool is_join() const noexcept {
        return kind == TokenKind::Keyword && text.ends_with("JOIN");
    }

    [[nodiscard]] bool empty() const noexcept { return length == 0; }
};

// ==============================================================================
// Scanning
// ==============================================================================

/// Read the token starting at `pos`. Pure: the cursor is not advanced.
[[nodiscard]] Token scan_token(std::string_view sql, std::size_t pos) noexcept;

/// First position at or after `pos` that is not a plain space
[[nodiscard]] std::size_t skip_spaces(std::string_view sql, std::size_t pos) noexcept;

// ==============================================================================
// Classification
// ==============================================================================

/// Member of the identifier character class [.\-a-zA-Z0-9_*]
[[nodiscard]] constexpr bool is_identifier_char(char c) noexcept {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
           c == '_' || c == '.' || c == '-' || c == '*';
}

/// Case-insensitive membership in RESERVED_WORDS
[[nodiscard]] bool is_reserved_word(std::string_view text) noexcept;

/// Not a reserved token and containing at least one letter or underscore
[[nodiscard]] bool is_identifier(std::string_view text) noexcept;

[[nodiscard]] bool is_identifier_or_asterisk(std::string_view text) noexcept;

/// Case-insensitive ASCII comparison
[[nodiscard]] bool iequals(std::string_view lhs, std::string_view rhs) noexcept;

} // namespace sqlparse::sql
