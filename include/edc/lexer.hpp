// ============================================================================
// edc/lexer.hpp — Tokeniser for edit-check condition expressions
// ============================================================================
//
// The lexer converts a condition string into a stream of tokens.  Every
// token carries its source position (line, column) so that error messages
// can point the user to the exact location of a problem.
//
// Recognised tokens:
//   Identifiers  [A-Za-z_][A-Za-z0-9_]* ('.' [A-Za-z_][A-Za-z0-9_]*)*
//                a dotted name such as "VitalSigns.SystolicBP" is a single
//                token
//   Keywords     AND OR NOT IF THEN ELSE IN BETWEEN IS NULL TRUE FALSE
//                (case-insensitive, never dotted)
//   Numbers      -?[0-9]+(\.[0-9]+)?   the sign is only read where an
//                operand may start, so "a-1" is not a number
//   Dates        YYYY-MM-DD
//   Strings      '...' or "..."
//   Symbols      = == != <> < <= > >= ( ) [ ] , && || !
//   EOF          end-of-input sentinel
//
// "&&", "||" and "!" are returned as KwAnd / KwOr / KwNot.
//
// In lenient mode unknown characters are skipped instead of raising an
// error; this lets the extraction helpers scan free-text conditions.
//
// ============================================================================

#ifndef EDC_LEXER_HPP
#define EDC_LEXER_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace edc {

// ── SourcePos ───────────────────────────────────────────────────────────────
// 1-based line and column, used for error reporting.

struct SourcePos {
    std::uint32_t line   = 1;
    std::uint32_t column = 1;
};

// ── TokenKind ───────────────────────────────────────────────────────────────

enum class TokenKind : std::uint8_t {
    // Literals / identifiers
    Identifier,     // field reference, possibly dotted
    Number,         // decimal literal
    Date,           // YYYY-MM-DD
    String,         // quoted text (quotes removed)

    // Keywords
    KwAnd,
    KwOr,
    KwNot,
    KwIf,
    KwThen,
    KwElse,
    KwIn,
    KwBetween,
    KwIs,
    KwNull,
    KwTrue,
    KwFalse,

    // Comparison operators
    Equal,          // = ==
    NotEqual,       // != <>
    Less,           // <
    LessEq,         // <=
    Greater,        // >
    GreaterEq,      // >=

    // Delimiters
    LParen,
    RParen,
    LBracket,
    RBracket,
    Comma,

    // Sentinel
    Eof
};

/// Human-readable name for debugging.
const char* token_kind_name(TokenKind k) noexcept;

// ── Token ───────────────────────────────────────────────────────────────────

struct Token {
    TokenKind   kind = TokenKind::Eof;
    std::string text;
    SourcePos   pos;
};

// ── Lexer ───────────────────────────────────────────────────────────────────
// Stores the full input and lazily produces tokens via next().
// Errors are reported by throwing std::runtime_error with a formatted
// message that includes line and column.

class Lexer {
public:
    /// Construct a lexer over the given input.
    /// @param source   the full text to tokenise
    /// @param line     the starting line number (default 1)
    /// @param lenient  skip unrecognised characters instead of throwing
    explicit Lexer(std::string_view source, std::uint32_t line = 1,
                   bool lenient = false);

    /// Return the next token.  Repeated calls after EOF keep returning EOF.
    Token next();

    /// Peek at the next token without consuming it.
    const Token& peek();

    /// Current source position (of the next character to be read).
    SourcePos current_pos() const noexcept;

private:
    void  skip_whitespace();
    Token read_identifier_or_keyword();
    Token read_number_or_date();
    Token read_string(char quote);
    Token make_token(TokenKind kind, std::string text, SourcePos pos);
    bool  operand_may_start() const noexcept;
    void  advance(std::size_t n = 1) noexcept;

    [[noreturn]] void error(const std::string& msg) const;

    std::string_view src_;
    std::size_t      idx_ = 0;
    SourcePos        pos_;
    bool             lenient_ = false;
    bool             has_peeked_ = false;
    Token            peeked_;
    TokenKind        prev_kind_ = TokenKind::Eof;  // Eof = nothing emitted yet
};

// ── tokenise ────────────────────────────────────────────────────────────────
// Convenience: tokenise a complete string and return a vector of tokens
// (including the trailing Eof).

std::vector<Token> tokenise(std::string_view source, std::uint32_t line = 1,
                            bool lenient = false);

}  // namespace edc

#endif  // EDC_LEXER_HPP
