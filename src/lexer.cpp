// ============================================================================
// lexer.cpp — Condition tokeniser implementation
// ============================================================================

#include "edc/lexer.hpp"
#include "edc/utils.hpp"

#include <cctype>
#include <stdexcept>

namespace edc {

// ── token_kind_name ─────────────────────────────────────────────────────────

const char* token_kind_name(TokenKind k) noexcept {
    switch (k) {
        case TokenKind::Identifier: return "Identifier";
        case TokenKind::Number:     return "Number";
        case TokenKind::Date:       return "Date";
        case TokenKind::String:     return "String";
        case TokenKind::KwAnd:      return "AND";
        case TokenKind::KwOr:       return "OR";
        case TokenKind::KwNot:      return "NOT";
        case TokenKind::KwIf:       return "IF";
        case TokenKind::KwThen:     return "THEN";
        case TokenKind::KwElse:     return "ELSE";
        case TokenKind::KwIn:       return "IN";
        case TokenKind::KwBetween:  return "BETWEEN";
        case TokenKind::KwIs:       return "IS";
        case TokenKind::KwNull:     return "NULL";
        case TokenKind::KwTrue:     return "TRUE";
        case TokenKind::KwFalse:    return "FALSE";
        case TokenKind::Equal:      return "'='";
        case TokenKind::NotEqual:   return "'!='";
        case TokenKind::Less:       return "'<'";
        case TokenKind::LessEq:     return "'<='";
        case TokenKind::Greater:    return "'>'";
        case TokenKind::GreaterEq:  return "'>='";
        case TokenKind::LParen:     return "'('";
        case TokenKind::RParen:     return "')'";
        case TokenKind::LBracket:   return "'['";
        case TokenKind::RBracket:   return "']'";
        case TokenKind::Comma:      return "','";
        case TokenKind::Eof:        return "EOF";
    }
    return "?";
}

// ── Lexer ───────────────────────────────────────────────────────────────────

Lexer::Lexer(std::string_view source, std::uint32_t line, bool lenient)
    : src_(source), lenient_(lenient) {
    pos_.line = line;
    pos_.column = 1;
}

SourcePos Lexer::current_pos() const noexcept {
    return pos_;
}

Token Lexer::make_token(TokenKind kind, std::string text, SourcePos pos) {
    prev_kind_ = kind;
    return Token{kind, std::move(text), pos};
}

void Lexer::advance(std::size_t n) noexcept {
    idx_ += n;
    pos_.column += static_cast<std::uint32_t>(n);
}

void Lexer::error(const std::string& msg) const {
    // Format: <line>: ERROR: <message> at column <n>
    throw std::runtime_error(
        std::to_string(pos_.line) + ": ERROR: " + msg +
        " at column " + std::to_string(pos_.column));
}

// A leading '-' belongs to a number only where an operand can begin.
bool Lexer::operand_may_start() const noexcept {
    switch (prev_kind_) {
        case TokenKind::Identifier:
        case TokenKind::Number:
        case TokenKind::Date:
        case TokenKind::String:
        case TokenKind::KwNull:
        case TokenKind::KwTrue:
        case TokenKind::KwFalse:
        case TokenKind::RParen:
        case TokenKind::RBracket:
            return false;
        default:
            return true;
    }
}

// ── skip_whitespace ─────────────────────────────────────────────────────────

void Lexer::skip_whitespace() {
    while (idx_ < src_.size()) {
        char c = src_[idx_];
        if (c == '\n') {
            ++idx_;
            pos_.line++;
            pos_.column = 1;
        } else if (std::isspace(static_cast<unsigned char>(c))) {
            advance();
        } else {
            break;
        }
    }
}

// ── read_identifier_or_keyword ──────────────────────────────────────────────

Token Lexer::read_identifier_or_keyword() {
    SourcePos start = pos_;
    std::size_t begin = idx_;

    auto is_ident_char = [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
    };

    while (idx_ < src_.size() && is_ident_char(src_[idx_])) advance();

    // Dotted continuation: "Form.Field" (the segment must start like a name).
    bool dotted = false;
    while (idx_ + 1 < src_.size() && src_[idx_] == '.' &&
           (std::isalpha(static_cast<unsigned char>(src_[idx_ + 1])) || src_[idx_ + 1] == '_')) {
        dotted = true;
        advance();
        while (idx_ < src_.size() && is_ident_char(src_[idx_])) advance();
    }

    std::string text(src_.substr(begin, idx_ - begin));
    if (dotted) {
        return make_token(TokenKind::Identifier, std::move(text), start);
    }

    const std::string upper = to_upper(text);
    TokenKind kind = TokenKind::Identifier;

    if (upper == "AND")          kind = TokenKind::KwAnd;
    else if (upper == "OR")      kind = TokenKind::KwOr;
    else if (upper == "NOT")     kind = TokenKind::KwNot;
    else if (upper == "IF")      kind = TokenKind::KwIf;
    else if (upper == "THEN")    kind = TokenKind::KwThen;
    else if (upper == "ELSE")    kind = TokenKind::KwElse;
    else if (upper == "IN")      kind = TokenKind::KwIn;
    else if (upper == "BETWEEN") kind = TokenKind::KwBetween;
    else if (upper == "IS")      kind = TokenKind::KwIs;
    else if (upper == "NULL")    kind = TokenKind::KwNull;
    else if (upper == "TRUE")    kind = TokenKind::KwTrue;
    else if (upper == "FALSE")   kind = TokenKind::KwFalse;

    return make_token(kind, std::move(text), start);
}

// ── read_number_or_date ─────────────────────────────────────────────────────
// Either YYYY-MM-DD or -?digits(.digits)?.

Token Lexer::read_number_or_date() {
    SourcePos start = pos_;
    std::size_t begin = idx_;

    if (src_[idx_] != '-' && idx_ + 10 <= src_.size()) {
        std::string_view candidate = src_.substr(idx_, 10);
        bool after_ok = idx_ + 10 == src_.size() ||
                        !std::isalnum(static_cast<unsigned char>(src_[idx_ + 10]));
        if (after_ok && parse_date(candidate)) {
            advance(10);
            return make_token(TokenKind::Date, std::string(candidate), start);
        }
    }

    if (src_[idx_] == '-') advance();
    while (idx_ < src_.size() && std::isdigit(static_cast<unsigned char>(src_[idx_]))) advance();
    if (idx_ + 1 < src_.size() && src_[idx_] == '.' &&
        std::isdigit(static_cast<unsigned char>(src_[idx_ + 1]))) {
        advance();
        while (idx_ < src_.size() && std::isdigit(static_cast<unsigned char>(src_[idx_]))) advance();
    }

    std::string text(src_.substr(begin, idx_ - begin));
    return make_token(TokenKind::Number, std::move(text), start);
}

// ── read_string ─────────────────────────────────────────────────────────────

Token Lexer::read_string(char quote) {
    SourcePos start = pos_;
    advance();  // opening quote
    std::size_t begin = idx_;

    while (idx_ < src_.size() && src_[idx_] != quote) {
        if (src_[idx_] == '\n') break;
        advance();
    }

    std::string text(src_.substr(begin, idx_ - begin));
    if (idx_ >= src_.size() || src_[idx_] != quote) {
        if (!lenient_) error("unterminated string literal");
    } else {
        advance();  // closing quote
    }
    return make_token(TokenKind::String, std::move(text), start);
}

// ── next ────────────────────────────────────────────────────────────────────

Token Lexer::next() {
    if (has_peeked_) {
        has_peeked_ = false;
        return std::move(peeked_);
    }

    for (;;) {
        skip_whitespace();

        if (idx_ >= src_.size()) {
            return make_token(TokenKind::Eof, "", pos_);
        }

        SourcePos start = pos_;
        char c = src_[idx_];
        char c2 = idx_ + 1 < src_.size() ? src_[idx_ + 1] : '\0';

        // ── single-character tokens ─────────────────────────────────────
        if (c == '(') { advance(); return make_token(TokenKind::LParen,   "(", start); }
        if (c == ')') { advance(); return make_token(TokenKind::RParen,   ")", start); }
        if (c == '[') { advance(); return make_token(TokenKind::LBracket, "[", start); }
        if (c == ']') { advance(); return make_token(TokenKind::RBracket, "]", start); }
        if (c == ',') { advance(); return make_token(TokenKind::Comma,    ",", start); }

        // ── operators ───────────────────────────────────────────────────
        if (c == '=') {
            advance(c2 == '=' ? 2 : 1);
            return make_token(TokenKind::Equal, "=", start);
        }
        if (c == '!') {
            if (c2 == '=') { advance(2); return make_token(TokenKind::NotEqual, "!=", start); }
            advance();
            return make_token(TokenKind::KwNot, "!", start);
        }
        if (c == '<') {
            if (c2 == '=') { advance(2); return make_token(TokenKind::LessEq,   "<=", start); }
            if (c2 == '>') { advance(2); return make_token(TokenKind::NotEqual, "!=", start); }
            advance();
            return make_token(TokenKind::Less, "<", start);
        }
        if (c == '>') {
            if (c2 == '=') { advance(2); return make_token(TokenKind::GreaterEq, ">=", start); }
            advance();
            return make_token(TokenKind::Greater, ">", start);
        }
        if (c == '&' && c2 == '&') { advance(2); return make_token(TokenKind::KwAnd, "&&", start); }
        if (c == '|' && c2 == '|') { advance(2); return make_token(TokenKind::KwOr,  "||", start); }

        // ── literals ────────────────────────────────────────────────────
        if (c == '\'' || c == '"') {
            return read_string(c);
        }
        if (std::isdigit(static_cast<unsigned char>(c)) ||
            (c == '-' && std::isdigit(static_cast<unsigned char>(c2)) && operand_may_start())) {
            return read_number_or_date();
        }

        // ── identifiers / keywords ──────────────────────────────────────
        if (std::isalpha(static_cast<unsigned char>(c)) || c == '_') {
            return read_identifier_or_keyword();
        }

        if (!lenient_) {
            error(std::string("unexpected character '") + c + "'");
        }
        advance();
    }
}

// ── peek ────────────────────────────────────────────────────────────────────

const Token& Lexer::peek() {
    if (!has_peeked_) {
        peeked_ = next();
        has_peeked_ = true;
    }
    return peeked_;
}

// ── tokenise (convenience) ──────────────────────────────────────────────────

std::vector<Token> tokenise(std::string_view source, std::uint32_t line, bool lenient) {
    Lexer lex(source, line, lenient);
    std::vector<Token> toks;
    for (;;) {
        Token t = lex.next();
        toks.push_back(t);
        if (t.kind == TokenKind::Eof) break;
    }
    return toks;
}

}  // namespace edc
