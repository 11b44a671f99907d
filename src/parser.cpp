// ============================================================================
// parser.cpp — Recursive-descent condition parser
// ============================================================================
//
// Implementation notes
// --------------------
//
// The recursive-descent structure mirrors the grammar directly:
//
//   parse()            calls parse_condition() and then expects Eof.
//   parse_condition()  handles IF/THEN/ELSE, otherwise delegates to or.
//   parse_or()         collects OR operands into one n-ary node.
//   parse_and()        collects AND operands into one n-ary node.
//   parse_not()        handles prefix NOT / '!'.
//   parse_predicate()  handles parentheses and every operand-led form.
//
// BETWEEN consumes its own AND, so "x BETWEEN 1 AND 5 AND y = 2" parses as
// a two-clause conjunction.
//
// ============================================================================

#include "edc/parser.hpp"
#include "edc/utils.hpp"

#include <stdexcept>

namespace edc {

Parser::Parser(Lexer& lexer, Condition& cond)
    : lex_(lexer), cond_(cond) {}

// ── Error helpers ───────────────────────────────────────────────────────────

void Parser::error(const Token& tok, const std::string& msg) {
    throw std::runtime_error(
        std::to_string(tok.pos.line) + ": ERROR: " + msg +
        " at column " + std::to_string(tok.pos.column));
}

Token Parser::expect(TokenKind kind, const std::string& context) {
    Token t = lex_.next();
    if (t.kind != kind) {
        error(t, "expected " + std::string(token_kind_name(kind)) +
                 " " + context + ", got '" + t.text + "'");
    }
    return t;
}

bool Parser::is_comparison(TokenKind kind) const noexcept {
    switch (kind) {
        case TokenKind::Equal:
        case TokenKind::NotEqual:
        case TokenKind::Less:
        case TokenKind::LessEq:
        case TokenKind::Greater:
        case TokenKind::GreaterEq:
            return true;
        default:
            return false;
    }
}

bool Parser::is_operand_start(TokenKind kind) const noexcept {
    switch (kind) {
        case TokenKind::Identifier:
        case TokenKind::Number:
        case TokenKind::Date:
        case TokenKind::String:
        case TokenKind::KwTrue:
        case TokenKind::KwFalse:
        case TokenKind::KwNull:
            return true;
        default:
            return false;
    }
}

// ── parse ───────────────────────────────────────────────────────────────────

ExprId Parser::parse() {
    ExprId e = parse_condition();
    const Token& t = lex_.peek();
    if (t.kind != TokenKind::Eof) {
        error(t, "unexpected token '" + t.text + "' after condition");
    }
    return e;
}

// ── parse_condition ─────────────────────────────────────────────────────────
// condition ::= 'IF' condition 'THEN' condition ('ELSE' condition)? | or_expr

ExprId Parser::parse_condition() {
    if (lex_.peek().kind != TokenKind::KwIf) {
        return parse_or();
    }
    lex_.next();  // consume IF
    ExprId guard = parse_condition();
    expect(TokenKind::KwThen, "after IF condition");
    ExprId then_branch = parse_condition();
    ExprId else_branch = kInvalidExpr;
    if (lex_.peek().kind == TokenKind::KwElse) {
        lex_.next();
        else_branch = parse_condition();
    }
    return cond_.make_if(guard, then_branch, else_branch);
}

// ── parse_or / parse_and ────────────────────────────────────────────────────

ExprId Parser::parse_or() {
    std::vector<ExprId> parts{parse_and()};
    while (lex_.peek().kind == TokenKind::KwOr) {
        lex_.next();
        parts.push_back(parse_and());
    }
    return parts.size() == 1 ? parts.front() : cond_.make_or(parts);
}

ExprId Parser::parse_and() {
    std::vector<ExprId> parts{parse_not()};
    while (lex_.peek().kind == TokenKind::KwAnd) {
        lex_.next();
        parts.push_back(parse_not());
    }
    return parts.size() == 1 ? parts.front() : cond_.make_and(parts);
}

// ── parse_not ───────────────────────────────────────────────────────────────

ExprId Parser::parse_not() {
    if (lex_.peek().kind == TokenKind::KwNot) {
        lex_.next();
        return cond_.make_not(parse_not());
    }
    return parse_predicate();
}

// ── parse_operand ───────────────────────────────────────────────────────────

ExprId Parser::parse_operand() {
    Token t = lex_.next();
    switch (t.kind) {
        case TokenKind::Identifier:
            return cond_.make_field(t.text);
        case TokenKind::Number: {
            auto v = parse_number(t.text);
            if (!v) error(t, "number out of range '" + t.text + "'");
            return cond_.make_number(*v, t.text);
        }
        case TokenKind::Date: {
            auto days = parse_date(t.text);
            if (!days) error(t, "invalid date '" + t.text + "'");
            return cond_.make_date(*days, t.text);
        }
        case TokenKind::String:
            return cond_.make_string(t.text);
        case TokenKind::KwTrue:
            return cond_.make_true();
        case TokenKind::KwFalse:
            return cond_.make_false();
        case TokenKind::KwNull:
            return cond_.make_null();
        default:
            error(t, "expected operand, got '" + t.text + "'");
    }
}

// ── parse_list ──────────────────────────────────────────────────────────────

std::vector<ExprId> Parser::parse_list() {
    Token open = lex_.next();
    if (open.kind != TokenKind::LParen && open.kind != TokenKind::LBracket) {
        error(open, "expected value list after IN, got '" + open.text + "'");
    }
    const TokenKind close =
        open.kind == TokenKind::LParen ? TokenKind::RParen : TokenKind::RBracket;

    std::vector<ExprId> values{parse_operand()};
    while (lex_.peek().kind == TokenKind::Comma) {
        lex_.next();
        values.push_back(parse_operand());
    }
    expect(close, "to close value list");
    return values;
}

// ── parse_predicate ─────────────────────────────────────────────────────────

ExprId Parser::parse_predicate() {
    const Token& head = lex_.peek();

    if (head.kind == TokenKind::LParen) {
        lex_.next();
        ExprId inner = parse_condition();
        expect(TokenKind::RParen, "to close parenthesised condition");
        return inner;
    }

    if (!is_operand_start(head.kind)) {
        Token t = lex_.next();
        error(t, "expected condition, got '" + t.text + "'");
    }

    ExprId lhs = parse_operand();
    const Token& t = lex_.peek();

    if (is_comparison(t.kind)) {
        Token op_tok = lex_.next();
        auto op = parse_compare_op(op_tok.text);
        if (!op) error(op_tok, "unknown comparison '" + op_tok.text + "'");
        ExprId rhs = parse_operand();
        return cond_.make_compare(*op, lhs, rhs);
    }

    switch (t.kind) {
        case TokenKind::KwIn:
            lex_.next();
            return cond_.make_in(lhs, parse_list(), false);

        case TokenKind::KwNot: {
            Token not_tok = lex_.next();
            if (lex_.peek().kind != TokenKind::KwIn) {
                error(not_tok, "expected IN after NOT");
            }
            lex_.next();
            return cond_.make_in(lhs, parse_list(), true);
        }

        case TokenKind::KwBetween: {
            lex_.next();
            ExprId low = parse_operand();
            expect(TokenKind::KwAnd, "inside BETWEEN");
            ExprId high = parse_operand();
            return cond_.make_between(lhs, low, high);
        }

        case TokenKind::KwIs: {
            lex_.next();
            bool negated = false;
            if (lex_.peek().kind == TokenKind::KwNot) {
                lex_.next();
                negated = true;
            }
            expect(TokenKind::KwNull, "after IS");
            return cond_.make_is_null(lhs, negated);
        }

        default:
            break;
    }

    // Bare operand: a boolean field or a constant.
    const ExprNode& n = cond_.node(lhs);
    if (n.kind == ExprKind::Field) {
        return cond_.make_compare(CompareOp::Eq, lhs, cond_.make_true());
    }
    if (n.kind == ExprKind::True || n.kind == ExprKind::False) {
        return lhs;
    }
    error(t, "expected comparison after '" + cond_.to_string(lhs) + "'");
}

// ── Convenience ─────────────────────────────────────────────────────────────

ExprId parse_condition(const std::string& input, Condition& cond, std::uint32_t line) {
    Lexer lex(input, line);
    Parser parser(lex, cond);
    return parser.parse();
}

Condition compile_condition(const std::string& input) {
    Condition cond;
    cond.set_root(parse_condition(input, cond));
    return cond;
}

}  // namespace edc
