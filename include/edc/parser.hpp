// ============================================================================
// edc/parser.hpp — Recursive-descent parser for edit-check conditions
// ============================================================================
//
// Grammar (informal, with precedence already encoded):
//
//   condition   ::= 'IF' condition 'THEN' condition ( 'ELSE' condition )?
//                  | or_expr
//   or_expr     ::= and_expr ( 'OR'  and_expr )*
//   and_expr    ::= not_expr ( 'AND' not_expr )*
//   not_expr    ::= 'NOT' not_expr
//                  | predicate
//   predicate   ::= '(' condition ')'
//                  | operand cmp operand
//                  | operand 'NOT'? 'IN' list
//                  | operand 'BETWEEN' operand 'AND' operand
//                  | operand 'IS' 'NOT'? 'NULL'
//                  | operand                        (boolean field / constant)
//   list        ::= ( '(' | '[' ) operand ( ',' operand )* ( ')' | ']' )
//   operand     ::= IDENTIFIER | NUMBER | DATE | STRING
//                  | 'TRUE' | 'FALSE' | 'NULL'
//
// Precedence (highest → lowest):
//   1. comparisons, IN, BETWEEN, IS NULL
//   2. NOT                           (prefix)
//   3. AND                           (n-ary)
//   4. OR                            (n-ary)
//   5. IF ... THEN ... ELSE          (only at condition level)
//
// ============================================================================

#ifndef EDC_PARSER_HPP
#define EDC_PARSER_HPP

#include "edc/condition.hpp"
#include "edc/lexer.hpp"

#include <string>
#include <vector>

namespace edc {

// ── Parser ──────────────────────────────────────────────────────────────────
// Takes a Lexer and a Condition reference.  Parses exactly one condition
// and returns its ExprId.  Throws std::runtime_error on syntax errors
// with the format: <line>: ERROR: <msg> at column <n>

class Parser {
public:
    Parser(Lexer& lexer, Condition& cond);

    /// Parse a complete condition (expects Eof after).
    ExprId parse();

    /// Parse a condition without requiring Eof.
    ExprId parse_condition();

private:
    ExprId parse_or();
    ExprId parse_and();
    ExprId parse_not();
    ExprId parse_predicate();
    ExprId parse_operand();
    std::vector<ExprId> parse_list();

    bool is_comparison(TokenKind kind) const noexcept;
    bool is_operand_start(TokenKind kind) const noexcept;

    Token expect(TokenKind kind, const std::string& context);
    [[noreturn]] void error(const Token& tok, const std::string& msg);

    Lexer&     lex_;
    Condition& cond_;
};

// ── Convenience free functions ──────────────────────────────────────────────

/// Parse `input` into `cond` and return the new root id (the condition's
/// root is not changed).
ExprId parse_condition(const std::string& input, Condition& cond,
                       std::uint32_t line = 1);

/// Parse `input` into a fresh Condition whose root is set.
Condition compile_condition(const std::string& input);

}  // namespace edc

#endif  // EDC_PARSER_HPP
