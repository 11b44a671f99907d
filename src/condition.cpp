// ============================================================================
// condition.cpp — Expression interning, printing and comparison extraction
// ============================================================================

#include "edc/condition.hpp"
#include "edc/lexer.hpp"
#include "edc/log.hpp"
#include "edc/parser.hpp"
#include "edc/utils.hpp"

#include <algorithm>
#include <functional>
#include <sstream>
#include <stdexcept>

namespace edc {

// ── CompareOp helpers ───────────────────────────────────────────────────────

const char* compare_op_symbol(CompareOp op) noexcept {
    switch (op) {
        case CompareOp::Eq: return "=";
        case CompareOp::Ne: return "!=";
        case CompareOp::Lt: return "<";
        case CompareOp::Le: return "<=";
        case CompareOp::Gt: return ">";
        case CompareOp::Ge: return ">=";
    }
    return "?";
}

std::optional<CompareOp> parse_compare_op(std::string_view text) noexcept {
    if (text == "=" || text == "==") return CompareOp::Eq;
    if (text == "!=" || text == "<>") return CompareOp::Ne;
    if (text == "<")  return CompareOp::Lt;
    if (text == "<=") return CompareOp::Le;
    if (text == ">")  return CompareOp::Gt;
    if (text == ">=") return CompareOp::Ge;
    return std::nullopt;
}

CompareOp mirror(CompareOp op) noexcept {
    switch (op) {
        case CompareOp::Lt: return CompareOp::Gt;
        case CompareOp::Le: return CompareOp::Ge;
        case CompareOp::Gt: return CompareOp::Lt;
        case CompareOp::Ge: return CompareOp::Le;
        default:            return op;
    }
}

CompareOp negate(CompareOp op) noexcept {
    switch (op) {
        case CompareOp::Eq: return CompareOp::Ne;
        case CompareOp::Ne: return CompareOp::Eq;
        case CompareOp::Lt: return CompareOp::Ge;
        case CompareOp::Le: return CompareOp::Gt;
        case CompareOp::Gt: return CompareOp::Le;
        case CompareOp::Ge: return CompareOp::Lt;
    }
    return op;
}

// ── expr_kind_name ──────────────────────────────────────────────────────────

const char* expr_kind_name(ExprKind k) noexcept {
    switch (k) {
        case ExprKind::True:       return "TRUE";
        case ExprKind::False:      return "FALSE";
        case ExprKind::Null:       return "NULL";
        case ExprKind::Field:      return "Field";
        case ExprKind::Number:     return "Number";
        case ExprKind::String:     return "String";
        case ExprKind::Date:       return "Date";
        case ExprKind::Compare:    return "Compare";
        case ExprKind::In:         return "IN";
        case ExprKind::NotIn:      return "NOT IN";
        case ExprKind::Between:    return "BETWEEN";
        case ExprKind::IsNull:     return "IS NULL";
        case ExprKind::IsNotNull:  return "IS NOT NULL";
        case ExprKind::Not:        return "NOT";
        case ExprKind::And:        return "AND";
        case ExprKind::Or:         return "OR";
        case ExprKind::IfThenElse: return "IF";
    }
    return "?";
}

bool is_operand_kind(ExprKind k) noexcept {
    switch (k) {
        case ExprKind::True:
        case ExprKind::False:
        case ExprKind::Null:
        case ExprKind::Field:
        case ExprKind::Number:
        case ExprKind::String:
        case ExprKind::Date:
            return true;
        default:
            return false;
    }
}

// ── ExprNode equality / hash ────────────────────────────────────────────────

bool ExprNode::operator==(const ExprNode& o) const noexcept {
    return kind == o.kind &&
           op == o.op &&
           text == o.text &&
           number == o.number &&
           children == o.children;
}

std::size_t ExprNodeHash::operator()(const ExprNode& n) const noexcept {
    std::size_t h = static_cast<std::size_t>(n.kind);
    h ^= std::hash<int>{}(static_cast<int>(n.op)) + 0x9e3779b9 + (h << 6) + (h >> 2);
    h ^= std::hash<std::string>{}(n.text) + 0x9e3779b9 + (h << 6) + (h >> 2);
    h ^= std::hash<double>{}(n.number) + 0x9e3779b9 + (h << 6) + (h >> 2);
    for (ExprId c : n.children) {
        h ^= std::hash<ExprId>{}(c) + 0x9e3779b9 + (h << 6) + (h >> 2);
    }
    return h;
}

// ── Condition ───────────────────────────────────────────────────────────────

Condition::Condition() {
    // Slots 0 and 1 are always the canonical constants.
    make_true();
    make_false();
}

ExprId Condition::intern(ExprNode node) {
    auto it = intern_.find(node);
    if (it != intern_.end()) {
        return it->second;
    }
    ExprId id = static_cast<ExprId>(nodes_.size());
    nodes_.push_back(std::move(node));
    intern_[nodes_.back()] = id;
    return id;
}

ExprId Condition::make_true() {
    ExprNode n;
    n.kind = ExprKind::True;
    return intern(std::move(n));
}

ExprId Condition::make_false() {
    ExprNode n;
    n.kind = ExprKind::False;
    return intern(std::move(n));
}

ExprId Condition::make_null() {
    ExprNode n;
    n.kind = ExprKind::Null;
    return intern(std::move(n));
}

ExprId Condition::make_field(const std::string& name) {
    ExprNode n;
    n.kind = ExprKind::Field;
    n.text = name;
    return intern(std::move(n));
}

ExprId Condition::make_number(double value, const std::string& text) {
    ExprNode n;
    n.kind = ExprKind::Number;
    n.text = text;
    n.number = value;
    return intern(std::move(n));
}

ExprId Condition::make_string(const std::string& text) {
    ExprNode n;
    n.kind = ExprKind::String;
    n.text = text;
    return intern(std::move(n));
}

ExprId Condition::make_date(std::int64_t days, const std::string& text) {
    ExprNode n;
    n.kind = ExprKind::Date;
    n.text = text;
    n.number = static_cast<double>(days);
    return intern(std::move(n));
}

ExprId Condition::make_compare(CompareOp op, ExprId lhs, ExprId rhs) {
    ExprNode n;
    n.kind = ExprKind::Compare;
    n.op = op;
    n.children = {lhs, rhs};
    return intern(std::move(n));
}

ExprId Condition::make_in(ExprId operand, const std::vector<ExprId>& values, bool negated) {
    ExprNode n;
    n.kind = negated ? ExprKind::NotIn : ExprKind::In;
    n.children.push_back(operand);
    n.children.insert(n.children.end(), values.begin(), values.end());
    return intern(std::move(n));
}

ExprId Condition::make_between(ExprId operand, ExprId low, ExprId high) {
    ExprNode n;
    n.kind = ExprKind::Between;
    n.children = {operand, low, high};
    return intern(std::move(n));
}

ExprId Condition::make_is_null(ExprId operand, bool negated) {
    ExprNode n;
    n.kind = negated ? ExprKind::IsNotNull : ExprKind::IsNull;
    n.children = {operand};
    return intern(std::move(n));
}

ExprId Condition::make_not(ExprId child) {
    ExprNode n;
    n.kind = ExprKind::Not;
    n.children = {child};
    return intern(std::move(n));
}

// Nested nodes of the same kind are spliced in; duplicates are kept so the
// verifier can report them.
ExprId Condition::make_nary(ExprKind kind, const std::vector<ExprId>& children) {
    ExprNode n;
    n.kind = kind;
    for (ExprId c : children) {
        const ExprNode& cn = node(c);
        if (cn.kind == kind) {
            n.children.insert(n.children.end(), cn.children.begin(), cn.children.end());
        } else {
            n.children.push_back(c);
        }
    }
    if (n.children.empty()) {
        return kind == ExprKind::And ? make_true() : make_false();
    }
    if (n.children.size() == 1) {
        return n.children.front();
    }
    return intern(std::move(n));
}

ExprId Condition::make_and(const std::vector<ExprId>& children) {
    return make_nary(ExprKind::And, children);
}

ExprId Condition::make_or(const std::vector<ExprId>& children) {
    return make_nary(ExprKind::Or, children);
}

ExprId Condition::make_if(ExprId cond, ExprId then_branch, ExprId else_branch) {
    ExprNode n;
    n.kind = ExprKind::IfThenElse;
    n.children = {cond, then_branch};
    if (else_branch != kInvalidExpr) {
        n.children.push_back(else_branch);
    }
    return intern(std::move(n));
}

const ExprNode& Condition::node(ExprId id) const {
    if (id >= nodes_.size()) {
        throw std::out_of_range("Condition::node: invalid ExprId " + std::to_string(id));
    }
    return nodes_[id];
}

std::size_t Condition::size() const noexcept {
    return nodes_.size();
}

// ── to_string ───────────────────────────────────────────────────────────────

std::string Condition::to_string(ExprId id) const {
    if (id == kInvalidExpr) return "<none>";
    const ExprNode& n = node(id);

    auto join = [this](const std::vector<ExprId>& ids, std::size_t from, const char* sep) {
        std::string out;
        for (std::size_t i = from; i < ids.size(); ++i) {
            if (i > from) out += sep;
            out += to_string(ids[i]);
        }
        return out;
    };

    switch (n.kind) {
        case ExprKind::True:   return "TRUE";
        case ExprKind::False:  return "FALSE";
        case ExprKind::Null:   return "NULL";
        case ExprKind::Field:  return n.text;
        case ExprKind::Number: return n.text;
        case ExprKind::Date:   return n.text;
        case ExprKind::String: return "'" + n.text + "'";

        case ExprKind::Compare:
            return "(" + to_string(n.children[0]) + " " + compare_op_symbol(n.op) +
                   " " + to_string(n.children[1]) + ")";
        case ExprKind::In:
            return "(" + to_string(n.children[0]) + " IN (" + join(n.children, 1, ", ") + "))";
        case ExprKind::NotIn:
            return "(" + to_string(n.children[0]) + " NOT IN (" + join(n.children, 1, ", ") + "))";
        case ExprKind::Between:
            return "(" + to_string(n.children[0]) + " BETWEEN " + to_string(n.children[1]) +
                   " AND " + to_string(n.children[2]) + ")";
        case ExprKind::IsNull:
            return "(" + to_string(n.children[0]) + " IS NULL)";
        case ExprKind::IsNotNull:
            return "(" + to_string(n.children[0]) + " IS NOT NULL)";
        case ExprKind::Not:
            return "(NOT " + to_string(n.children[0]) + ")";
        case ExprKind::And:
            return "(" + join(n.children, 0, " AND ") + ")";
        case ExprKind::Or:
            return "(" + join(n.children, 0, " OR ") + ")";
        case ExprKind::IfThenElse: {
            std::string out = "(IF " + to_string(n.children[0]) + " THEN " + to_string(n.children[1]);
            if (n.children.size() > 2) out += " ELSE " + to_string(n.children[2]);
            return out + ")";
        }
    }
    return "?";
}

// ── field_references ────────────────────────────────────────────────────────

std::vector<std::string> Condition::field_references(ExprId id) const {
    std::vector<std::string> refs;
    if (id == kInvalidExpr) return refs;

    std::function<void(ExprId)> visit = [&](ExprId e) {
        const ExprNode& n = node(e);
        if (n.kind == ExprKind::Field) {
            if (std::find(refs.begin(), refs.end(), n.text) == refs.end()) {
                refs.push_back(n.text);
            }
            return;
        }
        for (ExprId c : n.children) visit(c);
    };
    visit(id);
    return refs;
}

// ── Comparison ──────────────────────────────────────────────────────────────

static std::string operand_text(const Operand& o) {
    return o.kind == OperandKind::String ? "'" + o.text + "'" : o.text;
}

std::string Comparison::to_string() const {
    return operand_text(lhs) + " " + compare_op_symbol(op) + " " + operand_text(rhs);
}

static Operand to_operand(const ExprNode& n) {
    Operand o;
    switch (n.kind) {
        case ExprKind::Field:  o.kind = OperandKind::Field;   break;
        case ExprKind::Number: o.kind = OperandKind::Number;  break;
        case ExprKind::String: o.kind = OperandKind::String;  break;
        case ExprKind::Date:   o.kind = OperandKind::Date;    break;
        case ExprKind::True:   o.kind = OperandKind::Boolean; o.number = 1.0; break;
        case ExprKind::False:  o.kind = OperandKind::Boolean; o.number = 0.0; break;
        default:               o.kind = OperandKind::Null;    break;
    }
    o.text = n.kind == ExprKind::True ? "TRUE" : n.kind == ExprKind::False ? "FALSE"
           : n.kind == ExprKind::Null ? "NULL" : n.text;
    if (n.kind == ExprKind::Number || n.kind == ExprKind::Date) o.number = n.number;
    return o;
}

static Comparison oriented(Operand lhs, CompareOp op, Operand rhs) {
    if (!lhs.is_field() && rhs.is_field()) {
        return Comparison{std::move(rhs), mirror(op), std::move(lhs)};
    }
    return Comparison{std::move(lhs), op, std::move(rhs)};
}

std::vector<Comparison> comparisons_of(const Condition& cond, ExprId id) {
    std::vector<Comparison> out;
    if (id == kInvalidExpr) return out;

    std::function<void(ExprId)> visit = [&](ExprId e) {
        const ExprNode& n = cond.node(e);
        if (n.kind == ExprKind::Compare) {
            const ExprNode& a = cond.node(n.children[0]);
            const ExprNode& b = cond.node(n.children[1]);
            if (is_operand_kind(a.kind) && is_operand_kind(b.kind)) {
                out.push_back(oriented(to_operand(a), n.op, to_operand(b)));
            }
            return;
        }
        if (n.kind == ExprKind::Between) {
            const ExprNode& x  = cond.node(n.children[0]);
            const ExprNode& lo = cond.node(n.children[1]);
            const ExprNode& hi = cond.node(n.children[2]);
            out.push_back(oriented(to_operand(x), CompareOp::Ge, to_operand(lo)));
            out.push_back(oriented(to_operand(x), CompareOp::Le, to_operand(hi)));
            return;
        }
        for (ExprId c : n.children) visit(c);
    };
    visit(id);
    return out;
}

// ── Lenient scanning ────────────────────────────────────────────────────────

static std::optional<Operand> token_operand(const Token& t) {
    Operand o;
    o.text = t.text;
    switch (t.kind) {
        case TokenKind::Identifier: o.kind = OperandKind::Field;  return o;
        case TokenKind::Number: {
            auto v = parse_number(t.text);
            if (!v) return std::nullopt;
            o.kind = OperandKind::Number;
            o.number = *v;
            return o;
        }
        case TokenKind::String:     o.kind = OperandKind::String; return o;
        case TokenKind::Date: {
            auto days = parse_date(t.text);
            if (!days) return std::nullopt;
            o.kind = OperandKind::Date;
            o.number = static_cast<double>(*days);
            return o;
        }
        case TokenKind::KwTrue:  o.kind = OperandKind::Boolean; o.number = 1.0; return o;
        case TokenKind::KwFalse: o.kind = OperandKind::Boolean; o.number = 0.0; return o;
        case TokenKind::KwNull:  o.kind = OperandKind::Null; return o;
        default:                 return std::nullopt;
    }
}

static std::vector<Comparison> scan_comparisons(const std::vector<Token>& toks) {
    std::vector<Comparison> out;
    for (std::size_t i = 0; i + 2 < toks.size();) {
        auto lhs = token_operand(toks[i]);
        auto op  = parse_compare_op(toks[i + 1].text);
        auto rhs = token_operand(toks[i + 2]);
        if (lhs && op && rhs && (lhs->is_field() || rhs->is_field())) {
            out.push_back(oriented(std::move(*lhs), *op, std::move(*rhs)));
            i += 3;
        } else {
            ++i;
        }
    }
    return out;
}

std::vector<std::string> extract_field_references(std::string_view condition) {
    try {
        Condition cond = compile_condition(std::string(condition));
        return cond.field_references(cond.root());
    } catch (const std::exception& e) {
        log_debug(std::string("field extraction falling back to token scan: ") + e.what());
    }

    // Dotted names anywhere, plus bare names used as comparison operands.
    std::vector<Token> toks = tokenise(condition, 1, true);
    std::vector<std::string> refs;
    auto add = [&refs](const std::string& name) {
        if (std::find(refs.begin(), refs.end(), name) == refs.end()) refs.push_back(name);
    };
    for (std::size_t i = 0; i < toks.size(); ++i) {
        const Token& t = toks[i];
        if (t.kind != TokenKind::Identifier) continue;
        bool dotted = t.text.find('.') != std::string::npos;
        bool compared = (i + 1 < toks.size() && parse_compare_op(toks[i + 1].text)) ||
                        (i > 0 && parse_compare_op(toks[i - 1].text));
        if (dotted || compared) add(t.text);
    }
    return refs;
}

std::vector<Comparison> extract_comparisons(std::string_view condition) {
    try {
        Condition cond = compile_condition(std::string(condition));
        return comparisons_of(cond, cond.root());
    } catch (const std::exception& e) {
        log_debug(std::string("comparison extraction falling back to token scan: ") + e.what());
    }
    return scan_comparisons(tokenise(condition, 1, true));
}

// ── conjunction_of ──────────────────────────────────────────────────────────

static ExprId operand_node(const Operand& o, Condition& cond) {
    switch (o.kind) {
        case OperandKind::Field:   return cond.make_field(o.text);
        case OperandKind::Number:  return cond.make_number(o.number, o.text);
        case OperandKind::String:  return cond.make_string(o.text);
        case OperandKind::Date:    return cond.make_date(static_cast<std::int64_t>(o.number), o.text);
        case OperandKind::Boolean: return o.number != 0.0 ? cond.make_true() : cond.make_false();
        case OperandKind::Null:    return cond.make_null();
    }
    return cond.make_null();
}

ExprId conjunction_of(const std::vector<Comparison>& comparisons, Condition& cond) {
    if (comparisons.empty()) return kInvalidExpr;
    std::vector<ExprId> parts;
    parts.reserve(comparisons.size());
    for (const Comparison& c : comparisons) {
        parts.push_back(cond.make_compare(c.op, operand_node(c.lhs, cond), operand_node(c.rhs, cond)));
    }
    return cond.make_and(parts);
}

}  // namespace edc
