// ============================================================================
// evaluator.cpp — Direct evaluation of a condition on concrete data
// ============================================================================

#include "edc/evaluator.hpp"
#include "edc/log.hpp"
#include "edc/parser.hpp"
#include "edc/utils.hpp"

#include <cmath>

namespace edc {

Evaluator::Evaluator(const Specification& spec, std::vector<std::string> preferred_forms)
    : spec_(spec), preferred_forms_(std::move(preferred_forms)) {}

// ── Conversions ─────────────────────────────────────────────────────────────

static std::optional<double> to_number(const Value& v) {
    if (const double* d = std::get_if<double>(&v)) return *d;
    if (const std::string* s = std::get_if<std::string>(&v)) return parse_number(trim(*s));
    return std::nullopt;
}

static std::optional<std::int64_t> to_days(const Value& v) {
    if (const std::string* s = std::get_if<std::string>(&v)) return parse_date(trim(*s));
    return std::nullopt;
}

static std::optional<bool> to_bool(const Value& v) {
    if (const bool* b = std::get_if<bool>(&v)) return *b;
    if (const std::string* s = std::get_if<std::string>(&v)) {
        if (iequals(*s, "true"))  return true;
        if (iequals(*s, "false")) return false;
    }
    return std::nullopt;
}

static bool is_nan(const Value& v) {
    const double* d = std::get_if<double>(&v);
    return d && std::isnan(*d);
}

static FieldType infer_type(const Value& a, const Value& b) {
    auto has = [&](auto pred) { return pred(a) || pred(b); };
    if (has([](const Value& v) { return std::holds_alternative<double>(v); })) return FieldType::Numeric;
    if (has([](const Value& v) { return std::holds_alternative<bool>(v); }))   return FieldType::Boolean;
    if (to_days(a) && to_days(b)) return FieldType::Date;
    return FieldType::Text;
}

// ── Operands ────────────────────────────────────────────────────────────────

Value Evaluator::operand_value(const Condition& cond, ExprId id, const TestData& data) const {
    const ExprNode& n = cond.node(id);
    switch (n.kind) {
        case ExprKind::Field: {
            auto path = field_path_of(n.text, spec_, preferred_forms_);
            if (!path) return Value{};
            const Value* v = find_value(data, *path);
            return v ? *v : Value{};
        }
        case ExprKind::Number: return Value{n.number};
        case ExprKind::String: return Value{n.text};
        case ExprKind::Date:   return Value{format_date(static_cast<std::int64_t>(n.number))};
        case ExprKind::True:   return Value{true};
        case ExprKind::False:  return Value{false};
        default:               return Value{};
    }
}

std::optional<FieldType> Evaluator::context_of(const Condition& cond, ExprId a, ExprId b) const {
    for (ExprId id : {a, b}) {
        const ExprNode& n = cond.node(id);
        if (n.kind != ExprKind::Field) continue;
        if (const Field* f = spec_.lookup(n.text, preferred_forms_)) return f->type;
    }
    for (ExprId id : {a, b}) {
        const ExprNode& n = cond.node(id);
        switch (n.kind) {
            case ExprKind::Number: return FieldType::Numeric;
            case ExprKind::Date:   return FieldType::Date;
            case ExprKind::True:
            case ExprKind::False:  return FieldType::Boolean;
            case ExprKind::String:
                if (parse_date(n.text)) return FieldType::Date;
                break;
            default:
                break;
        }
    }
    return std::nullopt;
}

// ── compare ─────────────────────────────────────────────────────────────────

bool Evaluator::compare(CompareOp op, const Value& a, const Value& b,
                        std::optional<FieldType> context) const {
    const bool a_null = is_null(a);
    const bool b_null = is_null(b);
    if (a_null || b_null) {
        if (op == CompareOp::Eq) return a_null && b_null;
        if (op == CompareOp::Ne) return !(a_null && b_null);
        return false;
    }

    // Unconvertible operands: only "!=" holds.
    const bool mismatch = op == CompareOp::Ne;
    if (is_nan(a) || is_nan(b)) return mismatch;

    const FieldType t = context ? *context : infer_type(a, b);

    if (t == FieldType::Numeric) {
        auto x = to_number(a);
        auto y = to_number(b);
        if (!x || !y) return mismatch;
        return apply_compare(op, *x, *y);
    }
    if (is_temporal(t)) {
        auto x = to_days(a);
        auto y = to_days(b);
        if (!x || !y) return mismatch;
        return apply_compare(op, *x, *y);
    }
    if (t == FieldType::Boolean) {
        auto x = to_bool(a);
        auto y = to_bool(b);
        if (!x || !y) return mismatch;
        if (op != CompareOp::Eq && op != CompareOp::Ne) return false;
        return apply_compare(op, *x, *y);
    }

    if (std::holds_alternative<bool>(a) || std::holds_alternative<bool>(b)) return mismatch;
    return apply_compare(op, value_to_string(a), value_to_string(b));
}

bool Evaluator::compare_nodes(const Condition& cond, CompareOp op, ExprId a, ExprId b,
                              const TestData& data) const {
    return compare(op, operand_value(cond, a, data), operand_value(cond, b, data),
                   context_of(cond, a, b));
}

// ── evaluate ────────────────────────────────────────────────────────────────

std::optional<bool> Evaluator::evaluate(const Condition& cond, const TestData& data) const {
    if (!cond.has_root()) return std::nullopt;
    return evaluate(cond, cond.root(), data);
}

std::optional<bool> Evaluator::evaluate(const Condition& cond, ExprId id, const TestData& data) const {
    const ExprNode& n = cond.node(id);

    switch (n.kind) {
        case ExprKind::True:  return true;
        case ExprKind::False: return false;

        case ExprKind::Field: {
            auto b = to_bool(operand_value(cond, id, data));
            return b.value_or(false);
        }

        case ExprKind::Compare:
            return compare_nodes(cond, n.op, n.children[0], n.children[1], data);

        case ExprKind::In:
        case ExprKind::NotIn: {
            bool any = false;
            for (std::size_t i = 1; i < n.children.size() && !any; ++i) {
                any = compare_nodes(cond, CompareOp::Eq, n.children[0], n.children[i], data);
            }
            return n.kind == ExprKind::In ? any : !any;
        }

        case ExprKind::Between:
            return compare_nodes(cond, CompareOp::Ge, n.children[0], n.children[1], data) &&
                   compare_nodes(cond, CompareOp::Le, n.children[0], n.children[2], data);

        case ExprKind::IsNull:
        case ExprKind::IsNotNull: {
            const bool null = is_null(operand_value(cond, n.children[0], data));
            return n.kind == ExprKind::IsNull ? null : !null;
        }

        case ExprKind::Not: {
            auto r = evaluate(cond, n.children[0], data);
            if (!r) return std::nullopt;
            return !*r;
        }

        case ExprKind::And:
        case ExprKind::Or: {
            const bool is_and = n.kind == ExprKind::And;
            bool acc = is_and;
            for (ExprId c : n.children) {
                auto r = evaluate(cond, c, data);
                if (!r) return std::nullopt;
                acc = is_and ? (acc && *r) : (acc || *r);
            }
            return acc;
        }

        case ExprKind::IfThenElse: {
            auto guard = evaluate(cond, n.children[0], data);
            if (!guard) return std::nullopt;
            if (*guard) return evaluate(cond, n.children[1], data);
            if (n.children.size() > 2) return evaluate(cond, n.children[2], data);
            return true;
        }

        case ExprKind::Null:
        case ExprKind::Number:
        case ExprKind::String:
        case ExprKind::Date:
            break;
    }
    return std::nullopt;
}

// ── evaluate_rule ───────────────────────────────────────────────────────────

std::optional<bool> evaluate_rule(const Rule& rule, const Specification& spec, const TestData& data) {
    Condition cond;
    try {
        cond = compile_condition(rule.working_condition());
    } catch (const std::exception& e) {
        log_debug("rule " + rule.id + " cannot be evaluated directly: " + e.what());
        return std::nullopt;
    }
    return Evaluator(spec, rule_forms(rule, spec)).evaluate(cond, data);
}

}  // namespace edc
