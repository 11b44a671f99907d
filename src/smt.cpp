// ============================================================================
// smt.cpp — Z3 condition encoder and solver session
// ============================================================================

#include "edc/smt.hpp"
#include "edc/log.hpp"
#include "edc/utils.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>

namespace edc {

const char* smt_result_name(SmtResult r) noexcept {
    switch (r) {
        case SmtResult::Sat:     return "sat";
        case SmtResult::Unsat:   return "unsat";
        case SmtResult::Unknown: return "unknown";
    }
    return "?";
}

// Z3 numerals must be plain decimals: no exponent, no "inf".
static std::string decimal_text(double v) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(9) << v;
    std::string s = oss.str();
    if (s.find('.') != std::string::npos) {
        while (s.back() == '0') s.pop_back();
        if (s.back() == '.') s.pop_back();
    }
    if (s == "-0") s = "0";
    return s;
}

// ── SolverSession ───────────────────────────────────────────────────────────

SolverSession::SolverSession(const Specification& spec,
                             std::vector<std::string> preferred_forms,
                             unsigned timeout_ms)
    : spec_(spec), preferred_forms_(std::move(preferred_forms)), ctx_(), solver_(ctx_) {
    if (timeout_ms > 0) {
        solver_.set("timeout", timeout_ms);
    }
}

SolverSession::Scope::Scope(SolverSession& session)
    : session_(session), depth_(Z3_solver_get_num_scopes(session.solver_.ctx(), session.solver_)) {
    session_.solver_.push();
}

SolverSession::Scope::~Scope() {
    try {
        const unsigned now = Z3_solver_get_num_scopes(session_.solver_.ctx(), session_.solver_);
        if (now > depth_) session_.solver_.pop(now - depth_);
    } catch (const z3::exception& e) {
        log_error(std::string("solver pop failed: ") + e.msg());
    }
}

// ── Names and types ─────────────────────────────────────────────────────────

std::string SolverSession::canonical(const std::string& ref) const {
    auto p = spec_.resolve(ref, preferred_forms_);
    return p ? p->ref() : ref;
}

FieldType SolverSession::type_of(const std::string& ref) const {
    if (const Field* f = spec_.lookup(ref, preferred_forms_)) {
        return f->type;
    }
    auto it = inferred_.find(canonical(ref));
    return it != inferred_.end() ? it->second : FieldType::Numeric;
}

z3::expr SolverSession::variable(const std::string& ref) {
    const std::string key = canonical(ref);
    auto it = vars_.find(key);
    if (it != vars_.end()) {
        return *it->second;
    }

    const FieldType t = type_of(ref);
    std::unique_ptr<z3::expr> var;
    if (t == FieldType::Numeric) {
        var = std::make_unique<z3::expr>(ctx_.real_const(key.c_str()));
    } else if (is_temporal(t)) {
        var = std::make_unique<z3::expr>(ctx_.int_const(key.c_str()));
    } else if (t == FieldType::Boolean) {
        var = std::make_unique<z3::expr>(ctx_.bool_const(key.c_str()));
    } else {
        var = std::make_unique<z3::expr>(ctx_.constant(key.c_str(), ctx_.string_sort()));
    }

    z3::expr result = *var;
    vars_[key] = std::move(var);
    order_.push_back(key);
    return result;
}

z3::expr SolverSession::null_value(const std::string& ref) {
    const FieldType t = type_of(ref);
    if (t == FieldType::Numeric) return number(kNumericNull);
    if (is_temporal(t))          return ctx_.int_val(kDateNull);
    if (is_textual(t))           return ctx_.string_val(kTextNull);
    throw EncodeError("boolean field '" + ref + "' cannot be NULL");
}

z3::expr SolverSession::number(double v) {
    if (!std::isfinite(v)) {
        throw EncodeError("non-finite numeric value " + format_number(v));
    }
    return ctx_.real_val(decimal_text(v).c_str());
}

z3::expr SolverSession::literal(const std::string& ref, const Value& v) {
    if (is_null(v)) return null_value(ref);

    const FieldType t = type_of(ref);
    const std::string shown = value_to_string(v);

    if (const bool* b = std::get_if<bool>(&v)) {
        if (t == FieldType::Boolean) return ctx_.bool_val(*b);
        throw EncodeError("boolean value for " + std::string(field_type_name(t)) + " field '" + ref + "'");
    }

    if (const double* d = std::get_if<double>(&v)) {
        if (t == FieldType::Numeric) return number(*d);
        if (is_textual(t))           return ctx_.string_val(format_number(*d));
        throw EncodeError("numeric value " + shown + " for " +
                          field_type_name(t) + " field '" + ref + "'");
    }

    const std::string& s = std::get<std::string>(v);
    if (is_textual(t)) return ctx_.string_val(s);
    if (t == FieldType::Numeric) {
        if (auto n = parse_number(s)) return number(*n);
    } else if (is_temporal(t)) {
        if (auto days = parse_date(s)) return ctx_.int_val(*days);
    } else if (iequals(s, "true") || iequals(s, "false")) {
        return ctx_.bool_val(iequals(s, "true"));
    }
    throw EncodeError("value '" + s + "' is not a valid " + field_type_name(t) +
                      " for field '" + ref + "'");
}

z3::expr SolverSession::domain(const std::string& exclude) {
    z3::expr_vector parts(ctx_);
    for (const std::string& name : order_) {
        if (name == exclude) continue;
        const Field* f = spec_.lookup(name, preferred_forms_);
        if (!f) continue;
        z3::expr v = *vars_.at(name);

        if (f->type == FieldType::Numeric) {
            if (f->min_value) parts.push_back(v >= number(*f->min_value));
            if (f->max_value) parts.push_back(v <= number(*f->max_value));
        } else if (is_temporal(f->type)) {
            if (f->min_value) parts.push_back(v >= ctx_.int_val(static_cast<std::int64_t>(*f->min_value)));
            if (f->max_value) parts.push_back(v <= ctx_.int_val(static_cast<std::int64_t>(*f->max_value)));
        } else if (f->type == FieldType::Categorical && !f->valid_values.empty()) {
            z3::expr_vector alts(ctx_);
            for (const std::string& vv : f->valid_values) {
                alts.push_back(v == ctx_.string_val(vv));
            }
            parts.push_back(z3::mk_or(alts));
        }
    }
    return z3::mk_and(parts);
}

// ── Type inference for undeclared fields ────────────────────────────────────

void SolverSession::infer_from(const Condition& cond, ExprId field, ExprId other) {
    const std::string key = canonical(cond.node(field).text);
    if (spec_.lookup(key, preferred_forms_) || inferred_.count(key)) return;

    const ExprNode& o = cond.node(other);
    switch (o.kind) {
        case ExprKind::Number: inferred_[key] = FieldType::Numeric; break;
        case ExprKind::Date:   inferred_[key] = FieldType::Date; break;
        case ExprKind::True:
        case ExprKind::False:  inferred_[key] = FieldType::Boolean; break;
        case ExprKind::String:
            inferred_[key] = parse_date(o.text) ? FieldType::Date : FieldType::Text;
            break;
        case ExprKind::Field: {
            const std::string other_key = canonical(o.text);
            if (spec_.lookup(other_key, preferred_forms_) || inferred_.count(other_key)) {
                inferred_[key] = type_of(other_key);
            }
            break;
        }
        default:
            break;
    }
}

void SolverSession::infer_types(const Condition& cond) {
    // Two sweeps so that field-to-field comparisons pick up a type inferred
    // from a literal elsewhere in the condition.
    for (int sweep = 0; sweep < 2; ++sweep) {
        for (ExprId id = 0; id < cond.size(); ++id) {
            const ExprNode& n = cond.node(id);
            if (n.kind != ExprKind::Compare && n.kind != ExprKind::In &&
                n.kind != ExprKind::NotIn && n.kind != ExprKind::Between) {
                continue;
            }
            const ExprId x = n.children[0];
            for (std::size_t i = 1; i < n.children.size(); ++i) {
                const ExprId y = n.children[i];
                if (cond.node(x).kind == ExprKind::Field) infer_from(cond, x, y);
                if (n.kind == ExprKind::Compare && cond.node(y).kind == ExprKind::Field) {
                    infer_from(cond, y, x);
                }
            }
        }
    }
}

// ── Encoding ────────────────────────────────────────────────────────────────

z3::expr SolverSession::encode(const Condition& cond) {
    if (!cond.has_root()) {
        throw EncodeError("condition has no root");
    }
    return encode(cond, cond.root());
}

z3::expr SolverSession::encode(const Condition& cond, ExprId id) {
    infer_types(cond);
    try {
        return encode_node(cond, id);
    } catch (const z3::exception& e) {
        throw EncodeError(std::string("solver rejected condition: ") + e.msg());
    }
}

FieldType SolverSession::context_type(const Condition& cond, ExprId a, ExprId b) const {
    const ExprNode& na = cond.node(a);
    const ExprNode& nb = cond.node(b);
    if (na.kind == ExprKind::Field) return type_of(na.text);
    if (nb.kind == ExprKind::Field) return type_of(nb.text);

    auto kind_is = [&](ExprKind k) { return na.kind == k || nb.kind == k; };
    if (kind_is(ExprKind::Number)) return FieldType::Numeric;
    if (kind_is(ExprKind::Date))   return FieldType::Date;
    if (kind_is(ExprKind::True) || kind_is(ExprKind::False)) return FieldType::Boolean;
    if (na.kind == ExprKind::String && nb.kind == ExprKind::String &&
        parse_date(na.text) && parse_date(nb.text)) {
        return FieldType::Date;
    }
    return FieldType::Text;
}

z3::expr SolverSession::encode_operand(const Condition& cond, ExprId id, FieldType type) {
    const ExprNode& n = cond.node(id);
    const char* tname = field_type_name(type);

    switch (n.kind) {
        case ExprKind::Field:
            return variable(n.text);

        case ExprKind::Number:
            if (type == FieldType::Numeric) return number(n.number);
            if (is_temporal(type))          return ctx_.int_val(static_cast<std::int64_t>(std::llround(n.number)));
            if (is_textual(type))           return ctx_.string_val(n.text);
            break;

        case ExprKind::Date:
            if (is_temporal(type)) return ctx_.int_val(static_cast<std::int64_t>(n.number));
            if (is_textual(type))  return ctx_.string_val(n.text);
            break;

        case ExprKind::String:
            if (is_textual(type)) return ctx_.string_val(n.text);
            if (is_temporal(type)) {
                if (auto days = parse_date(n.text)) return ctx_.int_val(*days);
            } else if (type == FieldType::Numeric) {
                if (auto v = parse_number(n.text)) return number(*v);
            } else if (iequals(n.text, "true") || iequals(n.text, "false")) {
                return ctx_.bool_val(iequals(n.text, "true"));
            }
            break;

        case ExprKind::True:
        case ExprKind::False:
            if (type == FieldType::Boolean) return ctx_.bool_val(n.kind == ExprKind::True);
            break;

        case ExprKind::Null:
            if (type == FieldType::Numeric) return number(kNumericNull);
            if (is_temporal(type))          return ctx_.int_val(kDateNull);
            if (is_textual(type))           return ctx_.string_val(kTextNull);
            break;

        default:
            throw EncodeError("expected operand, got " + cond.to_string(id));
    }
    throw EncodeError("type mismatch: " + cond.to_string(id) + " used as " + tname);
}

z3::expr SolverSession::encode_compare(const Condition& cond, CompareOp op, ExprId a, ExprId b) {
    const FieldType t = context_type(cond, a, b);
    const bool a_null = cond.node(a).kind == ExprKind::Null;
    const bool b_null = cond.node(b).kind == ExprKind::Null;

    if (a_null && b_null) {
        if (op == CompareOp::Eq) return ctx_.bool_val(true);
        if (op == CompareOp::Ne) return ctx_.bool_val(false);
        throw EncodeError("ordering comparison between NULLs");
    }
    if ((a_null || b_null) && t == FieldType::Boolean) {
        return ctx_.bool_val(op == CompareOp::Ne);
    }
    if (op != CompareOp::Eq && op != CompareOp::Ne &&
        (is_textual(t) || t == FieldType::Boolean)) {
        throw EncodeError("ordering comparison on " + std::string(field_type_name(t)) +
                          " value: " + cond.to_string(a) + " " + compare_op_symbol(op) +
                          " " + cond.to_string(b));
    }

    z3::expr ea = encode_operand(cond, a, t);
    z3::expr eb = encode_operand(cond, b, t);
    if (!z3::eq(ea.get_sort(), eb.get_sort())) {
        throw EncodeError("cannot compare " + cond.to_string(a) + " with " + cond.to_string(b));
    }

    switch (op) {
        case CompareOp::Eq: return ea == eb;
        case CompareOp::Ne: return ea != eb;
        case CompareOp::Lt: return ea < eb;
        case CompareOp::Le: return ea <= eb;
        case CompareOp::Gt: return ea > eb;
        case CompareOp::Ge: return ea >= eb;
    }
    throw EncodeError("unknown comparison operator");
}

z3::expr SolverSession::encode_node(const Condition& cond, ExprId id) {
    const ExprNode& n = cond.node(id);

    switch (n.kind) {
        case ExprKind::True:
            return ctx_.bool_val(true);
        case ExprKind::False:
            return ctx_.bool_val(false);

        case ExprKind::Field:
            if (type_of(n.text) == FieldType::Boolean) return variable(n.text);
            throw EncodeError("field '" + n.text + "' used as a condition");

        case ExprKind::Compare:
            return encode_compare(cond, n.op, n.children[0], n.children[1]);

        case ExprKind::In:
        case ExprKind::NotIn: {
            z3::expr_vector alts(ctx_);
            for (std::size_t i = 1; i < n.children.size(); ++i) {
                alts.push_back(encode_compare(cond, CompareOp::Eq, n.children[0], n.children[i]));
            }
            z3::expr any = z3::mk_or(alts);
            return n.kind == ExprKind::In ? any : !any;
        }

        case ExprKind::Between:
            return encode_compare(cond, CompareOp::Ge, n.children[0], n.children[1]) &&
                   encode_compare(cond, CompareOp::Le, n.children[0], n.children[2]);

        case ExprKind::IsNull:
        case ExprKind::IsNotNull: {
            const ExprNode& x = cond.node(n.children[0]);
            z3::expr is_null_expr = ctx_.bool_val(x.kind == ExprKind::Null);
            if (x.kind == ExprKind::Field && type_of(x.text) != FieldType::Boolean) {
                is_null_expr = variable(x.text) == null_value(x.text);
            }
            return n.kind == ExprKind::IsNull ? is_null_expr : !is_null_expr;
        }

        case ExprKind::Not:
            return !encode_node(cond, n.children[0]);

        case ExprKind::And:
        case ExprKind::Or: {
            z3::expr_vector parts(ctx_);
            for (ExprId c : n.children) parts.push_back(encode_node(cond, c));
            return n.kind == ExprKind::And ? z3::mk_and(parts) : z3::mk_or(parts);
        }

        case ExprKind::IfThenElse: {
            z3::expr guard = encode_node(cond, n.children[0]);
            z3::expr then_branch = encode_node(cond, n.children[1]);
            if (n.children.size() > 2) {
                return z3::ite(guard, then_branch, encode_node(cond, n.children[2]));
            }
            return z3::implies(guard, then_branch);
        }

        case ExprKind::Null:
        case ExprKind::Number:
        case ExprKind::String:
        case ExprKind::Date:
            break;
    }
    throw EncodeError("literal " + cond.to_string(id) + " used as a condition");
}

// ── Solving ─────────────────────────────────────────────────────────────────

void SolverSession::add(const z3::expr& e) {
    solver_.add(e);
}

SmtResult SolverSession::check() {
    switch (solver_.check()) {
        case z3::sat:     return SmtResult::Sat;
        case z3::unsat:   return SmtResult::Unsat;
        case z3::unknown: return SmtResult::Unknown;
    }
    return SmtResult::Unknown;
}

std::map<std::string, Value> SolverSession::model_values() {
    std::map<std::string, Value> out;
    z3::model m = solver_.get_model();

    for (const std::string& name : order_) {
        z3::expr v = m.eval(*vars_.at(name), true);
        const FieldType t = type_of(name);

        if (t == FieldType::Numeric) {
            if (!v.is_numeral()) continue;
            std::string s = v.get_decimal_string(12);
            if (!s.empty() && s.back() == '?') s.pop_back();
            auto d = parse_number(s);
            if (!d) continue;
            out[name] = *d == kNumericNull ? Value{} : Value{*d};
        } else if (is_temporal(t)) {
            std::int64_t days = 0;
            if (!v.is_numeral_i64(days)) continue;
            out[name] = days == kDateNull ? Value{} : Value{format_date(days)};
        } else if (t == FieldType::Boolean) {
            out[name] = Value{v.is_true()};
        } else {
            if (!v.is_string_value()) continue;
            std::string s = v.get_string();
            out[name] = s == kTextNull ? Value{} : Value{s};
        }
    }
    return out;
}

}  // namespace edc
