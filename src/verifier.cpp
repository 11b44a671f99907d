// ============================================================================
// verifier.cpp — Rule and rule-set verification
// ============================================================================

#include "edc/verifier.hpp"
#include "edc/log.hpp"
#include "edc/parser.hpp"
#include "edc/smt.hpp"
#include "edc/utils.hpp"

#include <algorithm>
#include <functional>
#include <set>

namespace edc {

static constexpr double kExtremeMagnitude = 1e6;

SmtVerifier::SmtVerifier(VerifierOptions opts) : opts_(opts) {}

// ── Reachable nodes ─────────────────────────────────────────────────────────

static std::vector<ExprId> reachable(const Condition& cond, ExprId root) {
    std::vector<ExprId> out;
    std::set<ExprId> seen;
    std::function<void(ExprId)> visit = [&](ExprId id) {
        if (!seen.insert(id).second) return;
        out.push_back(id);
        for (ExprId c : cond.node(id).children) visit(c);
    };
    visit(root);
    return out;
}

// ── Reference checks ────────────────────────────────────────────────────────

void SmtVerifier::check_references(const Rule& rule, const Condition& cond,
                                   const Specification& spec, ValidationResult& result) const {
    for (const std::string& form : rule.forms) {
        if (!spec.find_form(form)) {
            result.add_error("invalid_form", "form '" + form + "' is not declared in the specification");
        }
    }

    for (const std::string& ref : cond.field_references(cond.root())) {
        auto dot = ref.find('.');
        if (dot != std::string::npos) {
            const std::string form = ref.substr(0, dot);
            const std::string field = ref.substr(dot + 1);
            if (!spec.find_form(form)) {
                result.add_error("invalid_form", "form '" + form + "' referenced by '" + ref +
                                 "' is not declared in the specification");
            } else if (!spec.find_field(form, field)) {
                result.add_error("invalid_field", "field '" + field + "' is not declared in form '" +
                                 form + "'");
            }
        } else if (!spec.resolve(ref, rule.forms)) {
            result.add_error("invalid_field", "field '" + ref + "' is not declared in any form");
        }
    }
}

// ── Literal checks ──────────────────────────────────────────────────────────
// A field compared with a literal it can never equal.

void SmtVerifier::check_literals(const Condition& cond, const Specification& spec,
                                 const std::vector<std::string>& forms,
                                 ValidationResult& result) const {
    auto check_one = [&](ExprId field_id, ExprId literal_id) {
        const ExprNode& fn = cond.node(field_id);
        const ExprNode& ln = cond.node(literal_id);
        if (fn.kind != ExprKind::Field) return;
        const Field* f = spec.lookup(fn.text, forms);
        if (!f) return;

        if (f->type == FieldType::Numeric) {
            if ((ln.kind == ExprKind::String && !parse_number(ln.text)) || ln.kind == ExprKind::Date) {
                result.add_error("type_mismatch", "numeric field '" + fn.text +
                                 "' compared with " + cond.to_string(literal_id));
            }
        } else if (is_temporal(f->type)) {
            if (ln.kind == ExprKind::String && !parse_date(ln.text)) {
                result.add_error("type_mismatch", std::string(field_type_name(f->type)) + " field '" +
                                 fn.text + "' compared with " + cond.to_string(literal_id));
            }
        } else if (f->type == FieldType::Categorical) {
            if ((ln.kind == ExprKind::String || ln.kind == ExprKind::Number) &&
                !f->accepts_value(ln.text)) {
                result.add_error("invalid_categorical_value", "'" + ln.text +
                                 "' is not a valid value of '" + fn.text + "'");
            }
        }
    };

    for (ExprId id : reachable(cond, cond.root())) {
        const ExprNode& n = cond.node(id);
        switch (n.kind) {
            case ExprKind::Compare:
                check_one(n.children[0], n.children[1]);
                check_one(n.children[1], n.children[0]);
                break;
            case ExprKind::In:
            case ExprKind::NotIn:
            case ExprKind::Between:
                for (std::size_t i = 1; i < n.children.size(); ++i) {
                    check_one(n.children[0], n.children[i]);
                }
                break;
            default:
                break;
        }
    }
}

// ── Structural redundancy ───────────────────────────────────────────────────

static bool complementary(const Condition& cond, ExprId a, ExprId b) {
    const ExprNode& na = cond.node(a);
    const ExprNode& nb = cond.node(b);
    if (nb.kind == ExprKind::Not && nb.children[0] == a) return true;
    if (na.kind == ExprKind::Not && na.children[0] == b) return true;
    if (na.kind == ExprKind::Compare && nb.kind == ExprKind::Compare &&
        na.children == nb.children && nb.op == negate(na.op)) {
        return true;
    }
    return false;
}

void SmtVerifier::check_redundancy(const Condition& cond, ValidationResult& result) const {
    for (ExprId id : reachable(cond, cond.root())) {
        const ExprNode& n = cond.node(id);
        if (n.kind != ExprKind::And && n.kind != ExprKind::Or) continue;
        const char* conn = expr_kind_name(n.kind);

        for (std::size_t i = 0; i < n.children.size(); ++i) {
            for (std::size_t j = i + 1; j < n.children.size(); ++j) {
                const ExprId a = n.children[i];
                const ExprId b = n.children[j];
                if (a == b) {
                    result.add_warning("redundant_condition", "duplicate clause " + cond.to_string(a) +
                                       " in " + conn);
                } else if (complementary(cond, a, b)) {
                    result.add_warning("redundant_condition", "clauses " + cond.to_string(a) + " and " +
                                       cond.to_string(b) + " are complementary in " + conn);
                }
            }
        }
    }
}

// ── verify_rule ─────────────────────────────────────────────────────────────

ValidationResult SmtVerifier::verify_rule(const Rule& rule, const Specification& spec) const {
    ValidationResult result;
    result.rule_id = rule.id;

    if (!rule.has_formalized()) {
        result.add_warning("missing_formalized_condition",
                           "rule has no formalized condition; formal verification skipped");
        return result;
    }

    Condition cond;
    try {
        cond = compile_condition(*rule.formalized_condition);
    } catch (const std::exception& e) {
        result.add_warning("parsing_error", e.what());
        return result;
    }

    const std::vector<std::string> forms = rule_forms(rule, spec);
    if (!spec.empty()) {
        check_references(rule, cond, spec, result);
        check_literals(cond, spec, forms, result);
    }
    check_redundancy(cond, result);

    try {
        SolverSession session(spec, forms, opts_.timeout_ms);
        z3::expr f = session.encode(cond);

        // (1) satisfiability
        SmtResult sat;
        {
            SolverSession::Scope scope(session);
            session.add(f);
            sat = session.check();
            if (sat == SmtResult::Sat) {
                for (const auto& [name, value] : session.model_values()) {
                    result.witness[name] = value_to_string(value);
                }
            }
        }
        if (sat == SmtResult::Unsat) {
            result.add_error("unsatisfiable_rule", "condition " + cond.to_string() + " can never be satisfied");
            return result;
        }
        if (sat == SmtResult::Unknown) {
            result.add_warning("solver_unknown", "satisfiability of the condition could not be decided");
            return result;
        }

        // (2) tautology
        {
            SolverSession::Scope scope(session);
            session.add(!f);
            SmtResult r = session.check();
            if (r == SmtResult::Unsat) {
                result.add_warning("tautology", "condition " + cond.to_string() + " is always satisfied");
            } else if (r == SmtResult::Unknown) {
                result.add_warning("solver_unknown", "tautology check could not be decided");
            }
        }

        if (!opts_.check_edge_cases) return result;

        // (3) all-NULL input
        std::vector<std::string> nullable;
        for (const std::string& name : session.variables()) {
            if (session.type_of(name) != FieldType::Boolean) nullable.push_back(name);
        }
        if (!nullable.empty()) {
            SolverSession::Scope scope(session);
            session.add(f);
            for (const std::string& name : nullable) {
                session.add(session.variable(name) == session.null_value(name));
            }
            if (session.check() == SmtResult::Sat) {
                result.add_warning("null_values_satisfy_rule",
                                   "condition holds when every referenced field is NULL");
            }
        }

        // (4) extreme magnitudes on numeric fields without declared bounds
        for (const std::string& name : session.variables()) {
            if (session.type_of(name) != FieldType::Numeric) continue;
            const Field* decl = spec.lookup(name, forms);
            for (double v : {kExtremeMagnitude, -kExtremeMagnitude}) {
                if (decl && v > 0 && decl->max_value && *decl->max_value < v) continue;
                if (decl && v < 0 && decl->min_value && *decl->min_value > v) continue;
                SolverSession::Scope scope(session);
                session.add(f);
                session.add(session.variable(name) == session.number(v));
                if (session.check() == SmtResult::Sat) {
                    result.add_warning("extreme_value_satisfies_rule",
                                       name + " = " + format_number(v) + " satisfies the condition");
                }
            }
        }
    } catch (const EncodeError& e) {
        result.add_warning("parsing_error", e.what());
    } catch (const z3::exception& e) {
        result.add_warning("parsing_error", std::string("solver error: ") + e.msg());
    }

    return result;
}

// ── Pairwise checks ─────────────────────────────────────────────────────────

void SmtVerifier::check_pair(const Rule& a, const Condition& ca, const Rule& b, const Condition& cb,
                             const Specification& spec,
                             ValidationResult& ra, ValidationResult& rb) const {
    std::vector<std::string> forms = rule_forms(a, spec);
    for (const std::string& f : rule_forms(b, spec)) {
        if (std::find(forms.begin(), forms.end(), f) == forms.end()) forms.push_back(f);
    }

    try {
        SolverSession session(spec, forms, opts_.timeout_ms);
        z3::expr fa = session.encode(ca);
        z3::expr fb = session.encode(cb);

        SmtResult joint;
        {
            SolverSession::Scope scope(session);
            session.add(fa);
            session.add(fb);
            joint = session.check();
        }
        if (joint == SmtResult::Unsat) {
            ra.add_error("contradictory_rules", "rule " + a.id + " contradicts rule " + b.id, b.id);
            rb.add_error("contradictory_rules", "rule " + b.id + " contradicts rule " + a.id, a.id);
        }
        if (joint == SmtResult::Unknown) {
            ra.add_warning("solver_unknown", "consistency with rule " + b.id + " could not be decided", b.id);
            rb.add_warning("solver_unknown", "consistency with rule " + a.id + " could not be decided", a.id);
            return;
        }

        {
            SolverSession::Scope scope(session);
            session.add(fa);
            session.add(!fb);
            if (session.check() == SmtResult::Unsat) {
                rb.add_warning("implied_rule", "rule " + b.id + " is implied by rule " + a.id, a.id);
            }
        }
        {
            SolverSession::Scope scope(session);
            session.add(fb);
            session.add(!fa);
            if (session.check() == SmtResult::Unsat) {
                ra.add_warning("implied_rule", "rule " + a.id + " is implied by rule " + b.id, b.id);
            }
        }
    } catch (const EncodeError& e) {
        log_debug("pair " + a.id + "/" + b.id + " skipped: " + e.what());
    } catch (const z3::exception& e) {
        log_warning("pair " + a.id + "/" + b.id + " skipped: solver error: " + e.msg());
    }
}

// ── verify_rule_set ─────────────────────────────────────────────────────────

std::vector<ValidationResult> SmtVerifier::verify_rule_set(const std::vector<Rule>& rules,
                                                           const Specification& spec) const {
    std::vector<ValidationResult> results;
    results.reserve(rules.size());
    for (const Rule& r : rules) {
        results.push_back(verify_rule(r, spec));
    }

    // Every rule with a parseable formalized condition takes part in the
    // pairwise checks, unsatisfiable ones included.
    std::vector<std::size_t> idx;
    std::vector<Condition>   conds;
    for (std::size_t i = 0; i < rules.size(); ++i) {
        if (!rules[i].has_formalized()) continue;
        try {
            conds.push_back(compile_condition(*rules[i].formalized_condition));
            idx.push_back(i);
        } catch (const std::exception& e) {
            log_debug("rule " + rules[i].id + " excluded from pairwise checks: " + e.what());
        }
    }

    std::size_t examined = 0;
    std::vector<bool> truncated(rules.size(), false);

    for (std::size_t x = 0; x < idx.size(); ++x) {
        for (std::size_t y = x + 1; y < idx.size(); ++y) {
            const std::size_t i = idx[x];
            const std::size_t j = idx[y];
            if (opts_.max_rule_pairs > 0 && examined >= opts_.max_rule_pairs) {
                truncated[i] = true;
                truncated[j] = true;
                continue;
            }
            ++examined;
            check_pair(rules[i], conds[x], rules[j], conds[y], spec, results[i], results[j]);
        }
    }

    for (std::size_t i = 0; i < rules.size(); ++i) {
        if (truncated[i]) {
            results[i].add_warning("pair_limit_reached",
                                   "not every rule pair involving " + rules[i].id +
                                   " was checked (limit " + std::to_string(opts_.max_rule_pairs) + ")");
        }
    }

    log_info("verified " + std::to_string(rules.size()) + " rules, " +
             std::to_string(examined) + " rule pairs");
    return results;
}

// ── check_test_case ─────────────────────────────────────────────────────────

std::optional<bool> SmtVerifier::check_test_case(const Rule& rule, const Specification& spec,
                                                 const TestCase& tc) const {
    if (!rule.has_formalized()) return std::nullopt;

    Condition cond;
    try {
        cond = compile_condition(*rule.formalized_condition);
    } catch (const std::exception& e) {
        log_debug("rule " + rule.id + ": " + e.what());
        return std::nullopt;
    }

    const std::vector<std::string> forms = rule_forms(rule, spec);
    try {
        SolverSession session(spec, forms, opts_.timeout_ms);
        z3::expr f = session.encode(cond);

        SolverSession::Scope scope(session);
        for (const std::string& ref : cond.field_references(cond.root())) {
            auto path = field_path_of(ref, spec, forms);
            const Value* v = path ? find_value(tc.test_data, *path) : nullptr;
            z3::expr var = session.variable(ref);
            session.add(var == (v ? session.literal(ref, *v) : session.null_value(ref)));
        }
        session.add(f);

        switch (session.check()) {
            case SmtResult::Sat:     return true;
            case SmtResult::Unsat:   return false;
            case SmtResult::Unknown: return std::nullopt;
        }
    } catch (const EncodeError& e) {
        log_debug("rule " + rule.id + ": no SMT opinion on '" + tc.description + "': " + e.what());
    } catch (const z3::exception& e) {
        log_debug("rule " + rule.id + ": solver error: " + e.msg());
    }
    return std::nullopt;
}

// ── implies ─────────────────────────────────────────────────────────────────

std::optional<bool> SmtVerifier::implies(const Rule& a, const Rule& b,
                                         const Specification& spec) const {
    if (!a.has_formalized() || !b.has_formalized()) return std::nullopt;

    try {
        Condition ca = compile_condition(*a.formalized_condition);
        Condition cb = compile_condition(*b.formalized_condition);

        std::vector<std::string> forms = rule_forms(a, spec);
        for (const std::string& f : rule_forms(b, spec)) {
            if (std::find(forms.begin(), forms.end(), f) == forms.end()) forms.push_back(f);
        }

        SolverSession session(spec, forms, opts_.timeout_ms);
        z3::expr fa = session.encode(ca);
        z3::expr fb = session.encode(cb);

        SolverSession::Scope scope(session);
        session.add(fa);
        session.add(!fb);
        switch (session.check()) {
            case SmtResult::Unsat:   return true;
            case SmtResult::Sat:     return false;
            case SmtResult::Unknown: return std::nullopt;
        }
    } catch (const EncodeError& e) {
        log_debug("implication " + a.id + " => " + b.id + " undecided: " + e.what());
    } catch (const z3::exception& e) {
        log_debug("implication " + a.id + " => " + b.id + " undecided: " + e.msg());
    } catch (const std::runtime_error& e) {
        log_debug("implication " + a.id + " => " + b.id + " undecided: " + e.what());
    }
    return std::nullopt;
}

}  // namespace edc
