// ============================================================================
// symbolic.cpp — Solver-driven test generation
// ============================================================================

#include "edc/symbolic.hpp"
#include "edc/condition.hpp"
#include "edc/log.hpp"
#include "edc/parser.hpp"
#include "edc/smt.hpp"
#include "edc/utils.hpp"

#include <cmath>
#include <optional>

namespace edc {

SymbolicExecutor::SymbolicExecutor(SymbolicOptions opts) : opts_(opts) {}

double SymbolicExecutor::epsilon() const noexcept {
    return (opts_.search_high - opts_.search_low) / std::ldexp(1.0, opts_.bisection_iterations + 1);
}

// ── Helpers ─────────────────────────────────────────────────────────────────

static TestData data_from_model(const std::map<std::string, Value>& values,
                                const Specification& spec,
                                const std::vector<std::string>& forms) {
    TestData data;
    for (const auto& [name, value] : values) {
        if (auto p = field_path_of(name, spec, forms)) {
            set_value(data, *p, value);
        }
    }
    return data;
}

/// Model of `f`, under the declared domain when possible.
static std::optional<std::map<std::string, Value>> solve(SolverSession& session, const z3::expr& f) {
    {
        SolverSession::Scope scope(session);
        session.add(f);
        session.add(session.domain());
        if (session.check() == SmtResult::Sat) return session.model_values();
    }
    SolverSession::Scope scope(session);
    session.add(f);
    if (session.check() == SmtResult::Sat) return session.model_values();
    return std::nullopt;
}

/// The constraint for the rule: the whole tree, or the encodable subset of
/// its comparisons.
static std::optional<z3::expr> build_constraint(SolverSession& session, const std::string& text,
                                                const std::string& rule_id) {
    try {
        Condition cond = compile_condition(text);
        return session.encode(cond);
    } catch (const std::exception& e) {
        log_debug("symbolic: rule " + rule_id + " falls back to atomic comparisons: " + e.what());
    }

    Condition cond;
    z3::expr_vector parts(session.context());
    for (const Comparison& c : extract_comparisons(text)) {
        const ExprId id = conjunction_of({c}, cond);
        try {
            parts.push_back(session.encode(cond, id));
        } catch (const EncodeError& e) {
            log_debug("symbolic: skipping " + c.to_string() + ": " + e.what());
        }
    }
    if (parts.empty()) return std::nullopt;
    return z3::mk_and(parts);
}

// ── generate_tests ──────────────────────────────────────────────────────────

std::vector<TestCase> SymbolicExecutor::generate_tests(const Rule& rule,
                                                       const Specification& spec) const {
    std::vector<TestCase> tests;
    if (!rule.has_formalized()) {
        log_debug("symbolic: rule " + rule.id + " has no formalized condition");
        return tests;
    }

    const std::vector<std::string> forms = rule_forms(rule, spec);
    SolverSession session(spec, forms, opts_.timeout_ms);

    auto constraint = build_constraint(session, *rule.formalized_condition, rule.id);
    if (!constraint) return tests;
    const z3::expr f = *constraint;

    auto make_test = [&](std::string description, bool expected, TestData data) {
        TestCase tc;
        tc.rule_id         = rule.id;
        tc.description     = std::move(description);
        tc.expected_result = expected;
        tc.test_data       = std::move(data);
        tc.technique       = Technique::Symbolic;
        tc.is_positive     = expected;
        tests.push_back(std::move(tc));
    };

    // (a) / (b) one model each side
    if (auto m = solve(session, f)) {
        make_test("Symbolic positive: solver model satisfying the condition", true,
                  data_from_model(*m, spec, forms));
    }
    if (auto m = solve(session, !f)) {
        make_test("Symbolic negative: solver model violating the condition", false,
                  data_from_model(*m, spec, forms));
    }

    // (c) boundaries
    const std::vector<std::string> names = session.variables();
    for (const std::string& name : names) {
        if (session.type_of(name) != FieldType::Numeric) continue;
        const z3::expr var = session.variable(name);

        auto sat_at = [&](double v) {
            SolverSession::Scope scope(session);
            session.add(session.domain(name));
            session.add(var == session.number(v));
            session.add(f);
            return session.check() == SmtResult::Sat;
        };

        double lo = opts_.search_low;
        double hi = opts_.search_high;
        const bool sat_lo = sat_at(lo);
        const bool sat_hi = sat_at(hi);
        if (sat_lo == sat_hi) continue;

        for (int i = 0; i < opts_.bisection_iterations; ++i) {
            const double mid = (lo + hi) / 2.0;
            if (sat_at(mid) == sat_lo) {
                lo = mid;
            } else {
                hi = mid;
            }
        }
        const double boundary = (lo + hi) / 2.0;

        // Other fields come from a model on the satisfying side.
        std::map<std::string, Value> others;
        {
            SolverSession::Scope scope(session);
            session.add(session.domain(name));
            session.add(var == session.number(sat_lo ? lo : hi));
            session.add(f);
            if (session.check() != SmtResult::Sat) {
                log_debug("symbolic: lost the satisfying side for " + name);
                continue;
            }
            others = session.model_values();
        }

        auto path = field_path_of(name, spec, forms);
        if (!path) continue;

        for (const auto& [value, expected] : {std::pair{lo, sat_lo}, std::pair{hi, sat_hi}}) {
            TestData data = data_from_model(others, spec, forms);
            set_value(data, *path, value);
            make_test("Symbolic boundary: " + name + " = " + format_number(value) +
                      (value < boundary ? " (below " : " (above ") +
                      format_number(boundary) + ")", expected, std::move(data));
        }
    }

    log_info("symbolic: generated " + std::to_string(tests.size()) + " tests for rule " + rule.id);
    return tests;
}

}  // namespace edc
