// ============================================================================
// edc/verifier.hpp — Formal checks of single rules and rule sets
// ============================================================================
//
// Per rule (one SolverSession, every check in its own scope):
//   unsatisfiable_rule           error    the condition can never hold
//   tautology                    warning  the condition always holds
//   redundant_condition          warning  duplicate clause, or a clause next
//                                         to its own negation, in one AND/OR
//   null_values_satisfy_rule     warning  all-NULL input satisfies it
//   extreme_value_satisfies_rule warning  +/-1e6 on an unbounded numeric
//   solver_unknown               warning  Z3 gave up
//   parsing_error                warning  condition cannot be parsed/encoded
//   missing_formalized_condition warning  nothing to verify
//   invalid_form / invalid_field error    undeclared references
//   type_mismatch                error    text literal vs numeric/date field
//   invalid_categorical_value    error    literal outside the valid values
//
// Per rule set (one SolverSession per unordered pair):
//   contradictory_rules          error    on both rules
//   implied_rule                 warning  on the implied rule
//   pair_limit_reached           warning  pairs skipped by max_rule_pairs
//
// Findings are never raised as exceptions.
//
// ============================================================================

#ifndef EDC_VERIFIER_HPP
#define EDC_VERIFIER_HPP

#include "edc/condition.hpp"
#include "edc/model.hpp"

#include <cstddef>
#include <optional>
#include <vector>

namespace edc {

// ── VerifierOptions ─────────────────────────────────────────────────────────

struct VerifierOptions {
    std::size_t max_rule_pairs   = 0;      // 0 = every pair
    bool        check_edge_cases = true;
    unsigned    timeout_ms       = 0;      // per solver session, 0 = none
};

// ── SmtVerifier ─────────────────────────────────────────────────────────────
// Stateless apart from its options; safe to call from several threads.

class SmtVerifier {
public:
    explicit SmtVerifier(VerifierOptions opts = {});

    ValidationResult verify_rule(const Rule& rule, const Specification& spec) const;

    /// verify_rule() for every rule, plus pairwise contradiction and
    /// implication findings.  Results are in input order.
    std::vector<ValidationResult> verify_rule_set(const std::vector<Rule>& rules,
                                                  const Specification& spec) const;

    /// Evaluate the rule's formalized condition on the test's data.
    /// Missing values are NULL.  nullopt when there is no formalized
    /// condition, a value cannot be encoded, or the solver gives up.
    std::optional<bool> check_test_case(const Rule& rule, const Specification& spec,
                                        const TestCase& tc) const;

    /// Whether `a` implies `b`; nullopt when undecidable here.
    std::optional<bool> implies(const Rule& a, const Rule& b,
                                const Specification& spec) const;

    const VerifierOptions& options() const noexcept { return opts_; }

private:
    void check_references(const Rule& rule, const Condition& cond,
                          const Specification& spec, ValidationResult& result) const;
    void check_literals(const Condition& cond, const Specification& spec,
                        const std::vector<std::string>& forms,
                        ValidationResult& result) const;
    void check_redundancy(const Condition& cond, ValidationResult& result) const;

    void check_pair(const Rule& a, const Condition& ca, const Rule& b, const Condition& cb,
                    const Specification& spec,
                    ValidationResult& ra, ValidationResult& rb) const;

    VerifierOptions opts_;
};

}  // namespace edc

#endif  // EDC_VERIFIER_HPP
