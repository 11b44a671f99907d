// ============================================================================
// multimodal.cpp — Majority-vote filtering of generated tests
// ============================================================================

#include "edc/multimodal.hpp"
#include "edc/evaluator.hpp"
#include "edc/log.hpp"
#include "edc/parser.hpp"

#include <algorithm>
#include <set>

namespace edc {

MultiModalVerifier::MultiModalVerifier(VerifierOptions smt_options, MultiModalOptions opts)
    : smt_(smt_options), opts_(opts) {}

// ── Opinions ────────────────────────────────────────────────────────────────

std::optional<bool> MultiModalVerifier::smt_opinion(const Rule& rule, const Specification& spec,
                                                    const TestCase& tc) const {
    auto actual = smt_.check_test_case(rule, spec, tc);
    if (!actual) return std::nullopt;
    return *actual == tc.expected_result;
}

std::optional<bool> MultiModalVerifier::direct_opinion(const Rule& rule, const Specification& spec,
                                                       const TestCase& tc) const {
    auto actual = evaluate_rule(rule, spec, tc.test_data);
    if (!actual) return std::nullopt;
    return *actual == tc.expected_result;
}

std::optional<bool> MultiModalVerifier::cross_opinion(const std::vector<RelatedRule>& related,
                                                      const Specification& spec,
                                                      const TestCase& tc) const {
    bool applicable = false;
    for (const RelatedRule& r : related) {
        const bool must_hold   = tc.expected_result && r.implied_by_rule;
        const bool must_fail   = !tc.expected_result && r.implies_rule;
        if (!must_hold && !must_fail) continue;

        auto actual = evaluate_rule(*r.rule, spec, tc.test_data);
        if (!actual) continue;
        applicable = true;
        if (*actual != must_hold) return false;
    }
    if (!applicable) return std::nullopt;
    return true;
}

// ── Related rules ───────────────────────────────────────────────────────────

static std::set<std::string> field_set(const Rule& rule, const Specification& spec) {
    std::set<std::string> out;
    const std::vector<std::string> forms = rule_forms(rule, spec);
    for (const std::string& ref : extract_field_references(rule.working_condition())) {
        auto p = field_path_of(ref, spec, forms);
        out.insert(p ? p->ref() : ref);
    }
    return out;
}

std::vector<RelatedRule> MultiModalVerifier::related_rules(const Rule& rule,
                                                           const std::vector<Rule>& rule_set,
                                                           const Specification& spec) const {
    std::vector<RelatedRule> out;
    if (!rule.has_formalized()) return out;

    const std::set<std::string> mine = field_set(rule, spec);
    for (const Rule& other : rule_set) {
        if (other.id == rule.id || !other.has_formalized()) continue;

        const std::set<std::string> theirs = field_set(other, spec);
        const bool shares = std::any_of(theirs.begin(), theirs.end(),
                                        [&mine](const std::string& f) { return mine.count(f) != 0; });
        if (!shares) continue;

        RelatedRule r;
        r.rule            = &other;
        r.implied_by_rule = smt_.implies(rule, other, spec).value_or(false);
        r.implies_rule    = smt_.implies(other, rule, spec).value_or(false);
        if (r.implied_by_rule || r.implies_rule) out.push_back(r);
    }
    return out;
}

// ── Voting ──────────────────────────────────────────────────────────────────

Verdict MultiModalVerifier::assess(const Rule& rule, const Specification& spec, const TestCase& tc,
                                   const std::vector<RelatedRule>& related) const {
    Verdict v;
    auto count = [&v](std::optional<bool> opinion) {
        if (!opinion) return;
        ++v.total;
        if (*opinion) ++v.valid;
    };

    if (opts_.use_smt)    count(smt_opinion(rule, spec, tc));
    if (opts_.use_direct) count(direct_opinion(rule, spec, tc));
    if (opts_.use_cross)  count(cross_opinion(related, spec, tc));

    v.keep = v.total > 0 && 2 * v.valid > v.total;
    return v;
}

std::vector<TestCase> MultiModalVerifier::verify(const Rule& rule, const Specification& spec,
                                                 std::vector<TestCase> tests,
                                                 const std::vector<Rule>& rule_set) const {
    std::vector<RelatedRule> related;
    if (opts_.use_cross && !rule_set.empty()) {
        related = related_rules(rule, rule_set, spec);
    }

    std::vector<TestCase> kept;
    for (TestCase& tc : tests) {
        const Verdict v = assess(rule, spec, tc, related);
        if (!v.keep) {
            log_debug("discarding '" + tc.description + "' (" + std::to_string(v.valid) + "/" +
                      std::to_string(v.total) + " opinions valid)");
            continue;
        }
        tc.description += " [verified " + std::to_string(v.valid) + "/" + std::to_string(v.total) + "]";
        kept.push_back(std::move(tc));
    }

    log_info("rule " + rule.id + ": kept " + std::to_string(kept.size()) + " of " +
             std::to_string(tests.size()) + " generated tests");
    return kept;
}

}  // namespace edc
