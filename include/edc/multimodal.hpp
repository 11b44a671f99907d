// ============================================================================
// edc/multimodal.hpp — Majority-vote filtering of generated tests
// ============================================================================
//
// Design notes:
//
//   Each candidate test collects up to three opinions on whether its
//   expected_result is right:
//
//     smt     SmtVerifier::check_test_case() on the test data
//     direct  Evaluator over the rule's condition tree
//     cross   consistency with related rules (rules sharing a field):
//               rule => related   a positive test must satisfy related
//               related => rule   a negative test must violate related
//             no opinion when no such implication holds
//
//   A test is kept when the valid opinions are a strict majority of the
//   opinions actually returned.  No opinions at all means discard.  Kept
//   tests get " [verified k/n]" appended to their description.
//
// ============================================================================

#ifndef EDC_MULTIMODAL_HPP
#define EDC_MULTIMODAL_HPP

#include "edc/model.hpp"
#include "edc/verifier.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace edc {

struct MultiModalOptions {
    bool use_smt    = true;
    bool use_direct = true;
    bool use_cross  = true;
};

/// A related rule and the implications that tie it to the rule under test.
struct RelatedRule {
    const Rule* rule = nullptr;
    bool        implied_by_rule = false;   // rule => related
    bool        implies_rule    = false;   // related => rule
};

struct Verdict {
    std::size_t valid = 0;
    std::size_t total = 0;
    bool        keep  = false;
};

class MultiModalVerifier {
public:
    explicit MultiModalVerifier(VerifierOptions smt_options = {}, MultiModalOptions opts = {});

    std::optional<bool> smt_opinion(const Rule& rule, const Specification& spec,
                                    const TestCase& tc) const;
    std::optional<bool> direct_opinion(const Rule& rule, const Specification& spec,
                                       const TestCase& tc) const;
    std::optional<bool> cross_opinion(const std::vector<RelatedRule>& related,
                                      const Specification& spec, const TestCase& tc) const;

    /// Rules of `rule_set` that share a field with `rule` and are linked to
    /// it by an implication in at least one direction.
    std::vector<RelatedRule> related_rules(const Rule& rule, const std::vector<Rule>& rule_set,
                                           const Specification& spec) const;

    Verdict assess(const Rule& rule, const Specification& spec, const TestCase& tc,
                   const std::vector<RelatedRule>& related) const;

    /// The kept tests, in input order, with the verification suffix.
    std::vector<TestCase> verify(const Rule& rule, const Specification& spec,
                                 std::vector<TestCase> tests,
                                 const std::vector<Rule>& rule_set = {}) const;

private:
    SmtVerifier       smt_;
    MultiModalOptions opts_;
};

}  // namespace edc

#endif  // EDC_MULTIMODAL_HPP
