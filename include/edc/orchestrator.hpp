// ============================================================================
// edc/orchestrator.hpp — Multi-technique test generation pipeline
// ============================================================================
//
// Design notes:
//
//   generate_tests() lays out a grid of (rule, technique) tasks.  Every task
//   builds its own generator, random engine and solver sessions, so tasks
//   share nothing but the read-only inputs.  Each task writes into its own
//   result slot; after the join, slots are merged per rule in grid order:
//
//     rule 0: [metamorphic] [symbolic] [adversarial] [causal]
//     rule 1: ...
//
//   With EDC_USE_OPENMP the grid is a `parallel for schedule(dynamic)`
//   bounded by max_workers; otherwise (or with parallel == false) it runs
//   sequentially.  A task that throws is logged and contributes nothing.
//
//   Merged tests are structurally validated against the specification, then
//   filtered by the multi-modal verifier.  Descriptions carry the technique
//   that produced them as a "[technique] " prefix.
//
// ============================================================================

#ifndef EDC_ORCHESTRATOR_HPP
#define EDC_ORCHESTRATOR_HPP

#include "edc/adversarial.hpp"
#include "edc/model.hpp"
#include "edc/verifier.hpp"

#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace edc {

struct GeneratorOptions {
    unsigned        max_workers          = 8;
    unsigned        seed                 = 0;
    std::size_t     causal_top_k         = 3;
    std::size_t     counterfactual_top_k = 2;
    VerifierOptions verifier;
};

class TestGenerator {
public:
    explicit TestGenerator(GeneratorOptions opts = {},
                           std::shared_ptr<MutationProposer> proposer = nullptr);

    /// Verified tests per rule id.  Every input rule has an entry, possibly
    /// empty.  An empty `techniques` list means all four generators.
    std::map<std::string, std::vector<TestCase>>
    generate_tests(const std::vector<Rule>& rules, const Specification& spec,
                   bool parallel = true,
                   const std::vector<Technique>& techniques = {}) const;

    /// The same pipeline for a single rule, run sequentially.
    std::vector<TestCase> generate_tests_for_rule(const Rule& rule, const Specification& spec,
                                                  const std::vector<Technique>& techniques = {}) const;

    ValidationResult verify_rule(const Rule& rule, const Specification& spec) const;
    std::vector<ValidationResult> verify_rule_set(const std::vector<Rule>& rules,
                                                  const Specification& spec) const;

    const GeneratorOptions& options() const noexcept { return opts_; }

    /// Run one technique on one rule; failures propagate.
    std::vector<TestCase> run_technique(Technique t, const Rule& rule, const Specification& spec,
                                        unsigned seed) const;

private:
    GeneratorOptions                  opts_;
    std::shared_ptr<MutationProposer> proposer_;
};

}  // namespace edc

#endif  // EDC_ORCHESTRATOR_HPP
