// ============================================================================
// orchestrator.cpp — Multi-technique test generation pipeline
// ============================================================================

#include "edc/orchestrator.hpp"
#include "edc/causal.hpp"
#include "edc/log.hpp"
#include "edc/metamorphic.hpp"
#include "edc/multimodal.hpp"
#include "edc/symbolic.hpp"

#include <algorithm>
#include <exception>
#include <iterator>
#include <stdexcept>

namespace edc {

TestGenerator::TestGenerator(GeneratorOptions opts, std::shared_ptr<MutationProposer> proposer)
    : opts_(std::move(opts)), proposer_(std::move(proposer)) {}

// ── Helpers ─────────────────────────────────────────────────────────────────

/// The generating techniques to run, in pipeline order.  Llm is a tag
/// carried by proposer-made adversarial tests, not a generator.
static std::vector<Technique> requested(const std::vector<Technique>& techniques) {
    if (techniques.empty()) return generator_techniques();

    std::vector<Technique> out;
    for (Technique t : generator_techniques()) {
        if (std::find(techniques.begin(), techniques.end(), t) != techniques.end()) {
            out.push_back(t);
        }
    }
    if (std::find(techniques.begin(), techniques.end(), Technique::Llm) != techniques.end()) {
        log_warning("'llm' is not a generator; request 'adversarial' with a mutation proposer");
    }
    return out;
}

/// Drop structurally invalid tests and tag the survivors with their technique.
static void admit(std::vector<TestCase>& out, std::vector<TestCase>&& produced,
                  const Rule& rule, const Specification& spec) {
    for (TestCase& tc : produced) {
        if (!validate_test_data(tc, rule, spec)) {
            log_debug("rule " + rule.id + ": dropping test with undeclared fields: " + tc.description);
            continue;
        }
        tc.description = std::string("[") + technique_name(tc.technique) + "] " + tc.description;
        out.push_back(std::move(tc));
    }
}

// ── run_technique ───────────────────────────────────────────────────────────

std::vector<TestCase> TestGenerator::run_technique(Technique t, const Rule& rule,
                                                   const Specification& spec,
                                                   unsigned seed) const {
    switch (t) {
        case Technique::Metamorphic:
            return MetamorphicTester(seed).generate_tests(rule, spec);
        case Technique::Symbolic: {
            SymbolicOptions so;
            so.timeout_ms = opts_.verifier.timeout_ms;
            return SymbolicExecutor(so).generate_tests(rule, spec);
        }
        case Technique::Adversarial:
            return AdversarialGenerator(proposer_).generate_tests(rule, spec);
        case Technique::Causal:
            return CausalTestGenerator(seed, opts_.causal_top_k, opts_.counterfactual_top_k)
                .generate_tests(rule, spec);
        case Technique::Llm:
            break;
    }
    throw std::invalid_argument(std::string("not a generating technique: ") + technique_name(t));
}

// ── generate_tests ──────────────────────────────────────────────────────────

std::map<std::string, std::vector<TestCase>>
TestGenerator::generate_tests(const std::vector<Rule>& rules, const Specification& spec,
                              bool parallel, const std::vector<Technique>& techniques) const {
    const std::vector<Technique> techs = requested(techniques);

    struct Task {
        std::size_t rule;
        Technique   technique;
    };
    std::vector<Task> tasks;
    tasks.reserve(rules.size() * techs.size());
    for (std::size_t r = 0; r < rules.size(); ++r) {
        for (Technique t : techs) tasks.push_back({r, t});
    }

    std::vector<std::vector<TestCase>> slots(tasks.size());
    const long n_tasks = static_cast<long>(tasks.size());

    auto run_task = [&](long i) {
        const Task& task = tasks[static_cast<std::size_t>(i)];
        const Rule& rule = rules[task.rule];
        try {
            slots[static_cast<std::size_t>(i)] =
                run_technique(task.technique, rule, spec, opts_.seed + static_cast<unsigned>(i));
        } catch (const std::exception& e) {
            log_error(std::string(technique_name(task.technique)) + " failed for rule " +
                      rule.id + ": " + e.what());
            slots[static_cast<std::size_t>(i)].clear();
        } catch (...) {
            // Nothing may leave the parallel region.
            log_error(std::string(technique_name(task.technique)) + " failed for rule " +
                      rule.id + ": unknown exception");
            slots[static_cast<std::size_t>(i)].clear();
        }
    };

#ifdef EDC_USE_OPENMP
    const int workers = static_cast<int>(
        std::max<long>(1, std::min<long>(static_cast<long>(opts_.max_workers), n_tasks)));
    #pragma omp parallel for schedule(dynamic) num_threads(workers) if(parallel && workers > 1)
    for (long i = 0; i < n_tasks; ++i) {
        run_task(i);
    }
#else
    (void)parallel;
    for (long i = 0; i < n_tasks; ++i) {
        run_task(i);
    }
#endif

    // ── Fan-in: merge per rule in grid order, then verify ───────────────
    MultiModalVerifier verifier(opts_.verifier);
    std::map<std::string, std::vector<TestCase>> out;
    for (std::size_t r = 0; r < rules.size(); ++r) {
        const Rule& rule = rules[r];
        std::vector<TestCase> merged;
        for (std::size_t k = 0; k < techs.size(); ++k) {
            admit(merged, std::move(slots[r * techs.size() + k]), rule, spec);
        }
        std::vector<TestCase> kept = verifier.verify(rule, spec, std::move(merged), rules);

        std::vector<TestCase>& bucket = out[rule.id];
        std::move(kept.begin(), kept.end(), std::back_inserter(bucket));
    }

    log_info("generated tests for " + std::to_string(rules.size()) + " rule(s) over " +
             std::to_string(tasks.size()) + " task(s)");
    return out;
}

std::vector<TestCase> TestGenerator::generate_tests_for_rule(const Rule& rule,
                                                             const Specification& spec,
                                                             const std::vector<Technique>& techniques) const {
    auto all = generate_tests({rule}, spec, false, techniques);
    return std::move(all[rule.id]);
}

// ── Verification ────────────────────────────────────────────────────────────

ValidationResult TestGenerator::verify_rule(const Rule& rule, const Specification& spec) const {
    return SmtVerifier(opts_.verifier).verify_rule(rule, spec);
}

std::vector<ValidationResult> TestGenerator::verify_rule_set(const std::vector<Rule>& rules,
                                                             const Specification& spec) const {
    return SmtVerifier(opts_.verifier).verify_rule_set(rules, spec);
}

}  // namespace edc
