// ============================================================================
// edc/adversarial.hpp — Edge-case and hostile-input test generation
// ============================================================================
//
// Design notes:
//
//   Five strategies, each run in isolation (one throwing never stops the
//   others):
//
//     boundary          at and 0.001 (1 day for dates) either side of every
//                       numeric or date literal threshold
//     missing_value     the field's form present, the field absent
//     type_confusion    a value of an incompatible type
//     logical_inversion threshold -/+ 1 opposite the operator, or another
//                       valid category; expected only true for !=
//     special_value     0, -1, +/-inf, NaN; 1900-01-01, 2100-12-31, today;
//                       "", " ", "NULL", "null", "None", "undefined", ...
//
//   A MutationProposer, when present and available, contributes extra
//   scenarios tagged Technique::Llm.  Its exceptions are logged and
//   dropped, and so are proposals whose data paths are not declared for
//   the rule.
//
//   Boundary and inversion labels describe the single comparison they
//   target; the multi-modal verifier decides which survive for the rule.
//
// ============================================================================

#ifndef EDC_ADVERSARIAL_HPP
#define EDC_ADVERSARIAL_HPP

#include "edc/model.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace edc {

// ── MutationProposer ────────────────────────────────────────────────────────
// External scenario source (e.g. a text-generation service).

struct MutationProposal {
    std::string description;
    bool        expected_result = false;
    TestData    test_data;
};

class MutationProposer {
public:
    virtual ~MutationProposer() = default;

    virtual bool available() const = 0;

    /// May return an empty list.  Should not throw; the generator guards
    /// against it anyway.
    virtual std::vector<MutationProposal> propose_mutations(const Rule& rule,
                                                            const Specification& spec) = 0;
};

// ── AdversarialStrategy ─────────────────────────────────────────────────────

enum class AdversarialStrategy : std::uint8_t {
    Boundary,
    MissingValue,
    TypeConfusion,
    LogicalInversion,
    SpecialValue
};

const char* adversarial_strategy_name(AdversarialStrategy s) noexcept;

const std::vector<AdversarialStrategy>& adversarial_strategies();

// ── AdversarialGenerator ────────────────────────────────────────────────────

class AdversarialGenerator {
public:
    explicit AdversarialGenerator(std::shared_ptr<MutationProposer> proposer = nullptr);

    /// Every strategy in order, then the proposer's scenarios.
    std::vector<TestCase> generate_tests(const Rule& rule, const Specification& spec) const;

    /// One strategy.  May throw; generate_tests() contains that.
    std::vector<TestCase> run_strategy(AdversarialStrategy s, const Rule& rule,
                                       const Specification& spec) const;

    /// Proposals that name only declared fields of the rule's forms.
    std::vector<TestCase> proposed_tests(const Rule& rule, const Specification& spec) const;

private:
    std::shared_ptr<MutationProposer> proposer_;
};

}  // namespace edc

#endif  // EDC_ADVERSARIAL_HPP
