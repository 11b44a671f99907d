// ============================================================================
// edc/metamorphic.hpp — Relation-labelled follow-up tests
// ============================================================================
//
// Design notes:
//
//   Each comparison operator owns a fixed list of (relation, expected)
//   pairs.  A follow-up test perturbs one field of a satisfying base case
//   and takes its label from the table; the rule is never re-evaluated.
//
//     >   increase:T  decrease_within:T  decrease_beyond:F
//     >=  increase:T  decrease_within:T  decrease_beyond:F
//     <   decrease:T  increase_within:T  increase_beyond:F
//     <=  decrease:T  increase_within:T  increase_beyond:F
//     =   exact_match:T  slight_change:F
//     !=  any_change:T   exact_match:F
//
//   With d = |threshold - base| the numeric perturbations are
//     increase / decrease            by d/2 + 1
//     *_within                       by d/2
//     *_beyond                       by 3d/2 + 1
//     exact_match                    threshold
//     slight_change                  threshold + 0.1
//     any_change                     away from threshold by d + 1
//
//   Dates move by whole days: 10 (increase/decrease/any_change), 3
//   (within), 30 (beyond), 1 (slight_change).  Date base values sit 10
//   days inside the satisfying side so the day offsets keep their labels.
//
//   Follow-ups are generated only for numeric and date fields that occur in
//   exactly one comparison; categorical and text fields get base cases only.
//
// ============================================================================

#ifndef EDC_METAMORPHIC_HPP
#define EDC_METAMORPHIC_HPP

#include "edc/condition.hpp"
#include "edc/model.hpp"

#include <cstdint>
#include <random>
#include <vector>

namespace edc {

enum class Relation : std::uint8_t {
    Increase,
    Decrease,
    IncreaseWithin,
    IncreaseBeyond,
    DecreaseWithin,
    DecreaseBeyond,
    ExactMatch,
    SlightChange,
    AnyChange
};

const char* relation_name(Relation r) noexcept;

struct RelationRule {
    Relation relation;
    bool     expected;
};

/// The operator's relations, in table order.
const std::vector<RelationRule>& relations_for(CompareOp op);

/// Follow-up value for a numeric field at `base` compared with `threshold`.
double perturb_numeric(Relation r, double base, double threshold) noexcept;

/// Follow-up day count for a date field.
std::int64_t perturb_date(Relation r, std::int64_t base, std::int64_t threshold) noexcept;

// ── MetamorphicTester ───────────────────────────────────────────────────────

class MetamorphicTester {
public:
    explicit MetamorphicTester(unsigned seed = 0);

    /// Base positive, base negative, then the follow-ups of the positive
    /// base.  Uses the free-text condition when there is no formalized one.
    std::vector<TestCase> generate_tests(const Rule& rule, const Specification& spec);

private:
    std::mt19937 rng_;
};

}  // namespace edc

#endif  // EDC_METAMORPHIC_HPP
