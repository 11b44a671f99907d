// ============================================================================
// edc/symbolic.hpp — Solver-driven test generation
// ============================================================================
//
// Design notes:
//
//   One SolverSession per generate_tests() call.  The constraint is the
//   encoded condition tree; when the formalized condition does not parse,
//   the leniently extracted comparisons are encoded one by one and the
//   encodable ones are conjoined.
//
//   Output, in order:
//     1. a model of  f   → positive test
//     2. a model of !f   → negative test
//     3. per numeric variable, two boundary tests from a fixed-length
//        bisection over [search_low, search_high]
//
//   Models are first requested under the declared field bounds and valid
//   values; when that is not sat the bare constraint is tried.
//
//   Bisection keeps the invariant  sat(lo) != sat(hi)  for exactly
//   `bisection_iterations` halvings.  The emitted values are the final lo
//   and hi, i.e. the boundary +/- half the final bracket width.
//
// ============================================================================

#ifndef EDC_SYMBOLIC_HPP
#define EDC_SYMBOLIC_HPP

#include "edc/model.hpp"

#include <vector>

namespace edc {

struct SymbolicOptions {
    double   search_low           = -1000.0;
    double   search_high          = 1000.0;
    int      bisection_iterations = 10;
    unsigned timeout_ms           = 0;
};

class SymbolicExecutor {
public:
    explicit SymbolicExecutor(SymbolicOptions opts = {});

    /// Empty when the rule has no formalized condition or nothing in it can
    /// be encoded.  Solver failures are logged and yield fewer tests.
    std::vector<TestCase> generate_tests(const Rule& rule, const Specification& spec) const;

    /// Distance of each boundary test from the discovered boundary.
    double epsilon() const noexcept;

private:
    SymbolicOptions opts_;
};

}  // namespace edc

#endif  // EDC_SYMBOLIC_HPP
