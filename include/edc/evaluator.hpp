// ============================================================================
// edc/evaluator.hpp — Direct evaluation of a condition on concrete data
// ============================================================================
//
// Design notes:
//
//   A tree walk over Condition; no text substitution and no general
//   expression evaluator.  Field operands are looked up in the test data;
//   a missing key and an explicit NULL are the same thing.
//
//   Comparison semantics:
//     NULL        only "=" between two NULLs holds ("!=" is its negation),
//                 ordering against NULL is false
//     NaN         false, except "!="
//     types       taken from the declared field when one side is a field;
//                 otherwise from the values.  A value that cannot be
//                 converted makes "=" false, "!=" true, ordering false
//     dates       compared as day counts, strings lexicographically
//
//   nullopt means "no opinion": the condition does not parse, or a node
//   cannot be evaluated as a condition (a bare literal).
//
// ============================================================================

#ifndef EDC_EVALUATOR_HPP
#define EDC_EVALUATOR_HPP

#include "edc/condition.hpp"
#include "edc/model.hpp"

#include <optional>
#include <string>
#include <vector>

namespace edc {

class Evaluator {
public:
    explicit Evaluator(const Specification& spec, std::vector<std::string> preferred_forms = {});

    std::optional<bool> evaluate(const Condition& cond, const TestData& data) const;
    std::optional<bool> evaluate(const Condition& cond, ExprId id, const TestData& data) const;

    /// Value of an operand node; std::monostate when absent.
    Value operand_value(const Condition& cond, ExprId id, const TestData& data) const;

    bool compare(CompareOp op, const Value& a, const Value& b,
                 std::optional<FieldType> context) const;

private:
    std::optional<FieldType> context_of(const Condition& cond, ExprId a, ExprId b) const;
    bool compare_nodes(const Condition& cond, CompareOp op, ExprId a, ExprId b,
                       const TestData& data) const;

    const Specification&     spec_;
    std::vector<std::string> preferred_forms_;
};

/// Compile the rule's working condition and evaluate it.
std::optional<bool> evaluate_rule(const Rule& rule, const Specification& spec, const TestData& data);

}  // namespace edc

#endif  // EDC_EVALUATOR_HPP
