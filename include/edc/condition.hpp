// ============================================================================
// edc/condition.hpp — Typed expression tree for edit-check conditions
// ============================================================================
//
// Design notes:
//
//   Every condition is represented as a node in an interned DAG.  Two
//   sub-expressions that are structurally identical share the same ExprId,
//   so duplicate clauses are detected by id equality.
//
//   Node types:
//     - True/False/Null : constants
//     - Field           : field reference ("Form.Field" or a bare name)
//     - Number          : numeric literal (value in `number`)
//     - String          : quoted literal
//     - Date            : ISO date literal (days since epoch in `number`)
//     - Compare         : children[0] <op> children[1]
//     - In / NotIn      : children[0] in { children[1..] }
//     - Between         : children[1] <= children[0] <= children[2]
//     - IsNull/IsNotNull: children[0]
//     - Not             : children[0]
//     - And / Or        : n-ary, flattened, order-preserving
//     - IfThenElse      : children[0] ? children[1] : children[2]; with only
//                         two children the missing branch is "true", which
//                         makes the node an implication
//
//   A bare boolean field "Form.Flag" is parsed as Compare(=, Form.Flag, TRUE).
//
//   Condition owns all nodes plus a root.  It is the single shared view of
//   "which fields and comparisons does this rule mention" consumed by the
//   verifier, the generators and the evaluator.
//
// ============================================================================

#ifndef EDC_CONDITION_HPP
#define EDC_CONDITION_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace edc {

// ── ExprId ──────────────────────────────────────────────────────────────────

using ExprId = std::uint32_t;
inline constexpr ExprId kInvalidExpr = static_cast<ExprId>(-1);

// ── CompareOp ───────────────────────────────────────────────────────────────

enum class CompareOp : std::uint8_t {
    Eq,
    Ne,
    Lt,
    Le,
    Gt,
    Ge
};

const char* compare_op_symbol(CompareOp op) noexcept;

/// Accepts = == != <> < <= > >=.
std::optional<CompareOp> parse_compare_op(std::string_view text) noexcept;

/// Operator after swapping the operands:  a < b  ==  b > a.
CompareOp mirror(CompareOp op) noexcept;

/// Logical complement:  !(a < b)  ==  a >= b.
CompareOp negate(CompareOp op) noexcept;

/// Apply the operator to two ordered values.
template <typename T>
bool apply_compare(CompareOp op, const T& a, const T& b) {
    switch (op) {
        case CompareOp::Eq: return a == b;
        case CompareOp::Ne: return a != b;
        case CompareOp::Lt: return a < b;
        case CompareOp::Le: return a <= b;
        case CompareOp::Gt: return a > b;
        case CompareOp::Ge: return a >= b;
    }
    return false;
}

// ── ExprKind ────────────────────────────────────────────────────────────────

enum class ExprKind : std::uint8_t {
    True,
    False,
    Null,
    Field,
    Number,
    String,
    Date,
    Compare,
    In,
    NotIn,
    Between,
    IsNull,
    IsNotNull,
    Not,
    And,
    Or,
    IfThenElse
};

const char* expr_kind_name(ExprKind k) noexcept;

/// True for leaf kinds that can stand on either side of a comparison.
bool is_operand_kind(ExprKind k) noexcept;

// ── ExprNode ────────────────────────────────────────────────────────────────

struct ExprNode {
    ExprKind            kind{};
    CompareOp           op = CompareOp::Eq;  // Compare only
    std::string         text;                // field name / literal text
    double              number = 0.0;        // Number value, Date day count
    std::vector<ExprId> children;

    bool operator==(const ExprNode& o) const noexcept;
};

struct ExprNodeHash {
    std::size_t operator()(const ExprNode& n) const noexcept;
};

// ── Condition ───────────────────────────────────────────────────────────────
// Not thread-safe; every task builds its own.

class Condition {
public:
    Condition();

    // ── Leaves ──────────────────────────────────────────────────────────
    ExprId make_true();
    ExprId make_false();
    ExprId make_null();
    ExprId make_field(const std::string& name);
    ExprId make_number(double value, const std::string& text);
    ExprId make_string(const std::string& text);
    ExprId make_date(std::int64_t days, const std::string& text);

    // ── Predicates ──────────────────────────────────────────────────────
    ExprId make_compare(CompareOp op, ExprId lhs, ExprId rhs);
    ExprId make_in(ExprId operand, const std::vector<ExprId>& values, bool negated);
    ExprId make_between(ExprId operand, ExprId low, ExprId high);
    ExprId make_is_null(ExprId operand, bool negated);

    // ── Connectives ─────────────────────────────────────────────────────
    ExprId make_not(ExprId child);
    ExprId make_and(const std::vector<ExprId>& children);
    ExprId make_or(const std::vector<ExprId>& children);
    ExprId make_if(ExprId cond, ExprId then_branch, ExprId else_branch = kInvalidExpr);

    // ── Accessors ───────────────────────────────────────────────────────
    const ExprNode& node(ExprId id) const;
    std::size_t     size() const noexcept;

    ExprId root() const noexcept { return root_; }
    void   set_root(ExprId id) noexcept { root_ = id; }
    bool   has_root() const noexcept { return root_ != kInvalidExpr; }

    /// Fully parenthesised rendering.
    std::string to_string(ExprId id) const;
    std::string to_string() const { return to_string(root_); }

    /// Field names below `id`, in order of first appearance.
    std::vector<std::string> field_references(ExprId id) const;

private:
    ExprId intern(ExprNode node);
    ExprId make_nary(ExprKind kind, const std::vector<ExprId>& children);

    std::vector<ExprNode>                                nodes_;
    std::unordered_map<ExprNode, ExprId, ExprNodeHash>   intern_;
    ExprId                                               root_ = kInvalidExpr;
};

// ── Atomic comparisons ──────────────────────────────────────────────────────

enum class OperandKind : std::uint8_t {
    Field,
    Number,
    String,
    Date,
    Boolean,
    Null
};

struct Operand {
    OperandKind kind = OperandKind::Null;
    std::string text;          // field name or literal text
    double      number = 0.0;  // Number value, Date day count, Boolean 0/1

    bool is_field() const noexcept { return kind == OperandKind::Field; }
};

struct Comparison {
    Operand   lhs;
    CompareOp op = CompareOp::Eq;
    Operand   rhs;

    bool field_vs_literal() const noexcept { return lhs.is_field() && !rhs.is_field(); }
    bool field_vs_field() const noexcept { return lhs.is_field() && rhs.is_field(); }
    std::string to_string() const;
};

/// Comparisons found in the tree below `id`.  A literal-vs-field comparison
/// is re-oriented so the field is on the left; BETWEEN yields >= and <=.
std::vector<Comparison> comparisons_of(const Condition& cond, ExprId id);

// ── Extraction (never throws) ───────────────────────────────────────────────
// Parses the full grammar when possible, otherwise scans tokens leniently
// and keeps whatever "operand op operand" triples and dotted names it finds.

std::vector<std::string> extract_field_references(std::string_view condition);
std::vector<Comparison>  extract_comparisons(std::string_view condition);

/// Build a conjunction of the leniently scanned comparisons.  Returns
/// kInvalidExpr when nothing usable was found.
ExprId conjunction_of(const std::vector<Comparison>& comparisons, Condition& cond);

}  // namespace edc

#endif  // EDC_CONDITION_HPP
