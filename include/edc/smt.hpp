// ============================================================================
// edc/smt.hpp — Z3 encoding of conditions and scoped solver sessions
// ============================================================================
//
// This module provides a wrapper around Z3 for reasoning about edit-check
// conditions over typed clinical fields.
//
// Usage:
//   SolverSession session(spec, rule.forms);
//   z3::expr f = session.encode(cond);
//   {
//       SolverSession::Scope scope(session);
//       session.add(f);
//       if (session.check() == SmtResult::Sat) { ... }
//   }   // constraints of the scope are gone here
//
// Sorts per field type:
//   numeric                 → Real
//   date / datetime / time  → Int  (days since 1970-01-01)
//   categorical / text      → String
//   boolean                 → Bool
//
// Fields missing from the specification take the type implied by the
// literals they are compared with, and Real when nothing implies one.
// NULL is a sentinel value of the field's sort (booleans are never NULL).
//
// IMPORTANT: a session owns its z3::context.  Create one per logical check
// and never share it between threads.
//
// ============================================================================

#ifndef EDC_SMT_HPP
#define EDC_SMT_HPP

#include "edc/condition.hpp"
#include "edc/model.hpp"

#include <z3++.h>

#include <cstdint>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace edc {

// ── EncodeError ─────────────────────────────────────────────────────────────
// A condition (or a test value) that cannot be expressed in the field's sort.

class EncodeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// ── SmtResult ───────────────────────────────────────────────────────────────

enum class SmtResult : std::uint8_t {
    Sat,
    Unsat,
    Unknown
};

const char* smt_result_name(SmtResult r) noexcept;

// ── NULL sentinels ──────────────────────────────────────────────────────────

inline constexpr double       kNumericNull = -9999.0;
inline constexpr std::int64_t kDateNull    = -999999;
inline constexpr const char*  kTextNull    = "<NULL>";

// ── SolverSession ───────────────────────────────────────────────────────────

class SolverSession {
public:
    explicit SolverSession(const Specification& spec,
                           std::vector<std::string> preferred_forms = {},
                           unsigned timeout_ms = 0);

    SolverSession(const SolverSession&) = delete;
    SolverSession& operator=(const SolverSession&) = delete;

    // ── Scope ───────────────────────────────────────────────────────────
    // RAII push/pop.  Everything added while the scope lives is retracted
    // when it ends, including what inner scopes still hold: the solver is
    // popped back to the depth it had when the scope opened.  The
    // destructor never throws; a failing pop is logged.

    class Scope {
    public:
        explicit Scope(SolverSession& session);
        ~Scope();

        Scope(const Scope&) = delete;
        Scope& operator=(const Scope&) = delete;

    private:
        SolverSession& session_;
        unsigned       depth_;
    };

    // ── Encoding ────────────────────────────────────────────────────────

    /// Encode the condition's root.  Throws EncodeError.
    z3::expr encode(const Condition& cond);

    /// Encode an arbitrary sub-tree.  Throws EncodeError.
    z3::expr encode(const Condition& cond, ExprId id);

    /// Canonical variable name: "Form.Field" when resolvable.
    std::string canonical(const std::string& ref) const;

    FieldType type_of(const std::string& ref) const;
    z3::expr  variable(const std::string& ref);
    z3::expr  null_value(const std::string& ref);

    /// The value as a constant of the field's sort.  Throws EncodeError for
    /// values of an incompatible type (and for NaN / infinity).
    z3::expr  literal(const std::string& ref, const Value& v);

    /// Real numeral.  Throws EncodeError for NaN / infinity.
    z3::expr  number(double v);

    /// Declared bounds and valid-value sets of every variable created so
    /// far, except `exclude` (a canonical name).
    z3::expr  domain(const std::string& exclude = {});

    // ── Solving ─────────────────────────────────────────────────────────

    void      add(const z3::expr& e);
    SmtResult check();

    /// Values of every variable in the current model.  Only valid after
    /// check() returned Sat.  NULL sentinels map back to std::monostate.
    std::map<std::string, Value> model_values();

    /// Canonical names of the variables created so far, in creation order.
    const std::vector<std::string>& variables() const noexcept { return order_; }

    z3::context& context() noexcept { return ctx_; }

private:
    void infer_types(const Condition& cond);
    void infer_from(const Condition& cond, ExprId field, ExprId other);

    z3::expr encode_node(const Condition& cond, ExprId id);
    z3::expr encode_compare(const Condition& cond, CompareOp op, ExprId a, ExprId b);
    z3::expr encode_operand(const Condition& cond, ExprId id, FieldType type);
    FieldType context_type(const Condition& cond, ExprId a, ExprId b) const;

    const Specification&     spec_;
    std::vector<std::string> preferred_forms_;
    z3::context              ctx_;
    z3::solver               solver_;

    std::unordered_map<std::string, std::unique_ptr<z3::expr>> vars_;
    std::unordered_map<std::string, FieldType>                 inferred_;
    std::vector<std::string>                                   order_;
};

}  // namespace edc

#endif  // EDC_SMT_HPP
