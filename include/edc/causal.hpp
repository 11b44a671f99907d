// ============================================================================
// edc/causal.hpp — Field influence graph and intervention-style tests
// ============================================================================
//
// Design notes:
//
//   CausalGraph is a plain adjacency list over "Form.Field" node names,
//   kept in order of first appearance.  There is at most one edge per
//   ordered pair; adding another overwrites it.
//
//   build_causal_graph() applies, in order:
//     1. temporal   : date-typed fields i < j         → i → j
//     2. form       : fields sharing a form           → both directions
//     3. comparison : "a <op> b" between two fields   → a → b (op),
//                                                      b → a (mirror(op))
//
//   Edge semantics for a comparison edge u → v with operator op are
//   "u op v"; propagation picks a value for v that makes it hold.
//
//   CausalTestGenerator:
//     intervention   top-k nodes by degree centrality, one test per probe
//                    value; only the node and its descendants are set
//     counterfactual base value propagated, then the node flipped
//     confounding    nodes with out-degree > 1, two random descendants
//
//   Labels are heuristic (intervention/confounding true, counterfactual
//   false); the multi-modal verifier filters them.
//
// ============================================================================

#ifndef EDC_CAUSAL_HPP
#define EDC_CAUSAL_HPP

#include "edc/condition.hpp"
#include "edc/model.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace edc {

// ── Relationship / CausalEdge ───────────────────────────────────────────────

enum class Relationship : std::uint8_t {
    Temporal,
    Form,
    Comparison
};

const char* relationship_name(Relationship r) noexcept;

struct CausalEdge {
    Relationship             relationship = Relationship::Form;
    std::optional<CompareOp> op;   // Comparison only
};

// ── CausalGraph ─────────────────────────────────────────────────────────────

class CausalGraph {
public:
    /// No-op when the node exists.
    void add_node(const std::string& name);

    /// Adds missing endpoints.  Replaces an existing from → to edge.
    void add_edge(const std::string& from, const std::string& to, CausalEdge edge);

    const std::vector<std::string>& nodes() const noexcept { return names_; }
    bool        has_node(const std::string& name) const;
    std::size_t edge_count() const noexcept;

    /// nullptr when there is no from → to edge.
    const CausalEdge* edge(const std::string& from, const std::string& to) const;

    std::vector<std::string> successors(const std::string& name) const;
    std::size_t in_degree(const std::string& name) const;
    std::size_t out_degree(const std::string& name) const;

    /// (in + out) / (n - 1); 1 for a single-node graph.
    double degree_centrality(const std::string& name) const;

    /// Nodes reachable from `name`, excluding it, in BFS order.
    std::vector<std::string> descendants(const std::string& name) const;

    /// (descendant, BFS parent) pairs in BFS order.
    std::vector<std::pair<std::string, std::string>> descendant_tree(const std::string& name) const;

    /// The k most central nodes; ties keep insertion order.
    std::vector<std::string> top_nodes(std::size_t k) const;

private:
    std::size_t index_of(const std::string& name) const;

    std::vector<std::string>                                    names_;
    std::unordered_map<std::string, std::size_t>                index_;
    std::vector<std::vector<std::pair<std::size_t, CausalEdge>>> out_;
    std::vector<std::size_t>                                    in_count_;
};

/// Graph over the rule's field references.
CausalGraph build_causal_graph(const Rule& rule, const Specification& spec);

// ── CausalTestGenerator ─────────────────────────────────────────────────────

class CausalTestGenerator {
public:
    explicit CausalTestGenerator(unsigned seed = 0,
                                 std::size_t top_k = 3,
                                 std::size_t counterfactual_top_k = 2);

    /// Intervention, counterfactual and confounding tests, in that order.
    std::vector<TestCase> generate_tests(const Rule& rule, const Specification& spec);

    std::vector<TestCase> intervention_tests(const Rule& rule, const Specification& spec,
                                             const CausalGraph& graph);
    std::vector<TestCase> counterfactual_tests(const Rule& rule, const Specification& spec,
                                               const CausalGraph& graph);
    std::vector<TestCase> confounding_tests(const Rule& rule, const Specification& spec,
                                            const CausalGraph& graph);

    /// Probe values used for an intervention on a field of this type.
    static std::vector<Value> probe_values(FieldType type, const Field* decl);

private:
    /// Set every descendant of `node` from its BFS parent's value.
    void propagate(TestData& data, const std::string& node, const CausalGraph& graph,
                   const Specification& spec);

    Value derived_value(const CausalEdge& edge, const Value& parent, FieldType type,
                        const Field* decl);
    Value base_value(FieldType type, const Field* decl);
    Value flipped_value(FieldType type, const Field* decl, const Value& base);
    Value independent_value(FieldType type, const Field* decl);

    double uniform(double a, double b);
    int    uniform_int(int a, int b);

    std::mt19937 rng_;
    std::size_t  top_k_;
    std::size_t  counterfactual_top_k_;
};

}  // namespace edc

#endif  // EDC_CAUSAL_HPP
