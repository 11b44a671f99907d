// ============================================================================
// causal.cpp — Field influence graph and intervention-style tests
// ============================================================================

#include "edc/causal.hpp"
#include "edc/log.hpp"
#include "edc/utils.hpp"

#include <algorithm>
#include <cmath>
#include <deque>
#include <iterator>
#include <stdexcept>

namespace edc {

const char* relationship_name(Relationship r) noexcept {
    switch (r) {
        case Relationship::Temporal:   return "temporal";
        case Relationship::Form:       return "form";
        case Relationship::Comparison: return "comparison";
    }
    return "?";
}

// ── CausalGraph ─────────────────────────────────────────────────────────────

void CausalGraph::add_node(const std::string& name) {
    if (index_.count(name)) return;
    index_.emplace(name, names_.size());
    names_.push_back(name);
    out_.emplace_back();
    in_count_.push_back(0);
}

void CausalGraph::add_edge(const std::string& from, const std::string& to, CausalEdge edge) {
    add_node(from);
    add_node(to);
    const std::size_t u = index_.at(from);
    const std::size_t v = index_.at(to);

    for (auto& [target, e] : out_[u]) {
        if (target == v) {
            e = edge;
            return;
        }
    }
    out_[u].emplace_back(v, edge);
    ++in_count_[v];
}

bool CausalGraph::has_node(const std::string& name) const {
    return index_.count(name) != 0;
}

std::size_t CausalGraph::edge_count() const noexcept {
    std::size_t n = 0;
    for (const auto& adj : out_) n += adj.size();
    return n;
}

std::size_t CausalGraph::index_of(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) {
        throw std::out_of_range("no node '" + name + "' in causal graph");
    }
    return it->second;
}

const CausalEdge* CausalGraph::edge(const std::string& from, const std::string& to) const {
    auto u = index_.find(from);
    auto v = index_.find(to);
    if (u == index_.end() || v == index_.end()) return nullptr;
    for (const auto& [target, e] : out_[u->second]) {
        if (target == v->second) return &e;
    }
    return nullptr;
}

std::vector<std::string> CausalGraph::successors(const std::string& name) const {
    std::vector<std::string> out;
    for (const auto& [target, e] : out_[index_of(name)]) {
        out.push_back(names_[target]);
    }
    return out;
}

std::size_t CausalGraph::in_degree(const std::string& name) const {
    return in_count_[index_of(name)];
}

std::size_t CausalGraph::out_degree(const std::string& name) const {
    return out_[index_of(name)].size();
}

double CausalGraph::degree_centrality(const std::string& name) const {
    const std::size_t n = names_.size();
    if (n <= 1) return has_node(name) ? 1.0 : 0.0;
    return static_cast<double>(in_degree(name) + out_degree(name)) / static_cast<double>(n - 1);
}

std::vector<std::pair<std::string, std::string>> CausalGraph::descendant_tree(
        const std::string& name) const {
    std::vector<std::pair<std::string, std::string>> tree;
    const std::size_t start = index_of(name);

    std::vector<bool> seen(names_.size(), false);
    seen[start] = true;
    std::deque<std::size_t> queue{start};
    while (!queue.empty()) {
        const std::size_t u = queue.front();
        queue.pop_front();
        for (const auto& [v, e] : out_[u]) {
            if (seen[v]) continue;
            seen[v] = true;
            tree.emplace_back(names_[v], names_[u]);
            queue.push_back(v);
        }
    }
    return tree;
}

std::vector<std::string> CausalGraph::descendants(const std::string& name) const {
    std::vector<std::string> out;
    for (auto& [child, parent] : descendant_tree(name)) {
        out.push_back(child);
    }
    return out;
}

std::vector<std::string> CausalGraph::top_nodes(std::size_t k) const {
    std::vector<std::string> ranked = names_;
    std::stable_sort(ranked.begin(), ranked.end(), [this](const std::string& a, const std::string& b) {
        return degree_centrality(a) > degree_centrality(b);
    });
    if (ranked.size() > k) ranked.resize(k);
    return ranked;
}

// ── build_causal_graph ──────────────────────────────────────────────────────

CausalGraph build_causal_graph(const Rule& rule, const Specification& spec) {
    CausalGraph graph;
    const std::vector<std::string> forms = rule_forms(rule, spec);
    const std::string& text = rule.working_condition();

    std::vector<FieldPath> paths;
    for (const std::string& ref : extract_field_references(text)) {
        auto p = field_path_of(ref, spec, forms);
        if (!p || graph.has_node(p->ref())) continue;
        graph.add_node(p->ref());
        paths.push_back(*p);
    }

    // 1. temporal
    std::vector<std::string> dates;
    for (const FieldPath& p : paths) {
        const Field* f = spec.find_field(p.form, p.field);
        if (f && is_temporal(f->type)) dates.push_back(p.ref());
    }
    for (std::size_t i = 0; i < dates.size(); ++i) {
        for (std::size_t j = i + 1; j < dates.size(); ++j) {
            graph.add_edge(dates[i], dates[j], CausalEdge{Relationship::Temporal, std::nullopt});
        }
    }

    // 2. form
    for (std::size_t i = 0; i < paths.size(); ++i) {
        for (std::size_t j = i + 1; j < paths.size(); ++j) {
            if (paths[i].form != paths[j].form) continue;
            graph.add_edge(paths[i].ref(), paths[j].ref(), CausalEdge{Relationship::Form, std::nullopt});
            graph.add_edge(paths[j].ref(), paths[i].ref(), CausalEdge{Relationship::Form, std::nullopt});
        }
    }

    // 3. comparison
    for (const Comparison& c : extract_comparisons(text)) {
        if (!c.field_vs_field()) continue;
        auto a = field_path_of(c.lhs.text, spec, forms);
        auto b = field_path_of(c.rhs.text, spec, forms);
        if (!a || !b || *a == *b) continue;
        graph.add_edge(a->ref(), b->ref(), CausalEdge{Relationship::Comparison, c.op});
        graph.add_edge(b->ref(), a->ref(), CausalEdge{Relationship::Comparison, mirror(c.op)});
    }

    return graph;
}

// ── CausalTestGenerator ─────────────────────────────────────────────────────

namespace {

FieldPath split_node(const std::string& node) {
    const auto dot = node.find('.');
    return FieldPath{node.substr(0, dot), node.substr(dot + 1)};
}

std::string other_category(const std::string& value, const Field* decl) {
    if (decl) {
        for (const std::string& v : decl->valid_values) {
            if (!iequals(v, value)) return v;
        }
    }
    return value == "Category A" ? "Category B" : "Category A";
}

}  // namespace

CausalTestGenerator::CausalTestGenerator(unsigned seed, std::size_t top_k,
                                         std::size_t counterfactual_top_k)
    : rng_(seed), top_k_(top_k), counterfactual_top_k_(counterfactual_top_k) {}

double CausalTestGenerator::uniform(double a, double b) {
    const double x = std::uniform_real_distribution<double>(a, b)(rng_);
    return std::round(x * 100.0) / 100.0;
}

int CausalTestGenerator::uniform_int(int a, int b) {
    return std::uniform_int_distribution<int>(a, b)(rng_);
}

std::vector<Value> CausalTestGenerator::probe_values(FieldType type, const Field* decl) {
    if (type == FieldType::Numeric) return {0.0, 10.0, 100.0};
    if (is_temporal(type)) {
        const std::int64_t today = today_days();
        return {format_date(today), format_date(today - 30), format_date(today + 30)};
    }
    if (type == FieldType::Boolean) return {true, false};
    if (type == FieldType::Categorical) {
        std::vector<Value> out;
        if (decl && !decl->valid_values.empty()) {
            for (const std::string& v : decl->valid_values) out.emplace_back(v);
        } else {
            for (const char* v : {"Category A", "Category B", "Other"}) out.emplace_back(std::string(v));
        }
        return out;
    }
    return {std::string("Test Value"), std::string()};
}

Value CausalTestGenerator::independent_value(FieldType type, const Field* decl) {
    if (type == FieldType::Numeric) return uniform(0.0, 100.0);
    if (is_temporal(type))          return format_date(today_days());
    if (type == FieldType::Boolean) return true;
    if (type == FieldType::Categorical) {
        return decl && !decl->valid_values.empty() ? decl->valid_values.front() : std::string("Category A");
    }
    return std::string("Test Value");
}

Value CausalTestGenerator::base_value(FieldType type, const Field* decl) {
    if (type == FieldType::Numeric) return uniform(10.0, 50.0);
    if (type == FieldType::Text)    return std::string("Base Value");
    return independent_value(type, decl);
}

Value CausalTestGenerator::flipped_value(FieldType type, const Field* decl, const Value& base) {
    if (const double* d = std::get_if<double>(&base)) {
        if (type == FieldType::Numeric) return -*d;
    }
    if (const bool* b = std::get_if<bool>(&base)) return !*b;
    if (const std::string* s = std::get_if<std::string>(&base)) {
        if (is_temporal(type)) {
            if (auto days = parse_date(*s)) return format_date(*days + 180);
        }
        if (type == FieldType::Categorical) return other_category(*s, decl);
    }
    return std::string("Counterfactual Value");
}

Value CausalTestGenerator::derived_value(const CausalEdge& edge, const Value& parent, FieldType type,
                                         const Field* decl) {
    const double* pnum = std::get_if<double>(&parent);
    const std::string* pstr = std::get_if<std::string>(&parent);
    std::optional<std::int64_t> pday;
    if (pstr) pday = parse_date(*pstr);

    switch (edge.relationship) {
        case Relationship::Temporal:
            if (is_temporal(type) && pday) return format_date(*pday + uniform_int(1, 30));
            break;

        case Relationship::Form:
            if (type == FieldType::Numeric && pnum) return *pnum + uniform(-10.0, 10.0);
            break;

        case Relationship::Comparison: {
            const CompareOp op = edge.op.value_or(CompareOp::Eq);
            if (type == FieldType::Numeric && pnum) {
                switch (op) {
                    case CompareOp::Gt: return *pnum - uniform(1.0, 10.0);
                    case CompareOp::Ge: return *pnum - uniform(0.0, 10.0);
                    case CompareOp::Lt: return *pnum + uniform(1.0, 10.0);
                    case CompareOp::Le: return *pnum + uniform(0.0, 10.0);
                    case CompareOp::Eq: return *pnum;
                    case CompareOp::Ne: return *pnum + (uniform_int(0, 1) == 1 ? 10.0 : -10.0);
                }
            }
            if (is_temporal(type) && pday) {
                switch (op) {
                    case CompareOp::Gt:
                    case CompareOp::Ge: return format_date(*pday - uniform_int(1, 30));
                    case CompareOp::Lt:
                    case CompareOp::Le:
                    case CompareOp::Ne: return format_date(*pday + uniform_int(1, 30));
                    case CompareOp::Eq: return format_date(*pday);
                }
            }
            if (const bool* pb = std::get_if<bool>(&parent); pb && type == FieldType::Boolean) {
                return op == CompareOp::Ne ? !*pb : *pb;
            }
            if (is_textual(type) && pstr) {
                if (op == CompareOp::Eq) return *pstr;
                if (op == CompareOp::Ne) return other_category(*pstr, decl);
            }
            break;
        }
    }
    return independent_value(type, decl);
}

void CausalTestGenerator::propagate(TestData& data, const std::string& node, const CausalGraph& graph,
                                    const Specification& spec) {
    for (const auto& [child, parent] : graph.descendant_tree(node)) {
        const FieldPath cp = split_node(child);
        const FieldPath pp = split_node(parent);
        const Field* decl = spec.find_field(cp.form, cp.field);
        const FieldType type = decl ? decl->type : FieldType::Text;

        const CausalEdge* e = graph.edge(parent, child);
        const Value* pv = find_value(data, pp);
        if (!e || !pv) {
            set_value(data, cp, independent_value(type, decl));
            continue;
        }
        set_value(data, cp, derived_value(*e, *pv, type, decl));
    }
}

// ── Test families ───────────────────────────────────────────────────────────

static TestCase causal_test(const Rule& rule, std::string description, bool expected, TestData data) {
    TestCase tc;
    tc.rule_id         = rule.id;
    tc.description     = std::move(description);
    tc.expected_result = expected;
    tc.test_data       = std::move(data);
    tc.technique       = Technique::Causal;
    tc.is_positive     = expected;
    return tc;
}

std::vector<TestCase> CausalTestGenerator::intervention_tests(const Rule& rule, const Specification& spec,
                                                              const CausalGraph& graph) {
    std::vector<TestCase> tests;
    for (const std::string& node : graph.top_nodes(top_k_)) {
        const FieldPath path = split_node(node);
        const Field* decl = spec.find_field(path.form, path.field);
        const FieldType type = decl ? decl->type : FieldType::Text;

        for (const Value& probe : probe_values(type, decl)) {
            TestData data;
            set_value(data, path, probe);
            propagate(data, node, graph, spec);
            tests.push_back(causal_test(rule, "Causal intervention: do(" + node + " = '" +
                                        value_to_string(probe) + "')", true, std::move(data)));
        }
    }
    return tests;
}

std::vector<TestCase> CausalTestGenerator::counterfactual_tests(const Rule& rule, const Specification& spec,
                                                                const CausalGraph& graph) {
    std::vector<TestCase> tests;
    for (const std::string& node : graph.top_nodes(counterfactual_top_k_)) {
        const FieldPath path = split_node(node);
        const Field* decl = spec.find_field(path.form, path.field);
        const FieldType type = decl ? decl->type : FieldType::Text;

        const Value base = base_value(type, decl);
        TestData data;
        set_value(data, path, base);
        propagate(data, node, graph, spec);

        const Value flipped = flipped_value(type, decl, base);
        set_value(data, path, flipped);
        tests.push_back(causal_test(rule, "Causal counterfactual: " + node + " = '" +
                                    value_to_string(flipped) + "' instead of '" +
                                    value_to_string(base) + "'", false, std::move(data)));
    }
    return tests;
}

std::vector<TestCase> CausalTestGenerator::confounding_tests(const Rule& rule, const Specification& spec,
                                                             const CausalGraph& graph) {
    std::vector<TestCase> tests;
    for (const std::string& node : graph.nodes()) {
        if (graph.out_degree(node) <= 1) continue;
        const std::vector<std::string> desc = graph.descendants(node);
        if (desc.size() < 2) continue;

        std::vector<std::string> picked;
        std::sample(desc.begin(), desc.end(), std::back_inserter(picked), 2, rng_);

        const FieldPath path = split_node(node);
        const Field* decl = spec.find_field(path.form, path.field);
        const Value v = base_value(decl ? decl->type : FieldType::Text, decl);

        TestData data;
        set_value(data, path, v);
        for (const std::string& d : picked) {
            const FieldPath dp = split_node(d);
            const Field* ddecl = spec.find_field(dp.form, dp.field);
            set_value(data, dp, independent_value(ddecl ? ddecl->type : FieldType::Text, ddecl));
        }
        tests.push_back(causal_test(rule, "Causal confounding: " + node + " = '" + value_to_string(v) +
                                    "' with " + picked[0] + ", " + picked[1], true, std::move(data)));
    }
    return tests;
}

std::vector<TestCase> CausalTestGenerator::generate_tests(const Rule& rule, const Specification& spec) {
    const CausalGraph graph = build_causal_graph(rule, spec);
    std::vector<TestCase> tests;
    if (graph.nodes().empty()) return tests;

    log_debug("causal: rule " + rule.id + " graph has " + std::to_string(graph.nodes().size()) +
              " nodes, " + std::to_string(graph.edge_count()) + " edges");

    for (auto family : {&CausalTestGenerator::intervention_tests,
                         &CausalTestGenerator::counterfactual_tests,
                         &CausalTestGenerator::confounding_tests}) {
        std::vector<TestCase> part = (this->*family)(rule, spec, graph);
        tests.insert(tests.end(), std::make_move_iterator(part.begin()),
                     std::make_move_iterator(part.end()));
    }

    log_info("causal: generated " + std::to_string(tests.size()) + " tests for rule " + rule.id);
    return tests;
}

}  // namespace edc
