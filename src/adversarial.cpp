// ============================================================================
// adversarial.cpp — Edge-case and hostile-input test generation
// ============================================================================

#include "edc/adversarial.hpp"
#include "edc/condition.hpp"
#include "edc/log.hpp"
#include "edc/utils.hpp"

#include <iterator>
#include <limits>
#include <optional>
#include <utility>

namespace edc {

const char* adversarial_strategy_name(AdversarialStrategy s) noexcept {
    switch (s) {
        case AdversarialStrategy::Boundary:         return "boundary";
        case AdversarialStrategy::MissingValue:     return "missing_value";
        case AdversarialStrategy::TypeConfusion:    return "type_confusion";
        case AdversarialStrategy::LogicalInversion: return "logical_inversion";
        case AdversarialStrategy::SpecialValue:     return "special_value";
    }
    return "?";
}

const std::vector<AdversarialStrategy>& adversarial_strategies() {
    static const std::vector<AdversarialStrategy> kAll = {
        AdversarialStrategy::Boundary,      AdversarialStrategy::MissingValue,
        AdversarialStrategy::TypeConfusion, AdversarialStrategy::LogicalInversion,
        AdversarialStrategy::SpecialValue};
    return kAll;
}

AdversarialGenerator::AdversarialGenerator(std::shared_ptr<MutationProposer> proposer)
    : proposer_(std::move(proposer)) {}

// ── Rule view ───────────────────────────────────────────────────────────────

namespace {

constexpr double kNudge = 0.001;

struct FieldInfo {
    std::string  ref;
    FieldPath    path;
    FieldType    type = FieldType::Numeric;
    const Field* decl = nullptr;
};

struct RuleView {
    std::vector<FieldInfo>  fields;
    std::vector<Comparison> comparisons;

    const FieldInfo* find(const std::string& ref) const {
        for (const FieldInfo& f : fields) {
            if (f.ref == ref) return &f;
        }
        return nullptr;
    }
};

RuleView view_of(const Rule& rule, const Specification& spec) {
    RuleView view;
    const std::vector<std::string> forms = rule_forms(rule, spec);
    const std::string& text = rule.working_condition();
    view.comparisons = extract_comparisons(text);

    for (const std::string& ref : extract_field_references(text)) {
        auto path = field_path_of(ref, spec, forms);
        if (!path) continue;

        FieldInfo info;
        info.ref  = ref;
        info.path = *path;
        info.decl = spec.find_field(path->form, path->field);
        if (info.decl) {
            info.type = info.decl->type;
        } else {
            for (const Comparison& c : view.comparisons) {
                if (c.lhs.text != ref || !c.field_vs_literal()) continue;
                if (c.rhs.kind == OperandKind::Date ||
                    (c.rhs.kind == OperandKind::String && parse_date(c.rhs.text))) {
                    info.type = FieldType::Date;
                } else if (c.rhs.kind == OperandKind::String) {
                    info.type = FieldType::Text;
                } else if (c.rhs.kind == OperandKind::Boolean) {
                    info.type = FieldType::Boolean;
                }
                break;
            }
        }
        view.fields.push_back(std::move(info));
    }
    return view;
}

std::optional<std::int64_t> date_threshold(const Operand& o) {
    if (o.kind == OperandKind::Date) return static_cast<std::int64_t>(o.number);
    if (o.kind == OperandKind::String) return parse_date(o.text);
    return std::nullopt;
}

std::optional<double> numeric_threshold(const Operand& o) {
    if (o.kind == OperandKind::Number) return o.number;
    if (o.kind == OperandKind::String) return parse_number(o.text);
    return std::nullopt;
}

/// (offset, expected) pairs around a threshold, in nudge units.
std::vector<std::pair<int, bool>> boundary_points(CompareOp op) {
    switch (op) {
        case CompareOp::Gt:
        case CompareOp::Ge: return {{0, op == CompareOp::Ge}, {-1, false}, {+1, true}};
        case CompareOp::Lt:
        case CompareOp::Le: return {{0, op == CompareOp::Le}, {+1, false}, {-1, true}};
        case CompareOp::Eq: return {{0, true}, {-1, false}, {+1, false}};
        case CompareOp::Ne: return {{0, false}, {+1, true}};
    }
    return {};
}

}  // namespace

// ── Strategies ──────────────────────────────────────────────────────────────

std::vector<TestCase> AdversarialGenerator::run_strategy(AdversarialStrategy s, const Rule& rule,
                                                         const Specification& spec) const {
    std::vector<TestCase> tests;
    const RuleView view = view_of(rule, spec);
    const std::string tag = std::string("Adversarial ") + adversarial_strategy_name(s) + ": ";

    auto emit = [&](const std::string& what, bool expected, TestData data) {
        TestCase tc;
        tc.rule_id         = rule.id;
        tc.description     = tag + what;
        tc.expected_result = expected;
        tc.test_data       = std::move(data);
        tc.technique       = Technique::Adversarial;
        tc.is_positive     = expected;
        tests.push_back(std::move(tc));
    };
    auto single = [](const FieldPath& p, Value v) {
        TestData data;
        set_value(data, p, std::move(v));
        return data;
    };

    switch (s) {
        case AdversarialStrategy::Boundary:
            for (const Comparison& c : view.comparisons) {
                if (!c.field_vs_literal()) continue;
                const FieldInfo* f = view.find(c.lhs.text);
                if (!f) continue;

                if (is_temporal(f->type)) {
                    auto t = date_threshold(c.rhs);
                    if (!t) continue;
                    for (const auto& [offset, expected] : boundary_points(c.op)) {
                        const std::string d = format_date(*t + offset);
                        emit(f->ref + " = " + d + " against " + c.to_string(), expected,
                             single(f->path, d));
                    }
                } else if (f->type == FieldType::Numeric) {
                    auto t = numeric_threshold(c.rhs);
                    if (!t) continue;
                    for (const auto& [offset, expected] : boundary_points(c.op)) {
                        const double v = *t + offset * kNudge;
                        emit(f->ref + " = " + format_number(v) + " against " + c.to_string(), expected,
                             single(f->path, v));
                    }
                }
            }
            break;

        case AdversarialStrategy::MissingValue:
            for (const FieldInfo& f : view.fields) {
                TestData data;
                data[f.path.form];
                emit(f.ref + " omitted", false, std::move(data));
            }
            break;

        case AdversarialStrategy::TypeConfusion:
            for (const FieldInfo& f : view.fields) {
                std::optional<Value> bad;
                if (f.type == FieldType::Numeric) {
                    bad = Value{std::string("not_a_number")};
                } else if (is_temporal(f.type)) {
                    bad = Value{std::string("not_a_date")};
                } else if (f.type == FieldType::Categorical) {
                    if (f.decl && !f.decl->valid_values.empty()) bad = Value{std::string("invalid_category")};
                } else if (f.type == FieldType::Text) {
                    bad = Value{12345.0};
                } else if (f.type == FieldType::Boolean) {
                    bad = Value{std::string("not_a_boolean")};
                }
                if (!bad) continue;
                emit(f.ref + " = " + value_to_string(*bad) + " (" + field_type_name(f.type) +
                     " expected)", false, single(f.path, *bad));
            }
            break;

        case AdversarialStrategy::LogicalInversion:
            for (const Comparison& c : view.comparisons) {
                if (!c.field_vs_literal()) continue;
                const FieldInfo* f = view.find(c.lhs.text);
                if (!f) continue;
                const bool expected = c.op == CompareOp::Ne;

                if (f->type == FieldType::Numeric) {
                    auto t = numeric_threshold(c.rhs);
                    if (!t) continue;
                    const double v = (c.op == CompareOp::Gt || c.op == CompareOp::Ge) ? *t - 1.0 : *t + 1.0;
                    emit(f->ref + " = " + format_number(v) + " inverts " + c.to_string(), expected,
                         single(f->path, v));
                } else if (f->type == FieldType::Categorical && f->decl &&
                           (c.op == CompareOp::Eq || c.op == CompareOp::Ne)) {
                    for (const std::string& alt : f->decl->valid_values) {
                        if (iequals(alt, c.rhs.text)) continue;
                        emit(f->ref + " = " + alt + " inverts " + c.to_string(), expected,
                             single(f->path, alt));
                        break;
                    }
                }
            }
            break;

        case AdversarialStrategy::SpecialValue:
            for (const FieldInfo& f : view.fields) {
                std::vector<Value> values;
                if (f.type == FieldType::Numeric) {
                    values = {0.0, -1.0, std::numeric_limits<double>::infinity(),
                              -std::numeric_limits<double>::infinity(),
                              std::numeric_limits<double>::quiet_NaN()};
                } else if (is_temporal(f.type)) {
                    values = {std::string("1900-01-01"), std::string("2100-12-31"),
                              format_date(today_days())};
                } else if (f.type == FieldType::Text) {
                    for (const char* s : {"", " ", "NULL", "null", "None", "undefined"}) {
                        values.emplace_back(std::string(s));
                    }
                } else if (f.type == FieldType::Categorical) {
                    for (const char* s : {"", " ", "OTHER", "Unknown"}) {
                        values.emplace_back(std::string(s));
                    }
                }
                for (const Value& v : values) {
                    emit(f.ref + " = '" + value_to_string(v) + "'", false, single(f.path, v));
                }
            }
            break;
    }
    return tests;
}

// ── Proposer ────────────────────────────────────────────────────────────────

std::vector<TestCase> AdversarialGenerator::proposed_tests(const Rule& rule,
                                                           const Specification& spec) const {
    std::vector<TestCase> tests;
    if (!proposer_) return tests;

    std::vector<MutationProposal> proposals;
    try {
        if (!proposer_->available()) return tests;
        proposals = proposer_->propose_mutations(rule, spec);
    } catch (const std::exception& e) {
        log_warning("mutation proposer failed for " + rule.id + ": " + e.what());
        return tests;
    }

    for (MutationProposal& p : proposals) {
        TestCase tc;
        tc.rule_id         = rule.id;
        tc.description     = p.description.empty() ? "Proposed scenario" : p.description;
        tc.expected_result = p.expected_result;
        tc.test_data       = std::move(p.test_data);
        tc.technique       = Technique::Llm;
        tc.is_positive     = p.expected_result;
        if (!validate_test_data(tc, rule, spec)) {
            log_debug("dropping proposed scenario with undeclared fields: " + tc.description);
            continue;
        }
        tests.push_back(std::move(tc));
    }
    return tests;
}

// ── generate_tests ──────────────────────────────────────────────────────────

std::vector<TestCase> AdversarialGenerator::generate_tests(const Rule& rule,
                                                           const Specification& spec) const {
    std::vector<TestCase> tests;
    for (AdversarialStrategy s : adversarial_strategies()) {
        try {
            std::vector<TestCase> part = run_strategy(s, rule, spec);
            tests.insert(tests.end(), std::make_move_iterator(part.begin()),
                         std::make_move_iterator(part.end()));
        } catch (const std::exception& e) {
            log_warning(std::string("adversarial strategy '") + adversarial_strategy_name(s) +
                        "' failed for " + rule.id + ": " + e.what());
        }
    }

    std::vector<TestCase> proposed = proposed_tests(rule, spec);
    tests.insert(tests.end(), std::make_move_iterator(proposed.begin()),
                 std::make_move_iterator(proposed.end()));

    log_info("adversarial: generated " + std::to_string(tests.size()) + " tests for rule " + rule.id);
    return tests;
}

}  // namespace edc
