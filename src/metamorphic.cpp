// ============================================================================
// metamorphic.cpp — Relation-labelled follow-up tests
// ============================================================================

#include "edc/metamorphic.hpp"
#include "edc/log.hpp"
#include "edc/utils.hpp"

#include <cmath>
#include <map>
#include <optional>

namespace edc {

// ── Relation table ──────────────────────────────────────────────────────────

const char* relation_name(Relation r) noexcept {
    switch (r) {
        case Relation::Increase:       return "increase";
        case Relation::Decrease:       return "decrease";
        case Relation::IncreaseWithin: return "increase_within";
        case Relation::IncreaseBeyond: return "increase_beyond";
        case Relation::DecreaseWithin: return "decrease_within";
        case Relation::DecreaseBeyond: return "decrease_beyond";
        case Relation::ExactMatch:     return "exact_match";
        case Relation::SlightChange:   return "slight_change";
        case Relation::AnyChange:      return "any_change";
    }
    return "?";
}

const std::vector<RelationRule>& relations_for(CompareOp op) {
    static const std::vector<RelationRule> kGreater = {
        {Relation::Increase, true},
        {Relation::DecreaseWithin, true},
        {Relation::DecreaseBeyond, false}};
    static const std::vector<RelationRule> kLess = {
        {Relation::Decrease, true},
        {Relation::IncreaseWithin, true},
        {Relation::IncreaseBeyond, false}};
    static const std::vector<RelationRule> kEqual = {
        {Relation::ExactMatch, true},
        {Relation::SlightChange, false}};
    static const std::vector<RelationRule> kNotEqual = {
        {Relation::AnyChange, true},
        {Relation::ExactMatch, false}};

    switch (op) {
        case CompareOp::Gt:
        case CompareOp::Ge: return kGreater;
        case CompareOp::Lt:
        case CompareOp::Le: return kLess;
        case CompareOp::Eq: return kEqual;
        case CompareOp::Ne: return kNotEqual;
    }
    return kEqual;
}

double perturb_numeric(Relation r, double base, double threshold) noexcept {
    const double d = std::fabs(threshold - base);
    switch (r) {
        case Relation::Increase:       return base + (d * 0.5 + 1.0);
        case Relation::Decrease:       return base - (d * 0.5 + 1.0);
        case Relation::IncreaseWithin: return base + d * 0.5;
        case Relation::IncreaseBeyond: return base + (d * 1.5 + 1.0);
        case Relation::DecreaseWithin: return base - d * 0.5;
        case Relation::DecreaseBeyond: return base - (d * 1.5 + 1.0);
        case Relation::ExactMatch:     return threshold;
        case Relation::SlightChange:   return threshold + 0.1;
        case Relation::AnyChange:      return base >= threshold ? base + d + 1.0 : base - d - 1.0;
    }
    return base;
}

std::int64_t perturb_date(Relation r, std::int64_t base, std::int64_t threshold) noexcept {
    switch (r) {
        case Relation::Increase:       return base + 10;
        case Relation::Decrease:       return base - 10;
        case Relation::IncreaseWithin: return base + 3;
        case Relation::IncreaseBeyond: return base + 30;
        case Relation::DecreaseWithin: return base - 3;
        case Relation::DecreaseBeyond: return base - 30;
        case Relation::ExactMatch:     return threshold;
        case Relation::SlightChange:   return threshold + 1;
        case Relation::AnyChange:      return base >= threshold ? base + 10 : base - 10;
    }
    return base;
}

// ── Targets ─────────────────────────────────────────────────────────────────

namespace {

struct Target {
    Comparison               cmp;
    FieldPath                lhs;
    FieldType                type = FieldType::Numeric;
    std::optional<FieldPath> rhs;        // field-to-field only
    FieldType                rhs_type = FieldType::Numeric;
};

FieldType operand_type(const Operand& o) {
    switch (o.kind) {
        case OperandKind::Number:  return FieldType::Numeric;
        case OperandKind::Date:    return FieldType::Date;
        case OperandKind::Boolean: return FieldType::Boolean;
        case OperandKind::String:  return parse_date(o.text) ? FieldType::Date : FieldType::Text;
        default:                   return FieldType::Numeric;
    }
}

std::optional<Value> literal_value(const Operand& o) {
    switch (o.kind) {
        case OperandKind::Number:  return Value{o.number};
        case OperandKind::Date:    return Value{format_date(static_cast<std::int64_t>(o.number))};
        case OperandKind::String:  return Value{o.text};
        case OperandKind::Boolean: return Value{o.number != 0.0};
        default:                   return std::nullopt;
    }
}

std::optional<double> as_number(const Value& v) {
    if (const double* d = std::get_if<double>(&v)) return *d;
    if (const std::string* s = std::get_if<std::string>(&v)) return parse_number(*s);
    return std::nullopt;
}

std::optional<std::int64_t> as_days(const Value& v) {
    if (const std::string* s = std::get_if<std::string>(&v)) return parse_date(*s);
    if (const double* d = std::get_if<double>(&v)) return static_cast<std::int64_t>(std::llround(*d));
    return std::nullopt;
}

bool is_ordering(CompareOp op) {
    return op != CompareOp::Eq && op != CompareOp::Ne;
}

Value default_value(FieldType type, const Field* decl) {
    if (type == FieldType::Numeric) {
        if (decl && decl->min_value && decl->max_value) return (*decl->min_value + *decl->max_value) / 2.0;
        if (decl && decl->min_value) return *decl->min_value + 10.0;
        if (decl && decl->max_value) return *decl->max_value - 10.0;
        return 100.0;
    }
    if (is_temporal(type)) return format_date(today_days());
    if (type == FieldType::Boolean) return true;
    if (type == FieldType::Categorical && decl && !decl->valid_values.empty()) {
        return decl->valid_values.front();
    }
    return std::string(type == FieldType::Categorical ? "Category A" : "Test Value");
}

std::string other_category(const std::string& value, const Field* decl) {
    if (decl) {
        for (const std::string& v : decl->valid_values) {
            if (!iequals(v, value)) return v;
        }
    }
    return iequals(value, "Other") ? "Unknown" : "Other";
}

}  // namespace

// ── MetamorphicTester ───────────────────────────────────────────────────────

MetamorphicTester::MetamorphicTester(unsigned seed) : rng_(seed) {}

std::vector<TestCase> MetamorphicTester::generate_tests(const Rule& rule, const Specification& spec) {
    std::vector<TestCase> tests;
    const std::vector<std::string> forms = rule_forms(rule, spec);

    std::vector<Target> targets;
    for (const Comparison& c : extract_comparisons(rule.working_condition())) {
        if (!c.lhs.is_field() || c.rhs.kind == OperandKind::Null) continue;

        Target t;
        t.cmp = c;
        auto lhs = field_path_of(c.lhs.text, spec, forms);
        if (!lhs) continue;
        t.lhs = *lhs;

        const Field* ldecl = spec.find_field(t.lhs.form, t.lhs.field);
        if (c.rhs.is_field()) {
            t.rhs = field_path_of(c.rhs.text, spec, forms);
            if (!t.rhs) continue;
            const Field* rdecl = spec.find_field(t.rhs->form, t.rhs->field);
            t.type = ldecl ? ldecl->type : (rdecl ? rdecl->type : FieldType::Numeric);
            t.rhs_type = rdecl ? rdecl->type : t.type;
        } else {
            t.type = ldecl ? ldecl->type : operand_type(c.rhs);
        }
        if (is_ordering(c.op) && (is_textual(t.type) || t.type == FieldType::Boolean)) continue;
        targets.push_back(std::move(t));
    }
    if (targets.empty()) {
        log_debug("metamorphic: no usable comparisons in rule " + rule.id);
        return tests;
    }

    auto uniform = [this](double a, double b) {
        const double x = std::uniform_real_distribution<double>(a, b)(rng_);
        return std::round(x * 100.0) / 100.0;
    };

    // A value for a field of `type` that satisfies (or violates)
    // "field <op> threshold".
    auto pick = [&](CompareOp op, FieldType type, const Field* decl, const Value& threshold,
                    bool violate) -> std::optional<Value> {
        if (violate) op = negate(op);

        if (type == FieldType::Numeric) {
            auto t = as_number(threshold);
            if (!t) return std::nullopt;
            switch (op) {
                case CompareOp::Gt: return Value{*t + uniform(1.0, 10.0)};
                case CompareOp::Ge: return Value{*t + uniform(0.0, 10.0)};
                case CompareOp::Lt: return Value{*t - uniform(1.0, 10.0)};
                case CompareOp::Le: return Value{*t - uniform(0.0, 10.0)};
                case CompareOp::Eq: return Value{*t};
                case CompareOp::Ne: {
                    const bool up = std::uniform_int_distribution<int>(0, 1)(rng_) == 1;
                    return Value{*t + (up ? 10.0 : -10.0)};
                }
            }
            return std::nullopt;
        }
        if (is_temporal(type)) {
            auto t = as_days(threshold);
            if (!t) return std::nullopt;
            std::int64_t d = *t;
            switch (op) {
                case CompareOp::Gt:
                case CompareOp::Ge:
                case CompareOp::Ne: d = *t + 10; break;
                case CompareOp::Lt:
                case CompareOp::Le: d = *t - 10; break;
                case CompareOp::Eq: break;
            }
            return Value{format_date(d)};
        }
        if (type == FieldType::Boolean) {
            const bool* b = std::get_if<bool>(&threshold);
            if (!b) return std::nullopt;
            return Value{op == CompareOp::Eq ? *b : !*b};
        }
        const std::string text = value_to_string(threshold);
        if (op == CompareOp::Eq) return Value{text};
        if (op == CompareOp::Ne) return Value{other_category(text, decl)};
        return std::nullopt;
    };

    auto current = [](const TestData& data, const FieldPath& p) -> const Value* {
        return find_value(data, p);
    };

    auto build = [&](std::optional<std::size_t> violated) {
        TestData data;
        std::vector<std::size_t> order;
        if (violated) order.push_back(*violated);
        for (int pass = 0; pass < 2; ++pass) {
            for (std::size_t i = 0; i < targets.size(); ++i) {
                if (violated && i == *violated) continue;
                if (targets[i].rhs.has_value() == (pass == 1)) order.push_back(i);
            }
        }

        for (std::size_t i : order) {
            const Target& t = targets[i];
            const bool violate = violated && i == *violated;
            const Field* ldecl = spec.find_field(t.lhs.form, t.lhs.field);

            if (const Value* have = current(data, t.lhs)) {
                // Left side already fixed; steer the right-hand field instead.
                if (t.rhs && !current(data, *t.rhs)) {
                    const Field* rdecl = spec.find_field(t.rhs->form, t.rhs->field);
                    if (auto v = pick(mirror(t.cmp.op), t.rhs_type, rdecl, *have, violate)) {
                        set_value(data, *t.rhs, *v);
                    }
                }
                continue;
            }

            std::optional<Value> threshold;
            if (t.rhs) {
                if (!current(data, *t.rhs)) {
                    const Field* rdecl = spec.find_field(t.rhs->form, t.rhs->field);
                    set_value(data, *t.rhs, default_value(t.rhs_type, rdecl));
                }
                threshold = *current(data, *t.rhs);
            } else {
                threshold = literal_value(t.cmp.rhs);
            }
            if (!threshold) continue;

            if (auto v = pick(t.cmp.op, t.type, ldecl, *threshold, violate)) {
                set_value(data, t.lhs, *v);
            }
        }
        return data;
    };

    auto make_test = [&](std::string description, bool expected, TestData data) {
        TestCase tc;
        tc.rule_id         = rule.id;
        tc.description     = std::move(description);
        tc.expected_result = expected;
        tc.test_data       = std::move(data);
        tc.technique       = Technique::Metamorphic;
        tc.is_positive     = expected;
        tests.push_back(std::move(tc));
    };

    // ── Base cases ──────────────────────────────────────────────────────
    const TestData positive = build(std::nullopt);
    make_test("Metamorphic base positive: every comparison satisfied", true, positive);

    const std::size_t k = std::uniform_int_distribution<std::size_t>(0, targets.size() - 1)(rng_);
    make_test("Metamorphic base negative: violates " + targets[k].cmp.to_string(), false,
              build(k));

    // ── Follow-ups ──────────────────────────────────────────────────────
    std::map<FieldPath, int> uses;
    for (const Target& t : targets) {
        ++uses[t.lhs];
        if (t.rhs) ++uses[*t.rhs];
    }

    for (const Target& t : targets) {
        if (uses[t.lhs] != 1) continue;
        if (t.type != FieldType::Numeric && !is_temporal(t.type)) continue;

        const Value* base = find_value(positive, t.lhs);
        if (!base) continue;
        std::optional<Value> threshold;
        if (t.rhs) {
            if (const Value* v = find_value(positive, *t.rhs)) threshold = *v;
        } else {
            threshold = literal_value(t.cmp.rhs);
        }
        if (!threshold) continue;

        const std::string where = t.lhs.ref() + " (" + compare_op_symbol(t.cmp.op) + " " +
                                  value_to_string(*threshold) + ")";

        for (const RelationRule& rel : relations_for(t.cmp.op)) {
            Value next;
            if (t.type == FieldType::Numeric) {
                auto b = as_number(*base);
                auto th = as_number(*threshold);
                if (!b || !th) break;
                next = perturb_numeric(rel.relation, *b, *th);
            } else {
                auto b = as_days(*base);
                auto th = as_days(*threshold);
                if (!b || !th) break;
                next = format_date(perturb_date(rel.relation, *b, *th));
            }
            TestData data = positive;
            set_value(data, t.lhs, next);
            make_test(std::string("Metamorphic ") + relation_name(rel.relation) + " on " + where,
                      rel.expected, std::move(data));
        }
    }

    log_info("metamorphic: generated " + std::to_string(tests.size()) + " tests for rule " + rule.id);
    return tests;
}

}  // namespace edc
