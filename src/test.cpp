// ============================================================================
// test.cpp — Self-test suite for the edit-check verifier and generators
// ============================================================================
//
// Contains tests covering:
//   - Utilities (dates, number literals) and leveled logging
//   - Lexer tokenisation (operators, dates, quoted text, lenient mode)
//   - Parser correctness (precedence, IN/BETWEEN/IS NULL, IF/THEN/ELSE)
//   - Field and comparison extraction, including the lenient fallback
//   - Data model invariants (duplicates, resolution, test-data validation)
//   - Z3 encoding (scopes, domains, NULL sentinels)
//   - Rule and rule-set verification findings
//   - Symbolic, metamorphic, adversarial and causal generation
//   - Direct evaluation semantics
//   - Multi-modal voting and the full orchestrated pipeline
//   - Input files and command-line handling
//
// ============================================================================

#include "edc/test.hpp"
#include "edc/adversarial.hpp"
#include "edc/causal.hpp"
#include "edc/cli.hpp"
#include "edc/condition.hpp"
#include "edc/evaluator.hpp"
#include "edc/lexer.hpp"
#include "edc/loader.hpp"
#include "edc/log.hpp"
#include "edc/metamorphic.hpp"
#include "edc/model.hpp"
#include "edc/multimodal.hpp"
#include "edc/orchestrator.hpp"
#include "edc/parser.hpp"
#include "edc/smt.hpp"
#include "edc/symbolic.hpp"
#include "edc/utils.hpp"
#include "edc/verifier.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <memory>
#include <optional>
#include <random>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace edc {

// ── TestContext ──────────────────────────────────────────────────────────────

void TestContext::check(bool condition, const std::string& description) {
    ++total_;
    if (!condition) {
        ++failed_;
        std::cerr << "  FAIL: " << description << "\n";
    }
}

void TestContext::check_eq(const std::string& actual,
                           const std::string& expected,
                           const std::string& description) {
    ++total_;
    if (actual != expected) {
        ++failed_;
        std::cerr << "  FAIL: " << description << "\n"
                  << "    expected: " << expected << "\n"
                  << "    actual:   " << actual << "\n";
    }
}

void TestContext::check_near(double actual, double expected, double tolerance,
                             const std::string& description) {
    ++total_;
    if (!(std::fabs(actual - expected) <= tolerance)) {
        ++failed_;
        std::cerr << "  FAIL: " << description << "\n"
                  << "    expected: " << format_number(expected)
                  << " (+/- " << format_number(tolerance) << ")\n"
                  << "    actual:   " << format_number(actual) << "\n";
    }
}

static std::string verdict_text(std::optional<bool> v) {
    return v ? (*v ? "true" : "false") : "no opinion";
}

void TestContext::check_verdict(std::optional<bool> actual, std::optional<bool> expected,
                                const std::string& description) {
    ++total_;
    if (actual != expected) {
        ++failed_;
        std::cerr << "  FAIL: " << description << "\n"
                  << "    expected: " << verdict_text(expected) << "\n"
                  << "    actual:   " << verdict_text(actual) << "\n";
    }
}

// ── TestRunner ──────────────────────────────────────────────────────────────

void TestRunner::run(const std::string& name, TestFunc func) {
    ++tests_run_;
    TestContext ctx;
    ctx.current_test_ = name;

    std::cerr << "TEST: " << name << "\n";
    try {
        func(ctx);
    } catch (const std::exception& e) {
        std::cerr << "  EXCEPTION: " << e.what() << "\n";
        ++ctx.failed_;
    }

    checks_total_ += ctx.total();
    checks_failed_ += ctx.failed();
    if (ctx.failed() > 0) {
        ++tests_failed_;
    } else {
        std::cerr << "  OK (" << ctx.total() << " checks)\n";
    }
}

int TestRunner::summarise() const {
    std::cerr << "\n=== Test Summary ===\n"
              << "Tests:  " << tests_run_ << " run, "
              << (tests_run_ - tests_failed_) << " passed, "
              << tests_failed_ << " failed\n"
              << "Checks: " << checks_total_ << " total, "
              << (checks_total_ - checks_failed_) << " passed, "
              << checks_failed_ << " failed\n";

    if (tests_failed_ == 0) {
        std::cerr << "ALL TESTS PASSED\n";
        return 0;
    } else {
        std::cerr << "SOME TESTS FAILED\n";
        return 1;
    }
}

// ============================================================================
// Fixtures
// ============================================================================

static Specification clinical_spec() {
    return parse_specification({
        "# vital signs",
        "VitalSigns.SystolicBP   numeric required min=60 max=250",
        "VitalSigns.DiastolicBP  numeric required min=40 max=150",
        "VitalSigns.HeartRate    numeric min=30 max=200",
        "Demographics.Age        numeric min=0 max=120",
        "Demographics.Sex        categorical values=M|F",
        "Demographics.Consent    boolean",
        "Visit.VisitDate         date",
        "Visit.DischargeDate     date",
        "Lab.Glucose             numeric",
        "Lab.Comment             text",
    });
}

static Rule make_rule(const std::string& id, const std::string& formalized) {
    Rule r;
    r.id = id;
    r.condition = formalized;
    r.formalized_condition = formalized;
    return r;
}

static std::string pp(const std::string& input) {
    Condition c = compile_condition(input);
    return c.to_string();
}

static bool parse_fails(const std::string& input) {
    try {
        compile_condition(input);
    } catch (const std::runtime_error&) {
        return true;
    }
    return false;
}

static std::optional<bool> eval(const std::string& text, const TestData& data,
                                const Specification& spec) {
    Condition c = compile_condition(text);
    return Evaluator(spec).evaluate(c, data);
}

static bool starts_with(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

static bool contains(const std::string& s, const std::string& part) {
    return s.find(part) != std::string::npos;
}

static double number_at(const TestData& data, const FieldPath& p) {
    const Value* v = find_value(data, p);
    const double* d = v ? std::get_if<double>(v) : nullptr;
    return d ? *d : std::numeric_limits<double>::quiet_NaN();
}

/// Every test whose label the direct evaluator can check agrees with it.
static bool labels_agree(const Rule& rule, const Specification& spec,
                         const std::vector<TestCase>& tests) {
    for (const TestCase& tc : tests) {
        auto actual = evaluate_rule(rule, spec, tc.test_data);
        if (!actual || *actual != tc.expected_result) {
            std::cerr << "    mislabelled: " << tc.description << "\n";
            return false;
        }
    }
    return true;
}

static const FieldPath kAge{"Demographics", "Age"};
static const FieldPath kSex{"Demographics", "Sex"};
static const FieldPath kSbp{"VitalSigns", "SystolicBP"};
static const FieldPath kDbp{"VitalSigns", "DiastolicBP"};

// ============================================================================
// Utilities
// ============================================================================

static void test_util_dates(TestContext& ctx) {
    ctx.check(days_from_civil(1970, 1, 1) == 0, "epoch is day 0");
    ctx.check(parse_date("2024-02-29").has_value(), "leap day accepted");
    ctx.check(!parse_date("2023-02-29").has_value(), "non-leap Feb 29 rejected");
    ctx.check(!parse_date("2024-13-01").has_value(), "month 13 rejected");
    ctx.check(!parse_date("24-01-01").has_value(), "short year rejected");
    ctx.check_eq(format_date(*parse_date("2000-03-01")), "2000-03-01", "date renders back");
    ctx.check(*parse_date("2024-01-02") - *parse_date("2023-12-31") == 2, "day arithmetic across years");
}

static void test_util_numbers(TestContext& ctx) {
    ctx.check(parse_number("18") == 18.0, "integer literal");
    ctx.check(parse_number("-0.5") == -0.5, "negative decimal");
    ctx.check(!parse_number("1e5"), "exponent rejected");
    ctx.check(!parse_number("inf"), "inf rejected");
    ctx.check(!parse_number("5."), "dangling point rejected");
    ctx.check(!parse_number("1" + std::string(400, '0')), "overflowing literal rejected");
    ctx.check_eq(format_number(18.0), "18", "integral value has no point");
    ctx.check_eq(format_number(149.0234375), "149.0234375", "binary fraction is exact");
    ctx.check_eq(format_number(std::numeric_limits<double>::infinity()), "inf", "infinity");
    ctx.check_eq(to_upper("and"), "AND", "to_upper");
    ctx.check(iequals("Female", "FEMALE"), "iequals");
    ctx.check(split("a| b |", '|').size() == 3, "split keeps empty pieces");
}

static void test_log_levels(TestContext& ctx) {
    const LogLevel saved = log_level();
    set_log_level(LogLevel::Info);
    ctx.check(log_enabled(LogLevel::Warning), "warning passes an info threshold");
    ctx.check(!log_enabled(LogLevel::Debug), "debug is dropped at info");
    ctx.check_eq(log_level_name(LogLevel::Debug), "DEBUG", "level name");
    set_log_level(saved);
}

// ============================================================================
// Lexer
// ============================================================================

static void test_lexer_operators(TestContext& ctx) {
    auto toks = tokenise("A.X >= 5 AND B <> 'x' && !C || D == 1");
    std::vector<TokenKind> kinds;
    for (const Token& t : toks) kinds.push_back(t.kind);

    const std::vector<TokenKind> expected = {
        TokenKind::Identifier, TokenKind::GreaterEq, TokenKind::Number, TokenKind::KwAnd,
        TokenKind::Identifier, TokenKind::NotEqual,  TokenKind::String, TokenKind::KwAnd,
        TokenKind::KwNot,      TokenKind::Identifier, TokenKind::KwOr,  TokenKind::Identifier,
        TokenKind::Equal,      TokenKind::Number,    TokenKind::Eof};
    ctx.check(kinds == expected, "operator and keyword kinds");
    ctx.check_eq(toks[0].text, "A.X", "dotted identifier is one token");
    ctx.check_eq(toks[6].text, "x", "quotes are stripped");
}

static void test_lexer_literals(TestContext& ctx) {
    auto toks = tokenise("Visit.VisitDate < 2024-02-29 AND Lab.Glucose > -5.5 AND Sex = \"F\"");
    ctx.check(toks[2].kind == TokenKind::Date, "ISO date token");
    ctx.check_eq(toks[2].text, "2024-02-29", "date text");
    ctx.check(toks[6].kind == TokenKind::Number, "negative number after an operator");
    ctx.check_eq(toks[6].text, "-5.5", "negative number text");
    ctx.check(toks[10].kind == TokenKind::String, "double-quoted string");

    auto kw = tokenise("a and b Or NOT c between 1 and 2 is null");
    ctx.check(kw[1].kind == TokenKind::KwAnd && kw[3].kind == TokenKind::KwOr &&
              kw[4].kind == TokenKind::KwNot && kw[6].kind == TokenKind::KwBetween,
              "keywords are case-insensitive");
}

static void test_lexer_errors(TestContext& ctx) {
    bool threw = false;
    try {
        tokenise("A.X = 'open");
    } catch (const std::runtime_error&) {
        threw = true;
    }
    ctx.check(threw, "unterminated string throws");

    threw = false;
    try {
        tokenise("A.X > 5 $ 3");
    } catch (const std::runtime_error&) {
        threw = true;
    }
    ctx.check(threw, "unexpected character throws");

    auto lenient = tokenise("A.X > 5 $ B.Y", 1, true);
    ctx.check(lenient.size() == 5, "lenient mode skips unknown characters");
}

// ============================================================================
// Parser
// ============================================================================

static void test_parse_connectives(TestContext& ctx) {
    ctx.check_eq(pp("A.X > 5 AND A.Y <= 3"), "((A.X > 5) AND (A.Y <= 3))", "conjunction");
    ctx.check_eq(pp("A.X > 5 OR A.Y < 1 AND A.Z = 2"),
                 "((A.X > 5) OR ((A.Y < 1) AND (A.Z = 2)))", "AND binds tighter than OR");
    ctx.check_eq(pp("(A.X > 5 OR A.Y < 1) AND A.Z = 2"),
                 "(((A.X > 5) OR (A.Y < 1)) AND (A.Z = 2))", "parentheses");
    ctx.check_eq(pp("NOT A.X > 5"), "(NOT (A.X > 5))", "prefix NOT");
    ctx.check_eq(pp("A.X <> 5"), "(A.X != 5)", "<> is !=");
    ctx.check_eq(pp("A.A = 1 AND A.B = 2 AND A.C = 3"),
                 "((A.A = 1) AND (A.B = 2) AND (A.C = 3))", "n-ary flattening");
}

static void test_parse_predicates(TestContext& ctx) {
    ctx.check_eq(pp("A.S IN ('a', 'b')"), "(A.S IN ('a', 'b'))", "IN list");
    ctx.check_eq(pp("A.S NOT IN ['a']"), "(A.S NOT IN ('a'))", "NOT IN with brackets");
    ctx.check_eq(pp("A.X BETWEEN 1 AND 5 AND A.Y = 2"),
                 "((A.X BETWEEN 1 AND 5) AND (A.Y = 2))", "BETWEEN owns its AND");
    ctx.check_eq(pp("A.X IS NULL"), "(A.X IS NULL)", "IS NULL");
    ctx.check_eq(pp("A.X IS NOT NULL"), "(A.X IS NOT NULL)", "IS NOT NULL");
    ctx.check_eq(pp("A.Flag"), "(A.Flag = TRUE)", "bare boolean field");
    ctx.check_eq(pp("A.D >= 2024-01-01"), "(A.D >= 2024-01-01)", "date literal");
    ctx.check_eq(pp("IF A.P = 'Y' THEN A.Q IS NOT NULL"),
                 "(IF (A.P = 'Y') THEN (A.Q IS NOT NULL))", "IF without ELSE");
    ctx.check_eq(pp("IF A.P = 'Y' THEN A.Q > 1 ELSE A.Q < 0"),
                 "(IF (A.P = 'Y') THEN (A.Q > 1) ELSE (A.Q < 0))", "IF with ELSE");
}

static void test_parse_interning(TestContext& ctx) {
    Condition c = compile_condition("A.X > 5 OR A.X > 5");
    const ExprNode& root = c.node(c.root());
    ctx.check(root.kind == ExprKind::Or, "root is OR");
    ctx.check(root.children.size() == 2 && root.children[0] == root.children[1],
              "identical clauses share one id");
}

static void test_parse_errors(TestContext& ctx) {
    ctx.check(parse_fails("A.X >"), "missing right operand");
    ctx.check(parse_fails("A.X > 5 )"), "trailing parenthesis");
    ctx.check(parse_fails("(A.X > 5"), "unclosed parenthesis");
    ctx.check(parse_fails("A.X IN 5"), "IN without list");
    ctx.check(parse_fails("IF A.X > 5 A.Y < 1"), "IF without THEN");
    ctx.check(parse_fails("A.X NOT 5"), "NOT without IN");
    ctx.check(parse_fails("5"), "bare number is not a condition");
}

// ============================================================================
// Extraction
// ============================================================================

static void test_extraction(TestContext& ctx) {
    auto refs = extract_field_references("A.X > 5 AND A.Y < A.X");
    ctx.check(refs == std::vector<std::string>{"A.X", "A.Y"}, "ordered, deduplicated references");

    auto cmps = extract_comparisons("5 < A.X");
    ctx.check(cmps.size() == 1, "one comparison");
    ctx.check(cmps[0].lhs.is_field() && cmps[0].op == CompareOp::Gt && cmps[0].rhs.number == 5.0,
              "literal-first comparison is re-oriented");

    auto between = extract_comparisons("A.X BETWEEN 1 AND 9");
    ctx.check(between.size() == 2 && between[0].op == CompareOp::Ge && between[1].op == CompareOp::Le,
              "BETWEEN yields >= and <=");
}

static void test_extraction_lenient(TestContext& ctx) {
    const std::string broken = "A.X > 10 AND AND A.Y = 'z'";
    ctx.check(parse_fails(broken), "input really is malformed");

    auto cmps = extract_comparisons(broken);
    ctx.check(cmps.size() == 2, "both comparisons recovered");
    ctx.check(cmps.size() == 2 && cmps[1].rhs.kind == OperandKind::String && cmps[1].rhs.text == "z",
              "string operand recovered");

    auto refs = extract_field_references(broken);
    ctx.check(refs == std::vector<std::string>{"A.X", "A.Y"}, "references recovered");

    Condition c;
    ExprId conj = conjunction_of(cmps, c);
    ctx.check_eq(c.to_string(conj), "((A.X > 10) AND (A.Y = 'z'))", "recovered conjunction");
    ctx.check(conjunction_of({}, c) == kInvalidExpr, "nothing to conjoin");

    const std::string huge = "Demographics.Age > 1" + std::string(400, '0') +
                             " AND Demographics.Age <= 65";
    ctx.check(parse_fails(huge), "literal beyond double range is a parse error");
    std::vector<Comparison> kept;
    try {
        kept = extract_comparisons(huge);
    } catch (const std::exception& e) {
        ctx.check(false, std::string("extraction raised: ") + e.what());
    }
    ctx.check(kept.size() == 1 && kept[0].op == CompareOp::Le, "only the representable comparison is kept");
    ctx.check(extract_field_references(huge) == std::vector<std::string>{"Demographics.Age"},
              "references survive an oversized literal");
}

static void test_compare_op_helpers(TestContext& ctx) {
    ctx.check(mirror(CompareOp::Lt) == CompareOp::Gt, "mirror <");
    ctx.check(mirror(CompareOp::Ge) == CompareOp::Le, "mirror >=");
    ctx.check(negate(CompareOp::Lt) == CompareOp::Ge, "negate <");
    ctx.check(negate(CompareOp::Eq) == CompareOp::Ne, "negate =");
    ctx.check(parse_compare_op("==") == CompareOp::Eq, "== parses");
    ctx.check(!parse_compare_op("=>"), "=> is not an operator");
}

// ============================================================================
// Data model
// ============================================================================

static void test_model_invariants(TestContext& ctx) {
    Specification spec;
    Form& form = spec.add_form("Demographics");
    form.add_field(Field{"Age", FieldType::Numeric});

    bool threw = false;
    try {
        form.add_field(Field{"Age", FieldType::Text});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    ctx.check(threw, "duplicate field throws");

    threw = false;
    try {
        spec.add_form("Demographics");
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    ctx.check(threw, "duplicate form throws");

    ctx.check(field_type_from_string("Integer") == FieldType::Numeric, "integer alias");
    ctx.check(field_type_from_string("yes/no") == FieldType::Boolean, "yes/no alias");
    ctx.check(field_type_from_string("enum") == FieldType::Categorical, "enum alias");
    ctx.check(field_type_from_string("whatever") == FieldType::Text, "unknown type is text");
    ctx.check(severity_from_string("Warning") == Severity::Warning, "severity parse");
    ctx.check(parse_technique("Causal") == Technique::Causal, "technique parse");
    ctx.check(!parse_technique("fuzzing"), "unknown technique");
    ctx.check(generator_techniques().size() == 4, "four generators");
}

static void test_model_resolution(TestContext& ctx) {
    const Specification spec = clinical_spec();
    auto p = spec.resolve("Age");
    ctx.check(p && p->ref() == "Demographics.Age", "bare name resolves");
    ctx.check(!spec.resolve("Demographics.Height"), "undeclared dotted name");
    ctx.check(spec.lookup("Sex")->valid_values.size() == 2, "lookup through bare name");

    auto fallback = field_path_of("Other.Thing", spec);
    ctx.check(fallback && fallback->form == "Other" && fallback->field == "Thing",
              "undeclared dotted name still splits");
    ctx.check(!field_path_of(".Thing", spec), "leading dot rejected");
    ctx.check(!field_path_of("Nothing", spec), "unknown bare name");

    Rule rule = make_rule("R", "Demographics.Age >= 18 AND VitalSigns.HeartRate > 40");
    ctx.check(rule_forms(rule, spec) == std::vector<std::string>{"Demographics", "VitalSigns"},
              "rule forms from references");
    rule.forms = {"Demographics"};
    ctx.check(rule_forms(rule, spec).size() == 1, "explicit forms win");
}

static void test_model_validate_test_data(TestContext& ctx) {
    const Specification spec = clinical_spec();
    const Rule rule = make_rule("R", "Demographics.Age >= 18");

    TestCase ok;
    set_value(ok.test_data, kAge, 30.0);
    ctx.check(validate_test_data(ok, rule, spec), "declared field of the rule's form");

    TestCase empty_form;
    empty_form.test_data["Demographics"];
    ctx.check(validate_test_data(empty_form, rule, spec), "empty form entry is allowed");

    TestCase foreign;
    set_value(foreign.test_data, kSbp, 120.0);
    ctx.check(!validate_test_data(foreign, rule, spec), "form outside the rule");

    TestCase undeclared;
    set_value(undeclared.test_data, FieldPath{"Demographics", "Height"}, 180.0);
    ctx.check(!validate_test_data(undeclared, rule, spec), "undeclared field");

    ValidationResult r;
    ctx.check(r.is_valid, "fresh result is valid");
    r.add_warning("tautology", "w");
    ctx.check(r.is_valid, "warnings keep it valid");
    r.add_error("unsatisfiable_rule", "e");
    ctx.check(!r.is_valid && r.has_error("unsatisfiable_rule"), "errors invalidate");
}

// ============================================================================
// SMT encoding
// ============================================================================

static void test_smt_scopes(TestContext& ctx) {
    const Specification spec = clinical_spec();
    SolverSession s(spec);
    Condition c = compile_condition("Demographics.Age >= 18");
    z3::expr f = s.encode(c);
    z3::expr age = s.variable("Demographics.Age");

    {
        SolverSession::Scope scope(s);
        s.add(f);
        s.add(age == s.number(10));
        ctx.check(s.check() == SmtResult::Unsat, "Age = 10 violates Age >= 18");
    }
    {
        SolverSession::Scope scope(s);
        s.add(f);
        ctx.check(s.check() == SmtResult::Sat, "constraints retracted with the scope");
        auto values = s.model_values();
        const double* v = std::get_if<double>(&values["Demographics.Age"]);
        ctx.check(v && *v >= 18.0, "model satisfies the condition");
    }
    {
        // Closing the outer scope first retracts the inner scope's additions
        // too; the inner scope then has nothing left to pop.
        std::optional<SolverSession::Scope> outer;
        std::optional<SolverSession::Scope> inner;
        outer.emplace(s);
        s.add(age == s.number(10));
        inner.emplace(s);
        s.add(f);
        ctx.check(s.check() == SmtResult::Unsat, "nested scopes accumulate");
        outer.reset();
        s.add(age == s.number(30));
        ctx.check(s.check() == SmtResult::Sat, "outer scope end retracts both levels");
        inner.reset();
        ctx.check(s.check() == SmtResult::Sat, "late inner scope end is harmless");
    }
    {
        SolverSession::Scope scope(s);
        s.add(age == s.number(40));
        ctx.check(s.check() == SmtResult::Unsat, "constraints added outside any scope persist");
    }
    ctx.check(s.canonical("Age") == "Demographics.Age", "canonical name");
    ctx.check(s.type_of("Demographics.Sex") == FieldType::Categorical, "declared type");
}

static void test_smt_domain_and_nulls(TestContext& ctx) {
    const Specification spec = clinical_spec();
    SolverSession s(spec);
    Condition c = compile_condition("Demographics.Age > 200");
    z3::expr f = s.encode(c);

    {
        SolverSession::Scope scope(s);
        s.add(f);
        s.add(s.domain());
        ctx.check(s.check() == SmtResult::Unsat, "declared max excludes 200");
    }
    {
        SolverSession::Scope scope(s);
        s.add(f);
        ctx.check(s.check() == SmtResult::Sat, "bare constraint ignores bounds");
    }
    {
        SolverSession::Scope scope(s);
        s.add(s.variable("Demographics.Age") == s.null_value("Demographics.Age"));
        ctx.check(s.check() == SmtResult::Sat, "NULL sentinel is assignable");
        auto values = s.model_values();
        ctx.check(is_null(values["Demographics.Age"]), "sentinel maps back to NULL");
    }

    bool threw = false;
    try {
        s.literal("Demographics.Age", Value{std::string("abc")});
    } catch (const EncodeError&) {
        threw = true;
    }
    ctx.check(threw, "text for a numeric field is not encodable");

    threw = false;
    try {
        s.number(std::numeric_limits<double>::infinity());
    } catch (const EncodeError&) {
        threw = true;
    }
    ctx.check(threw, "infinity is not encodable");
}

static void test_smt_inferred_types(TestContext& ctx) {
    const Specification spec{};
    SolverSession s(spec);
    Condition c = compile_condition("Trial.Start > 2024-01-01 AND Trial.Arm = 'B' AND Trial.Dose < 5");
    z3::expr f = s.encode(c);
    ctx.check(s.type_of("Trial.Start") == FieldType::Date, "date literal implies date");
    ctx.check(s.type_of("Trial.Arm") == FieldType::Text, "string literal implies text");
    ctx.check(s.type_of("Trial.Dose") == FieldType::Numeric, "number implies numeric");

    SolverSession::Scope scope(s);
    s.add(f);
    ctx.check(s.check() == SmtResult::Sat, "mixed-sort condition is satisfiable");
    auto values = s.model_values();
    const std::string* arm = std::get_if<std::string>(&values["Trial.Arm"]);
    ctx.check(arm && *arm == "B", "string model value");
}

static void test_smt_ordering_on_text_rejected(TestContext& ctx) {
    const Specification spec = clinical_spec();
    SolverSession s(spec);
    Condition c = compile_condition("Demographics.Sex > 'F'");
    bool threw = false;
    try {
        s.encode(c);
    } catch (const EncodeError&) {
        threw = true;
    }
    ctx.check(threw, "ordering on a categorical field is not encodable");
}

// ============================================================================
// Verifier
// ============================================================================

static void test_verifier_unsatisfiable(TestContext& ctx) {
    const Specification spec = clinical_spec();
    SmtVerifier v;
    auto r = v.verify_rule(make_rule("R1", "Demographics.Age >= 18 AND Demographics.Age < 18"), spec);
    ctx.check(!r.is_valid, "rule is invalid");
    ctx.check(r.has_error("unsatisfiable_rule"), "unsatisfiable_rule");
    ctx.check(r.has_warning("redundant_condition"), "complementary clauses flagged");
    ctx.check(r.witness.empty(), "no witness");
}

static void test_verifier_tautology_and_witness(TestContext& ctx) {
    const Specification spec = clinical_spec();
    SmtVerifier v;

    auto taut = v.verify_rule(make_rule("R1", "Lab.Glucose >= 0 OR Lab.Glucose < 0"), spec);
    ctx.check(taut.is_valid, "tautology is still valid");
    ctx.check(taut.has_warning("tautology"), "tautology");

    auto sat = v.verify_rule(make_rule("R2", "Demographics.Age >= 18"), spec);
    ctx.check(sat.is_valid && sat.errors.empty(), "plain rule is valid");
    ctx.check(sat.witness.count("Demographics.Age") == 1, "witness names the field");
    ctx.check(!sat.has_warning("tautology"), "not a tautology");
}

static void test_verifier_references(TestContext& ctx) {
    const Specification spec = clinical_spec();
    SmtVerifier v;
    ctx.check(v.verify_rule(make_rule("R1", "Demographics.Height > 100"), spec).has_error("invalid_field"),
              "invalid_field");
    ctx.check(v.verify_rule(make_rule("R2", "Labs.Value > 1"), spec).has_error("invalid_form"),
              "invalid_form");
    ctx.check(v.verify_rule(make_rule("R3", "Demographics.Age > 'abc'"), spec).has_error("type_mismatch"),
              "type_mismatch");
    ctx.check(v.verify_rule(make_rule("R4", "Demographics.Sex = 'X'"), spec)
                  .has_error("invalid_categorical_value"),
              "invalid_categorical_value");
    ctx.check(v.verify_rule(make_rule("R5", "Demographics.Sex IN ('M', 'F')"), spec).is_valid,
              "valid categorical values");
}

static void test_verifier_edge_cases(TestContext& ctx) {
    const Specification spec = clinical_spec();
    SmtVerifier v;

    auto nulls = v.verify_rule(make_rule("R1", "Demographics.Age < 18"), spec);
    ctx.check(nulls.has_warning("null_values_satisfy_rule"), "NULL satisfies an upper bound");

    auto extreme = v.verify_rule(make_rule("R2", "Lab.Glucose > 5"), spec);
    ctx.check(extreme.has_warning("extreme_value_satisfies_rule"), "unbounded numeric field");

    auto bounded = v.verify_rule(make_rule("R3", "Demographics.Age > 5"), spec);
    ctx.check(!bounded.has_warning("extreme_value_satisfies_rule"), "declared bounds skip extremes");

    VerifierOptions quiet;
    quiet.check_edge_cases = false;
    auto skipped = SmtVerifier(quiet).verify_rule(make_rule("R4", "Demographics.Age < 18"), spec);
    ctx.check(!skipped.has_warning("null_values_satisfy_rule"), "edge cases can be disabled");

    Rule informal;
    informal.id = "R5";
    informal.condition = "Age should be plausible";
    auto missing = v.verify_rule(informal, spec);
    ctx.check(missing.is_valid && missing.has_warning("missing_formalized_condition"),
              "missing_formalized_condition");

    auto broken = v.verify_rule(make_rule("R6", "Demographics.Age >> 5"), spec);
    ctx.check(broken.has_warning("parsing_error"), "parsing_error");
}

static void test_verifier_contradiction(TestContext& ctx) {
    const Specification spec = clinical_spec();
    SmtVerifier v;
    auto results = v.verify_rule_set({make_rule("R1", "Demographics.Age >= 18"),
                                      make_rule("R2", "Demographics.Age < 18")}, spec);
    ctx.check(results.size() == 2, "one result per rule");
    ctx.check(results[0].has_error("contradictory_rules"), "R1 contradictory");
    ctx.check(results[1].has_error("contradictory_rules"), "R2 contradictory");
    ctx.check(!results[0].errors.empty() && results[0].errors.back().related_rule == "R2",
              "finding names the other rule");

    // An unsatisfiable rule still takes part in every pair.
    auto with_unsat = v.verify_rule_set({make_rule("U", "Demographics.Age > 50 AND Demographics.Age < 10"),
                                         make_rule("R1", "Demographics.Age >= 18")}, spec);
    ctx.check(with_unsat[0].has_error("unsatisfiable_rule"), "U is unsatisfiable on its own");
    ctx.check(with_unsat[0].has_error("contradictory_rules"), "U contradicts R1");
    ctx.check(with_unsat[1].has_error("contradictory_rules"), "R1 contradicts U");
    ctx.check(with_unsat[1].has_warning("implied_rule"), "U vacuously implies R1");
    ctx.check(!with_unsat[0].has_warning("implied_rule"), "R1 does not imply U");
}

static void test_verifier_implication_and_pair_limit(TestContext& ctx) {
    const Specification spec = clinical_spec();
    SmtVerifier v;
    auto results = v.verify_rule_set({make_rule("R1", "Demographics.Age >= 18"),
                                      make_rule("R3", "Demographics.Age >= 21")}, spec);
    ctx.check(results[0].has_warning("implied_rule"), "R1 implied by R3");
    ctx.check(!results[1].has_warning("implied_rule"), "R3 not implied by R1");
    ctx.check(results[0].is_valid && results[1].is_valid, "implication is not an error");

    ctx.check(v.implies(make_rule("a", "Demographics.Age >= 21"),
                        make_rule("b", "Demographics.Age >= 18"), spec) == true, "implies");
    ctx.check(v.implies(make_rule("b", "Demographics.Age >= 18"),
                        make_rule("a", "Demographics.Age >= 21"), spec) == false, "does not imply");

    VerifierOptions limit;
    limit.max_rule_pairs = 1;
    auto limited = SmtVerifier(limit).verify_rule_set(
        {make_rule("R1", "Demographics.Age >= 18"), make_rule("R3", "Demographics.Age >= 21"),
         make_rule("R4", "Demographics.Age <= 100")}, spec);
    ctx.check(limited[2].has_warning("pair_limit_reached"), "skipped pairs are reported");
}

static void test_verifier_check_test_case(TestContext& ctx) {
    const Specification spec = clinical_spec();
    SmtVerifier v;
    const Rule rule = make_rule("R1", "Demographics.Age >= 18");

    TestCase adult;
    set_value(adult.test_data, kAge, 30.0);
    ctx.check_verdict(v.check_test_case(rule, spec, adult), true, "30 satisfies");

    TestCase minor;
    set_value(minor.test_data, kAge, 10.0);
    ctx.check_verdict(v.check_test_case(rule, spec, minor), false, "10 violates");

    TestCase missing;
    ctx.check_verdict(v.check_test_case(rule, spec, missing), false, "missing value is NULL");

    TestCase confused;
    set_value(confused.test_data, kAge, std::string("abc"));
    ctx.check_verdict(v.check_test_case(rule, spec, confused), std::nullopt,
                      "unencodable value gives no opinion");
}

// ============================================================================
// Symbolic executor
// ============================================================================

static void test_symbolic_blood_pressure(TestContext& ctx) {
    const Specification spec = clinical_spec();
    const Rule rule = make_rule("R001", "VitalSigns.SystolicBP > VitalSigns.DiastolicBP");
    SymbolicExecutor exec;
    const std::vector<TestCase> tests = exec.generate_tests(rule, spec);

    ctx.check(tests.size() == 6, "positive, negative and two boundary pairs");
    if (tests.size() != 6) return;

    ctx.check(tests[0].expected_result && tests[0].is_positive, "first test is positive");
    ctx.check(number_at(tests[0].test_data, kSbp) > number_at(tests[0].test_data, kDbp),
              "positive model has SBP > DBP");
    ctx.check(!tests[1].expected_result, "second test is negative");
    ctx.check(number_at(tests[1].test_data, kSbp) <= number_at(tests[1].test_data, kDbp),
              "negative model has SBP <= DBP");
    ctx.check(labels_agree(rule, spec, tests), "every label matches direct evaluation");

    for (std::size_t i = 2; i + 1 < tests.size(); i += 2) {
        const TestCase& lo = tests[i];
        const TestCase& hi = tests[i + 1];
        ctx.check(starts_with(lo.description, "Symbolic boundary: ") &&
                  starts_with(hi.description, "Symbolic boundary: "), "boundary descriptions");
        ctx.check(lo.expected_result != hi.expected_result, "boundary pair is complementary");

        const FieldPath& path = contains(lo.description, "SystolicBP") ? kSbp : kDbp;
        const double a = number_at(lo.test_data, path);
        const double b = number_at(hi.test_data, path);
        ctx.check_near(b - a, 2.0 * exec.epsilon(), 1e-9, "pair straddles the boundary by epsilon");

        if (&path == &kSbp) {
            ctx.check(a <= 40.0 && b > 40.0, "SBP boundary sits at the DBP minimum");
            ctx.check(!lo.expected_result, "SBP below the boundary violates");
        } else {
            ctx.check(a < 250.0 && b >= 250.0, "DBP boundary sits at the SBP maximum");
            ctx.check(lo.expected_result, "DBP below the boundary satisfies");
        }
    }
    ctx.check(exec.epsilon() == 2000.0 / 2048.0, "epsilon is half the final bracket");
}

static void test_symbolic_systolic_not_above_diastolic(TestContext& ctx) {
    const Specification spec = clinical_spec();
    const Rule rule = make_rule("R002", "VitalSigns.SystolicBP <= VitalSigns.DiastolicBP");
    const std::vector<TestCase> tests = SymbolicExecutor().generate_tests(rule, spec);

    ctx.check(tests.size() >= 2, "a model on each side");
    if (tests.size() < 2) return;

    const double sbp_pos = number_at(tests[0].test_data, kSbp);
    const double dbp_pos = number_at(tests[0].test_data, kDbp);
    ctx.check(tests[0].expected_result, "first test expects the rule to hold");
    ctx.check(sbp_pos <= dbp_pos, "positive model has SBP <= DBP");
    ctx.check(sbp_pos >= 60.0 && dbp_pos <= 150.0, "positive model stays in the declared ranges");

    ctx.check(!tests[1].expected_result, "second test expects a violation");
    ctx.check(number_at(tests[1].test_data, kSbp) > number_at(tests[1].test_data, kDbp),
              "negative model has SBP > DBP");

    const std::vector<TestCase> sides(tests.begin(), tests.begin() + 2);
    ctx.check(labels_agree(rule, spec, sides), "both labels match direct evaluation");
}

static void test_symbolic_unsat_has_no_positive(TestContext& ctx) {
    const Specification spec = clinical_spec();
    const Rule rule = make_rule("R1", "Demographics.Age > 50 AND Demographics.Age < 10");
    const auto tests = SymbolicExecutor().generate_tests(rule, spec);
    bool any_positive = false;
    for (const TestCase& tc : tests) any_positive = any_positive || tc.expected_result;
    ctx.check(!any_positive, "unsatisfiable rule yields no positive test");
    ctx.check(!tests.empty() && !tests[0].expected_result, "a negative test is still produced");
}

static void test_symbolic_informal_and_fallback(TestContext& ctx) {
    const Specification spec = clinical_spec();
    Rule informal;
    informal.id = "R1";
    informal.condition = "Demographics.Age >= 18";
    ctx.check(SymbolicExecutor().generate_tests(informal, spec).empty(),
              "no formalized condition, no symbolic tests");

    const Rule broken = make_rule("R2", "Demographics.Age >= 18 AND AND Demographics.Age <= 65");
    const auto tests = SymbolicExecutor().generate_tests(broken, spec);
    ctx.check(!tests.empty() && tests[0].expected_result, "lenient comparisons still encode");
    if (!tests.empty()) {
        const double age = number_at(tests[0].test_data, kAge);
        ctx.check(age >= 18.0 && age <= 65.0, "fallback model honours both comparisons");
    }
}

// ============================================================================
// Metamorphic tester
// ============================================================================

static void test_metamorphic_table(TestContext& ctx) {
    const auto& ge = relations_for(CompareOp::Ge);
    ctx.check(ge.size() == 3, ">= has three relations");
    bool within_true = false;
    bool beyond_false = false;
    for (const RelationRule& r : ge) {
        if (r.relation == Relation::DecreaseWithin) within_true = r.expected;
        if (r.relation == Relation::DecreaseBeyond) beyond_false = !r.expected;
    }
    ctx.check(within_true && beyond_false, ">= decrease_within:T decrease_beyond:F");

    std::mt19937 rng(42);
    std::uniform_real_distribution<double> threshold(-100.0, 100.0);
    std::uniform_real_distribution<double> gap(0.0, 50.0);
    bool ge_ok = true;
    bool lt_ok = true;
    for (int i = 0; i < 500; ++i) {
        const double t = threshold(rng);
        const double up = t + gap(rng);
        ge_ok = ge_ok && perturb_numeric(Relation::Increase, up, t) >= t &&
                perturb_numeric(Relation::DecreaseWithin, up, t) >= t &&
                perturb_numeric(Relation::DecreaseBeyond, up, t) < t;

        const double down = t - 0.01 - gap(rng);
        lt_ok = lt_ok && perturb_numeric(Relation::Decrease, down, t) < t &&
                perturb_numeric(Relation::IncreaseWithin, down, t) < t &&
                perturb_numeric(Relation::IncreaseBeyond, down, t) >= t;
    }
    ctx.check(ge_ok, ">= labels hold for random satisfying bases");
    ctx.check(lt_ok, "< labels hold for random satisfying bases");

    ctx.check(perturb_numeric(Relation::ExactMatch, 3.0, 7.0) == 7.0, "exact_match lands on threshold");
    ctx.check(perturb_numeric(Relation::SlightChange, 3.0, 7.0) != 7.0, "slight_change leaves threshold");
    ctx.check(perturb_date(Relation::DecreaseBeyond, 100, 90) == 70, "date beyond moves 30 days");
}

static void test_metamorphic_numeric(TestContext& ctx) {
    const Specification spec = clinical_spec();
    const Rule rule = make_rule("R1", "Demographics.Age >= 18");
    MetamorphicTester tester(7);
    const auto tests = tester.generate_tests(rule, spec);

    ctx.check(tests.size() == 5, "two base cases and three follow-ups");
    if (tests.size() != 5) return;
    ctx.check(tests[0].expected_result && !tests[1].expected_result, "base positive then base negative");
    ctx.check(contains(tests[2].description, "increase") && contains(tests[3].description, "decrease_within") &&
              contains(tests[4].description, "decrease_beyond"), "follow-ups in table order");
    ctx.check(tests[3].expected_result && !tests[4].expected_result, "follow-up labels");
    ctx.check(labels_agree(rule, spec, tests), "labels match direct evaluation");

    MetamorphicTester again(7);
    const auto replay = again.generate_tests(rule, spec);
    ctx.check(replay.size() == tests.size() &&
              number_at(replay[0].test_data, kAge) == number_at(tests[0].test_data, kAge),
              "same seed, same tests");
}

static void test_metamorphic_dates_and_fields(TestContext& ctx) {
    const Specification spec = clinical_spec();

    const Rule dated = make_rule("R1", "Visit.VisitDate > 2024-01-01");
    const auto date_tests = MetamorphicTester(3).generate_tests(dated, spec);
    ctx.check(date_tests.size() == 5, "date rule gets follow-ups");
    ctx.check(labels_agree(dated, spec, date_tests), "date labels match direct evaluation");

    const Rule paired = make_rule("R2", "VitalSigns.SystolicBP > VitalSigns.DiastolicBP");
    const auto pair_tests = MetamorphicTester(5).generate_tests(paired, spec);
    ctx.check(pair_tests.size() == 5, "field-to-field rule perturbs the left field");
    ctx.check(labels_agree(paired, spec, pair_tests), "field-to-field labels match");
    if (!pair_tests.empty()) {
        ctx.check(number_at(pair_tests[0].test_data, kDbp) == 95.0, "right field starts mid-range");
    }

    const Rule categorical = make_rule("R3", "Demographics.Sex = 'M'");
    const auto cat_tests = MetamorphicTester(1).generate_tests(categorical, spec);
    ctx.check(cat_tests.size() == 2, "categorical field gets base cases only");
    ctx.check(labels_agree(categorical, spec, cat_tests), "categorical labels match");
    if (cat_tests.size() == 2) {
        const Value* sex = find_value(cat_tests[1].test_data, kSex);
        ctx.check(sex && value_to_string(*sex) == "F", "negative uses another valid value");
    }
}

// ============================================================================
// Adversarial generator
// ============================================================================

namespace {

class ScriptedProposer : public MutationProposer {
public:
    bool available() const override { return true; }

    std::vector<MutationProposal> propose_mutations(const Rule&, const Specification&) override {
        MutationProposal good;
        good.description = "Elderly participant";
        good.expected_result = true;
        set_value(good.test_data, kAge, 90.0);

        MutationProposal stray;
        stray.description = "Unknown form";
        set_value(stray.test_data, FieldPath{"Nowhere", "Field"}, 1.0);
        return {good, stray};
    }
};

class FailingProposer : public MutationProposer {
public:
    bool available() const override { return true; }

    std::vector<MutationProposal> propose_mutations(const Rule&, const Specification&) override {
        throw std::runtime_error("service unavailable");
    }
};

// Cannot even say whether it is reachable.
class UnreachableProposer : public MutationProposer {
public:
    bool available() const override { throw std::runtime_error("endpoint down"); }

    std::vector<MutationProposal> propose_mutations(const Rule&, const Specification&) override {
        return {};
    }
};

// Throws something that is not a std::exception.
struct ProposerOutage {};

class ForeignThrowProposer : public MutationProposer {
public:
    bool available() const override { return true; }

    std::vector<MutationProposal> propose_mutations(const Rule&, const Specification&) override {
        throw ProposerOutage{};
    }
};

}  // namespace

static void test_adversarial_strategies(TestContext& ctx) {
    const Specification spec = clinical_spec();
    const Rule rule = make_rule("R1", "Demographics.Age >= 18");
    AdversarialGenerator gen;

    const auto boundary = gen.run_strategy(AdversarialStrategy::Boundary, rule, spec);
    ctx.check(boundary.size() == 3, "threshold and both nudges");
    ctx.check(labels_agree(rule, spec, boundary), "boundary labels match direct evaluation");
    if (boundary.size() == 3) {
        ctx.check(number_at(boundary[1].test_data, kAge) == 18.0 - 0.001, "nudge below");
    }

    const auto missing = gen.run_strategy(AdversarialStrategy::MissingValue, rule, spec);
    ctx.check(missing.size() == 1 && !missing[0].expected_result, "missing value expects false");
    ctx.check(missing.size() == 1 && missing[0].test_data.count("Demographics") == 1 &&
              missing[0].test_data.at("Demographics").empty(), "form present, field absent");

    const auto confused = gen.run_strategy(AdversarialStrategy::TypeConfusion, rule, spec);
    ctx.check(confused.size() == 1 && labels_agree(rule, spec, confused), "type confusion fails the rule");

    const auto inverted = gen.run_strategy(AdversarialStrategy::LogicalInversion, rule, spec);
    ctx.check(inverted.size() == 1 && number_at(inverted[0].test_data, kAge) == 17.0,
              "inversion steps across the threshold");

    const auto special = gen.run_strategy(AdversarialStrategy::SpecialValue, rule, spec);
    ctx.check(special.size() == 5, "zero, -1, both infinities and NaN");

    ctx.check(gen.generate_tests(rule, spec).size() == 11, "all strategies in one call");
}

static void test_adversarial_proposer(TestContext& ctx) {
    const Specification spec = clinical_spec();
    const Rule rule = make_rule("R1", "Demographics.Age >= 18");

    AdversarialGenerator scripted(std::make_shared<ScriptedProposer>());
    const auto tests = scripted.generate_tests(rule, spec);
    std::size_t llm = 0;
    for (const TestCase& tc : tests) {
        if (tc.technique == Technique::Llm) ++llm;
    }
    ctx.check(llm == 1, "undeclared proposal dropped, valid one tagged llm");
    ctx.check(tests.size() == 12, "proposals follow the strategies");

    AdversarialGenerator failing(std::make_shared<FailingProposer>());
    ctx.check(failing.generate_tests(rule, spec).size() == 11, "proposer failure is contained");

    AdversarialGenerator unreachable(std::make_shared<UnreachableProposer>());
    std::size_t kept = 0;
    try {
        kept = unreachable.generate_tests(rule, spec).size();
    } catch (const std::exception& e) {
        ctx.check(false, std::string("availability check escaped: ") + e.what());
    }
    ctx.check(kept == 11, "throwing availability check keeps every strategy's tests");
}

// ============================================================================
// Causal graph and generator
// ============================================================================

static void test_causal_graph(TestContext& ctx) {
    const Specification spec = clinical_spec();
    const Rule rule = make_rule("R1", "Visit.VisitDate < Visit.DischargeDate AND Demographics.Age >= 18");
    const CausalGraph g = build_causal_graph(rule, spec);

    ctx.check(g.nodes() == std::vector<std::string>{"Visit.VisitDate", "Visit.DischargeDate",
                                                   "Demographics.Age"}, "nodes in first-appearance order");
    ctx.check(g.edge_count() == 2, "one edge per ordered pair");
    const CausalEdge* fwd = g.edge("Visit.VisitDate", "Visit.DischargeDate");
    const CausalEdge* back = g.edge("Visit.DischargeDate", "Visit.VisitDate");
    ctx.check(fwd && fwd->relationship == Relationship::Comparison && fwd->op == CompareOp::Lt,
              "comparison edge overwrites temporal and form edges");
    ctx.check(back && back->op == CompareOp::Gt, "reverse edge is mirrored");
    ctx.check(g.degree_centrality("Visit.VisitDate") == 1.0, "centrality");
    ctx.check(g.degree_centrality("Demographics.Age") == 0.0, "isolated node");
    ctx.check(g.top_nodes(1) == std::vector<std::string>{"Visit.VisitDate"}, "ties keep insertion order");
    ctx.check(g.descendants("Demographics.Age").empty(), "no descendants");

    bool threw = false;
    try {
        g.in_degree("Nope.Nope");
    } catch (const std::out_of_range&) {
        threw = true;
    }
    ctx.check(threw, "unknown node throws");

    CausalGraph single;
    single.add_node("A.X");
    ctx.check(single.degree_centrality("A.X") == 1.0, "single-node centrality");

    ctx.check(CausalTestGenerator::probe_values(FieldType::Numeric, nullptr).size() == 3, "numeric probes");
}

static void test_causal_locality(TestContext& ctx) {
    const Specification spec = clinical_spec();
    const Rule rule = make_rule("R1", "Visit.VisitDate < Visit.DischargeDate AND Demographics.Age >= 18");
    const CausalGraph g = build_causal_graph(rule, spec);
    CausalTestGenerator gen(11);
    const auto tests = gen.generate_tests(rule, spec);

    std::size_t interventions = 0;
    bool local = true;
    bool ordered = true;
    for (const TestCase& tc : tests) {
        const auto at = tc.description.find("do(");
        if (at == std::string::npos) continue;
        ++interventions;
        const auto end = tc.description.find(" = '", at);
        const std::string node = tc.description.substr(at + 3, end - at - 3);

        std::set<std::string> allowed{node};
        for (const std::string& d : g.descendants(node)) allowed.insert(d);
        for (const auto& [form, fields] : tc.test_data) {
            for (const auto& [field, value] : fields) {
                local = local && allowed.count(form + "." + field) == 1;
            }
        }

        if (node == "Visit.VisitDate") {
            const Value* v = find_value(tc.test_data, FieldPath{"Visit", "VisitDate"});
            const Value* d = find_value(tc.test_data, FieldPath{"Visit", "DischargeDate"});
            ordered = ordered && v && d &&
                      *parse_date(value_to_string(*d)) > *parse_date(value_to_string(*v));
        }
    }
    ctx.check(interventions == 9, "three probes on each of the three nodes");
    ctx.check(local, "interventions only set the node and its descendants");
    ctx.check(ordered, "propagation honours the comparison edge");

    std::size_t counterfactuals = 0;
    for (const TestCase& tc : tests) {
        if (starts_with(tc.description, "Causal counterfactual")) {
            ++counterfactuals;
            ctx.check(!tc.expected_result, "counterfactual expects false");
        }
    }
    ctx.check(counterfactuals == 2, "counterfactuals on the top two nodes");
}

static void test_causal_confounding(TestContext& ctx) {
    const Specification spec = clinical_spec();
    const Rule rule = make_rule("R1", "VitalSigns.SystolicBP > VitalSigns.DiastolicBP AND "
                                      "VitalSigns.HeartRate > 40");
    CausalTestGenerator gen(5);
    const CausalGraph g = build_causal_graph(rule, spec);
    const auto tests = gen.confounding_tests(rule, spec, g);
    ctx.check(tests.size() == 3, "every node fans out to two others");
    for (const TestCase& tc : tests) {
        ctx.check(tc.test_data.at("VitalSigns").size() == 3, "confounder plus two descendants");
    }
}

// ============================================================================
// Evaluator
// ============================================================================

static void test_evaluator_compare(TestContext& ctx) {
    const Specification spec = clinical_spec();
    Evaluator e(spec);
    const Value null;
    const Value five{5.0};
    const Value nan{std::numeric_limits<double>::quiet_NaN()};

    ctx.check(e.compare(CompareOp::Eq, null, null, FieldType::Numeric), "NULL = NULL");
    ctx.check(!e.compare(CompareOp::Ne, null, null, FieldType::Numeric), "NULL != NULL is false");
    ctx.check(e.compare(CompareOp::Ne, null, five, FieldType::Numeric), "NULL != 5");
    ctx.check(!e.compare(CompareOp::Lt, null, five, FieldType::Numeric), "ordering with NULL is false");
    ctx.check(!e.compare(CompareOp::Eq, nan, nan, FieldType::Numeric), "NaN = NaN is false");
    ctx.check(e.compare(CompareOp::Ne, nan, five, FieldType::Numeric), "NaN != 5");

    const Value text{std::string("abc")};
    ctx.check(!e.compare(CompareOp::Eq, text, five, FieldType::Numeric), "unconvertible =");
    ctx.check(e.compare(CompareOp::Ne, text, five, FieldType::Numeric), "unconvertible !=");
    ctx.check(!e.compare(CompareOp::Gt, text, five, FieldType::Numeric), "unconvertible >");

    ctx.check(e.compare(CompareOp::Gt, Value{std::string("2024-01-02")}, Value{std::string("2024-01-01")},
                        FieldType::Date), "dates by day");
    ctx.check(e.compare(CompareOp::Gt, Value{std::string("b")}, Value{std::string("a")},
                        FieldType::Text), "text lexicographic");
    ctx.check(e.compare(CompareOp::Eq, Value{std::string("18")}, Value{18.0}, FieldType::Numeric),
              "numeric text converts");
}

static void test_evaluator_conditions(TestContext& ctx) {
    const Specification spec = clinical_spec();
    TestData d;
    set_value(d, kAge, 30.0);
    set_value(d, kSex, std::string("F"));
    set_value(d, FieldPath{"Visit", "VisitDate"}, std::string("2024-03-01"));
    set_value(d, FieldPath{"Demographics", "Consent"}, true);

    ctx.check_verdict(eval("Demographics.Age BETWEEN 18 AND 65", d, spec), true, "BETWEEN");
    ctx.check(eval("Demographics.Sex IN ('M', 'F')", d, spec) == true, "IN");
    ctx.check(eval("Demographics.Sex NOT IN ('M')", d, spec) == true, "NOT IN");
    ctx.check_verdict(eval("Demographics.Sex = 'f'", d, spec), false, "text equality is exact");
    ctx.check(eval("VitalSigns.HeartRate IS NULL", d, spec) == true, "missing is NULL");
    ctx.check(eval("Visit.VisitDate > 2024-01-01", d, spec) == true, "declared date field");
    ctx.check(eval("Demographics.Consent", d, spec) == true, "bare boolean field");
    ctx.check(eval("IF Demographics.Sex = 'M' THEN Demographics.Age > 50", d, spec) == true,
              "false guard makes the implication hold");
    ctx.check(eval("IF Demographics.Sex = 'F' THEN Demographics.Age > 50 ELSE TRUE", d, spec) == false,
              "true guard takes THEN");
    ctx.check(eval("NOT (Demographics.Age < 18 OR Demographics.Sex = 'M')", d, spec) == true,
              "NOT over OR");

    const Rule unparseable = make_rule("R", "Demographics.Age >>> 3");
    ctx.check_verdict(evaluate_rule(unparseable, spec, d), std::nullopt, "unparseable rule gives no opinion");
}

// ============================================================================
// Multi-modal verifier
// ============================================================================

static TestCase labelled(const std::string& description, double age, bool expected) {
    TestCase tc;
    tc.rule_id = "R";
    tc.description = description;
    tc.expected_result = expected;
    tc.is_positive = expected;
    set_value(tc.test_data, kAge, age);
    return tc;
}

static void test_multimodal_majority(TestContext& ctx) {
    const Specification spec = clinical_spec();
    const Rule rule = make_rule("R", "Demographics.Age >= 18");
    MultiModalVerifier mm;

    const auto kept = mm.verify(rule, spec, {labelled("adult", 30.0, true),
                                             labelled("mislabelled minor", 10.0, true),
                                             labelled("minor", 10.0, false)});
    ctx.check(kept.size() == 2, "mislabelled test is discarded");
    ctx.check(kept.size() == 2 && kept[0].description == "adult [verified 2/2]", "verification suffix");
    ctx.check(kept.size() == 2 && kept[1].description == "minor [verified 2/2]", "order preserved");

    TestCase confused = labelled("confused", 0.0, false);
    set_value(confused.test_data, kAge, std::string("abc"));
    const Verdict v = mm.assess(rule, spec, confused, {});
    ctx.check(v.total == 1 && v.valid == 1 && v.keep, "only the evaluator has an opinion");

    Rule informal;
    informal.id = "F";
    informal.condition = "free text only";
    ctx.check(mm.verify(informal, spec, {labelled("anything", 1.0, true)}).empty(),
              "no opinions means discard");
}

static void test_multimodal_cross_validation(TestContext& ctx) {
    const Specification spec = clinical_spec();
    const Rule strict = make_rule("R21", "Demographics.Age >= 21");
    const Rule loose  = make_rule("R18", "Demographics.Age >= 18");
    const Rule other  = make_rule("RBP", "VitalSigns.SystolicBP > 90");
    const std::vector<Rule> rules{strict, loose, other};
    MultiModalVerifier mm;

    const auto related = mm.related_rules(strict, rules, spec);
    ctx.check(related.size() == 1 && related[0].rule->id == "R18", "only the rule sharing a field");
    ctx.check(!related.empty() && related[0].implied_by_rule && !related[0].implies_rule,
              "R21 implies R18");

    const auto kept = mm.verify(strict, spec, {labelled("adult", 30.0, true)}, rules);
    ctx.check(kept.size() == 1 && kept[0].description == "adult [verified 3/3]",
              "implied rule gives a third opinion");

    const auto neg = mm.verify(loose, spec, {labelled("minor", 10.0, false)}, rules);
    ctx.check(neg.size() == 1 && neg[0].description == "minor [verified 3/3]",
              "negative test must violate the implying rule");

    // A wrong relation outvoted by the other two opinions.
    const Rule senior = make_rule("R65", "Demographics.Age >= 65");
    std::vector<RelatedRule> bogus{RelatedRule{&senior, true, false}};
    const Verdict v = mm.assess(loose, spec, labelled("adult", 30.0, true), bogus);
    ctx.check(v.total == 3 && v.valid == 2 && v.keep, "two of three keeps the test");
}

// ============================================================================
// Orchestrator
// ============================================================================

static std::vector<Rule> pipeline_rules() {
    return {make_rule("R001", "VitalSigns.SystolicBP > VitalSigns.DiastolicBP"),
            make_rule("R002", "Demographics.Age >= 18"),
            make_rule("R003", "Visit.VisitDate < Visit.DischargeDate")};
}

static void test_orchestrator_pipeline(TestContext& ctx) {
    const Specification spec = clinical_spec();
    GeneratorOptions opts;
    opts.seed = 3;
    TestGenerator gen(opts);

    const Rule rule = make_rule("R001", "VitalSigns.SystolicBP > VitalSigns.DiastolicBP");
    const auto tests = gen.generate_tests_for_rule(rule, spec);
    ctx.check(!tests.empty(), "pipeline produces tests");

    std::set<std::string> prefixes;
    bool tagged = true;
    for (const TestCase& tc : tests) {
        tagged = tagged && starts_with(tc.description, "[") && contains(tc.description, " [verified ");
        prefixes.insert(tc.description.substr(0, tc.description.find(']') + 1));
    }
    ctx.check(tagged, "technique prefix and verification suffix");
    ctx.check(prefixes.count("[symbolic]") == 1, "symbolic tests survive");
    ctx.check(prefixes.count("[metamorphic]") == 1, "metamorphic tests survive");
    ctx.check(labels_agree(rule, spec, tests), "kept labels agree with direct evaluation");

    const auto only = gen.generate_tests({rule}, spec, false, {Technique::Symbolic});
    bool symbolic_only = !only.at("R001").empty();
    for (const TestCase& tc : only.at("R001")) {
        symbolic_only = symbolic_only && starts_with(tc.description, "[symbolic] ");
    }
    ctx.check(symbolic_only, "technique subset");
}

static void test_orchestrator_parallel_equivalence(TestContext& ctx) {
    const Specification spec = clinical_spec();
    const std::vector<Rule> rules = pipeline_rules();
    GeneratorOptions opts;
    opts.seed = 9;
    opts.max_workers = 4;
    TestGenerator gen(opts);

    const auto seq = gen.generate_tests(rules, spec, false);
    const auto par = gen.generate_tests(rules, spec, true);
    ctx.check(seq.size() == 3 && par.size() == 3, "an entry per rule");

    bool same = true;
    for (const auto& [id, tests] : seq) {
        auto it = par.find(id);
        if (it == par.end() || it->second.size() != tests.size()) {
            same = false;
            continue;
        }
        for (std::size_t i = 0; i < tests.size(); ++i) {
            same = same && tests[i].description == it->second[i].description &&
                   tests[i].expected_result == it->second[i].expected_result;
        }
    }
    ctx.check(same, "parallel and sequential runs agree");
}

static void test_orchestrator_filters(TestContext& ctx) {
    const Specification spec = clinical_spec();
    TestGenerator gen(GeneratorOptions{}, std::make_shared<ScriptedProposer>());

    const Rule rule = make_rule("R002", "Demographics.Age >= 18");
    const auto adversarial = gen.generate_tests({rule}, spec, false, {Technique::Adversarial});
    bool llm = false;
    for (const TestCase& tc : adversarial.at("R002")) {
        llm = llm || starts_with(tc.description, "[llm] Elderly participant");
    }
    ctx.check(llm, "proposer scenarios carry the llm tag");

    const auto plain = TestGenerator().generate_tests({rule}, spec, false, {Technique::Adversarial});
    const auto unreachable = TestGenerator(GeneratorOptions{}, std::make_shared<UnreachableProposer>())
                                 .generate_tests({rule}, spec, false, {Technique::Adversarial});
    ctx.check(!plain.at("R002").empty() &&
              unreachable.at("R002").size() == plain.at("R002").size(),
              "unreachable proposer leaves the adversarial suite intact");

    // A non-standard exception from a technique stays inside its task.
    TestGenerator foreign(GeneratorOptions{}, std::make_shared<ForeignThrowProposer>());
    for (bool parallel : {false, true}) {
        const auto mixed = foreign.generate_tests({rule}, spec, parallel,
                                                  {Technique::Symbolic, Technique::Adversarial});
        bool symbolic = false;
        bool adversarial = false;
        for (const TestCase& tc : mixed.at("R002")) {
            symbolic = symbolic || starts_with(tc.description, "[symbolic] ");
            adversarial = adversarial || starts_with(tc.description, "[adversarial] ");
        }
        ctx.check(symbolic, "other techniques survive a foreign exception");
        ctx.check(!adversarial, "the failing technique contributes nothing");
    }

    const Rule undeclared = make_rule("R009", "Demographics.Height > 100");
    const auto none = gen.generate_tests({undeclared}, spec, false);
    ctx.check(none.count("R009") == 1 && none.at("R009").empty(),
              "tests naming undeclared fields never reach the suite");

    const auto results = gen.verify_rule_set({make_rule("R1", "Demographics.Age >= 18"),
                                              make_rule("R2", "Demographics.Age < 18")}, spec);
    ctx.check(results[0].has_error("contradictory_rules") && results[1].has_error("contradictory_rules"),
              "Age >= 18 and Age < 18 contradict");
    ctx.check(gen.verify_rule(make_rule("R3", "Demographics.Age > 200 AND Demographics.Age < 100"), spec)
                  .has_error("unsatisfiable_rule"), "verify_rule delegates");
}

// ============================================================================
// Input files and CLI
// ============================================================================

static void test_loader_specification(TestContext& ctx) {
    const Specification spec = parse_specification({
        "Visit.VisitDate date required min=2020-01-01   # enrolment opened",
        "",
        "Demographics.Sex categorical values=M|F|U label=Sex_at_birth",
        "Demographics.Age integer min=0 max=120",
    });
    const Field* date = spec.find_field("Visit", "VisitDate");
    ctx.check(date && date->required && date->type == FieldType::Date, "date field");
    ctx.check(date && date->min_value == static_cast<double>(*parse_date("2020-01-01")),
              "date bound is a day count");
    const Field* sex = spec.find_field("Demographics", "Sex");
    ctx.check(sex && sex->valid_values.size() == 3 && sex->label == "Sex_at_birth", "values and label");
    ctx.check(spec.lookup("Age")->max_value == 120.0, "numeric bound");

    auto fails = [](std::vector<std::string> lines) {
        try {
            parse_specification(lines);
        } catch (const std::runtime_error&) {
            return true;
        }
        return false;
    };
    ctx.check(fails({"Age numeric"}), "reference without form");
    ctx.check(fails({"A.X numeric min=abc"}), "bad bound");
    ctx.check(fails({"A.X numeric", "A.X text"}), "duplicate field");
    ctx.check(fails({"A.X numeric min=5 max=1"}), "inverted bounds");
    ctx.check(fails({"A.X numeric colour=red"}), "unknown attribute");
}

static void test_loader_rules(TestContext& ctx) {
    const auto rules = parse_rules({
        "# id | severity | formalized | text",
        "R001 | error   | VitalSigns.SystolicBP > VitalSigns.DiastolicBP | SBP must exceed DBP",
        "R002 | warning |  | Age should be plausible",
        "R003 | info    | Demographics.Age >= 18 | adults | seniors",
    });
    ctx.check(rules.size() == 3, "three rules");
    if (rules.size() != 3) return;
    ctx.check(rules[0].has_formalized() && rules[0].message == "SBP must exceed DBP", "formal rule");
    ctx.check(!rules[1].has_formalized() && rules[1].condition == "Age should be plausible",
              "informal rule keeps its text");
    ctx.check(rules[1].severity == Severity::Warning, "severity");
    ctx.check_eq(rules[2].message, "adults | seniors", "free text may contain the separator");

    auto fails = [](std::vector<std::string> lines) {
        try {
            parse_rules(lines);
        } catch (const std::runtime_error&) {
            return true;
        }
        return false;
    };
    ctx.check(fails({"R1 | critical | A.X > 1 | t"}), "unknown severity");
    ctx.check(fails({"R1 | error | A.X > 1", "R1 | error | A.X > 2"}), "duplicate id");
    ctx.check(fails({"R1 | error"}), "too few columns");
    ctx.check(fails({"R1 | error |  | "}), "no condition at all");
}

static void test_loader_files(TestContext& ctx) {
    const auto dir = std::filesystem::temp_directory_path() / "edc_selftest";
    std::filesystem::create_directories(dir);
    const std::string spec_path = (dir / "spec.txt").string();
    const std::string rules_path = (dir / "rules.txt").string();
    {
        std::ofstream f(spec_path);
        f << "Demographics.Age numeric min=0 max=120\n";
    }
    {
        std::ofstream f(rules_path);
        f << "R1 | error | Demographics.Age >= 18 | adults only\n";
    }
    ctx.check(load_specification(spec_path).find_field("Demographics", "Age") != nullptr, "spec file");
    ctx.check(load_rules(rules_path).size() == 1, "rules file");

    bool threw = false;
    try {
        load_rules((dir / "missing.txt").string());
    } catch (const std::runtime_error& e) {
        threw = contains(e.what(), "missing.txt");
    }
    ctx.check(threw, "missing file names its path");
    std::filesystem::remove_all(dir);
}

static Options parse(std::vector<std::string> args) {
    std::vector<char*> argv;
    for (std::string& a : args) argv.push_back(a.data());
    return parse_args(static_cast<int>(argv.size()), argv.data());
}

static void test_cli_args(TestContext& ctx) {
    Options o = parse({"edc_check", "--spec", "s.txt", "--rules", "r.txt", "--techniques",
                       "symbolic,causal", "--seed", "7", "-j", "4", "--json", "--sequential"});
    ctx.check_eq(o.spec_path, "s.txt", "spec path");
    ctx.check_eq(o.rules_path, "r.txt", "rules path");
    ctx.check(o.techniques == std::vector<Technique>{Technique::Symbolic, Technique::Causal}, "techniques");
    ctx.check(o.seed == 7 && o.num_threads == 4, "numeric options");
    ctx.check(o.json && o.sequential && !o.verify_only, "flags");
    ctx.check(parse({"edc_check", "--selftest"}).selftest, "selftest needs no inputs");

    auto fails = [](std::vector<std::string> args) {
        try {
            parse(std::move(args));
        } catch (const std::runtime_error&) {
            return true;
        }
        return false;
    };
    ctx.check(fails({"edc_check", "--spec", "s.txt"}), "rules required");
    ctx.check(fails({"edc_check", "--spec", "s", "--rules", "r", "--techniques", "fuzz"}), "bad technique");
    ctx.check(fails({"edc_check", "--spec", "s", "--rules", "r", "--threads", "-1"}), "negative threads");
    ctx.check(fails({"edc_check", "--bogus"}), "unknown option");
    ctx.check(fails({"edc_check", "--spec"}), "missing value");
    ctx.check(fails({"edc_check", "--spec", "s", "--rules", "r", "--seed", "100000000000000000000"}),
              "seed beyond unsigned range");
    ctx.check(fails({"edc_check", "--spec", "s", "--rules", "r", "--seed", "1e20"}), "exponent seed");
    ctx.check(parse({"edc_check", "--spec", "s", "--rules", "r", "--seed", "4294967295"}).seed == 4294967295u,
              "largest unsigned seed accepted");
}

static void test_cli_render(TestContext& ctx) {
    Report report;
    ValidationResult r;
    r.rule_id = "R001";
    r.add_error("contradictory_rules", "rule R001 contradicts rule \"R002\"", "R002");
    report.results.push_back(r);

    TestCase tc = labelled("[symbolic] adult [verified 2/2]", 30.0, true);
    tc.rule_id = "R001";
    set_value(tc.test_data, FieldPath{"Demographics", "Note"}, Value{});
    report.tests["R001"].push_back(tc);

    const std::string text = render_text(report);
    ctx.check(contains(text, "R001: INVALID"), "text verdict");
    ctx.check(contains(text, "error contradictory_rules (R002)"), "text finding");
    ctx.check(contains(text, "[+] [symbolic] adult"), "text test line");

    const std::string json = render_json(report);
    ctx.check(contains(json, "\\\"R002\\\""), "quotes are escaped");
    ctx.check(contains(json, "\"Age\": 30"), "numbers stay numbers");
    ctx.check(contains(json, "\"Note\": null"), "NULL is null");
    ctx.check(contains(json, "\"valid\": false"), "validity flag");

    report.with_tests = false;
    ctx.check(!contains(render_json(report), "\"tests\""), "verify-only omits tests");
}

// ============================================================================
// run_selftests
// ============================================================================

int run_selftests() {
    set_log_level(LogLevel::Error);
    TestRunner runner;

    // Utilities
    runner.run("util_dates",                    test_util_dates);
    runner.run("util_numbers",                  test_util_numbers);
    runner.run("log_levels",                    test_log_levels);

    // Lexer
    runner.run("lexer_operators",               test_lexer_operators);
    runner.run("lexer_literals",                test_lexer_literals);
    runner.run("lexer_errors",                  test_lexer_errors);

    // Parser
    runner.run("parse_connectives",             test_parse_connectives);
    runner.run("parse_predicates",              test_parse_predicates);
    runner.run("parse_interning",               test_parse_interning);
    runner.run("parse_errors",                  test_parse_errors);

    // Extraction
    runner.run("extraction",                    test_extraction);
    runner.run("extraction_lenient",            test_extraction_lenient);
    runner.run("compare_op_helpers",            test_compare_op_helpers);

    // Data model
    runner.run("model_invariants",              test_model_invariants);
    runner.run("model_resolution",              test_model_resolution);
    runner.run("model_validate_test_data",      test_model_validate_test_data);

    // SMT encoding
    runner.run("smt_scopes",                    test_smt_scopes);
    runner.run("smt_domain_and_nulls",          test_smt_domain_and_nulls);
    runner.run("smt_inferred_types",            test_smt_inferred_types);
    runner.run("smt_ordering_on_text_rejected", test_smt_ordering_on_text_rejected);

    // Verifier
    runner.run("verifier_unsatisfiable",        test_verifier_unsatisfiable);
    runner.run("verifier_tautology_and_witness", test_verifier_tautology_and_witness);
    runner.run("verifier_references",           test_verifier_references);
    runner.run("verifier_edge_cases",           test_verifier_edge_cases);
    runner.run("verifier_contradiction",        test_verifier_contradiction);
    runner.run("verifier_implication_and_pair_limit", test_verifier_implication_and_pair_limit);
    runner.run("verifier_check_test_case",      test_verifier_check_test_case);

    // Generators
    runner.run("symbolic_blood_pressure",       test_symbolic_blood_pressure);
    runner.run("symbolic_systolic_not_above_diastolic", test_symbolic_systolic_not_above_diastolic);
    runner.run("symbolic_unsat_has_no_positive", test_symbolic_unsat_has_no_positive);
    runner.run("symbolic_informal_and_fallback", test_symbolic_informal_and_fallback);
    runner.run("metamorphic_table",             test_metamorphic_table);
    runner.run("metamorphic_numeric",           test_metamorphic_numeric);
    runner.run("metamorphic_dates_and_fields",  test_metamorphic_dates_and_fields);
    runner.run("adversarial_strategies",        test_adversarial_strategies);
    runner.run("adversarial_proposer",          test_adversarial_proposer);
    runner.run("causal_graph",                  test_causal_graph);
    runner.run("causal_locality",               test_causal_locality);
    runner.run("causal_confounding",            test_causal_confounding);

    // Evaluation and voting
    runner.run("evaluator_compare",             test_evaluator_compare);
    runner.run("evaluator_conditions",          test_evaluator_conditions);
    runner.run("multimodal_majority",           test_multimodal_majority);
    runner.run("multimodal_cross_validation",   test_multimodal_cross_validation);

    // Pipeline
    runner.run("orchestrator_pipeline",         test_orchestrator_pipeline);
    runner.run("orchestrator_parallel_equivalence", test_orchestrator_parallel_equivalence);
    runner.run("orchestrator_filters",          test_orchestrator_filters);

    // Inputs and CLI
    runner.run("loader_specification",          test_loader_specification);
    runner.run("loader_rules",                  test_loader_rules);
    runner.run("loader_files",                  test_loader_files);
    runner.run("cli_args",                      test_cli_args);
    runner.run("cli_render",                    test_cli_render);

    return runner.summarise();
}

}  // namespace edc
