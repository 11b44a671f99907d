// ============================================================================
// edc/model.hpp — Specification, rules, test cases and validation results
// ============================================================================
//
// Design notes:
//
//   Specification and Rule are immutable inputs produced by an earlier
//   ingestion stage.  TestCase and ValidationResult are created fresh per
//   invocation.
//
//   Field references inside conditions are either "Form.Field" or a bare
//   field name.  Specification::resolve() maps both to a FieldPath, trying
//   the rule's own forms before the rest of the specification.
//
//   Test data is form → field → Value.  A missing key means the value was
//   not entered; std::monostate means an explicit NULL.  Dates travel as
//   ISO strings.
//
// ============================================================================

#ifndef EDC_MODEL_HPP
#define EDC_MODEL_HPP

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace edc {

// ── FieldType ───────────────────────────────────────────────────────────────

enum class FieldType : std::uint8_t {
    Numeric,
    Date,
    DateTime,
    Time,
    Categorical,
    Boolean,
    Text
};

const char* field_type_name(FieldType t) noexcept;

/// Accepts the canonical names plus common aliases ("integer", "float",
/// "timestamp", "enum", "yes/no", "varchar", ...).  Unknown names map to Text.
FieldType field_type_from_string(std::string_view name);

/// Date, DateTime and Time are all carried as day counts.
bool is_temporal(FieldType t) noexcept;

/// Categorical and Text are carried as strings.
bool is_textual(FieldType t) noexcept;

// ── Field / Form ────────────────────────────────────────────────────────────

struct Field {
    std::string              name;
    FieldType                type = FieldType::Text;
    std::string              label;
    bool                     required = false;
    std::vector<std::string> valid_values;   // categorical only
    std::optional<double>    min_value;      // numeric value or day count
    std::optional<double>    max_value;

    bool accepts_value(const std::string& v) const;
};

class Form {
public:
    explicit Form(std::string name = {});

    const std::string& name() const noexcept { return name_; }

    /// Throws std::invalid_argument if a field of that name already exists.
    void add_field(Field field);

    const Field* find_field(const std::string& name) const noexcept;
    const std::vector<Field>& fields() const noexcept { return fields_; }

private:
    std::string        name_;
    std::vector<Field> fields_;
};

// ── FieldPath ───────────────────────────────────────────────────────────────

struct FieldPath {
    std::string form;
    std::string field;

    std::string ref() const { return form + "." + field; }

    bool operator==(const FieldPath& o) const noexcept {
        return form == o.form && field == o.field;
    }
    bool operator<(const FieldPath& o) const noexcept {
        return form != o.form ? form < o.form : field < o.field;
    }
};

// ── Specification ───────────────────────────────────────────────────────────

class Specification {
public:
    /// Throws std::invalid_argument if a form of that name already exists.
    Form& add_form(const std::string& name);

    const Form*  find_form(const std::string& name) const noexcept;
    const Field* find_field(const std::string& form, const std::string& field) const noexcept;

    /// Resolve "Form.Field" or a bare field name.  Bare names are looked up
    /// in `preferred_forms` first, then in every form (first match wins).
    std::optional<FieldPath> resolve(const std::string& ref,
                                     const std::vector<std::string>& preferred_forms = {}) const;

    /// resolve() followed by find_field(); nullptr when undeclared.
    const Field* lookup(const std::string& ref,
                        const std::vector<std::string>& preferred_forms = {}) const;

    const std::map<std::string, Form>& forms() const noexcept { return forms_; }
    bool empty() const noexcept { return forms_.empty(); }

private:
    std::map<std::string, Form> forms_;
};

// ── Severity ────────────────────────────────────────────────────────────────

enum class Severity : std::uint8_t {
    Error,
    Warning,
    Info
};

const char* severity_name(Severity s) noexcept;

/// Throws std::invalid_argument for anything but error/warning/info.
Severity severity_from_string(std::string_view name);

// ── Rule ────────────────────────────────────────────────────────────────────

struct Rule {
    std::string                id;
    std::string                condition;             // free text
    std::optional<std::string> formalized_condition;  // logical expression
    Severity                   severity = Severity::Error;
    std::string                message;
    std::vector<std::string>   forms;
    std::vector<std::string>   fields;

    bool has_formalized() const;

    /// The formalized condition when present, the free text otherwise.
    const std::string& working_condition() const;
};

/// Forms the rule's test data may touch: `rule.forms` when given, otherwise
/// the forms of every resolvable field the condition references.
std::vector<std::string> rule_forms(const Rule& rule, const Specification& spec);

// ── Value / TestData ────────────────────────────────────────────────────────

using Value       = std::variant<std::monostate, bool, double, std::string>;
using FieldValues = std::map<std::string, Value>;
using TestData    = std::map<std::string, FieldValues>;

bool        is_null(const Value& v) noexcept;
std::string value_to_string(const Value& v);

/// Where a condition's field reference lives in test data: the resolved
/// path, or the literal "Form.Field" split when the field is undeclared.
std::optional<FieldPath> field_path_of(const std::string& ref, const Specification& spec,
                                       const std::vector<std::string>& preferred_forms = {});

/// nullptr when the form or field key is absent.
const Value* find_value(const TestData& data, const FieldPath& path);
void         set_value(TestData& data, const FieldPath& path, Value v);

// ── Technique ───────────────────────────────────────────────────────────────

enum class Technique : std::uint8_t {
    Metamorphic,
    Symbolic,
    Adversarial,
    Causal,
    Llm
};

const char* technique_name(Technique t) noexcept;
std::optional<Technique> parse_technique(std::string_view name);

/// The four generating techniques, in pipeline order.  Llm is only a tag.
const std::vector<Technique>& generator_techniques();

// ── TestCase ────────────────────────────────────────────────────────────────

struct TestCase {
    std::string rule_id;
    std::string description;
    bool        expected_result = false;
    TestData    test_data;
    Technique   technique = Technique::Symbolic;
    bool        is_positive = false;
};

/// Every test_data[form][field] path must name a declared field of one of
/// the rule's forms.
bool validate_test_data(const TestCase& tc, const Rule& rule, const Specification& spec);

// ── ValidationResult ────────────────────────────────────────────────────────

struct Finding {
    std::string code;          // e.g. "unsatisfiable_rule"
    std::string message;
    std::string related_rule;  // set for pairwise findings
};

struct ValidationResult {
    std::string          rule_id;
    bool                 is_valid = true;
    std::vector<Finding> errors;
    std::vector<Finding> warnings;

    /// Satisfying assignment (field reference → value) when one was found.
    std::map<std::string, std::string> witness;

    void add_error(std::string code, std::string message, std::string related_rule = {});
    void add_warning(std::string code, std::string message, std::string related_rule = {});

    bool has_error(std::string_view code) const noexcept;
    bool has_warning(std::string_view code) const noexcept;
};

}  // namespace edc

#endif  // EDC_MODEL_HPP
