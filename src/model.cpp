// ============================================================================
// model.cpp — Data model helpers
// ============================================================================

#include "edc/model.hpp"
#include "edc/condition.hpp"
#include "edc/utils.hpp"

#include <algorithm>
#include <stdexcept>

namespace edc {

// ── FieldType ───────────────────────────────────────────────────────────────

const char* field_type_name(FieldType t) noexcept {
    switch (t) {
        case FieldType::Numeric:     return "numeric";
        case FieldType::Date:        return "date";
        case FieldType::DateTime:    return "datetime";
        case FieldType::Time:        return "time";
        case FieldType::Categorical: return "categorical";
        case FieldType::Boolean:     return "boolean";
        case FieldType::Text:        return "text";
    }
    return "?";
}

FieldType field_type_from_string(std::string_view name) {
    const std::string n = to_lower(trim(std::string(name)));

    if (n == "numeric" || n == "number" || n == "integer" || n == "int" ||
        n == "float" || n == "decimal" || n == "double") {
        return FieldType::Numeric;
    }
    if (n == "date") return FieldType::Date;
    if (n == "datetime" || n == "timestamp" || n == "date_time") return FieldType::DateTime;
    if (n == "time") return FieldType::Time;
    if (n == "categorical" || n == "category" || n == "enum" || n == "codelist" ||
        n == "select" || n == "radio" || n == "dropdown") {
        return FieldType::Categorical;
    }
    if (n == "boolean" || n == "bool" || n == "yes/no" || n == "yesno" ||
        n == "checkbox") {
        return FieldType::Boolean;
    }
    return FieldType::Text;
}

bool is_temporal(FieldType t) noexcept {
    return t == FieldType::Date || t == FieldType::DateTime || t == FieldType::Time;
}

bool is_textual(FieldType t) noexcept {
    return t == FieldType::Categorical || t == FieldType::Text;
}

bool Field::accepts_value(const std::string& v) const {
    if (valid_values.empty()) return true;
    return std::any_of(valid_values.begin(), valid_values.end(),
                       [&v](const std::string& allowed) { return iequals(allowed, v); });
}

// ── Form ────────────────────────────────────────────────────────────────────

Form::Form(std::string name) : name_(std::move(name)) {}

void Form::add_field(Field field) {
    if (find_field(field.name)) {
        throw std::invalid_argument("duplicate field '" + field.name + "' in form '" + name_ + "'");
    }
    fields_.push_back(std::move(field));
}

const Field* Form::find_field(const std::string& name) const noexcept {
    for (const Field& f : fields_) {
        if (f.name == name) return &f;
    }
    return nullptr;
}

// ── Specification ───────────────────────────────────────────────────────────

Form& Specification::add_form(const std::string& name) {
    auto [it, inserted] = forms_.emplace(name, Form(name));
    if (!inserted) {
        throw std::invalid_argument("duplicate form '" + name + "'");
    }
    return it->second;
}

const Form* Specification::find_form(const std::string& name) const noexcept {
    auto it = forms_.find(name);
    return it == forms_.end() ? nullptr : &it->second;
}

const Field* Specification::find_field(const std::string& form,
                                       const std::string& field) const noexcept {
    const Form* f = find_form(form);
    return f ? f->find_field(field) : nullptr;
}

std::optional<FieldPath> Specification::resolve(
        const std::string& ref, const std::vector<std::string>& preferred_forms) const {
    auto dot = ref.find('.');
    if (dot != std::string::npos) {
        FieldPath p{ref.substr(0, dot), ref.substr(dot + 1)};
        if (!find_field(p.form, p.field)) return std::nullopt;
        return p;
    }

    for (const std::string& form : preferred_forms) {
        if (find_field(form, ref)) return FieldPath{form, ref};
    }
    for (const auto& [name, form] : forms_) {
        if (form.find_field(ref)) return FieldPath{name, ref};
    }
    return std::nullopt;
}

const Field* Specification::lookup(const std::string& ref,
                                   const std::vector<std::string>& preferred_forms) const {
    auto p = resolve(ref, preferred_forms);
    return p ? find_field(p->form, p->field) : nullptr;
}

// ── Severity ────────────────────────────────────────────────────────────────

const char* severity_name(Severity s) noexcept {
    switch (s) {
        case Severity::Error:   return "error";
        case Severity::Warning: return "warning";
        case Severity::Info:    return "info";
    }
    return "?";
}

Severity severity_from_string(std::string_view name) {
    const std::string n = to_lower(trim(std::string(name)));
    if (n == "error")   return Severity::Error;
    if (n == "warning") return Severity::Warning;
    if (n == "info")    return Severity::Info;
    throw std::invalid_argument("unknown severity '" + std::string(name) + "'");
}

// ── Rule ────────────────────────────────────────────────────────────────────

bool Rule::has_formalized() const {
    return formalized_condition && !trim(*formalized_condition).empty();
}

const std::string& Rule::working_condition() const {
    return has_formalized() ? *formalized_condition : condition;
}

std::vector<std::string> rule_forms(const Rule& rule, const Specification& spec) {
    if (!rule.forms.empty()) return rule.forms;

    std::vector<std::string> forms;
    for (const std::string& ref : extract_field_references(rule.working_condition())) {
        auto p = spec.resolve(ref);
        if (p && std::find(forms.begin(), forms.end(), p->form) == forms.end()) {
            forms.push_back(p->form);
        }
    }
    return forms;
}

// ── Value ───────────────────────────────────────────────────────────────────

bool is_null(const Value& v) noexcept {
    return std::holds_alternative<std::monostate>(v);
}

std::string value_to_string(const Value& v) {
    if (std::holds_alternative<bool>(v))   return std::get<bool>(v) ? "true" : "false";
    if (std::holds_alternative<double>(v)) return format_number(std::get<double>(v));
    if (std::holds_alternative<std::string>(v)) return std::get<std::string>(v);
    return "NULL";
}

std::optional<FieldPath> field_path_of(const std::string& ref, const Specification& spec,
                                       const std::vector<std::string>& preferred_forms) {
    if (auto p = spec.resolve(ref, preferred_forms)) return p;
    auto dot = ref.find('.');
    if (dot == std::string::npos || dot == 0 || dot + 1 == ref.size()) return std::nullopt;
    return FieldPath{ref.substr(0, dot), ref.substr(dot + 1)};
}

const Value* find_value(const TestData& data, const FieldPath& path) {
    auto form_it = data.find(path.form);
    if (form_it == data.end()) return nullptr;
    auto field_it = form_it->second.find(path.field);
    return field_it == form_it->second.end() ? nullptr : &field_it->second;
}

void set_value(TestData& data, const FieldPath& path, Value v) {
    data[path.form][path.field] = std::move(v);
}

// ── Technique ───────────────────────────────────────────────────────────────

const char* technique_name(Technique t) noexcept {
    switch (t) {
        case Technique::Metamorphic: return "metamorphic";
        case Technique::Symbolic:    return "symbolic";
        case Technique::Adversarial: return "adversarial";
        case Technique::Causal:      return "causal";
        case Technique::Llm:         return "llm";
    }
    return "?";
}

std::optional<Technique> parse_technique(std::string_view name) {
    const std::string n = to_lower(trim(std::string(name)));
    if (n == "metamorphic") return Technique::Metamorphic;
    if (n == "symbolic")    return Technique::Symbolic;
    if (n == "adversarial") return Technique::Adversarial;
    if (n == "causal")      return Technique::Causal;
    if (n == "llm")         return Technique::Llm;
    return std::nullopt;
}

const std::vector<Technique>& generator_techniques() {
    static const std::vector<Technique> kAll = {
        Technique::Metamorphic, Technique::Symbolic,
        Technique::Adversarial, Technique::Causal};
    return kAll;
}

// ── validate_test_data ──────────────────────────────────────────────────────

bool validate_test_data(const TestCase& tc, const Rule& rule, const Specification& spec) {
    const std::vector<std::string> forms = rule_forms(rule, spec);
    for (const auto& [form, fields] : tc.test_data) {
        if (std::find(forms.begin(), forms.end(), form) == forms.end()) return false;
        for (const auto& [field, value] : fields) {
            if (!spec.find_field(form, field)) return false;
        }
    }
    return true;
}

// ── ValidationResult ────────────────────────────────────────────────────────

void ValidationResult::add_error(std::string code, std::string message, std::string related_rule) {
    errors.push_back(Finding{std::move(code), std::move(message), std::move(related_rule)});
    is_valid = false;
}

void ValidationResult::add_warning(std::string code, std::string message, std::string related_rule) {
    warnings.push_back(Finding{std::move(code), std::move(message), std::move(related_rule)});
}

bool ValidationResult::has_error(std::string_view code) const noexcept {
    return std::any_of(errors.begin(), errors.end(),
                       [code](const Finding& f) { return f.code == code; });
}

bool ValidationResult::has_warning(std::string_view code) const noexcept {
    return std::any_of(warnings.begin(), warnings.end(),
                       [code](const Finding& f) { return f.code == code; });
}

}  // namespace edc
