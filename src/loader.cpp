// ============================================================================
// loader.cpp — Line-oriented specification and rule files
// ============================================================================

#include "edc/loader.hpp"
#include "edc/utils.hpp"

#include <iterator>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace edc {

static std::runtime_error line_error(std::size_t line, const std::string& what) {
    return std::runtime_error("line " + std::to_string(line) + ": " + what);
}

/// Numeric bound, or a day count for temporal fields.
static double parse_bound(const std::string& text, FieldType type, std::size_t line) {
    if (auto n = parse_number(text)) return *n;
    if (is_temporal(type)) {
        if (auto d = parse_date(text)) return static_cast<double>(*d);
    }
    throw line_error(line, "invalid bound '" + text + "'");
}

// ── parse_specification ─────────────────────────────────────────────────────

Specification parse_specification(const std::vector<std::string>& lines) {
    // Forms in first-appearance order with their fields.
    std::vector<std::pair<std::string, std::vector<Field>>> forms;

    for (std::size_t i = 0; i < lines.size(); ++i) {
        const std::size_t line_num = i + 1;
        const std::string content = strip_comment(lines[i]);
        if (content.empty()) continue;

        std::istringstream in(content);
        std::string ref, type_name;
        if (!(in >> ref >> type_name)) {
            throw line_error(line_num, "expected 'Form.Field type'");
        }

        const auto dot = ref.find('.');
        if (dot == std::string::npos || dot == 0 || dot + 1 == ref.size() ||
            ref.find('.', dot + 1) != std::string::npos) {
            throw line_error(line_num, "field reference must be Form.Field: '" + ref + "'");
        }

        Field field;
        field.name  = ref.substr(dot + 1);
        field.type  = field_type_from_string(type_name);
        field.label = field.name;

        std::string attr;
        while (in >> attr) {
            if (iequals(attr, "required")) {
                field.required = true;
                continue;
            }
            const auto eq = attr.find('=');
            if (eq == std::string::npos) {
                throw line_error(line_num, "unknown attribute '" + attr + "'");
            }
            const std::string key   = to_lower(attr.substr(0, eq));
            const std::string value = attr.substr(eq + 1);

            if (key == "min") {
                field.min_value = parse_bound(value, field.type, line_num);
            } else if (key == "max") {
                field.max_value = parse_bound(value, field.type, line_num);
            } else if (key == "values") {
                for (const std::string& v : split(value, '|')) {
                    if (!v.empty()) field.valid_values.push_back(v);
                }
            } else if (key == "label") {
                field.label = value;
            } else {
                throw line_error(line_num, "unknown attribute '" + key + "'");
            }
        }

        if (field.min_value && field.max_value && *field.min_value > *field.max_value) {
            throw line_error(line_num, "min exceeds max for '" + ref + "'");
        }

        const std::string form_name = ref.substr(0, dot);
        auto it = forms.begin();
        while (it != forms.end() && it->first != form_name) ++it;
        if (it == forms.end()) {
            forms.emplace_back(form_name, std::vector<Field>{});
            it = std::prev(forms.end());
        }
        for (const Field& f : it->second) {
            if (f.name == field.name) throw line_error(line_num, "duplicate field '" + ref + "'");
        }
        it->second.push_back(std::move(field));
    }

    Specification spec;
    for (auto& [name, fields] : forms) {
        Form& form = spec.add_form(name);
        for (Field& f : fields) form.add_field(std::move(f));
    }
    return spec;
}

// ── parse_rules ─────────────────────────────────────────────────────────────

std::vector<Rule> parse_rules(const std::vector<std::string>& lines) {
    std::vector<Rule> rules;

    for (std::size_t i = 0; i < lines.size(); ++i) {
        const std::size_t line_num = i + 1;
        const std::string content = strip_comment(lines[i]);
        if (content.empty()) continue;

        std::vector<std::string> cols = split(content, '|');
        if (cols.size() < 3) {
            throw line_error(line_num, "expected 'ID | severity | condition | text'");
        }

        Rule rule;
        rule.id = cols[0];
        if (rule.id.empty()) throw line_error(line_num, "empty rule id");

        try {
            rule.severity = severity_from_string(cols[1]);
        } catch (const std::invalid_argument& e) {
            throw line_error(line_num, e.what());
        }

        if (!cols[2].empty()) rule.formalized_condition = cols[2];

        // The free-text column may itself contain '|'.
        std::string text;
        for (std::size_t c = 3; c < cols.size(); ++c) {
            if (c > 3) text += " | ";
            text += cols[c];
        }
        if (text.empty() && !rule.formalized_condition) {
            throw line_error(line_num, "rule '" + rule.id + "' has no condition");
        }
        rule.condition = text.empty() ? *rule.formalized_condition : text;
        rule.message   = text;

        for (const Rule& seen : rules) {
            if (seen.id == rule.id) throw line_error(line_num, "duplicate rule id '" + rule.id + "'");
        }
        rules.push_back(std::move(rule));
    }
    return rules;
}

// ── File wrappers ───────────────────────────────────────────────────────────

Specification load_specification(const std::string& path) {
    try {
        return parse_specification(read_lines(path));
    } catch (const std::runtime_error& e) {
        throw std::runtime_error(path + ": " + e.what());
    }
}

std::vector<Rule> load_rules(const std::string& path) {
    try {
        return parse_rules(read_lines(path));
    } catch (const std::runtime_error& e) {
        throw std::runtime_error(path + ": " + e.what());
    }
}

}  // namespace edc
