// ============================================================================
// cli.cpp — Command-line interface and main driver
// ============================================================================

#include "edc/cli.hpp"
#include "edc/loader.hpp"
#include "edc/log.hpp"
#include "edc/orchestrator.hpp"
#include "edc/test.hpp"
#include "edc/utils.hpp"

#include <cmath>
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>

namespace edc {

// ── parse_args ──────────────────────────────────────────────────────────────

static std::string take_value(int argc, char* argv[], int& i, const std::string& flag) {
    if (i + 1 >= argc) {
        throw std::runtime_error(flag + " requires an argument");
    }
    return argv[++i];
}

static unsigned take_unsigned(int argc, char* argv[], int& i, const std::string& flag) {
    const std::string text = take_value(argc, argv, i, flag);
    auto n = parse_number(text);
    if (!n || *n < 0 || std::floor(*n) != *n ||
        *n > static_cast<double>(std::numeric_limits<unsigned>::max())) {
        throw std::runtime_error(flag + " expects a non-negative integer, got '" + text + "'");
    }
    return static_cast<unsigned>(*n);
}

Options parse_args(int argc, char* argv[]) {
    Options opts;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--selftest") {
            opts.selftest = true;
        } else if (arg == "--help" || arg == "-h") {
            opts.help = true;
        } else if (arg == "--spec") {
            opts.spec_path = take_value(argc, argv, i, arg);
        } else if (arg == "--rules") {
            opts.rules_path = take_value(argc, argv, i, arg);
        } else if (arg == "--techniques") {
            for (const std::string& name : split(take_value(argc, argv, i, arg), ',')) {
                if (name.empty()) continue;
                auto t = parse_technique(name);
                if (!t) throw std::runtime_error("unknown technique: " + name);
                opts.techniques.push_back(*t);
            }
        } else if (arg == "--sequential") {
            opts.sequential = true;
        } else if (arg == "--threads" || arg == "-j") {
            opts.num_threads = take_unsigned(argc, argv, i, arg);
        } else if (arg == "--seed") {
            opts.seed = take_unsigned(argc, argv, i, arg);
        } else if (arg == "--verify-only") {
            opts.verify_only = true;
        } else if (arg == "--json") {
            opts.json = true;
        } else if (arg == "--verbose" || arg == "-v") {
            opts.verbose = true;
        } else if (arg.starts_with("-")) {
            throw std::runtime_error("unknown option: " + arg);
        } else {
            throw std::runtime_error("unexpected argument: " + arg);
        }
    }

    if (!opts.selftest && !opts.help && (opts.spec_path.empty() || opts.rules_path.empty())) {
        throw std::runtime_error("both --spec and --rules are required (use --help for usage)");
    }

    return opts;
}

// ── print_usage ─────────────────────────────────────────────────────────────

void print_usage(const char* program_name) {
    std::cerr
        << "Usage: " << program_name << " --spec <spec.txt> --rules <rules.txt> [OPTIONS]\n"
        << "       " << program_name << " --selftest\n"
        << "\n"
        << "Edit-check rule verifier and test generator.\n"
        << "\n"
        << "Options:\n"
        << "  --spec F          Field specification, one 'Form.Field type [attrs]' per line\n"
        << "  --rules F         Rules, one 'ID | severity | formalized | free text' per line\n"
        << "  --techniques L    Comma-separated subset of metamorphic,symbolic,adversarial,causal\n"
        << "  --sequential      Run generation tasks one after another\n"
        << "  --threads N, -j N Upper bound on worker threads (0 = default 8)\n"
        << "  --seed N          Base seed for the randomised generators (default 0)\n"
        << "  --verify-only     Only verify the rules, do not generate tests\n"
        << "  --json            Print the report as JSON\n"
        << "  --verbose, -v     Debug-level diagnostics on stderr\n"
        << "  --selftest        Run built-in tests\n"
        << "  --help, -h        Show this message\n"
        << "\n"
        << "Input format:\n"
        << "  - Empty lines and lines starting with # are ignored\n"
        << "  - Inline comments: everything after # is ignored\n"
        << "\n"
        << "Exit status is 1 when any rule carries an error finding or an input\n"
        << "cannot be read, and 2 on a bad command line.\n";
}

// ── render_text ─────────────────────────────────────────────────────────────

static void write_finding(std::ostream& os, const char* level, const Finding& f) {
    os << "  " << level << " " << f.code;
    if (!f.related_rule.empty()) os << " (" << f.related_rule << ")";
    os << ": " << f.message << "\n";
}

static std::string data_to_string(const TestData& data) {
    std::string out;
    for (const auto& [form, fields] : data) {
        if (fields.empty()) {
            if (!out.empty()) out += ", ";
            out += form + ": {}";
        }
        for (const auto& [field, value] : fields) {
            if (!out.empty()) out += ", ";
            out += form + "." + field + " = " + value_to_string(value);
        }
    }
    return out.empty() ? "{}" : out;
}

std::string render_text(const Report& report) {
    std::ostringstream os;

    for (const ValidationResult& r : report.results) {
        os << r.rule_id << ": " << (r.is_valid ? "VALID" : "INVALID") << "\n";
        for (const Finding& f : r.errors)   write_finding(os, "error", f);
        for (const Finding& f : r.warnings) write_finding(os, "warning", f);
        if (!r.witness.empty()) {
            os << "  witness:";
            for (const auto& [ref, value] : r.witness) os << " " << ref << "=" << value;
            os << "\n";
        }

        if (!report.with_tests) continue;
        auto it = report.tests.find(r.rule_id);
        const std::size_t n = it == report.tests.end() ? 0 : it->second.size();
        os << "  tests (" << n << "):\n";
        if (n == 0) continue;
        for (const TestCase& tc : it->second) {
            os << "    [" << (tc.expected_result ? "+" : "-") << "] " << tc.description << "\n"
               << "        " << data_to_string(tc.test_data) << "\n";
        }
    }
    return os.str();
}

// ── render_json ─────────────────────────────────────────────────────────────

static std::string json_escape(const std::string& s) {
    std::string out = "\"";
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    static const char* hex = "0123456789abcdef";
                    out += "\\u00";
                    out += hex[(c >> 4) & 0xF];
                    out += hex[c & 0xF];
                } else {
                    out += c;
                }
        }
    }
    out += '"';
    return out;
}

static std::string json_value(const Value& v) {
    if (std::holds_alternative<std::monostate>(v)) return "null";
    if (const bool* b = std::get_if<bool>(&v)) return *b ? "true" : "false";
    if (const double* d = std::get_if<double>(&v)) {
        // JSON has no inf/nan; those travel as strings.
        return std::isfinite(*d) ? format_number(*d) : json_escape(value_to_string(v));
    }
    return json_escape(std::get<std::string>(v));
}

static void write_findings(std::ostream& os, const std::vector<Finding>& findings) {
    os << "[";
    for (std::size_t i = 0; i < findings.size(); ++i) {
        const Finding& f = findings[i];
        if (i) os << ", ";
        os << "{\"code\": " << json_escape(f.code)
           << ", \"message\": " << json_escape(f.message);
        if (!f.related_rule.empty()) os << ", \"related_rule\": " << json_escape(f.related_rule);
        os << "}";
    }
    os << "]";
}

static void write_test(std::ostream& os, const TestCase& tc) {
    os << "        {\n"
       << "          \"description\": " << json_escape(tc.description) << ",\n"
       << "          \"technique\": \"" << technique_name(tc.technique) << "\",\n"
       << "          \"expected_result\": " << (tc.expected_result ? "true" : "false") << ",\n"
       << "          \"is_positive\": " << (tc.is_positive ? "true" : "false") << ",\n"
       << "          \"test_data\": {";
    bool first_form = true;
    for (const auto& [form, fields] : tc.test_data) {
        if (!first_form) os << ", ";
        first_form = false;
        os << json_escape(form) << ": {";
        bool first = true;
        for (const auto& [field, value] : fields) {
            if (!first) os << ", ";
            first = false;
            os << json_escape(field) << ": " << json_value(value);
        }
        os << "}";
    }
    os << "}\n"
       << "        }";
}

std::string render_json(const Report& report) {
    std::ostringstream os;
    os << "{\n  \"rules\": [";

    for (std::size_t i = 0; i < report.results.size(); ++i) {
        const ValidationResult& r = report.results[i];
        os << (i ? ",\n" : "\n");
        os << "    {\n"
           << "      \"id\": " << json_escape(r.rule_id) << ",\n"
           << "      \"valid\": " << (r.is_valid ? "true" : "false") << ",\n"
           << "      \"errors\": ";
        write_findings(os, r.errors);
        os << ",\n      \"warnings\": ";
        write_findings(os, r.warnings);
        os << ",\n      \"witness\": {";
        bool first = true;
        for (const auto& [ref, value] : r.witness) {
            if (!first) os << ", ";
            first = false;
            os << json_escape(ref) << ": " << json_escape(value);
        }
        os << "}";

        if (report.with_tests) {
            os << ",\n      \"tests\": [";
            auto it = report.tests.find(r.rule_id);
            if (it != report.tests.end()) {
                for (std::size_t t = 0; t < it->second.size(); ++t) {
                    os << (t ? ",\n" : "\n");
                    write_test(os, it->second[t]);
                }
                if (!it->second.empty()) os << "\n      ";
            }
            os << "]";
        }
        os << "\n    }";
    }

    if (!report.results.empty()) os << "\n  ";
    os << "]\n}\n";
    return os.str();
}

// ── run ─────────────────────────────────────────────────────────────────────

int run(const Options& opts) {
    if (opts.selftest) {
        return run_selftests();
    }

    set_log_level(opts.verbose ? LogLevel::Debug : LogLevel::Warning);

    const Specification     spec  = load_specification(opts.spec_path);
    const std::vector<Rule> rules = load_rules(opts.rules_path);
    log_info("loaded " + std::to_string(spec.forms().size()) + " form(s) and " +
             std::to_string(rules.size()) + " rule(s)");

    GeneratorOptions gopts;
    gopts.seed = opts.seed;
    if (opts.num_threads > 0) gopts.max_workers = opts.num_threads;
    TestGenerator generator(gopts);

    Report report;
    report.results    = generator.verify_rule_set(rules, spec);
    report.with_tests = !opts.verify_only;
    if (report.with_tests) {
        report.tests = generator.generate_tests(rules, spec, !opts.sequential, opts.techniques);
    }

    std::cout << (opts.json ? render_json(report) : render_text(report));

    for (const ValidationResult& r : report.results) {
        if (!r.is_valid) return 1;
    }
    return 0;
}

}  // namespace edc
