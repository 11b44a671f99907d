// ============================================================================
// edc/cli.hpp — Command-line interface handling
// ============================================================================
//
// Parses argv into a structured Options object and provides the main
// driver: load spec and rules → verify the rule set → generate and verify
// tests → print a report (text or JSON).
//
// ============================================================================

#ifndef EDC_CLI_HPP
#define EDC_CLI_HPP

#include "edc/model.hpp"

#include <map>
#include <string>
#include <vector>

namespace edc {

// ── Options ─────────────────────────────────────────────────────────────────

struct Options {
    std::string            spec_path;
    std::string            rules_path;
    std::vector<Technique> techniques;          // empty = all generators
    bool                   sequential  = false;
    unsigned               num_threads = 0;     // 0 = default worker bound
    unsigned               seed        = 0;
    bool                   verify_only = false;
    bool                   json        = false;
    bool                   verbose     = false;
    bool                   selftest    = false;
    bool                   help        = false;
};

/// Parse command-line arguments.  Throws std::runtime_error on bad usage.
Options parse_args(int argc, char* argv[]);

/// Print usage information to stderr.
void print_usage(const char* program_name);

// ── Report ──────────────────────────────────────────────────────────────────

struct Report {
    std::vector<ValidationResult>                results;   // one per rule, input order
    std::map<std::string, std::vector<TestCase>> tests;     // by rule id
    bool                                         with_tests = true;
};

std::string render_text(const Report& report);
std::string render_json(const Report& report);

/// Main driver.  Returns the process exit code: 0 when every rule is
/// valid, 1 when a rule carries an error finding.
int run(const Options& opts);

}  // namespace edc

#endif  // EDC_CLI_HPP
