// ============================================================================
// edc/loader.hpp — Line-oriented specification and rule files
// ============================================================================
//
// Both formats follow the usual input conventions: one entry per line,
// blank lines ignored, everything after '#' is a comment.
//
//   Specification:  Form.Field type [required] [min=..] [max=..] [values=a|b|c]
//
//     VitalSigns.SystolicBP  numeric  required min=60 max=250
//     Demographics.Sex       categorical values=M|F
//     Visit.VisitDate        date     min=2020-01-01
//
//   Rules:  ID | severity | formalized condition | free text
//
//     R001 | error | VitalSigns.SystolicBP > VitalSigns.DiastolicBP | SBP must exceed DBP
//
//   Columns are split on '|', so conditions spell disjunction as OR.
//   An empty formalized column leaves the rule informal.  Bounds on date
//   fields may be ISO dates or day counts.
//
// Malformed lines throw std::runtime_error naming the line number.
//
// ============================================================================

#ifndef EDC_LOADER_HPP
#define EDC_LOADER_HPP

#include "edc/model.hpp"

#include <string>
#include <vector>

namespace edc {

Specification parse_specification(const std::vector<std::string>& lines);
std::vector<Rule> parse_rules(const std::vector<std::string>& lines);

Specification load_specification(const std::string& path);
std::vector<Rule> load_rules(const std::string& path);

}  // namespace edc

#endif  // EDC_LOADER_HPP
