// ============================================================================
// edc/utils.hpp — Utility functions
// ============================================================================
//
// File I/O, string helpers, literal recognition and the calendar arithmetic
// used by every component that handles date-typed fields.  Dates are carried
// internally as a signed day count relative to 1970-01-01 and rendered as
// ISO "YYYY-MM-DD" strings at the edges.
//
// ============================================================================

#ifndef EDC_UTILS_HPP
#define EDC_UTILS_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace edc {

// ── File I/O ────────────────────────────────────────────────────────────────

/// Read a text file and return its content as a vector of lines.
/// Throws std::runtime_error if the file cannot be opened.
std::vector<std::string> read_lines(const std::string& path);

// ── String helpers ──────────────────────────────────────────────────────────

/// Trim leading and trailing whitespace from a string.
std::string trim(const std::string& s);

/// Strip an inline comment (everything from the first '#' onward).
/// Returns the portion before '#', trimmed.
std::string strip_comment(const std::string& line);

/// Return true if the line is empty or consists only of whitespace
/// (after comment stripping).
bool is_blank_or_comment(const std::string& line);

/// Split on a separator; every piece is trimmed, empty pieces are kept.
std::vector<std::string> split(const std::string& s, char sep);

std::string to_upper(std::string s);
std::string to_lower(std::string s);

/// Case-insensitive ASCII comparison.
bool iequals(std::string_view a, std::string_view b) noexcept;

// ── Literals ────────────────────────────────────────────────────────────────

/// Parse a plain decimal literal:  -?[0-9]+(\.[0-9]+)?
/// Exponents, hex, "inf", "nan" and literals beyond double range are
/// rejected.
std::optional<double> parse_number(std::string_view s);

/// Shortest round-trippable rendering ("18", "149.0234375", "-0.001").
std::string format_number(double v);

// ── Dates ───────────────────────────────────────────────────────────────────

/// Days since 1970-01-01 for a proleptic Gregorian date.
std::int64_t days_from_civil(std::int64_t y, unsigned m, unsigned d) noexcept;

/// Parse a strict ISO date "YYYY-MM-DD" (calendar-validated).
std::optional<std::int64_t> parse_date(std::string_view s);

/// Render a day count as "YYYY-MM-DD".
std::string format_date(std::int64_t days);

/// Today's date (local time) as a day count.
std::int64_t today_days();

}  // namespace edc

#endif  // EDC_UTILS_HPP
