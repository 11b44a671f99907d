// ============================================================================
// edc/test.hpp — Lightweight selftest framework
// ============================================================================
//
// Defines a minimal test harness: register test functions, run them,
// and report pass/fail counts.  No external dependencies.
//
// Beyond plain boolean checks the context compares strings, doubles
// within a tolerance, and three-valued verdicts (true / false / no
// opinion), which is what most verifier and evaluator checks produce.
//
// Usage:
//   void test_foo(TestContext& ctx) {
//       ctx.check(1 + 1 == 2, "basic math");
//   }
//   // in run_selftests():  runner.run("foo", test_foo);
//
// ============================================================================

#ifndef EDC_TEST_HPP
#define EDC_TEST_HPP

#include <functional>
#include <optional>
#include <string>

namespace edc {

// ── TestContext ──────────────────────────────────────────────────────────────

class TestContext {
public:
    /// Record a check.  If `condition` is false, logs a failure.
    void check(bool condition, const std::string& description);

    /// Record a string-equality check with nice diff output.
    void check_eq(const std::string& actual, const std::string& expected,
                  const std::string& description);

    /// |actual - expected| <= tolerance.
    void check_near(double actual, double expected, double tolerance,
                    const std::string& description);

    /// Three-valued check; std::nullopt reads as "no opinion".
    void check_verdict(std::optional<bool> actual, std::optional<bool> expected,
                       const std::string& description);

    /// Total checks so far.
    int total() const noexcept { return total_; }

    /// Failed checks so far.
    int failed() const noexcept { return failed_; }

private:
    int total_  = 0;
    int failed_ = 0;
    std::string current_test_;

    friend class TestRunner;
};

// ── TestRunner ──────────────────────────────────────────────────────────────

class TestRunner {
public:
    using TestFunc = std::function<void(TestContext&)>;

    /// Register and immediately run a named test.
    void run(const std::string& name, TestFunc func);

    /// Print summary and return exit code (0 = all pass, 1 = failures).
    int summarise() const;

private:
    int tests_run_     = 0;
    int tests_failed_  = 0;
    int checks_total_  = 0;
    int checks_failed_ = 0;
};

/// Entry point: run all built-in self-tests.
/// Returns 0 on success, 1 on failure.
int run_selftests();

}  // namespace edc

#endif  // EDC_TEST_HPP
