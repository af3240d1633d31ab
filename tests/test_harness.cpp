#include "test_harness.h"

#include <cstdlib>
#include <iostream>
#include <string>

namespace {

int g_failures = 0;
std::string g_current_test;

void report_failure(const std::string& message) {
  std::cerr << "FAIL [" << g_current_test << "]: " << message << std::endl;
  ++g_failures;
}

}  // namespace

void expect_true(bool condition, const std::string& message) {
  if (!condition) report_failure(message);
}

void expect_eq(size_t actual, size_t expected, const std::string& message) {
  if (actual != expected) {
    report_failure(message + " (expected " + std::to_string(expected) + ", got " +
                   std::to_string(actual) + ")");
  }
}

void expect_str_eq(const std::string& actual, const std::string& expected,
                   const std::string& message) {
  if (actual != expected) {
    report_failure(message + " (expected \"" + expected + "\", got \"" + actual + "\")");
  }
}

int run_test(const TestCase& test) {
  g_current_test = test.name;
  g_failures = 0;
  test.fn();
  return g_failures;
}

int run_all_tests(const std::vector<TestCase>& tests) {
  int total_failures = 0;
  size_t failed_cases = 0;
  for (const auto& test : tests) {
    int failures = run_test(test);
    if (failures > 0) {
      std::cerr << "FAILED: " << test.name << " (" << failures << ")" << std::endl;
      total_failures += failures;
      ++failed_cases;
    }
  }
  if (total_failures > 0) {
    std::cerr << total_failures << " expectation(s) failed in " << failed_cases << " of "
              << tests.size() << " test(s)." << std::endl;
    return EXIT_FAILURE;
  }
  std::cout << "All " << tests.size() << " tests passed." << std::endl;
  return EXIT_SUCCESS;
}
