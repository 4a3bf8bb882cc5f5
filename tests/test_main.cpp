#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include "test_harness.h"

int g_failures = 0;
std::string g_current_test;

namespace {

std::string visible(const std::string& s) {
  std::string out;
  for (char c : s) {
    if (c == '\033') {
      out += "\\e";
    } else if (c == '\n') {
      out += "\\n";
    } else if (c == '\r') {
      out += "\\r";
    } else {
      out += c;
    }
  }
  return out;
}

std::vector<TestCase> collect_tests() {
  std::vector<TestCase> tests;
  register_style_tests(tests);
  register_style_spec_tests(tests);
  register_palette_tests(tests);
  register_pattern_tests(tests);
  register_group_styler_tests(tests);
  register_line_colorizer_tests(tests);
  register_cli_tests(tests);
  return tests;
}

int run_test(const TestCase& test) {
  g_current_test = test.name;
  g_failures = 0;
  test.fn();
  return g_failures;
}

}  // namespace

void expect_true(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL [" << g_current_test << "]: " << message << std::endl;
    ++g_failures;
  }
}

void expect_eq(size_t actual, size_t expected, const std::string& message) {
  if (actual != expected) {
    std::cerr << "FAIL [" << g_current_test << "]: " << message
              << " (expected " << expected << ", got " << actual << ")" << std::endl;
    ++g_failures;
  }
}

void expect_str_eq(const std::string& actual, const std::string& expected, const std::string& message) {
  if (actual != expected) {
    std::cerr << "FAIL [" << g_current_test << "]: " << message
              << " (expected \"" << visible(expected) << "\", got \"" << visible(actual) << "\")"
              << std::endl;
    ++g_failures;
  }
}

int main(int argc, char** argv) {
  std::vector<TestCase> tests = collect_tests();
  if (argc > 1) {
    std::string target = argv[1];
    for (const auto& test : tests) {
      if (target == test.name) {
        int failures = run_test(test);
        return failures == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
      }
    }
    std::cerr << "Unknown test: " << target << std::endl;
    std::cerr << "Available tests:" << std::endl;
    for (const auto& test : tests) {
      std::cerr << "  " << test.name << std::endl;
    }
    return EXIT_FAILURE;
  }

  int total_failures = 0;
  for (const auto& test : tests) {
    int failures = run_test(test);
    if (failures > 0) {
      std::cerr << "FAILED: " << test.name << " (" << failures << ")" << std::endl;
      total_failures += failures;
    }
  }

  if (total_failures > 0) {
    std::cerr << total_failures << " test(s) failed." << std::endl;
    return EXIT_FAILURE;
  }
  std::cout << "All tests passed." << std::endl;
  return EXIT_SUCCESS;
}
