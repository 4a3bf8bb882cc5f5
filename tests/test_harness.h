#pragma once

#include <cstddef>
#include <string>
#include <vector>

struct TestCase {
  const char* name;
  void (*fn)();
};

extern int g_failures;
extern std::string g_current_test;

void expect_true(bool condition, const std::string& message);
void expect_eq(size_t actual, size_t expected, const std::string& message);
/// Compares strings and prints both sides with escape bytes made visible on mismatch.
void expect_str_eq(const std::string& actual, const std::string& expected, const std::string& message);

void register_style_tests(std::vector<TestCase>& tests);
void register_style_spec_tests(std::vector<TestCase>& tests);
void register_palette_tests(std::vector<TestCase>& tests);
void register_pattern_tests(std::vector<TestCase>& tests);
void register_group_styler_tests(std::vector<TestCase>& tests);
void register_line_colorizer_tests(std::vector<TestCase>& tests);
void register_cli_tests(std::vector<TestCase>& tests);
