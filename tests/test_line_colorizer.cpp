#include "test_harness.h"
#include "test_utils.h"

#include "line_colorizer.h"
#include "recolor/recolor.h"

namespace {

using recolor::Colorizer;
using recolor::ColorizerOptions;
using recolor::MatchMode;

void test_no_match_passthrough() {
  auto colorizer = Colorizer::create(R"re((\d+))re", {});
  const char* lines[] = {"", "no digits here", "\t tabs and spaces ", "\033[mpre-styled\033[m"};
  for (const char* line : lines) {
    expect_str_eq(colorizer.colorize(line), line, "unmatched line is byte-identical");
  }
}

void test_ipv4_second_octet() {
  auto colorizer = Colorizer::create(R"re(\d{1,3}\.(\d{1,3})\.\d{1,3}\.\d{1,3})re", {});
  expect_str_eq(colorizer.colorize("64: 172.217.1.14"),
                std::string("64: 172.") + test_esc::kRed + "217" + test_esc::kReset + ".1.14",
                "only the group is wrapped, with the first palette style");
}

void test_named_groups_with_overrides() {
  auto colorizer = Colorizer::create(R"re((?P<a>\d+)\.(?P<b>\d+))re", {"a=red", "b=green,underline"});
  expect_str_eq(colorizer.colorize("10.20"), wrap("31", "10") + "." + wrap("4;32", "20"),
                "explicit styles per named group");
}

void test_single_match_per_line() {
  auto colorizer = Colorizer::create("(5)", {});
  expect_str_eq(colorizer.colorize("12345 12345"), "1234" + wrap("31", "5") + " 12345",
                "only the first match is styled");
}

void test_global_mode_styles_every_match() {
  ColorizerOptions options;
  options.mode = MatchMode::All;
  auto colorizer = Colorizer::create("(5)", {}, options);
  std::string five = wrap("31", "5");
  expect_str_eq(colorizer.colorize("12345 12345 12345"),
                "1234" + five + " 1234" + five + " 1234" + five, "every match styled");
}

void test_adjacent_groups() {
  auto colorizer = Colorizer::create("(foo)(bar)", {});
  expect_str_eq(colorizer.colorize("hello foobar"), "hello " + wrap("31", "foo") + wrap("32", "bar"),
                "adjacent groups each wrapped");
}

void test_nested_groups() {
  auto colorizer = Colorizer::create("12(3(5))", {});
  expect_str_eq(colorizer.colorize("12345 1235"), "12345 12" + wrap("31", "3") + wrap("32", "5"),
                "inner group styles its text; outer styles the rest");
}

void test_non_participating_group_skipped() {
  auto colorizer = Colorizer::create("(a)|(b)", {});
  expect_str_eq(colorizer.colorize("xbx"), "x" + wrap("32", "b") + "x",
                "absent group contributes nothing");
}

void test_strip_roundtrip() {
  auto colorizer = Colorizer::create(R"re((\w+)=(\d+)(;)?)re", {"2=bold,#336699"});
  const char* lines[] = {"key=42;", "a=1 b=2", "x = 3", "mixed=7;tail"};
  for (const char* line : lines) {
    expect_str_eq(recolor::strip_ansi(colorizer.colorize(line)), line, "stripping escapes restores input");
  }
}

void test_styles_stable_across_lines() {
  auto colorizer = Colorizer::create(R"re((\d+)-(\d+))re", {});
  expect_str_eq(colorizer.colorize("1-2"), wrap("31", "1") + "-" + wrap("32", "2"), "first line");
  expect_str_eq(colorizer.colorize("x 3-4"), "x " + wrap("31", "3") + "-" + wrap("32", "4"),
                "second line reuses the same styles");
}

void test_megabyte_line() {
  std::string line(1 << 20, 'a');
  auto greedy = Colorizer::create("(a+)", {});
  expect_str_eq(greedy.colorize(line), wrap("31", line), "whole line styled");
  ColorizerOptions options;
  options.mode = MatchMode::All;
  auto any = Colorizer::create("(.*)", {}, options);
  expect_eq(any.colorize(line).size(), line.size() + 9, "one open and one reset");
}

void test_pattern_errors_reported_before_overrides() {
  expect_true(throws_kind([] { Colorizer::create("(unclosed", {"a=chartreuse"}); },
                          recolor::ErrorKind::InvalidPattern),
              "bad pattern wins over a bad override");
  expect_true(throws_kind([] { Colorizer::create("(a)", {"1=chartreuse"}); },
                          recolor::ErrorKind::UnknownStyleToken),
              "override checked once the pattern compiles");
}

void test_free_function_colorize() {
  auto pattern = recolor::compile_pattern(R"re((?P<w>\w+))re");
  recolor::GroupStyles styles;
  styles[recolor::GroupKey::by_name("w")] = recolor::combine("yellow");
  expect_str_eq(recolor::colorize("hi there", pattern, styles),
                std::string(test_esc::kYellow) + "hi" + test_esc::kReset + " there",
                "lookup by group identifier");
}

}  // namespace

void register_line_colorizer_tests(std::vector<TestCase>& tests) {
  tests.push_back({"line_colorizer_no_match_passthrough", test_no_match_passthrough});
  tests.push_back({"line_colorizer_ipv4_second_octet", test_ipv4_second_octet});
  tests.push_back({"line_colorizer_named_groups_with_overrides", test_named_groups_with_overrides});
  tests.push_back({"line_colorizer_single_match_per_line", test_single_match_per_line});
  tests.push_back({"line_colorizer_global_mode_styles_every_match", test_global_mode_styles_every_match});
  tests.push_back({"line_colorizer_adjacent_groups", test_adjacent_groups});
  tests.push_back({"line_colorizer_nested_groups", test_nested_groups});
  tests.push_back({"line_colorizer_non_participating_group_skipped", test_non_participating_group_skipped});
  tests.push_back({"line_colorizer_strip_roundtrip", test_strip_roundtrip});
  tests.push_back({"line_colorizer_styles_stable_across_lines", test_styles_stable_across_lines});
  tests.push_back({"line_colorizer_megabyte_line", test_megabyte_line});
  tests.push_back({"line_colorizer_pattern_errors_reported_before_overrides",
                   test_pattern_errors_reported_before_overrides});
  tests.push_back({"line_colorizer_free_function_colorize", test_free_function_colorize});
}
