#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace recolor::util {

/// Converts a string to lowercase for case-insensitive comparisons.
/// MUST avoid locale-sensitive behavior to keep parsing deterministic.
/// Inputs are strings; outputs are lowercase strings with no side effects.
std::string to_lower(std::string_view s);
/// Trims leading and trailing ASCII whitespace.
/// MUST preserve internal whitespace and MUST not modify the input.
/// Inputs are strings; outputs are trimmed strings with no side effects.
std::string trim_ws(std::string_view s);
/// Splits on every occurrence of a delimiter, keeping empty fields.
/// "a,,b" yields {"a", "", "b"} and "" yields {""}.
std::vector<std::string> split(std::string_view s, char delim);
/// Tests for an identifier of the form [A-Za-z_][A-Za-z0-9_]*.
bool is_identifier(std::string_view s);
/// Tests for a non-empty run of ASCII digits.
bool is_digits(std::string_view s);

}  // namespace recolor::util
