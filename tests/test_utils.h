#pragma once

#include <functional>
#include <string>

#include "recolor/recolor.h"

namespace test_esc {
constexpr const char* kReset = "\033[0m";
constexpr const char* kRed = "\033[31m";
constexpr const char* kGreen = "\033[32m";
constexpr const char* kYellow = "\033[33m";
}  // namespace test_esc

/// Runs fn and reports whether it threw recolor::Error of the given kind.
bool throws_kind(const std::function<void()>& fn, recolor::ErrorKind kind);
/// Runs fn and returns the message of the recolor::Error it threw, or "" when none.
std::string error_message(const std::function<void()>& fn);
/// Wraps text in "\033[<codes>m" ... "\033[0m".
std::string wrap(const std::string& codes, const std::string& text);
