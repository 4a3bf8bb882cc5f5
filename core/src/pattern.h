#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <re2/re2.h>

#include "recolor/recolor.h"

namespace recolor {

/// Half-open byte range [begin, end) into a line.
struct Span {
  size_t begin = 0;
  size_t end = 0;
};

/// Holds one match of a pattern against one line.
/// groups[i] describes ordinal i + 1 and is empty when the group did not participate.
struct MatchResult {
  Span whole;
  std::vector<std::optional<Span>> groups;
};

/// Rewrites (?<name>...) to the (?P<name>...) form every RE2 release accepts.
/// Escapes, character classes and the lookbehind openers (?<= and (?<! are left alone.
std::string normalize_group_syntax(const std::string& source);

/// Wraps a compiled RE2 program with its capture-group metadata.
/// MUST be immutable after construction so it can be shared across all lines.
class CompiledPattern {
 public:
  const std::string& source() const { return source_; }
  const std::vector<GroupInfo>& groups() const { return groups_; }

  /// Returns the first match in the line, if any.
  std::optional<MatchResult> match_first(const std::string& line) const;
  /// Returns every non-overlapping match in the line, left to right.
  std::vector<MatchResult> match_all(const std::string& line) const;

 private:
  friend CompiledPattern compile_pattern(const std::string& source);

  CompiledPattern(std::string source, std::vector<GroupInfo> groups, std::unique_ptr<RE2> regex);

  std::optional<MatchResult> match_at(const std::string& line, size_t pos) const;

  std::string source_;
  std::vector<GroupInfo> groups_;
  std::unique_ptr<RE2> regex_;
};

/// Compiles a user pattern and enumerates its capture groups from the engine.
/// MUST throw Error(InvalidPattern) naming the pattern when it cannot be compiled.
/// Inputs are the pattern source; outputs are an immutable CompiledPattern.
CompiledPattern compile_pattern(const std::string& source);

}  // namespace recolor
