#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "recolor/error.h"
#include "recolor/style.h"

namespace recolor {

/// Identifies a capture group either by 1-based ordinal or by name.
/// MUST hold exactly one of the two; ordinal keys are never zero.
struct GroupKey {
  enum class Kind { Ordinal, Name } kind = Kind::Ordinal;
  size_t ordinal = 0;
  std::string name;

  static GroupKey by_ordinal(size_t ordinal);
  static GroupKey by_name(std::string name);

  /// Renders the key as the user would type it: "3" or "name".
  std::string to_string() const;

  bool operator<(const GroupKey& other) const;
  bool operator==(const GroupKey& other) const;
};

/// Describes one capture group of a compiled pattern.
/// Ordinals follow the left-to-right order of opening parentheses, starting at 1.
struct GroupInfo {
  size_t ordinal = 0;
  std::optional<std::string> name;

  /// Returns the identifier used for override matching: the name when present, else the ordinal.
  GroupKey key() const;
};

/// Chooses whether a line is styled at its first match only or at every match.
enum class MatchMode { First, All };

/// Records the style chosen for a group and where it came from.
struct ResolvedGroup {
  GroupInfo info;
  Style style;
  bool from_override = false;
};

/// Startup options that are not part of the pattern or override arguments.
struct ColorizerOptions {
  /// Default styles for groups without an override; empty means the built-in palette.
  std::vector<Style> palette;
  MatchMode mode = MatchMode::First;
};

/// Returns the built-in default palette (12 entries, never empty).
const std::vector<Style>& default_palette();

class CompiledPattern;

/// Holds a compiled pattern and the per-group styles resolved once at startup.
/// MUST be fully validated at construction and MUST be read-only afterwards.
/// Inputs are raw CLI arguments; failures throw Error before any line is processed.
class Colorizer {
 public:
  /// Compiles the pattern, parses overrides and resolves group styles.
  /// MUST report InvalidPattern before any override error.
  /// Inputs are pattern/override args/options; throws Error on invalid input.
  static Colorizer create(const std::string& pattern,
                          const std::vector<std::string>& override_args,
                          const ColorizerOptions& options = {});

  Colorizer(Colorizer&&) noexcept;
  Colorizer& operator=(Colorizer&&) noexcept;
  ~Colorizer();

  /// Styles one line (without its line terminator).
  /// MUST return the line unchanged when the pattern does not match.
  std::string colorize(const std::string& line) const;

  const std::vector<ResolvedGroup>& groups() const { return groups_; }
  /// Override keys that matched no capture group in the pattern.
  const std::vector<GroupKey>& unused_overrides() const { return unused_overrides_; }
  const std::string& pattern_source() const;
  MatchMode mode() const { return mode_; }

 private:
  Colorizer(std::unique_ptr<CompiledPattern> pattern,
            std::vector<ResolvedGroup> groups,
            std::vector<GroupKey> unused_overrides,
            MatchMode mode);

  std::unique_ptr<CompiledPattern> pattern_;
  std::vector<ResolvedGroup> groups_;
  std::map<GroupKey, Style> styles_;
  std::vector<GroupKey> unused_overrides_;
  MatchMode mode_ = MatchMode::First;
};

}  // namespace recolor
