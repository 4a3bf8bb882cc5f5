#include "recolor/recolor.h"

#include <utility>

#include "group_styler.h"
#include "line_colorizer.h"
#include "palette.h"
#include "pattern.h"
#include "style_spec.h"

namespace recolor {

GroupKey GroupKey::by_ordinal(size_t ordinal) {
  GroupKey key;
  key.kind = Kind::Ordinal;
  key.ordinal = ordinal;
  return key;
}

GroupKey GroupKey::by_name(std::string name) {
  GroupKey key;
  key.kind = Kind::Name;
  key.name = std::move(name);
  return key;
}

std::string GroupKey::to_string() const {
  return kind == Kind::Name ? name : std::to_string(ordinal);
}

bool GroupKey::operator<(const GroupKey& other) const {
  if (kind != other.kind) return kind < other.kind;
  if (kind == Kind::Ordinal) return ordinal < other.ordinal;
  return name < other.name;
}

bool GroupKey::operator==(const GroupKey& other) const {
  if (kind != other.kind) return false;
  return kind == Kind::Ordinal ? ordinal == other.ordinal : name == other.name;
}

GroupKey GroupInfo::key() const {
  return name ? GroupKey::by_name(*name) : GroupKey::by_ordinal(ordinal);
}

Colorizer Colorizer::create(const std::string& pattern,
                            const std::vector<std::string>& override_args,
                            const ColorizerOptions& options) {
  auto compiled = std::make_unique<CompiledPattern>(compile_pattern(pattern));
  OverrideMap overrides = parse_overrides(override_args);
  PaletteCycler palette(options.palette.empty() ? default_palette() : options.palette);
  std::vector<ResolvedGroup> groups = resolve(compiled->groups(), overrides, palette);
  std::vector<GroupKey> unused = unmatched_overrides(compiled->groups(), overrides);
  return Colorizer(std::move(compiled), std::move(groups), std::move(unused), options.mode);
}

Colorizer::Colorizer(std::unique_ptr<CompiledPattern> pattern,
                     std::vector<ResolvedGroup> groups,
                     std::vector<GroupKey> unused_overrides,
                     MatchMode mode)
    : pattern_(std::move(pattern)),
      groups_(std::move(groups)),
      unused_overrides_(std::move(unused_overrides)),
      mode_(mode) {
  for (const auto& group : groups_) {
    styles_.emplace(group.info.key(), group.style);
  }
}

Colorizer::Colorizer(Colorizer&&) noexcept = default;
Colorizer& Colorizer::operator=(Colorizer&&) noexcept = default;
Colorizer::~Colorizer() = default;

std::string Colorizer::colorize(const std::string& line) const {
  return recolor::colorize(line, *pattern_, styles_, mode_);
}

const std::string& Colorizer::pattern_source() const {
  return pattern_->source();
}

}  // namespace recolor
