#include "group_styler.h"

#include <set>
#include <utility>

namespace recolor {

std::vector<ResolvedGroup> resolve(const std::vector<GroupInfo>& groups,
                                   const OverrideMap& overrides,
                                   PaletteCycler& palette) {
  std::vector<ResolvedGroup> resolved;
  resolved.reserve(groups.size());
  for (const auto& group : groups) {
    ResolvedGroup entry;
    entry.info = group;
    auto it = overrides.find(group.key());
    if (it != overrides.end()) {
      entry.style = it->second;
      entry.from_override = true;
    } else {
      entry.style = palette.next();
    }
    resolved.push_back(std::move(entry));
  }
  return resolved;
}

GroupStyles resolve_group_styles(const std::vector<GroupInfo>& groups,
                                 const OverrideMap& overrides,
                                 PaletteCycler& palette) {
  GroupStyles styles;
  for (auto& entry : resolve(groups, overrides, palette)) {
    styles.emplace(entry.info.key(), entry.style);
  }
  return styles;
}

std::vector<GroupKey> unmatched_overrides(const std::vector<GroupInfo>& groups,
                                          const OverrideMap& overrides) {
  std::set<GroupKey> known;
  for (const auto& group : groups) {
    known.insert(group.key());
  }
  std::vector<GroupKey> unmatched;
  for (const auto& kv : overrides) {
    if (known.count(kv.first) == 0) {
      unmatched.push_back(kv.first);
    }
  }
  return unmatched;
}

}  // namespace recolor
