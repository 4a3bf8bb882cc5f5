#pragma once

#include <map>
#include <vector>

#include "palette.h"
#include "recolor/recolor.h"
#include "style_spec.h"

namespace recolor {

/// Maps each group identifier to the style it is rendered with.
using GroupStyles = std::map<GroupKey, Style>;

/// Resolves one style per group in ordinal order.
/// MUST use an override when one is keyed by the group's identifier and MUST NOT advance
/// the palette for it; every other group takes palette.next().
/// Inputs are the pattern groups, overrides and the run's cycler; the cycler is advanced.
std::vector<ResolvedGroup> resolve(const std::vector<GroupInfo>& groups,
                                   const OverrideMap& overrides,
                                   PaletteCycler& palette);

/// Convenience form returning only the identifier to style mapping.
GroupStyles resolve_group_styles(const std::vector<GroupInfo>& groups,
                                 const OverrideMap& overrides,
                                 PaletteCycler& palette);

/// Collects override keys that no group in `groups` is identified by.
std::vector<GroupKey> unmatched_overrides(const std::vector<GroupInfo>& groups,
                                          const OverrideMap& overrides);

}  // namespace recolor
