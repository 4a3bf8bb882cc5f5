#pragma once

#include <string>

#include "group_styler.h"
#include "pattern.h"

namespace recolor {

/// Styles the capture groups of a line's match, leaving all other bytes untouched.
/// MUST return the line byte-identical when there is no match and MUST never style group 0.
/// Inputs are the line, pattern and resolved group styles; outputs the rendered line.
std::string colorize(const std::string& line,
                     const CompiledPattern& pattern,
                     const GroupStyles& group_styles,
                     MatchMode mode = MatchMode::First);

}  // namespace recolor
