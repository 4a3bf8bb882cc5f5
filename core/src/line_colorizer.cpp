#include "line_colorizer.h"

#include <algorithm>
#include <string_view>
#include <utility>
#include <vector>

namespace recolor {

namespace {

struct StyledSpan {
  Span span;
  size_t ordinal = 0;
  const Style* style = nullptr;
};

// The innermost span wins: latest start, then earliest end, then highest ordinal.
bool is_inner(const StyledSpan& candidate, const StyledSpan& current) {
  if (candidate.span.begin != current.span.begin) {
    return candidate.span.begin > current.span.begin;
  }
  if (candidate.span.end != current.span.end) {
    return candidate.span.end < current.span.end;
  }
  return candidate.ordinal > current.ordinal;
}

void collect_spans(const MatchResult& match,
                   const CompiledPattern& pattern,
                   const GroupStyles& group_styles,
                   std::vector<StyledSpan>& out) {
  const auto& groups = pattern.groups();
  for (size_t i = 0; i < match.groups.size() && i < groups.size(); ++i) {
    const auto& span = match.groups[i];
    if (!span || span->begin == span->end) continue;
    auto it = group_styles.find(groups[i].key());
    if (it == group_styles.end() || it->second.empty()) continue;
    out.push_back(StyledSpan{*span, groups[i].ordinal, &it->second});
  }
}

// Appends the styled pieces of one match to out; copied tracks how much of line is written.
void render_match(std::string_view line, const std::vector<StyledSpan>& spans,
                  std::string& out, size_t& copied) {
  std::vector<size_t> cuts;
  cuts.reserve(spans.size() * 2);
  for (const auto& s : spans) {
    cuts.push_back(s.span.begin);
    cuts.push_back(s.span.end);
  }
  std::sort(cuts.begin(), cuts.end());
  cuts.erase(std::unique(cuts.begin(), cuts.end()), cuts.end());

  for (size_t c = 0; c + 1 < cuts.size(); ++c) {
    size_t from = cuts[c];
    size_t to = cuts[c + 1];
    const StyledSpan* active = nullptr;
    for (const auto& s : spans) {
      if (s.span.begin <= from && to <= s.span.end && (!active || is_inner(s, *active))) {
        active = &s;
      }
    }
    if (!active) continue;
    out.append(line.substr(copied, from - copied));
    out += recolor::apply(*active->style, line.substr(from, to - from));
    copied = to;
  }
}

}  // namespace

std::string colorize(const std::string& line,
                     const CompiledPattern& pattern,
                     const GroupStyles& group_styles,
                     MatchMode mode) {
  std::vector<MatchResult> matches;
  if (mode == MatchMode::All) {
    matches = pattern.match_all(line);
  } else if (auto first = pattern.match_first(line)) {
    matches.push_back(std::move(*first));
  }

  std::string out;
  size_t copied = 0;
  std::vector<StyledSpan> spans;
  for (const auto& match : matches) {
    spans.clear();
    collect_spans(match, pattern, group_styles, spans);
    if (spans.empty()) continue;
    if (out.empty()) out.reserve(line.size() + 16);
    render_match(line, spans, out, copied);
  }
  if (out.empty()) return line;
  out.append(std::string_view(line).substr(copied));
  return out;
}

}  // namespace recolor
