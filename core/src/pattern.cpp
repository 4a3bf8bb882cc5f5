#include "pattern.h"

#include <map>
#include <utility>

#include "util/string_util.h"

namespace recolor {

namespace {

[[noreturn]] void invalid_pattern(const std::string& source, const std::string& detail) {
  throw Error(ErrorKind::InvalidPattern,
              "invalid pattern \"" + source + "\": " + detail);
}

bool is_continuation_byte(char c) {
  return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

}  // namespace

std::string normalize_group_syntax(const std::string& source) {
  std::string out;
  out.reserve(source.size() + 4);
  bool in_class = false;
  size_t i = 0;
  while (i < source.size()) {
    char c = source[i];
    if (c == '\\') {
      out.append(source, i, 2);
      i += 2;
      continue;
    }
    if (in_class) {
      if (c == ']') in_class = false;
    } else if (c == '[') {
      in_class = true;
    } else if (source.compare(i, 3, "(?<") == 0 && i + 3 < source.size() &&
               source[i + 3] != '=' && source[i + 3] != '!') {
      out += "(?P<";
      i += 3;
      continue;
    }
    out += c;
    ++i;
  }
  return out;
}

CompiledPattern::CompiledPattern(std::string source, std::vector<GroupInfo> groups,
                                 std::unique_ptr<RE2> regex)
    : source_(std::move(source)), groups_(std::move(groups)), regex_(std::move(regex)) {}

CompiledPattern compile_pattern(const std::string& source) {
  RE2::Options options;
  options.set_log_errors(false);
  auto regex = std::make_unique<RE2>(normalize_group_syntax(source), options);
  if (!regex->ok()) {
    invalid_pattern(source, regex->error());
  }

  std::vector<GroupInfo> groups;
  int count = regex->NumberOfCapturingGroups();
  groups.reserve(static_cast<size_t>(count));
  for (int i = 1; i <= count; ++i) {
    groups.push_back(GroupInfo{static_cast<size_t>(i), std::nullopt});
  }
  for (const auto& kv : regex->NamedCapturingGroups()) {
    // Group names are identifiers so an override key never reads as both.
    if (!util::is_identifier(kv.first)) {
      invalid_pattern(source, "invalid group name \"" + kv.first + "\"");
    }
    groups[static_cast<size_t>(kv.second - 1)].name = kv.first;
  }
  return CompiledPattern(source, std::move(groups), std::move(regex));
}

std::optional<MatchResult> CompiledPattern::match_at(const std::string& line, size_t pos) const {
  std::vector<re2::StringPiece> pieces(groups_.size() + 1);
  if (!regex_->Match(line, pos, line.size(), RE2::UNANCHORED, pieces.data(),
                     static_cast<int>(pieces.size()))) {
    return std::nullopt;
  }
  auto offset = [&line](const re2::StringPiece& piece) {
    return static_cast<size_t>(piece.data() - line.data());
  };
  MatchResult result;
  result.whole.begin = offset(pieces[0]);
  result.whole.end = result.whole.begin + pieces[0].size();
  result.groups.reserve(groups_.size());
  for (size_t i = 1; i < pieces.size(); ++i) {
    if (pieces[i].data() == nullptr) {
      result.groups.push_back(std::nullopt);
    } else {
      size_t begin = offset(pieces[i]);
      result.groups.push_back(Span{begin, begin + pieces[i].size()});
    }
  }
  return result;
}

std::optional<MatchResult> CompiledPattern::match_first(const std::string& line) const {
  return match_at(line, 0);
}

std::vector<MatchResult> CompiledPattern::match_all(const std::string& line) const {
  std::vector<MatchResult> results;
  size_t pos = 0;
  while (pos <= line.size()) {
    auto match = match_at(line, pos);
    if (!match) break;
    size_t next = match->whole.end;
    if (match->whole.begin == match->whole.end) {
      // Step past an empty match without splitting a UTF-8 sequence.
      next = match->whole.end + 1;
      while (next < line.size() && is_continuation_byte(line[next])) ++next;
    }
    results.push_back(std::move(*match));
    pos = next;
  }
  return results;
}

}  // namespace recolor
