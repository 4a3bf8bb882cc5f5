#include "palette.h"

#include <stdexcept>
#include <utility>

#include "recolor/recolor.h"
#include "util/string_util.h"

namespace recolor {

const std::vector<Style>& default_palette() {
  static const std::vector<Style> palette = {
      Style::named(NamedColor::Red),
      Style::named(NamedColor::Green),
      Style::named(NamedColor::Yellow),
      Style::named(NamedColor::Blue),
      Style::named(NamedColor::Magenta),
      Style::named(NamedColor::Cyan),
      Style::named(NamedColor::BrightRed),
      Style::named(NamedColor::BrightGreen),
      Style::named(NamedColor::BrightYellow),
      Style::named(NamedColor::BrightBlue),
      Style::named(NamedColor::BrightMagenta),
      Style::named(NamedColor::BrightCyan),
  };
  return palette;
}

PaletteCycler::PaletteCycler(std::vector<Style> palette) : palette_(std::move(palette)) {
  if (palette_.empty()) {
    throw std::invalid_argument("palette must contain at least one style");
  }
}

Style PaletteCycler::next() {
  Style style = palette_[counter_ % palette_.size()];
  ++counter_;
  return style;
}

std::vector<Style> parse_palette(const std::string& spec) {
  std::vector<Style> palette;
  for (const auto& entry : util::split(spec, ';')) {
    std::string trimmed = util::trim_ws(entry);
    if (trimmed.empty()) continue;
    palette.push_back(combine(trimmed));
  }
  return palette;
}

}  // namespace recolor
