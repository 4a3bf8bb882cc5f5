#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace recolor {

/// Enumerates the 16 named terminal colors in SGR order.
/// MUST keep normal colors at 0-7 and bright variants at 8-15 so codes map arithmetically.
enum class NamedColor : uint8_t {
  Black,
  Red,
  Green,
  Yellow,
  Blue,
  Magenta,
  Cyan,
  White,
  BrightBlack,
  BrightRed,
  BrightGreen,
  BrightYellow,
  BrightBlue,
  BrightMagenta,
  BrightCyan,
  BrightWhite,
};

/// Text attributes as bit flags so a Style can hold them as a set.
enum Attribute : uint8_t {
  kBold = 1 << 0,
  kDim = 1 << 1,
  kItalic = 1 << 2,
  kUnderline = 1 << 3,
  kBlink = 1 << 4,
  kHidden = 1 << 5,
  kStrikethrough = 1 << 6,
};

struct Rgb {
  uint8_t r = 0;
  uint8_t g = 0;
  uint8_t b = 0;

  bool operator==(const Rgb& other) const {
    return r == other.r && g == other.g && b == other.b;
  }
};

/// Selects at most one foreground color for a Style.
/// MUST carry kind None when no color was requested.
struct ColorSpec {
  enum class Kind { None, Named, Rgb } kind = Kind::None;
  NamedColor named = NamedColor::Black;
  Rgb rgb;

  bool operator==(const ColorSpec& other) const;
  bool operator!=(const ColorSpec& other) const { return !(*this == other); }
};

/// Describes how a span of text is rendered on a terminal.
/// MUST treat color and attributes independently; an empty Style renders text unchanged.
/// Inputs are built from style tokens; values are immutable once resolved.
struct Style {
  ColorSpec color;
  uint8_t attributes = 0;

  bool empty() const { return color.kind == ColorSpec::Kind::None && attributes == 0; }
  bool has(Attribute attribute) const { return (attributes & attribute) != 0; }

  static Style named(NamedColor color);
  static Style rgb(uint8_t r, uint8_t g, uint8_t b);
  /// Returns a copy with the attribute added; existing attributes are kept.
  Style with(Attribute attribute) const;

  bool operator==(const Style& other) const;
  bool operator!=(const Style& other) const { return !(*this == other); }
};

/// Parses one comma-free token into a color, an attribute, or a hex color.
/// MUST throw Error(UnknownStyleToken) naming the token when it is not recognized.
/// Inputs are raw tokens; whitespace is trimmed and words match case-insensitively.
Style parse_style_token(std::string_view token);
/// Folds tokens left to right into one Style.
/// MUST union attributes and MUST let a later color override an earlier one.
/// Inputs are tokens; failures propagate from parse_style_token.
Style combine(const std::vector<std::string>& tokens);
/// Splits a comma-separated value list (e.g. "green,underline") and combines it.
Style combine(std::string_view value_list);
/// Layers `next` over `base`: attributes union, color replaced when `next` has one.
Style merge(const Style& base, const Style& next);

/// Returns the SGR parameter list for a style, e.g. "1;31"; empty for an empty style.
std::string sgr_codes(const Style& style);
/// Returns the full opening escape sequence for a style, or "" for an empty style.
std::string open_sequence(const Style& style);
/// Wraps text in the style's escape sequence and a trailing reset.
/// MUST return text unchanged for an empty style or empty text so nothing leaks.
/// Inputs are style/text; outputs are the rendered string with no side effects.
std::string apply(const Style& style, std::string_view text);
/// Renders a style back to its canonical token list (e.g. "red,bold,underline").
/// Returns "none" for an empty style.
std::string describe(const Style& style);

/// Removes SGR escape sequences from text; used to compare rendered output with input.
std::string strip_ansi(std::string_view text);

}  // namespace recolor
