#include "recolor/style.h"

#include <array>
#include <cctype>
#include <initializer_list>
#include <string>
#include <unordered_map>

#include "recolor/error.h"
#include "util/string_util.h"

namespace recolor {

namespace {

constexpr std::string_view kEscStart = "\033[";
constexpr char kEscEnd = 'm';
constexpr std::string_view kReset = "\033[0m";

constexpr int kFgBase = 30;
constexpr int kBrightOffset = 60;

constexpr std::array<std::string_view, 16> kColorNames = {
    "black",        "red",          "green",          "yellow",
    "blue",         "magenta",      "cyan",           "white",
    "bright_black", "bright_red",   "bright_green",   "bright_yellow",
    "bright_blue",  "bright_magenta", "bright_cyan",  "bright_white"};

struct AttributeInfo {
  Attribute attribute;
  int sgr;
  std::string_view canonical;
};

// Ordered by SGR code; rendering walks this table so output is stable.
constexpr std::array<AttributeInfo, 7> kAttributes = {{
    {kBold, 1, "bold"},
    {kDim, 2, "dimmed"},
    {kItalic, 3, "italic"},
    {kUnderline, 4, "underline"},
    {kBlink, 5, "blink"},
    {kHidden, 8, "hidden"},
    {kStrikethrough, 9, "strikethrough"},
}};

const std::unordered_map<std::string_view, Attribute>& attribute_map() {
  static const std::unordered_map<std::string_view, Attribute> map = {
      {"bold", kBold},
      {"bolded", kBold},
      {"dimmed", kDim},
      {"dim", kDim},
      {"italic", kItalic},
      {"italics", kItalic},
      {"underline", kUnderline},
      {"underlined", kUnderline},
      {"blink", kBlink},
      {"blinking", kBlink},
      {"hidden", kHidden},
      {"strikethrough", kStrikethrough},
      {"struckthrough", kStrikethrough},
      {"strike", kStrikethrough},
  };
  return map;
}

const std::unordered_map<std::string_view, NamedColor>& color_map() {
  static const std::unordered_map<std::string_view, NamedColor> map = []() {
    std::unordered_map<std::string_view, NamedColor> values;
    for (size_t i = 0; i < kColorNames.size(); ++i) {
      values.emplace(kColorNames[i], static_cast<NamedColor>(i));
    }
    return values;
  }();
  return map;
}

int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

[[noreturn]] void unknown_token(std::string_view token) {
  throw Error(ErrorKind::UnknownStyleToken,
              "unknown style token \"" + std::string(token) + "\"");
}

Style parse_hex(const std::string& token) {
  if (token.size() != 7) {
    unknown_token(token);
  }
  uint8_t channels[3] = {0, 0, 0};
  for (size_t i = 0; i < 3; ++i) {
    int hi = hex_value(token[1 + i * 2]);
    int lo = hex_value(token[2 + i * 2]);
    if (hi < 0 || lo < 0) {
      unknown_token(token);
    }
    channels[i] = static_cast<uint8_t>(hi * 16 + lo);
  }
  return Style::rgb(channels[0], channels[1], channels[2]);
}

std::string format_hex(const Rgb& rgb) {
  static constexpr char kDigits[] = "0123456789abcdef";
  std::string out = "#";
  for (uint8_t channel : {rgb.r, rgb.g, rgb.b}) {
    out += kDigits[channel >> 4];
    out += kDigits[channel & 0x0f];
  }
  return out;
}

}  // namespace

bool ColorSpec::operator==(const ColorSpec& other) const {
  if (kind != other.kind) return false;
  switch (kind) {
    case Kind::None: return true;
    case Kind::Named: return named == other.named;
    case Kind::Rgb: return rgb == other.rgb;
  }
  return false;
}

Style Style::named(NamedColor color) {
  Style style;
  style.color.kind = ColorSpec::Kind::Named;
  style.color.named = color;
  return style;
}

Style Style::rgb(uint8_t r, uint8_t g, uint8_t b) {
  Style style;
  style.color.kind = ColorSpec::Kind::Rgb;
  style.color.rgb = Rgb{r, g, b};
  return style;
}

Style Style::with(Attribute attribute) const {
  Style out = *this;
  out.attributes = static_cast<uint8_t>(out.attributes | attribute);
  return out;
}

bool Style::operator==(const Style& other) const {
  return color == other.color && attributes == other.attributes;
}

Style parse_style_token(std::string_view token) {
  std::string trimmed = util::trim_ws(token);
  if (!trimmed.empty() && trimmed[0] == '#') {
    return parse_hex(trimmed);
  }
  std::string word = util::to_lower(trimmed);
  const auto& colors = color_map();
  auto color_it = colors.find(word);
  if (color_it != colors.end()) {
    return Style::named(color_it->second);
  }
  const auto& attributes = attribute_map();
  auto attr_it = attributes.find(word);
  if (attr_it != attributes.end()) {
    return Style{}.with(attr_it->second);
  }
  unknown_token(token);
}

Style merge(const Style& base, const Style& next) {
  Style out = base;
  if (next.color.kind != ColorSpec::Kind::None) {
    out.color = next.color;
  }
  out.attributes = static_cast<uint8_t>(out.attributes | next.attributes);
  return out;
}

Style combine(const std::vector<std::string>& tokens) {
  Style style;
  for (const auto& token : tokens) {
    style = merge(style, parse_style_token(token));
  }
  return style;
}

Style combine(std::string_view value_list) {
  return combine(util::split(value_list, ','));
}

std::string sgr_codes(const Style& style) {
  std::string codes;
  auto push = [&codes](const std::string& code) {
    if (!codes.empty()) codes += ';';
    codes += code;
  };
  for (const auto& info : kAttributes) {
    if (style.has(info.attribute)) {
      push(std::to_string(info.sgr));
    }
  }
  switch (style.color.kind) {
    case ColorSpec::Kind::None:
      break;
    case ColorSpec::Kind::Named: {
      int index = static_cast<int>(style.color.named);
      int code = index < 8 ? kFgBase + index : kFgBase + kBrightOffset + (index - 8);
      push(std::to_string(code));
      break;
    }
    case ColorSpec::Kind::Rgb:
      push("38;2;" + std::to_string(style.color.rgb.r) + ";" +
           std::to_string(style.color.rgb.g) + ";" + std::to_string(style.color.rgb.b));
      break;
  }
  return codes;
}

std::string open_sequence(const Style& style) {
  if (style.empty()) return {};
  std::string out(kEscStart);
  out += sgr_codes(style);
  out += kEscEnd;
  return out;
}

std::string apply(const Style& style, std::string_view text) {
  if (style.empty() || text.empty()) {
    return std::string(text);
  }
  std::string out = open_sequence(style);
  out.reserve(out.size() + text.size() + kReset.size());
  out.append(text);
  out.append(kReset);
  return out;
}

std::string describe(const Style& style) {
  if (style.empty()) return "none";
  std::vector<std::string> parts;
  switch (style.color.kind) {
    case ColorSpec::Kind::None:
      break;
    case ColorSpec::Kind::Named:
      parts.emplace_back(kColorNames[static_cast<size_t>(style.color.named)]);
      break;
    case ColorSpec::Kind::Rgb:
      parts.push_back(format_hex(style.color.rgb));
      break;
  }
  for (const auto& info : kAttributes) {
    if (style.has(info.attribute)) {
      parts.emplace_back(info.canonical);
    }
  }
  std::string out;
  for (size_t i = 0; i < parts.size(); ++i) {
    if (i > 0) out += ',';
    out += parts[i];
  }
  return out;
}

std::string strip_ansi(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  size_t i = 0;
  while (i < text.size()) {
    if (text.compare(i, kEscStart.size(), kEscStart) == 0) {
      size_t j = i + kEscStart.size();
      while (j < text.size() &&
             (std::isdigit(static_cast<unsigned char>(text[j])) || text[j] == ';')) {
        ++j;
      }
      if (j < text.size() && text[j] == kEscEnd) {
        i = j + 1;
        continue;
      }
    }
    out += text[i];
    ++i;
  }
  return out;
}

}  // namespace recolor
