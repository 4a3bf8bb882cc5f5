#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "recolor/style.h"

namespace recolor {

/// Hands out default styles in a fixed, repeating order.
/// MUST be created once per run and only advanced while resolving group styles.
/// Inputs are a non-empty palette; next() mutates the counter.
class PaletteCycler {
 public:
  /// Throws std::invalid_argument when the palette is empty.
  explicit PaletteCycler(std::vector<Style> palette);

  /// Returns palette[counter % size] and advances the counter.
  Style next();

  size_t position() const { return counter_; }
  const std::vector<Style>& palette() const { return palette_; }

 private:
  std::vector<Style> palette_;
  size_t counter_ = 0;
};

/// Parses a ';'-separated list of style value-lists, e.g. "red;green,bold;#ff8800".
/// Blank entries are skipped; an all-blank spec yields an empty vector.
/// Throws Error(UnknownStyleToken) for an invalid token.
std::vector<Style> parse_palette(const std::string& spec);

}  // namespace recolor
