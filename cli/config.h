#pragma once

#include <optional>
#include <string>

#include "recolor/recolor.h"

namespace recolor::cli {

struct EnvSettings {
  std::optional<std::string> palette;
  bool debug = false;
};

/// Reads RECOLOR_PALETTE and RECOLOR_LOG from the environment.
/// Unset or empty variables leave the corresponding field at its default.
EnvSettings load_env_settings();
/// Applies environment settings to colorizer options.
/// MUST leave options untouched and return false when the palette spec is invalid.
/// Inputs are settings/options; outputs are options/error with no side effects.
bool apply_env_settings(const EnvSettings& settings, ColorizerOptions& options, std::string& error);

}  // namespace recolor::cli
