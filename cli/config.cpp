#include "config.h"

#include <cstdlib>
#include <utility>

#include "palette.h"
#include "util/string_util.h"

namespace recolor::cli {

namespace {

std::string get_env(const char* name) {
  if (const char* value = std::getenv(name)) {
    if (*value) return value;
  }
  return {};
}

}  // namespace

EnvSettings load_env_settings() {
  EnvSettings settings;
  std::string palette = get_env("RECOLOR_PALETTE");
  if (!palette.empty()) {
    settings.palette = palette;
  }
  settings.debug = util::to_lower(get_env("RECOLOR_LOG")) == "debug";
  return settings;
}

bool apply_env_settings(const EnvSettings& settings, ColorizerOptions& options, std::string& error) {
  if (!settings.palette.has_value()) {
    return true;
  }
  try {
    std::vector<Style> palette = parse_palette(*settings.palette);
    if (!palette.empty()) {
      options.palette = std::move(palette);
    }
  } catch (const Error& ex) {
    error = std::string("Invalid RECOLOR_PALETTE: ") + ex.what();
    return false;
  }
  return true;
}

}  // namespace recolor::cli
