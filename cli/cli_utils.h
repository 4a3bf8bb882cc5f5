#pragma once

#include <istream>
#include <ostream>
#include <string>

#include "config.h"
#include "recolor/recolor.h"

namespace recolor::cli {

constexpr int kExitOk = 0;
constexpr int kExitError = 1;
constexpr int kExitUsage = 2;

/// Standard streams of one CLI run.
struct CliStreams {
  std::istream& in;
  std::ostream& out;
  std::ostream& err;
  bool err_is_tty = false;
};

/// Routes diagnostics to stderr with optional color and a debug switch.
/// MUST never write to the styled output stream.
struct Diagnostics {
  std::ostream& err;
  bool color = true;
  bool debug = false;

  /// Writes "Error: <message>" in red when color is enabled.
  void error(const std::string& message) const;
  /// Writes "[debug] <message>" only when debug is enabled.
  void debug_log(const std::string& message) const;
};

/// Copies input to output line by line, styling each line with the colorizer.
/// MUST preserve line count/order, MUST not add a newline the input lacked, and MUST flush per line.
/// Inputs are streams and a ready colorizer; returns false when the output stream fails.
bool run_pipeline(std::istream& in, std::ostream& out, const Colorizer& colorizer);

/// Serializes the resolved groups of a colorizer for --explain.
/// MUST list groups in ordinal order and MUST mark each style's source.
/// Inputs are the colorizer; outputs are pretty-printed JSON text.
std::string build_explain_json(const Colorizer& colorizer);

/// Logs the parsed setup (pattern, groups, unmatched overrides) at debug level.
void log_setup(const Diagnostics& diag, const Colorizer& colorizer);

/// Runs one recolor invocation: parse argv, build the colorizer, then pump or explain.
/// MUST return kExitUsage for usage errors and kExitError for setup errors,
/// reporting either as "Error: <message>" on io.err.
/// Inputs are argv, streams and environment settings; returns the process exit status.
int run_cli(int argc, char** argv, const CliStreams& io, const EnvSettings& env);

}  // namespace recolor::cli
