#include "cli_args.h"

#include <string>
#include <utility>

namespace recolor::cli {

/// Prints the startup help so users see baseline usage without flags.
/// MUST keep examples aligned with current CLI and MUST not throw on stream errors.
/// Inputs are the output stream; side effects are writing text to stdout/stderr.
void print_startup_help(std::ostream& os) {
  os << "recolor - color any command output with a regular expression\n\n";
  os << "Usage:\n";
  os << "  <command> | recolor [options] <pattern> [key=style[,style...]]...\n\n";
  os << "Notes:\n";
  os << "  - Each capture group is styled; unnamed groups take palette colors in order.\n";
  os << "  - Keys are group names ((?P<name>...) or (?<name>...)) or group numbers.\n";
  os << "  - Styles: colors, bright_<color>, #rrggbb, bold, dim, italic, underline,\n";
  os << "    blink, hidden, strikethrough.\n\n";
  os << "Examples:\n";
  os << "  ping example.com | recolor '\\d{1,3}\\.(\\d{1,3})\\.\\d{1,3}\\.\\d{1,3}'\n";
  os << "  tail -f app.log | recolor '(?P<level>ERROR|WARN)' level=red,bold\n";
  os << "  ls -l | recolor -g '(\\d+)' 1=#ff8800\n";
}

/// Prints the explicit help requested by --help.
/// MUST stay synchronized with supported flags and MUST not throw on stream errors.
/// Inputs are the output stream; side effects are writing text to stdout/stderr.
void print_help(std::ostream& os) {
  os << "Usage: recolor [options] <pattern> [key=style[,style...]]...\n";
  os << "Options:\n";
  os << "  -g, --global       style every match on a line, not only the first\n";
  os << "      --explain      print the resolved group styles as JSON and exit\n";
  os << "      --color=disabled  print diagnostics without color\n";
  os << "  -h, --help         show this help\n";
  os << "  -V, --version      show the version\n";
  os << "      --             treat every following argument as positional\n";
  os << "Environment:\n";
  os << "  RECOLOR_PALETTE    ';'-separated default styles, e.g. \"red;green,bold;#ff8800\"\n";
  os << "  RECOLOR_LOG        set to \"debug\" for diagnostics on stderr\n";
}

/// Parses argv into typed options so main can dispatch consistently.
/// MUST return false for invalid flags and MUST treat the first positional as the pattern.
/// Inputs are argc/argv; outputs are options/error and no external side effects.
bool parse_cli_args(int argc, char** argv, CliOptions& options, std::string& error) {
  CliOptions parsed;
  bool positional_only = false;
  bool have_pattern = false;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (!positional_only && arg.size() > 1 && arg[0] == '-') {
      if (arg == "--") {
        positional_only = true;
      } else if (arg == "--global" || arg == "-g") {
        parsed.global = true;
      } else if (arg == "--explain") {
        parsed.explain = true;
      } else if (arg == "--color=disabled") {
        parsed.color = false;
      } else if (arg == "--help" || arg == "-h") {
        parsed.show_help = true;
      } else if (arg == "--version" || arg == "-V") {
        parsed.show_version = true;
      } else {
        error = "Unknown option: " + arg + " (use -- before a pattern that starts with '-')";
        return false;
      }
      continue;
    }
    if (!have_pattern) {
      parsed.pattern = arg;
      have_pattern = true;
    } else {
      parsed.overrides.push_back(arg);
    }
  }
  if (!have_pattern && !parsed.show_help && !parsed.show_version) {
    error = "Missing required <pattern> argument";
    return false;
  }
  options = std::move(parsed);
  return true;
}

}  // namespace recolor::cli
