#include "cli_utils.h"

#include <exception>

#include <nlohmann/json.hpp>

#include "cli_args.h"
#include "config.h"

#ifndef RECOLOR_VERSION
#define RECOLOR_VERSION "0.0.0"
#endif

namespace recolor::cli {

namespace {

std::string group_label(const GroupInfo& info) {
  std::string label = std::to_string(info.ordinal);
  if (info.name) {
    label += " (" + *info.name + ")";
  }
  return label;
}

}  // namespace

void Diagnostics::error(const std::string& message) const {
  std::string text = "Error: " + message;
  err << (color ? recolor::apply(Style::named(NamedColor::Red), text) : text) << std::endl;
}

void Diagnostics::debug_log(const std::string& message) const {
  if (!debug) return;
  std::string text = "[debug] " + message;
  err << (color ? recolor::apply(Style{}.with(kDim), text) : text) << std::endl;
}

bool run_pipeline(std::istream& in, std::ostream& out, const Colorizer& colorizer) {
  std::string line;
  while (std::getline(in, line)) {
    bool has_newline = !in.eof();
    bool has_cr = !line.empty() && line.back() == '\r';
    if (has_cr) line.pop_back();
    out << colorizer.colorize(line);
    if (has_cr) out << '\r';
    if (has_newline) out << '\n';
    out.flush();
    if (!out) return false;
  }
  return true;
}

std::string build_explain_json(const Colorizer& colorizer) {
  using nlohmann::json;
  json groups = json::array();
  for (const auto& group : colorizer.groups()) {
    json obj = json::object();
    obj["ordinal"] = group.info.ordinal;
    obj["name"] = group.info.name ? json(*group.info.name) : json(nullptr);
    obj["style"] = describe(group.style);
    obj["source"] = group.from_override ? "override" : "palette";
    obj["sgr"] = open_sequence(group.style);
    groups.push_back(obj);
  }
  json unused = json::array();
  for (const auto& key : colorizer.unused_overrides()) {
    unused.push_back(key.to_string());
  }
  json out = json::object();
  out["pattern"] = colorizer.pattern_source();
  out["mode"] = colorizer.mode() == MatchMode::All ? "all" : "first";
  out["groups"] = groups;
  out["unused_overrides"] = unused;
  return out.dump(2);
}

void log_setup(const Diagnostics& diag, const Colorizer& colorizer) {
  if (!diag.debug) return;
  diag.debug_log("pattern: " + colorizer.pattern_source());
  diag.debug_log(std::string("mode: ") + (colorizer.mode() == MatchMode::All ? "all" : "first"));
  for (const auto& group : colorizer.groups()) {
    diag.debug_log("group " + group_label(group.info) + ": " + describe(group.style) +
                   (group.from_override ? " [override]" : " [palette]"));
  }
  for (const auto& key : colorizer.unused_overrides()) {
    diag.debug_log("override \"" + key.to_string() + "\" matches no capture group");
  }
}

int run_cli(int argc, char** argv, const CliStreams& io, const EnvSettings& env) {
  if (argc <= 1) {
    print_startup_help(io.err);
    return kExitUsage;
  }

  CliOptions options;
  std::string error;
  if (!parse_cli_args(argc, argv, options, error)) {
    Diagnostics{io.err, io.err_is_tty, false}.error(error);
    print_help(io.err);
    return kExitUsage;
  }
  if (options.show_help) {
    print_help(io.out);
    return kExitOk;
  }
  if (options.show_version) {
    io.out << "recolor " << RECOLOR_VERSION << std::endl;
    return kExitOk;
  }

  Diagnostics diag{io.err, options.color && io.err_is_tty, env.debug};
  ColorizerOptions colorizer_options;
  colorizer_options.mode = options.global ? MatchMode::All : MatchMode::First;
  if (!apply_env_settings(env, colorizer_options, error)) {
    diag.error(error);
    return kExitError;
  }

  try {
    diag.debug_log("override arguments: " + std::to_string(options.overrides.size()));
    Colorizer colorizer = Colorizer::create(options.pattern, options.overrides, colorizer_options);
    log_setup(diag, colorizer);

    if (options.explain) {
      io.out << build_explain_json(colorizer) << std::endl;
      return kExitOk;
    }
    if (!run_pipeline(io.in, io.out, colorizer)) {
      diag.error("failed to write output");
      return kExitError;
    }
    return kExitOk;
  } catch (const Error& ex) {
    diag.debug_log(std::string("error kind: ") + to_string(ex.kind()));
    diag.error(ex.what());
    return kExitError;
  } catch (const std::exception& ex) {
    diag.error(ex.what());
    return kExitError;
  }
}

}  // namespace recolor::cli
