#pragma once

#include <stdexcept>
#include <string>

namespace recolor {

/// Classifies startup validation failures so callers can react per kind.
/// All kinds are fatal; none are raised while lines are being processed.
enum class ErrorKind {
  InvalidPattern,
  MalformedOverride,
  UnknownStyleToken,
  DuplicateOverrideKey,
};

/// Returns the stable name of an error kind, e.g. "UnknownStyleToken".
const char* to_string(ErrorKind kind);

/// Reports a startup validation failure with a user-facing message.
/// MUST name the offending argument in the message.
/// Inputs are kind/message; thrown by the core, caught by the CLI.
class Error : public std::runtime_error {
 public:
  Error(ErrorKind kind, const std::string& message)
      : std::runtime_error(message), kind_(kind) {}

  ErrorKind kind() const { return kind_; }

 private:
  ErrorKind kind_;
};

}  // namespace recolor
