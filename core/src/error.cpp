#include "recolor/error.h"

namespace recolor {

const char* to_string(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::InvalidPattern: return "InvalidPattern";
    case ErrorKind::MalformedOverride: return "MalformedOverride";
    case ErrorKind::UnknownStyleToken: return "UnknownStyleToken";
    case ErrorKind::DuplicateOverrideKey: return "DuplicateOverrideKey";
  }
  return "Unknown";
}

}  // namespace recolor
