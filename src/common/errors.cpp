#include "common/errors.hpp"

const char* ErrorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::Unresolved: return "unresolved";
    case ErrorKind::FetchFailed: return "fetch_failed";
    case ErrorKind::ConfigInvalid: return "config_invalid";
  }
  return "unknown";
}

std::string ScanError::Describe() const {
  std::string out = ErrorKindName(kind);
  if (!context.empty()) out += " [" + context + "]";
  if (!message.empty()) out += ": " + message;
  return out;
}
