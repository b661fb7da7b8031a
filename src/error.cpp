#include <stratus/error.hpp>

namespace stratus {

const char* error_kind_name(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::Transport:           return "transport";
    case ErrorKind::EndpointUnavailable: return "endpoint unavailable";
    case ErrorKind::MalformedResponse:   return "malformed response";
    case ErrorKind::FileAccess:          return "file access";
    case ErrorKind::FileParse:           return "file parse";
    case ErrorKind::WatchSetup:          return "watch setup";
    case ErrorKind::StreamTruncated:     return "stream truncated";
  }
  return "unknown";
}

Error::Error(ErrorKind kind, const std::string& what)
  : std::runtime_error(std::string(error_kind_name(kind)) + ": " + what), kind_(kind) {}

} // namespace stratus
