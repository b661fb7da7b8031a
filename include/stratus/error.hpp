#pragma once
#include <stdexcept>
#include <string>

namespace stratus {

enum class ErrorKind {
  Transport,            // connect/send/receive failed
  EndpointUnavailable,  // non-success status or service not running
  MalformedResponse,    // payload could not be decoded
  FileAccess,           // telemetry file missing or unreadable
  FileParse,            // telemetry file is not a valid snapshot
  WatchSetup,           // filesystem watch could not be established
  StreamTruncated       // stream ended before the done marker
};

const char* error_kind_name(ErrorKind kind);

class Error : public std::runtime_error {
public:
  Error(ErrorKind kind, const std::string& what);
  ErrorKind kind() const noexcept { return kind_; }

private:
  ErrorKind kind_;
};

} // namespace stratus
