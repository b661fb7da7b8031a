#pragma once
#include <chrono>
#include <memory>
#include <string>

namespace stratus {

// Body of a streaming reply, split into lines as bytes arrive.
class LineStream {
public:
  virtual ~LineStream() = default;
  // Blocks for the next line (without the terminator). Returns false once the
  // body is exhausted or the transport ended; does not throw.
  virtual bool next_line(std::string& line) = 0;
  // True if the body ended because the transport failed rather than
  // because the reply was complete.
  virtual bool failed() const = 0;
  // Callable from another thread: a blocked or later next_line returns false
  // promptly. Not reported as a failure.
  virtual void cancel() = 0;
};

// Request/response plumbing to the model endpoint. Implementations must be
// safe to call from several threads at once.
class LlmTransport {
public:
  virtual ~LlmTransport() = default;

  // Liveness check; true on a success status within the timeout.
  virtual bool probe(const std::string& target, std::chrono::milliseconds timeout) = 0;

  // JSON POST returning the full body. Throws Error(Transport) or
  // Error(EndpointUnavailable).
  virtual std::string post(const std::string& target, const std::string& body,
                           std::chrono::milliseconds timeout) = 0;

  // JSON POST whose reply is consumed incrementally. Connection, send and
  // status failures throw before the stream is returned; the timeout applies
  // to each read.
  virtual std::unique_ptr<LineStream> post_stream(const std::string& target, const std::string& body,
                                                  std::chrono::milliseconds timeout) = 0;
};

} // namespace stratus
