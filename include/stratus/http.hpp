#pragma once
#include <memory>
#include <optional>
#include <string>
#include <stratus/llm_transport.hpp>

namespace stratus {

struct HttpEndpoint {
  std::string host = "localhost";
  std::string port = "80";
};

// Accepts "http://host[:port][/]", with IPv6 literals in brackets
// ("http://[::1]:11434"); the stored host has no brackets. Anything else
// (other schemes, paths, empty host) yields nullopt.
std::optional<HttpEndpoint> parse_http_url(const std::string& url);
std::string to_url(const HttpEndpoint& ep);

// Plain HTTP/1.1 client over Boost.Beast. Every call opens its own connection
// and io_context, so one instance can be shared between threads.
class HttpTransport final : public LlmTransport {
public:
  explicit HttpTransport(HttpEndpoint endpoint);

  bool probe(const std::string& target, std::chrono::milliseconds timeout) override;
  std::string post(const std::string& target, const std::string& body,
                   std::chrono::milliseconds timeout) override;
  std::unique_ptr<LineStream> post_stream(const std::string& target, const std::string& body,
                                          std::chrono::milliseconds timeout) override;

  const HttpEndpoint& endpoint() const { return endpoint_; }

private:
  HttpEndpoint endpoint_;
};

// Throws Error(EndpointUnavailable) when the URL cannot be parsed.
std::shared_ptr<HttpTransport> make_http_transport(const std::string& url);

} // namespace stratus
