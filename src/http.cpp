#include <stratus/http.hpp>
#include <stratus/error.hpp>
#include <stratus/log.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <algorithm>
#include <atomic>
#include <cctype>

namespace stratus {

namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;
using tcp       = net::ip::tcp;

static constexpr const char* kTag = "http";
static constexpr const char* kUserAgent = "stratus-atc";

std::optional<HttpEndpoint> parse_http_url(const std::string& url) {
  static const std::string kScheme = "http://";
  if (url.size() <= kScheme.size()) return std::nullopt;
  std::string lower = url.substr(0, kScheme.size());
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
  if (lower != kScheme) return std::nullopt;

  std::string rest = url.substr(kScheme.size());
  if (!rest.empty() && rest.back() == '/') rest.pop_back();
  if (rest.empty() || rest.find('/') != std::string::npos) return std::nullopt;

  HttpEndpoint ep;
  std::string port;
  if (rest.front() == '[') {
    // IPv6 literal: "[addr]" or "[addr]:port"
    const auto close = rest.find(']');
    if (close == std::string::npos) return std::nullopt;
    ep.host = rest.substr(1, close - 1);
    const std::string tail = rest.substr(close + 1);
    if (!tail.empty()) {
      if (tail.front() != ':') return std::nullopt;
      port = tail.substr(1);
      if (port.empty()) return std::nullopt;
    }
  } else {
    const auto colon = rest.rfind(':');
    if (colon == std::string::npos) {
      ep.host = rest;
    } else {
      ep.host = rest.substr(0, colon);
      port = rest.substr(colon + 1);
      if (port.empty() || ep.host.find(':') != std::string::npos) return std::nullopt;
    }
  }
  if (!port.empty()) {
    if (port.size() > 5) return std::nullopt;
    if (!std::all_of(port.begin(), port.end(), [](unsigned char c){ return std::isdigit(c); })) {
      return std::nullopt;
    }
    if (std::stoi(port) > 65535) return std::nullopt;
    ep.port = port;
  }
  if (ep.host.empty()) return std::nullopt;
  return ep;
}

std::string to_url(const HttpEndpoint& ep) {
  if (ep.host.find(':') != std::string::npos) return "http://[" + ep.host + "]:" + ep.port;
  return "http://" + ep.host + ":" + ep.port;
}

namespace {

bool is_success(unsigned status) { return status >= 200 && status < 300; }

// One connection with its own io_context. Blocking calls are run as async
// operations so the tcp_stream deadlines apply.
class HttpConnection {
public:
  explicit HttpConnection(HttpEndpoint ep) : ep_(std::move(ep)), stream_(ioc_) {}

  ~HttpConnection() {
    // not_connected is expected here; nothing useful to report on teardown.
    beast::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_both, ec);
  }

  HttpConnection(const HttpConnection&) = delete;
  HttpConnection& operator=(const HttpConnection&) = delete;

  beast::error_code connect(std::chrono::milliseconds timeout) {
    beast::error_code ec;
    tcp::resolver resolver(ioc_);
    const auto results = resolver.resolve(ep_.host, ep_.port, ec);
    if (ec) return ec;
    stream_.expires_after(timeout);
    stream_.async_connect(results, [&](beast::error_code e, const tcp::endpoint&) { ec = e; });
    run_();
    return ec;
  }

  beast::error_code send(http::verb verb, const std::string& target, const std::string& body,
                         std::chrono::milliseconds timeout) {
    http::request<http::string_body> req{verb, target, 11};
    if (ep_.host.find(':') != std::string::npos) {
      req.set(http::field::host, "[" + ep_.host + "]");
    } else {
      req.set(http::field::host, ep_.host);
    }
    req.set(http::field::user_agent, kUserAgent);
    if (verb == http::verb::post) {
      req.set(http::field::content_type, "application/json");
      req.body() = body;
    }
    req.prepare_payload();

    beast::error_code ec;
    stream_.expires_after(timeout);
    http::async_write(stream_, req, [&](beast::error_code e, std::size_t) { ec = e; });
    run_();
    return ec;
  }

  beast::error_code read(http::response<http::string_body>& res, std::chrono::milliseconds timeout) {
    beast::error_code ec;
    stream_.expires_after(timeout);
    http::async_read(stream_, buffer_, res, [&](beast::error_code e, std::size_t) { ec = e; });
    run_();
    return ec;
  }

  template <class Parser>
  beast::error_code read_header(Parser& parser, std::chrono::milliseconds timeout) {
    beast::error_code ec;
    stream_.expires_after(timeout);
    http::async_read_header(stream_, buffer_, parser, [&](beast::error_code e, std::size_t) { ec = e; });
    run_();
    return ec;
  }

  template <class Parser>
  beast::error_code read_some(Parser& parser, std::chrono::milliseconds timeout) {
    beast::error_code ec;
    stream_.expires_after(timeout);
    http::async_read_some(stream_, buffer_, parser, [&](beast::error_code e, std::size_t) { ec = e; });
    run_();
    return ec;
  }

  // Thread-safe: the close runs on this connection's io_context, aborting
  // whatever operation is pending or the next one started.
  void cancel() {
    net::post(ioc_, [this] { stream_.close(); });
  }

private:
  void run_() {
    ioc_.restart();
    ioc_.run();
  }

  HttpEndpoint ep_;
  net::io_context ioc_;
  beast::tcp_stream stream_;
  beast::flat_buffer buffer_;
};

std::string describe(const HttpEndpoint& ep, const std::string& target, const beast::error_code& ec) {
  return to_url(ep) + target + ": " + ec.message();
}

// Streams the body of an already-accepted response, one line at a time.
class HttpLineStream final : public LineStream {
public:
  HttpLineStream(std::unique_ptr<HttpConnection> conn,
                 std::unique_ptr<http::response_parser<http::buffer_body>> parser,
                 std::chrono::milliseconds timeout)
    : conn_(std::move(conn)), parser_(std::move(parser)), timeout_(timeout) {
    exhausted_ = parser_->is_done();
  }

  bool next_line(std::string& line) override {
    for (;;) {
      if (cancelled_.load()) return false;
      const auto nl = pending_.find('\n');
      if (nl != std::string::npos) {
        line.assign(pending_, 0, nl);
        pending_.erase(0, nl + 1);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        return true;
      }
      if (exhausted_) {
        if (pending_.empty()) return false;
        line = std::move(pending_);
        pending_.clear();
        return true;
      }
      fill_();
    }
  }

  bool failed() const override { return failed_; }

  void cancel() override {
    if (cancelled_.exchange(true)) return;
    conn_->cancel();
  }

private:
  void fill_() {
    auto& body = parser_->get().body();
    body.data = chunk_;
    body.size = sizeof(chunk_);
    auto ec = conn_->read_some(*parser_, timeout_);
    if (ec == http::error::need_buffer) ec = {};
    if (ec) {
      if (cancelled_.load()) {
        STRATUS_LOG_DEBUG(kTag, "stream read cancelled");
      } else {
        STRATUS_LOG_WARN(kTag, "stream read ended: %s", ec.message().c_str());
        failed_ = true;
      }
      exhausted_ = true;
      return;
    }
    pending_.append(chunk_, sizeof(chunk_) - body.size);
    if (parser_->is_done()) exhausted_ = true;
  }

  std::unique_ptr<HttpConnection> conn_;
  std::unique_ptr<http::response_parser<http::buffer_body>> parser_;
  std::chrono::milliseconds timeout_;
  std::string pending_;
  bool exhausted_{false};
  bool failed_{false};
  std::atomic<bool> cancelled_{false};
  char chunk_[4096];
};

} // namespace

HttpTransport::HttpTransport(HttpEndpoint endpoint) : endpoint_(std::move(endpoint)) {}

bool HttpTransport::probe(const std::string& target, std::chrono::milliseconds timeout) {
  HttpConnection conn(endpoint_);
  auto ec = conn.connect(timeout);
  if (!ec) ec = conn.send(http::verb::get, target, {}, timeout);
  http::response<http::string_body> res;
  if (!ec) ec = conn.read(res, timeout);
  if (ec) {
    STRATUS_LOG_DEBUG(kTag, "probe failed: %s", describe(endpoint_, target, ec).c_str());
    return false;
  }
  return is_success(res.result_int());
}

std::string HttpTransport::post(const std::string& target, const std::string& body,
                                std::chrono::milliseconds timeout) {
  HttpConnection conn(endpoint_);
  if (auto ec = conn.connect(timeout)) {
    throw Error(ErrorKind::EndpointUnavailable, describe(endpoint_, target, ec));
  }
  if (auto ec = conn.send(http::verb::post, target, body, timeout)) {
    throw Error(ErrorKind::Transport, describe(endpoint_, target, ec));
  }
  http::response<http::string_body> res;
  if (auto ec = conn.read(res, timeout)) {
    throw Error(ErrorKind::Transport, describe(endpoint_, target, ec));
  }
  if (!is_success(res.result_int())) {
    throw Error(ErrorKind::EndpointUnavailable,
                to_url(endpoint_) + target + ": status " + std::to_string(res.result_int()));
  }
  return std::move(res.body());
}

std::unique_ptr<LineStream> HttpTransport::post_stream(const std::string& target, const std::string& body,
                                                       std::chrono::milliseconds timeout) {
  auto conn = std::make_unique<HttpConnection>(endpoint_);
  if (auto ec = conn->connect(timeout)) {
    throw Error(ErrorKind::EndpointUnavailable, describe(endpoint_, target, ec));
  }
  if (auto ec = conn->send(http::verb::post, target, body, timeout)) {
    throw Error(ErrorKind::Transport, describe(endpoint_, target, ec));
  }
  auto parser = std::make_unique<http::response_parser<http::buffer_body>>();
  parser->body_limit(boost::none);
  if (auto ec = conn->read_header(*parser, timeout)) {
    throw Error(ErrorKind::Transport, describe(endpoint_, target, ec));
  }
  const unsigned status = parser->get().result_int();
  if (!is_success(status)) {
    throw Error(ErrorKind::EndpointUnavailable,
                to_url(endpoint_) + target + ": status " + std::to_string(status));
  }
  return std::make_unique<HttpLineStream>(std::move(conn), std::move(parser), timeout);
}

std::shared_ptr<HttpTransport> make_http_transport(const std::string& url) {
  auto ep = parse_http_url(url);
  if (!ep) throw Error(ErrorKind::EndpointUnavailable, "unsupported endpoint url '" + url + "'");
  return std::make_shared<HttpTransport>(std::move(*ep));
}

} // namespace stratus
