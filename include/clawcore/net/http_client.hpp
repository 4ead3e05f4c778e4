#pragma once

#include <asio.hpp>
#include <asio/ssl.hpp>
#include <chrono>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace clawcore::net {

// HTTP response. Header names are stored lower-cased.
struct HttpResponse {
  int status_code = 0;
  std::map<std::string, std::string> headers;
  std::string body;
  std::string error;
  bool timed_out = false;

  bool ok() const {
    return status_code >= 200 && status_code < 300;
  }
};

// HTTP request options
struct HttpOptions {
  std::string method = "POST";
  std::map<std::string, std::string> headers;
  std::string body;
  std::chrono::seconds timeout{120};
};

// Request/response seam used by the provider adapters. Tests substitute
// canned responses by implementing this.
class Transport {
 public:
  virtual ~Transport() = default;

  virtual std::future<HttpResponse> request(const std::string &url, const HttpOptions &options) = 0;
};

// Async HTTP/HTTPS client using ASIO. The io_context must be run by the owner.
class HttpClient : public Transport {
 public:
  explicit HttpClient(asio::io_context &io_ctx);

  ~HttpClient() override;

  // Async request with callback
  void request(const std::string &url, const HttpOptions &options, std::function<void(HttpResponse)> callback);

  // Async request returning future
  std::future<HttpResponse> request(const std::string &url, const HttpOptions &options) override;

 private:
  class Impl;

  std::unique_ptr<Impl> impl_;
};

// URL parsing helper
struct ParsedUrl {
  std::string scheme;
  std::string host;
  std::string port;
  std::string path;
  std::string query;

  bool is_https() const {
    return scheme == "https";
  }

  std::string port_or_default() const;

  static std::optional<ParsedUrl> parse(const std::string &url);
};

// Parse a complete raw HTTP/1.1 response (status line, headers, body).
// Chunked bodies are decoded.
HttpResponse parse_response(const std::string &raw);

// Decode a Transfer-Encoding: chunked body; malformed input returns what was decoded so far
std::string decode_chunked(const std::string &body);

}  // namespace clawcore::net
