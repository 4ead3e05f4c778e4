#include "clawcore/net/http_client.hpp"

#include <openssl/ssl.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <regex>
#include <sstream>
#include <type_traits>

namespace clawcore::net {

namespace {

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
  return s;
}

std::string build_request(const ParsedUrl& url, const HttpOptions& options) {
  std::ostringstream req;
  req << options.method << " " << url.path << url.query << " HTTP/1.1\r\n";
  req << "Host: " << url.host << "\r\n";
  req << "Connection: close\r\n";

  for (const auto& [key, value] : options.headers) {
    req << key << ": " << value << "\r\n";
  }

  if (!options.body.empty()) {
    req << "Content-Length: " << options.body.size() << "\r\n";
  }

  req << "\r\n";
  req << options.body;
  return req.str();
}

// True once the headers are in and a Content-Length body is complete
bool response_complete(const std::string& raw) {
  auto header_end = raw.find("\r\n\r\n");
  if (header_end == std::string::npos) return false;

  static const std::regex length_regex(R"(\r\n[Cc]ontent-[Ll]ength:\s*(\d+))");
  std::smatch match;
  std::string head = raw.substr(0, header_end);
  if (!std::regex_search(head, match, length_regex)) return false;

  try {
    size_t content_length = std::stoull(match[1].str());
    return raw.size() - (header_end + 4) >= content_length;
  } catch (const std::exception&) {
    return false;
  }
}

}  // namespace

// URL parsing
std::optional<ParsedUrl> ParsedUrl::parse(const std::string& url) {
  static const std::regex url_regex(R"(^(https?):\/\/([^:\/\s]+)(?::(\d+))?(\/[^\?\s]*)?(\?[^\s]*)?)");
  std::smatch match;

  if (!std::regex_match(url, match, url_regex)) {
    return std::nullopt;
  }

  ParsedUrl result;
  result.scheme = match[1].str();
  result.host = match[2].str();
  result.port = match[3].str();
  result.path = match[4].str().empty() ? "/" : match[4].str();
  result.query = match[5].str();

  return result;
}

std::string ParsedUrl::port_or_default() const {
  if (!port.empty()) return port;
  return is_https() ? "443" : "80";
}

std::string decode_chunked(const std::string& body) {
  std::string decoded;
  size_t pos = 0;

  while (pos < body.size()) {
    auto line_end = body.find("\r\n", pos);
    if (line_end == std::string::npos) break;

    size_t chunk_size = 0;
    try {
      // Chunk extensions after ';' are ignored
      chunk_size = std::stoul(body.substr(pos, line_end - pos), nullptr, 16);
    } catch (const std::exception&) {
      break;
    }
    if (chunk_size == 0) break;

    size_t data_start = line_end + 2;
    if (data_start + chunk_size > body.size()) {
      decoded.append(body, data_start, std::string::npos);
      break;
    }
    decoded.append(body, data_start, chunk_size);
    pos = data_start + chunk_size + 2;
  }

  return decoded;
}

HttpResponse parse_response(const std::string& raw) {
  HttpResponse response;

  auto header_end = raw.find("\r\n\r\n");
  if (header_end == std::string::npos) {
    response.error = raw.empty() ? "Empty response" : "Incomplete response headers";
    return response;
  }

  std::istringstream stream(raw.substr(0, header_end));
  std::string status_line;
  std::getline(stream, status_line);

  static const std::regex status_regex(R"(HTTP/[\d.]+ (\d+))");
  std::smatch match;
  if (!std::regex_search(status_line, match, status_regex)) {
    response.error = "Invalid HTTP response: cannot parse status line";
    return response;
  }
  response.status_code = std::stoi(match[1].str());

  std::string header_line;
  while (std::getline(stream, header_line)) {
    auto colon = header_line.find(':');
    if (colon == std::string::npos) continue;
    std::string key = to_lower(header_line.substr(0, colon));
    std::string value = header_line.substr(colon + 1);
    value.erase(0, value.find_first_not_of(" \t"));
    value.erase(value.find_last_not_of(" \t\r\n") + 1);
    response.headers[key] = value;
  }

  response.body = raw.substr(header_end + 4);

  auto te = response.headers.find("transfer-encoding");
  if (te != response.headers.end() && to_lower(te->second).find("chunked") != std::string::npos) {
    response.body = decode_chunked(response.body);
  }

  return response;
}

// HTTP Client implementation
class HttpClient::Impl {
 public:
  explicit Impl(asio::io_context& io_ctx) : io_ctx_(io_ctx), ssl_ctx_(asio::ssl::context::tlsv12_client) {
    ssl_ctx_.set_default_verify_paths();
    ssl_ctx_.set_verify_mode(asio::ssl::verify_peer);
  }

  void request(const std::string& url, const HttpOptions& options, std::function<void(HttpResponse)> callback) {
    auto parsed = ParsedUrl::parse(url);
    if (!parsed) {
      HttpResponse response;
      response.error = "Invalid URL: " + url;
      callback(std::move(response));
      return;
    }

    if (parsed->is_https()) {
      auto socket = std::make_shared<asio::ssl::stream<asio::ip::tcp::socket>>(io_ctx_, ssl_ctx_);
      SSL_set_tlsext_host_name(socket->native_handle(), parsed->host.c_str());
      start(socket, *parsed, options, std::move(callback));
    } else {
      start(std::make_shared<asio::ip::tcp::socket>(io_ctx_), *parsed, options, std::move(callback));
    }
  }

 private:
  using Callback = std::function<void(HttpResponse)>;

  template <typename Socket>
  static constexpr bool is_ssl = !std::is_same_v<Socket, asio::ip::tcp::socket>;

  template <typename Socket>
  static void close_socket(const std::shared_ptr<Socket>& socket) {
    asio::error_code ignored;
    socket->lowest_layer().close(ignored);
  }

  // When the timer fires, mark the request timed out and close the socket
  template <typename Socket>
  std::shared_ptr<asio::steady_timer> start_timeout(std::chrono::seconds timeout, std::shared_ptr<Socket> socket, std::shared_ptr<bool> timed_out) {
    auto timer = std::make_shared<asio::steady_timer>(io_ctx_);
    timer->expires_after(timeout);
    timer->async_wait([socket, timed_out](const asio::error_code& ec) {
      if (!ec) {
        *timed_out = true;
        close_socket(socket);
      }
    });
    return timer;
  }

  template <typename Socket>
  void start(std::shared_ptr<Socket> socket, const ParsedUrl& url, const HttpOptions& options, Callback callback) {
    auto request_str = std::make_shared<std::string>(build_request(url, options));
    auto raw = std::make_shared<std::string>();
    auto timed_out = std::make_shared<bool>(false);
    auto resolver = std::make_shared<asio::ip::tcp::resolver>(io_ctx_);

    auto timer = start_timeout(options.timeout, socket, timed_out);

    // Single completion point: cancels the timer and reports a timeout over any socket error
    auto finish = std::make_shared<Callback>([timer, timed_out, callback = std::move(callback)](HttpResponse resp) {
      timer->cancel();
      if (*timed_out) {
        resp.status_code = 0;
        resp.timed_out = true;
        resp.error = "Request timed out";
      }
      callback(std::move(resp));
    });

    auto fail = [finish](const std::string& what, const asio::error_code& ec) {
      HttpResponse resp;
      resp.error = what + ": " + ec.message();
      (*finish)(std::move(resp));
    };

    resolver->async_resolve(
        url.host, url.port_or_default(), [this, resolver, socket, request_str, raw, finish, fail](const asio::error_code& ec, asio::ip::tcp::resolver::results_type results) {
          if (ec) {
            fail("DNS resolution failed", ec);
            return;
          }

          asio::async_connect(socket->lowest_layer(), results, [this, socket, request_str, raw, finish, fail](const asio::error_code& ec, const asio::ip::tcp::endpoint&) {
            if (ec) {
              fail("Connection failed", ec);
              return;
            }

            if constexpr (is_ssl<Socket>) {
              socket->async_handshake(asio::ssl::stream_base::client, [this, socket, request_str, raw, finish, fail](const asio::error_code& ec) {
                if (ec) {
                  fail("SSL handshake failed", ec);
                  return;
                }
                write_request(socket, request_str, raw, finish);
              });
            } else {
              write_request(socket, request_str, raw, finish);
            }
          });
        });
  }

  template <typename Socket>
  void write_request(std::shared_ptr<Socket> socket, std::shared_ptr<std::string> request_str, std::shared_ptr<std::string> raw,
                     std::shared_ptr<Callback> finish) {
    asio::async_write(*socket, asio::buffer(*request_str), [this, socket, request_str, raw, finish](const asio::error_code& ec, size_t) {
      if (ec) {
        HttpResponse resp;
        resp.error = "Write failed: " + ec.message();
        (*finish)(std::move(resp));
        return;
      }
      read_all(socket, std::make_shared<asio::streambuf>(), raw, finish);
    });
  }

  // Read until EOF (Connection: close) or until a Content-Length body is complete
  template <typename Socket>
  void read_all(std::shared_ptr<Socket> socket, std::shared_ptr<asio::streambuf> buffer, std::shared_ptr<std::string> raw, std::shared_ptr<Callback> finish) {
    asio::async_read(*socket, *buffer, asio::transfer_at_least(1), [this, socket, buffer, raw, finish](const asio::error_code& ec, size_t) {
      if (buffer->size() > 0) {
        std::istream stream(buffer.get());
        std::ostringstream chunk;
        chunk << stream.rdbuf();
        *raw += chunk.str();
      }

      // SSL peers frequently close without close_notify; treat it as EOF
      bool is_eof = ec == asio::error::eof || ec == asio::ssl::error::stream_truncated || (ec && ec.category() == asio::error::get_ssl_category());

      if (ec && !is_eof) {
        HttpResponse resp = raw->empty() ? HttpResponse{} : parse_response(*raw);
        resp.error = "Read failed: " + ec.message();
        (*finish)(std::move(resp));
        return;
      }

      if (is_eof || response_complete(*raw)) {
        close_socket(socket);
        (*finish)(parse_response(*raw));
        return;
      }

      read_all(socket, buffer, raw, finish);
    });
  }

  asio::io_context& io_ctx_;
  asio::ssl::context ssl_ctx_;
};

HttpClient::HttpClient(asio::io_context& io_ctx) : impl_(std::make_unique<Impl>(io_ctx)) {}

HttpClient::~HttpClient() = default;

void HttpClient::request(const std::string& url, const HttpOptions& options, std::function<void(HttpResponse)> callback) {
  impl_->request(url, options, std::move(callback));
}

std::future<HttpResponse> HttpClient::request(const std::string& url, const HttpOptions& options) {
  auto promise = std::make_shared<std::promise<HttpResponse>>();
  auto future = promise->get_future();

  spdlog::debug("[HttpClient] {} {}", options.method, url);
  impl_->request(url, options, [promise](HttpResponse response) {
    promise->set_value(std::move(response));
  });

  return future;
}

}  // namespace clawcore::net
