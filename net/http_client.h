#pragma once

#include "common/cancellation.h"

#include <cstddef>
#include <map>
#include <stdexcept>
#include <string>

#include <openssl/ssl.h>

namespace promptguard {

struct HttpResponse {
  int status{0};
  std::string body;
};

class HttpTimeout : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class HttpCancelled : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class HttpResponseTooLarge : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

constexpr std::size_t kDefaultMaxResponseBytes = 4 * 1024 * 1024;

// Per-call limits. Both interrupt a call that is connecting, writing or
// waiting for the response.
struct RequestOptions {
  Clock::time_point deadline{Clock::time_point::max()};
  CancellationToken cancellation;
  // Raw response bytes (headers included) read before giving up with
  // HttpResponseTooLarge.
  std::size_t max_response_bytes{kDefaultMaxResponseBytes};
};

// Minimal HTTP/1.1 client (one connection per request, "Connection: close").
// https URLs go through OpenSSL with peer and host verification. Failures
// throw std::runtime_error; deadline and cancellation throw HttpTimeout and
// HttpCancelled respectively, an oversized response HttpResponseTooLarge.
class HttpClient {
 public:
  HttpClient();
  ~HttpClient();
  HttpClient(const HttpClient&) = delete;
  HttpClient& operator=(const HttpClient&) = delete;

  HttpResponse Post(const std::string& url, const std::string& body,
                    const std::map<std::string, std::string>& headers = {},
                    const RequestOptions& options = {}) const;

 private:
  HttpResponse Send(const std::string& method, const std::string& url,
                    const std::string& body,
                    const std::map<std::string, std::string>& headers,
                    const RequestOptions& options) const;

  SSL_CTX* ssl_ctx_{nullptr};
  bool tls_ready_{false};
};

// Sets SNI and makes certificate verification require `host`. Throws
// std::runtime_error when OpenSSL refuses the name.
void PinTlsHost(SSL* ssl, const std::string& host);

// Splits a raw HTTP/1.1 response into status and body, decoding a chunked
// body when the headers say so.
HttpResponse ParseHttpResponse(const std::string& raw);

}  // namespace promptguard
