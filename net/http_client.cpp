#include "net/http_client.h"

#include <arpa/inet.h>
#include <cerrno>
#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <openssl/err.h>
#include <openssl/x509v3.h>

#include <algorithm>
#include <cctype>
#include <memory>
#include <sstream>
#include <string>

namespace promptguard {
namespace {
constexpr int kPollSliceMs = 20;

struct ParsedUrl {
  std::string scheme{"http"};
  std::string host;
  std::string path{"/"};
  int port{80};
  bool use_tls{false};
};

ParsedUrl ParseUrl(const std::string& url) {
  ParsedUrl parsed;
  std::string remainder = url;
  auto scheme_pos = url.find("://");
  if (scheme_pos != std::string::npos) {
    parsed.scheme = url.substr(0, scheme_pos);
    remainder = url.substr(scheme_pos + 3);
  }
  if (parsed.scheme != "http" && parsed.scheme != "https") {
    throw std::runtime_error("unsupported URL scheme: " + parsed.scheme);
  }
  parsed.use_tls = (parsed.scheme == "https");
  parsed.port = parsed.use_tls ? 443 : 80;

  auto slash = remainder.find('/');
  std::string host_port = slash == std::string::npos ? remainder : remainder.substr(0, slash);
  parsed.path = slash == std::string::npos ? "/" : remainder.substr(slash);

  auto colon = host_port.find(':');
  if (colon == std::string::npos) {
    parsed.host = host_port;
  } else {
    parsed.host = host_port.substr(0, colon);
    try {
      parsed.port = std::stoi(host_port.substr(colon + 1));
    } catch (const std::exception&) {
      throw std::runtime_error("invalid URL port: " + host_port.substr(colon + 1));
    }
  }
  if (parsed.host.empty()) {
    throw std::runtime_error("invalid URL host");
  }
  return parsed;
}

void CheckInterrupt(const RequestOptions& options) {
  if (options.cancellation.IsCancelled()) {
    throw HttpCancelled("request cancelled");
  }
  if (Clock::now() >= options.deadline) {
    throw HttpTimeout("request deadline exceeded");
  }
}

// Polls in short slices so that both the deadline and the cancellation token
// are observed while the socket is idle.
void WaitReady(int sock, short events, const RequestOptions& options) {
  while (true) {
    CheckInterrupt(options);
    int slice = kPollSliceMs;
    if (options.deadline != Clock::time_point::max()) {
      auto left = std::chrono::duration_cast<std::chrono::milliseconds>(options.deadline -
                                                                        Clock::now())
                      .count();
      slice = static_cast<int>(std::max<long long>(1, std::min<long long>(slice, left)));
    }
    pollfd pfd{};
    pfd.fd = sock;
    pfd.events = events;
    int rc = ::poll(&pfd, 1, slice);
    if (rc > 0) {
      return;
    }
    if (rc < 0 && errno != EINTR) {
      throw std::runtime_error("poll failed");
    }
  }
}

struct Connection {
  int sock{-1};
  SSL* ssl{nullptr};

  Connection() = default;
  Connection(const Connection&) = delete;
  Connection& operator=(const Connection&) = delete;
  ~Connection() {
    if (ssl) {
      SSL_shutdown(ssl);
      SSL_free(ssl);
    }
    if (sock >= 0) {
      ::close(sock);
    }
  }
};

void Connect(Connection* conn, const ParsedUrl& parsed, const RequestOptions& options) {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo* result = nullptr;
  if (getaddrinfo(parsed.host.c_str(), std::to_string(parsed.port).c_str(), &hints,
                  &result) != 0) {
    throw std::runtime_error("failed to resolve host " + parsed.host);
  }
  std::unique_ptr<addrinfo, decltype(&freeaddrinfo)> guard(result, &freeaddrinfo);
  for (addrinfo* rp = result; rp != nullptr; rp = rp->ai_next) {
    int sock = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
    if (sock == -1) {
      continue;
    }
    conn->sock = sock;
    ::fcntl(sock, F_SETFL, ::fcntl(sock, F_GETFL, 0) | O_NONBLOCK);
    if (::connect(sock, rp->ai_addr, rp->ai_addrlen) == 0) {
      return;
    }
    if (errno == EINPROGRESS) {
      WaitReady(sock, POLLOUT, options);
      int error = 0;
      socklen_t len = sizeof(error);
      if (::getsockopt(sock, SOL_SOCKET, SO_ERROR, &error, &len) == 0 && error == 0) {
        return;
      }
    }
    ::close(sock);
    conn->sock = -1;
  }
  throw std::runtime_error("failed to connect to " + parsed.host);
}

// Waits for the direction OpenSSL asked for, or throws `what` on a hard error.
void WaitForTls(const Connection& conn, int rc, const RequestOptions& options,
                const char* what) {
  int err = SSL_get_error(conn.ssl, rc);
  if (err == SSL_ERROR_WANT_READ) {
    WaitReady(conn.sock, POLLIN, options);
    return;
  }
  if (err == SSL_ERROR_WANT_WRITE) {
    WaitReady(conn.sock, POLLOUT, options);
    return;
  }
  throw std::runtime_error(what);
}

void StartTls(Connection* conn, SSL_CTX* ctx, const ParsedUrl& parsed,
              const RequestOptions& options) {
  conn->ssl = SSL_new(ctx);
  if (!conn->ssl) {
    throw std::runtime_error("failed to allocate TLS context");
  }
  PinTlsHost(conn->ssl, parsed.host);
  SSL_set_fd(conn->ssl, conn->sock);
  int rc = 0;
  while ((rc = SSL_connect(conn->ssl)) != 1) {
    WaitForTls(*conn, rc, options, "TLS handshake failed");
  }
  if (SSL_get_verify_result(conn->ssl) != X509_V_OK) {
    throw std::runtime_error("TLS certificate verification failed");
  }
}

void WriteAll(const Connection& conn, const std::string& payload,
              const RequestOptions& options) {
  const char* ptr = payload.c_str();
  std::size_t remaining = payload.size();
  while (remaining > 0) {
    CheckInterrupt(options);
    if (conn.ssl) {
      int sent = SSL_write(conn.ssl, ptr, static_cast<int>(remaining));
      if (sent <= 0) {
        WaitForTls(conn, sent, options, "failed to send TLS request");
        continue;
      }
      ptr += sent;
      remaining -= static_cast<std::size_t>(sent);
      continue;
    }
    ssize_t sent = ::send(conn.sock, ptr, remaining, MSG_NOSIGNAL);
    if (sent < 0) {
      if (errno == EAGAIN || errno == EWOULDBLOCK) {
        WaitReady(conn.sock, POLLOUT, options);
        continue;
      }
      if (errno == EINTR) {
        continue;
      }
      throw std::runtime_error("failed to send request");
    }
    ptr += sent;
    remaining -= static_cast<std::size_t>(sent);
  }
}

void AppendBounded(std::string* response, const char* data, std::size_t size,
                   const RequestOptions& options) {
  if (response->size() + size > options.max_response_bytes) {
    throw HttpResponseTooLarge("response exceeds " + std::to_string(options.max_response_bytes) +
                               " bytes");
  }
  response->append(data, size);
}

std::string ReadAll(const Connection& conn, const RequestOptions& options) {
  std::string response;
  char buffer[4096];
  while (true) {
    CheckInterrupt(options);
    if (conn.ssl) {
      int received = SSL_read(conn.ssl, buffer, sizeof(buffer));
      if (received > 0) {
        AppendBounded(&response, buffer, static_cast<std::size_t>(received), options);
        continue;
      }
      int err = SSL_get_error(conn.ssl, received);
      if (err == SSL_ERROR_ZERO_RETURN || (err == SSL_ERROR_SYSCALL && received == 0)) {
        break;
      }
      WaitForTls(conn, received, options, "failed to read TLS response");
      continue;
    }
    WaitReady(conn.sock, POLLIN, options);
    ssize_t received = ::recv(conn.sock, buffer, sizeof(buffer), 0);
    if (received > 0) {
      AppendBounded(&response, buffer, static_cast<std::size_t>(received), options);
      continue;
    }
    if (received == 0) {
      break;
    }
    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
      continue;
    }
    throw std::runtime_error("failed to read response");
  }
  return response;
}

std::string BuildRequest(const ParsedUrl& parsed, const std::string& method,
                         const std::string& body,
                         const std::map<std::string, std::string>& headers) {
  std::ostringstream request;
  request << method << " " << parsed.path << " HTTP/1.1\r\n";
  request << "Host: " << parsed.host << "\r\n";
  request << "Content-Length: " << body.size() << "\r\n";
  if (headers.find("Content-Type") == headers.end()) {
    request << "Content-Type: application/json\r\n";
  }
  for (const auto& [key, value] : headers) {
    request << key << ": " << value << "\r\n";
  }
  request << "Connection: close\r\n\r\n";
  request << body;
  return request.str();
}

std::string DecodeChunked(const std::string& body) {
  std::string decoded;
  std::size_t pos = 0;
  while (pos < body.size()) {
    auto line_end = body.find("\r\n", pos);
    if (line_end == std::string::npos) {
      break;
    }
    std::size_t size = 0;
    try {
      size = std::stoul(body.substr(pos, line_end - pos), nullptr, 16);
    } catch (const std::exception&) {
      throw std::runtime_error("malformed chunked response");
    }
    if (size == 0) {
      break;
    }
    pos = line_end + 2;
    if (pos + size > body.size()) {
      throw std::runtime_error("truncated chunked response");
    }
    decoded.append(body, pos, size);
    pos += size + 2;
  }
  return decoded;
}
}  // namespace

void PinTlsHost(SSL* ssl, const std::string& host) {
  if (SSL_set_tlsext_host_name(ssl, host.c_str()) != 1) {
    throw std::runtime_error("failed to set TLS server name " + host);
  }
  // The certificate must also name the host we dialled.
  if (SSL_set1_host(ssl, host.c_str()) != 1) {
    throw std::runtime_error("failed to set TLS host name " + host);
  }
}

HttpResponse ParseHttpResponse(const std::string& raw) {
  HttpResponse http_response;
  auto header_end = raw.find("\r\n\r\n");
  std::string header = header_end == std::string::npos ? raw : raw.substr(0, header_end);
  std::string body = header_end == std::string::npos ? std::string() : raw.substr(header_end + 4);
  auto status_pos = header.find(' ');
  if (status_pos != std::string::npos) {
    try {
      http_response.status = std::stoi(header.substr(status_pos + 1));
    } catch (const std::exception&) {
      http_response.status = 0;
    }
  }
  std::string lowered = header;
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (lowered.find("transfer-encoding: chunked") != std::string::npos) {
    body = DecodeChunked(body);
  }
  http_response.body = std::move(body);
  return http_response;
}

HttpClient::HttpClient() {
  SSL_load_error_strings();
  OpenSSL_add_ssl_algorithms();
  ssl_ctx_ = SSL_CTX_new(TLS_client_method());
  if (ssl_ctx_) {
    SSL_CTX_set_verify(ssl_ctx_, SSL_VERIFY_PEER, nullptr);
    SSL_CTX_set_default_verify_paths(ssl_ctx_);
    tls_ready_ = true;
  }
}

HttpClient::~HttpClient() {
  if (ssl_ctx_) {
    SSL_CTX_free(ssl_ctx_);
    ssl_ctx_ = nullptr;
  }
}

HttpResponse HttpClient::Post(const std::string& url, const std::string& body,
                              const std::map<std::string, std::string>& headers,
                              const RequestOptions& options) const {
  return Send("POST", url, body, headers, options);
}

HttpResponse HttpClient::Send(const std::string& method, const std::string& url,
                              const std::string& body,
                              const std::map<std::string, std::string>& headers,
                              const RequestOptions& options) const {
  auto parsed = ParseUrl(url);
  CheckInterrupt(options);
  if (parsed.use_tls && !tls_ready_) {
    throw std::runtime_error("TLS not available in HttpClient");
  }
  Connection conn;
  Connect(&conn, parsed, options);
  if (parsed.use_tls) {
    StartTls(&conn, ssl_ctx_, parsed, options);
  }
  WriteAll(conn, BuildRequest(parsed, method, body, headers), options);
  return ParseHttpResponse(ReadAll(conn, options));
}

}  // namespace promptguard
