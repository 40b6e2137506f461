#pragma once

#include "classifier/classifier_adapter.h"
#include "net/http_client.h"

#include <map>
#include <memory>
#include <stdexcept>
#include <string>

namespace promptguard {

struct TransportResponse {
  int status{0};
  std::string body;
};

class TransportError : public std::runtime_error {
 public:
  TransportError(UnavailableReason reason, const std::string& message)
      : std::runtime_error(message), reason_(reason) {}

  UnavailableReason reason() const { return reason_; }

 private:
  UnavailableReason reason_;
};

// Moves one JSON request to a classifier service and back. Throws
// TransportError; never interprets the body.
class ClassifierTransport {
 public:
  virtual ~ClassifierTransport() = default;

  virtual TransportResponse Post(const std::string& json_body, const CallContext& call) const = 0;
  virtual std::string Describe() const = 0;
};

class HttpClassifierTransport : public ClassifierTransport {
 public:
  HttpClassifierTransport(std::string url, std::map<std::string, std::string> headers = {},
                          std::shared_ptr<const HttpClient> client = nullptr);

  TransportResponse Post(const std::string& json_body, const CallContext& call) const override;
  std::string Describe() const override { return url_; }

 private:
  std::string url_;
  std::map<std::string, std::string> headers_;
  std::shared_ptr<const HttpClient> client_;
};

// Serves a canned response from disk (file:// endpoints), for offline runs
// and reproducible tests. The request body is ignored.
class FileClassifierTransport : public ClassifierTransport {
 public:
  explicit FileClassifierTransport(std::string path);

  TransportResponse Post(const std::string& json_body, const CallContext& call) const override;
  std::string Describe() const override { return "file://" + path_; }

 private:
  std::string path_;
};

// http(s):// or file:// endpoint. Throws std::invalid_argument otherwise.
std::shared_ptr<ClassifierTransport> MakeTransport(
    const std::string& endpoint, const std::map<std::string, std::string>& headers = {});

}  // namespace promptguard
