#include "classifier/classifier_transport.h"

#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>

namespace promptguard {

HttpClassifierTransport::HttpClassifierTransport(std::string url,
                                                 std::map<std::string, std::string> headers,
                                                 std::shared_ptr<const HttpClient> client)
    : url_(std::move(url)), headers_(std::move(headers)), client_(std::move(client)) {
  if (!client_) {
    client_ = std::make_shared<HttpClient>();
  }
}

TransportResponse HttpClassifierTransport::Post(const std::string& json_body,
                                                const CallContext& call) const {
  RequestOptions options;
  options.deadline = call.deadline;
  options.cancellation = call.cancellation;
  try {
    auto response = client_->Post(url_, json_body, headers_, options);
    return {response.status, std::move(response.body)};
  } catch (const HttpTimeout& e) {
    throw TransportError(UnavailableReason::kTimeout, e.what());
  } catch (const HttpCancelled& e) {
    throw TransportError(UnavailableReason::kCancelled, e.what());
  } catch (const HttpResponseTooLarge& e) {
    throw TransportError(UnavailableReason::kMalformedResponse, e.what());
  } catch (const std::runtime_error& e) {
    throw TransportError(UnavailableReason::kUnreachable, e.what());
  }
}

FileClassifierTransport::FileClassifierTransport(std::string path) : path_(std::move(path)) {}

TransportResponse FileClassifierTransport::Post(const std::string& /*json_body*/,
                                                const CallContext& call) const {
  if (call.cancellation.IsCancelled()) {
    throw TransportError(UnavailableReason::kCancelled, "request cancelled");
  }
  if (call.Expired()) {
    throw TransportError(UnavailableReason::kTimeout, "request deadline exceeded");
  }
  std::filesystem::path path(path_);
  if (!std::filesystem::exists(path)) {
    throw TransportError(UnavailableReason::kUnreachable, "classifier file not found: " + path_);
  }
  std::ifstream input(path);
  if (!input.good()) {
    throw TransportError(UnavailableReason::kUnreachable, "classifier file unreadable: " + path_);
  }
  std::error_code ec;
  const auto size = std::filesystem::file_size(path, ec);
  if (!ec && size > kDefaultMaxResponseBytes) {
    throw TransportError(UnavailableReason::kMalformedResponse,
                         "classifier file exceeds " + std::to_string(kDefaultMaxResponseBytes) +
                             " bytes: " + path_);
  }
  std::string body((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
  return {200, std::move(body)};
}

std::shared_ptr<ClassifierTransport> MakeTransport(
    const std::string& endpoint, const std::map<std::string, std::string>& headers) {
  if (endpoint.rfind("file://", 0) == 0) {
    return std::make_shared<FileClassifierTransport>(endpoint.substr(std::strlen("file://")));
  }
  if (endpoint.rfind("http://", 0) == 0 || endpoint.rfind("https://", 0) == 0) {
    return std::make_shared<HttpClassifierTransport>(endpoint, headers);
  }
  throw std::invalid_argument("unsupported classifier endpoint: " + endpoint);
}

}  // namespace promptguard
