#include "classifier/remote_classifier.h"

#include "logging/logger.h"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace promptguard {

RemoteClassifier::RemoteClassifier(ClassifierSettings settings,
                                   std::shared_ptr<const ClassifierTransport> transport)
    : settings_(std::move(settings)), transport_(std::move(transport)) {
  if (!transport_) {
    throw std::invalid_argument("classifier '" + settings_.name + "' has no transport");
  }
}

std::string RemoteClassifier::RequestBody(const std::string& prompt) const {
  json payload = {{"inputs", prompt}};
  return payload.dump(-1, ' ', false, json::error_handler_t::replace);
}

bool RemoteClassifier::AboveFloor(double score) const {
  return ClampConfidence(score) >= settings_.min_confidence;
}

Finding RemoteClassifier::MakeFinding(Category category, double score, std::string rule) const {
  Finding finding;
  finding.category = category;
  finding.confidence = ClampConfidence(score);
  finding.source = FindingSource::kClassifier;
  finding.classifier = settings_.name;
  finding.rule = std::move(rule);
  return finding;
}

ClassifierOutcome RemoteClassifier::Invoke(const std::string& prompt,
                                           const CallContext& call) const {
  if (call.cancellation.IsCancelled()) {
    return ClassifierOutcome::Unavailable(UnavailableReason::kCancelled, "cancelled before dispatch");
  }
  TransportResponse response;
  try {
    response = transport_->Post(RequestBody(prompt), call);
  } catch (const TransportError& e) {
    log::Debug("classifier", "transport failed", "classifier=" + settings_.name +
                                                     " reason=" + UnavailableReasonName(e.reason()));
    return ClassifierOutcome::Unavailable(e.reason(), e.what());
  }
  if (response.status < 200 || response.status >= 300) {
    return ClassifierOutcome::Unavailable(UnavailableReason::kHttpStatus,
                                          "HTTP " + std::to_string(response.status) + " from " +
                                              transport_->Describe());
  }
  ClassifierOutcome outcome;
  try {
    outcome.findings = Normalize(ParseClassifierResponse(response.body), prompt);
  } catch (const MalformedResponse& e) {
    return ClassifierOutcome::Unavailable(UnavailableReason::kMalformedResponse, e.what());
  }
  return outcome;
}

}  // namespace promptguard
