#pragma once

#include "classifier/classifier_adapter.h"
#include "classifier/classifier_response.h"
#include "classifier/classifier_transport.h"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace promptguard {

struct ClassifierSettings {
  std::string name;
  std::chrono::milliseconds timeout{2000};
  // Scores below the floor never become Findings.
  double min_confidence{0.5};
};

// Shared request/response handling for HTTP-style classifiers. Subclasses
// only turn a parsed response into Findings.
class RemoteClassifier : public ClassifierAdapter {
 public:
  std::string Name() const override { return settings_.name; }
  std::chrono::milliseconds Timeout() const override { return settings_.timeout; }
  ClassifierOutcome Invoke(const std::string& prompt, const CallContext& call) const override;

 protected:
  RemoteClassifier(ClassifierSettings settings, std::shared_ptr<const ClassifierTransport> transport);

  // Default: {"inputs": prompt}.
  virtual std::string RequestBody(const std::string& prompt) const;
  virtual std::vector<Finding> Normalize(const ClassifierResponse& response,
                                         const std::string& prompt) const = 0;

  bool AboveFloor(double score) const;
  Finding MakeFinding(Category category, double score, std::string rule) const;
  const ClassifierSettings& settings() const { return settings_; }

 private:
  ClassifierSettings settings_;
  std::shared_ptr<const ClassifierTransport> transport_;
};

}  // namespace promptguard
