#pragma once

#include "classifier/remote_classifier.h"

#include <map>

namespace promptguard {

// Zero-shot classifiers scoring the prompt against candidate labels. Each
// mapped label above the floor becomes a span-less Finding; unmapped labels
// are ignored.
class ZeroShotAdapter : public RemoteClassifier {
 public:
  ZeroShotAdapter(ClassifierSettings settings, std::shared_ptr<const ClassifierTransport> transport,
                  std::map<std::string, Category> label_categories,
                  std::vector<std::string> candidate_labels = {});

 protected:
  // Adds "parameters": {"candidate_labels": [...]} when candidates are set.
  std::string RequestBody(const std::string& prompt) const override;
  std::vector<Finding> Normalize(const ClassifierResponse& response,
                                 const std::string& prompt) const override;

 private:
  std::map<std::string, Category> label_categories_;  // lower-case keys
  std::vector<std::string> candidate_labels_;
};

}  // namespace promptguard
