#pragma once

#include "classifier/remote_classifier.h"

#include <set>

namespace promptguard {

// Binary text classifiers (e.g. a prompt-injection detector answering
// INJECTION/SAFE). The best-scoring positive label yields one span-less
// Finding of the configured category.
class BinaryLabelAdapter : public RemoteClassifier {
 public:
  BinaryLabelAdapter(ClassifierSettings settings, std::shared_ptr<const ClassifierTransport> transport,
                     Category category, std::set<std::string> positive_labels);

 protected:
  std::vector<Finding> Normalize(const ClassifierResponse& response,
                                 const std::string& prompt) const override;

 private:
  Category category_;
  std::set<std::string> positive_labels_;  // lower-case
};

}  // namespace promptguard
