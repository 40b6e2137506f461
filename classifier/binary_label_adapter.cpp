#include "classifier/binary_label_adapter.h"

#include <algorithm>
#include <cctype>

namespace promptguard {

namespace {
std::string Lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}
}  // namespace

BinaryLabelAdapter::BinaryLabelAdapter(ClassifierSettings settings,
                                       std::shared_ptr<const ClassifierTransport> transport,
                                       Category category, std::set<std::string> positive_labels)
    : RemoteClassifier(std::move(settings), std::move(transport)), category_(category) {
  for (const auto& label : positive_labels) {
    positive_labels_.insert(Lower(label));
  }
}

std::vector<Finding> BinaryLabelAdapter::Normalize(const ClassifierResponse& response,
                                                   const std::string& /*prompt*/) const {
  std::vector<Finding> findings;
  if (response.shape == ClassifierResponse::Shape::kEntities) {
    for (const auto& entity : response.entities) {
      if (AboveFloor(entity.score)) {
        findings.push_back(MakeFinding(category_, entity.score, entity.type));
      }
    }
    return findings;
  }
  // Labels arrive highest score first.
  for (const auto& label : response.labels) {
    if (positive_labels_.count(Lower(label.label)) == 0) {
      continue;
    }
    if (AboveFloor(label.score)) {
      findings.push_back(MakeFinding(category_, label.score, label.label));
    }
    break;
  }
  return findings;
}

}  // namespace promptguard
