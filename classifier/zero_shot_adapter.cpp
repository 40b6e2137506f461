#include "classifier/zero_shot_adapter.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>

using json = nlohmann::json;

namespace promptguard {

namespace {
std::string Lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}
}  // namespace

ZeroShotAdapter::ZeroShotAdapter(ClassifierSettings settings,
                                 std::shared_ptr<const ClassifierTransport> transport,
                                 std::map<std::string, Category> label_categories,
                                 std::vector<std::string> candidate_labels)
    : RemoteClassifier(std::move(settings), std::move(transport)),
      candidate_labels_(std::move(candidate_labels)) {
  for (const auto& [label, category] : label_categories) {
    label_categories_[Lower(label)] = category;
  }
}

std::string ZeroShotAdapter::RequestBody(const std::string& prompt) const {
  json payload = {{"inputs", prompt}};
  if (!candidate_labels_.empty()) {
    payload["parameters"] = {{"candidate_labels", candidate_labels_}};
  }
  return payload.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::vector<Finding> ZeroShotAdapter::Normalize(const ClassifierResponse& response,
                                                const std::string& /*prompt*/) const {
  std::vector<Finding> findings;
  for (const auto& label : response.labels) {
    auto it = label_categories_.find(Lower(label.label));
    if (it == label_categories_.end() || !AboveFloor(label.score)) {
      continue;
    }
    findings.push_back(MakeFinding(it->second, label.score, label.label));
  }
  for (const auto& entity : response.entities) {
    auto it = label_categories_.find(Lower(entity.type));
    if (it != label_categories_.end() && AboveFloor(entity.score)) {
      findings.push_back(MakeFinding(it->second, entity.score, entity.type));
    }
  }
  return findings;
}

}  // namespace promptguard
