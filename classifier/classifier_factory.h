#pragma once

#include "classifier/classifier_adapter.h"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace promptguard {

// One configured classifier. `kind` is "binary_label", "entity_list" or
// "zero_shot"; `endpoint` is http(s):// or file://.
struct ClassifierSpec {
  std::string name;
  std::string kind;
  std::string endpoint;
  std::map<std::string, std::string> headers;
  int timeout_ms{2000};
  double min_confidence{0.5};
  bool enabled{true};
  // binary_label
  std::string category;
  std::vector<std::string> positive_labels;
  // entity_list (entity type -> category) and zero_shot (label -> category)
  std::map<std::string, std::string> categories;
  std::vector<std::string> candidate_labels;
};

using AdapterList = std::vector<std::shared_ptr<const ClassifierAdapter>>;

// Builds adapters in spec order, skipping disabled specs. Throws
// std::invalid_argument naming the classifier for an unknown kind, category
// or endpoint scheme, a non-positive timeout or an out-of-range floor.
AdapterList BuildClassifierAdapters(const std::vector<ClassifierSpec>& specs);

}  // namespace promptguard
