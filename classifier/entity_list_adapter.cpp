#include "classifier/entity_list_adapter.h"

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

std::optional<TextSpan> LocateEntity(const EntityMatch& entity, const std::string& prompt) {
  if (entity.start && entity.end && *entity.start < *entity.end && *entity.end <= prompt.size()) {
    const std::size_t start = *entity.start;
    const std::size_t length = *entity.end - start;
    if (entity.text.empty() || prompt.compare(start, length, entity.text) == 0) {
      return TextSpan{start, *entity.end};
    }
  }
  if (entity.text.empty()) {
    return std::nullopt;
  }
  auto pos = prompt.find(entity.text);
  if (pos == std::string::npos) {
    return std::nullopt;
  }
  return TextSpan{pos, pos + entity.text.size()};
}

EntityListAdapter::EntityListAdapter(ClassifierSettings settings,
                                     std::shared_ptr<const ClassifierTransport> transport,
                                     std::map<std::string, Category> entity_categories,
                                     Category default_category)
    : RemoteClassifier(std::move(settings), std::move(transport)),
      default_category_(default_category) {
  for (const auto& [type, category] : entity_categories) {
    entity_categories_[Lower(type)] = category;
  }
}

std::map<std::string, Category> EntityListAdapter::DefaultEntityCategories() {
  return {{"password", Category::kCredential},    {"api_key", Category::kCredential},
          {"token", Category::kCredential},       {"secret", Category::kCredential},
          {"credential", Category::kCredential},  {"access_key", Category::kCredential},
          {"private_key", Category::kCredential}};
}

std::string EntityListAdapter::MaskFor(const std::string& entity_type) {
  std::string mask = "[";
  for (unsigned char c : entity_type) {
    mask += std::isalnum(c) ? static_cast<char>(std::toupper(c)) : '_';
  }
  mask += "_MASKED]";
  return mask;
}

Category EntityListAdapter::CategoryFor(const std::string& type) const {
  auto it = entity_categories_.find(Lower(type));
  return it == entity_categories_.end() ? default_category_ : it->second;
}

std::vector<Finding> EntityListAdapter::Normalize(const ClassifierResponse& response,
                                                  const std::string& prompt) const {
  std::vector<Finding> findings;
  if (response.shape == ClassifierResponse::Shape::kLabels) {
    // Only labels the map knows are meaningful without a span.
    for (const auto& label : response.labels) {
      auto it = entity_categories_.find(Lower(label.label));
      if (it != entity_categories_.end() && AboveFloor(label.score)) {
        findings.push_back(MakeFinding(it->second, label.score, label.label));
      }
    }
    return findings;
  }
  for (const auto& entity : response.entities) {
    if (!AboveFloor(entity.score)) {
      continue;
    }
    auto finding = MakeFinding(CategoryFor(entity.type), entity.score, entity.type);
    finding.span = LocateEntity(entity, prompt);
    if (finding.span) {
      finding.replacement_hint = MaskFor(entity.type);
    }
    findings.push_back(std::move(finding));
  }
  return findings;
}

}  // namespace promptguard
