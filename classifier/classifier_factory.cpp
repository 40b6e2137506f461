#include "classifier/classifier_factory.h"

#include "classifier/binary_label_adapter.h"
#include "classifier/entity_list_adapter.h"
#include "classifier/zero_shot_adapter.h"

#include <set>
#include <stdexcept>

namespace promptguard {

namespace {
Category RequireCategory(const ClassifierSpec& spec, const std::string& name) {
  auto category = ParseCategory(name);
  if (!category) {
    throw std::invalid_argument("classifier '" + spec.name + "': unknown category '" + name + "'");
  }
  return *category;
}

std::map<std::string, Category> CategoryMap(const ClassifierSpec& spec) {
  std::map<std::string, Category> mapped;
  for (const auto& [key, name] : spec.categories) {
    mapped[key] = RequireCategory(spec, name);
  }
  return mapped;
}

std::shared_ptr<const ClassifierAdapter> Build(const ClassifierSpec& spec) {
  if (spec.name.empty()) {
    throw std::invalid_argument("classifier without a name");
  }
  if (spec.timeout_ms <= 0) {
    throw std::invalid_argument("classifier '" + spec.name + "': timeout_ms must be positive");
  }
  if (spec.min_confidence < 0.0 || spec.min_confidence > 1.0) {
    throw std::invalid_argument("classifier '" + spec.name +
                                "': min_confidence must be within [0, 1]");
  }
  ClassifierSettings settings;
  settings.name = spec.name;
  settings.timeout = std::chrono::milliseconds(spec.timeout_ms);
  settings.min_confidence = spec.min_confidence;

  std::shared_ptr<ClassifierTransport> transport;
  try {
    transport = MakeTransport(spec.endpoint, spec.headers);
  } catch (const std::invalid_argument& e) {
    throw std::invalid_argument("classifier '" + spec.name + "': " + e.what());
  }

  if (spec.kind == "binary_label") {
    if (spec.positive_labels.empty()) {
      throw std::invalid_argument("classifier '" + spec.name + "': positive_labels is empty");
    }
    return std::make_shared<BinaryLabelAdapter>(
        settings, transport, RequireCategory(spec, spec.category),
        std::set<std::string>(spec.positive_labels.begin(), spec.positive_labels.end()));
  }
  if (spec.kind == "entity_list") {
    auto mapped = EntityListAdapter::DefaultEntityCategories();
    for (const auto& [type, category] : CategoryMap(spec)) {
      mapped[type] = category;
    }
    Category fallback =
        spec.category.empty() ? Category::kPersonalInfo : RequireCategory(spec, spec.category);
    return std::make_shared<EntityListAdapter>(settings, transport, mapped, fallback);
  }
  if (spec.kind == "zero_shot") {
    auto mapped = CategoryMap(spec);
    if (mapped.empty()) {
      throw std::invalid_argument("classifier '" + spec.name + "': zero_shot needs categories");
    }
    return std::make_shared<ZeroShotAdapter>(settings, transport, mapped, spec.candidate_labels);
  }
  throw std::invalid_argument("classifier '" + spec.name + "': unknown kind '" + spec.kind + "'");
}
}  // namespace

AdapterList BuildClassifierAdapters(const std::vector<ClassifierSpec>& specs) {
  AdapterList adapters;
  std::set<std::string> names;
  for (const auto& spec : specs) {
    if (!spec.enabled) {
      continue;
    }
    if (!names.insert(spec.name).second) {
      throw std::invalid_argument("duplicate classifier name '" + spec.name + "'");
    }
    adapters.push_back(Build(spec));
  }
  return adapters;
}

}  // namespace promptguard
