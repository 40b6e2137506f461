#pragma once

#include "classifier/remote_classifier.h"

#include <map>

namespace promptguard {

// Named-entity recognizers (PII, secrets). Each entity above the floor becomes
// a Finding; its offsets are checked against the prompt bytes before they are
// trusted as a span.
class EntityListAdapter : public RemoteClassifier {
 public:
  // `entity_categories` keys are entity types (case-insensitive). Types not in
  // the map fall back to `default_category`.
  EntityListAdapter(ClassifierSettings settings, std::shared_ptr<const ClassifierTransport> transport,
                    std::map<std::string, Category> entity_categories = DefaultEntityCategories(),
                    Category default_category = Category::kPersonalInfo);

  static std::map<std::string, Category> DefaultEntityCategories();

  // "[<TYPE>_MASKED]" with the type upper-cased and non-alphanumerics as '_'.
  static std::string MaskFor(const std::string& entity_type);

 protected:
  std::vector<Finding> Normalize(const ClassifierResponse& response,
                                 const std::string& prompt) const override;

 private:
  Category CategoryFor(const std::string& type) const;

  std::map<std::string, Category> entity_categories_;  // lower-case keys
  Category default_category_;
};

// The span the entity really occupies in `prompt`: the reported offsets when
// they reproduce the entity text, else the first occurrence of the text.
std::optional<TextSpan> LocateEntity(const EntityMatch& entity, const std::string& prompt);

}  // namespace promptguard
