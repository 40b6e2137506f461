#include "core/finding.h"

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

const char* CategoryName(Category category) {
  switch (category) {
    case Category::kCredential:
      return "credential";
    case Category::kPersonalInfo:
      return "personal_info";
    case Category::kInjection:
      return "injection";
    case Category::kMaliciousCode:
      return "malicious_code";
    case Category::kJailbreak:
      return "jailbreak";
    case Category::kNormal:
      return "normal";
  }
  return "normal";
}

std::optional<Category> ParseCategory(const std::string& name) {
  auto lowered = Lower(name);
  if (lowered == "credential" || lowered == "credentials") {
    return Category::kCredential;
  }
  if (lowered == "personal_info" || lowered == "pii") {
    return Category::kPersonalInfo;
  }
  if (lowered == "injection") {
    return Category::kInjection;
  }
  if (lowered == "malicious_code" || lowered == "malicious") {
    return Category::kMaliciousCode;
  }
  if (lowered == "jailbreak") {
    return Category::kJailbreak;
  }
  if (lowered == "normal") {
    return Category::kNormal;
  }
  return std::nullopt;
}

std::vector<Category> AllCategories() {
  return {Category::kCredential, Category::kPersonalInfo, Category::kInjection,
          Category::kMaliciousCode, Category::kJailbreak, Category::kNormal};
}

std::string SourceLabel(const Finding& finding) {
  switch (finding.source) {
    case FindingSource::kPattern:
      return "pattern";
    case FindingSource::kEntropy:
      return "entropy";
    case FindingSource::kClassifier:
      return "classifier:" + finding.classifier;
  }
  return "pattern";
}

double ClampConfidence(double value) {
  if (!(value > 0.0)) {
    return 0.0;
  }
  return std::min(1.0, value);
}

const char* PhaseStatusName(PhaseStatus status) {
  switch (status) {
    case PhaseStatus::kOk:
      return "ok";
    case PhaseStatus::kFailed:
      return "failed";
    case PhaseStatus::kTimedOut:
      return "timed_out";
    case PhaseStatus::kCancelled:
      return "cancelled";
  }
  return "failed";
}

}  // namespace promptguard
