#include <catch2/catch.hpp>

#include "core/finding.h"

#include <limits>
#include <string>

using namespace promptguard;

TEST_CASE("Category names round-trip through ParseCategory", "[finding]") {
  for (auto category : AllCategories()) {
    auto parsed = ParseCategory(CategoryName(category));
    REQUIRE(parsed.has_value());
    REQUIRE(*parsed == category);
  }
}

TEST_CASE("ParseCategory accepts short aliases case-insensitively", "[finding]") {
  REQUIRE(ParseCategory("PII") == Category::kPersonalInfo);
  REQUIRE(ParseCategory("credentials") == Category::kCredential);
  REQUIRE(ParseCategory("Malicious") == Category::kMaliciousCode);
  REQUIRE_FALSE(ParseCategory("spam").has_value());
  REQUIRE_FALSE(ParseCategory("").has_value());
}

TEST_CASE("SourceLabel names the classifier for classifier findings", "[finding]") {
  Finding finding;
  REQUIRE(SourceLabel(finding) == "pattern");
  finding.source = FindingSource::kEntropy;
  REQUIRE(SourceLabel(finding) == "entropy");
  finding.source = FindingSource::kClassifier;
  finding.classifier = "pii-ner";
  REQUIRE(SourceLabel(finding) == "classifier:pii-ner");
}

TEST_CASE("ClampConfidence keeps scores in [0, 1]", "[finding]") {
  REQUIRE(ClampConfidence(-0.3) == 0.0);
  REQUIRE(ClampConfidence(1.7) == 1.0);
  REQUIRE(ClampConfidence(0.42) == Catch::Detail::Approx(0.42));
  REQUIRE(ClampConfidence(std::numeric_limits<double>::quiet_NaN()) == 0.0);
}

TEST_CASE("TextSpan overlap is half-open", "[finding]") {
  TextSpan a{0, 5};
  TextSpan b{5, 9};
  TextSpan c{4, 6};
  REQUIRE_FALSE(a.Overlaps(b));
  REQUIRE(a.Overlaps(c));
  REQUIRE(b.Overlaps(c));
  REQUIRE(TextSpan{7, 3}.length() == 0);
}

TEST_CASE("ValidationResult reports modifications only when text changed", "[finding]") {
  ValidationResult result;
  result.original_prompt = "hello";
  result.sanitized_text = "hello";
  REQUIRE_FALSE(result.ModificationsMade());
  result.sanitized_text = "[EMAIL_MASKED]";
  REQUIRE(result.ModificationsMade());
}

TEST_CASE("PhaseStatusName", "[finding]") {
  REQUIRE(std::string(PhaseStatusName(PhaseStatus::kOk)) == "ok");
  REQUIRE(std::string(PhaseStatusName(PhaseStatus::kTimedOut)) == "timed_out");
  REQUIRE(std::string(PhaseStatusName(PhaseStatus::kCancelled)) == "cancelled");
}
