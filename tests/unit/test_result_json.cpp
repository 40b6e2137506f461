#include <catch2/catch.hpp>

#include "pipeline/result_json.h"

#include <string>

using json = nlohmann::json;
using namespace promptguard;

TEST_CASE("Validation result serializes with the camelCase wire shape", "[json]") {
  ValidationResult result;
  result.request_id = "abc";
  result.security_level = "strict";
  result.original_prompt = "email me at a@b.io";
  result.sanitized_text = "email me at [EMAIL_MASKED]";
  result.blocked_categories = {Category::kPersonalInfo};
  result.warnings = {"personal_info blocked (confidence 0.90)"};
  result.confidence_score = 0.9;
  result.is_blocked = true;
  result.context.is_disclosure = true;

  Finding email;
  email.category = Category::kPersonalInfo;
  email.confidence = 0.9;
  email.span = TextSpan{12, 18};
  email.replacement_hint = "[EMAIL_MASKED]";
  email.rule = "pii.email";
  Finding judgment;
  judgment.category = Category::kInjection;
  judgment.confidence = 0.3;
  judgment.source = FindingSource::kClassifier;
  judgment.classifier = "injection-model";
  result.findings = {email, judgment};

  SanitizationSpan span;
  span.start = 12;
  span.end = 18;
  span.replacement_text = "[EMAIL_MASKED]";
  span.origin_finding_ids = {0};
  result.sanitization_spans = {span};

  PhaseReport phase;
  phase.name = "injection-model";
  phase.status = PhaseStatus::kFailed;
  phase.error = "unreachable: connection refused";
  result.phases = {phase};

  auto j = ToJson(result);
  REQUIRE(j["requestId"] == "abc");
  REQUIRE(j["securityLevel"] == "strict");
  REQUIRE(j["sanitizedText"] == "email me at [EMAIL_MASKED]");
  REQUIRE(j["isBlocked"] == true);
  REQUIRE(j["blockedCategories"] == json::array({"personal_info"}));
  REQUIRE(j["warnings"].size() == 1);
  REQUIRE(j["confidenceScore"] == 0.9);
  REQUIRE(j["modificationsMade"] == true);
  REQUIRE(j["context"]["isDisclosure"] == true);
  REQUIRE(j["context"]["isQuestion"] == false);

  REQUIRE(j["findings"].size() == 2);
  REQUIRE(j["findings"][0]["span"]["start"] == 12);
  REQUIRE(j["findings"][0]["source"] == "pattern");
  REQUIRE(j["findings"][0]["replacementHint"] == "[EMAIL_MASKED]");
  REQUIRE_FALSE(j["findings"][1].contains("span"));
  REQUIRE(j["findings"][1]["source"] == "classifier:injection-model");

  REQUIRE(j["sanitizationSpans"][0]["originFindingIds"] == json::array({0}));
  REQUIRE(j["phases"][0]["status"] == "failed");
  REQUIRE(j["phases"][0]["error"] == "unreachable: connection refused");
  // The raw prompt stays out of the response.
  REQUIRE_FALSE(j.contains("originalPrompt"));
}

TEST_CASE("DumpJson tolerates arbitrary prompt bytes", "[json]") {
  ValidationResult result;
  result.sanitized_text = std::string("caf\xc3 \xff");
  std::string text;
  REQUIRE_NOTHROW(text = DumpJson(ToJson(result)));
  REQUIRE_NOTHROW(json::parse(text));
  REQUIRE(DumpJson(json::object(), true) == "{}");
}
