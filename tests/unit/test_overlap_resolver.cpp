#include <catch2/catch.hpp>

#include "pipeline/overlap_resolver.h"

#include <string>
#include <vector>

using namespace promptguard;

TEST_CASE("Non-overlapping spans are all applied", "[overlap]") {
  const std::string prompt = "mail a@b.io key sk-1234567890abcdef";
  std::vector<SpanCandidate> candidates{{16, 35, "[API_KEY_MASKED]", 1},
                                        {5, 11, "[EMAIL_MASKED]", 0}};
  auto outcome = OverlapResolver::Resolve(prompt, candidates);
  REQUIRE(outcome.spans.size() == 2);
  REQUIRE(outcome.spans[0].start == 5);
  REQUIRE(outcome.sanitized_text == "mail [EMAIL_MASKED] key [API_KEY_MASKED]");
}

TEST_CASE("Earliest then longest span wins an overlap", "[overlap]") {
  const std::string prompt = "xx SECRETVALUE yy";
  std::vector<SpanCandidate> candidates{{3, 9, "[SHORT]", 0},
                                        {3, 14, "[LONG]", 1},
                                        {6, 14, "[LATE]", 2}};
  auto outcome = OverlapResolver::Resolve(prompt, candidates);
  REQUIRE(outcome.spans.size() == 1);
  REQUIRE(outcome.spans[0].replacement_text == "[LONG]");
  REQUIRE(outcome.spans[0].origin_finding_ids == std::vector<std::size_t>{1, 0, 2});
  REQUIRE(outcome.sanitized_text == "xx [LONG] yy");
}

TEST_CASE("Equal spans are ordered by finding id", "[overlap]") {
  std::vector<SpanCandidate> candidates{{0, 4, "[B]", 7}, {0, 4, "[A]", 3}};
  auto outcome = OverlapResolver::Resolve("abcd", candidates);
  REQUIRE(outcome.sanitized_text == "[A]");
  REQUIRE(outcome.spans[0].origin_finding_ids == std::vector<std::size_t>{3, 7});
}

TEST_CASE("Adjacent spans do not overlap", "[overlap]") {
  std::vector<SpanCandidate> candidates{{0, 3, "<1>", 0}, {3, 6, "<2>", 1}};
  auto outcome = OverlapResolver::Resolve("abcdef", candidates);
  REQUIRE(outcome.spans.size() == 2);
  REQUIRE(outcome.sanitized_text == "<1><2>");
}

TEST_CASE("Resolving a non-overlapping set is idempotent", "[overlap]") {
  const std::string prompt = "alpha beta gamma delta";
  std::vector<SpanCandidate> candidates{{0, 5, "[A]", 0}, {11, 16, "[G]", 1}};
  auto first = OverlapResolver::Resolve(prompt, candidates);

  std::vector<SpanCandidate> again;
  for (const auto& span : first.spans) {
    again.push_back({span.start, span.end, span.replacement_text, span.origin_finding_ids[0]});
  }
  auto second = OverlapResolver::Resolve(prompt, again);
  REQUIRE(second.sanitized_text == first.sanitized_text);
  REQUIRE(second.spans.size() == first.spans.size());
  for (std::size_t i = 0; i < first.spans.size(); ++i) {
    REQUIRE(second.spans[i].start == first.spans[i].start);
    REQUIRE(second.spans[i].end == first.spans[i].end);
    REQUIRE(second.spans[i].replacement_text == first.spans[i].replacement_text);
  }
}

TEST_CASE("Invalid candidates are ignored", "[overlap]") {
  std::vector<SpanCandidate> candidates{{4, 2, "[BACKWARDS]", 0},
                                        {3, 3, "[EMPTY]", 1},
                                        {2, 50, "[PAST_END]", 2}};
  auto outcome = OverlapResolver::Resolve("short", candidates);
  REQUIRE(outcome.spans.empty());
  REQUIRE(outcome.sanitized_text == "short");
}

TEST_CASE("CandidatesFrom skips findings without span or hint", "[overlap]") {
  std::vector<Finding> findings(3);
  findings[0].span = TextSpan{0, 2};
  findings[0].replacement_hint = "[X]";
  findings[1].span = TextSpan{2, 4};  // report-only
  findings[2].replacement_hint = "[Y]";  // whole-prompt judgment
  auto candidates = OverlapResolver::CandidatesFrom(findings, {0, 1, 2, 9});
  REQUIRE(candidates.size() == 1);
  REQUIRE(candidates[0].finding_id == 0);
  REQUIRE(candidates[0].replacement == "[X]");
}
