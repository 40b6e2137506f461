#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace promptguard {

struct LabelScore {
  std::string label;
  double score{0.0};
};

struct EntityMatch {
  std::string type;
  std::string text;
  std::optional<std::size_t> start;
  std::optional<std::size_t> end;
  double score{0.0};
};

// The shapes classifier services answer with, normalized. A response carries
// either labels or entities.
struct ClassifierResponse {
  enum class Shape { kLabels, kEntities };

  Shape shape{Shape::kLabels};
  std::vector<LabelScore> labels;  // highest score first
  std::vector<EntityMatch> entities;
};

class MalformedResponse : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Accepts:
//   {"label": "...", "score": 0.9}
//   [{"label": "...", "score": 0.9}, ...]        (also nested one level: [[...]])
//   {"entities": [{"type", "text", "start", "end", "score"}, ...]}
//   [{"entity_group": "...", "word": "...", "start", "end", "score"}, ...]
//   {"labels": [...], "scores": [...]}
// Throws MalformedResponse for anything else.
ClassifierResponse ParseClassifierResponse(const std::string& body);

}  // namespace promptguard
