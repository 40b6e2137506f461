#include "classifier/classifier_response.h"

#include <nlohmann/json.hpp>

#include <algorithm>

using json = nlohmann::json;

namespace promptguard {

namespace {
double ScoreOf(const json& j, const char* key) {
  if (!j.contains(key)) {
    return 1.0;
  }
  if (!j[key].is_number()) {
    throw MalformedResponse(std::string("non-numeric '") + key + "'");
  }
  return j[key].get<double>();
}

std::optional<std::size_t> OffsetOf(const json& j, const char* key) {
  if (!j.contains(key) || j[key].is_null()) {
    return std::nullopt;
  }
  if (!j[key].is_number_integer() || j[key].get<long long>() < 0) {
    throw MalformedResponse(std::string("invalid entity offset '") + key + "'");
  }
  return static_cast<std::size_t>(j[key].get<long long>());
}

std::string StringOf(const json& j, std::initializer_list<const char*> keys) {
  for (const char* key : keys) {
    if (j.contains(key) && j[key].is_string()) {
      return j[key].get<std::string>();
    }
  }
  return {};
}

bool LooksLikeEntity(const json& j) {
  return j.is_object() && (j.contains("entity_group") || j.contains("entity") || j.contains("type"));
}

LabelScore ParseLabel(const json& j) {
  if (!j.is_object() || !j.contains("label") || !j["label"].is_string()) {
    throw MalformedResponse("label entry without a string 'label'");
  }
  if (!j.contains("score")) {
    throw MalformedResponse("label entry without 'score'");
  }
  return {j["label"].get<std::string>(), ScoreOf(j, "score")};
}

EntityMatch ParseEntity(const json& j) {
  if (!j.is_object()) {
    throw MalformedResponse("entity entry is not an object");
  }
  EntityMatch entity;
  entity.type = StringOf(j, {"type", "entity_group", "entity"});
  if (entity.type.empty()) {
    throw MalformedResponse("entity without a type");
  }
  entity.text = StringOf(j, {"text", "word"});
  entity.start = OffsetOf(j, "start");
  entity.end = OffsetOf(j, "end");
  entity.score = ScoreOf(j, "score");
  return entity;
}

void SortLabels(ClassifierResponse* response) {
  std::stable_sort(response->labels.begin(), response->labels.end(),
                   [](const LabelScore& a, const LabelScore& b) { return a.score > b.score; });
}

ClassifierResponse FromArray(const json& items) {
  ClassifierResponse response;
  if (items.empty()) {
    return response;
  }
  if (LooksLikeEntity(items.front())) {
    response.shape = ClassifierResponse::Shape::kEntities;
    for (const auto& item : items) {
      response.entities.push_back(ParseEntity(item));
    }
    return response;
  }
  for (const auto& item : items) {
    response.labels.push_back(ParseLabel(item));
  }
  SortLabels(&response);
  return response;
}
}  // namespace

ClassifierResponse ParseClassifierResponse(const std::string& body) {
  json j;
  try {
    j = json::parse(body);
  } catch (const json::parse_error& e) {
    throw MalformedResponse(std::string("invalid JSON: ") + e.what());
  }

  try {
    if (j.is_array()) {
      // Text-classification pipelines wrap one result list per input.
      if (!j.empty() && j.front().is_array()) {
        return FromArray(j.front());
      }
      return FromArray(j);
    }
    if (!j.is_object()) {
      throw MalformedResponse("unexpected JSON type");
    }
    if (j.contains("error")) {
      throw MalformedResponse("classifier reported an error: " +
                              (j["error"].is_string() ? j["error"].get<std::string>()
                                                      : j["error"].dump()));
    }
    ClassifierResponse response;
    if (j.contains("entities")) {
      if (!j["entities"].is_array()) {
        throw MalformedResponse("'entities' is not a list");
      }
      response.shape = ClassifierResponse::Shape::kEntities;
      for (const auto& item : j["entities"]) {
        response.entities.push_back(ParseEntity(item));
      }
      return response;
    }
    if (j.contains("labels") && j.contains("scores")) {
      const auto& labels = j["labels"];
      const auto& scores = j["scores"];
      if (!labels.is_array() || !scores.is_array() || labels.size() != scores.size()) {
        throw MalformedResponse("'labels' and 'scores' must be lists of equal length");
      }
      for (std::size_t i = 0; i < labels.size(); ++i) {
        if (!labels[i].is_string() || !scores[i].is_number()) {
          throw MalformedResponse("zero-shot entry has the wrong types");
        }
        response.labels.push_back({labels[i].get<std::string>(), scores[i].get<double>()});
      }
      SortLabels(&response);
      return response;
    }
    if (j.contains("label")) {
      response.labels.push_back(ParseLabel(j));
      return response;
    }
  } catch (const json::exception& e) {
    throw MalformedResponse(std::string("unexpected response layout: ") + e.what());
  }
  throw MalformedResponse("unrecognized classifier response");
}

}  // namespace promptguard
