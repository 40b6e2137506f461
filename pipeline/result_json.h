#pragma once

#include "core/finding.h"

#include <nlohmann/json.hpp>

#include <string>

namespace promptguard {

nlohmann::json ToJson(const Finding& finding);
nlohmann::json ToJson(const ContextSignals& context);
nlohmann::json ToJson(const PhaseReport& phase);
// camelCase wire shape of a validation: sanitizedText, isBlocked,
// blockedCategories, warnings, confidenceScore, findings, ...
nlohmann::json ToJson(const ValidationResult& result);

// Serializes with invalid UTF-8 replaced, so arbitrary prompt bytes never
// make serialization throw.
std::string DumpJson(const nlohmann::json& j, bool pretty = false);

}  // namespace promptguard
