#include "core/security_level.h"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace promptguard {

namespace {
std::string Lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

bool InUnitRange(double value) { return value >= 0.0 && value <= 1.0; }
}  // namespace

void SecurityLevelConfig::Validate() const {
  if (name.empty()) {
    throw InvalidConfig("security level has no name");
  }
  if (!InUnitRange(detection_threshold)) {
    throw InvalidConfig("security level '" + name +
                        "': detection_threshold must be within [0, 1]");
  }
  if (!InUnitRange(blocking_threshold)) {
    throw InvalidConfig("security level '" + name +
                        "': blocking_threshold must be within [0, 1]");
  }
  if (detection_threshold > blocking_threshold) {
    throw InvalidConfig("security level '" + name +
                        "': detection_threshold exceeds blocking_threshold");
  }
  // Shannon entropy over bytes is bounded by 8 bits.
  if (!(entropy_threshold > 0.0) || entropy_threshold > 8.0) {
    throw InvalidConfig("security level '" + name +
                        "': entropy_threshold must be within (0, 8]");
  }
}

SecurityLevelRegistry::SecurityLevelRegistry(std::vector<Entry> entries,
                                             std::string default_level)
    : entries_(std::move(entries)), default_level_(Lower(default_level)) {
  if (entries_.empty()) {
    throw InvalidConfig("no security levels configured");
  }
  for (std::size_t i = 0; i < entries_.size(); ++i) {
    auto& entry = entries_[i];
    entry.config.Validate();
    std::vector<std::string> keys{entry.config.name};
    keys.insert(keys.end(), entry.aliases.begin(), entry.aliases.end());
    for (const auto& key : keys) {
      auto lowered = Lower(key);
      if (lowered.empty()) {
        continue;
      }
      if (!index_.emplace(lowered, i).second) {
        throw InvalidConfig("duplicate security level name or alias: " + key);
      }
    }
  }
  if (default_level_.empty()) {
    default_level_ = Lower(entries_.front().config.name);
  }
  if (index_.find(default_level_) == index_.end()) {
    throw InvalidConfig("default security level is not registered: " +
                        default_level);
  }
}

std::vector<SecurityLevelRegistry::Entry> SecurityLevelRegistry::BuiltinEntries() {
  std::vector<Entry> entries;
  entries.push_back({{"permissive", 0.70, 0.95, 4.2, true}, {"low"}});
  entries.push_back({{"balanced", 0.60, 0.80, 3.5, true}, {"medium"}});
  entries.push_back({{"strict", 0.40, 0.60, 3.0, true}, {"high"}});
  entries.push_back({{"observe", 0.60, 0.80, 3.5, false}, {"monitor"}});
  return entries;
}

SecurityLevelRegistry SecurityLevelRegistry::Builtin() {
  return SecurityLevelRegistry(BuiltinEntries(), "balanced");
}

const SecurityLevelConfig* SecurityLevelRegistry::Find(const std::string& name) const {
  auto it = index_.find(Lower(name));
  if (it == index_.end()) {
    return nullptr;
  }
  return &entries_[it->second].config;
}

const SecurityLevelConfig& SecurityLevelRegistry::Lookup(const std::string& name) const {
  if (name.empty()) {
    throw InvalidConfig("security level not specified");
  }
  const auto* config = Find(name);
  if (!config) {
    std::ostringstream message;
    message << "unknown security level '" << name << "'; valid options:";
    for (const auto& known : Names()) {
      message << " " << known;
    }
    throw InvalidConfig(message.str());
  }
  return *config;
}

const SecurityLevelConfig& SecurityLevelRegistry::DefaultLevel() const {
  return entries_[index_.at(default_level_)].config;
}

std::vector<std::string> SecurityLevelRegistry::Names() const {
  std::vector<std::string> names;
  names.reserve(entries_.size());
  for (const auto& entry : entries_) {
    names.push_back(entry.config.name);
  }
  return names;
}

}  // namespace promptguard
