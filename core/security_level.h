#pragma once

#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace promptguard {

// Raised for a malformed or unknown security level. Fatal for the call (or
// for startup when raised while loading configuration).
class InvalidConfig : public std::runtime_error {
 public:
  explicit InvalidConfig(const std::string& message)
      : std::runtime_error(message) {}
};

struct SecurityLevelConfig {
  std::string name;
  double detection_threshold{0.6};
  double blocking_threshold{0.8};
  double entropy_threshold{3.5};
  // false = observe-only: sanitize and report but never refuse.
  bool block_mode{true};

  // Throws InvalidConfig describing the first violated constraint.
  void Validate() const;
};

// ── SecurityLevelRegistry ───────────────────────────────────────────────────
// Named table of immutable SecurityLevelConfig values, populated once at
// startup. Switching the "current" level means passing a different config
// into the next call; entries are never mutated after construction.
//
// Thread safety: all methods are const and safe to call concurrently.
class SecurityLevelRegistry {
 public:
  struct Entry {
    SecurityLevelConfig config;
    std::vector<std::string> aliases;
  };

  // Validates every entry; throws InvalidConfig on a bad threshold, a
  // duplicate name/alias, or a default level that is not registered.
  SecurityLevelRegistry(std::vector<Entry> entries, std::string default_level);

  // permissive (low), balanced (medium), strict (high), observe (monitor).
  static SecurityLevelRegistry Builtin();
  static std::vector<Entry> BuiltinEntries();

  // Case-insensitive lookup by name or alias. Throws InvalidConfig.
  const SecurityLevelConfig& Lookup(const std::string& name) const;
  const SecurityLevelConfig* Find(const std::string& name) const;
  const SecurityLevelConfig& DefaultLevel() const;

  std::vector<std::string> Names() const;
  const std::vector<Entry>& Entries() const { return entries_; }

 private:
  std::vector<Entry> entries_;
  std::map<std::string, std::size_t> index_;  // lowered name/alias -> entry
  std::string default_level_;
};

}  // namespace promptguard
