#pragma once

#include <optional>
#include <string>

namespace promptguard {
namespace log {

enum class Level { DEBUG, INFO, WARN, ERROR };

// Enable JSON-structured output (one JSON object per line to stderr).
// Default mode is plain text: "[LEVEL] component: message".
// Call from main() based on PROMPTGUARD_LOG_FORMAT=json before any logging.
void SetJsonMode(bool enabled);
bool IsJsonMode();

// Entries below the minimum level are dropped. Default: INFO.
void SetMinLevel(Level level);
Level MinLevel();

// "debug", "info", "warn"/"warning", "error" (case-insensitive).
std::optional<Level> ParseLevel(const std::string &name);
const char *LevelName(Level level);

// The line Log() would write for this entry, without the trailing newline.
std::string FormatLine(Level level, const std::string &component,
                       const std::string &message, const std::string &extra = {});

// Emit a log entry at the given level.  `component` identifies the subsystem
// (e.g. "pipeline", "detector", "classifier").  `extra` is an optional
// key=value string appended to the JSON object or the text line.
void Log(Level level, const std::string &component, const std::string &message,
         const std::string &extra = {});

inline void Debug(const std::string &component, const std::string &message,
                  const std::string &extra = {}) {
  Log(Level::DEBUG, component, message, extra);
}
inline void Info(const std::string &component, const std::string &message,
                 const std::string &extra = {}) {
  Log(Level::INFO, component, message, extra);
}
inline void Warn(const std::string &component, const std::string &message,
                 const std::string &extra = {}) {
  Log(Level::WARN, component, message, extra);
}
inline void Error(const std::string &component, const std::string &message,
                  const std::string &extra = {}) {
  Log(Level::ERROR, component, message, extra);
}

} // namespace log
} // namespace promptguard
