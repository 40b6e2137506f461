#include "config/service_config.h"

#include "logging/logger.h"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace promptguard {

namespace {

std::string Lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

bool ParseBool(const std::string& value) {
  const std::string lowered = Lower(value);
  return lowered == "true" || lowered == "1" || lowered == "yes" || lowered == "on";
}

std::vector<std::string> StringList(const YAML::Node& node) {
  std::vector<std::string> out;
  if (!node) {
    return out;
  }
  if (!node.IsSequence()) {
    throw ConfigError("expected a list, got '" + node.as<std::string>() + "'");
  }
  for (const auto& item : node) {
    out.push_back(item.as<std::string>());
  }
  return out;
}

std::map<std::string, std::string> StringMap(const YAML::Node& node) {
  std::map<std::string, std::string> out;
  if (!node) {
    return out;
  }
  if (!node.IsMap()) {
    throw ConfigError("expected a mapping");
  }
  for (const auto& kv : node) {
    out[kv.first.as<std::string>()] = kv.second.as<std::string>();
  }
  return out;
}

void ParseLevels(const YAML::Node& node, ServiceConfig* config) {
  if (!node.IsSequence()) {
    throw ConfigError("security_levels must be a list");
  }
  for (const auto& item : node) {
    if (!item["name"]) {
      throw ConfigError("security level entry without a name");
    }
    const std::string name = Lower(item["name"].as<std::string>());
    auto it = std::find_if(config->levels.begin(), config->levels.end(),
                           [&](const SecurityLevelRegistry::Entry& e) {
                             return Lower(e.config.name) == name;
                           });
    SecurityLevelRegistry::Entry entry;
    if (it != config->levels.end()) {
      entry = *it;
    } else {
      entry.config.name = name;
    }
    if (item["detection_threshold"])
      entry.config.detection_threshold = item["detection_threshold"].as<double>();
    if (item["blocking_threshold"])
      entry.config.blocking_threshold = item["blocking_threshold"].as<double>();
    if (item["entropy_threshold"])
      entry.config.entropy_threshold = item["entropy_threshold"].as<double>();
    if (item["block_mode"])
      entry.config.block_mode = item["block_mode"].as<bool>();
    if (item["aliases"])
      entry.aliases = StringList(item["aliases"]);
    if (it != config->levels.end()) {
      *it = std::move(entry);
    } else {
      config->levels.push_back(std::move(entry));
    }
  }
}

PatternRule ParseRule(const YAML::Node& item) {
  PatternRule rule;
  if (!item["id"] || !item["pattern"] || !item["category"]) {
    throw ConfigError("custom rule requires id, category and pattern");
  }
  rule.id = item["id"].as<std::string>();
  auto category = ParseCategory(item["category"].as<std::string>());
  if (!category || *category == Category::kNormal) {
    throw ConfigError("custom rule '" + rule.id + "' has unknown category '" +
                      item["category"].as<std::string>() + "'");
  }
  rule.category = *category;
  rule.pattern = item["pattern"].as<std::string>();
  rule.confidence = item["confidence"] ? item["confidence"].as<double>() : 0.8;
  if (item["replacement"]) rule.replacement = item["replacement"].as<std::string>();
  if (item["family"]) rule.family = item["family"].as<std::string>();
  if (item["value_group"]) rule.value_group = item["value_group"].as<int>();
  if (item["min_value_length"])
    rule.min_value_length = item["min_value_length"].as<std::size_t>();
  if (rule.family.empty() && rule.category == Category::kJailbreak) {
    rule.family = rule.id;
  }
  return rule;
}

ClassifierSpec ParseClassifier(const YAML::Node& item) {
  ClassifierSpec spec;
  if (!item["name"] || !item["kind"] || !item["endpoint"]) {
    throw ConfigError("classifier entry requires name, kind and endpoint");
  }
  spec.name = item["name"].as<std::string>();
  spec.kind = item["kind"].as<std::string>();
  spec.endpoint = item["endpoint"].as<std::string>();
  spec.headers = StringMap(item["headers"]);
  if (item["timeout_ms"]) spec.timeout_ms = item["timeout_ms"].as<int>();
  if (item["min_confidence"]) spec.min_confidence = item["min_confidence"].as<double>();
  if (item["enabled"]) spec.enabled = item["enabled"].as<bool>();
  if (item["category"]) spec.category = item["category"].as<std::string>();
  spec.positive_labels = StringList(item["positive_labels"]);
  spec.categories = StringMap(item["categories"]);
  spec.candidate_labels = StringList(item["candidate_labels"]);
  // Header values of the form "env:NAME" are read from the environment so
  // API tokens stay out of the file.
  for (auto& kv : spec.headers) {
    if (kv.second.rfind("env:", 0) == 0) {
      const char* value = std::getenv(kv.second.substr(4).c_str());
      kv.second = value ? value : "";
    }
  }
  return spec;
}

void Populate(const YAML::Node& root, ServiceConfig* config) {
  if (!root || root.IsNull()) {
    return;
  }
  if (!root.IsMap()) {
    throw ConfigError("configuration root must be a mapping");
  }
  if (root["logging"]["format"]) config->logging.format = root["logging"]["format"].as<std::string>();
  if (root["logging"]["level"]) config->logging.level = root["logging"]["level"].as<std::string>();

  if (root["pipeline"]["phase_timeout_ms"]) {
    config->phase_timeout =
        std::chrono::milliseconds(root["pipeline"]["phase_timeout_ms"].as<long>());
  }
  if (root["pipeline"]["workers"]) config->workers = root["pipeline"]["workers"].as<std::size_t>();
  if (root["pipeline"]["max_workers"])
    config->max_workers = root["pipeline"]["max_workers"].as<std::size_t>();

  if (root["default_level"]) config->default_level = root["default_level"].as<std::string>();
  if (root["security_levels"]) ParseLevels(root["security_levels"], config);

  const YAML::Node detector = root["detector"];
  if (detector) {
    if (detector["entropy_scan"]) config->detector.entropy_scan = detector["entropy_scan"].as<bool>();
    if (detector["min_token_length"])
      config->detector.min_token_length = detector["min_token_length"].as<std::size_t>();
    if (detector["keyword_window"])
      config->detector.keyword_window = detector["keyword_window"].as<std::size_t>();
    config->detector.excluded_values = StringList(detector["excluded_values"]);
    config->detector.credential_keywords = StringList(detector["credential_keywords"]);
    if (detector["custom_rules"]) {
      for (const auto& item : detector["custom_rules"]) {
        config->detector.custom_rules.push_back(ParseRule(item));
      }
    }
  }

  if (root["classifiers"]) {
    if (!root["classifiers"].IsSequence()) {
      throw ConfigError("classifiers must be a list");
    }
    for (const auto& item : root["classifiers"]) {
      config->classifiers.push_back(ParseClassifier(item));
    }
  }

  if (root["audit"]["path"]) config->audit.path = root["audit"]["path"].as<std::string>();
  if (root["audit"]["debug"]) config->audit.debug = root["audit"]["debug"].as<bool>();
}

}  // namespace

ServiceConfig ParseServiceConfig(const std::string& yaml_text) {
  ServiceConfig config;
  try {
    Populate(YAML::Load(yaml_text), &config);
  } catch (const YAML::Exception& e) {
    throw ConfigError(std::string("invalid configuration: ") + e.what());
  }
  return config;
}

ServiceConfig LoadServiceConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigError("cannot read configuration file " + path);
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  try {
    return ParseServiceConfig(buffer.str());
  } catch (const ConfigError& e) {
    throw ConfigError(path + ": " + e.what());
  }
}

void ApplyEnvironment(ServiceConfig* config, const EnvLookup& lookup) {
  if (const char* v = lookup("PROMPTGUARD_LOG_FORMAT")) config->logging.format = v;
  if (const char* v = lookup("PROMPTGUARD_LOG_LEVEL")) config->logging.level = v;
  if (const char* v = lookup("PROMPTGUARD_DEFAULT_LEVEL")) config->default_level = v;
  if (const char* v = lookup("PROMPTGUARD_PHASE_TIMEOUT_MS")) {
    try {
      config->phase_timeout = std::chrono::milliseconds(std::stol(v));
    } catch (const std::exception&) {
      throw ConfigError(std::string("PROMPTGUARD_PHASE_TIMEOUT_MS is not a number: ") + v);
    }
  }
  if (const char* v = lookup("PROMPTGUARD_WORKERS")) {
    try {
      const long workers = std::stol(v);
      if (workers <= 0) {
        throw ConfigError("PROMPTGUARD_WORKERS must be positive");
      }
      config->workers = static_cast<std::size_t>(workers);
    } catch (const std::logic_error&) {
      throw ConfigError(std::string("PROMPTGUARD_WORKERS is not a number: ") + v);
    }
  }
  if (const char* v = lookup("PROMPTGUARD_AUDIT_LOG")) config->audit.path = v;
  if (const char* v = lookup("PROMPTGUARD_AUDIT_DEBUG")) config->audit.debug = ParseBool(v);
  if (const char* v = lookup("PROMPTGUARD_CLASSIFIERS_DISABLED")) {
    config->classifiers_enabled = !ParseBool(v);
  }
}

void ApplyEnvironment(ServiceConfig* config) {
  ApplyEnvironment(config, [](const char* name) { return std::getenv(name); });
}

void ConfigureLogging(const LoggingSettings& settings) {
  const std::string format = Lower(settings.format);
  if (format != "json" && format != "text") {
    throw ConfigError("unknown log format '" + settings.format + "'");
  }
  auto level = log::ParseLevel(settings.level);
  if (!level) {
    throw ConfigError("unknown log level '" + settings.level + "'");
  }
  log::SetJsonMode(format == "json");
  log::SetMinLevel(*level);
}

ServiceComponents BuildComponents(const ServiceConfig& config) {
  if (config.phase_timeout.count() <= 0) {
    throw ConfigError("pipeline.phase_timeout_ms must be positive");
  }
  if (config.workers == 0) {
    throw ConfigError("pipeline.workers must be positive");
  }
  if (config.max_workers < config.workers) {
    throw ConfigError("pipeline.max_workers must be at least pipeline.workers");
  }

  ServiceComponents components;
  components.levels =
      std::make_shared<const SecurityLevelRegistry>(config.levels, config.default_level);

  PatternDetectorOptions options;
  options.entropy_scan = config.detector.entropy_scan;
  options.min_token_length = config.detector.min_token_length;
  options.keyword_window = config.detector.keyword_window;
  options.excluded_values.insert(options.excluded_values.end(),
                                 config.detector.excluded_values.begin(),
                                 config.detector.excluded_values.end());
  options.credential_keywords.insert(options.credential_keywords.end(),
                                     config.detector.credential_keywords.begin(),
                                     config.detector.credential_keywords.end());
  auto rules = DefaultPatternRules();
  rules.insert(rules.end(), config.detector.custom_rules.begin(),
               config.detector.custom_rules.end());
  components.detector = std::make_shared<const PatternDetector>(std::move(rules), options);

  if (config.classifiers_enabled) {
    try {
      components.adapters = BuildClassifierAdapters(config.classifiers);
    } catch (const std::invalid_argument& e) {
      throw ConfigError(e.what());
    }
  }

  components.options.phase_timeout = config.phase_timeout;
  components.options.workers = config.workers;
  components.options.max_workers = config.max_workers;
  return components;
}

}  // namespace promptguard
