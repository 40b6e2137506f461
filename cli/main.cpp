#include "cli/batch.h"
#include "config/service_config.h"
#include "logging/audit_logger.h"
#include "logging/logger.h"
#include "metrics/metrics.h"
#include "pipeline/result_json.h"
#include "pipeline/validation_pipeline.h"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

using json = nlohmann::json;
using namespace promptguard;

namespace {

constexpr int kExitAllowed = 0;
constexpr int kExitError = 1;

struct CliOptions {
  std::string command;
  std::string prompt;
  std::string prompt_file;
  std::string level;
  std::string config_path;
  bool pretty{false};
  bool metrics{false};
};

void PrintUsage() {
  std::cout
      << "Usage:\n"
      << "  promptguardctl validate [--prompt TEXT | --file PATH] [--level NAME]\n"
         "                         [--config PATH] [--pretty] [--metrics]\n"
      << "      Validate a prompt (stdin when neither --prompt nor --file is\n"
         "      given). --file validates one prompt per line and prints one\n"
         "      result per prompt. Exit 0 when allowed, 2 when any prompt is\n"
         "      blocked, 1 on error.\n"
      << "  promptguardctl metrics --file PATH [--level NAME] [--config PATH]\n"
         "      Validate one prompt per line and print only the Prometheus text.\n"
      << "  promptguardctl analyze [--prompt TEXT | --file PATH] [--level NAME]\n"
         "                        [--config PATH] [--pretty]\n"
      << "      Print context signals and raw detector findings.\n"
      << "  promptguardctl levels [--config PATH]\n"
      << "      List the configured security levels.\n";
}

std::filesystem::path DefaultConfigPath() {
  if (const char *env = std::getenv("PROMPTGUARD_CONFIG")) {
    return std::filesystem::path(env);
  }
  if (const char *home = std::getenv("HOME")) {
    return std::filesystem::path(home) / ".promptguard" / "config.yaml";
  }
  return std::filesystem::current_path() / "promptguard.yaml";
}

std::string ReadAll(std::istream &in) {
  std::stringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

// Explicit --config must exist; the default path is optional.
ServiceConfig LoadConfig(const std::string &explicit_path) {
  ServiceConfig config;
  if (!explicit_path.empty()) {
    config = LoadServiceConfig(explicit_path);
  } else {
    auto path = DefaultConfigPath();
    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
      config = LoadServiceConfig(path.string());
    }
  }
  ApplyEnvironment(&config);
  return config;
}

std::string ResolvePrompt(const CliOptions &options) {
  if (!options.prompt.empty()) {
    return options.prompt;
  }
  if (!options.prompt_file.empty()) {
    std::ifstream in(options.prompt_file, std::ios::binary);
    if (!in) {
      throw ConfigError("cannot read prompt file " + options.prompt_file);
    }
    return ReadAll(in);
  }
  return ReadAll(std::cin);
}

std::vector<std::string> ResolvePrompts(const CliOptions &options) {
  if (options.prompt.empty() && !options.prompt_file.empty()) {
    std::ifstream in(options.prompt_file, std::ios::binary);
    if (!in) {
      throw ConfigError("cannot read prompt file " + options.prompt_file);
    }
    return ReadPromptLines(in);
  }
  return {ResolvePrompt(options)};
}

int CmdLevels(const ServiceComponents &components) {
  const auto &registry = *components.levels;
  const std::string default_name = registry.DefaultLevel().name;
  for (const auto &entry : registry.Entries()) {
    const auto &level = entry.config;
    std::cout << level.name << (level.name == default_name ? " (default)" : "");
    if (!entry.aliases.empty()) {
      std::cout << " aliases=";
      for (std::size_t i = 0; i < entry.aliases.size(); ++i) {
        std::cout << (i ? "," : "") << entry.aliases[i];
      }
    }
    std::cout << " detection=" << level.detection_threshold
              << " blocking=" << level.blocking_threshold
              << " entropy=" << level.entropy_threshold
              << " mode=" << (level.block_mode ? "block" : "observe") << "\n";
  }
  return kExitAllowed;
}

int CmdAnalyze(const ValidationPipeline &pipeline, const CliOptions &options) {
  const auto &level = options.level.empty() ? pipeline.Levels().DefaultLevel()
                                            : pipeline.Levels().Lookup(options.level);
  const std::string prompt = ResolvePrompt(options);
  std::vector<Finding> findings;
  ContextSignals context = pipeline.Analyze(prompt, level, &findings);
  json j;
  j["securityLevel"] = level.name;
  j["context"] = ToJson(context);
  j["findings"] = json::array();
  for (const auto &finding : findings) {
    j["findings"].push_back(ToJson(finding));
  }
  std::cout << DumpJson(j, options.pretty) << "\n";
  return kExitAllowed;
}

std::string LevelName(const ValidationPipeline &pipeline, const CliOptions &options) {
  return options.level.empty() ? pipeline.Levels().DefaultLevel().name : options.level;
}

int CmdValidate(const ValidationPipeline &pipeline, AuditLogger *audit,
                const CliOptions &options) {
  const auto prompts = ResolvePrompts(options);
  if (prompts.empty()) {
    throw ConfigError("no prompts in " + options.prompt_file);
  }
  auto outcome = ValidatePrompts(pipeline, prompts, LevelName(pipeline, options), audit,
                                 &std::cout, options.pretty);
  if (options.metrics) {
    std::cerr << GlobalMetrics().RenderPrometheus();
  }
  return ExitCodeFor(outcome);
}

int CmdMetrics(const ValidationPipeline &pipeline, AuditLogger *audit,
               const CliOptions &options) {
  if (options.prompt_file.empty()) {
    throw ConfigError("metrics needs --file");
  }
  auto outcome = ValidatePrompts(pipeline, ResolvePrompts(options),
                                 LevelName(pipeline, options), audit, nullptr);
  std::cout << GlobalMetrics().RenderPrometheus();
  return ExitCodeFor(outcome);
}

} // namespace

int main(int argc, char **argv) {
  if (argc < 2) {
    PrintUsage();
    return kExitError;
  }
  CliOptions options;
  options.command = argv[1];
  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];
    if ((arg == "--prompt" || arg == "-p") && i + 1 < argc) {
      options.prompt = argv[++i];
    } else if ((arg == "--file" || arg == "-f") && i + 1 < argc) {
      options.prompt_file = argv[++i];
    } else if ((arg == "--level" || arg == "-l") && i + 1 < argc) {
      options.level = argv[++i];
    } else if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
      options.config_path = argv[++i];
    } else if (arg == "--pretty") {
      options.pretty = true;
    } else if (arg == "--metrics") {
      options.metrics = true;
    } else {
      std::cerr << "Unknown argument: " << arg << "\n";
      PrintUsage();
      return kExitError;
    }
  }
  if (options.command == "help" || options.command == "--help") {
    PrintUsage();
    return kExitAllowed;
  }
  if (options.command != "validate" && options.command != "analyze" &&
      options.command != "levels" && options.command != "metrics") {
    std::cerr << "Unknown command: " << options.command << "\n";
    PrintUsage();
    return kExitError;
  }

  try {
    ServiceConfig config = LoadConfig(options.config_path);
    ConfigureLogging(config.logging);
    ServiceComponents components = BuildComponents(config);
    if (options.command == "levels") {
      return CmdLevels(components);
    }

    ValidationPipeline pipeline(components.levels, components.detector, components.adapters,
                                components.options, &GlobalMetrics());
    if (options.command == "analyze") {
      return CmdAnalyze(pipeline, options);
    }
    auto audit = config.audit.path.empty()
                     ? std::make_unique<AuditLogger>()
                     : std::make_unique<AuditLogger>(config.audit.path, config.audit.debug);
    if (!config.audit.path.empty() && !audit->Enabled()) {
      log::Warn("cli", "audit log not writable", "path=" + config.audit.path);
    }
    if (options.command == "metrics") {
      return CmdMetrics(pipeline, audit.get(), options);
    }
    return CmdValidate(pipeline, audit.get(), options);
  } catch (const ConfigError &e) {
    log::Error("cli", e.what());
  } catch (const InvalidConfig &e) {
    log::Error("cli", e.what());
  } catch (const MalformedDetectorRule &e) {
    log::Error("cli", e.what());
  }
  return kExitError;
}
