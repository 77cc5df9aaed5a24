#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>

#include "spendcat/hybrid.hpp"

namespace spendcat {

struct Config {
  std::string env_path = ".env";
  std::string db_path = "spendcat.db";
  std::string lexicon_path;  // empty -> built-in lexicon
  std::size_t max_tokens = kMaxTokenLimit;
  double min_confidence = 0.55;
  double nb_threshold = 0.6;
  double override_threshold = 0.85;
  std::string log_level = "info";
};

using EnvMap = std::unordered_map<std::string, std::string>;

// Parses KEY=VALUE lines. Blank lines and '#' comments are skipped, a UTF-8
// BOM and surrounding quotes are stripped. A missing file yields an empty map.
EnvMap ReadEnvFile(const std::string& path);

// Recognised keys: DB_PATH, LEXICON_PATH, MAX_TOKENS, MIN_CONFIDENCE,
// NB_THRESHOLD, OVERRIDE_THRESHOLD, LOG_LEVEL. Throws std::runtime_error
// naming the key when a value does not parse or is out of range.
void ApplyEnvOverrides(Config& cfg, const EnvMap& env);

// Collects SPENDCAT_<KEY> variables from the process environment, with the
// prefix stripped.
EnvMap ReadProcessEnv();

// Defaults, then `env_path`, then the process environment.
Config LoadConfig(const std::string& env_path = ".env");

[[nodiscard]] HybridOptions ToHybridOptions(const Config& cfg);

}  // namespace spendcat
