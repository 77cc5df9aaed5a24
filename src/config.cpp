#include "spendcat/config.hpp"

#include <array>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace spendcat {

namespace {
constexpr std::array<const char*, 7> kKeys = {
    "DB_PATH", "LEXICON_PATH", "MAX_TOKENS", "MIN_CONFIDENCE", "NB_THRESHOLD", "OVERRIDE_THRESHOLD", "LOG_LEVEL",
};

std::string Trim(const std::string& s) {
  const auto first = s.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) {
    return {};
  }
  const auto last = s.find_last_not_of(" \t\r\n");
  return s.substr(first, last - first + 1);
}

std::size_t ParseTokenLimit(const std::string& key, const std::string& s) {
  // stoull accepts a sign and wraps negatives around.
  if (s.empty() || s.find_first_not_of("0123456789") != std::string::npos) {
    throw std::runtime_error("invalid value for " + key + ": " + s);
  }
  unsigned long long v = 0;
  try {
    v = std::stoull(s, nullptr, 10);
  } catch (const std::exception&) {
    throw std::runtime_error("invalid value for " + key + ": " + s);
  }
  if (v == 0 || v > kMaxTokenLimit) {
    throw std::runtime_error("invalid value for " + key + " (expected 1.." + std::to_string(kMaxTokenLimit) +
                             "): " + s);
  }
  return static_cast<std::size_t>(v);
}

double ParseProbability(const std::string& key, const std::string& s) {
  std::size_t pos = 0;
  double v = 0.0;
  try {
    v = std::stod(s, &pos);
  } catch (const std::exception&) {
    throw std::runtime_error("invalid value for " + key + " (expected 0..1): " + s);
  }
  if (pos != s.size() || !std::isfinite(v) || v < 0.0 || v > 1.0) {
    throw std::runtime_error("invalid value for " + key + " (expected 0..1): " + s);
  }
  return v;
}
}  // namespace

EnvMap ReadEnvFile(const std::string& path) {
  EnvMap env;
  std::ifstream in(path);
  if (!in) {
    return env;
  }
  bool first_line = true;
  std::string line;
  while (std::getline(in, line)) {
    if (first_line) {
      first_line = false;
      if (line.size() >= 3 && static_cast<unsigned char>(line[0]) == 0xEF &&
          static_cast<unsigned char>(line[1]) == 0xBB && static_cast<unsigned char>(line[2]) == 0xBF) {
        line.erase(0, 3);
      }
    }
    auto trimmed = Trim(line);
    if (trimmed.empty() || trimmed[0] == '#') {
      continue;
    }
    auto eq = trimmed.find('=');
    if (eq == std::string::npos) {
      continue;
    }
    std::string key = Trim(trimmed.substr(0, eq));
    std::string val = Trim(trimmed.substr(eq + 1));
    if (val.size() >= 2 && ((val.front() == '"' && val.back() == '"') || (val.front() == '\'' && val.back() == '\''))) {
      val = val.substr(1, val.size() - 2);
    }
    env[key] = val;
  }
  return env;
}

void ApplyEnvOverrides(Config& cfg, const EnvMap& env) {
  auto get = [&](const char* key) -> const std::string* {
    auto it = env.find(key);
    return it == env.end() ? nullptr : &it->second;
  };
  if (auto v = get("DB_PATH")) {
    cfg.db_path = *v;
  }
  if (auto v = get("LEXICON_PATH")) {
    cfg.lexicon_path = *v;
  }
  if (auto v = get("MAX_TOKENS")) {
    cfg.max_tokens = ParseTokenLimit("MAX_TOKENS", *v);
  }
  if (auto v = get("MIN_CONFIDENCE")) {
    cfg.min_confidence = ParseProbability("MIN_CONFIDENCE", *v);
  }
  if (auto v = get("NB_THRESHOLD")) {
    cfg.nb_threshold = ParseProbability("NB_THRESHOLD", *v);
  }
  if (auto v = get("OVERRIDE_THRESHOLD")) {
    cfg.override_threshold = ParseProbability("OVERRIDE_THRESHOLD", *v);
  }
  if (auto v = get("LOG_LEVEL")) {
    cfg.log_level = *v;
  }
}

EnvMap ReadProcessEnv() {
  EnvMap env;
  for (const char* key : kKeys) {
    const std::string name = std::string("SPENDCAT_") + key;
    if (const char* value = std::getenv(name.c_str())) {
      env[key] = value;
    }
  }
  return env;
}

Config LoadConfig(const std::string& env_path) {
  Config cfg;
  cfg.env_path = env_path;
  ApplyEnvOverrides(cfg, ReadEnvFile(env_path));
  ApplyEnvOverrides(cfg, ReadProcessEnv());
  return cfg;
}

HybridOptions ToHybridOptions(const Config& cfg) {
  HybridOptions opts;
  opts.tokenize.max_tokens = cfg.max_tokens;
  opts.predictor.tokenize = opts.tokenize;
  opts.predictor.min_confidence = cfg.min_confidence;
  opts.combiner.nb_threshold = cfg.nb_threshold;
  opts.combiner.override_threshold = cfg.override_threshold;
  return opts;
}

}  // namespace spendcat
