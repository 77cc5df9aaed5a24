#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

#include "spendcat/config.hpp"
#include "spendcat/logging.hpp"

int main() {
  using namespace spendcat;

  const auto path = std::filesystem::temp_directory_path() / "spendcat_config_test.env";
  {
    std::ofstream out(path);
    out << "\xEF\xBB\xBF# engine settings\n"
        << "DB_PATH=\"/tmp/spendcat-test.db\"\n"
        << "\n"
        << "MIN_CONFIDENCE = 0.7\r\n"
        << "MAX_TOKENS=5\n"
        << "LOG_LEVEL='debug'\n"
        << "not a setting\n";
  }

  auto env = ReadEnvFile(path.string());
  assert(env.size() == 4);
  assert(env["DB_PATH"] == "/tmp/spendcat-test.db");
  assert(env["MIN_CONFIDENCE"] == "0.7");
  assert(env["LOG_LEVEL"] == "debug");

  Config cfg;
  ApplyEnvOverrides(cfg, env);
  assert(cfg.db_path == "/tmp/spendcat-test.db");
  assert(cfg.min_confidence == 0.7);
  assert(cfg.max_tokens == 5);
  assert(cfg.log_level == "debug");
  assert(cfg.nb_threshold == 0.6);
  assert(cfg.lexicon_path.empty());

  Config widest;
  ApplyEnvOverrides(widest, EnvMap{{"MAX_TOKENS", "10"}});
  assert(widest.max_tokens == kMaxTokenLimit);

  auto opts = ToHybridOptions(cfg);
  assert(opts.tokenize.max_tokens == 5);
  assert(opts.predictor.tokenize.max_tokens == 5);
  assert(opts.predictor.min_confidence == 0.7);
  assert(opts.combiner.override_threshold == 0.85);

  ::setenv("SPENDCAT_MAX_TOKENS", "7", 1);
  auto process = ReadProcessEnv();
  assert(process["MAX_TOKENS"] == "7");
  auto loaded = LoadConfig(path.string());
  assert(loaded.env_path == path.string());
  assert(loaded.db_path == "/tmp/spendcat-test.db");
  assert(loaded.max_tokens == 7);
  ::unsetenv("SPENDCAT_MAX_TOKENS");

  std::filesystem::remove(path);
  assert(ReadEnvFile(path.string()).empty());

  for (const auto& bad : {EnvMap{{"NB_THRESHOLD", "1.5"}}, EnvMap{{"MIN_CONFIDENCE", "high"}},
                          EnvMap{{"MAX_TOKENS", "0"}}, EnvMap{{"MAX_TOKENS", "10x"}},
                          EnvMap{{"MAX_TOKENS", "-1"}}, EnvMap{{"MAX_TOKENS", "+5"}},
                          EnvMap{{"MAX_TOKENS", "11"}}, EnvMap{{"MAX_TOKENS", "18446744073709551617"}}}) {
    Config c;
    bool threw = false;
    try {
      ApplyEnvOverrides(c, bad);
    } catch (const std::runtime_error&) {
      threw = true;
    }
    assert(threw);
  }

  SetLogLevel("warn");
  assert(GetLogger()->level() == spdlog::level::warn);
  SetLogLevel("off");
  assert(GetLogger()->level() == spdlog::level::off);
  bool threw = false;
  try {
    SetLogLevel("loud");
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);

  return 0;
}
