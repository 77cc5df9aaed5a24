#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "spendcat/frequency_store.hpp"
#include "spendcat/lexicon.hpp"
#include "spendcat/naive_bayes.hpp"
#include "spendcat/rule_engine.hpp"
#include "spendcat/tokenizer.hpp"

namespace spendcat {

enum class SuggestionSource {
  kNone = 0,
  kRule,
  kNb,
};

[[nodiscard]] std::string_view ToString(SuggestionSource source);

struct CombinerOptions {
  // NB may overrule a matching rule only above this probability.
  double override_threshold = 0.85;
  // NB is accepted on its own above this probability when no rule matched.
  double nb_threshold = 0.6;
};

struct HybridResult {
  std::optional<std::string> category;
  double confidence = 0.0;
  SuggestionSource source = SuggestionSource::kNone;
  std::vector<std::string> explanation;
};

[[nodiscard]] HybridResult Combine(const RuleMatch& rule, const NBResult& nb, const CombinerOptions& opts = {});

struct HybridOptions {
  TokenizeOptions tokenize;
  PredictorOptions predictor;
  CombinerOptions combiner;
};

// Runs both engines on the same token sequence and reconciles them.
class HybridPredictor {
 public:
  HybridPredictor(std::shared_ptr<const Lexicon> lexicon, const FrequencyStore& store, HybridOptions options = {});

  [[nodiscard]] HybridResult Predict(std::string_view text) const;

 private:
  HybridOptions options_;
  RuleEngine rules_;
  NaiveBayesPredictor nb_;
};

}  // namespace spendcat
