#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "spendcat/frequency_store.hpp"
#include "spendcat/tokenizer.hpp"

namespace spendcat {

enum class NoPredictionReason {
  kNone = 0,
  kEmptyInput,
  kUntrained,
  kAllTokensUnseen,
  kLowConfidence,
};

[[nodiscard]] std::string_view ToString(NoPredictionReason reason);

struct PredictorOptions {
  double min_confidence = 0.55;
  TokenizeOptions tokenize;
};

struct CategoryProbability {
  std::string category;
  double log_score = 0.0;
  double probability = 0.0;
};

struct NBResult {
  std::optional<std::string> category;
  // Probability of the best category. Still reported when the confidence
  // gate suppresses the prediction, zero for every other no-prediction.
  double probability = 0.0;
  NoPredictionReason reason = NoPredictionReason::kNone;
  std::vector<std::string> trace;
  // Softmax over every known category, in store order. Empty unless scoring ran.
  std::vector<CategoryProbability> distribution;
};

// Multinomial naive Bayes over the counters in a FrequencyStore, with add-one
// smoothing. Token presence (not repetition) drives the likelihood term and
// tokens the store has never seen are left out entirely.
class NaiveBayesPredictor {
 public:
  explicit NaiveBayesPredictor(const FrequencyStore& store, PredictorOptions options = {});

  [[nodiscard]] NBResult Predict(std::string_view text) const;
  [[nodiscard]] NBResult PredictTokens(const std::vector<std::string>& tokens) const;

  [[nodiscard]] const PredictorOptions& Options() const { return options_; }

 private:
  const FrequencyStore& store_;
  PredictorOptions options_;
};

}  // namespace spendcat
