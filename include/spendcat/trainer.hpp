#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "spendcat/frequency_store.hpp"
#include "spendcat/tokenizer.hpp"

namespace spendcat {

struct TrainingInput {
  std::string transaction_id;
  std::string text;
  std::string category;
  double weight = 1.0;
};

struct TrainStats {
  std::size_t tokens = 0;
  std::size_t distinct_tokens = 0;
  std::int64_t weighted_mass = 0;
  std::size_t new_words = 0;
  bool skipped = false;
};

struct TrainerOptions {
  TokenizeOptions tokenize;
};

// Rounds to the nearest integer and clamps to at least 1. NaN and infinities
// become 1.
[[nodiscard]] std::int64_t CoerceWeight(double weight);

// Online naive-Bayes update. Every call is a separate labeling event and
// only ever grows the counters; there is no batch recomputation or decay.
class NaiveBayesTrainer {
 public:
  explicit NaiveBayesTrainer(FrequencyStore& store, TrainerOptions options = {});

  // Throws std::invalid_argument when `input.category` is empty. Text with no
  // usable tokens is a no-op reported through TrainStats::skipped.
  TrainStats Train(const TrainingInput& input);

 private:
  FrequencyStore& store_;
  TrainerOptions options_;
};

}  // namespace spendcat
