#include "spendcat/trainer.hpp"

#include <chrono>
#include <cmath>
#include <ctime>
#include <limits>
#include <map>
#include <random>
#include <stdexcept>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include "spendcat/logging.hpp"

namespace spendcat {

namespace {
std::string NewExampleId() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};
  const std::uint64_t hi = rng();
  const std::uint64_t lo = rng();
  // RFC 4122 version 4, variant 10xx.
  const std::uint64_t hi_v4 = (hi & 0xFFFFFFFFFFFF0FFFull) | 0x0000000000004000ull;
  const std::uint64_t lo_v = (lo & 0x3FFFFFFFFFFFFFFFull) | 0x8000000000000000ull;
  return fmt::format("{:08x}-{:04x}-{:04x}-{:04x}-{:012x}", hi_v4 >> 32, (hi_v4 >> 16) & 0xFFFF, hi_v4 & 0xFFFF,
                     lo_v >> 48, lo_v & 0xFFFFFFFFFFFFull);
}

std::string UtcTimestamp() {
  const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  return fmt::format("{:%Y-%m-%d %H:%M:%S}", fmt::gmtime(now));
}
}  // namespace

std::int64_t CoerceWeight(double weight) {
  if (!std::isfinite(weight)) {
    return 1;
  }
  const double rounded = std::round(weight);
  if (rounded < 1.0) {
    return 1;
  }
  if (rounded >= static_cast<double>(std::numeric_limits<std::int32_t>::max())) {
    return std::numeric_limits<std::int32_t>::max();
  }
  return static_cast<std::int64_t>(rounded);
}

NaiveBayesTrainer::NaiveBayesTrainer(FrequencyStore& store, TrainerOptions options)
    : store_(store), options_(options) {}

TrainStats NaiveBayesTrainer::Train(const TrainingInput& input) {
  if (input.category.empty()) {
    throw std::invalid_argument("training example has no category");
  }

  TrainStats stats;
  const auto tokens = Tokenize(input.text, options_.tokenize);
  if (tokens.empty()) {
    stats.skipped = true;
    GetLogger()->debug("skipping training for transaction {}: no usable tokens", input.transaction_id);
    return stats;
  }

  const std::int64_t weight = CoerceWeight(input.weight);
  std::map<std::string, std::int64_t> multiplicity;
  for (const auto& t : tokens) {
    multiplicity[t] += weight;
  }

  TrainingExample example;
  example.id = NewExampleId();
  example.transaction_id = input.transaction_id;
  example.text = input.text;
  example.category = input.category;
  example.created_at = UtcTimestamp();

  for (const auto& [token, count] : multiplicity) {
    stats.weighted_mass += count;
  }
  const std::int64_t new_words = store_.ApplyTraining(example, multiplicity, stats.weighted_mass);

  stats.tokens = tokens.size();
  stats.distinct_tokens = multiplicity.size();
  stats.new_words = static_cast<std::size_t>(new_words);

  GetLogger()->info("trained category={} tokens={} weighted={} new_words={} transaction={}", input.category,
                    stats.tokens, stats.weighted_mass, stats.new_words, input.transaction_id);
  return stats;
}

}  // namespace spendcat
