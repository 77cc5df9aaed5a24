#include "spendcat/naive_bayes.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <set>

#include <fmt/format.h>

namespace spendcat {

namespace {
NBResult NoPrediction(NoPredictionReason reason, std::string why) {
  NBResult r;
  r.reason = reason;
  r.trace.push_back(std::move(why));
  return r;
}
}  // namespace

std::string_view ToString(NoPredictionReason reason) {
  switch (reason) {
    case NoPredictionReason::kNone:
      return "none";
    case NoPredictionReason::kEmptyInput:
      return "empty input";
    case NoPredictionReason::kUntrained:
      return "untrained";
    case NoPredictionReason::kAllTokensUnseen:
      return "all tokens unseen";
    case NoPredictionReason::kLowConfidence:
      return "low confidence";
  }
  return "none";
}

NaiveBayesPredictor::NaiveBayesPredictor(const FrequencyStore& store, PredictorOptions options)
    : store_(store), options_(options) {}

NBResult NaiveBayesPredictor::Predict(std::string_view text) const {
  return PredictTokens(Tokenize(text, options_.tokenize));
}

NBResult NaiveBayesPredictor::PredictTokens(const std::vector<std::string>& tokens) const {
  if (tokens.empty()) {
    return NoPrediction(NoPredictionReason::kEmptyInput, "nb: no usable tokens");
  }

  const auto totals = store_.ListCategoryTotals();
  std::int64_t vocab_size = store_.GetVocabSize();
  if (vocab_size <= 0) {
    vocab_size = 1;
  }

  std::int64_t total_docs = 0;
  for (const auto& row : totals) {
    total_docs += std::max<std::int64_t>(row.doc_count, 0);
  }
  if (total_docs == 0) {
    return NoPrediction(NoPredictionReason::kUntrained, "nb: model has no training data");
  }

  const std::set<std::string> unique(tokens.begin(), tokens.end());
  const auto rows = store_.LookupWords(unique);

  // word -> category -> count
  std::map<std::string, std::map<std::string, std::int64_t>> seen;
  for (const auto& row : rows) {
    if (row.count > 0) {
      seen[row.word][row.category] = row.count;
    }
  }

  std::vector<std::string> surviving;
  for (const auto& token : tokens) {
    if (seen.count(token) != 0 &&
        std::find(surviving.begin(), surviving.end(), token) == surviving.end()) {
      surviving.push_back(token);
    }
  }
  if (surviving.empty()) {
    return NoPrediction(NoPredictionReason::kAllTokensUnseen, "nb: all tokens are unseen by the model");
  }

  NBResult result;
  result.distribution.reserve(totals.size());
  for (const auto& cat : totals) {
    const std::int64_t docs = cat.doc_count > 0 ? cat.doc_count : 1;
    double score = std::log(static_cast<double>(docs) / static_cast<double>(total_docs));
    const double denom = static_cast<double>(cat.total_words + vocab_size);
    for (const auto& token : surviving) {
      const auto& per_cat = seen[token];
      auto it = per_cat.find(cat.category);
      const std::int64_t count = it == per_cat.end() ? 0 : it->second;
      score += std::log(static_cast<double>(count + 1) / denom);
    }
    result.distribution.push_back({cat.category, score, 0.0});
  }

  double max_score = result.distribution.front().log_score;
  for (const auto& cp : result.distribution) {
    max_score = std::max(max_score, cp.log_score);
  }
  double sum = 0.0;
  for (auto& cp : result.distribution) {
    cp.probability = std::exp(cp.log_score - max_score);
    sum += cp.probability;
  }
  std::size_t best = 0;
  for (std::size_t i = 0; i < result.distribution.size(); ++i) {
    result.distribution[i].probability /= sum;
    if (result.distribution[i].probability > result.distribution[best].probability) {
      best = i;
    }
  }

  const auto& winner = result.distribution[best];
  result.probability = winner.probability;

  if (winner.probability < options_.min_confidence) {
    result.reason = NoPredictionReason::kLowConfidence;
    result.trace.push_back(fmt::format("nb: best guess {} at {:.3f} is below the {:.2f} gate",
                                       winner.category, winner.probability, options_.min_confidence));
    return result;
  }

  result.category = winner.category;
  const auto& prior_row = totals[best];
  result.trace.push_back(fmt::format("nb: prior {}/{} for {}", prior_row.doc_count > 0 ? prior_row.doc_count : 1,
                                     total_docs, winner.category));
  for (const auto& token : surviving) {
    std::string line = fmt::format("nb: token \"{}\" found in", token);
    bool first = true;
    for (const auto& [category, count] : seen[token]) {
      line += fmt::format("{}{}={}", first ? " " : ", ", category, count);
      first = false;
    }
    result.trace.push_back(std::move(line));
  }
  result.trace.push_back(fmt::format("nb: {} with probability {:.3f}", winner.category, winner.probability));
  return result;
}

}  // namespace spendcat
