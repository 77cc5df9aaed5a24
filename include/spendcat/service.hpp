#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "spendcat/frequency_store.hpp"
#include "spendcat/hybrid.hpp"
#include "spendcat/lexicon.hpp"
#include "spendcat/trainer.hpp"

namespace spendcat {

struct Suggestion {
  std::optional<std::string> category;
  double confidence = 0.0;
  SuggestionSource source = SuggestionSource::kNone;
  std::string explanation;
};

// The free-text fields a transaction carries. Either may be empty.
struct TransactionText {
  std::string note;
  std::string merchant;
};

struct Transaction {
  std::string id;
  TransactionText text;
  std::string category;  // user-confirmed
};

// Joins non-empty fields with a single space and trims the result.
[[nodiscard]] std::string ComposeText(const TransactionText& text);

// Entry point for the surrounding application: predictions for transactions
// the user is looking at, and training whenever a category is set or edited.
class CategorizationService {
 public:
  CategorizationService(std::shared_ptr<const Lexicon> lexicon, FrequencyStore& store, HybridOptions options = {});

  // nullopt for blank text. Otherwise a suggestion whose category is empty
  // when neither engine was confident enough.
  [[nodiscard]] std::optional<Suggestion> Predict(std::string_view text) const;
  [[nodiscard]] std::optional<Suggestion> Predict(const TransactionText& text) const;

  TrainStats Train(const std::string& transaction_id, const std::string& text, const std::string& category,
                   double weight = 1.0);

  // Skips transactions without a category or without any text.
  TrainStats TrainOnTransaction(const Transaction& tx);

  void ResetModel();

 private:
  FrequencyStore& store_;
  HybridPredictor predictor_;
  NaiveBayesTrainer trainer_;
};

}  // namespace spendcat
