#include "spendcat/service.hpp"

#include <utility>

#include "spendcat/logging.hpp"
#include "spendcat/tokenizer.hpp"

namespace spendcat {

namespace {
std::string JoinLines(const std::vector<std::string>& lines) {
  std::string out;
  for (const auto& line : lines) {
    if (!out.empty()) {
      out += "; ";
    }
    out += line;
  }
  return out;
}
}  // namespace

std::string ComposeText(const TransactionText& text) {
  std::string joined;
  for (const auto* part : {&text.note, &text.merchant}) {
    if (part->empty()) {
      continue;
    }
    if (!joined.empty()) {
      joined.push_back(' ');
    }
    joined += *part;
  }
  return std::string(TrimWhitespace(joined));
}

CategorizationService::CategorizationService(std::shared_ptr<const Lexicon> lexicon, FrequencyStore& store,
                                             HybridOptions options)
    : store_(store),
      predictor_(std::move(lexicon), store, options),
      trainer_(store, TrainerOptions{options.tokenize}) {}

std::optional<Suggestion> CategorizationService::Predict(std::string_view text) const {
  const auto trimmed = TrimWhitespace(text);
  if (trimmed.empty()) {
    return std::nullopt;
  }

  const auto result = predictor_.Predict(trimmed);
  Suggestion s;
  s.category = result.category;
  s.confidence = result.confidence;
  s.source = result.source;
  s.explanation = JoinLines(result.explanation);
  GetLogger()->debug("predict \"{}\" -> {} ({}, {:.3f})", trimmed, s.category.value_or("<none>"),
                     ToString(s.source), s.confidence);
  return s;
}

std::optional<Suggestion> CategorizationService::Predict(const TransactionText& text) const {
  return Predict(ComposeText(text));
}

TrainStats CategorizationService::Train(const std::string& transaction_id, const std::string& text,
                                        const std::string& category, double weight) {
  TrainingInput input;
  input.transaction_id = transaction_id;
  input.text = text;
  input.category = category;
  input.weight = weight;
  return trainer_.Train(input);
}

TrainStats CategorizationService::TrainOnTransaction(const Transaction& tx) {
  const auto text = ComposeText(tx.text);
  if (tx.category.empty() || text.empty()) {
    GetLogger()->debug("transaction {} not trained: missing category or text", tx.id);
    TrainStats skipped;
    skipped.skipped = true;
    return skipped;
  }
  return Train(tx.id, text, tx.category);
}

void CategorizationService::ResetModel() {
  store_.Reset();
}

}  // namespace spendcat
