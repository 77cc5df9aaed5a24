#include <cassert>
#include <cmath>
#include <string>

#include "spendcat/frequency_store.hpp"
#include "spendcat/service.hpp"

namespace {
using namespace spendcat;

void CheckService(FrequencyStore& store) {
  CategorizationService service(Lexicon::Default(), store);

  assert(!service.Predict(""));
  assert(!service.Predict("   "));
  assert(!service.Predict("\v"));
  assert(!service.Predict(" \f\t\r\n"));
  assert(!service.Predict(TransactionText{"", ""}));

  auto rule = service.Predict("Uber ride");
  assert(rule && rule->category && *rule->category == "transport");
  assert(rule->source == SuggestionSource::kRule);
  assert(rule->confidence == 1.0);
  assert(rule->explanation.find("exact: uber -> transport") != std::string::npos);
  assert(rule->explanation.find("; ") != std::string::npos);

  auto unknown = service.Predict("Reliance Fresh");
  assert(unknown && !unknown->category);
  assert(unknown->source == SuggestionSource::kNone);

  for (int i = 0; i < 3; ++i) {
    Transaction tx{"g" + std::to_string(i), {"weekly", "Reliance Fresh"}, "groceries"};
    auto stats = service.TrainOnTransaction(tx);
    assert(!stats.skipped);
  }
  auto learned = service.Predict(TransactionText{"", "reliance fresh"});
  assert(learned && learned->category && *learned->category == "groceries");
  assert(learned->source == SuggestionSource::kNb);
  assert(std::fabs(learned->confidence - 1.0) < 1e-9);

  const auto examples = store.CountTrainingExamples();
  assert(service.TrainOnTransaction({"x1", {"lunch", ""}, ""}).skipped);
  assert(service.TrainOnTransaction({"x2", {"", ""}, "food"}).skipped);
  assert(store.CountTrainingExamples() == examples);

  service.Train("g9", "reliance fresh", "groceries", 2.0);
  assert(store.CountTrainingExamples() == examples + 1);

  service.ResetModel();
  assert(store.CountTrainingExamples() == 0);
  assert(store.GetVocabSize() == 0);
  auto forgotten = service.Predict("Reliance Fresh");
  assert(forgotten && !forgotten->category);
}
}  // namespace

int main() {
  assert(ComposeText({"", "Uber"}) == "Uber");
  assert(ComposeText({"note", ""}) == "note");
  assert(ComposeText({"", ""}).empty());
  assert(ComposeText({"\v", "\f"}).empty());
  assert(ComposeText({"  lunch ", "Cafe Coffee Day "}) == "lunch  Cafe Coffee Day");

  {
    MemoryFrequencyStore store;
    CheckService(store);
  }
  {
    SqliteFrequencyStore store(":memory:");
    CheckService(store);
  }
  return 0;
}
