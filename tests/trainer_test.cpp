#include <cassert>
#include <cstdint>
#include <filesystem>
#include <limits>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "spendcat/frequency_store.hpp"
#include "spendcat/trainer.hpp"

namespace {
using namespace spendcat;

std::int64_t CountOf(const FrequencyStore& store, const std::string& word, const std::string& category) {
  for (const auto& row : store.LookupWords({word})) {
    if (row.category == category) {
      return row.count;
    }
  }
  return 0;
}

CategoryTotals TotalsOf(const FrequencyStore& store, const std::string& category) {
  for (const auto& row : store.ListCategoryTotals()) {
    if (row.category == category) {
      return row;
    }
  }
  return {};
}

void CheckTrainer(FrequencyStore& store) {
  NaiveBayesTrainer trainer(store);

  constexpr int kRounds = 5;
  for (int i = 0; i < kRounds; ++i) {
    auto stats = trainer.Train({"t1", "uber ride", "transport"});
    assert(!stats.skipped);
    assert(stats.tokens == 2);
    assert(stats.new_words == (i == 0 ? 2u : 0u));
  }
  assert(TotalsOf(store, "transport").doc_count == kRounds);
  assert(TotalsOf(store, "transport").total_words == 2 * kRounds);
  assert(CountOf(store, "uber", "transport") == kRounds);
  assert(store.GetVocabSize() == 2);
  assert(store.CountTrainingExamples() == kRounds);

  // a known word under a second category is not a new vocabulary entry
  auto moved = trainer.Train({"t2", "Uber Eats", "food"});
  assert(moved.new_words == 1);
  assert(store.GetVocabSize() == 3);
  assert(CountOf(store, "uber", "food") == 1);

  // weighted multiplicity
  auto weighted = trainer.Train({"t3", "pizza pizza dinner", "meals", 3.0});
  assert(weighted.weighted_mass == 9);
  assert(CountOf(store, "pizza", "meals") == 6);
  assert(CountOf(store, "dinner", "meals") == 3);
  assert(TotalsOf(store, "meals").total_words == 9);
  assert(TotalsOf(store, "meals").doc_count == 1);

  // fractional and non-positive weights are coerced, not rejected
  trainer.Train({"t4", "metro card", "transport", -2.0});
  assert(CountOf(store, "metro", "transport") == 1);
  trainer.Train({"t5", "metro card", "transport", 1.6});
  assert(CountOf(store, "metro", "transport") == 3);

  const auto before = store.CountTrainingExamples();
  auto skipped = trainer.Train({"t6", "!! ?? a", "food"});
  assert(skipped.skipped);
  assert(store.CountTrainingExamples() == before);

  bool threw = false;
  try {
    trainer.Train({"t7", "uber", ""});
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);

  // vocabulary never shrinks across a run of training calls
  std::int64_t last = store.GetVocabSize();
  const std::vector<std::string> texts = {"rent march", "rent april", "netflix", "uber", "apollo pharmacy"};
  for (const auto& text : texts) {
    trainer.Train({"seq", text, "misc"});
    assert(store.GetVocabSize() >= last);
    last = store.GetVocabSize();
  }
}
// Delegates to an in-memory store but can refuse the next training event.
class FlakyStore final : public FrequencyStore {
 public:
  void IncrementWord(const std::string& word, const std::string& category, std::int64_t amount) override {
    inner_.IncrementWord(word, category, amount);
  }
  void IncrementCategoryTotals(const std::string& category, std::int64_t token_mass) override {
    inner_.IncrementCategoryTotals(category, token_mass);
  }
  void SetVocabSize(std::int64_t n) override { inner_.SetVocabSize(n); }
  void IncrementVocabSize(std::int64_t delta) override { inner_.IncrementVocabSize(delta); }
  std::int64_t GetVocabSize() const override { return inner_.GetVocabSize(); }
  std::vector<WordCount> LookupWords(const std::set<std::string>& words) const override {
    return inner_.LookupWords(words);
  }
  std::vector<CategoryTotals> ListCategoryTotals() const override { return inner_.ListCategoryTotals(); }
  void InsertTrainingExample(const TrainingExample& example) override { inner_.InsertTrainingExample(example); }
  std::size_t CountTrainingExamples() const override { return inner_.CountTrainingExamples(); }
  std::int64_t ApplyTraining(const TrainingExample& example, const std::map<std::string, std::int64_t>& word_counts,
                             std::int64_t token_mass) override {
    if (fail_next_) {
      fail_next_ = false;
      throw StoreError("disk full");
    }
    return inner_.ApplyTraining(example, word_counts, token_mass);
  }
  void Reset() override { inner_.Reset(); }

  void FailNext() { fail_next_ = true; }

 private:
  MemoryFrequencyStore inner_;
  bool fail_next_ = false;
};

void CheckFailedTrainingLeavesNoTrace() {
  FlakyStore store;
  NaiveBayesTrainer trainer(store);

  store.FailNext();
  bool threw = false;
  try {
    trainer.Train({"t1", "chaayos", "food"});
  } catch (const StoreError&) {
    threw = true;
  }
  assert(threw);
  assert(store.GetVocabSize() == 0);
  assert(store.LookupWords({"chaayos"}).empty());
  assert(store.ListCategoryTotals().empty());
  assert(store.CountTrainingExamples() == 0);

  auto retried = trainer.Train({"t1", "chaayos", "food"});
  assert(retried.new_words == 1);
  assert(store.GetVocabSize() == 1);
  assert(CountOf(store, "chaayos", "food") == 1);
  assert(store.CountTrainingExamples() == 1);
}

// Trainers on separate connections race to introduce the same word under
// different categories; the vocabulary must still count it once.
void CheckConcurrentTrainers() {
  constexpr int kTrainers = 4;
  constexpr int kWords = 20;
  const auto path = std::filesystem::temp_directory_path() / "spendcat_trainer_concurrency.db";
  std::filesystem::remove(path);
  {
    std::vector<std::unique_ptr<SqliteFrequencyStore>> stores;
    for (int t = 0; t < kTrainers; ++t) {
      stores.push_back(std::make_unique<SqliteFrequencyStore>(path.string()));
    }
    std::vector<std::thread> workers;
    for (int t = 0; t < kTrainers; ++t) {
      workers.emplace_back([&stores, t] {
        NaiveBayesTrainer trainer(*stores[t]);
        const std::string category = "category" + std::to_string(t);
        for (int i = 0; i < kWords; ++i) {
          trainer.Train({"c" + std::to_string(i), "chaayos" + std::to_string(i), category});
        }
      });
    }
    for (auto& w : workers) {
      w.join();
    }
    assert(stores[0]->GetVocabSize() == kWords);
    assert(stores[0]->LookupWords({"chaayos0"}).size() == static_cast<std::size_t>(kTrainers));
    assert(stores[0]->CountTrainingExamples() == static_cast<std::size_t>(kTrainers * kWords));
  }
  std::filesystem::remove(path);
}
}  // namespace

int main() {
  assert(CoerceWeight(0.0) == 1);
  assert(CoerceWeight(-4.0) == 1);
  assert(CoerceWeight(2.4) == 2);
  assert(CoerceWeight(2.6) == 3);
  assert(CoerceWeight(1.5) == 2);
  assert(CoerceWeight(std::numeric_limits<double>::quiet_NaN()) == 1);
  assert(CoerceWeight(std::numeric_limits<double>::infinity()) == 1);

  {
    MemoryFrequencyStore store;
    CheckTrainer(store);
  }
  {
    SqliteFrequencyStore store(":memory:");
    CheckTrainer(store);
  }
  CheckFailedTrainingLeavesNoTrace();
  CheckConcurrentTrainers();
  return 0;
}
