#include "spendcat/frequency_store.hpp"

#include <algorithm>

namespace spendcat {

void MemoryFrequencyStore::IncrementWord(const std::string& word, const std::string& category,
                                         std::int64_t amount) {
  std::lock_guard<std::mutex> lock(mu_);
  words_[{word, category}] += amount;
}

void MemoryFrequencyStore::IncrementCategoryTotals(const std::string& category, std::int64_t token_mass) {
  std::lock_guard<std::mutex> lock(mu_);
  auto& row = totals_[category];
  row.category = category;
  row.total_words += token_mass;
  row.doc_count += 1;
}

void MemoryFrequencyStore::SetVocabSize(std::int64_t n) {
  std::lock_guard<std::mutex> lock(mu_);
  vocab_size_ = n;
}

void MemoryFrequencyStore::IncrementVocabSize(std::int64_t delta) {
  std::lock_guard<std::mutex> lock(mu_);
  vocab_size_ += delta;
}

std::int64_t MemoryFrequencyStore::GetVocabSize() const {
  std::lock_guard<std::mutex> lock(mu_);
  return vocab_size_;
}

std::vector<WordCount> MemoryFrequencyStore::LookupWords(const std::set<std::string>& words) const {
  std::lock_guard<std::mutex> lock(mu_);
  std::vector<WordCount> out;
  for (const auto& w : words) {
    for (auto it = words_.lower_bound({w, std::string()}); it != words_.end() && it->first.first == w; ++it) {
      out.push_back({it->first.first, it->first.second, it->second});
    }
  }
  return out;
}

std::vector<CategoryTotals> MemoryFrequencyStore::ListCategoryTotals() const {
  std::lock_guard<std::mutex> lock(mu_);
  std::vector<CategoryTotals> out;
  out.reserve(totals_.size());
  for (const auto& [category, row] : totals_) {
    out.push_back(row);
  }
  return out;
}

bool MemoryFrequencyStore::HasWordLocked(const std::string& word) const {
  auto it = words_.lower_bound({word, std::string()});
  return it != words_.end() && it->first.first == word;
}

bool MemoryFrequencyStore::HasExampleLocked(const std::string& id) const {
  return std::any_of(examples_.begin(), examples_.end(), [&](const TrainingExample& e) { return e.id == id; });
}

void MemoryFrequencyStore::InsertTrainingExample(const TrainingExample& example) {
  std::lock_guard<std::mutex> lock(mu_);
  if (HasExampleLocked(example.id)) {
    throw StoreError("duplicate training example id: " + example.id);
  }
  examples_.push_back(example);
}

std::size_t MemoryFrequencyStore::CountTrainingExamples() const {
  std::lock_guard<std::mutex> lock(mu_);
  return examples_.size();
}

std::int64_t MemoryFrequencyStore::ApplyTraining(const TrainingExample& example,
                                                 const std::map<std::string, std::int64_t>& word_counts,
                                                 std::int64_t token_mass) {
  std::lock_guard<std::mutex> lock(mu_);
  // Validate before touching anything so a rejected event leaves no trace.
  if (HasExampleLocked(example.id)) {
    throw StoreError("duplicate training example id: " + example.id);
  }
  examples_.reserve(examples_.size() + 1);

  std::int64_t new_words = 0;
  for (const auto& [word, count] : word_counts) {
    if (!HasWordLocked(word)) {
      ++new_words;
    }
    words_[{word, example.category}] += count;
  }
  auto& row = totals_[example.category];
  row.category = example.category;
  row.total_words += token_mass;
  row.doc_count += 1;
  vocab_size_ += new_words;
  examples_.push_back(example);
  return new_words;
}

void MemoryFrequencyStore::Reset() {
  std::lock_guard<std::mutex> lock(mu_);
  words_.clear();
  totals_.clear();
  vocab_size_ = 0;
  examples_.clear();
}

}  // namespace spendcat
