#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

struct sqlite3;

namespace spendcat {

// Raised for any failure of the backing store. The engine never retries.
class StoreError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

struct WordCount {
  std::string word;
  std::string category;
  std::int64_t count = 0;
};

struct CategoryTotals {
  std::string category;
  std::int64_t total_words = 0;
  std::int64_t doc_count = 0;
};

struct TrainingExample {
  std::string id;
  std::string transaction_id;
  std::string text;
  std::string category;
  std::string created_at;
};

// Owner of every persisted counter. Single-counter mutations are atomic
// upserts and a whole training event goes through ApplyTraining; the
// predictor and trainer only read and write through this interface.
class FrequencyStore {
 public:
  virtual ~FrequencyStore() = default;

  virtual void IncrementWord(const std::string& word, const std::string& category,
                             std::int64_t amount = 1) = 0;
  virtual void IncrementCategoryTotals(const std::string& category, std::int64_t token_mass) = 0;

  virtual void SetVocabSize(std::int64_t n) = 0;
  virtual void IncrementVocabSize(std::int64_t delta) = 0;
  [[nodiscard]] virtual std::int64_t GetVocabSize() const = 0;

  [[nodiscard]] virtual std::vector<WordCount> LookupWords(const std::set<std::string>& words) const = 0;

  // Ordered by category name, ascending.
  [[nodiscard]] virtual std::vector<CategoryTotals> ListCategoryTotals() const = 0;

  virtual void InsertTrainingExample(const TrainingExample& example) = 0;
  [[nodiscard]] virtual std::size_t CountTrainingExamples() const = 0;

  // Records one training event as a single unit of work: the audit row, each
  // word count under `example.category`, the category totals (one document,
  // `token_mass` words) and the vocabulary growth. Either all of it is applied
  // or none of it is. Returns the number of words that were absent under every
  // category beforehand, which is also what VocabSize grew by.
  virtual std::int64_t ApplyTraining(const TrainingExample& example,
                                     const std::map<std::string, std::int64_t>& word_counts,
                                     std::int64_t token_mass) = 0;

  // Drops all counters, the vocabulary size and the audit trail.
  virtual void Reset() = 0;
};

struct SqliteStoreOptions {
  int busy_timeout_ms = 5000;
};

class SqliteFrequencyStore final : public FrequencyStore {
 public:
  // `path` may be ":memory:". Creates the schema if needed.
  explicit SqliteFrequencyStore(const std::string& path, SqliteStoreOptions options = {});
  ~SqliteFrequencyStore() override;

  SqliteFrequencyStore(const SqliteFrequencyStore&) = delete;
  SqliteFrequencyStore& operator=(const SqliteFrequencyStore&) = delete;

  void IncrementWord(const std::string& word, const std::string& category,
                     std::int64_t amount = 1) override;
  void IncrementCategoryTotals(const std::string& category, std::int64_t token_mass) override;

  void SetVocabSize(std::int64_t n) override;
  void IncrementVocabSize(std::int64_t delta) override;
  [[nodiscard]] std::int64_t GetVocabSize() const override;

  [[nodiscard]] std::vector<WordCount> LookupWords(const std::set<std::string>& words) const override;
  [[nodiscard]] std::vector<CategoryTotals> ListCategoryTotals() const override;

  void InsertTrainingExample(const TrainingExample& example) override;
  [[nodiscard]] std::size_t CountTrainingExamples() const override;

  std::int64_t ApplyTraining(const TrainingExample& example, const std::map<std::string, std::int64_t>& word_counts,
                             std::int64_t token_mass) override;

  void Reset() override;

  [[nodiscard]] const std::string& Path() const { return path_; }

 private:
  void InitSchema();
  void Exec(const char* sql);
  // Runs `body` between BEGIN IMMEDIATE and COMMIT, rolling back if it throws.
  void RunInTransaction(const std::function<void()>& body);

  std::string path_;
  sqlite3* db_ = nullptr;
  // One open transaction per connection at a time.
  std::mutex tx_mu_;
};

// Process-local store, mainly for tests and ephemeral sessions.
class MemoryFrequencyStore final : public FrequencyStore {
 public:
  void IncrementWord(const std::string& word, const std::string& category,
                     std::int64_t amount = 1) override;
  void IncrementCategoryTotals(const std::string& category, std::int64_t token_mass) override;

  void SetVocabSize(std::int64_t n) override;
  void IncrementVocabSize(std::int64_t delta) override;
  [[nodiscard]] std::int64_t GetVocabSize() const override;

  [[nodiscard]] std::vector<WordCount> LookupWords(const std::set<std::string>& words) const override;
  [[nodiscard]] std::vector<CategoryTotals> ListCategoryTotals() const override;

  void InsertTrainingExample(const TrainingExample& example) override;
  [[nodiscard]] std::size_t CountTrainingExamples() const override;

  std::int64_t ApplyTraining(const TrainingExample& example, const std::map<std::string, std::int64_t>& word_counts,
                             std::int64_t token_mass) override;

  void Reset() override;

 private:
  [[nodiscard]] bool HasWordLocked(const std::string& word) const;
  [[nodiscard]] bool HasExampleLocked(const std::string& id) const;

  mutable std::mutex mu_;
  std::map<std::pair<std::string, std::string>, std::int64_t> words_;
  std::map<std::string, CategoryTotals> totals_;
  std::int64_t vocab_size_ = 0;
  std::vector<TrainingExample> examples_;
};

}  // namespace spendcat
