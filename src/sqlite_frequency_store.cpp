#include "spendcat/frequency_store.hpp"

#include <exception>
#include <memory>

#include <sqlite3.h>

#include "spendcat/logging.hpp"

namespace spendcat {

namespace {
constexpr const char* kVocabSizeKey = "vocab_size";

struct StatementDeleter {
  void operator()(sqlite3_stmt* stmt) const {
    if (stmt) {
      sqlite3_finalize(stmt);
    }
  }
};

using StatementPtr = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

[[noreturn]] void Fail(sqlite3* db, const std::string& what) {
  throw StoreError(what + ": " + (db ? sqlite3_errmsg(db) : "no database handle"));
}

StatementPtr Prepare(sqlite3* db, const std::string& sql) {
  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &raw, nullptr) != SQLITE_OK) {
    Fail(db, "failed to prepare statement");
  }
  return StatementPtr(raw);
}

void BindText(sqlite3* db, sqlite3_stmt* stmt, int index, const std::string& value) {
  if (sqlite3_bind_text(stmt, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT) !=
      SQLITE_OK) {
    Fail(db, "failed to bind text parameter");
  }
}

void BindInt64(sqlite3* db, sqlite3_stmt* stmt, int index, std::int64_t value) {
  if (sqlite3_bind_int64(stmt, index, static_cast<sqlite3_int64>(value)) != SQLITE_OK) {
    Fail(db, "failed to bind integer parameter");
  }
}

void StepDone(sqlite3* db, sqlite3_stmt* stmt, const char* what) {
  if (sqlite3_step(stmt) != SQLITE_DONE) {
    Fail(db, what);
  }
}

std::string ColumnText(sqlite3_stmt* stmt, int col) {
  const auto* raw = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
  return raw ? std::string(raw) : std::string();
}

void UpsertWord(sqlite3* db, const std::string& word, const std::string& category, std::int64_t amount) {
  auto stmt = Prepare(db,
                      "INSERT INTO word_frequency (word, category, count) VALUES (?1, ?2, ?3) "
                      "ON CONFLICT(word, category) DO UPDATE SET count = count + excluded.count;");
  BindText(db, stmt.get(), 1, word);
  BindText(db, stmt.get(), 2, category);
  BindInt64(db, stmt.get(), 3, amount);
  StepDone(db, stmt.get(), "failed to increment word count");
}

void UpsertCategoryTotals(sqlite3* db, const std::string& category, std::int64_t token_mass) {
  auto stmt = Prepare(db,
                      "INSERT INTO category_totals (category, total_words, doc_count) VALUES (?1, ?2, 1) "
                      "ON CONFLICT(category) DO UPDATE SET "
                      "total_words = total_words + excluded.total_words, doc_count = doc_count + 1;");
  BindText(db, stmt.get(), 1, category);
  BindInt64(db, stmt.get(), 2, token_mass);
  StepDone(db, stmt.get(), "failed to increment category totals");
}

void AddToVocabSize(sqlite3* db, std::int64_t delta) {
  auto stmt = Prepare(db,
                      "INSERT INTO model_meta (key, value) VALUES (?1, ?2) "
                      "ON CONFLICT(key) DO UPDATE SET "
                      "value = CAST(value AS INTEGER) + CAST(excluded.value AS INTEGER);");
  BindText(db, stmt.get(), 1, kVocabSizeKey);
  BindInt64(db, stmt.get(), 2, delta);
  StepDone(db, stmt.get(), "failed to increment vocab size");
}

void InsertExample(sqlite3* db, const TrainingExample& example) {
  auto stmt = Prepare(db,
                      "INSERT INTO training_examples (id, transaction_id, text, category, created_at) "
                      "VALUES (?1, ?2, ?3, ?4, ?5);");
  BindText(db, stmt.get(), 1, example.id);
  BindText(db, stmt.get(), 2, example.transaction_id);
  BindText(db, stmt.get(), 3, example.text);
  BindText(db, stmt.get(), 4, example.category);
  BindText(db, stmt.get(), 5, example.created_at);
  StepDone(db, stmt.get(), "failed to insert training example");
}
}  // namespace

SqliteFrequencyStore::SqliteFrequencyStore(const std::string& path, SqliteStoreOptions options)
    : path_(path) {
  const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
  if (sqlite3_open_v2(path.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
    sqlite3_close(db_);
    db_ = nullptr;
    throw StoreError("can't open database " + path + ": " + msg);
  }
  sqlite3_extended_result_codes(db_, 1);
  sqlite3_busy_timeout(db_, options.busy_timeout_ms);

  try {
    InitSchema();
  } catch (...) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteFrequencyStore::~SqliteFrequencyStore() {
  if (db_) {
    sqlite3_close(db_);
  }
}

void SqliteFrequencyStore::Exec(const char* sql) {
  char* error_msg = nullptr;
  if (sqlite3_exec(db_, sql, nullptr, nullptr, &error_msg) != SQLITE_OK) {
    std::string msg = error_msg ? error_msg : "unknown error";
    sqlite3_free(error_msg);
    throw StoreError("sqlite exec failed: " + msg);
  }
}

void SqliteFrequencyStore::InitSchema() {
  Exec(
      "CREATE TABLE IF NOT EXISTS training_examples ("
      "  id TEXT PRIMARY KEY,"
      "  transaction_id TEXT,"
      "  text TEXT,"
      "  category TEXT,"
      "  created_at TEXT);"
      "CREATE TABLE IF NOT EXISTS word_frequency ("
      "  word TEXT NOT NULL,"
      "  category TEXT NOT NULL,"
      "  count INTEGER NOT NULL DEFAULT 0,"
      "  PRIMARY KEY (word, category));"
      "CREATE TABLE IF NOT EXISTS category_totals ("
      "  category TEXT PRIMARY KEY,"
      "  total_words INTEGER NOT NULL DEFAULT 0,"
      "  doc_count INTEGER NOT NULL DEFAULT 0);"
      "CREATE TABLE IF NOT EXISTS model_meta ("
      "  key TEXT PRIMARY KEY,"
      "  value TEXT);");
  GetLogger()->debug("frequency store ready at {}", path_);
}

void SqliteFrequencyStore::IncrementWord(const std::string& word, const std::string& category,
                                         std::int64_t amount) {
  UpsertWord(db_, word, category, amount);
}

void SqliteFrequencyStore::IncrementCategoryTotals(const std::string& category, std::int64_t token_mass) {
  UpsertCategoryTotals(db_, category, token_mass);
}

void SqliteFrequencyStore::SetVocabSize(std::int64_t n) {
  auto stmt = Prepare(db_,
                      "INSERT INTO model_meta (key, value) VALUES (?1, ?2) "
                      "ON CONFLICT(key) DO UPDATE SET value = excluded.value;");
  BindText(db_, stmt.get(), 1, kVocabSizeKey);
  BindInt64(db_, stmt.get(), 2, n);
  StepDone(db_, stmt.get(), "failed to set vocab size");
}

void SqliteFrequencyStore::IncrementVocabSize(std::int64_t delta) { AddToVocabSize(db_, delta); }

std::int64_t SqliteFrequencyStore::GetVocabSize() const {
  auto stmt = Prepare(db_, "SELECT CAST(value AS INTEGER) FROM model_meta WHERE key = ?1 LIMIT 1;");
  BindText(db_, stmt.get(), 1, kVocabSizeKey);
  const int rc = sqlite3_step(stmt.get());
  if (rc == SQLITE_ROW) {
    return static_cast<std::int64_t>(sqlite3_column_int64(stmt.get(), 0));
  }
  if (rc != SQLITE_DONE) {
    Fail(db_, "failed to read vocab size");
  }
  return 0;
}

std::vector<WordCount> SqliteFrequencyStore::LookupWords(const std::set<std::string>& words) const {
  std::vector<WordCount> out;
  if (words.empty()) {
    return out;
  }

  std::string sql = "SELECT word, category, count FROM word_frequency WHERE word IN (";
  for (std::size_t i = 0; i < words.size(); ++i) {
    sql += i == 0 ? "?" : ", ?";
  }
  sql += ") ORDER BY word, category;";

  auto stmt = Prepare(db_, sql);
  int index = 1;
  for (const auto& w : words) {
    BindText(db_, stmt.get(), index++, w);
  }

  int rc = 0;
  while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
    WordCount row;
    row.word = ColumnText(stmt.get(), 0);
    row.category = ColumnText(stmt.get(), 1);
    row.count = static_cast<std::int64_t>(sqlite3_column_int64(stmt.get(), 2));
    out.push_back(std::move(row));
  }
  if (rc != SQLITE_DONE) {
    Fail(db_, "failed to look up word counts");
  }
  return out;
}

std::vector<CategoryTotals> SqliteFrequencyStore::ListCategoryTotals() const {
  auto stmt = Prepare(db_,
                      "SELECT category, total_words, doc_count FROM category_totals "
                      "ORDER BY category COLLATE BINARY;");
  std::vector<CategoryTotals> out;
  int rc = 0;
  while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
    CategoryTotals row;
    row.category = ColumnText(stmt.get(), 0);
    row.total_words = static_cast<std::int64_t>(sqlite3_column_int64(stmt.get(), 1));
    row.doc_count = static_cast<std::int64_t>(sqlite3_column_int64(stmt.get(), 2));
    out.push_back(std::move(row));
  }
  if (rc != SQLITE_DONE) {
    Fail(db_, "failed to list category totals");
  }
  return out;
}

void SqliteFrequencyStore::InsertTrainingExample(const TrainingExample& example) { InsertExample(db_, example); }

std::size_t SqliteFrequencyStore::CountTrainingExamples() const {
  auto stmt = Prepare(db_, "SELECT COUNT(*) FROM training_examples;");
  if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
    Fail(db_, "failed to count training examples");
  }
  return static_cast<std::size_t>(sqlite3_column_int64(stmt.get(), 0));
}

void SqliteFrequencyStore::RunInTransaction(const std::function<void()>& body) {
  std::lock_guard<std::mutex> lock(tx_mu_);
  Exec("BEGIN IMMEDIATE;");
  try {
    body();
    Exec("COMMIT;");
  } catch (const std::exception&) {
    char* rollback_error = nullptr;
    if (sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, &rollback_error) != SQLITE_OK) {
      GetLogger()->error("rollback on {} failed: {}", path_, rollback_error ? rollback_error : "unknown error");
    }
    sqlite3_free(rollback_error);
    throw;
  }
}

std::int64_t SqliteFrequencyStore::ApplyTraining(const TrainingExample& example,
                                                 const std::map<std::string, std::int64_t>& word_counts,
                                                 std::int64_t token_mass) {
  std::int64_t new_words = 0;
  RunInTransaction([&] {
    // BEGIN IMMEDIATE holds the write lock, so no other writer can add one of
    // these words between the existence check and the upsert.
    auto exists = Prepare(db_, "SELECT EXISTS(SELECT 1 FROM word_frequency WHERE word = ?1);");
    for (const auto& [word, count] : word_counts) {
      BindText(db_, exists.get(), 1, word);
      if (sqlite3_step(exists.get()) != SQLITE_ROW) {
        Fail(db_, "failed to check word presence");
      }
      if (sqlite3_column_int(exists.get(), 0) == 0) {
        ++new_words;
      }
      if (sqlite3_reset(exists.get()) != SQLITE_OK) {
        Fail(db_, "failed to reset word presence check");
      }
      UpsertWord(db_, word, example.category, count);
    }
    UpsertCategoryTotals(db_, example.category, token_mass);
    if (new_words > 0) {
      AddToVocabSize(db_, new_words);
    }
    InsertExample(db_, example);
  });
  return new_words;
}

void SqliteFrequencyStore::Reset() {
  RunInTransaction([this] {
    Exec(
        "DELETE FROM word_frequency;"
        "DELETE FROM category_totals;"
        "DELETE FROM model_meta;"
        "DELETE FROM training_examples;");
  });
  GetLogger()->warn("model reset: all counters and training examples removed from {}", path_);
}

}  // namespace spendcat
