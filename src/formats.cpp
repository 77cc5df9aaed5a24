#include "spendcat/formats.hpp"

#include <fstream>
#include <stdexcept>
#include <utility>

namespace spendcat {

nlohmann::json ModelToJson(const FrequencyStore& store, const std::set<std::string>& words) {
  nlohmann::json j;
  j["vocab_size"] = store.GetVocabSize();
  j["training_examples"] = store.CountTrainingExamples();

  nlohmann::json categories = nlohmann::json::array();
  for (const auto& row : store.ListCategoryTotals()) {
    categories.push_back({
        {"category", row.category},
        {"total_words", row.total_words},
        {"doc_count", row.doc_count},
    });
  }
  j["categories"] = std::move(categories);

  nlohmann::json words_json = nlohmann::json::object();
  for (const auto& row : store.LookupWords(words)) {
    words_json[row.word][row.category] = row.count;
  }
  j["words"] = std::move(words_json);
  return j;
}

void SaveModelJson(const FrequencyStore& store, const std::string& path, const std::set<std::string>& words) {
  const auto j = ModelToJson(store, words);
  std::ofstream out(path);
  if (!out) {
    throw std::runtime_error("failed to create model snapshot: " + path);
  }
  out << j.dump(2);
}

}  // namespace spendcat
