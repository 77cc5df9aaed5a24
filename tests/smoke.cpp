#include <cassert>
#include <filesystem>
#include <fstream>

#include <nlohmann/json.hpp>

#include "spendcat/formats.hpp"
#include "spendcat/frequency_store.hpp"
#include "spendcat/service.hpp"

int main() {
  using namespace spendcat;
  namespace fs = std::filesystem;

  const auto db = fs::temp_directory_path() / "spendcat_smoke.db";
  const auto snapshot = fs::temp_directory_path() / "spendcat_smoke.json";
  fs::remove(db);

  {
    SqliteFrequencyStore store(db.string());
    CategorizationService service(Lexicon::Default(), store);
    service.Train("t1", "chaayos evening chai", "food");
    service.Train("t2", "chaayos chai", "food");
    service.Train("t3", "reliance fresh", "groceries");
  }

  SqliteFrequencyStore store(db.string());
  CategorizationService service(Lexicon::Default(), store);
  auto suggestion = service.Predict("Chaayos");
  assert(suggestion && suggestion->category && *suggestion->category == "food");

  SaveModelJson(store, snapshot.string(), {"chaayos", "fresh"});
  std::ifstream in(snapshot);
  nlohmann::json j;
  in >> j;
  assert(j["vocab_size"] == 5);
  assert(j["training_examples"] == 3);
  assert(j["categories"].size() == 2);
  assert(j["categories"][0]["category"] == "food");
  assert(j["categories"][0]["doc_count"] == 2);
  assert(j["words"]["chaayos"]["food"] == 2);
  assert(j["words"]["fresh"]["groceries"] == 1);

  fs::remove(db);
  fs::remove(snapshot);
  return 0;
}
