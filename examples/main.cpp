#include <iostream>
#include <vector>

#include "spendcat/formats.hpp"
#include "spendcat/frequency_store.hpp"
#include "spendcat/service.hpp"

int main() {
  using namespace spendcat;

  MemoryFrequencyStore store;
  CategorizationService service(Lexicon::Default(), store);

  const std::vector<Transaction> history = {
      {"t1", {"weekly groceries", "Reliance Fresh"}, "groceries"},
      {"t2", {"", "reliance fresh vegetables"}, "groceries"},
      {"t3", {"evening chai", "chaayos"}, "food"},
      {"t4", {"", "Uber trip"}, "transport"},
  };
  for (const auto& tx : history) {
    service.TrainOnTransaction(tx);
  }

  for (const char* text : {"Reliance Fresh", "Uber ride home", "chaayos", "something new"}) {
    auto suggestion = service.Predict(text);
    if (!suggestion) {
      continue;
    }
    std::cout << text << " -> " << suggestion->category.value_or("(none)") << " [" << ToString(suggestion->source)
              << ", " << suggestion->confidence << "]\n  " << suggestion->explanation << '\n';
  }

  std::cout << ModelToJson(store, {"reliance", "fresh", "uber"}).dump(2) << '\n';
  return 0;
}
