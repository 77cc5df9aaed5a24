#include "spendcat/lexicon.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>

#include <nlohmann/json.hpp>

namespace spendcat {

namespace {
std::string ToLowerAscii(std::string s) {
  for (char& c : s) {
    if (c >= 'A' && c <= 'Z') {
      c = static_cast<char>(c - 'A' + 'a');
    }
  }
  return s;
}

std::shared_ptr<const Lexicon> ParseLexicon(const nlohmann::ordered_json& j) {
  if (!j.is_object()) {
    throw std::runtime_error("lexicon must be a JSON object of category -> keyword list");
  }

  std::vector<LexiconEntry> entries;
  entries.reserve(j.size());
  for (auto it = j.begin(); it != j.end(); ++it) {
    if (!it.value().is_array()) {
      throw std::runtime_error("lexicon category '" + it.key() + "' must map to an array");
    }
    LexiconEntry entry;
    entry.category = it.key();
    for (const auto& kw : it.value()) {
      if (!kw.is_string()) {
        throw std::runtime_error("lexicon category '" + it.key() + "' has a non-string keyword");
      }
      auto keyword = ToLowerAscii(kw.get<std::string>());
      if (!keyword.empty()) {
        entry.keywords.push_back(std::move(keyword));
      }
    }
    entries.push_back(std::move(entry));
  }
  return std::make_shared<const Lexicon>(std::move(entries));
}
}  // namespace

Lexicon::Lexicon(std::vector<LexiconEntry> entries) : entries_(std::move(entries)) {}

bool Lexicon::HasCategory(const std::string& category) const {
  return std::any_of(entries_.begin(), entries_.end(),
                     [&](const LexiconEntry& e) { return e.category == category; });
}

std::shared_ptr<const Lexicon> Lexicon::Default() {
  static const std::shared_ptr<const Lexicon> kDefault = std::make_shared<const Lexicon>(
      std::vector<LexiconEntry>{
          {"food",
           {"zomato", "swiggy", "dominos", "pizza", "kfc", "mcdonalds", "burger", "cafe",
            "restaurant", "meal", "lunch", "dinner", "biryani"}},
          {"transport",
           {"uber", "ola", "rapido", "taxi", "cab", "bus", "metro", "fuel", "petrol", "diesel",
            "bike", "train"}},
          {"shopping",
           {"amazon", "flipkart", "myntra", "ajio", "meesho", "dmart", "bigbasket", "nykaa",
            "zara"}},
          {"bills",
           {"electricity", "water", "gas", "recharge", "airtel", "jio", "broadband", "wifi",
            "dth", "bill", "rent"}},
          {"health",
           {"pharmacy", "medical", "chemist", "hospital", "clinic", "medlife", "1mg", "apollo"}},
          {"subscriptions",
           {"spotify", "netflix", "prime", "hotstar", "youtube", "apple", "google", "itunes"}},
      });
  return kDefault;
}

std::shared_ptr<const Lexicon> Lexicon::FromJsonString(const std::string& text) {
  auto j = nlohmann::ordered_json::parse(text, nullptr, false);
  if (j.is_discarded()) {
    throw std::runtime_error("lexicon is not valid JSON");
  }
  return ParseLexicon(j);
}

std::shared_ptr<const Lexicon> Lexicon::FromJsonFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("unable to read lexicon file: " + path);
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  return FromJsonString(ss.str());
}

}  // namespace spendcat
