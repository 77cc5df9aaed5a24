#include "spendcat/rule_engine.hpp"

#include <algorithm>
#include <numeric>
#include <stdexcept>
#include <utility>

namespace spendcat {

std::size_t EditDistance(std::string_view a, std::string_view b) {
  if (a.empty()) {
    return b.size();
  }
  if (b.empty()) {
    return a.size();
  }

  std::vector<std::size_t> prev(b.size() + 1);
  std::vector<std::size_t> cur(b.size() + 1);
  std::iota(prev.begin(), prev.end(), std::size_t{0});

  for (std::size_t i = 1; i <= a.size(); ++i) {
    cur[0] = i;
    for (std::size_t j = 1; j <= b.size(); ++j) {
      const std::size_t substitute = prev[j - 1] + (a[i - 1] == b[j - 1] ? 0 : 1);
      cur[j] = std::min({prev[j] + 1, cur[j - 1] + 1, substitute});
    }
    prev.swap(cur);
  }
  return prev[b.size()];
}

std::size_t FuzzyTolerance(std::string_view keyword) {
  return keyword.size() <= 6 ? 1 : 2;
}

RuleEngine::RuleEngine(std::shared_ptr<const Lexicon> lexicon) : lexicon_(std::move(lexicon)) {
  if (!lexicon_) {
    throw std::invalid_argument("rule engine requires a lexicon");
  }
}

std::optional<RuleMatch> RuleEngine::MatchExact(const std::vector<std::string>& tokens) const {
  for (const auto& entry : lexicon_->Entries()) {
    for (const auto& keyword : entry.keywords) {
      for (const auto& token : tokens) {
        if (token != keyword) {
          continue;
        }
        RuleMatch m;
        m.category = entry.category;
        m.score = kExactRuleScore;
        m.trace.push_back("exact: " + token + " -> " + entry.category);
        return m;
      }
    }
  }
  return std::nullopt;
}

std::optional<RuleMatch> RuleEngine::MatchFuzzy(const std::vector<std::string>& tokens) const {
  for (const auto& entry : lexicon_->Entries()) {
    for (const auto& keyword : entry.keywords) {
      const std::size_t tolerance = FuzzyTolerance(keyword);
      for (const auto& token : tokens) {
        const std::size_t len_gap =
            token.size() > keyword.size() ? token.size() - keyword.size() : keyword.size() - token.size();
        if (len_gap > tolerance || EditDistance(token, keyword) > tolerance) {
          continue;
        }
        RuleMatch m;
        m.category = entry.category;
        m.score = kFuzzyRuleScore;
        m.trace.push_back("fuzzy: " + token + "~" + keyword + " -> " + entry.category);
        return m;
      }
    }
  }
  return std::nullopt;
}

RuleMatch RuleEngine::Match(const std::vector<std::string>& tokens) const {
  if (tokens.empty()) {
    return {};
  }
  if (auto exact = MatchExact(tokens)) {
    return *exact;
  }
  if (auto fuzzy = MatchFuzzy(tokens)) {
    return *fuzzy;
  }
  RuleMatch none;
  none.trace.push_back("rule: no keyword matched");
  return none;
}

}  // namespace spendcat
