#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "spendcat/lexicon.hpp"

namespace spendcat {

inline constexpr double kExactRuleScore = 1.0;
inline constexpr double kFuzzyRuleScore = 0.85;

struct RuleMatch {
  std::optional<std::string> category;
  double score = 0.0;
  std::vector<std::string> trace;
};

// Levenshtein distance with unit insert/delete/substitute costs.
[[nodiscard]] std::size_t EditDistance(std::string_view a, std::string_view b);

// Largest edit distance tolerated against `keyword` in the fuzzy pass.
[[nodiscard]] std::size_t FuzzyTolerance(std::string_view keyword);

class RuleEngine {
 public:
  explicit RuleEngine(std::shared_ptr<const Lexicon> lexicon);

  // Two full passes over the lexicon: exact equality first, then fuzzy. The
  // first hit in declaration order wins.
  [[nodiscard]] RuleMatch Match(const std::vector<std::string>& tokens) const;

  [[nodiscard]] const Lexicon& GetLexicon() const { return *lexicon_; }

 private:
  [[nodiscard]] std::optional<RuleMatch> MatchExact(const std::vector<std::string>& tokens) const;
  [[nodiscard]] std::optional<RuleMatch> MatchFuzzy(const std::vector<std::string>& tokens) const;

  std::shared_ptr<const Lexicon> lexicon_;
};

}  // namespace spendcat
