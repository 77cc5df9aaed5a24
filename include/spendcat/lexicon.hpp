#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace spendcat {

struct LexiconEntry {
  std::string category;
  std::vector<std::string> keywords;
};

// Immutable category -> keyword table. Declaration order is significant: the
// rule engine walks categories and keywords in the order they were defined.
class Lexicon {
 public:
  explicit Lexicon(std::vector<LexiconEntry> entries);

  // Built-in table shipped with the engine.
  static std::shared_ptr<const Lexicon> Default();

  // Reads a JSON object of the form {"category": ["kw", ...], ...}. Key order
  // in the file is preserved. Throws std::runtime_error on unreadable or
  // malformed input.
  static std::shared_ptr<const Lexicon> FromJsonFile(const std::string& path);
  static std::shared_ptr<const Lexicon> FromJsonString(const std::string& text);

  [[nodiscard]] const std::vector<LexiconEntry>& Entries() const { return entries_; }
  [[nodiscard]] std::size_t CategoryCount() const { return entries_.size(); }
  [[nodiscard]] bool HasCategory(const std::string& category) const;

 private:
  std::vector<LexiconEntry> entries_;
};

}  // namespace spendcat
