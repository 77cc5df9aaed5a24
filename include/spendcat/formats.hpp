#pragma once

#include <set>
#include <string>

#include <nlohmann/json.hpp>

#include "spendcat/frequency_store.hpp"

namespace spendcat {

// Snapshot of the learned counters:
// {"vocab_size": n, "training_examples": n,
//  "categories": [{"category", "total_words", "doc_count"}...],
//  "words": {word: {category: count}}}
// Only words listed in `words` are included; an empty set skips the section.
[[nodiscard]] nlohmann::json ModelToJson(const FrequencyStore& store, const std::set<std::string>& words = {});

void SaveModelJson(const FrequencyStore& store, const std::string& path, const std::set<std::string>& words = {});

}  // namespace spendcat
