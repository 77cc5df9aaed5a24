#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace spendcat {

struct LabeledRecord {
  std::string transaction_id;
  std::string note;
  std::string merchant;
  std::string text;  // used as-is when set, otherwise note + merchant
  std::string category;
  double weight = 1.0;
};

struct CorpusReadOptions {
  std::vector<std::string> text_fields = {"text", "description"};
  std::vector<std::string> category_fields = {"category", "category_id"};
};

// Streams labeled transactions out of exported files. Supported: .jsonl,
// .json (array or single object), .gz holding either of those, and .tsv with
// "category<TAB>text" or "transaction_id<TAB>category<TAB>text" rows.
class CorpusReader {
 public:
  explicit CorpusReader(CorpusReadOptions options = {});

  // Returns false when the file cannot be opened. Rows that do not parse are
  // skipped and counted in `skipped` when provided.
  bool ForEachRecord(const std::string& path, const std::function<void(const LabeledRecord&)>& fn,
                     std::size_t* skipped = nullptr) const;

 private:
  bool ReadTsv(const std::string& path, const std::function<void(const LabeledRecord&)>& fn,
               std::size_t* skipped) const;
  bool ReadJsonl(const std::string& path, const std::function<void(const LabeledRecord&)>& fn,
                 std::size_t* skipped) const;
  bool ReadJson(const std::string& path, const std::function<void(const LabeledRecord&)>& fn,
                std::size_t* skipped) const;
  bool ReadGz(const std::string& path, const std::function<void(const LabeledRecord&)>& fn,
              std::size_t* skipped) const;
  void EmitPayload(const std::string& payload, const std::function<void(const LabeledRecord&)>& fn,
                   std::size_t* skipped) const;

  CorpusReadOptions options_;
};

}  // namespace spendcat
