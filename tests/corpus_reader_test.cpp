#include <cassert>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include <zlib.h>

#include "spendcat/corpus_reader.hpp"

namespace {
using namespace spendcat;
namespace fs = std::filesystem;

std::vector<LabeledRecord> ReadAll(const fs::path& path, std::size_t* skipped = nullptr) {
  std::vector<LabeledRecord> out;
  CorpusReader reader;
  bool ok = reader.ForEachRecord(path.string(), [&](const LabeledRecord& r) { out.push_back(r); }, skipped);
  assert(ok);
  return out;
}
}  // namespace

int main() {
  const auto dir = fs::temp_directory_path() / "spendcat_corpus_test";
  fs::create_directories(dir);

  const auto jsonl = dir / "labels.jsonl";
  {
    std::ofstream out(jsonl);
    out << R"({"transaction_id": "t1", "text": "Uber ride", "category": "transport"})" << "\n"
        << R"({"id": 42, "note": "lunch", "merchant": "Cafe", "category_id": "food", "weight": 2})" << "\n"
        << "not json\n"
        << R"({"text": "missing category"})" << "\n";
  }
  std::size_t skipped = 0;
  auto records = ReadAll(jsonl, &skipped);
  assert(records.size() == 2);
  assert(skipped == 2);
  assert(records[0].transaction_id == "t1" && records[0].text == "Uber ride" && records[0].category == "transport");
  assert(records[1].transaction_id == "42");
  assert(records[1].note == "lunch" && records[1].merchant == "Cafe");
  assert(records[1].category == "food");
  assert(records[1].weight == 2.0);

  const auto json = dir / "labels.json";
  {
    std::ofstream out(json);
    out << R"([{"text": "netflix", "category": "subscriptions"}, {"text": "rent", "category": "bills"}])";
  }
  assert(ReadAll(json).size() == 2);

  const auto tsv = dir / "labels.tsv";
  {
    std::ofstream out(tsv);
    out << "# category\ttext\n"
        << "groceries\treliance fresh\n"
        << "t9\thealth\tapollo pharmacy\n"
        << "only-one-column\n";
  }
  skipped = 0;
  auto rows = ReadAll(tsv, &skipped);
  assert(rows.size() == 2);
  assert(skipped == 1);
  assert(rows[0].category == "groceries" && rows[0].text == "reliance fresh");
  assert(rows[1].transaction_id == "t9" && rows[1].category == "health");

  const auto gz = dir / "labels.jsonl.gz";
  {
    gzFile f = gzopen(gz.string().c_str(), "wb");
    assert(f);
    const std::string payload =
        "{\"text\": \"zomato order\", \"category\": \"food\"}\n{\"text\": \"ola cab\", \"category\": \"transport\"}\n";
    gzwrite(f, payload.data(), static_cast<unsigned>(payload.size()));
    gzclose(f);
  }
  auto zipped = ReadAll(gz);
  assert(zipped.size() == 2);
  assert(zipped[1].text == "ola cab");

  CorpusReader reader;
  assert(!reader.ForEachRecord((dir / "missing.jsonl").string(), [](const LabeledRecord&) {}));

  fs::remove_all(dir);
  return 0;
}
