#include "spendcat/corpus_reader.hpp"

#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <utility>

#include <nlohmann/json.hpp>
#include <zlib.h>

namespace spendcat {

namespace {
std::string FirstString(const nlohmann::json& j, const std::vector<std::string>& fields) {
  for (const auto& field : fields) {
    if (j.contains(field) && j[field].is_string()) {
      return j[field].get<std::string>();
    }
  }
  return {};
}

std::string StringOrNumber(const nlohmann::json& j, const char* field) {
  if (!j.contains(field)) {
    return {};
  }
  const auto& v = j[field];
  if (v.is_string()) {
    return v.get<std::string>();
  }
  if (v.is_number_integer()) {
    return std::to_string(v.get<long long>());
  }
  return {};
}

void SplitTabs(const std::string& line, std::vector<std::string>& out) {
  out.clear();
  std::string cur;
  for (char c : line) {
    if (c == '\t') {
      out.push_back(cur);
      cur.clear();
    } else if (c != '\r') {
      cur.push_back(c);
    }
  }
  out.push_back(cur);
}

std::optional<LabeledRecord> ToRecord(const nlohmann::json& j, const CorpusReadOptions& opts) {
  if (!j.is_object()) {
    return std::nullopt;
  }
  LabeledRecord r;
  r.transaction_id = StringOrNumber(j, "transaction_id");
  if (r.transaction_id.empty()) {
    r.transaction_id = StringOrNumber(j, "id");
  }
  r.text = FirstString(j, opts.text_fields);
  if (j.contains("note") && j["note"].is_string()) {
    r.note = j["note"].get<std::string>();
  }
  if (j.contains("merchant") && j["merchant"].is_string()) {
    r.merchant = j["merchant"].get<std::string>();
  }
  r.category = FirstString(j, opts.category_fields);
  if (j.contains("weight") && j["weight"].is_number()) {
    r.weight = j["weight"].get<double>();
  }
  if (r.category.empty() || (r.text.empty() && r.note.empty() && r.merchant.empty())) {
    return std::nullopt;
  }
  return r;
}

void CountSkip(std::size_t* skipped) {
  if (skipped) {
    ++*skipped;
  }
}
}  // namespace

CorpusReader::CorpusReader(CorpusReadOptions options) : options_(std::move(options)) {}

bool CorpusReader::ForEachRecord(const std::string& path, const std::function<void(const LabeledRecord&)>& fn,
                                 std::size_t* skipped) const {
  auto ext = std::filesystem::path(path).extension().string();
  if (ext == ".jsonl") return ReadJsonl(path, fn, skipped);
  if (ext == ".json") return ReadJson(path, fn, skipped);
  if (ext == ".gz") return ReadGz(path, fn, skipped);
  return ReadTsv(path, fn, skipped);
}

bool CorpusReader::ReadTsv(const std::string& path, const std::function<void(const LabeledRecord&)>& fn,
                           std::size_t* skipped) const {
  std::ifstream in(path);
  if (!in) return false;
  std::string line;
  std::vector<std::string> cols;
  while (std::getline(in, line)) {
    if (line.empty() || line[0] == '#') continue;
    SplitTabs(line, cols);
    LabeledRecord r;
    if (cols.size() == 2) {
      r.category = cols[0];
      r.text = cols[1];
    } else if (cols.size() == 3) {
      r.transaction_id = cols[0];
      r.category = cols[1];
      r.text = cols[2];
    }
    if (r.category.empty() || r.text.empty()) {
      CountSkip(skipped);
      continue;
    }
    fn(r);
  }
  return true;
}

bool CorpusReader::ReadJsonl(const std::string& path, const std::function<void(const LabeledRecord&)>& fn,
                             std::size_t* skipped) const {
  std::ifstream in(path);
  if (!in) return false;
  std::string line;
  while (std::getline(in, line)) {
    if (line.empty()) continue;
    auto j = nlohmann::json::parse(line, nullptr, false);
    auto record = j.is_discarded() ? std::nullopt : ToRecord(j, options_);
    if (!record) {
      CountSkip(skipped);
      continue;
    }
    fn(*record);
  }
  return true;
}

bool CorpusReader::ReadJson(const std::string& path, const std::function<void(const LabeledRecord&)>& fn,
                            std::size_t* skipped) const {
  std::ifstream in(path);
  if (!in) return false;
  std::ostringstream ss;
  ss << in.rdbuf();
  EmitPayload(ss.str(), fn, skipped);
  return true;
}

bool CorpusReader::ReadGz(const std::string& path, const std::function<void(const LabeledRecord&)>& fn,
                          std::size_t* skipped) const {
  gzFile gz = gzopen(path.c_str(), "rb");
  if (!gz) return false;
  std::string payload;
  char buf[1 << 15];
  int read_n = 0;
  while ((read_n = gzread(gz, buf, sizeof(buf))) > 0) {
    payload.append(buf, static_cast<std::size_t>(read_n));
  }
  const bool read_failed = read_n < 0;
  gzclose(gz);
  if (read_failed) {
    throw std::runtime_error("corrupt gzip stream: " + path);
  }
  EmitPayload(payload, fn, skipped);
  return true;
}

void CorpusReader::EmitPayload(const std::string& payload, const std::function<void(const LabeledRecord&)>& fn,
                               std::size_t* skipped) const {
  auto j = nlohmann::json::parse(payload, nullptr, false);
  if (j.is_discarded()) {
    // Not a single document; treat it as JSON lines.
    std::istringstream iss(payload);
    std::string line;
    while (std::getline(iss, line)) {
      if (line.empty()) continue;
      auto jl = nlohmann::json::parse(line, nullptr, false);
      auto record = jl.is_discarded() ? std::nullopt : ToRecord(jl, options_);
      if (!record) {
        CountSkip(skipped);
        continue;
      }
      fn(*record);
    }
    return;
  }

  if (j.is_array()) {
    for (const auto& item : j) {
      auto record = ToRecord(item, options_);
      if (!record) {
        CountSkip(skipped);
        continue;
      }
      fn(*record);
    }
    return;
  }

  if (auto record = ToRecord(j, options_)) {
    fn(*record);
  } else {
    CountSkip(skipped);
  }
}

}  // namespace spendcat
