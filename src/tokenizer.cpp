#include "spendcat/tokenizer.hpp"

#include <algorithm>
#include <array>

namespace spendcat {

namespace {
constexpr std::array<std::string_view, 20> kStopwords = {
    "the", "a",   "an",   "and",  "or",   "in", "on", "at",   "to",   "for",
    "from", "with", "of", "by", "is", "was", "were", "be", "been", "are",
};

std::string SqueezeRuns(const std::string& token) {
  std::string out;
  out.reserve(token.size());
  std::size_t run = 0;
  for (std::size_t i = 0; i < token.size(); ++i) {
    if (i > 0 && token[i] == token[i - 1]) {
      ++run;
    } else {
      run = 1;
    }
    if (run <= 2) {
      out.push_back(token[i]);
    }
  }
  return out;
}
}  // namespace

bool IsStopword(std::string_view token) {
  return std::find(kStopwords.begin(), kStopwords.end(), token) != kStopwords.end();
}

std::vector<std::string> Tokenize(std::string_view text, const TokenizeOptions& opts) {
  std::vector<std::string> out;
  if (opts.max_tokens == 0) {
    return out;
  }

  std::string cur;
  auto flush = [&] {
    if (cur.empty()) {
      return;
    }
    auto token = SqueezeRuns(cur);
    cur.clear();
    if (token.size() < opts.min_token_length || IsStopword(token)) {
      return;
    }
    out.push_back(std::move(token));
  };

  for (char raw : text) {
    char c = raw;
    if (c >= 'A' && c <= 'Z') {
      c = static_cast<char>(c - 'A' + 'a');
    }
    if ((c >= 'a' && c <= 'z') || (c >= '0' && c <= '9')) {
      cur.push_back(c);
      continue;
    }
    flush();
    if (out.size() >= opts.max_tokens) {
      return out;
    }
  }
  flush();

  if (out.size() > opts.max_tokens) {
    out.resize(opts.max_tokens);
  }
  return out;
}

std::string_view TrimWhitespace(std::string_view text) {
  const auto first = text.find_first_not_of(kWhitespace);
  if (first == std::string_view::npos) {
    return {};
  }
  const auto last = text.find_last_not_of(kWhitespace);
  return text.substr(first, last - first + 1);
}

bool IsBlank(std::string_view text) { return text.find_first_not_of(kWhitespace) == std::string_view::npos; }

}  // namespace spendcat
