#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace spendcat {

// Upper bound on tokens kept per transaction text.
inline constexpr std::size_t kMaxTokenLimit = 10;

struct TokenizeOptions {
  std::size_t max_tokens = kMaxTokenLimit;
  std::size_t min_token_length = 3;
};

// Lowercases, strips everything outside [a-z0-9], squeezes runs of three or
// more identical characters down to two, then drops short tokens and
// stopwords. Keeps the first `max_tokens` survivors in input order.
[[nodiscard]] std::vector<std::string> Tokenize(std::string_view text, const TokenizeOptions& opts = {});

[[nodiscard]] bool IsStopword(std::string_view token);

// ASCII whitespace as understood by every input check: space, \t, \n, \v, \f, \r.
inline constexpr std::string_view kWhitespace = " \t\n\v\f\r";

[[nodiscard]] std::string_view TrimWhitespace(std::string_view text);
[[nodiscard]] bool IsBlank(std::string_view text);

}  // namespace spendcat
