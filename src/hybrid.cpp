#include "spendcat/hybrid.hpp"

#include <algorithm>
#include <utility>

#include <fmt/format.h>

namespace spendcat {

namespace {
void AppendTraces(HybridResult& out, const RuleMatch& rule, const NBResult& nb) {
  out.explanation.insert(out.explanation.end(), rule.trace.begin(), rule.trace.end());
  out.explanation.insert(out.explanation.end(), nb.trace.begin(), nb.trace.end());
}
}  // namespace

std::string_view ToString(SuggestionSource source) {
  switch (source) {
    case SuggestionSource::kNone:
      return "none";
    case SuggestionSource::kRule:
      return "rule";
    case SuggestionSource::kNb:
      return "nb";
  }
  return "none";
}

HybridResult Combine(const RuleMatch& rule, const NBResult& nb, const CombinerOptions& opts) {
  HybridResult out;

  if (rule.category) {
    if (nb.category && *nb.category != *rule.category && nb.probability >= opts.override_threshold) {
      out.category = nb.category;
      out.confidence = nb.probability;
      out.source = SuggestionSource::kNb;
      out.explanation.push_back(fmt::format("nb overrides rule {} ({:.3f} >= {:.2f})", *rule.category,
                                            nb.probability, opts.override_threshold));
    } else {
      out.category = rule.category;
      out.confidence = rule.score;
      out.source = SuggestionSource::kRule;
      out.explanation.push_back(
          fmt::format("rule match used (score {:.2f}, nb {:.3f})", rule.score, nb.probability));
    }
    AppendTraces(out, rule, nb);
    return out;
  }

  if (nb.category && nb.probability >= opts.nb_threshold) {
    out.category = nb.category;
    out.confidence = nb.probability;
    out.source = SuggestionSource::kNb;
    out.explanation.push_back(
        fmt::format("nb used, no rule match ({:.3f} >= {:.2f})", nb.probability, opts.nb_threshold));
  } else {
    out.confidence = std::max(rule.score, nb.probability);
    out.source = SuggestionSource::kNone;
    out.explanation.push_back(fmt::format("low confidence from both engines (nb: {})", ToString(nb.reason)));
  }
  AppendTraces(out, rule, nb);
  return out;
}

HybridPredictor::HybridPredictor(std::shared_ptr<const Lexicon> lexicon, const FrequencyStore& store,
                                 HybridOptions options)
    : options_(options), rules_(std::move(lexicon)), nb_(store, options.predictor) {}

HybridResult HybridPredictor::Predict(std::string_view text) const {
  if (IsBlank(text)) {
    HybridResult empty;
    empty.explanation.push_back("no text provided");
    return empty;
  }

  const auto tokens = Tokenize(text, options_.tokenize);
  const auto rule = rules_.Match(tokens);
  const auto nb = nb_.PredictTokens(tokens);
  return Combine(rule, nb, options_.combiner);
}

}  // namespace spendcat
