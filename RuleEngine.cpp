#include "RuleEngine.hpp"

#include <algorithm>
#include <execution>

#include "IOManager.hpp"
#include "utils.hpp"

namespace {
std::vector<std::string> keyword_matches(std::string_view value,
                                         const std::vector<std::string>& keywords) {
  std::vector<std::string> matches;
  const std::string lowered = string_to_lower_ascii(value);
  for (const auto& keyword : keywords) {
    if (keyword.empty()) continue;
    if (lowered.find(string_to_lower_ascii(keyword)) != std::string::npos) {
      matches.push_back(keyword);
    }
  }
  return matches;
}

struct Tally {
  int score = 0;
  std::vector<std::string> reasons;

  void add(const char* label, const std::vector<std::string>& matches,
           int weight) {
    if (matches.empty()) return;
    score += static_cast<int>(matches.size()) * weight;
    reasons.push_back(std::format("{}:{}", label, join_strings(matches, ",")));
  }
};
}  // namespace

RuleEngine::RuleEngine(const RuleConfig& config) : m_config(config) {}

BucketScore RuleEngine::score_document(const Document& document) const {
  BucketScore best{document.doc_id, std::string(kFallbackBucket), 0.0,
                   {"fallback"}};
  int best_score = 0;

  const std::string ext = string_to_lower_ascii(document.extension);
  const std::string imports = join_strings(document.imports_first, " ");
  const std::string headings = join_strings(document.markdown_headings, " ");

  for (const auto& rule : m_config.buckets) {
    Tally tally;
    if (!ext.empty() &&
        std::find(rule.exts.begin(), rule.exts.end(), ext) != rule.exts.end()) {
      tally.add("ext", {ext.substr(1)}, m_config.weight("ext"));
    }
    tally.add("name", keyword_matches(document.name, rule.name_keywords),
              m_config.weight("name"));
    tally.add("dir", keyword_matches(document.dir_hint, rule.dir_keywords),
              m_config.weight("dir"));
    const int content_weight = m_config.weight("content");
    tally.add("content", keyword_matches(document.sample_text, rule.code_hints),
              content_weight);
    tally.add("imports", keyword_matches(imports, rule.imports), content_weight);
    tally.add("titles", keyword_matches(headings, rule.title_keywords),
              content_weight);

    // Strictly greater: on a tie the earlier bucket in config order stays.
    if (tally.score > best_score) {
      best_score = tally.score;
      best.bucket = rule.name;
      best.reasons =
          tally.reasons.empty() ? std::vector<std::string>{"matched"}
                                : std::move(tally.reasons);
    }
  }
  best.score = static_cast<double>(best_score);
  return best;
}

std::vector<BucketScore> RuleEngine::classify_all(
    const std::vector<Document>& documents) const {
  std::vector<BucketScore> scores(documents.size());
  std::transform(std::execution::par, documents.begin(), documents.end(),
                 scores.begin(),
                 [this](const Document& doc) { return score_document(doc); });

  IOManager::log(std::format("Classified {} documents across {} buckets.",
                             scores.size(), m_config.buckets.size()));
  return scores;
}
