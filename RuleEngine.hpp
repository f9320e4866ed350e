#pragma once

#include <vector>

#include "types.hpp"

// Weighted keyword classifier. Stateless apart from the borrowed config, so a
// single engine may score documents from many threads.
class RuleEngine {
 public:
  explicit RuleEngine(const RuleConfig& config);

  BucketScore score_document(const Document& document) const;

  // Scores every document independently; output order follows the input.
  std::vector<BucketScore> classify_all(
      const std::vector<Document>& documents) const;

 private:
  const RuleConfig& m_config;
};
