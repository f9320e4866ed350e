#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "types.hpp"

struct ClusterInput {
  std::string doc_id;
  fs::path path;
  std::string bucket;
};

// Builds cluster inputs from scanned documents, taking each bucket from the
// score map and falling back to "archive".
std::vector<ClusterInput> make_cluster_inputs(
    const std::vector<Document>& documents, const ScoreMap& scoreMap);

// Groups documents into inferred projects by their parent directory path.
// Pure: the same inputs and hints always give the same labels and ids.
class Clusterer {
 public:
  explicit Clusterer(std::vector<std::string> projectHints);

  ClusterResult cluster(const std::vector<ClusterInput>& inputs,
                        const ScoreMap& scoreMap) const;

  std::string infer_project_label(const fs::path& directory) const;

  // Lowercase, runs of characters other than alphanumerics, '_' and '-'
  // become '_', and leading/trailing '_' are dropped.
  static std::string normalize_label(std::string_view label);

  static double confidence_for(std::size_t memberCount);

 private:
  std::vector<std::string> m_hints;
};
