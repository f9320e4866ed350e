#pragma once

#include <set>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "types.hpp"

using ScanIndex = std::unordered_map<std::string, Document>;

ScanIndex make_scan_index(const std::vector<Document>& documents);

// Maps clustered documents onto target paths under
// <target_root>/<project_label>/<bucket directory>/. Planning creates
// directories but never touches the files themselves.
class Planner {
 public:
  explicit Planner(const SchemaConfig& schema);

  // One plan per (project, document) whose document is known to the scan
  // index with a path and digest. Projects are planned independently and the
  // result keeps project order, then member order.
  std::vector<OrganizePlan> build_plans(const ClusterResult& clusters,
                                        const ScoreMap& scoreMap,
                                        const ScanIndex& scanIndex) const;

  // Creates every structure directory under root.
  void ensure_schema_structure(const fs::path& root) const;

  // Fixed bucket -> relative directory table; unknown buckets go to "archive".
  static std::string_view bucket_directory(std::string_view bucket);

  // Picks the first free name among: the original name, <stem>__<hash7><ext>,
  // <stem>__<hash7>_1<ext>, <stem>__<hash7>_2<ext>, ... A name is taken if it
  // is in usedTargets or exists on disk as a file other than sourcePath. The
  // chosen path is added to usedTargets. Returns the path and the
  // 7-character hash suffix.
  static std::pair<fs::path, std::string> resolve_target_path(
      const fs::path& bucketDir, const fs::path& sourcePath,
      const std::string& digest, std::set<fs::path>& usedTargets);

 private:
  std::vector<OrganizePlan> plan_project(const ClusterProject& project,
                                         const ScoreMap& scoreMap,
                                         const ScanIndex& scanIndex) const;

  const SchemaConfig& m_schema;
};
