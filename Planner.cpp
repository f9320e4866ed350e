#include "Planner.hpp"

#include <algorithm>
#include <array>
#include <execution>

#include "IOManager.hpp"

namespace {
constexpr size_t kHashSuffixLength = 7;

constexpr std::array<std::pair<std::string_view, std::string_view>, 10>
    kBucketDirectories = {{
        {"src", "src/core"},
        {"scripts", "scripts"},
        {"tests", "tests/unit"},
        {"docs", "docs"},
        {"reports", "reports"},
        {"configs", "configs"},
        {"data", "data/raw"},
        {"notebooks", "notebooks"},
        {"archive", "archive"},
        {"tmp", "tmp"},
    }};

bool is_taken(const fs::path& candidate, const fs::path& source,
              const std::set<fs::path>& used) {
  if (used.contains(candidate)) return true;
  // A file already sitting at its target keeps it on re-runs.
  if (candidate == source) return false;
  std::error_code ec;
  return fs::exists(candidate, ec);
}
}  // namespace

ScanIndex make_scan_index(const std::vector<Document>& documents) {
  ScanIndex index;
  index.reserve(documents.size());
  for (const auto& doc : documents) {
    index.emplace(doc.doc_id, doc);
  }
  return index;
}

Planner::Planner(const SchemaConfig& schema) : m_schema(schema) {}

std::string_view Planner::bucket_directory(std::string_view bucket) {
  for (const auto& [name, directory] : kBucketDirectories) {
    if (name == bucket) return directory;
  }
  return kFallbackBucket;
}

void Planner::ensure_schema_structure(const fs::path& root) const {
  for (const auto& relative : m_schema.structure) {
    ensure_directory(root / path_from_utf8(relative));
  }
}

std::pair<fs::path, std::string> Planner::resolve_target_path(
    const fs::path& bucketDir, const fs::path& sourcePath,
    const std::string& digest, std::set<fs::path>& usedTargets) {
  const fs::path source = sourcePath.filename();
  const std::string stem = safe_path_to_string(source.stem());
  const std::string ext = safe_path_to_string(source.extension());
  const std::string hash_suffix = digest.substr(0, kHashSuffixLength);

  fs::path candidate = bucketDir / source;
  // Every retry yields a distinct name, so the loop terminates once it runs
  // past the names already on disk or allocated.
  for (size_t attempt = 0; is_taken(candidate, sourcePath, usedTargets);
       ++attempt) {
    const std::string name =
        attempt == 0
            ? std::format("{}__{}{}", stem, hash_suffix, ext)
            : std::format("{}__{}_{}{}", stem, hash_suffix, attempt, ext);
    candidate = bucketDir / path_from_utf8(name);
  }
  usedTargets.insert(candidate);
  return {candidate, hash_suffix};
}

std::vector<OrganizePlan> Planner::plan_project(
    const ClusterProject& project, const ScoreMap& scoreMap,
    const ScanIndex& scanIndex) const {
  std::vector<OrganizePlan> plans;
  const fs::path project_root =
      m_schema.target_root / path_from_utf8(project.project_label);
  try {
    ensure_schema_structure(project_root);

    // Allocation state is per project; other projects may reuse names.
    std::set<fs::path> used_targets;
    for (const auto& doc_id : project.doc_ids) {
      auto doc_it = scanIndex.find(doc_id);
      if (doc_it == scanIndex.end() || doc_it->second.path.empty() ||
          doc_it->second.content_digest.empty()) {
        IOManager::log(std::format(
            "Skipping {} in {}: no usable scan record.", doc_id,
            project.project_id));
        continue;
      }
      const Document& doc = doc_it->second;

      std::string bucket(kFallbackBucket);
      if (auto role = project.role_bucket_map.find(doc_id);
          role != project.role_bucket_map.end()) {
        bucket = role->second;
      } else if (auto score = scoreMap.find(doc_id); score != scoreMap.end()) {
        bucket = score->second;
      }

      const fs::path bucket_dir =
          project_root / path_from_utf8(bucket_directory(bucket));
      ensure_directory(bucket_dir);
      auto [target_path, hash_suffix] = resolve_target_path(
          bucket_dir, doc.path, doc.content_digest, used_targets);

      plans.push_back(OrganizePlan{doc_id, project.project_id,
                                   project.project_label, bucket, doc.path,
                                   std::move(target_path),
                                   std::move(hash_suffix)});
    }
  } catch (const fs::filesystem_error& e) {
    IOManager::log(std::format(
        "Error preparing '{}' for {}: {}. Remaining documents not planned.",
        safe_path_to_string(e.path1()), project.project_id, e.what()));
  }
  return plans;
}

std::vector<OrganizePlan> Planner::build_plans(
    const ClusterResult& clusters, const ScoreMap& scoreMap,
    const ScanIndex& scanIndex) const {
  ensure_schema_structure(m_schema.target_root);

  std::vector<std::vector<OrganizePlan>> per_project(clusters.projects.size());
  std::transform(std::execution::par, clusters.projects.begin(),
                 clusters.projects.end(), per_project.begin(),
                 [&](const ClusterProject& project) {
                   return plan_project(project, scoreMap, scanIndex);
                 });

  std::vector<OrganizePlan> plans;
  for (auto& project_plans : per_project) {
    plans.insert(plans.end(), std::make_move_iterator(project_plans.begin()),
                 std::make_move_iterator(project_plans.end()));
  }
  IOManager::log(std::format("Planned {} relocations across {} projects.",
                             plans.size(), clusters.projects.size()));
  return plans;
}
