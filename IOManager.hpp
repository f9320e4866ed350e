#pragma once

#include <functional>
#include <optional>
#include <vector>

#include "types.hpp"

namespace IOManager {
void initialize_logger();

void set_log_handler(std::function<void(std::string_view)> handler);

void log(std::string_view message);

// Configuration loaders return nullopt after logging the reason; callers treat
// that as fatal before any stage runs.
std::optional<RuleConfig> load_rule_config(const fs::path& configPath);
std::optional<SchemaConfig> load_schema(const fs::path& schemaPath);

// Pretty-printed JSON artifact writer; creates parent directories.
void save_json(const fs::path& path, const json& data);

void save_scores(const fs::path& path, const std::vector<BucketScore>& scores);
std::vector<BucketScore> load_scores(const fs::path& path);
ScoreMap load_score_map(const fs::path& path);

// Plans are exported as a bare list so they can be reviewed and executed later.
void save_plans(const fs::path& path, const std::vector<OrganizePlan>& plans);
std::vector<OrganizePlan> load_plans(const fs::path& path);

void save_cluster_result(const fs::path& path, const ClusterResult& result);
ClusterResult load_cluster_result(const fs::path& path);
}  // namespace IOManager
