#pragma once

#include <cstdint>
#include <filesystem>
#include <format>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include "utils.hpp"

namespace fs = std::filesystem;
using json = nlohmann::json;
using ordered_json = nlohmann::ordered_json;

inline constexpr std::string_view kFallbackBucket = "archive";

// Thrown when a persisted record (scores, clusters, plans, journal lines) or a
// configuration value is malformed. The message names the record and field.
class ValidationError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

namespace detail {
template <typename T>
T required_field(const json& j, std::string_view record, const char* field) {
  if (!j.is_object()) {
    throw ValidationError(std::format("{}: record is not a JSON object", record));
  }
  auto it = j.find(field);
  if (it == j.end() || it->is_null()) {
    throw ValidationError(
        std::format("{}: missing required field '{}'", record, field));
  }
  try {
    return it->get<T>();
  } catch (const json::type_error&) {
    throw ValidationError(std::format("{}: field '{}' has the wrong type ({})",
                                      record, field, it->type_name()));
  }
}

template <typename T>
T optional_field(const json& j, std::string_view record, const char* field,
                 T fallback) {
  auto it = j.find(field);
  if (it == j.end() || it->is_null()) return fallback;
  try {
    return it->get<T>();
  } catch (const json::type_error&) {
    throw ValidationError(std::format("{}: field '{}' has the wrong type ({})",
                                      record, field, it->type_name()));
  }
}
}  // namespace detail

struct ScanConfig {
  std::vector<fs::path> roots;
  std::uintmax_t max_size_bytes = 500ull * 1024 * 1024;
  std::size_t sample_bytes = 4096;
  fs::path cache_path = ".cache/scan.db";
  fs::path output_path = ".cache/scan_results.json";
};

struct BucketRule {
  std::string name;
  std::vector<std::string> exts;
  std::vector<std::string> name_keywords;
  std::vector<std::string> dir_keywords;
  std::vector<std::string> code_hints;
  std::vector<std::string> imports;
  std::vector<std::string> title_keywords;
};

// Buckets keep their configured order; it decides ties.
struct RuleConfig {
  std::vector<BucketRule> buckets;
  std::unordered_map<std::string, int> weights;
  std::vector<std::string> project_hints;

  int weight(const std::string& category) const {
    auto it = weights.find(category);
    return it != weights.end() ? it->second : 1;
  }
};

enum class TransferMode { MOVE, COPY };
enum class ConflictPolicy { SUFFIX };

std::string_view to_string(TransferMode mode);
std::optional<TransferMode> parse_transfer_mode(std::string_view text);
std::optional<ConflictPolicy> parse_conflict_policy(std::string_view text);

struct SchemaConfig {
  fs::path target_root;
  std::vector<std::string> structure;
  ConflictPolicy conflict_policy = ConflictPolicy::SUFFIX;
  TransferMode mode = TransferMode::MOVE;
};

struct Document {
  std::string doc_id;
  fs::path path;
  std::string name;
  std::string extension;
  std::uintmax_t size = 0;
  double modified_time = 0.0;
  std::string content_digest;
  std::string mime_type;
  std::string dir_hint;
  std::vector<std::string> imports_first;
  std::optional<std::string> top_comment;
  std::vector<std::string> markdown_headings;
  std::vector<std::string> json_root_keys;
  std::vector<std::string> csv_header;
  std::string sample_text;
  std::optional<std::string> capture_date;
};
void to_json(json& j, const Document& d);
void from_json(const json& j, Document& d);

struct BucketScore {
  std::string doc_id;
  std::string bucket;
  double score = 0.0;
  std::vector<std::string> reasons;
};
void to_json(json& j, const BucketScore& s);
void from_json(const json& j, BucketScore& s);

struct ClusterProject {
  std::string project_id;
  std::string project_label;
  std::vector<std::string> doc_ids;
  std::map<std::string, std::string> role_bucket_map;
  double confidence = 0.0;
  std::vector<std::string> reasons;
};
void to_json(json& j, const ClusterProject& p);
void from_json(const json& j, ClusterProject& p);

struct ClusterResult {
  std::vector<ClusterProject> projects;
};

struct OrganizePlan {
  std::string doc_id;
  std::string project_id;
  std::string project_label;
  std::string bucket;
  fs::path source_path;
  fs::path target_path;
  std::string hash_suffix;
};
void to_json(json& j, const OrganizePlan& p);
void from_json(const json& j, OrganizePlan& p);

enum class JournalStatus { MOVED, COPIED, MISSING, FAILED };

std::string_view to_string(JournalStatus status);
std::optional<JournalStatus> parse_journal_status(std::string_view text);

struct JournalEntry {
  fs::path original_path;
  fs::path target_path;
  std::string doc_id;
  std::string content_digest;
  std::string project_id;
  std::string bucket;
  JournalStatus status = JournalStatus::MISSING;
  double timestamp = 0.0;
};
void to_json(json& j, const JournalEntry& e);
void from_json(const json& j, JournalEntry& e);

// doc_id -> bucket, as produced by the rule engine.
using ScoreMap = std::unordered_map<std::string, std::string>;
