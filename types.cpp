#include "types.hpp"

using detail::optional_field;
using detail::required_field;

namespace {
std::optional<std::string> optional_text(const json& j, std::string_view record,
                                         const char* field) {
  auto it = j.find(field);
  if (it == j.end() || it->is_null()) return std::nullopt;
  if (!it->is_string()) {
    throw ValidationError(std::format("{}: field '{}' has the wrong type ({})",
                                      record, field, it->type_name()));
  }
  return it->get<std::string>();
}
}  // namespace

std::string_view to_string(TransferMode mode) {
  switch (mode) {
    case TransferMode::MOVE:
      return "move";
    case TransferMode::COPY:
      return "copy";
  }
  return "move";
}

std::optional<TransferMode> parse_transfer_mode(std::string_view text) {
  const std::string lowered = string_to_lower_ascii(text);
  if (lowered == "move") return TransferMode::MOVE;
  if (lowered == "copy") return TransferMode::COPY;
  return std::nullopt;
}

std::optional<ConflictPolicy> parse_conflict_policy(std::string_view text) {
  const std::string lowered = string_to_lower_ascii(text);
  // "version" is the historical name of digest suffixing.
  if (lowered == "suffix" || lowered == "version") {
    return ConflictPolicy::SUFFIX;
  }
  return std::nullopt;
}

std::string_view to_string(JournalStatus status) {
  switch (status) {
    case JournalStatus::MOVED:
      return "moved";
    case JournalStatus::COPIED:
      return "copied";
    case JournalStatus::MISSING:
      return "missing";
    case JournalStatus::FAILED:
      return "failed";
  }
  return "failed";
}

std::optional<JournalStatus> parse_journal_status(std::string_view text) {
  if (text == "moved") return JournalStatus::MOVED;
  if (text == "copied") return JournalStatus::COPIED;
  if (text == "missing") return JournalStatus::MISSING;
  if (text == "failed") return JournalStatus::FAILED;
  return std::nullopt;
}

void to_json(json& j, const Document& d) {
  j = json{{"doc_id", d.doc_id},
           {"path", safe_path_to_string(d.path)},
           {"name", d.name},
           {"extension", d.extension},
           {"size", d.size},
           {"modified_time", d.modified_time},
           {"content_digest", d.content_digest},
           {"mime_type", d.mime_type},
           {"dir_hint", d.dir_hint},
           {"imports_first", d.imports_first},
           {"top_comment", d.top_comment ? json(*d.top_comment) : json()},
           {"markdown_headings", d.markdown_headings},
           {"json_root_keys", d.json_root_keys},
           {"csv_header", d.csv_header},
           {"sample_text", d.sample_text}};
  if (d.capture_date) {
    j["capture_date"] = *d.capture_date;
  }
}

void from_json(const json& j, Document& d) {
  constexpr std::string_view kRecord = "document";
  d.doc_id = required_field<std::string>(j, kRecord, "doc_id");
  d.path = path_from_utf8(required_field<std::string>(j, kRecord, "path"));
  d.name = required_field<std::string>(j, kRecord, "name");
  d.extension = required_field<std::string>(j, kRecord, "extension");
  d.size = required_field<std::uintmax_t>(j, kRecord, "size");
  d.modified_time = required_field<double>(j, kRecord, "modified_time");
  d.content_digest = required_field<std::string>(j, kRecord, "content_digest");
  d.mime_type = required_field<std::string>(j, kRecord, "mime_type");
  d.dir_hint = required_field<std::string>(j, kRecord, "dir_hint");
  d.sample_text = required_field<std::string>(j, kRecord, "sample_text");
  // Structural hints are opportunistic; absence means "nothing found".
  d.imports_first = optional_field<std::vector<std::string>>(
      j, kRecord, "imports_first", {});
  d.markdown_headings = optional_field<std::vector<std::string>>(
      j, kRecord, "markdown_headings", {});
  d.json_root_keys = optional_field<std::vector<std::string>>(
      j, kRecord, "json_root_keys", {});
  d.csv_header =
      optional_field<std::vector<std::string>>(j, kRecord, "csv_header", {});
  d.top_comment = optional_text(j, kRecord, "top_comment");
  d.capture_date = optional_text(j, kRecord, "capture_date");
}

void to_json(json& j, const BucketScore& s) {
  j = json{{"doc_id", s.doc_id},
           {"bucket", s.bucket},
           {"score", s.score},
           {"reasons", s.reasons}};
}

void from_json(const json& j, BucketScore& s) {
  constexpr std::string_view kRecord = "bucket score";
  s.doc_id = required_field<std::string>(j, kRecord, "doc_id");
  // A score without a bucket is the documented "archive" fallback.
  s.bucket = optional_field<std::string>(j, kRecord, "bucket",
                                         std::string(kFallbackBucket));
  s.score = optional_field<double>(j, kRecord, "score", 0.0);
  s.reasons =
      optional_field<std::vector<std::string>>(j, kRecord, "reasons", {});
  if (s.doc_id.empty()) {
    throw ValidationError("bucket score: field 'doc_id' is empty");
  }
}

void to_json(json& j, const ClusterProject& p) {
  j = json{{"project_id", p.project_id},
           {"project_label", p.project_label},
           {"doc_ids", p.doc_ids},
           {"role_bucket_map", p.role_bucket_map},
           {"confidence", p.confidence},
           {"reasons", p.reasons}};
}

void from_json(const json& j, ClusterProject& p) {
  constexpr std::string_view kRecord = "cluster project";
  p.project_id = required_field<std::string>(j, kRecord, "project_id");
  p.project_label = required_field<std::string>(j, kRecord, "project_label");
  p.doc_ids = required_field<std::vector<std::string>>(j, kRecord, "doc_ids");
  p.role_bucket_map = required_field<std::map<std::string, std::string>>(
      j, kRecord, "role_bucket_map");
  p.confidence = required_field<double>(j, kRecord, "confidence");
  p.reasons =
      optional_field<std::vector<std::string>>(j, kRecord, "reasons", {});
  if (p.project_id.empty() || p.project_label.empty()) {
    throw ValidationError(
        "cluster project: 'project_id' and 'project_label' must be non-empty");
  }
}

void to_json(json& j, const OrganizePlan& p) {
  j = json{{"doc_id", p.doc_id},
           {"project_id", p.project_id},
           {"project_label", p.project_label},
           {"bucket", p.bucket},
           {"source_path", safe_path_to_string(p.source_path)},
           {"target_path", safe_path_to_string(p.target_path)},
           {"hash_suffix", p.hash_suffix}};
}

void from_json(const json& j, OrganizePlan& p) {
  constexpr std::string_view kRecord = "organize plan";
  p.doc_id = required_field<std::string>(j, kRecord, "doc_id");
  p.project_id = required_field<std::string>(j, kRecord, "project_id");
  p.project_label = required_field<std::string>(j, kRecord, "project_label");
  p.bucket = required_field<std::string>(j, kRecord, "bucket");
  p.source_path =
      path_from_utf8(required_field<std::string>(j, kRecord, "source_path"));
  p.target_path =
      path_from_utf8(required_field<std::string>(j, kRecord, "target_path"));
  p.hash_suffix = required_field<std::string>(j, kRecord, "hash_suffix");
}

void to_json(json& j, const JournalEntry& e) {
  j = json{{"original_path", safe_path_to_string(e.original_path)},
           {"target_path", safe_path_to_string(e.target_path)},
           {"doc_id", e.doc_id},
           {"content_digest", e.content_digest},
           {"project_id", e.project_id},
           {"bucket", e.bucket},
           {"status", std::string(to_string(e.status))},
           {"timestamp", e.timestamp}};
}

void from_json(const json& j, JournalEntry& e) {
  constexpr std::string_view kRecord = "journal entry";
  e.original_path =
      path_from_utf8(required_field<std::string>(j, kRecord, "original_path"));
  e.target_path =
      path_from_utf8(required_field<std::string>(j, kRecord, "target_path"));
  e.doc_id = required_field<std::string>(j, kRecord, "doc_id");
  e.content_digest = required_field<std::string>(j, kRecord, "content_digest");
  e.project_id = required_field<std::string>(j, kRecord, "project_id");
  e.bucket = required_field<std::string>(j, kRecord, "bucket");
  const auto status_text = required_field<std::string>(j, kRecord, "status");
  auto status = parse_journal_status(status_text);
  if (!status) {
    throw ValidationError(
        std::format("{}: unknown status '{}'", kRecord, status_text));
  }
  e.status = *status;
  e.timestamp = required_field<double>(j, kRecord, "timestamp");
}
