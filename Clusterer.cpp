#include "Clusterer.hpp"

#include <algorithm>
#include <cmath>
#include <map>

#include "IOManager.hpp"

namespace {
constexpr std::string_view kGeneralProject = "general_project";

std::size_t utf8_length(std::string_view text) {
  return static_cast<std::size_t>(
      std::count_if(text.begin(), text.end(), [](char c) {
        return (static_cast<unsigned char>(c) & 0xC0) != 0x80;
      }));
}

bool is_label_char(char c) {
  const auto byte = static_cast<unsigned char>(c);
  return byte >= 0x80 || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
         (c >= '0' && c <= '9') || c == '_' || c == '-';
}

// Directory segments longer than two characters, lowercased.
std::vector<std::string> label_segments(const fs::path& directory) {
  std::vector<std::string> segments;
  for (const auto& part : directory) {
    std::string text = safe_path_to_string(part);
    if (utf8_length(text) > 2) {
      segments.push_back(string_to_lower_ascii(text));
    }
  }
  return segments;
}
}  // namespace

std::vector<ClusterInput> make_cluster_inputs(
    const std::vector<Document>& documents, const ScoreMap& scoreMap) {
  std::vector<ClusterInput> inputs;
  inputs.reserve(documents.size());
  for (const auto& doc : documents) {
    auto it = scoreMap.find(doc.doc_id);
    inputs.push_back({doc.doc_id, doc.path,
                      it != scoreMap.end() ? it->second
                                           : std::string(kFallbackBucket)});
  }
  return inputs;
}

Clusterer::Clusterer(std::vector<std::string> projectHints)
    : m_hints(std::move(projectHints)) {}

std::string Clusterer::normalize_label(std::string_view label) {
  std::string normalized;
  normalized.reserve(label.size());
  bool in_run = false;
  for (char c : label) {
    if (is_label_char(c)) {
      normalized += c;
      in_run = false;
    } else if (!in_run) {
      normalized += '_';
      in_run = true;
    }
  }
  const auto first = normalized.find_first_not_of('_');
  if (first == std::string::npos) return {};
  const auto last = normalized.find_last_not_of('_');
  return string_to_lower_ascii(
      std::string_view(normalized).substr(first, last - first + 1));
}

double Clusterer::confidence_for(std::size_t memberCount) {
  const double raw =
      std::min(1.0, 0.6 + 0.05 * static_cast<double>(memberCount));
  return std::round(raw * 100.0) / 100.0;
}

std::string Clusterer::infer_project_label(const fs::path& directory) const {
  const auto segments = label_segments(directory);
  for (const auto& hint : m_hints) {
    const std::string wanted = normalize_label(hint);
    if (wanted.empty()) continue;
    for (const auto& segment : segments) {
      if (normalize_label(segment) == wanted) {
        return wanted;
      }
    }
  }
  std::string label;
  if (segments.size() >= 2) {
    label = normalize_label(segments[segments.size() - 2] + "_" +
                            segments.back());
  } else if (!segments.empty()) {
    label = normalize_label(segments.back());
  }
  return label.empty() ? std::string(kGeneralProject) : label;
}

ClusterResult Clusterer::cluster(const std::vector<ClusterInput>& inputs,
                                 const ScoreMap& scoreMap) const {
  // std::map iterates labels in sorted order, which fixes the project ids.
  std::map<std::string, std::vector<const ClusterInput*>> groups;
  for (const auto& input : inputs) {
    groups[infer_project_label(input.path.parent_path())].push_back(&input);
  }

  ClusterResult result;
  std::size_t index = 0;
  for (auto& [label, members] : groups) {
    std::sort(members.begin(), members.end(),
              [](const ClusterInput* a, const ClusterInput* b) {
                if (a->path != b->path) return a->path < b->path;
                return a->doc_id < b->doc_id;
              });

    ClusterProject project;
    project.project_id = std::format("project_{:03d}", ++index);
    project.project_label = label;
    for (const auto* member : members) {
      project.doc_ids.push_back(member->doc_id);
      auto it = scoreMap.find(member->doc_id);
      project.role_bucket_map[member->doc_id] =
          it != scoreMap.end() ? it->second : member->bucket;
    }
    project.confidence = confidence_for(members.size());
    project.reasons = {std::format("grouped_by:{}", label),
                       std::format("docs:{}", members.size())};
    result.projects.push_back(std::move(project));
  }

  IOManager::log(std::format("Clustered {} documents into {} projects.",
                             inputs.size(), result.projects.size()));
  return result;
}
