#pragma once

#include <string>
#include <vector>

#include "types.hpp"

namespace Report {
// {"projects": [...], "moves": [...], "project_totals": {...},
//  "bucket_totals": {...}, "status_totals": {...}}
json build_summary(const ClusterResult& clusters,
                   const std::vector<JournalEntry>& entries);

std::string render_csv(const json& summary);
std::string render_html(const json& summary);
// Plain-text tables for the terminal.
std::string render_console(const json& summary);

// Writes <out>.html, <out>.json and <out>.csv next to each other.
void write_reports(const json& summary, const fs::path& htmlPath);
}  // namespace Report
