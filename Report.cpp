#include "Report.hpp"

#include <fstream>
#include <ftxui/dom/elements.hpp>
#include <ftxui/dom/table.hpp>
#include <ftxui/screen/screen.hpp>
#include <map>

#include "IOManager.hpp"

namespace {
std::string escape_html(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (char c : text) {
    switch (c) {
      case '&':
        out += "&amp;";
        break;
      case '<':
        out += "&lt;";
        break;
      case '>':
        out += "&gt;";
        break;
      case '"':
        out += "&quot;";
        break;
      case '\'':
        out += "&#39;";
        break;
      default:
        out += c;
    }
  }
  return out;
}

void write_text(const fs::path& path, const std::string& text) {
  ensure_directory(path.parent_path());
  std::ofstream out(path);
  out << text;
  if (!out) {
    throw std::runtime_error(
        std::format("cannot write '{}'", safe_path_to_string(path)));
  }
}

std::string render_table(std::vector<std::vector<std::string>> rows) {
  using namespace ftxui;
  auto table = Table(std::move(rows));
  table.SelectAll().Border(LIGHT);
  table.SelectAll().SeparatorVertical(LIGHT);
  table.SelectRow(0).Decorate(bold);
  table.SelectRow(0).BorderBottom(LIGHT);
  auto document = table.Render();
  auto screen = Screen::Create(Dimension::Fit(document));
  Render(screen, document);
  return screen.ToString();
}
}  // namespace

json Report::build_summary(const ClusterResult& clusters,
                           const std::vector<JournalEntry>& entries) {
  json projects = json::array();
  for (const auto& project : clusters.projects) {
    projects.push_back({{"project_id", project.project_id},
                        {"project_label", project.project_label},
                        {"doc_count", project.doc_ids.size()},
                        {"confidence", project.confidence}});
  }

  std::map<std::string, std::size_t> project_totals;
  std::map<std::string, std::size_t> bucket_totals;
  std::map<std::string, std::size_t> status_totals;
  for (const auto& entry : entries) {
    ++project_totals[entry.project_id];
    ++bucket_totals[entry.bucket];
    ++status_totals[std::string(to_string(entry.status))];
  }

  return json{{"projects", std::move(projects)},
              {"moves", entries},
              {"project_totals", project_totals},
              {"bucket_totals", bucket_totals},
              {"status_totals", status_totals}};
}

std::string Report::render_csv(const json& summary) {
  std::string csv = "project_id,count\n";
  for (const auto& [project_id, count] : summary.at("project_totals").items()) {
    csv += std::format("{},{}\n", project_id, count.get<std::size_t>());
  }
  return csv;
}

std::string Report::render_html(const json& summary) {
  std::string project_rows;
  for (const auto& item : summary.at("projects")) {
    project_rows += std::format(
        "<tr><td>{}</td><td>{}</td><td>{}</td><td>{:.2f}</td></tr>",
        escape_html(item.at("project_id").get<std::string>()),
        escape_html(item.at("project_label").get<std::string>()),
        item.at("doc_count").get<std::size_t>(),
        item.at("confidence").get<double>());
  }
  std::string bucket_rows;
  for (const auto& [bucket, count] : summary.at("bucket_totals").items()) {
    bucket_rows += std::format("<tr><td>{}</td><td>{}</td></tr>",
                               escape_html(bucket), count.get<std::size_t>());
  }
  if (project_rows.empty()) {
    project_rows = "<tr><td colspan='4'>No projects</td></tr>";
  }
  if (bucket_rows.empty()) {
    bucket_rows = "<tr><td colspan='2'>No buckets</td></tr>";
  }

  return std::format(R"(<html>
  <head>
    <meta charset="utf-8" />
    <title>Project Summary</title>
    <style>
      body {{ background-color: #0B1220; color: #E5E7EB; font-family: sans-serif; }}
      .container {{ max-width: 960px; margin: 0 auto; padding: 32px; }}
      table {{ width: 100%; border-collapse: collapse; margin-top: 24px; }}
      th, td {{ border: 1px solid #111827; padding: 12px; text-align: left; }}
      th {{ background-color: #111827; color: #22D3EE; }}
    </style>
  </head>
  <body>
    <div class="container">
      <h1>Project Summary</h1>
      <h2>Projects</h2>
      <table>
        <thead><tr><th>ID</th><th>Label</th><th>Docs</th><th>Confidence</th></tr></thead>
        <tbody>{}</tbody>
      </table>
      <h2>Buckets</h2>
      <table>
        <thead><tr><th>Bucket</th><th>Count</th></tr></thead>
        <tbody>{}</tbody>
      </table>
    </div>
  </body>
</html>
)",
                     project_rows, bucket_rows);
}

std::string Report::render_console(const json& summary) {
  std::vector<std::vector<std::string>> project_rows = {
      {"ID", "Label", "Docs", "Confidence", "Journaled"}};
  const auto& totals = summary.at("project_totals");
  for (const auto& item : summary.at("projects")) {
    const auto id = item.at("project_id").get<std::string>();
    const std::size_t journaled =
        totals.contains(id) ? totals.at(id).get<std::size_t>() : 0;
    project_rows.push_back({id, item.at("project_label").get<std::string>(),
                            std::to_string(item.at("doc_count").get<std::size_t>()),
                            std::format("{:.2f}", item.at("confidence").get<double>()),
                            std::to_string(journaled)});
  }

  std::vector<std::vector<std::string>> bucket_rows = {{"Bucket", "Count"}};
  for (const auto& [bucket, count] : summary.at("bucket_totals").items()) {
    bucket_rows.push_back({bucket, std::to_string(count.get<std::size_t>())});
  }

  std::vector<std::vector<std::string>> status_rows = {{"Status", "Count"}};
  for (const auto& [status, count] : summary.at("status_totals").items()) {
    status_rows.push_back({status, std::to_string(count.get<std::size_t>())});
  }

  return render_table(std::move(project_rows)) + "\n" +
         render_table(std::move(bucket_rows)) + "\n" +
         render_table(std::move(status_rows)) + "\n";
}

void Report::write_reports(const json& summary, const fs::path& htmlPath) {
  fs::path json_path = htmlPath;
  json_path.replace_extension(".json");
  fs::path csv_path = htmlPath;
  csv_path.replace_extension(".csv");

  IOManager::save_json(json_path, summary);
  write_text(csv_path, render_csv(summary));
  write_text(htmlPath, render_html(summary));
  IOManager::log(std::format("Report generated at {}",
                             safe_path_to_string(htmlPath)));
}
