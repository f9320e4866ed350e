#include <CLI/CLI.hpp>
#include <exception>
#include <exiv2/exiv2.hpp>
#include <print>
#include <vector>

#include "Clusterer.hpp"
#include "DocumentStore.hpp"
#include "Executor.hpp"
#include "IOManager.hpp"
#include "Planner.hpp"
#include "Report.hpp"
#include "Rollback.hpp"
#include "RuleEngine.hpp"
#include "Scanner.hpp"
#include "types.hpp"

namespace fs = std::filesystem;

namespace {
struct Options {
  bool verbose = false;
  fs::path cache_db = ".cache/scan.db";
  fs::path scores = ".cache/scores.json";
  fs::path clusters = ".cache/projects.json";
  fs::path journal = ".cache/journal.jsonl";

  std::vector<std::string> scan_paths;
  std::uintmax_t max_size = 500ull * 1024 * 1024;
  std::size_t sample_bytes = 4096;
  fs::path scan_out = ".cache/scan_results.json";

  fs::path rules_config = "rules.json";
  std::vector<std::string> extra_hints;

  fs::path schema = "schema.json";
  std::string target_override;
  std::string mode_override;
  std::string conflict_override;
  fs::path plans_out = ".cache/plans.json";
  bool dry_run = false;
  std::string from_plans;

  fs::path report_out = "reports/projects_summary.html";
};

int fail(std::string_view message) {
  IOManager::log(std::format("CRITICAL: {}", message));
  std::println(stderr, "\n=== ERROR ===");
  std::println(stderr, "{}", message);
  std::println(stderr, "Check organizer.log for details.");
  return 1;
}

int run_scan(const Options& opts) {
  ScanConfig config;
  for (const auto& p : opts.scan_paths) config.roots.push_back(path_from_utf8(p));
  config.max_size_bytes = opts.max_size;
  config.sample_bytes = opts.sample_bytes;
  config.cache_path = opts.cache_db;
  config.output_path = opts.scan_out;

  const auto documents = Scanner(config).scan();
  std::println("Scanned {} files.", documents.size());
  return 0;
}

int run_rules(const Options& opts) {
  auto rules = IOManager::load_rule_config(opts.rules_config);
  if (!rules) {
    return fail(std::format("Failed to load rule config '{}'.",
                            safe_path_to_string(opts.rules_config)));
  }
  DocumentStore store(opts.cache_db);
  const auto documents = store.load_all();
  if (documents.empty()) {
    std::println("No scan data found. Run 'scan' first.");
    return 0;
  }
  const auto scores = RuleEngine(*rules).classify_all(documents);
  IOManager::save_scores(opts.scores, scores);
  std::println("Classified {} files.", scores.size());
  return 0;
}

int run_cluster(const Options& opts) {
  std::vector<std::string> hints;
  if (fs::exists(opts.rules_config)) {
    auto rules = IOManager::load_rule_config(opts.rules_config);
    if (!rules) {
      return fail(std::format("Failed to load rule config '{}'.",
                              safe_path_to_string(opts.rules_config)));
    }
    hints = rules->project_hints;
  } else {
    hints = {"project"};
  }
  hints.insert(hints.end(), opts.extra_hints.begin(), opts.extra_hints.end());

  DocumentStore store(opts.cache_db);
  const auto documents = store.load_all();
  const ScoreMap scores = IOManager::load_score_map(opts.scores);
  const auto result =
      Clusterer(hints).cluster(make_cluster_inputs(documents, scores), scores);
  IOManager::save_cluster_result(opts.clusters, result);
  std::println("Clustered {} projects.", result.projects.size());
  return 0;
}

int run_organize(const Options& opts) {
  auto schema = IOManager::load_schema(opts.schema);
  if (!schema) {
    return fail(std::format("Failed to load schema '{}'.",
                            safe_path_to_string(opts.schema)));
  }
  if (!opts.target_override.empty()) {
    schema->target_root = path_from_utf8(opts.target_override);
  }
  if (!opts.mode_override.empty()) {
    auto mode = parse_transfer_mode(opts.mode_override);
    if (!mode) {
      return fail(std::format("Unknown mode '{}'; expected move or copy.",
                              opts.mode_override));
    }
    schema->mode = *mode;
  }
  if (!opts.conflict_override.empty()) {
    auto policy = parse_conflict_policy(opts.conflict_override);
    if (!policy) {
      return fail(std::format("Unsupported conflict policy '{}'.",
                              opts.conflict_override));
    }
    schema->conflict_policy = *policy;
  }
  schema->target_root = fs::absolute(schema->target_root);

  const ClusterResult clusters = IOManager::load_cluster_result(opts.clusters);
  DocumentStore store(opts.cache_db);
  const ScanIndex scan_index = make_scan_index(store.load_all());
  const ScoreMap scores = IOManager::load_score_map(opts.scores);

  std::vector<OrganizePlan> plans;
  if (!opts.from_plans.empty()) {
    // Reviewed plans are executed as written; nothing is re-planned.
    plans = IOManager::load_plans(path_from_utf8(opts.from_plans));
  } else {
    plans = Planner(*schema).build_plans(clusters, scores, scan_index);
    IOManager::save_plans(opts.plans_out, plans);
  }
  if (opts.dry_run) {
    std::println("Planned {} relocations; written to {}.", plans.size(),
                 safe_path_to_string(opts.plans_out));
    return 0;
  }

  Journal journal(opts.journal);
  const auto entries =
      Executor(journal, schema->mode, scan_index).execute_all(plans);
  std::println("Recorded {} {} operations in {}.", entries.size(),
               to_string(schema->mode), safe_path_to_string(opts.journal));
  return 0;
}

int run_report(const Options& opts) {
  const ClusterResult clusters = IOManager::load_cluster_result(opts.clusters);
  const auto entries = Journal(opts.journal).read_all();
  const json summary = Report::build_summary(clusters, entries);
  Report::write_reports(summary, opts.report_out);
  std::print("{}", Report::render_console(summary));
  std::println("Report written to {}", safe_path_to_string(opts.report_out));
  return 0;
}

int run_rollback(const Options& opts) {
  Journal journal(opts.journal);
  const auto summary = RollbackEngine(journal).run();
  std::println("Restored {} files ({} skipped, {} failed).", summary.restored,
               summary.skipped, summary.failed);
  return 0;
}
}  // namespace

int main(int argc, char* argv[]) {
  Options opts;
  CLI::App app{"Scan, classify, cluster and reorganize project files"};
  app.require_subcommand(1);
  app.add_flag("-v,--verbose", opts.verbose, "Echo log lines to stderr");
  app.add_option("--cache", opts.cache_db, "Document store path");

  auto* scan = app.add_subcommand("scan", "Scan paths into the document store");
  scan->add_option("-p,--path", opts.scan_paths, "Root paths to scan")
      ->required();
  scan->add_option("--max-size", opts.max_size, "Largest file to scan (bytes)");
  scan->add_option("--sample-bytes", opts.sample_bytes,
                   "Bytes of content sampled per file");
  scan->add_option("--out", opts.scan_out, "Snapshot export path");

  auto* rules = app.add_subcommand("rules", "Classify scanned files into buckets");
  rules->add_option("-c,--config", opts.rules_config, "Rule config (JSON)")
      ->required();
  rules->add_option("--emit", opts.scores, "Score output path");

  auto* cluster = app.add_subcommand("cluster", "Group files into projects");
  cluster->add_option("--rules", opts.rules_config,
                      "Rule config supplying project_hints");
  cluster->add_option("--hint", opts.extra_hints, "Extra project hint");
  cluster->add_option("--scores", opts.scores, "Score file");
  cluster->add_option("--out", opts.clusters, "Cluster output path");

  auto* organize = app.add_subcommand("organize", "Plan and execute relocation");
  organize->add_option("--clusters", opts.clusters, "Cluster file");
  organize->add_option("--schema", opts.schema, "Schema config (JSON)");
  organize->add_option("--target", opts.target_override, "Override target root");
  organize->add_option("--mode", opts.mode_override, "move or copy");
  organize->add_option("--conflict", opts.conflict_override,
                       "Conflict policy (suffix)");
  organize->add_option("--scores", opts.scores, "Score file");
  organize->add_option("--journal", opts.journal, "Journal path");
  organize->add_option("--plans", opts.plans_out, "Plan export path");
  organize->add_flag("--dry-run", opts.dry_run,
                     "Write the plans without moving anything");
  organize->add_option("--from-plans", opts.from_plans,
                       "Execute a previously exported plan file")
      ->excludes("--dry-run");

  auto* report = app.add_subcommand("report", "Summarize clusters and journal");
  report->add_option("--clusters", opts.clusters, "Cluster file");
  report->add_option("--journal", opts.journal, "Journal path");
  report->add_option("--out", opts.report_out, "HTML output path");

  auto* rollback = app.add_subcommand("rollback", "Undo a journal");
  rollback->add_option("journal", opts.journal, "Journal path");

  CLI11_PARSE(app, argc, argv);

  Exiv2::XmpParser::initialize();
  IOManager::initialize_logger();
  if (opts.verbose) {
    IOManager::set_log_handler(
        [](std::string_view line) { std::println(stderr, "{}", line); });
  }
  IOManager::log("--- Project organizer started ---");

  int rc = 0;
  try {
    if (*scan) {
      rc = run_scan(opts);
    } else if (*rules) {
      rc = run_rules(opts);
    } else if (*cluster) {
      rc = run_cluster(opts);
    } else if (*organize) {
      rc = run_organize(opts);
    } else if (*report) {
      rc = run_report(opts);
    } else if (*rollback) {
      rc = run_rollback(opts);
    }
  } catch (const ValidationError& e) {
    rc = fail(std::format("Invalid input: {}", e.what()));
  } catch (const std::exception& e) {
    rc = fail(std::format("FATAL EXCEPTION: {}", e.what()));
  }

  IOManager::log(std::format("--- Project organizer exited ({}) ---", rc));
  Exiv2::XmpParser::terminate();
  return rc;
}
