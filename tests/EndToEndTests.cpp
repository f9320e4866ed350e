#include <gtest/gtest.h>

#include "../Clusterer.hpp"
#include "../DocumentStore.hpp"
#include "../Executor.hpp"
#include "../IOManager.hpp"
#include "../Report.hpp"
#include "../Rollback.hpp"
#include "../RuleEngine.hpp"
#include "../Scanner.hpp"
#include "TestSupport.hpp"

// Runs every stage the way the CLI chains them: scan, classify, cluster,
// plan, execute, report and roll back.
class EndToEndTest : public TempDirTest {
 protected:
  void SetUp() override {
    TempDirTest::SetUp();
    app = CreateFile("sample/app.py",
                     "import os\n\nif __name__ == \"__main__\":\n    main()\n");
    readme = CreateFile("sample/README.md", "# Sample\n\nSome notes.\n");

    scan_config.roots = {test_dir / "sample"};
    scan_config.cache_path = test_dir / ".cache" / "scan.db";
    scan_config.output_path = test_dir / ".cache" / "scan_results.json";

    CreateFile("rules.json", R"({
      "buckets": {
        "scripts": {"code_hints": ["if __name__ == \"__main__\":"]}
      },
      "weights": {"content": 3},
      "project_hints": ["sample"]
    })");
    CreateFile("schema.json", std::format(R"({{
      "target_root": "{}",
      "structure": ["src/core", "docs", "scripts"],
      "conflict_policy": "suffix",
      "mode": "move"
    }})",
                                          safe_path_to_string(test_dir / "organized")));
  }

  fs::path app;
  fs::path readme;
  ScanConfig scan_config;
};

TEST_F(EndToEndTest, OrganizeThenRollbackRestoresTree) {
  const auto documents = Scanner(scan_config).scan();
  ASSERT_EQ(documents.size(), 2u);

  auto rules = IOManager::load_rule_config(test_dir / "rules.json");
  ASSERT_TRUE(rules.has_value());
  DocumentStore store(scan_config.cache_path);
  const auto stored = store.load_all();
  ASSERT_EQ(stored.size(), 2u);

  const auto scores = RuleEngine(*rules).classify_all(stored);
  const fs::path scores_path = test_dir / ".cache" / "scores.json";
  IOManager::save_scores(scores_path, scores);
  const ScoreMap score_map = IOManager::load_score_map(scores_path);
  for (const auto& doc : stored) {
    const std::string expected = doc.path == app ? "scripts" : "archive";
    EXPECT_EQ(score_map.at(doc.doc_id), expected) << doc.name;
  }

  const auto clusters = Clusterer(rules->project_hints)
                            .cluster(make_cluster_inputs(stored, score_map),
                                     score_map);
  ASSERT_EQ(clusters.projects.size(), 1u);
  EXPECT_EQ(clusters.projects[0].project_id, "project_001");
  EXPECT_EQ(clusters.projects[0].project_label, "sample");
  EXPECT_EQ(clusters.projects[0].doc_ids.size(), 2u);

  auto schema = IOManager::load_schema(test_dir / "schema.json");
  ASSERT_TRUE(schema.has_value());
  const ScanIndex index = make_scan_index(stored);
  const auto plans = Planner(*schema).build_plans(clusters, score_map, index);
  ASSERT_EQ(plans.size(), 2u);

  Journal journal(test_dir / ".cache" / "journal.jsonl");
  const auto entries =
      Executor(journal, schema->mode, index).execute_all(plans);
  ASSERT_EQ(entries.size(), 2u);
  for (const auto& entry : entries) {
    EXPECT_EQ(entry.status, JournalStatus::MOVED);
    EXPECT_TRUE(fs::exists(entry.target_path));
  }
  const fs::path project_root = test_dir / "organized" / "sample";
  EXPECT_TRUE(fs::exists(project_root / "scripts" / "app.py"));
  EXPECT_TRUE(fs::exists(project_root / "archive" / "README.md"));
  EXPECT_FALSE(fs::exists(app));
  EXPECT_FALSE(fs::exists(readme));

  const json summary = Report::build_summary(clusters, journal.read_all());
  EXPECT_EQ(summary.at("status_totals").at("moved").get<std::size_t>(), 2u);
  EXPECT_EQ(summary.at("project_totals").at("project_001").get<std::size_t>(),
            2u);
  const fs::path report_path = test_dir / "reports" / "projects_summary.html";
  Report::write_reports(summary, report_path);
  EXPECT_NE(ReadFile(report_path).find("sample"), std::string::npos);
  EXPECT_EQ(ReadFile(test_dir / "reports" / "projects_summary.csv"),
            "project_id,count\nproject_001,2\n");
  EXPECT_TRUE(fs::exists(test_dir / "reports" / "projects_summary.json"));
  EXPECT_NE(Report::render_console(summary).find("project_001"),
            std::string::npos);

  const auto summary_back = RollbackEngine(journal).run();
  EXPECT_EQ(summary_back.restored, 2u);
  EXPECT_EQ(ReadFile(app),
            "import os\n\nif __name__ == \"__main__\":\n    main()\n");
  EXPECT_EQ(ReadFile(readme), "# Sample\n\nSome notes.\n");
  EXPECT_FALSE(fs::exists(project_root / "scripts" / "app.py"));
}

TEST_F(EndToEndTest, CopyModeLeavesSourcesInPlace) {
  const auto documents = Scanner(scan_config).scan();
  auto rules = IOManager::load_rule_config(test_dir / "rules.json");
  ASSERT_TRUE(rules.has_value());
  const ScoreMap score_map = [&] {
    ScoreMap map;
    for (const auto& score : RuleEngine(*rules).classify_all(documents)) {
      map[score.doc_id] = score.bucket;
    }
    return map;
  }();
  const auto clusters = Clusterer(rules->project_hints)
                            .cluster(make_cluster_inputs(documents, score_map),
                                     score_map);

  SchemaConfig schema;
  schema.target_root = test_dir / "copies";
  schema.mode = TransferMode::COPY;
  const ScanIndex index = make_scan_index(documents);
  const auto plans = Planner(schema).build_plans(clusters, score_map, index);
  Journal journal(test_dir / "journal.jsonl");
  const auto entries = Executor(journal, schema.mode, index).execute_all(plans);

  ASSERT_EQ(entries.size(), 2u);
  for (const auto& entry : entries) {
    EXPECT_EQ(entry.status, JournalStatus::COPIED);
    EXPECT_TRUE(fs::exists(entry.original_path));
    EXPECT_TRUE(fs::exists(entry.target_path));
  }
}
