#include <gtest/gtest.h>

#include "../IOManager.hpp"
#include "TestSupport.hpp"

class IOManagerTest : public TempDirTest {};

TEST_F(IOManagerTest, LoadRuleConfigKeepsBucketOrderAndNormalizes) {
  const auto path = CreateFile("rules.json", R"({
    "buckets": {
      "zeta": {"exts": ["PY", ".Md"], "name_keywords": ["main"]},
      "alpha": {"code_hints": ["def "], "imports": ["numpy"]}
    },
    "weights": {"mimetype": 4, "name": 2},
    "project_hints": ["client", "sample"]
  })");

  auto config = IOManager::load_rule_config(path);

  ASSERT_TRUE(config.has_value());
  ASSERT_EQ(config->buckets.size(), 2u);
  EXPECT_EQ(config->buckets[0].name, "zeta");
  EXPECT_EQ(config->buckets[1].name, "alpha");
  EXPECT_EQ(config->buckets[0].exts,
            (std::vector<std::string>{".py", ".md"}));
  EXPECT_EQ(config->buckets[1].imports, std::vector<std::string>{"numpy"});
  EXPECT_TRUE(config->buckets[1].exts.empty());
  EXPECT_EQ(config->weight("ext"), 4);
  EXPECT_EQ(config->weight("name"), 2);
  EXPECT_EQ(config->weight("dir"), 1);
  EXPECT_EQ(config->project_hints,
            (std::vector<std::string>{"client", "sample"}));
}

TEST_F(IOManagerTest, LoadRuleConfigRejectsMalformedInput) {
  EXPECT_FALSE(IOManager::load_rule_config(test_dir / "absent.json"));
  EXPECT_FALSE(IOManager::load_rule_config(CreateFile("a.json", "{not json")));
  EXPECT_FALSE(
      IOManager::load_rule_config(CreateFile("b.json", R"({"weights": {}})")));
  EXPECT_FALSE(IOManager::load_rule_config(
      CreateFile("c.json", R"({"buckets": {"src": ["py"]}})")));
  EXPECT_FALSE(IOManager::load_rule_config(
      CreateFile("d.json", R"({"buckets": {"src": {"exts": [1]}}})")));
  EXPECT_FALSE(IOManager::load_rule_config(CreateFile(
      "e.json", R"({"buckets": {}, "weights": {"ext": "high"}})")));
}

TEST_F(IOManagerTest, LoadSchemaAppliesDefaults) {
  const auto path = CreateFile("schema.json", R"({
    "target_root": "organized",
    "structure": ["src/core", "docs"]
  })");

  auto schema = IOManager::load_schema(path);

  ASSERT_TRUE(schema.has_value());
  EXPECT_EQ(schema->target_root, fs::path("organized"));
  EXPECT_EQ(schema->structure.size(), 2u);
  EXPECT_EQ(schema->mode, TransferMode::MOVE);
  EXPECT_EQ(schema->conflict_policy, ConflictPolicy::SUFFIX);
}

TEST_F(IOManagerTest, LoadSchemaRejectsBadValues) {
  EXPECT_FALSE(IOManager::load_schema(
      CreateFile("a.json", R"({"structure": ["docs"]})")));
  EXPECT_FALSE(IOManager::load_schema(
      CreateFile("b.json", R"({"target_root": "out", "mode": "teleport"})")));
  EXPECT_FALSE(IOManager::load_schema(CreateFile(
      "c.json", R"({"target_root": "out", "conflict_policy": "overwrite"})")));

  auto copy = IOManager::load_schema(CreateFile(
      "d.json", R"({"target_root": "out", "mode": "COPY", "conflict_policy": "version"})"));
  ASSERT_TRUE(copy.has_value());
  EXPECT_EQ(copy->mode, TransferMode::COPY);
}

TEST_F(IOManagerTest, ScoreMapDefaultsMissingBucketToArchive) {
  const auto path = CreateFile("scores.json", R"({"scores": [
    {"doc_id": "a", "bucket": "src", "score": 3, "reasons": ["ext:py"]},
    {"doc_id": "b"}
  ]})");

  const ScoreMap map = IOManager::load_score_map(path);

  ASSERT_EQ(map.size(), 2u);
  EXPECT_EQ(map.at("a"), "src");
  EXPECT_EQ(map.at("b"), "archive");
  EXPECT_TRUE(IOManager::load_score_map(test_dir / "absent.json").empty());
}

TEST_F(IOManagerTest, SavedScoresLoadBack) {
  const fs::path path = test_dir / "out" / "scores.json";
  IOManager::save_scores(path, {BucketScore{"a", "docs", 5.0, {"ext:md"}}});

  const auto scores = IOManager::load_scores(path);

  ASSERT_EQ(scores.size(), 1u);
  EXPECT_EQ(scores[0].bucket, "docs");
  EXPECT_DOUBLE_EQ(scores[0].score, 5.0);
  EXPECT_EQ(scores[0].reasons, std::vector<std::string>{"ext:md"});
}

TEST_F(IOManagerTest, ClusterLoaderValidatesRecords) {
  EXPECT_TRUE(
      IOManager::load_cluster_result(test_dir / "absent.json").projects.empty());
  EXPECT_THROW(IOManager::load_cluster_result(CreateFile("a.json", "[]")),
               ValidationError);
  EXPECT_THROW(IOManager::load_cluster_result(CreateFile(
                   "b.json", R"({"projects": [{"project_id": "p"}]})")),
               ValidationError);
  EXPECT_THROW(IOManager::load_cluster_result(CreateFile(
                   "c.json", R"({"projects": [{"project_id": "p",
                     "project_label": "l", "doc_ids": "d1",
                     "role_bucket_map": {}, "confidence": 0.6}]})")),
               ValidationError);
}

TEST_F(IOManagerTest, ClusterResultSurvivesSaveAndLoad) {
  ClusterResult result;
  ClusterProject project;
  project.project_id = "project_001";
  project.project_label = "alpha";
  project.doc_ids = {"d1", "d2"};
  project.role_bucket_map = {{"d1", "src"}, {"d2", "docs"}};
  project.confidence = 0.7;
  project.reasons = {"grouped_by:alpha"};
  result.projects.push_back(project);
  const fs::path path = test_dir / "projects.json";

  IOManager::save_cluster_result(path, result);
  const auto loaded = IOManager::load_cluster_result(path);

  ASSERT_EQ(loaded.projects.size(), 1u);
  EXPECT_EQ(loaded.projects[0].doc_ids, project.doc_ids);
  EXPECT_EQ(loaded.projects[0].role_bucket_map, project.role_bucket_map);
  EXPECT_DOUBLE_EQ(loaded.projects[0].confidence, 0.7);
}

TEST(JournalEntryJsonTest, UnknownStatusIsRejected) {
  const json line = {{"original_path", "/a"}, {"target_path", "/b"},
                     {"doc_id", "d"},         {"content_digest", "x"},
                     {"project_id", "p"},     {"bucket", "docs"},
                     {"status", "vanished"},  {"timestamp", 1.0}};
  EXPECT_THROW(line.get<JournalEntry>(), ValidationError);

  json ok = line;
  ok["status"] = "copied";
  EXPECT_EQ(ok.get<JournalEntry>().status, JournalStatus::COPIED);
}

TEST(DocumentJsonTest, MissingRequiredFieldIsNamed) {
  const json record = {{"doc_id", "d"}, {"path", "/a"}};
  try {
    (void)record.get<Document>();
    FAIL() << "expected ValidationError";
  } catch (const ValidationError& e) {
    EXPECT_NE(std::string(e.what()).find("name"), std::string::npos);
  }
}

TEST_F(IOManagerTest, ExportedPlansLoadBack) {
  OrganizePlan plan{"d1",
                    "project_001",
                    "alpha",
                    "docs",
                    test_dir / "in" / "a.md",
                    test_dir / "out" / "alpha" / "docs" / "a.md",
                    "abcdef0"};
  const fs::path path = test_dir / ".cache" / "plans.json";

  IOManager::save_plans(path, {plan});
  const auto plans = IOManager::load_plans(path);

  ASSERT_EQ(plans.size(), 1u);
  EXPECT_EQ(plans[0].doc_id, "d1");
  EXPECT_EQ(plans[0].source_path, plan.source_path);
  EXPECT_EQ(plans[0].target_path, plan.target_path);
  EXPECT_EQ(plans[0].hash_suffix, "abcdef0");
}

TEST_F(IOManagerTest, MalformedPlanFileIsRejected) {
  EXPECT_THROW(IOManager::load_plans(test_dir / "absent.json"),
               ValidationError);
  EXPECT_THROW(IOManager::load_plans(CreateFile("a.json", R"({"plans": []})")),
               ValidationError);
  EXPECT_THROW(IOManager::load_plans(CreateFile(
                   "b.json", R"([{"doc_id": "d1", "project_id": "p",
                     "project_label": "l", "bucket": "docs",
                     "source_path": "/a", "hash_suffix": "abc"}])")),
               ValidationError);
}
