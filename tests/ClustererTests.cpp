#include <gtest/gtest.h>

#include <algorithm>
#include <random>

#include "../Clusterer.hpp"

TEST(ClustererLabelTest, PrefersHintSegment) {
  Clusterer clusterer({"Sample", "other"});
  EXPECT_EQ(clusterer.infer_project_label("/home/user/sample/src/pkg"),
            "sample");
}

TEST(ClustererLabelTest, JoinsLastTwoLongSegments) {
  Clusterer clusterer({});
  EXPECT_EQ(clusterer.infer_project_label("/home/user/work/alpha"),
            "work_alpha");
  // Segments of two characters or fewer do not count.
  EXPECT_EQ(clusterer.infer_project_label("/home/user/work/alpha/v2"),
            "work_alpha");
}

TEST(ClustererLabelTest, SingleSegmentAndGeneralFallback) {
  Clusterer clusterer({});
  EXPECT_EQ(clusterer.infer_project_label("/data"), "data");
  EXPECT_EQ(clusterer.infer_project_label("/"), "general_project");
  EXPECT_EQ(clusterer.infer_project_label("/a/b"), "general_project");
}

TEST(ClustererLabelTest, NormalizesLabels) {
  EXPECT_EQ(Clusterer::normalize_label("My Project (v2)!"), "my_project_v2");
  EXPECT_EQ(Clusterer::normalize_label("__keep-dash__"), "keep-dash");
  Clusterer clusterer({});
  EXPECT_EQ(clusterer.infer_project_label("/srv/Client Work/Site.Build"),
            "client_work_site_build");
}

TEST(ClustererConfidenceTest, GrowsWithSizeAndCaps) {
  EXPECT_DOUBLE_EQ(Clusterer::confidence_for(1), 0.65);
  EXPECT_DOUBLE_EQ(Clusterer::confidence_for(4), 0.8);
  EXPECT_DOUBLE_EQ(Clusterer::confidence_for(7), 0.95);
  EXPECT_DOUBLE_EQ(Clusterer::confidence_for(8), 1.0);
  EXPECT_DOUBLE_EQ(Clusterer::confidence_for(50), 1.0);
}

class ClustererGroupingTest : public ::testing::Test {
 protected:
  std::vector<ClusterInput> inputs = {
      {"d1", "/work/zeta/app/main.py", "src"},
      {"d2", "/work/zeta/app/util.py", "src"},
      {"d3", "/work/beta/docs/readme.md", "docs"},
      {"d4", "/work/beta/docs/guide.md", "docs"},
      {"d5", "/work/beta/docs/faq.md", "docs"},
  };
};

TEST_F(ClustererGroupingTest, AssignsIdsInSortedLabelOrder) {
  const ClusterResult result = Clusterer({}).cluster(inputs, {});

  ASSERT_EQ(result.projects.size(), 2u);
  EXPECT_EQ(result.projects[0].project_id, "project_001");
  EXPECT_EQ(result.projects[0].project_label, "beta_docs");
  EXPECT_EQ(result.projects[0].doc_ids,
            (std::vector<std::string>{"d5", "d4", "d3"}));
  EXPECT_DOUBLE_EQ(result.projects[0].confidence, 0.75);
  EXPECT_EQ(result.projects[0].reasons,
            (std::vector<std::string>{"grouped_by:beta_docs", "docs:3"}));

  EXPECT_EQ(result.projects[1].project_id, "project_002");
  EXPECT_EQ(result.projects[1].project_label, "zeta_app");
  EXPECT_EQ(result.projects[1].doc_ids,
            (std::vector<std::string>{"d1", "d2"}));
}

TEST_F(ClustererGroupingTest, RoleMapPrefersScoreMap) {
  const ScoreMap scores = {{"d1", "scripts"}};
  const ClusterResult result = Clusterer({}).cluster(inputs, scores);

  const auto& zeta = result.projects[1];
  EXPECT_EQ(zeta.role_bucket_map.at("d1"), "scripts");
  EXPECT_EQ(zeta.role_bucket_map.at("d2"), "src");
}

TEST_F(ClustererGroupingTest, DeterministicRegardlessOfInputOrder) {
  Clusterer clusterer({"zeta"});
  const ClusterResult expected = clusterer.cluster(inputs, {});

  std::mt19937 rng(42);
  for (int round = 0; round < 5; ++round) {
    auto shuffled = inputs;
    std::shuffle(shuffled.begin(), shuffled.end(), rng);
    const ClusterResult again = clusterer.cluster(shuffled, {});
    ASSERT_EQ(again.projects.size(), expected.projects.size());
    for (size_t i = 0; i < again.projects.size(); ++i) {
      EXPECT_EQ(again.projects[i].project_id, expected.projects[i].project_id);
      EXPECT_EQ(again.projects[i].project_label,
                expected.projects[i].project_label);
      EXPECT_EQ(again.projects[i].doc_ids, expected.projects[i].doc_ids);
    }
  }
  EXPECT_EQ(expected.projects[1].project_label, "zeta");
}

TEST(ClusterInputTest, BucketsComeFromScoreMapWithArchiveFallback) {
  Document a;
  a.doc_id = "a";
  a.path = "/x/a.txt";
  Document b;
  b.doc_id = "b";
  b.path = "/x/b.txt";

  const auto inputs = make_cluster_inputs({a, b}, {{"a", "docs"}});
  ASSERT_EQ(inputs.size(), 2u);
  EXPECT_EQ(inputs[0].bucket, "docs");
  EXPECT_EQ(inputs[1].bucket, "archive");
}
