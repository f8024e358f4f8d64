/***
 * Name: test_metrics
 * Purpose: Stage timers, counters, geometry accumulation, summaries and hints.
 */
#include <gtest/gtest.h>
#include <string>
#include "observability/Metrics.h"

using namespace pysca;

TEST(Metrics, StagesAccumulateAcrossFiles) {
  obs::Metrics m;
  {
    obs::ScopedStage s(&m, "Parse");
  }
  {
    obs::ScopedStage s(&m, "Parse");
  }
  EXPECT_EQ(m.durations().size(), 1u);
  EXPECT_EQ(m.durations().count("Parse"), 1u);
}

TEST(Metrics, StopWithoutStartIsIgnored) {
  obs::Metrics m;
  m.stop("Read");
  EXPECT_TRUE(m.durations().empty());
}

TEST(Metrics, NullMetricsScopedStageIsNoop) {
  obs::ScopedStage s(nullptr, "Extract");
  SUCCEED();
}

TEST(Metrics, CountersAndGeometry) {
  obs::Metrics m;
  m.incCounter("diagnostics.S001");
  m.incCounter("diagnostics.S001", 2);
  EXPECT_EQ(m.counter("diagnostics.S001"), 3u);
  EXPECT_EQ(m.counter("missing"), 0u);
  m.addAstGeometry({10, 3});
  m.addAstGeometry({5, 7});
  ASSERT_TRUE(m.astGeometry().has_value());
  EXPECT_EQ(m.astGeometry()->nodes, 15u);
  EXPECT_EQ(m.astGeometry()->maxDepth, 7u);
}

TEST(Metrics, TextSummary) {
  obs::Metrics m;
  m.start("LineChecks");
  m.stop("LineChecks");
  m.incCounter("files.analyzed");
  const auto txt = m.summaryText();
  EXPECT_NE(txt.find("== Metrics =="), std::string::npos);
  EXPECT_NE(txt.find("LineChecks:"), std::string::npos);
  EXPECT_NE(txt.find("files.analyzed = 1"), std::string::npos);
}

TEST(Metrics, JsonSummaryUsesLowercaseStageKeys) {
  obs::Metrics m;
  m.start("Parse");
  m.stop("Parse");
  m.addAstGeometry({4, 2});
  m.incCounter("diagnostics.total", 2);
  const auto js = m.summaryJson();
  EXPECT_NE(js.find("\"durations_ms\""), std::string::npos);
  EXPECT_NE(js.find("\"parse\""), std::string::npos);
  EXPECT_NE(js.find("\"ast\": { \"nodes\": 4, \"max_depth\": 2 }"), std::string::npos);
  EXPECT_NE(js.find("\"diagnostics.total\": 2"), std::string::npos);
  EXPECT_NE(js.find("\"hints\": [\"diagnostics_present\"]"), std::string::npos);
}

TEST(Metrics, Hints) {
  obs::Metrics m;
  EXPECT_TRUE(m.hints().empty());
  m.incCounter("files.analyzed", 0);
  ASSERT_EQ(m.hints().size(), 1u);
  EXPECT_EQ(m.hints()[0], "no_files_analyzed");
  m.incCounter("files.analyzed");
  m.incCounter("files.failed");
  ASSERT_EQ(m.hints().size(), 1u);
  EXPECT_EQ(m.hints()[0], "unparsed_files");
}
