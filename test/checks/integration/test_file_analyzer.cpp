/***
 * Name: test_file_analyzer
 * Purpose: End-to-end analysis of one file: merging, ordering, errors and sinks.
 */
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>
#include "checks/FileAnalyzer.h"
#include "observability/Metrics.h"
#include "pysca/exceptions/file_read_error.h"
#include "pysca/exceptions/parse_error.h"

using namespace pysca;
using checks::DiagnosticCode;
namespace fs = std::filesystem;

static std::vector<std::string> report(const checks::AnalysisResult& r) {
  std::vector<std::string> out;
  for (const auto& d : r.diagnostics) { out.push_back(d.format()); }
  return out;
}

TEST(FileAnalyzer, ExtraSpacesAfterDef) {
  const checks::FileAnalyzer a;
  const auto r = a.analyzeText("t.py", "def  foo():\n    pass\n");
  const std::vector<std::string> expected{"t.py: Line 1: S007 Too many spaces after 'def'"};
  EXPECT_EQ(report(r), expected);
}

TEST(FileAnalyzer, FourBlankLinesFlagOnlyTheNextLine) {
  const checks::FileAnalyzer a;
  const auto r = a.analyzeText("t.py", "import os\n\n\n\n\nx = 1\n\n\ny = 2\n");
  const std::vector<std::string> expected{"t.py: Line 6: S006 More than two blank lines found before this line"};
  EXPECT_EQ(report(r), expected);
}

TEST(FileAnalyzer, CleanFileHasNoDiagnostics) {
  const checks::FileAnalyzer a;
  const auto r = a.analyzeText("ok.py",
                               "import sys\n\n\nclass Greeter:\n    def greet(self, name):\n"
                               "        message = 'hi ' + name  # build\n        return message\n");
  EXPECT_EQ(r.file, "ok.py");
  EXPECT_TRUE(r.diagnostics.empty());
}

TEST(FileAnalyzer, TreeDiagnosticsPrecedeLineDiagnosticsOnSameLine) {
  const checks::FileAnalyzer a;
  const auto r = a.analyzeText("t.py", "def f(a=[]):  # todo\n    pass\n");
  ASSERT_EQ(r.diagnostics.size(), 2u);
  EXPECT_EQ(r.diagnostics[0].code(), DiagnosticCode::MutableDefaultArgument);
  EXPECT_EQ(r.diagnostics[1].code(), DiagnosticCode::TodoFound);
}

TEST(FileAnalyzer, MutableDefaultCoversPositionalDefaultsOnly) {
  const checks::FileAnalyzer a;
  const auto r = a.analyzeText("t.py",
                               "def f(*, x=[]):\n    pass\n\n\n"
                               "def g(x=-1):\n    pass\n\n\n"
                               "h = lambda X: X\n");
  ASSERT_EQ(r.diagnostics.size(), 1u);
  EXPECT_EQ(r.diagnostics[0].code(), DiagnosticCode::MutableDefaultArgument);
  EXPECT_EQ(r.diagnostics[0].line(), 5);
}

TEST(FileAnalyzer, SortedByLineAcrossProducers) {
  const checks::FileAnalyzer a;
  const auto r = a.analyzeText("t.py", "x = 1;\nMyVar = 2\nclass bad_name:\n    pass\n");
  const std::vector<std::string> expected{
      "t.py: Line 1: S003 Unnecessary semicolon",
      "t.py: Line 2: S011 Variable 'MyVar' should be snake_case",
      "t.py: Line 3: S008 Class name 'bad_name' should use CamelCase",
  };
  EXPECT_EQ(report(r), expected);
}

TEST(FileAnalyzer, FunctionScopeOption) {
  const std::string src = "TopLevel = 1\ndef f():\n    Inner = 2\n";
  const checks::FileAnalyzer everywhere;
  EXPECT_EQ(everywhere.analyzeText("t.py", src).diagnostics.size(), 2u);
  const checks::FileAnalyzer scoped(checks::AnalyzerOptions{true});
  const auto r = scoped.analyzeText("t.py", src);
  ASSERT_EQ(r.diagnostics.size(), 1u);
  EXPECT_EQ(r.diagnostics[0].line(), 3);
}

TEST(FileAnalyzer, MultiLineStringLinesAreStillChecked) {
  const checks::FileAnalyzer a;
  const auto r = a.analyzeText("t.py", "s = '''\n   odd indent\n'''\n");
  ASSERT_EQ(r.diagnostics.size(), 1u);
  EXPECT_EQ(r.diagnostics[0].code(), DiagnosticCode::BadIndentation);
  EXPECT_EQ(r.diagnostics[0].line(), 2);
}

TEST(FileAnalyzer, ByteOrderMarkAndCrlf) {
  const checks::FileAnalyzer a;
  const auto r = a.analyzeText("t.py", "\xEF\xBB\xBFx = 1\r\ny = 2\r\n");
  EXPECT_TRUE(r.diagnostics.empty());
}

TEST(FileAnalyzer, ParseErrorYieldsNoResult) {
  const checks::FileAnalyzer a;
  EXPECT_THROW((void)a.analyzeText("bad.py", "def f(:\n    pass\n"), exceptions::ParseError);
  EXPECT_THROW((void)a.analyzeText("bad.py", "x = (1,\n"), exceptions::ParseError);
}

TEST(FileAnalyzer, MissingAndNonRegularPaths) {
  const checks::FileAnalyzer a;
  try {
    (void)a.analyze("/nonexistent/pysca/missing.py");
    FAIL() << "expected FileReadError";
  } catch (const exceptions::FileReadError& ex) {
    EXPECT_NE(std::string(ex.what()).find("does not exist"), std::string::npos);
  }
  const auto dir = fs::temp_directory_path() / "pysca_analyzer_dir.py";
  std::error_code ec;
  fs::create_directories(dir, ec);
  try {
    (void)a.analyze(dir.string());
    FAIL() << "expected FileReadError";
  } catch (const exceptions::FileReadError& ex) {
    EXPECT_NE(std::string(ex.what()).find("is not a file"), std::string::npos);
  }
}

TEST(FileAnalyzer, AnalyzeFromDiskRecordsMetrics) {
  const auto path = fs::temp_directory_path() / "pysca_analyzer_metrics.py";
  {
    std::ofstream out(path, std::ios::binary);
    out << "def  Foo(Arg):\n    return Arg\n";
  }
  obs::Metrics m;
  const checks::FileAnalyzer a({}, &m);
  const auto r = a.analyze(path.string());
  EXPECT_EQ(r.file, path.string());
  EXPECT_EQ(r.diagnostics.size(), 3u);  // S010, S007, S009
  EXPECT_EQ(m.counter("files.analyzed"), 1u);
  EXPECT_EQ(m.counter("diagnostics.total"), 3u);
  EXPECT_EQ(m.counter("diagnostics.S007"), 1u);
  EXPECT_GT(m.counter("lex.tokens"), 0u);
  for (const char* stage : {"Read", "Parse", "Extract", "LineChecks"}) {
    EXPECT_EQ(m.durations().count(stage), 1u) << stage;
  }
  ASSERT_TRUE(m.astGeometry().has_value());
  EXPECT_GT(m.astGeometry()->nodes, 1u);
}

TEST(FileAnalyzer, TokenLogSink) {
  std::ostringstream log;
  checks::FileAnalyzer a;
  a.setTokenLog(&log);
  (void)a.analyzeText("tok.py", "x = 1\n");
  const auto text = log.str();
  EXPECT_NE(text.find("tok.py:1:1 Ident x"), std::string::npos);
  EXPECT_NE(text.find("End"), std::string::npos);
}
