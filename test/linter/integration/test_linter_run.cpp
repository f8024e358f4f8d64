/***
 * Name: test_linter_run
 * Purpose: In-process Linter::run over files and trees; output ordering and exit status.
 */
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <system_error>
#include "cli/Options.h"
#include "linter/Linter.h"

using namespace pysca;
namespace fs = std::filesystem;

static fs::path fresh_dir(const std::string& name) {
  const auto dir = fs::temp_directory_path() / ("pysca_linter_" + name);
  std::error_code ec;
  fs::remove_all(dir, ec);
  fs::create_directories(dir);
  return dir;
}

static void write_file(const fs::path& p, const std::string& s) {
  std::ofstream out(p); out << s;
}

static cli::Options optionsFor(const fs::path& input) {
  cli::Options o;
  o.inputs.push_back(input.string());
  return o;
}

TEST(LinterRun, FilesReportedInSortedPathOrder) {
  const auto dir = fresh_dir("order");
  write_file(dir / "b.py", "x = 1;\n");
  write_file(dir / "a.py", "# todo\n");
  testing::internal::CaptureStdout();
  const int rc = Linter::run(optionsFor(dir));
  const auto out = testing::internal::GetCapturedStdout();
  EXPECT_EQ(rc, 0);
  const std::string expected = (dir / "a.py").string() + ": Line 1: S005 TODO found\n" +
                               (dir / "b.py").string() + ": Line 1: S003 Unnecessary semicolon\n";
  EXPECT_EQ(out, expected);
}

TEST(LinterRun, FunctionScopeOptionReachesAnalyzer) {
  const auto dir = fresh_dir("scope");
  write_file(dir / "v.py", "ModVar = 1\n");
  auto opts = optionsFor(dir / "v.py");
  testing::internal::CaptureStdout();
  EXPECT_EQ(Linter::run(opts), 0);
  EXPECT_NE(testing::internal::GetCapturedStdout().find("S011"), std::string::npos);
  opts.functionScopeVars = true;
  testing::internal::CaptureStdout();
  EXPECT_EQ(Linter::run(opts), 0);
  EXPECT_TRUE(testing::internal::GetCapturedStdout().empty());
}

TEST(LinterRun, FailedFileIsReportedAndRunContinues) {
  const auto dir = fresh_dir("failed");
  write_file(dir / "bad.py", "if x\n    pass\n");
  write_file(dir / "good.py", "def Bad():\n    pass\n");
  testing::internal::CaptureStdout();
  testing::internal::CaptureStderr();
  const int rc = Linter::run(optionsFor(dir));
  const auto out = testing::internal::GetCapturedStdout();
  const auto err = testing::internal::GetCapturedStderr();
  EXPECT_EQ(rc, 1);
  EXPECT_NE(out.find("S009 Function name 'Bad' should use snake_case"), std::string::npos);
  EXPECT_NE(err.find("pysca: " + (dir / "bad.py").string() + ":1:"), std::string::npos);
}

TEST(LinterRun, MissingRootPath) {
  testing::internal::CaptureStderr();
  const int rc = Linter::run(optionsFor("/nonexistent/pysca/root"));
  EXPECT_EQ(rc, 1);
  EXPECT_EQ(testing::internal::GetCapturedStderr(), "Error: Can't find given path\n");
}

TEST(LinterRun, MetricsTextThenJsonOnStderr) {
  const auto dir = fresh_dir("metrics");
  write_file(dir / "m.py", "x = 1\n");
  auto opts = optionsFor(dir / "m.py");
  opts.metrics = true;
  opts.logPath = (dir / "logs").string();
  testing::internal::CaptureStderr();
  EXPECT_EQ(Linter::run(opts), 0);
  const auto err = testing::internal::GetCapturedStderr();
  const auto text = err.find("== Metrics ==");
  const auto json = err.find("\"durations_ms\"");
  ASSERT_NE(text, std::string::npos);
  ASSERT_NE(json, std::string::npos);
  EXPECT_LT(text, json);
  EXPECT_NE(err.find("files.analyzed = 1"), std::string::npos);
}

TEST(LinterRun, EmptyDirectoryHintsNoFiles) {
  const auto dir = fresh_dir("empty");
  auto opts = optionsFor(dir);
  opts.metricsJson = true;
  opts.logPath = (dir / "logs").string();
  testing::internal::CaptureStderr();
  EXPECT_EQ(Linter::run(opts), 0);
  EXPECT_NE(testing::internal::GetCapturedStderr().find("no_files_analyzed"), std::string::npos);
}

TEST(LinterRun, DiagnosticsLogMirrorsStdout) {
  const auto dir = fresh_dir("diaglog");
  write_file(dir / "d.py", "x = 1;\n");
  auto opts = optionsFor(dir / "d.py");
  opts.logDiagnostics = true;
  opts.logPath = (dir / "logs").string();
  testing::internal::CaptureStdout();
  EXPECT_EQ(Linter::run(opts), 0);
  const auto out = testing::internal::GetCapturedStdout();
  int logs = 0;
  for (const auto& entry : fs::directory_iterator(dir / "logs")) {
    const auto name = entry.path().filename().string();
    if (name.size() < 15 || name.compare(name.size() - 15, 15, "diagnostics.log") != 0) { continue; }
    std::ifstream in(entry.path());
    const std::string body((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_EQ(body, out);
    ++logs;
  }
  EXPECT_EQ(logs, 1);
}

TEST(LinterRun, UnwritableLogPathIsReportedAndRunSucceeds) {
  const auto dir = fresh_dir("badlog");
  fs::create_directories(dir / "src");
  write_file(dir / "src" / "u.py", "x = 1;\n");
  write_file(dir / "blocker.txt", "not a directory\n");
  auto opts = optionsFor(dir / "src" / "u.py");
  opts.logLexer = true;
  opts.logDiagnostics = true;
  opts.metricsJson = true;
  opts.logPath = (dir / "blocker.txt").string();
  testing::internal::CaptureStdout();
  testing::internal::CaptureStderr();
  const int rc = Linter::run(opts);
  const auto err = testing::internal::GetCapturedStderr();
  const auto out = testing::internal::GetCapturedStdout();
  EXPECT_EQ(rc, 0);
  EXPECT_NE(out.find("S003 Unnecessary semicolon"), std::string::npos);
  EXPECT_NE(err.find("pysca: failed to open lexer log"), std::string::npos);
  EXPECT_NE(err.find("pysca: failed to open file for writing: "), std::string::npos);
  EXPECT_NE(err.find("diagnostics.log"), std::string::npos);
  EXPECT_NE(err.find("metrics.json"), std::string::npos);
}
