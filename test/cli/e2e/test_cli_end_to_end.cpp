/***
 * Name: test_cli_end_to_end
 * Purpose: Run the pysca binary: help, reports, exit codes, metrics and logs.
 */
#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>
#include <sys/wait.h>

namespace fs = std::filesystem;

static fs::path testing_dir() {
  const auto dir = fs::temp_directory_path() / "pysca_e2e";
  std::error_code ec;
  fs::create_directories(dir, ec);
  return dir;
}

static void write_file(const fs::path& path, const std::string& s) {
  std::ofstream out(path); out << s;
}

static std::string read_all(const fs::path& path) {
  std::ifstream in(path); std::string s, line; while (std::getline(in, line)) { s += line; s += '\n'; } return s;
}

// Runs pysca with the given arguments; returns its exit status.
static int run_pysca(const std::string& args, const fs::path& out, const fs::path& err) {
  const std::string cmd = std::string(PYSCA_BINARY) + " " + args + " > " + out.string() + " 2> " + err.string();
  const int rc = std::system(cmd.c_str());
  return WIFEXITED(rc) ? WEXITSTATUS(rc) : -1;
}

TEST(CLI_EndToEnd, HelpPrintsUsage) {
  const auto dir = testing_dir();
  ASSERT_EQ(run_pysca("--help", dir / "help.txt", dir / "help.err"), 0);
  EXPECT_NE(read_all(dir / "help.txt").find("pysca [options] <path>"), std::string::npos);
}

TEST(CLI_EndToEnd, UsageErrorsExitTwo) {
  const auto dir = testing_dir();
  EXPECT_EQ(run_pysca("", dir / "u.out", dir / "u.err"), 2);
  EXPECT_NE(read_all(dir / "u.err").find("pysca [options] <path>"), std::string::npos);
  EXPECT_EQ(run_pysca("--bogus x.py", dir / "u.out", dir / "u.err"), 2);
  EXPECT_NE(read_all(dir / "u.err").find("unknown option '--bogus'"), std::string::npos);
}

TEST(CLI_EndToEnd, MissingPathExitsOne) {
  const auto dir = testing_dir();
  EXPECT_EQ(run_pysca((dir / "nope" / "missing").string(), dir / "m.out", dir / "m.err"), 1);
  EXPECT_NE(read_all(dir / "m.err").find("Error: Can't find given path"), std::string::npos);
  EXPECT_TRUE(read_all(dir / "m.out").empty());
}

TEST(CLI_EndToEnd, ReportsDiagnosticsForFile) {
  const auto dir = testing_dir();
  const auto src = dir / "style.py";
  write_file(src, "def  foo():\n    pass\n");
  ASSERT_EQ(run_pysca(src.string(), dir / "r.out", dir / "r.err"), 0);
  EXPECT_EQ(read_all(dir / "r.out"), src.string() + ": Line 1: S007 Too many spaces after 'def'\n");
}

TEST(CLI_EndToEnd, DirectoryWithUnparsableFileExitsOne) {
  const auto dir = testing_dir() / "tree";
  std::error_code ec;
  fs::remove_all(dir, ec);
  fs::create_directories(dir / "pkg");
  write_file(dir / "a.py", "x = 1;\n");
  write_file(dir / "pkg" / "broken.py", "def f(:\n");
  const auto out = testing_dir() / "t.out";
  const auto err = testing_dir() / "t.err";
  EXPECT_EQ(run_pysca(dir.string(), out, err), 1);
  EXPECT_NE(read_all(out).find("a.py: Line 1: S003 Unnecessary semicolon"), std::string::npos);
  EXPECT_NE(read_all(err).find("broken.py:1:"), std::string::npos);
}

TEST(CLI_EndToEnd, MetricsJsonAndLogFiles) {
  const auto base = testing_dir();
  const auto logs = base / "logs";
  std::error_code ec;
  fs::remove_all(logs, ec);
  const auto src = base / "m.py";
  write_file(src, "def main():\n    return 1\n");
  const std::string args = "--metrics-json --log-lexer --log-diagnostics --log-path=" + logs.string() + " " +
                           src.string();
  ASSERT_EQ(run_pysca(args, base / "mj.out", base / "mj.err"), 0);
  const auto js = read_all(base / "mj.err");
  EXPECT_NE(js.find("\"durations_ms\""), std::string::npos);
  EXPECT_NE(js.find("\"parse\""), std::string::npos);
  EXPECT_NE(js.find("\"files.analyzed\": 1"), std::string::npos);
  bool sawLexer = false, sawDiagnostics = false, sawMetrics = false;
  for (const auto& entry : fs::directory_iterator(logs)) {
    const auto name = entry.path().filename().string();
    sawLexer = sawLexer || name.find("lexer.lex.log") != std::string::npos;
    sawDiagnostics = sawDiagnostics || name.find("diagnostics.log") != std::string::npos;
    sawMetrics = sawMetrics || name.find("metrics.json") != std::string::npos;
  }
  EXPECT_TRUE(sawLexer);
  EXPECT_TRUE(sawDiagnostics);
  EXPECT_TRUE(sawMetrics);
}
