/***
 * Name: test_fs
 * Purpose: File reads and source collection from files and directory trees.
 */
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>
#include <vector>
#include "pysca/support/fs.h"

using namespace pysca;
namespace fs = std::filesystem;

static fs::path fresh_dir(const std::string& name) {
  const auto dir = fs::temp_directory_path() / ("pysca_fs_" + name);
  std::error_code ec;
  fs::remove_all(dir, ec);
  fs::create_directories(dir);
  return dir;
}

static void write_file(const fs::path& p, const std::string& s) {
  std::ofstream out(p, std::ios::binary); out << s;
}

TEST(SupportFs, ReadFileReturnsBytesUntranslated) {
  const auto dir = fresh_dir("read");
  write_file(dir / "a.py", "x = 1\r\n");
  std::string data, err;
  ASSERT_TRUE(support::ReadFile((dir / "a.py").string(), data, err));
  EXPECT_EQ(data, "x = 1\r\n");
}

TEST(SupportFs, ReadFileMissingReportsError) {
  std::string data, err;
  EXPECT_FALSE(support::ReadFile("/nonexistent/pysca/none.py", data, err));
  EXPECT_NE(err.find("failed to open file"), std::string::npos);
}

TEST(SupportFs, WriteThenRead) {
  const auto dir = fresh_dir("write");
  std::string err, back;
  ASSERT_TRUE(support::WriteFile((dir / "out.log").string(), "hello\n", err));
  ASSERT_TRUE(support::ReadFile((dir / "out.log").string(), back, err));
  EXPECT_EQ(back, "hello\n");
}

TEST(SupportFs, CollectSingleFile) {
  const auto dir = fresh_dir("single");
  write_file(dir / "only.py", "pass\n");
  std::vector<std::string> files;
  std::string err;
  ASSERT_TRUE(support::CollectSources((dir / "only.py").string(), files, err));
  ASSERT_EQ(files.size(), 1u);
  EXPECT_EQ(files[0], (dir / "only.py").string());
}

TEST(SupportFs, CollectDirectoryRecursiveSorted) {
  const auto dir = fresh_dir("tree");
  fs::create_directories(dir / "pkg" / "sub");
  write_file(dir / "z.py", "");
  write_file(dir / "a.py", "");
  write_file(dir / "notes.txt", "");
  write_file(dir / "pkg" / "sub" / "m.py", "");
  std::vector<std::string> files;
  std::string err;
  ASSERT_TRUE(support::CollectSources(dir.string(), files, err));
  const std::vector<std::string> expected{(dir / "a.py").string(), (dir / "pkg" / "sub" / "m.py").string(),
                                          (dir / "z.py").string()};
  EXPECT_EQ(files, expected);
}

TEST(SupportFs, CollectMissingPathFails) {
  std::vector<std::string> files;
  std::string err;
  EXPECT_FALSE(support::CollectSources("/nonexistent/pysca/tree", files, err));
  EXPECT_EQ(err, "Can't find given path");
}

TEST(SupportFs, CollectNonPythonFileFails) {
  const auto dir = fresh_dir("nonpy");
  write_file(dir / "readme.md", "# hi\n");
  std::vector<std::string> files;
  std::string err;
  EXPECT_FALSE(support::CollectSources((dir / "readme.md").string(), files, err));
  EXPECT_TRUE(files.empty());
}
