/***
 * Name: pysca::support::CollectSources
 * Purpose: Turn the user-supplied root path into the ordered list of files to check.
 * Inputs:
 *   - root: a .py file or a directory
 * Outputs:
 *   - out: lexicographically sorted file paths
 *   - err: error message when root is neither
 * Theory of Operation: std::filesystem recursive walk with error codes (no throws);
 *   entries that cannot be stat'ed are skipped.
 */
#include "pysca/support/fs.h"

#include <algorithm>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace pysca {
namespace support {

namespace {
constexpr std::string_view kSourceExt = ".py";

bool hasSourceExt(const std::string& path) {
  return path.size() >= kSourceExt.size() &&
         path.compare(path.size() - kSourceExt.size(), kSourceExt.size(), kSourceExt) == 0;
}
} // namespace

bool CollectSources(const std::string& root, std::vector<std::string>& out, std::string& err) {
  namespace fs = std::filesystem;
  std::error_code errCode;
  if (fs::is_regular_file(root, errCode) && hasSourceExt(root)) {
    out.push_back(root);
    return true;
  }
  if (!fs::is_directory(root, errCode)) {
    err = "Can't find given path";
    return false;
  }
  auto iter = fs::recursive_directory_iterator(root, fs::directory_options::skip_permission_denied, errCode);
  if (errCode) {
    err = "failed to read directory '" + root + "': " + errCode.message();
    return false;
  }
  for (const auto end = fs::recursive_directory_iterator(); iter != end; iter.increment(errCode)) {
    if (errCode) { break; }
    std::error_code entryErr;
    if (!iter->is_regular_file(entryErr) || entryErr) { continue; }
    const std::string path = iter->path().string();
    if (hasSourceExt(path)) { out.push_back(path); }
  }
  if (errCode) {
    err = "failed to walk directory '" + root + "': " + errCode.message();
    return false;
  }
  std::sort(out.begin(), out.end());
  return true;
}

}  // namespace support
}  // namespace pysca
