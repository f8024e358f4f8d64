/***
 * Name: pysca::support::ReadFile
 * Purpose: Read the full contents of a source file into a string.
 * Inputs:
 *   - path: filesystem path to read
 * Outputs:
 *   - out: populated with file contents on success
 *   - err: error message on failure
 * Theory of Operation: Uses std::ifstream in binary mode with exceptions disabled;
 *   newline translation is left to SplitLines.
 */
// NOLINTNEXTLINE(misc-include-cleaner) - include interface to ensure signature stays in sync
#include "pysca/support/fs.h"

#include <fstream>
#include <ios>
#include <sstream>
#include <string>

namespace pysca {
namespace support {

bool ReadFile(const std::string& path, std::string& out, std::string& err) {
  const std::ifstream file_stream(path, std::ios::in | std::ios::binary);
  if (!file_stream.good()) {
    err = "failed to open file: " + path;
    return false;
  }
  std::ostringstream stream;
  stream << file_stream.rdbuf();
  if (file_stream.bad()) {
    err = "failed to read file: " + path;
    return false;
  }
  out = stream.str();
  return true;
}

}  // namespace support
}  // namespace pysca
