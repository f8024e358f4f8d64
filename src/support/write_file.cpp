/***
 * Name: pysca::support::WriteFile
 * Purpose: Write a string to a file, truncating existing content.
 * Inputs:
 *   - path: destination path
 *   - data: bytes to write
 * Outputs:
 *   - err: error message on failure
 */
#include "pysca/support/fs.h"

#include <fstream>
#include <ios>
#include <string>

namespace pysca {
namespace support {

bool WriteFile(const std::string& path, const std::string& data, std::string& err) {
  std::ofstream file_stream(path, std::ios::out | std::ios::binary | std::ios::trunc);
  if (!file_stream.good()) {
    err = "failed to open file for writing: " + path;
    return false;
  }
  file_stream << data;
  file_stream.flush();
  if (!file_stream.good()) {
    err = "failed to write file: " + path;
    return false;
  }
  return true;
}

}  // namespace support
}  // namespace pysca
