/***
 * Name: pysca::support::SplitLines
 * Purpose: Split file contents into raw lines using universal newlines.
 * Inputs: text
 * Outputs: ordered lines, each terminated line ending in exactly one '\n'
 */
#include "pysca/support/text.h"

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace pysca {
namespace support {

std::vector<std::string> SplitLines(const std::string_view text) {
  std::vector<std::string> lines;
  std::string current;
  for (std::size_t i = 0; i < text.size(); ++i) {
    const char chr = text[i];
    if (chr == '\r') {
      if (i + 1 < text.size() && text[i + 1] == '\n') { ++i; }
      current.push_back('\n');
      lines.push_back(std::move(current));
      current.clear();
      continue;
    }
    current.push_back(chr);
    if (chr == '\n') {
      lines.push_back(std::move(current));
      current.clear();
    }
  }
  if (!current.empty()) { lines.push_back(std::move(current)); }
  return lines;
}

}  // namespace support
}  // namespace pysca
