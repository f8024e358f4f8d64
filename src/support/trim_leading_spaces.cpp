/***
 * Name: pysca::support::TrimLeadingSpaces / TrimTrailingSpaces
 * Purpose: Remove leading or trailing ASCII whitespace from a string_view.
 * Inputs: text (by ref)
 * Outputs: text with prefix/suffix removed
 */
#include "pysca/support/text.h"

#include <cstddef>
#include <string_view>

namespace pysca {
namespace support {

bool IsSpace(const char chr) {
  return chr == ' ' || chr == '\t' || chr == '\n' || chr == '\r' || chr == '\f' || chr == '\v';
}

void TrimLeadingSpaces(std::string_view& text) {
  std::size_t index = 0;
  while (index < text.size() && IsSpace(text[index])) {
    ++index;
  }
  if (index > 0) {
    text.remove_prefix(index);
  }
}

void TrimTrailingSpaces(std::string_view& text) {
  std::size_t count = 0;
  while (count < text.size() && IsSpace(text[text.size() - 1 - count])) {
    ++count;
  }
  if (count > 0) {
    text.remove_suffix(count);
  }
}

}  // namespace support
}  // namespace pysca
