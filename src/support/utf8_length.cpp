/***
 * Name: pysca::support::Utf8Length / ToLowerAscii
 * Purpose: Character-level helpers for line checks.
 * Theory of Operation: Utf8Length counts every byte that is not a UTF-8
 *   continuation byte (10xxxxxx). Invalid sequences degrade to byte counts.
 */
#include "pysca/support/text.h"

#include <cstddef>
#include <string>
#include <string_view>

namespace pysca {
namespace support {

std::size_t Utf8Length(const std::string_view text) {
  std::size_t count = 0;
  for (const char chr : text) {
    if ((static_cast<unsigned char>(chr) & 0xC0U) != 0x80U) { ++count; }
  }
  return count;
}

std::string ToLowerAscii(const std::string_view text) {
  std::string out(text);
  for (auto& chr : out) {
    if (chr >= 'A' && chr <= 'Z') { chr = static_cast<char>(chr - 'A' + 'a'); }
  }
  return out;
}

}  // namespace support
}  // namespace pysca
