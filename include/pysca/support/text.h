/***
 * Name: pysca::support (text)
 * Purpose: Small helpers for line-oriented text handling.
 * Inputs: std::string_view values
 * Outputs: Views, copies and counts
 * Theory of Operation: ASCII whitespace semantics throughout; lengths are
 *   counted in code points so multi-byte UTF-8 characters count once.
 */
#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace pysca {
namespace support {

/*** IsSpace: True for ' ', '\t', '\n', '\r', '\f', '\v'. */
bool IsSpace(char chr);

/*** TrimLeadingSpaces: Remove leading ASCII whitespace from view. */
void TrimLeadingSpaces(std::string_view& text);

/*** TrimTrailingSpaces: Remove trailing ASCII whitespace from view. */
void TrimTrailingSpaces(std::string_view& text);

/*** Utf8Length: Number of code points in a UTF-8 byte sequence. */
std::size_t Utf8Length(std::string_view text);

/*** ToLowerAscii: Lowercase copy (ASCII letters only). */
std::string ToLowerAscii(std::string_view text);

/***
 * SplitLines: Split on "\n", "\r\n" or "\r". Each terminated line keeps a
 * single "\n" terminator; a final unterminated line is kept as-is.
 */
std::vector<std::string> SplitLines(std::string_view text);

}  // namespace support
}  // namespace pysca
