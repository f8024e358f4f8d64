/***
 * Name: pysca::checks::DiagnosticCode
 * Purpose: The twelve fixed diagnostic kinds.
 * Theory of Operation:
 *   Codes 1-9 belong to line checkers, 10-12 to the syntax fact extractor;
 *   neither producer emits the other's codes. The numeric value is the wire
 *   code rendered as S001..S012.
 */
#pragma once

#include <string>
#include <string_view>

namespace pysca::checks {

enum class DiagnosticCode : int {
  LineTooLong = 1,
  BadIndentation = 2,
  UnnecessarySemicolon = 3,
  InlineCommentSpacing = 4,
  TodoFound = 5,
  TooManyBlankLines = 6,
  ExtraSpacesAfterKeyword = 7,
  ClassNameNotCamelCase = 8,
  FunctionNameNotSnakeCase = 9,
  ArgumentNameNotSnakeCase = 10,
  VariableNameNotSnakeCase = 11,
  MutableDefaultArgument = 12
};

// "S001" .. "S012"
std::string CodeLabel(DiagnosticCode code);

// Fixed message for codes whose text never varies; empty for the
// name-carrying codes (7-11), whose message is rendered per occurrence.
std::string_view DefaultMessage(DiagnosticCode code);

constexpr bool IsLineCode(DiagnosticCode code) {
  return static_cast<int>(code) >= 1 && static_cast<int>(code) <= 9;
}

} // namespace pysca::checks
