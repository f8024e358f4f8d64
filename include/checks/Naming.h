/***
 * Name: pysca::checks naming predicates
 * Purpose: Identifier casing rules shared by line checkers and the extractor.
 * Theory of Operation (full matches):
 *   IsSnakeCase:  _*[a-z][a-z0-9]*(_[a-z0-9]+)*_?
 *                 | __[a-z][a-z0-9]*(_[a-z0-9]+)*__
 *                 | _+            (throwaway names)
 *   IsPascalCase: [A-Z]+([a-z0-9]|[A-Z0-9][a-z0-9]+)*[A-Z]?
 */
#pragma once

#include <string_view>

namespace pysca::checks {

bool IsSnakeCase(std::string_view identifier);
bool IsPascalCase(std::string_view identifier);

} // namespace pysca::checks
