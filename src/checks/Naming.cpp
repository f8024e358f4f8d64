/***
 * Name: pysca::checks naming predicates
 * Purpose: snake_case / PascalCase full-match tests.
 * Theory of Operation: Patterns are compiled once (function-local statics)
 *   and matched with std::regex_match, which anchors both ends.
 */
#include "checks/Naming.h"

#include <regex>
#include <string>
#include <string_view>

namespace pysca::checks {

namespace {
const std::regex& snakePattern() {
  static const std::regex re(R"(_*[a-z][a-z0-9]*(_[a-z0-9]+)*_?|__[a-z][a-z0-9]*(_[a-z0-9]+)*__|_+)");
  return re;
}

const std::regex& pascalPattern() {
  static const std::regex re(R"([A-Z]+([a-z0-9]|[A-Z0-9][a-z0-9]+)*[A-Z]?)");
  return re;
}
} // namespace

bool IsSnakeCase(const std::string_view identifier) {
  if (identifier.empty()) { return false; }
  return std::regex_match(identifier.begin(), identifier.end(), snakePattern());
}

bool IsPascalCase(const std::string_view identifier) {
  if (identifier.empty()) { return false; }
  return std::regex_match(identifier.begin(), identifier.end(), pascalPattern());
}

} // namespace pysca::checks
