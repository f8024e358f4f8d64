/***
 * Name: pysca::checks::SemicolonChecker
 * Purpose: Flag a statement line whose code part ends in ';'.
 * Theory of Operation:
 *   The code part is the text before the first '#', right-trimmed. Lines
 *   opening with '#' or with a triple quote are never flagged. The check is
 *   line-local: a '#' inside a string literal still cuts the line.
 */
#include "checks/LineCheckers.h"

#include <string_view>
#include "pysca/support/text.h"

namespace pysca::checks {

namespace {
bool opensCommentOrDocstring(std::string_view line) {
  support::TrimLeadingSpaces(line);
  return line.substr(0, 1) == "#" || line.substr(0, 3) == "'''" || line.substr(0, 3) == R"(""")";
}
} // namespace

CheckResult SemicolonChecker::check(const std::string_view line, const LineContext& /*ctx*/) const {
  std::string_view code = line.substr(0, line.find('#'));
  support::TrimTrailingSpaces(code);
  if (code.empty() || code.back() != ';') { return CheckResult::Pass(); }
  return opensCommentOrDocstring(line) ? CheckResult::Pass() : CheckResult::Fail();
}

} // namespace pysca::checks
