#include "checks/LineCheckers.h"

#include <cstddef>
#include <string_view>
#include "pysca/support/text.h"

namespace pysca::checks {

CheckResult InlineCommentChecker::check(const std::string_view line, const LineContext& /*ctx*/) const {
  const auto hash = line.find('#');
  if (hash == std::string_view::npos) { return CheckResult::Pass(); }
  const std::string_view before = line.substr(0, hash);
  std::string_view code = before;
  support::TrimLeadingSpaces(code);
  if (code.empty()) { return CheckResult::Pass(); } // comment-only line
  std::size_t gap = 0;
  while (gap < before.size() && support::IsSpace(before[before.size() - 1 - gap])) { ++gap; }
  return gap >= 2 ? CheckResult::Pass() : CheckResult::Fail();
}

} // namespace pysca::checks
