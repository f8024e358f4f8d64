#include "checks/LineCheckers.h"

#include <cstddef>
#include <string_view>
#include "pysca/support/text.h"

namespace pysca::checks {

CheckResult IndentationChecker::check(const std::string_view line, const LineContext& /*ctx*/) const {
  std::size_t leading = 0;
  while (leading < line.size() && support::IsSpace(line[leading])) { ++leading; }
  return leading % 4 == 0 ? CheckResult::Pass() : CheckResult::Fail();
}

} // namespace pysca::checks
