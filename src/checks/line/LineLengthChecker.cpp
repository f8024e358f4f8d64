#include "checks/LineCheckers.h"

#include <string_view>
#include "pysca/support/text.h"

namespace pysca::checks {

CheckResult LineLengthChecker::check(const std::string_view line, const LineContext& /*ctx*/) const {
  return support::Utf8Length(line) > kMaxLength ? CheckResult::Fail() : CheckResult::Pass();
}

} // namespace pysca::checks
