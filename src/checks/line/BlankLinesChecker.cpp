#include "checks/LineCheckers.h"

#include <string_view>
#include "checks/LinePipeline.h"

namespace pysca::checks {

CheckResult BlankLinesChecker::check(const std::string_view line, const LineContext& ctx) const {
  if (LinePipeline::IsBlank(line)) { return CheckResult::Pass(); }
  return ctx.blankRun > kMaxBlankRun ? CheckResult::Fail() : CheckResult::Pass();
}

} // namespace pysca::checks
