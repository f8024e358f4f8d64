#include "checks/LineCheckers.h"

#include <string>
#include <string_view>
#include "pysca/support/text.h"

namespace pysca::checks {

CheckResult TodoChecker::check(const std::string_view line, const LineContext& /*ctx*/) const {
  const auto hash = line.find('#');
  if (hash == std::string_view::npos) { return CheckResult::Pass(); }
  const std::string comment = support::ToLowerAscii(line.substr(hash));
  return comment.find("todo") == std::string::npos ? CheckResult::Pass() : CheckResult::Fail();
}

} // namespace pysca::checks
