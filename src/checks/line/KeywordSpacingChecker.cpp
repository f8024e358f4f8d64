#include "checks/LineCheckers.h"

#include <regex>
#include <string>
#include <string_view>

namespace pysca::checks {

CheckResult KeywordSpacingChecker::check(const std::string_view line, const LineContext& /*ctx*/) const {
  static const std::regex kPattern(R"(\b(def|class) {2,}[A-Za-z_])");
  std::match_results<std::string_view::const_iterator> m;
  if (!std::regex_search(line.begin(), line.end(), m, kPattern)) { return CheckResult::Pass(); }
  return CheckResult::Fail("Too many spaces after '" + m[1].str() + "'");
}

} // namespace pysca::checks
