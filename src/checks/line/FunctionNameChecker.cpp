#include "checks/LineCheckers.h"

#include <regex>
#include <string>
#include <string_view>
#include "checks/Naming.h"

namespace pysca::checks {

CheckResult FunctionNameChecker::check(const std::string_view line, const LineContext& /*ctx*/) const {
  static const std::regex kDecl(R"(\bdef\s+(\w+))");
  std::match_results<std::string_view::const_iterator> m;
  if (!std::regex_search(line.begin(), line.end(), m, kDecl)) { return CheckResult::Pass(); }
  const std::string name = m[1].str();
  if (IsSnakeCase(name)) { return CheckResult::Pass(); }
  return CheckResult::Fail("Function name '" + name + "' should use snake_case");
}

} // namespace pysca::checks
