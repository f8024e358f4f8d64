/***
 * Name: pysca::checks::LineChecker
 * Purpose: Interface for a single-line style rule.
 * Inputs: one raw line (terminator included when present) and the LineContext
 * Outputs: CheckResult
 * Theory of Operation: Checkers hold no mutable state; anything that spans
 *   lines arrives through LineContext.
 */
#pragma once

#include <string_view>
#include "checks/CheckResult.h"
#include "checks/DiagnosticCode.h"
#include "checks/LineContext.h"

namespace pysca::checks {

class LineChecker {
 public:
  virtual ~LineChecker() = default;
  virtual DiagnosticCode code() const = 0;
  virtual CheckResult check(std::string_view line, const LineContext& ctx) const = 0;
};

} // namespace pysca::checks
