/***
 * Name: pysca::checks::LinePipeline
 * Purpose: Run every line checker, in code order, over one non-blank line.
 * Inputs: raw line, its 1-based number, LineContext, file path
 * Outputs: Diagnostics appended to the caller's vector
 * Theory of Operation:
 *   The pipeline owns the checkers and nothing else. Blank-line handling
 *   (skipping blank lines, counting and resetting the run) belongs to the
 *   caller, which passes the current run in LineContext.
 */
#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>
#include "checks/Diagnostic.h"
#include "checks/LineChecker.h"
#include "checks/LineContext.h"

namespace pysca::checks {

class LinePipeline {
 public:
  LinePipeline();

  void checkLine(std::string_view line, int lineNo, const LineContext& ctx, const std::string& file,
                 std::vector<Diagnostic>& out) const;

  // True when the line is empty after stripping whitespace.
  static bool IsBlank(std::string_view line);

  const std::vector<std::unique_ptr<LineChecker>>& checkers() const { return checkers_; }

 private:
  std::vector<std::unique_ptr<LineChecker>> checkers_;
};

} // namespace pysca::checks
