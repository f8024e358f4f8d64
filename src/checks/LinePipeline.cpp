#include "checks/LinePipeline.h"

#include <memory>
#include <string>
#include <string_view>
#include <vector>
#include "checks/LineCheckers.h"
#include "pysca/support/text.h"

namespace pysca::checks {

LinePipeline::LinePipeline() {
  checkers_.push_back(std::make_unique<LineLengthChecker>());
  checkers_.push_back(std::make_unique<IndentationChecker>());
  checkers_.push_back(std::make_unique<SemicolonChecker>());
  checkers_.push_back(std::make_unique<InlineCommentChecker>());
  checkers_.push_back(std::make_unique<TodoChecker>());
  checkers_.push_back(std::make_unique<BlankLinesChecker>());
  checkers_.push_back(std::make_unique<KeywordSpacingChecker>());
  checkers_.push_back(std::make_unique<ClassNameChecker>());
  checkers_.push_back(std::make_unique<FunctionNameChecker>());
}

void LinePipeline::checkLine(const std::string_view line, const int lineNo, const LineContext& ctx,
                             const std::string& file, std::vector<Diagnostic>& out) const {
  for (const auto& checker : checkers_) {
    auto result = checker->check(line, ctx);
    if (result.passed) { continue; }
    std::string message = result.message ? std::move(*result.message) : std::string(DefaultMessage(checker->code()));
    out.emplace_back(lineNo, checker->code(), std::move(message), file);
  }
}

bool LinePipeline::IsBlank(std::string_view line) {
  support::TrimLeadingSpaces(line);
  return line.empty();
}

} // namespace pysca::checks
