/***
 * Name: pysca::checks::FileAnalyzer
 * Purpose: Produce the ordered diagnostics of one Python source file.
 * Inputs:
 *   - A path (analyze) or a name plus in-memory text (analyzeText)
 *   - AnalyzerOptions; optional Metrics sink for stage timings and counters
 * Outputs:
 *   - AnalysisResult
 * Theory of Operation:
 *   Read once, split into raw lines with universal newlines, parse once.
 *   Tree diagnostics come from SyntaxFactExtractor; line diagnostics from one
 *   pass over the raw lines with the blank-run state owned here. The two
 *   groups are concatenated (tree first) and stable-sorted by line only.
 *   Errors: exceptions::FileReadError for a missing, non-regular or unreadable
 *   path; exceptions::ParseError for malformed source. Neither yields a
 *   partial result.
 */
#pragma once

#include <ostream>
#include <string>
#include <vector>
#include "checks/AnalysisResult.h"
#include "checks/AnalyzerOptions.h"
#include "checks/Diagnostic.h"
#include "checks/LinePipeline.h"
#include "lexer/Token.h"
#include "observability/Metrics.h"

namespace pysca::checks {

class FileAnalyzer {
 public:
  explicit FileAnalyzer(AnalyzerOptions options = {}, obs::Metrics* metrics = nullptr);

  AnalysisResult analyze(const std::string& path) const;
  AnalysisResult analyzeText(const std::string& name, const std::string& text) const;

  // When set, every token of each analyzed file is written here, one per line.
  void setTokenLog(std::ostream* log) { tokenLog_ = log; }

 private:
  void recordTokens(const std::vector<lex::Token>& tokens) const;
  std::vector<Diagnostic> runLineChecks(const std::vector<std::string>& lines, const std::string& file) const;

  AnalyzerOptions options_;
  obs::Metrics* metrics_;
  std::ostream* tokenLog_{nullptr};
  LinePipeline pipeline_;
};

} // namespace pysca::checks
