/***
 * Name: pysca::checks::FileAnalyzer (impl)
 * Purpose: Read, parse, extract, line-check and merge for one file.
 */
#include "checks/FileAnalyzer.h"

#include <algorithm>
#include <filesystem>
#include <ostream>
#include <iterator>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>
#include "ast/GeometryVisitor.h"
#include "checks/SyntaxFactExtractor.h"
#include "lexer/Lexer.h"
#include "parser/Parser.h"
#include "pysca/exceptions/file_read_error.h"
#include "pysca/support/fs.h"
#include "pysca/support/text.h"

namespace pysca::checks {

namespace {
constexpr std::string_view kUtf8Bom = "\xEF\xBB\xBF";

std::string joinLines(const std::vector<std::string>& lines) {
  std::string text;
  for (const auto& line : lines) { text += line; }
  if (text.compare(0, kUtf8Bom.size(), kUtf8Bom) == 0) { text.erase(0, kUtf8Bom.size()); }
  return text;
}
} // namespace

FileAnalyzer::FileAnalyzer(AnalyzerOptions options, obs::Metrics* metrics)
    : options_(options), metrics_(metrics) {}

AnalysisResult FileAnalyzer::analyze(const std::string& path) const {
  namespace fs = std::filesystem;
  std::error_code errCode;
  if (!fs::exists(path, errCode)) { throw exceptions::FileReadError(path + " does not exist"); }
  if (!fs::is_regular_file(path, errCode)) { throw exceptions::FileReadError(path + " is not a file"); }
  std::string text;
  std::string err;
  {
    obs::ScopedStage stage(metrics_, "Read");
    if (!support::ReadFile(path, text, err)) { throw exceptions::FileReadError(err); }
  }
  return analyzeText(path, text);
}

AnalysisResult FileAnalyzer::analyzeText(const std::string& name, const std::string& text) const {
  const std::vector<std::string> lines = support::SplitLines(text);

  std::unique_ptr<ast::Module> module;
  {
    obs::ScopedStage stage(metrics_, "Parse");
    const std::string normalized = joinLines(lines);
    lex::Lexer lexer;
    lexer.pushString(normalized, name);
    parse::Parser parser(lexer, normalized);
    module = parser.parseModule();
    if (tokenLog_ != nullptr || metrics_ != nullptr) { recordTokens(lexer.tokens()); }
  }
  if (metrics_ != nullptr) {
    const auto geom = ast::ComputeGeometry(*module);
    metrics_->addAstGeometry(obs::AstGeometry{geom.nodes, geom.maxDepth});
  }

  AnalysisResult result;
  result.file = name;
  {
    obs::ScopedStage stage(metrics_, "Extract");
    SyntaxFactExtractor extractor(options_.functionScopeOnly);
    result.diagnostics = FactsToDiagnostics(extractor.extract(*module), name);
  }
  std::vector<Diagnostic> lineDiagnostics;
  {
    obs::ScopedStage stage(metrics_, "LineChecks");
    lineDiagnostics = runLineChecks(lines, name);
  }
  result.diagnostics.insert(result.diagnostics.end(), std::make_move_iterator(lineDiagnostics.begin()),
                            std::make_move_iterator(lineDiagnostics.end()));
  std::stable_sort(result.diagnostics.begin(), result.diagnostics.end(),
                   [](const Diagnostic& lhs, const Diagnostic& rhs) { return lhs.line() < rhs.line(); });

  if (metrics_ != nullptr) {
    metrics_->incCounter("files.analyzed");
    metrics_->incCounter("diagnostics.total", result.diagnostics.size());
    for (const auto& diag : result.diagnostics) { metrics_->incCounter("diagnostics." + CodeLabel(diag.code())); }
  }
  return result;
}

void FileAnalyzer::recordTokens(const std::vector<lex::Token>& tokens) const {
  if (metrics_ != nullptr) { metrics_->incCounter("lex.tokens", tokens.size()); }
  if (tokenLog_ == nullptr) { return; }
  for (const auto& tok : tokens) {
    *tokenLog_ << tok.file << ":" << tok.line << ":" << tok.col << " " << lex::to_string(tok.kind) << " " << tok.text
               << "\n";
  }
}

std::vector<Diagnostic> FileAnalyzer::runLineChecks(const std::vector<std::string>& lines,
                                                    const std::string& file) const {
  std::vector<Diagnostic> out;
  LineContext ctx;
  int lineNo = 0;
  for (const auto& line : lines) {
    ++lineNo;
    if (LinePipeline::IsBlank(line)) {
      ++ctx.blankRun;
      continue;
    }
    pipeline_.checkLine(line, lineNo, ctx, file, out);
    ctx.blankRun = 0;
  }
  return out;
}

} // namespace pysca::checks
