/***
 * Name: pysca::Linter::run
 * Purpose: Discover, analyze, report.
 */
#include "linter/Linter.h"
#include "checks/AnalyzerOptions.h"
#include "checks/Diagnostic.h"
#include "checks/FileAnalyzer.h"
#include "cli/Options.h"
#include "observability/Metrics.h"
#include "pysca/exceptions/file_read_error.h"
#include "pysca/exceptions/parse_error.h"
#include "pysca/support/fs.h"

#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

namespace pysca {

namespace {
// Timestamp prefix for log file names: YYYYmmdd-HHMMSS-
std::string timestampPrefix() {
  auto tsNow = std::chrono::system_clock::now();
  const std::time_t tsTime = std::chrono::system_clock::to_time_t(tsNow);
  std::tm tmBuf{};
#ifdef _WIN32
  localtime_s(&tmBuf, &tsTime);
#else
  localtime_r(&tsTime, &tmBuf);
#endif
  std::ostringstream timestampStream;
  timestampStream << std::put_time(&tmBuf, "%Y%m%d-%H%M%S");
  return timestampStream.str() + "-";
}

bool ensureLogDir(const std::string& logDir) {
  std::error_code errCode;
  namespace fs = std::filesystem;
  if (fs::exists(logDir, errCode)) { return true; }
  if (!fs::create_directories(logDir, errCode) && !fs::exists(logDir)) {
    std::cerr << "pysca: failed to create log directory '" << logDir << "': " << errCode.message() << "\n";
    return false;
  }
  return true;
}
} // namespace

int Linter::run(const cli::Options& opts) { // NOLINT(readability-function-cognitive-complexity)
  if (opts.inputs.empty()) {
    std::cerr << "pysca: no input path provided\n";
    return 2;
  }

  std::vector<std::string> files;
  std::string err;
  if (!support::CollectSources(opts.inputs.front(), files, err)) {
    std::cerr << "Error: " << err << "\n";
    return 1;
  }

  const bool metricsRequested = opts.metrics || opts.metricsJson;
  const bool wantsLogs = opts.logLexer || opts.logDiagnostics || metricsRequested;
  const std::string logDir = opts.logPath.empty() ? std::string(".") : opts.logPath;
  const bool logsEnabled = wantsLogs && ensureLogDir(logDir);
  const std::string tsPrefix = timestampPrefix();

  obs::Metrics metrics;
  metrics.incCounter("files.analyzed", 0);
  checks::AnalyzerOptions analyzerOptions;
  analyzerOptions.functionScopeOnly = opts.functionScopeVars;
  checks::FileAnalyzer analyzer(analyzerOptions, metricsRequested ? &metrics : nullptr);

  std::unique_ptr<std::ofstream> lexFile;
  if (logsEnabled && opts.logLexer) {
    const std::string lexPath = logDir + "/" + tsPrefix + "lexer.lex.log";
    lexFile = std::make_unique<std::ofstream>(lexPath);
    if (lexFile->is_open()) {
      analyzer.setTokenLog(lexFile.get());
    } else {
      std::cerr << "pysca: failed to open lexer log '" << lexPath << "'\n";
      lexFile.reset();
    }
  }

  std::vector<checks::Diagnostic> diagnostics;
  bool anyFailed = false;
  for (const auto& file : files) {
    try {
      auto result = analyzer.analyze(file);
      diagnostics.insert(diagnostics.end(), result.diagnostics.begin(), result.diagnostics.end());
    } catch (const exceptions::ParseError& ex) {
      std::cerr << "pysca: " << ex.what() << "\n";
      metrics.incCounter("files.failed");
      anyFailed = true;
    } catch (const exceptions::FileReadError& ex) {
      std::cerr << "pysca: " << ex.what() << "\n";
      metrics.incCounter("files.failed");
      anyFailed = true;
    }
  }

  for (const auto& diag : diagnostics) { std::cout << diag.format() << "\n"; }
  std::cout.flush();

  if (logsEnabled && opts.logDiagnostics) {
    std::ostringstream diagLog;
    for (const auto& diag : diagnostics) { diagLog << diag.format() << "\n"; }
    if (!support::WriteFile(logDir + "/" + tsPrefix + "diagnostics.log", diagLog.str(), err)) {
      std::cerr << "pysca: " << err << "\n";
    }
  }

  // - With --metrics-json: JSON only
  // - With --metrics: human-readable text, then JSON for tool consumption
  if (opts.metricsJson) {
    std::cerr << metrics.summaryJson();
  } else if (opts.metrics) {
    std::cerr << metrics.summaryText();
    std::cerr << metrics.summaryJson();
  }
  if (metricsRequested && logsEnabled) {
    if (!support::WriteFile(logDir + "/" + tsPrefix + "metrics.json", metrics.summaryJson(), err)) {
      std::cerr << "pysca: " << err << "\n";
    }
  }
  return anyFailed ? 1 : 0;
}

} // namespace pysca
