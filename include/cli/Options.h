#pragma once

#include <string>
#include <vector>

namespace pysca::cli {

    struct Options {
        bool showHelp{false};
        bool functionScopeVars{false}; // --function-scope-vars
        bool metrics{false};           // --metrics
        bool metricsJson{false};       // --metrics-json
        std::vector<std::string> inputs{};
        std::string logPath{"."};      // --log-path=<dir> (defaults to ./)
        bool logLexer{false};          // --log-lexer
        bool logDiagnostics{false};    // --log-diagnostics
    };

} // namespace pysca::cli
