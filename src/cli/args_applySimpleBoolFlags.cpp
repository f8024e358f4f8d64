#include "cli/ParseArgsInternals.h"

namespace pysca::cli::detail {
    /***
     * Name: pysca::cli::detail::applySimpleBoolFlags
     * Purpose: Handle flag-only boolean options and set outputs.
     */
    bool applySimpleBoolFlags(std::string_view arg, Options &out) {
        if (isFlag(arg, "-h") || isFlag(arg, "--help")) {
            out.showHelp = true;
            return true;
        }
        if (isFlag(arg, "--function-scope-vars")) {
            out.functionScopeVars = true;
            return true;
        }
        if (isFlag(arg, "--metrics")) {
            out.metrics = true;
            return true;
        }
        if (isFlag(arg, "--metrics-json")) {
            out.metricsJson = true;
            return true;
        }
        if (isFlag(arg, "--log-lexer")) {
            out.logLexer = true;
            return true;
        }
        if (isFlag(arg, "--log-diagnostics")) {
            out.logDiagnostics = true;
            return true;
        }
        return false;
    }
} // namespace pysca::cli::detail
