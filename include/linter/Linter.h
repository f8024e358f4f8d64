#ifndef PYSCA_LINTER_LINTER_H
#define PYSCA_LINTER_LINTER_H

/***
 * Name: pysca::Linter
 * Purpose: Run one analysis over a file or directory tree.
 * Inputs:
 *   - CLI options
 * Outputs:
 *   - Diagnostics on stdout, errors and metrics on stderr, optional log
 *     files; exit code
 * Theory of Operation:
 *   Resolves the input path into sorted *.py files, analyzes each with one
 *   FileAnalyzer, and prints every diagnostic once all files are done. A file
 *   that cannot be read or parsed is reported and skipped; the run still
 *   finishes but exits 1. Metrics and log files are written at the end.
 */

// Forward declarations to reduce header coupling
namespace pysca { namespace cli { struct Options; } }

namespace pysca {
    class Linter {
    public:
        static int run(const cli::Options &opts);
    };
} // namespace pysca

#endif // PYSCA_LINTER_LINTER_H
