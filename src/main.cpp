/***
 * Name: pysca::main
 * Purpose: CLI entry point for the pysca style analyzer.
 * Inputs:
 *   - argv
 * Outputs:
 *   - Exit status
 * Theory of Operation:
 *   Parse args then invoke Linter::run.
 */
#include "cli/ParseArgs.h"
#include "cli/Usage.h"
#include "linter/Linter.h"
#include "pysca/exceptions/pysca_exception.h"
#include <exception>
#include <iostream>

int main(const int argc, char** argv) {
  try {
    pysca::cli::Options opts;
    if (!pysca::cli::ParseArgs(argc, argv, opts)) {
      std::cerr << pysca::cli::Usage();
      return 2;
    }
    if (opts.showHelp) {
      std::cout << pysca::cli::Usage();
      return 0;
    }
    return pysca::Linter::run(opts);
  } catch (const pysca::exceptions::PyscaException& ex) {
    std::cerr << "pysca: " << ex.what() << "\n";
    return 2;
  } catch (const std::exception& ex) {
    std::cerr << "pysca: internal error: " << ex.what() << "\n";
    return 2;
  }
}
