#include "cli/ParseArgs.h"
#include "cli/Options.h"
#include "cli/ParseArgsInternals.h"
#include <iostream>
#include <string>
#include <string_view>

namespace pysca::cli {
    /***
     * Name: pysca::cli::ParseArgs
     * Purpose: Command-line parser for pysca.
     * Inputs: argv; options precede the single path unless '--' ends them.
     * Outputs: Options; false on unknown options or a wrong path count.
     */
    bool ParseArgs(const int argc, char **argv, Options &out) {
        for (int i = 1; i < argc; ++i) {
            // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            const std::string_view arg{argv[i]};
            if (detail::isFlag(arg, "--")) {
                detail::collectRemainingAsInputs(i + 1, argc, argv, out);
                break;
            }
            if (detail::applySimpleBoolFlags(arg, out)) { continue; }
            if (detail::applyPrefixedOptions(arg, out)) { continue; }

            // Positional
            if (detail::isUnknownOptionArg(arg)) {
                std::cerr << "pysca: unknown option '" << arg << "'\n";
                return false;
            }
            out.inputs.emplace_back(std::string(arg));
        }

        if (out.showHelp) { return true; }
        if (out.inputs.empty()) {
            std::cerr << "pysca: missing input path\n";
            return false;
        }
        if (out.inputs.size() > 1) {
            std::cerr << "pysca: exactly one input path is supported\n";
            return false;
        }
        return true;
    }
} // namespace pysca::cli
