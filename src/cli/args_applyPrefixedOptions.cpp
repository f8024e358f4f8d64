#include "cli/ParseArgsInternals.h"

#include <string>

namespace pysca::cli::detail {
    /***
     * Name: pysca::cli::detail::applyPrefixedOptions
     * Purpose: Parse and apply --key=value options.
     */
    bool applyPrefixedOptions(std::string_view arg, Options &out) {
        if (constexpr std::string_view logPathPrefix{"--log-path="}; arg.rfind(logPathPrefix, 0) == 0) {
            out.logPath = std::string(arg.substr(logPathPrefix.size()));
            if (out.logPath.empty()) { out.logPath = "."; }
            return true;
        }
        return false;
    }
} // namespace pysca::cli::detail
