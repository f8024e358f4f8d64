#pragma once

#include "Options.h"

namespace pysca::cli {

    // Parse argv into Options. Returns false on a usage error (already
    // reported on stderr). Exactly one input path is required unless help
    // was requested.
    bool ParseArgs(int argc, char** argv, Options& out);

} // namespace pysca::cli
