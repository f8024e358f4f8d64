#pragma once

#include <string>
#include <vector>
#include "checks/Diagnostic.h"

namespace pysca::checks {

// Diagnostics of one file, ordered by line; same-line entries keep producer
// order (tree-derived before line-derived).
struct AnalysisResult {
  std::string file;
  std::vector<Diagnostic> diagnostics;
};

} // namespace pysca::checks
