#pragma once

namespace pysca::checks {

struct AnalyzerOptions {
  bool functionScopeOnly{false}; // record stored variables only inside def bodies
};

} // namespace pysca::checks
