#pragma once

namespace pysca::checks {

// Cross-line state handed to the line pipeline; owned and updated by the
// file analyzer.
struct LineContext {
  int blankRun{0}; // consecutive blank lines immediately before the current line
};

} // namespace pysca::checks
