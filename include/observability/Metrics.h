/***
 * Name: pysca::obs::Metrics
 * Purpose: Collect per-stage timings, counters and AST geometry for a run.
 * Inputs:
 *   - Calls to start/stop timers for named stages (Read, Parse, Extract, LineChecks).
 *   - Counters bumped by the analyzer and the linter driver.
 *   - AST summary values (nodes, depth) recorded per analyzed file.
 * Outputs:
 *   - Human-readable text and JSON summaries.
 * Theory of Operation:
 *   Uses steady_clock timestamps to measure durations. A stage timed more than
 *   once (one Parse per file) accumulates into a single total. Geometry sums
 *   node counts and keeps the deepest tree. Formatting is performed on demand,
 *   with keys in sorted order so output is stable.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace pysca::obs {

struct AstGeometry {
  uint64_t nodes{0};
  uint64_t maxDepth{0};
};

class Metrics {
 public:
  using Clock = std::chrono::steady_clock;

  void start(const std::string& name);
  void stop(const std::string& name);

  void addAstGeometry(AstGeometry g);
  const std::optional<AstGeometry>& astGeometry() const { return geom_; }

  void incCounter(const std::string& key, uint64_t delta = 1) { counters_[key] += delta; }
  uint64_t counter(const std::string& key) const;
  const auto& counters() const { return counters_; }
  const auto& durations() const { return durations_us_; }

  std::string summaryText() const;
  std::string summaryJson() const;
  std::vector<std::string> hints() const;

 private:
  std::map<std::string, Clock::time_point> active_{};
  std::map<std::string, uint64_t> durations_us_{};
  std::optional<AstGeometry> geom_{};
  std::map<std::string, uint64_t> counters_{};
};

// RAII stage timer: start on construction, stop on scope exit. A null
// Metrics pointer makes it a no-op.
class ScopedStage {
 public:
  ScopedStage(Metrics* metrics, std::string name);
  ~ScopedStage();
  ScopedStage(const ScopedStage&) = delete;
  ScopedStage& operator=(const ScopedStage&) = delete;
  ScopedStage(ScopedStage&&) = delete;
  ScopedStage& operator=(ScopedStage&&) = delete;

 private:
  Metrics* metrics_;
  std::string name_;
};

} // namespace pysca::obs
