/***
 * Name: pysca::obs::Metrics (impl)
 * Purpose: Accumulate stage timings and counters; render text and JSON.
 * Theory of Operation:
 *   Durations are stored in microseconds and rendered in milliseconds with
 *   three decimals. JSON stage keys are lowercased ("parse", "linechecks");
 *   counter keys are emitted verbatim. std::map keeps every section sorted.
 */
#include "observability/Metrics.h"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <iomanip>
#include <ios>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>
#include "pysca/support/text.h"

namespace pysca::obs {

namespace {
constexpr double kUsPerMs = 1000.0;
constexpr int kMillisPrecision = 3;

void writeMillis(std::ostringstream& oss, const uint64_t micros) {
  oss << std::fixed << std::setprecision(kMillisPrecision) << static_cast<double>(micros) / kUsPerMs;
}

// Writes `"name": {` ... `}` with one member per line at four spaces.
template <typename WriteValue>
void writeJsonObject(std::ostringstream& oss, const char* name, const std::map<std::string, uint64_t>& values,
                     const bool lowerKeys, WriteValue writeValue) {
  oss << "  \"" << name << "\": {";
  const char* sep = "";
  for (const auto& [key, val] : values) {
    oss << sep << "\n    \"" << (lowerKeys ? support::ToLowerAscii(key) : key) << "\": ";
    writeValue(oss, val);
    sep = ",";
  }
  oss << "\n  }";
}
} // namespace

void Metrics::start(const std::string& name) { active_[name] = Clock::now(); }

void Metrics::stop(const std::string& name) {
  const auto iter = active_.find(name);
  if (iter == active_.end()) { return; }
  const auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - iter->second);
  durations_us_[name] += static_cast<uint64_t>(elapsed.count());
  active_.erase(iter);
}

void Metrics::addAstGeometry(const AstGeometry g) {
  if (!geom_) {
    geom_ = g;
    return;
  }
  geom_->nodes += g.nodes;
  geom_->maxDepth = std::max(geom_->maxDepth, g.maxDepth);
}

uint64_t Metrics::counter(const std::string& key) const {
  const auto iter = counters_.find(key);
  return iter == counters_.end() ? 0 : iter->second;
}

std::string Metrics::summaryText() const {
  std::ostringstream oss;
  oss << "== Metrics ==\n";
  for (const auto& [stage, micros] : durations_us_) {
    oss << "  " << stage << ": ";
    writeMillis(oss, micros);
    oss << " ms\n";
  }
  if (geom_) { oss << "  AST: nodes=" << geom_->nodes << ", max_depth=" << geom_->maxDepth << "\n"; }
  for (const auto& [key, val] : counters_) { oss << "  " << key << " = " << val << "\n"; }
  return oss.str();
}

std::string Metrics::summaryJson() const {
  std::ostringstream oss;
  oss << "{\n";
  writeJsonObject(oss, "durations_ms", durations_us_, true, writeMillis);
  if (geom_) {
    oss << ",\n  \"ast\": { \"nodes\": " << geom_->nodes << ", \"max_depth\": " << geom_->maxDepth << " }";
  }
  if (!counters_.empty()) {
    oss << ",\n";
    writeJsonObject(oss, "counters", counters_, false,
                    [](std::ostringstream& out, const uint64_t val) { out << val; });
  }
  const auto hs = hints();
  if (!hs.empty()) {
    oss << ",\n  \"hints\": [";
    const char* sep = "";
    for (const auto& hint : hs) {
      oss << sep << "\"" << hint << "\"";
      sep = ", ";
    }
    oss << "]";
  }
  oss << "\n}\n";
  return oss.str();
}

// Flags a reader of the JSON should not miss.
std::vector<std::string> Metrics::hints() const {
  std::vector<std::string> out;
  if (counter("diagnostics.total") > 0) { out.emplace_back("diagnostics_present"); }
  if (counter("files.failed") > 0) { out.emplace_back("unparsed_files"); }
  if (counters_.contains("files.analyzed") && counter("files.analyzed") == 0) { out.emplace_back("no_files_analyzed"); }
  return out;
}

ScopedStage::ScopedStage(Metrics* metrics, std::string name) : metrics_(metrics), name_(std::move(name)) {
  if (metrics_ != nullptr) { metrics_->start(name_); }
}

ScopedStage::~ScopedStage() {
  if (metrics_ != nullptr) { metrics_->stop(name_); }
}

} // namespace pysca::obs
