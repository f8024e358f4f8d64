#pragma once

#include <optional>
#include <string>
#include <utility>

namespace pysca::checks {

// Outcome of one checker on one line. A failing result may carry a message
// rendered for this occurrence; otherwise the code's default message applies.
struct CheckResult {
  bool passed{true};
  std::optional<std::string> message{};

  static CheckResult Pass() { return CheckResult{}; }
  static CheckResult Fail() { return CheckResult{false, std::nullopt}; }
  static CheckResult Fail(std::string msg) { return CheckResult{false, std::move(msg)}; }
};

} // namespace pysca::checks
