#include "checks/SyntaxFacts.h"

#include <string>

namespace pysca::checks {

void SyntaxFacts::recordVariable(const std::string& name, const int line) {
  const auto it = variableIndex_.find(name);
  if (it != variableIndex_.end()) {
    variables_[it->second].second = line; // later binding wins, position kept
    return;
  }
  variableIndex_.emplace(name, variables_.size());
  variables_.emplace_back(name, line);
}

void SyntaxFacts::recordParameter(const int defLine, const std::string& name) {
  if (seenParameters_.emplace(defLine, name).second) { parameters_.emplace_back(defLine, name); }
}

void SyntaxFacts::recordMutableDefault(const int defLine) { mutableDefaults_.insert(defLine); }

} // namespace pysca::checks
