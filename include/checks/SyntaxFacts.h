/***
 * Name: pysca::checks::SyntaxFacts
 * Purpose: The three fact sets gathered from one syntax tree.
 * Theory of Operation:
 *   storedVariables  identifier -> line of its last binding, in first-seen order
 *   parameters       (def line, identifier) pairs, in order, without duplicates
 *   mutableDefaults  def lines with a non-literal default, ascending, unique
 */
#pragma once

#include <cstddef>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace pysca::checks {

class SyntaxFacts {
 public:
  void recordVariable(const std::string& name, int line);
  void recordParameter(int defLine, const std::string& name);
  void recordMutableDefault(int defLine);

  const std::vector<std::pair<std::string, int>>& storedVariables() const { return variables_; }
  const std::vector<std::pair<int, std::string>>& parameters() const { return parameters_; }
  const std::set<int>& mutableDefaults() const { return mutableDefaults_; }

 private:
  std::vector<std::pair<std::string, int>> variables_{};
  std::unordered_map<std::string, std::size_t> variableIndex_{};
  std::vector<std::pair<int, std::string>> parameters_{};
  std::set<std::pair<int, std::string>> seenParameters_{};
  std::set<int> mutableDefaults_{};
};

} // namespace pysca::checks
