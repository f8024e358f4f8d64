/***
 * Name: pysca::checks::Diagnostic
 * Purpose: One reported style violation.
 * Inputs: line number (1-based), code, rendered message, file path
 * Outputs: format() renders "{file}: Line {line}: S{code:03d} {message}"
 * Theory of Operation: Values are fixed at construction; only accessors are
 *   exposed. Copy/move assignment stays available so results can be sorted.
 */
#pragma once

#include <string>
#include "checks/DiagnosticCode.h"

namespace pysca::checks {

class Diagnostic {
 public:
  Diagnostic(int line, DiagnosticCode code, std::string message, std::string file);

  int line() const { return line_; }
  DiagnosticCode code() const { return code_; }
  const std::string& message() const { return message_; }
  const std::string& file() const { return file_; }

  std::string format() const;

 private:
  int line_;
  DiagnosticCode code_;
  std::string message_;
  std::string file_;
};

} // namespace pysca::checks
