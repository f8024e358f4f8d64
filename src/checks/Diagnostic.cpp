#include "checks/Diagnostic.h"

#include <sstream>
#include <string>
#include <utility>

namespace pysca::checks {

Diagnostic::Diagnostic(const int line, const DiagnosticCode code, std::string message, std::string file)
    : line_(line), code_(code), message_(std::move(message)), file_(std::move(file)) {}

std::string Diagnostic::format() const {
  std::ostringstream out;
  out << file_ << ": Line " << line_ << ": " << CodeLabel(code_) << " " << message_;
  return out.str();
}

} // namespace pysca::checks
