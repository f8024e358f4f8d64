#include "checks/DiagnosticCode.h"

#include <cstdio>
#include <string>
#include <string_view>

namespace pysca::checks {

std::string CodeLabel(const DiagnosticCode code) {
  char buf[8];
  std::snprintf(buf, sizeof(buf), "S%03d", static_cast<int>(code));
  return buf;
}

std::string_view DefaultMessage(const DiagnosticCode code) {
  switch (code) {
    case DiagnosticCode::LineTooLong: return "Too long";
    case DiagnosticCode::BadIndentation: return "Indentation is not a multiple of four";
    case DiagnosticCode::UnnecessarySemicolon: return "Unnecessary semicolon";
    case DiagnosticCode::InlineCommentSpacing: return "At least two spaces required before inline comment";
    case DiagnosticCode::TodoFound: return "TODO found";
    case DiagnosticCode::TooManyBlankLines: return "More than two blank lines found before this line";
    case DiagnosticCode::MutableDefaultArgument: return "Default argument value is mutable";
    default: return {};
  }
}

} // namespace pysca::checks
