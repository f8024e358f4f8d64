#include "cli/Usage.h"
#include <string>
#include <string_view>
namespace pysca::cli {

namespace {
// Keep help text as a compile-time constant to avoid reallocation work.
constexpr std::string_view kUsageText = R"(pysca [options] <path>

Analyze a Python file, or every *.py file under a directory, for style issues.

Options:
  -h, --help             Print this help and exit
  --function-scope-vars  Check variable names only inside function bodies
  --metrics              Print run metrics (text and JSON) to stderr
  --metrics-json         Print run metrics in JSON to stderr
  --log-path=<dir>       Directory where logs are written (default: .)
  --log-lexer            Write a token log per analyzed file
  --log-diagnostics      Also write the diagnostics to a log file
  --                     End of options

Exit status: 0 when every file was analyzed, 1 when the path is missing or a
file could not be read or parsed, 2 on usage errors.
)";
} // namespace

std::string Usage() { return std::string(kUsageText); }
} // namespace pysca::cli
