/**
 * @file
 * @brief The nine line checkers, in evaluation order.
 */
#pragma once

#include <cstddef>
#include <string_view>
#include "checks/LineChecker.h"

namespace pysca::checks {

// S001: more than 79 characters, terminator included.
class LineLengthChecker final : public LineChecker {
 public:
  static constexpr std::size_t kMaxLength = 79;
  DiagnosticCode code() const override { return DiagnosticCode::LineTooLong; }
  CheckResult check(std::string_view line, const LineContext& ctx) const override;
};

// S002: leading whitespace count not a multiple of 4 (tabs count as one).
class IndentationChecker final : public LineChecker {
 public:
  DiagnosticCode code() const override { return DiagnosticCode::BadIndentation; }
  CheckResult check(std::string_view line, const LineContext& ctx) const override;
};

// S003
class SemicolonChecker final : public LineChecker {
 public:
  DiagnosticCode code() const override { return DiagnosticCode::UnnecessarySemicolon; }
  CheckResult check(std::string_view line, const LineContext& ctx) const override;
};

// S004: code before an inline comment needs two spaces of separation.
class InlineCommentChecker final : public LineChecker {
 public:
  DiagnosticCode code() const override { return DiagnosticCode::InlineCommentSpacing; }
  CheckResult check(std::string_view line, const LineContext& ctx) const override;
};

// S005
class TodoChecker final : public LineChecker {
 public:
  DiagnosticCode code() const override { return DiagnosticCode::TodoFound; }
  CheckResult check(std::string_view line, const LineContext& ctx) const override;
};

// S006: reads LineContext::blankRun.
class BlankLinesChecker final : public LineChecker {
 public:
  static constexpr int kMaxBlankRun = 2;
  DiagnosticCode code() const override { return DiagnosticCode::TooManyBlankLines; }
  CheckResult check(std::string_view line, const LineContext& ctx) const override;
};

// S007: 'def' or 'class' followed by two or more spaces.
class KeywordSpacingChecker final : public LineChecker {
 public:
  DiagnosticCode code() const override { return DiagnosticCode::ExtraSpacesAfterKeyword; }
  CheckResult check(std::string_view line, const LineContext& ctx) const override;
};

// S008
class ClassNameChecker final : public LineChecker {
 public:
  DiagnosticCode code() const override { return DiagnosticCode::ClassNameNotCamelCase; }
  CheckResult check(std::string_view line, const LineContext& ctx) const override;
};

// S009
class FunctionNameChecker final : public LineChecker {
 public:
  DiagnosticCode code() const override { return DiagnosticCode::FunctionNameNotSnakeCase; }
  CheckResult check(std::string_view line, const LineContext& ctx) const override;
};

} // namespace pysca::checks
