/***
 * Name: test_line_pipeline
 * Purpose: Checker registration order and per-line emission.
 */
#include <gtest/gtest.h>
#include <vector>
#include "checks/LinePipeline.h"

using namespace pysca::checks;

TEST(LinePipeline, CheckersRegisteredInCodeOrder) {
  const LinePipeline p;
  ASSERT_EQ(p.checkers().size(), 9u);
  for (size_t i = 0; i < p.checkers().size(); ++i) {
    EXPECT_EQ(static_cast<int>(p.checkers()[i]->code()), static_cast<int>(i) + 1);
  }
}

TEST(LinePipeline, MultipleViolationsOnOneLineInCodeOrder) {
  const LinePipeline p;
  std::vector<Diagnostic> out;
  p.checkLine("def  Foo():  # TODO\n", 7, LineContext{}, "m.py", out);
  ASSERT_EQ(out.size(), 3u);
  EXPECT_EQ(out[0].code(), DiagnosticCode::TodoFound);
  EXPECT_EQ(out[1].code(), DiagnosticCode::ExtraSpacesAfterKeyword);
  EXPECT_EQ(out[2].code(), DiagnosticCode::FunctionNameNotSnakeCase);
  for (const auto& d : out) {
    EXPECT_EQ(d.line(), 7);
    EXPECT_EQ(d.file(), "m.py");
  }
  EXPECT_EQ(out[0].message(), "TODO found");
}

TEST(LinePipeline, CleanLineEmitsNothing) {
  const LinePipeline p;
  std::vector<Diagnostic> out;
  p.checkLine("value = compute(1, 2)  # fine\n", 1, LineContext{}, "m.py", out);
  EXPECT_TRUE(out.empty());
}

TEST(LinePipeline, IsBlank) {
  EXPECT_TRUE(LinePipeline::IsBlank("\n"));
  EXPECT_TRUE(LinePipeline::IsBlank(" \t \r\n"));
  EXPECT_TRUE(LinePipeline::IsBlank(""));
  EXPECT_FALSE(LinePipeline::IsBlank("  x\n"));
}
