/***
 * Name: test_parser_errors
 * Purpose: Parse errors carry file:line:col, the source line and a caret underline.
 */
#include <gtest/gtest.h>
#include <string>
#include "ParseHelpers.h"
#include "pysca/exceptions/parse_error.h"

using namespace pysca;

static std::string parseError(const std::string& src) {
  try {
    (void)testutil::parseSrc(src, "errs.py");
  } catch (const exceptions::ParseError& ex) {
    return ex.what();
  }
  return {};
}

TEST(ParserErrors, CaretAndSourceLineShown) {
  // Missing ':' after the return annotation
  auto msg = parseError("def f() -> int\n    return 0\n");
  ASSERT_FALSE(msg.empty());
  EXPECT_NE(msg.find("errs.py:1:"), std::string::npos);
  EXPECT_NE(msg.find("expected ':'"), std::string::npos);
  EXPECT_NE(msg.find("def f() -> int"), std::string::npos);
  EXPECT_NE(msg.find("^"), std::string::npos);
}

TEST(ParserErrors, UnderlineCoversToken) {
  auto msg = parseError("x = = 1\n");
  EXPECT_NE(msg.find("errs.py:1:5"), std::string::npos);
  EXPECT_NE(msg.find("\n    ^"), std::string::npos);
}

TEST(ParserErrors, InvalidAssignmentTarget) {
  EXPECT_NE(parseError("f() = 1\n").find("cannot assign to expression"), std::string::npos);
  EXPECT_NE(parseError("del f()\n").find("cannot delete expression"), std::string::npos);
  EXPECT_NE(parseError("x + 1 += 2\n").find("illegal expression for augmented assignment"), std::string::npos);
}

TEST(ParserErrors, ParameterOrdering) {
  EXPECT_NE(parseError("def f(a=1, b):\n    pass\n").find("non-default argument follows default argument"),
            std::string::npos);
  EXPECT_NE(parseError("def f(*):\n    pass\n").find("named arguments must follow bare *"), std::string::npos);
}

TEST(ParserErrors, DuplicateParameterNamesStillParse) {
  EXPECT_TRUE(parseError("def f(a, a):\n    pass\n").empty());
}

TEST(ParserErrors, CallArgumentOrdering) {
  EXPECT_NE(parseError("f(a=1, b)\n").find("positional argument follows keyword argument"), std::string::npos);
  EXPECT_NE(parseError("f(x for x in y, 1)\n").find("Generator expression must be parenthesized"),
            std::string::npos);
  EXPECT_NE(parseError("f(**a, *b)\n").find("iterable argument unpacking follows keyword argument unpacking"),
            std::string::npos);
  EXPECT_TRUE(parseError("f(a=1, *b, **c)\n").empty());
}

TEST(ParserErrors, ClassBasesRejectBareGenerator) {
  const auto msg = parseError("class A(x for x in y):\n    pass\n");
  EXPECT_NE(msg.find("invalid syntax"), std::string::npos);
  EXPECT_NE(msg.find("errs.py:1:"), std::string::npos);
  EXPECT_TRUE(parseError("class A((x for x in y)):\n    pass\n").empty());
}

TEST(ParserErrors, UnexpectedIndentAndMissingBlock) {
  EXPECT_NE(parseError("x = 1\n    y = 2\n").find("unexpected indent"), std::string::npos);
  EXPECT_NE(parseError("if x:\ny = 2\n").find("expected an indented block"), std::string::npos);
}

TEST(ParserErrors, MixedBytesAndText) {
  EXPECT_NE(parseError("s = b'a' 'b'\n").find("cannot mix bytes and nonbytes literals"), std::string::npos);
}

TEST(ParserErrors, TryWithoutHandlers) {
  EXPECT_NE(parseError("try:\n    pass\nx = 1\n").find("expected 'except' or 'finally' block"), std::string::npos);
}
