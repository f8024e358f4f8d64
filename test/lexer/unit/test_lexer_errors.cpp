/***
 * Name: test_lexer_errors
 * Purpose: Malformed input raises ParseError with location and caret.
 */
#include <gtest/gtest.h>
#include <string>
#include "lexer/Lexer.h"
#include "pysca/exceptions/parse_error.h"

using namespace pysca;

static std::string lexError(const char* src) {
  lex::Lexer L; L.pushString(src, "bad.py");
  try {
    (void)L.tokens();
  } catch (const exceptions::ParseError& ex) {
    return ex.what();
  }
  return {};
}

TEST(LexerErrors, UnterminatedString) {
  auto msg = lexError("x = 'abc\n");
  ASSERT_FALSE(msg.empty());
  EXPECT_NE(msg.find("bad.py:1:5"), std::string::npos);
  EXPECT_NE(msg.find("unterminated string literal"), std::string::npos);
  EXPECT_NE(msg.find("x = 'abc"), std::string::npos);
  EXPECT_NE(msg.find("^"), std::string::npos);
}

TEST(LexerErrors, UnterminatedTripleQuotedString) {
  auto msg = lexError("x = \"\"\"abc\nmore\n");
  EXPECT_NE(msg.find("unterminated triple-quoted string literal"), std::string::npos);
  EXPECT_NE(msg.find("bad.py:1:"), std::string::npos);
}

TEST(LexerErrors, BracketNeverClosed) {
  auto msg = lexError("x = (1,\n");
  EXPECT_NE(msg.find("'(' was never closed"), std::string::npos);
}

TEST(LexerErrors, MismatchedClosingBracket) {
  auto msg = lexError("x = (1]\n");
  EXPECT_NE(msg.find("does not match"), std::string::npos);
}

TEST(LexerErrors, InconsistentDedent) {
  auto msg = lexError("if x:\n        a\n    b\n");
  EXPECT_NE(msg.find("unindent does not match any outer indentation level"), std::string::npos);
  EXPECT_NE(msg.find("bad.py:3:"), std::string::npos);
}

TEST(LexerErrors, InvalidCharacter) {
  auto msg = lexError("x = $\n");
  EXPECT_NE(msg.find("invalid character '$'"), std::string::npos);
}

TEST(LexerErrors, BadHexLiteral) {
  auto msg = lexError("x = 0x\n");
  EXPECT_NE(msg.find("invalid numeric literal"), std::string::npos);
}
