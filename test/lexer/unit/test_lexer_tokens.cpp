/***
 * Name: test_lexer_tokens
 * Purpose: Cover token kinds, logical lines, indentation and string/number spellings.
 */
#include <gtest/gtest.h>
#include <vector>
#include "lexer/Lexer.h"

using namespace pysca;
using lex::TokenKind;

static std::vector<lex::Token> lexAll(const char* src) {
  lex::Lexer L; L.pushString(src, "lex.py");
  return L.tokens();
}

static std::vector<TokenKind> kindsOf(const std::vector<lex::Token>& toks) {
  std::vector<TokenKind> out;
  for (const auto& t : toks) out.push_back(t.kind);
  return out;
}

TEST(LexerTokens, SimpleAssignment) {
  auto toks = lexAll("x = 1\n");
  const std::vector<TokenKind> expected{TokenKind::Ident, TokenKind::Equal, TokenKind::Int, TokenKind::Newline,
                                        TokenKind::End};
  EXPECT_EQ(kindsOf(toks), expected);
  EXPECT_EQ(toks[0].text, "x");
  EXPECT_EQ(toks[0].line, 1);
  EXPECT_EQ(toks[0].col, 1);
  EXPECT_EQ(toks[2].col, 5);
  EXPECT_EQ(toks[0].file, "lex.py");
}

TEST(LexerTokens, BlankAndCommentLinesProduceNothing) {
  auto toks = lexAll("# leading comment\n\n   \nx\n");
  ASSERT_GE(toks.size(), 3u);
  EXPECT_EQ(toks[0].kind, TokenKind::Ident);
  EXPECT_EQ(toks[0].line, 4);
  EXPECT_EQ(toks[1].kind, TokenKind::Newline);
}

TEST(LexerTokens, IndentAndDedentBracketABlock) {
  auto toks = lexAll("if x:\n    y\nz\n");
  const std::vector<TokenKind> expected{TokenKind::If,     TokenKind::Ident,   TokenKind::Colon,
                                        TokenKind::Newline, TokenKind::Indent, TokenKind::Ident,
                                        TokenKind::Newline, TokenKind::Dedent, TokenKind::Ident,
                                        TokenKind::Newline, TokenKind::End};
  EXPECT_EQ(kindsOf(toks), expected);
}

TEST(LexerTokens, DedentsFlushedAtEndOfInput) {
  auto toks = lexAll("def f():\n    if x:\n        return 1\n");
  int dedents = 0;
  for (const auto& t : toks) if (t.kind == TokenKind::Dedent) ++dedents;
  EXPECT_EQ(dedents, 2);
  EXPECT_EQ(toks.back().kind, TokenKind::End);
}

TEST(LexerTokens, BracketsJoinPhysicalLines) {
  auto toks = lexAll("x = (1,\n     2)\ny = 3\n");
  int newlines = 0;
  for (const auto& t : toks) if (t.kind == TokenKind::Newline) ++newlines;
  EXPECT_EQ(newlines, 2);
}

TEST(LexerTokens, BackslashContinuationJoinsLines) {
  auto toks = lexAll("x = 1 + \\\n    2\n");
  const std::vector<TokenKind> expected{TokenKind::Ident, TokenKind::Equal, TokenKind::Int, TokenKind::Plus,
                                        TokenKind::Int,   TokenKind::Newline, TokenKind::End};
  EXPECT_EQ(kindsOf(toks), expected);
}

TEST(LexerTokens, StringPrefixesAndBytes) {
  auto toks = lexAll("a = b'ab'\nb = f\"{x}\"\nc = rb'\\d'\nd = r'\\n'\n");
  EXPECT_EQ(toks[2].kind, TokenKind::Bytes);
  EXPECT_EQ(toks[2].text, "b'ab'");
  EXPECT_EQ(toks[6].kind, TokenKind::String);
  EXPECT_EQ(toks[6].text, "f\"{x}\"");
  EXPECT_EQ(toks[10].kind, TokenKind::Bytes);
  EXPECT_EQ(toks[14].kind, TokenKind::String);
}

TEST(LexerTokens, TripleQuotedStringSpansLines) {
  auto toks = lexAll("s = '''one\ntwo'''\nt = 1\n");
  ASSERT_EQ(toks[2].kind, TokenKind::String);
  EXPECT_EQ(toks[2].line, 1);
  EXPECT_NE(toks[2].text.find('\n'), std::string::npos);
  EXPECT_EQ(toks[4].kind, TokenKind::Ident);
  EXPECT_EQ(toks[4].line, 3);
}

TEST(LexerTokens, NumberSpellings) {
  auto toks = lexAll("n = [1_000, 0x1F, 1.5e-3, 2j, .5]\n");
  std::vector<lex::Token> nums;
  for (const auto& t : toks) {
    if (t.kind == TokenKind::Int || t.kind == TokenKind::Float || t.kind == TokenKind::Imag) nums.push_back(t);
  }
  ASSERT_EQ(nums.size(), 5u);
  EXPECT_EQ(nums[0].kind, TokenKind::Int);
  EXPECT_EQ(nums[0].text, "1_000");
  EXPECT_EQ(nums[1].kind, TokenKind::Int);
  EXPECT_EQ(nums[2].kind, TokenKind::Float);
  EXPECT_EQ(nums[3].kind, TokenKind::Imag);
  EXPECT_EQ(nums[4].kind, TokenKind::Float);
}

TEST(LexerTokens, KeywordsAndSoftKeywords) {
  auto toks = lexAll("match = True or None\n");
  EXPECT_EQ(toks[0].kind, TokenKind::Ident);
  EXPECT_EQ(toks[2].kind, TokenKind::BoolLit);
  EXPECT_EQ(toks[3].kind, TokenKind::Or);
  EXPECT_EQ(toks[4].kind, TokenKind::NoneLit);
}

TEST(LexerTokens, LongestOperatorWins) {
  auto toks = lexAll("x **= y // z -> w := v ...\n");
  EXPECT_EQ(toks[1].kind, TokenKind::StarStarEqual);
  EXPECT_EQ(toks[3].kind, TokenKind::SlashSlash);
  EXPECT_EQ(toks[5].kind, TokenKind::Arrow);
  EXPECT_EQ(toks[7].kind, TokenKind::ColonEqual);
  EXPECT_EQ(toks[9].kind, TokenKind::Ellipsis);
}

TEST(LexerTokens, CrLfLinesAreAccepted) {
  auto toks = lexAll("x = 1\r\ny = 2\r\n");
  EXPECT_EQ(toks[4].text, "y");
  EXPECT_EQ(toks[4].line, 2);
}

TEST(LexerTokens, PeekAndNextAgreeWithTokens) {
  lex::Lexer L; L.pushString("a b\n", "lex.py");
  EXPECT_EQ(L.peek().text, "a");
  EXPECT_EQ(L.peek(1).text, "b");
  EXPECT_EQ(L.next().text, "a");
  EXPECT_EQ(L.next().text, "b");
  EXPECT_EQ(L.next().kind, TokenKind::Newline);
  EXPECT_EQ(L.next().kind, TokenKind::End);
  EXPECT_EQ(L.next().kind, TokenKind::End);
}

TEST(LexerTokens, ToStringNamesKinds) {
  EXPECT_STREQ(lex::to_string(TokenKind::Indent), "Indent");
  EXPECT_STREQ(lex::to_string(TokenKind::Ident), "Ident");
}

TEST(LexerTokens, RawFStringBackslashBeforeDoubledBrace) {
  auto toks = lexAll("x = rf'(\\{{%)(\\s+)'\nBad = 1\n");
  ASSERT_GE(toks.size(), 5u);
  EXPECT_EQ(toks[2].kind, TokenKind::String);
  EXPECT_EQ(toks[2].text, "rf'(\\{{%)(\\s+)'");
  EXPECT_EQ(toks[3].kind, TokenKind::Newline);
  EXPECT_EQ(toks[4].text, "Bad");
  EXPECT_EQ(toks[4].line, 2);
}

TEST(LexerTokens, FStringFieldHoldsTripleQuotedLiteral) {
  auto toks = lexAll("s = f\"{'''eric's'''}\"\n");
  ASSERT_GE(toks.size(), 4u);
  EXPECT_EQ(toks[2].kind, TokenKind::String);
  EXPECT_EQ(toks[2].text, "f\"{'''eric's'''}\"");
  EXPECT_EQ(toks[3].kind, TokenKind::Newline);
}

TEST(LexerTokens, BackslashBraceInFStringOpensField) {
  auto toks = lexAll("s = f'\\{x}'\n");
  EXPECT_EQ(toks[2].text, "f'\\{x}'");
  EXPECT_EQ(toks[3].kind, TokenKind::Newline);
}
