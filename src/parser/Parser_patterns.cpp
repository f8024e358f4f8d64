/***
 * Name: pysca::parse::Parser (match/case)
 * Purpose: Structural pattern matching statements and their patterns.
 * Theory of Operation:
 *   `match` is a soft keyword: a logical line starting with the identifier
 *   `match`, whose last token is ':' and which opens an indented block, is a
 *   match statement; anything else starting with `match` is an ordinary
 *   expression or assignment. Inside the block, `case` is recognized the same way.
 */
#include "parser/Parser.h"

#include <string>
#include <utility>
#include <vector>

namespace pysca::parse {

using TK = lex::TokenKind;
using detail::makeAt;

bool Parser::atMatchStatement() const {
  if (!checkSoft("match")) { return false; }
  const auto next = peek(1).kind;
  if (next == TK::Colon || next == TK::Equal || next == TK::Newline || next == TK::Dot ||
      next == TK::Comma || next == TK::End) {
    return false;
  }
  for (size_t k = 1;; ++k) {
    const auto kind = peek(k).kind;
    if (kind == TK::End) { return false; }
    if (kind == TK::Newline) {
      return peek(k - 1).kind == TK::Colon && peek(k + 1).kind == TK::Indent;
    }
  }
}

std::unique_ptr<ast::Stmt> Parser::parseMatchStmt() {
  const auto start = get(); // soft keyword 'match'
  auto match_ = makeAt<ast::MatchStmt>(start);
  match_->subject = parseStarExpressions();
  expect(TK::Colon, "':'");
  expect(TK::Newline, "end of line");
  expect(TK::Indent, "an indented block of 'case' clauses");
  while (checkSoft("case")) {
    (void)get();
    ast::MatchCase mc;
    mc.pattern = parsePatternTop();
    if (match(TK::If)) { mc.guard = parseNamedExpr(); }
    parseBlockInto(mc.body);
    match_->cases.push_back(std::move(mc));
  }
  if (match_->cases.empty()) { fail(peek(), "expected 'case' clause"); }
  if (!check(TK::End)) { expect(TK::Dedent, "'case' clause"); }
  return match_;
}

// case a, *rest:   -- an open sequence without brackets
std::unique_ptr<ast::Pattern> Parser::parsePatternTop() {
  const auto start = peek();
  auto first = parsePattern();
  if (!check(TK::Comma)) { return first; }
  auto seq = makeAt<ast::Pattern>(start, ast::PatternForm::Sequence);
  seq->children.push_back(std::move(first));
  while (match(TK::Comma)) {
    if (check(TK::Colon) || check(TK::If)) { break; }
    seq->children.push_back(parsePattern());
  }
  return seq;
}

std::unique_ptr<ast::Pattern> Parser::parsePattern() {
  const auto start = peek();
  auto inner = parsePatternOr();
  if (!match(TK::As)) { return inner; }
  const auto nameTok = expect(TK::Ident, "name after 'as'");
  if (nameTok.text == "_") { fail(nameTok, "cannot use '_' as a target"); }
  auto as = makeAt<ast::Pattern>(start, ast::PatternForm::As);
  as->name = nameTok.text;
  as->children.push_back(std::move(inner));
  return as;
}

std::unique_ptr<ast::Pattern> Parser::parsePatternOr() {
  const auto start = peek();
  auto first = parseClosedPattern();
  if (!check(TK::Pipe)) { return first; }
  auto alt = makeAt<ast::Pattern>(start, ast::PatternForm::Or);
  alt->children.push_back(std::move(first));
  while (match(TK::Pipe)) { alt->children.push_back(parseClosedPattern()); }
  return alt;
}

void Parser::parsePatternSequence(const TK closer, std::vector<std::unique_ptr<ast::Pattern>>& out) {
  while (!check(closer)) {
    out.push_back(parsePattern());
    if (!match(TK::Comma)) { break; }
  }
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
std::unique_ptr<ast::Pattern> Parser::parseClosedPattern() {
  const auto tok = peek();
  switch (tok.kind) {
    case TK::Star: {
      (void)get();
      const auto nameTok = expect(TK::Ident, "name after '*'");
      auto star = makeAt<ast::Pattern>(tok, ast::PatternForm::Star);
      if (nameTok.text != "_") { star->name = nameTok.text; }
      return star;
    }
    case TK::LParen: {
      (void)get();
      if (match(TK::RParen)) { return makeAt<ast::Pattern>(tok, ast::PatternForm::Sequence); }
      auto first = parsePattern();
      if (match(TK::RParen)) { return first; } // group
      auto seq = makeAt<ast::Pattern>(tok, ast::PatternForm::Sequence);
      seq->children.push_back(std::move(first));
      expect(TK::Comma, "',' or ')'");
      parsePatternSequence(TK::RParen, seq->children);
      expect(TK::RParen, "')'");
      return seq;
    }
    case TK::LBracket: {
      (void)get();
      auto seq = makeAt<ast::Pattern>(tok, ast::PatternForm::Sequence);
      parsePatternSequence(TK::RBracket, seq->children);
      expect(TK::RBracket, "']'");
      return seq;
    }
    case TK::LBrace:
      (void)get();
      return parseMappingPattern(tok);
    case TK::Ident: {
      if (tok.text == "_" && peek(1).kind != TK::Dot && peek(1).kind != TK::LParen) {
        (void)get();
        return makeAt<ast::Pattern>(tok, ast::PatternForm::Wildcard);
      }
      if (peek(1).kind != TK::Dot && peek(1).kind != TK::LParen) {
        (void)get();
        auto capture = makeAt<ast::Pattern>(tok, ast::PatternForm::Capture);
        capture->name = tok.text;
        return capture;
      }
      // dotted value or class pattern
      (void)get();
      std::unique_ptr<ast::Expr> ref = makeAt<ast::Name>(tok, tok.text);
      while (match(TK::Dot)) {
        const int line = ref->line;
        const int col = ref->col;
        ref = std::make_unique<ast::Attribute>(std::move(ref), expect(TK::Ident, "attribute name").text);
        ref->line = line;
        ref->col = col;
      }
      if (!match(TK::LParen)) {
        auto value = makeAt<ast::Pattern>(tok, ast::PatternForm::Value);
        value->value = std::move(ref);
        return value;
      }
      auto cls = makeAt<ast::Pattern>(tok, ast::PatternForm::Class);
      cls->value = std::move(ref);
      while (!check(TK::RParen)) {
        if (check(TK::Ident) && peek(1).kind == TK::Equal) {
          cls->keywordNames.push_back(get().text);
          (void)get();
          cls->keywordPatterns.push_back(parsePattern());
        } else {
          if (!cls->keywordNames.empty()) { fail(peek(), "positional patterns follow keyword patterns"); }
          cls->children.push_back(parsePattern());
        }
        if (!match(TK::Comma)) { break; }
      }
      expect(TK::RParen, "')'");
      return cls;
    }
    case TK::Int: case TK::Float: case TK::Imag: case TK::String: case TK::Bytes:
    case TK::BoolLit: case TK::NoneLit: case TK::Minus: {
      // literals, signed numbers and complex literals such as -1+2j
      auto value = makeAt<ast::Pattern>(tok, ast::PatternForm::Value);
      value->value = parseAdditive();
      return value;
    }
    default:
      fail(tok, "invalid pattern");
  }
}

std::unique_ptr<ast::Pattern> Parser::parseMappingPattern(const lex::Token& open) {
  auto mapping = makeAt<ast::Pattern>(open, ast::PatternForm::Mapping);
  while (!check(TK::RBrace)) {
    if (match(TK::StarStar)) {
      mapping->name = expect(TK::Ident, "name after '**'").text;
      (void)match(TK::Comma);
      break;
    }
    mapping->keys.push_back(parseAdditive());
    expect(TK::Colon, "':'");
    mapping->children.push_back(parsePattern());
    if (!match(TK::Comma)) { break; }
  }
  expect(TK::RBrace, "'}'");
  return mapping;
}

} // namespace pysca::parse
