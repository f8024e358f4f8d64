/***
 * Name: pysca::parse::Parser (core)
 * Purpose: Token helpers, error context and module entry point.
 */
#include "parser/Parser.h"

#include "pysca/exceptions/parse_error.h"
#include <sstream>
#include <string>
#include <utility>

namespace pysca::parse {

using TK = lex::TokenKind;

Parser::Parser(lex::ITokenStream& stream, const std::string& source) : ts_(stream) {
  std::istringstream in(source);
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') { line.pop_back(); }
    lines_.push_back(line);
  }
}

const lex::Token& Parser::peek(const size_t k) const { return ts_.peek(k); }

lex::Token Parser::get() { return ts_.next(); }

bool Parser::check(const TK kind) const { return peek().kind == kind; }

bool Parser::match(const TK kind) {
  if (peek().kind == kind) {
    (void)get();
    return true;
  }
  return false;
}

lex::Token Parser::expect(const TK kind, const char* what) {
  if (peek().kind != kind) { fail(peek(), std::string("expected ") + what); }
  return get();
}

bool Parser::checkSoft(const char* word, const size_t k) const {
  const auto& tok = peek(k);
  return tok.kind == TK::Ident && tok.text == word;
}

bool Parser::startsExpression(const TK kind) {
  switch (kind) {
    case TK::Ident: case TK::Int: case TK::Float: case TK::Imag: case TK::String: case TK::Bytes:
    case TK::BoolLit: case TK::NoneLit: case TK::Ellipsis: case TK::LParen: case TK::LBracket:
    case TK::LBrace: case TK::Minus: case TK::Plus: case TK::Tilde: case TK::Not: case TK::Lambda:
    case TK::Await: case TK::Star:
      return true;
    default:
      return false;
  }
}

std::string Parser::formatContext(const int line, const int col, const size_t width,
                                  const std::string& headMsg) const {
  std::ostringstream out;
  out << file_ << ":" << line << ":" << col << ": " << headMsg;
  if (line > 0 && static_cast<size_t>(line) - 1 < lines_.size()) {
    const std::string& srcLine = lines_[static_cast<size_t>(line) - 1];
    out << "\n" << srcLine;
    std::string caret;
    caret.assign(static_cast<size_t>(col > 1 ? col - 1 : 0), ' ');
    caret.push_back('^');
    if (width > 1) { caret.append(width - 1, '~'); }
    out << "\n" << caret;
  }
  return out.str();
}

void Parser::fail(const lex::Token& tok, const std::string& msg) const {
  std::string head = msg;
  if (tok.kind == TK::End) {
    head += ", got end of file";
  } else if (tok.kind == TK::Newline) {
    head += ", got end of line";
  } else if (tok.kind == TK::Indent || tok.kind == TK::Dedent) {
    head += tok.kind == TK::Indent ? ", got unexpected indent" : ", got unexpected dedent";
  } else {
    head += ", got '" + tok.text + "'";
  }
  // Multi-line strings underline their first line only
  const auto nl = tok.text.find('\n');
  size_t width = nl == std::string::npos ? tok.text.size() : nl;
  if (tok.kind == TK::Newline || tok.kind == TK::Indent || tok.kind == TK::Dedent || tok.kind == TK::End) {
    width = 1;
  }
  throw exceptions::ParseError(formatContext(tok.line, tok.col, width, head));
}

void Parser::failAt(const ast::Node& node, const std::string& msg) const {
  throw exceptions::ParseError(formatContext(node.line, node.col, 1, msg));
}

std::unique_ptr<ast::Module> Parser::parseModule() {
  auto mod = std::make_unique<ast::Module>();
  file_ = peek().file;
  mod->file = file_;
  mod->line = 1;
  mod->col = 1;
  while (!check(TK::End)) {
    if (match(TK::Newline)) { continue; }
    if (check(TK::Indent)) { fail(peek(), "unexpected indent"); }
    parseStatementInto(mod->body);
  }
  return mod;
}

void Parser::setTargetContext(ast::Expr& e, const ast::ExprContext ctx) const {
  using ast::NodeKind;
  switch (e.kind) {
    case NodeKind::Name:
      static_cast<ast::Name&>(e).ctx = ctx;
      return;
    case NodeKind::Attribute:
      static_cast<ast::Attribute&>(e).ctx = ctx;
      return;
    case NodeKind::Subscript:
      static_cast<ast::Subscript&>(e).ctx = ctx;
      return;
    case NodeKind::Starred: {
      auto& starred = static_cast<ast::Starred&>(e);
      if (ctx == ast::ExprContext::Del) { failAt(e, "cannot delete starred"); }
      starred.ctx = ctx;
      setTargetContext(*starred.value, ctx);
      return;
    }
    case NodeKind::TupleLiteral: {
      auto& tuple = static_cast<ast::TupleLiteral&>(e);
      tuple.ctx = ctx;
      for (auto& elt : tuple.elements) { setTargetContext(*elt, ctx); }
      return;
    }
    case NodeKind::ListLiteral: {
      auto& list = static_cast<ast::ListLiteral&>(e);
      list.ctx = ctx;
      for (auto& elt : list.elements) { setTargetContext(*elt, ctx); }
      return;
    }
    default:
      break;
  }
  failAt(e, ctx == ast::ExprContext::Del ? "cannot delete expression" : "cannot assign to expression");
}

} // namespace pysca::parse
