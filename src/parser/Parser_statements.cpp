/***
 * Name: pysca::parse::Parser (statements)
 * Purpose: Simple and compound statements, blocks, parameter lists.
 */
#include "parser/Parser.h"

#include <string>
#include <utility>
#include <vector>

namespace pysca::parse {

using TK = lex::TokenKind;
using detail::makeAt;

namespace {
bool augOperatorFor(const TK kind, ast::BinaryOperator& out) {
  using ast::BinaryOperator;
  switch (kind) {
    case TK::PlusEqual: out = BinaryOperator::Add; return true;
    case TK::MinusEqual: out = BinaryOperator::Sub; return true;
    case TK::StarEqual: out = BinaryOperator::Mul; return true;
    case TK::AtEqual: out = BinaryOperator::MatMul; return true;
    case TK::SlashEqual: out = BinaryOperator::Div; return true;
    case TK::SlashSlashEqual: out = BinaryOperator::FloorDiv; return true;
    case TK::PercentEqual: out = BinaryOperator::Mod; return true;
    case TK::StarStarEqual: out = BinaryOperator::Pow; return true;
    case TK::LShiftEqual: out = BinaryOperator::LShift; return true;
    case TK::RShiftEqual: out = BinaryOperator::RShift; return true;
    case TK::AmpEqual: out = BinaryOperator::BitAnd; return true;
    case TK::PipeEqual: out = BinaryOperator::BitOr; return true;
    case TK::CaretEqual: out = BinaryOperator::BitXor; return true;
    default: return false;
  }
}

bool isSingleTarget(const ast::Expr& e) {
  return e.kind == ast::NodeKind::Name || e.kind == ast::NodeKind::Attribute ||
         e.kind == ast::NodeKind::Subscript;
}
} // namespace

void Parser::parseStatementInto(std::vector<std::unique_ptr<ast::Stmt>>& out) {
  const auto& tok = peek();
  switch (tok.kind) {
    case TK::Def: out.push_back(parseFunction({})); return;
    case TK::Class: out.push_back(parseClass({})); return;
    case TK::At: out.push_back(parseDecorated()); return;
    case TK::If: out.push_back(parseIfStmt()); return;
    case TK::While: out.push_back(parseWhileStmt()); return;
    case TK::For: out.push_back(parseForStmt(false)); return;
    case TK::Try: out.push_back(parseTryStmt()); return;
    case TK::With: out.push_back(parseWithStmt(false)); return;
    case TK::Async: {
      const auto next = peek(1).kind;
      if (next == TK::Def) { out.push_back(parseFunction({})); return; }
      if (next == TK::For) { (void)get(); out.push_back(parseForStmt(true)); return; }
      if (next == TK::With) { (void)get(); out.push_back(parseWithStmt(true)); return; }
      fail(peek(1), "expected 'def', 'for' or 'with' after 'async'");
    }
    default:
      break;
  }
  if (atMatchStatement()) {
    out.push_back(parseMatchStmt());
    return;
  }
  parseSimpleLineInto(out);
}

void Parser::parseSimpleLineInto(std::vector<std::unique_ptr<ast::Stmt>>& out) {
  for (;;) {
    out.push_back(parseSmallStmt());
    if (!match(TK::Semicolon)) { break; }
    if (check(TK::Newline) || check(TK::End)) { break; }
  }
  if (check(TK::End)) { return; }
  expect(TK::Newline, "end of statement");
}

void Parser::parseBlockInto(std::vector<std::unique_ptr<ast::Stmt>>& out) {
  expect(TK::Colon, "':'");
  if (!match(TK::Newline)) {
    parseSimpleLineInto(out);
    return;
  }
  expect(TK::Indent, "an indented block");
  while (!check(TK::Dedent) && !check(TK::End)) {
    parseStatementInto(out);
  }
  (void)match(TK::Dedent);
}

std::unique_ptr<ast::Stmt> Parser::parseSmallStmt() {
  const auto tok = peek();
  switch (tok.kind) {
    case TK::Pass: (void)get(); return makeAt<ast::PassStmt>(tok);
    case TK::Break: (void)get(); return makeAt<ast::BreakStmt>(tok);
    case TK::Continue: (void)get(); return makeAt<ast::ContinueStmt>(tok);
    case TK::Return: {
      (void)get();
      auto ret = makeAt<ast::ReturnStmt>(tok);
      if (startsExpression(peek().kind)) { ret->value = parseStarExpressions(); }
      return ret;
    }
    case TK::Raise: return parseRaiseStmt();
    case TK::Del: return parseDelStmt();
    case TK::Assert: return parseAssertStmt();
    case TK::Import: return parseImportStmt();
    case TK::From: return parseFromImportStmt();
    case TK::Global:
    case TK::Nonlocal: {
      (void)get();
      std::vector<std::string> names;
      do {
        names.push_back(expect(TK::Ident, "identifier").text);
      } while (match(TK::Comma));
      if (tok.kind == TK::Global) {
        auto stmt = makeAt<ast::GlobalStmt>(tok);
        stmt->names = std::move(names);
        return stmt;
      }
      auto stmt = makeAt<ast::NonlocalStmt>(tok);
      stmt->names = std::move(names);
      return stmt;
    }
    default:
      break;
  }
  if (checkSoft("type") && peek(1).kind == TK::Ident &&
      (peek(2).kind == TK::Equal || peek(2).kind == TK::LBracket)) {
    return parseTypeAliasStmt();
  }
  return parseExprOrAssignStmt();
}

std::unique_ptr<ast::Stmt> Parser::parseExprOrAssignStmt() {
  const auto start = peek();
  auto first = check(TK::Yield) ? parseYieldExpr() : parseStarExpressions();

  if (check(TK::Colon)) {
    (void)get();
    if (!isSingleTarget(*first)) { failAt(*first, "illegal target for annotation"); }
    setTargetContext(*first, ast::ExprContext::Store);
    auto ann = makeAt<ast::AnnAssignStmt>(start);
    ann->target = std::move(first);
    ann->annotation = parseExpr();
    if (match(TK::Equal)) {
      ann->value = check(TK::Yield) ? parseYieldExpr() : parseStarExpressions();
    }
    return ann;
  }

  ast::BinaryOperator op{};
  if (augOperatorFor(peek().kind, op)) {
    (void)get();
    if (!isSingleTarget(*first)) { failAt(*first, "illegal expression for augmented assignment"); }
    setTargetContext(*first, ast::ExprContext::Store);
    auto aug = makeAt<ast::AugAssignStmt>(start);
    aug->target = std::move(first);
    aug->op = op;
    aug->value = check(TK::Yield) ? parseYieldExpr() : parseStarExpressions();
    return aug;
  }

  if (check(TK::Equal)) {
    auto asg = makeAt<ast::AssignStmt>(start);
    std::unique_ptr<ast::Expr> rhs = std::move(first);
    while (match(TK::Equal)) {
      setTargetContext(*rhs, ast::ExprContext::Store);
      asg->targets.push_back(std::move(rhs));
      rhs = check(TK::Yield) ? parseYieldExpr() : parseStarExpressions();
    }
    asg->value = std::move(rhs);
    return asg;
  }

  if (first->kind == ast::NodeKind::Starred) { failAt(*first, "can't use starred expression here"); }
  auto stmt = makeAt<ast::ExprStmt>(start);
  stmt->value = std::move(first);
  return stmt;
}

std::unique_ptr<ast::Stmt> Parser::parseDecorated() {
  std::vector<std::unique_ptr<ast::Expr>> decorators;
  while (match(TK::At)) {
    decorators.push_back(parseNamedExpr());
    expect(TK::Newline, "end of line after decorator");
  }
  if (check(TK::Def) || (check(TK::Async) && peek(1).kind == TK::Def)) {
    return parseFunction(std::move(decorators));
  }
  if (check(TK::Class)) { return parseClass(std::move(decorators)); }
  fail(peek(), "expected 'def' or 'class' after decorator");
}

std::unique_ptr<ast::Stmt> Parser::parseFunction(std::vector<std::unique_ptr<ast::Expr>> decorators) {
  const auto start = peek();
  const bool isAsync = match(TK::Async);
  expect(TK::Def, "'def'");
  const auto nameTok = expect(TK::Ident, "function name");
  auto fn = makeAt<ast::FunctionDef>(start, nameTok.text);
  fn->isAsync = isAsync;
  fn->decorators = std::move(decorators);
  if (check(TK::LBracket)) { fn->typeParams = parseTypeParams(); }
  expect(TK::LParen, "'('");
  fn->params = parseParamList(TK::RParen, true);
  if (match(TK::Arrow)) { fn->returns = parseExpr(); }
  parseBlockInto(fn->body);
  return fn;
}

std::unique_ptr<ast::Stmt> Parser::parseClass(std::vector<std::unique_ptr<ast::Expr>> decorators) {
  const auto start = expect(TK::Class, "'class'");
  const auto nameTok = expect(TK::Ident, "class name");
  auto cls = makeAt<ast::ClassDef>(start, nameTok.text);
  cls->decorators = std::move(decorators);
  if (check(TK::LBracket)) { cls->typeParams = parseTypeParams(); }
  if (check(TK::LParen)) {
    // Reuse call-argument parsing for bases and keywords
    const auto open = peek();
    ast::Call bases(nullptr);
    bases.line = open.line;
    bases.col = open.col;
    (void)get();
    parseCallArgs(bases, false);
    cls->bases = std::move(bases.args);
    cls->keywords = std::move(bases.keywords);
  }
  parseBlockInto(cls->body);
  return cls;
}

// PEP 695 type parameter lists are kept by name only; bounds and defaults are skipped.
std::vector<std::string> Parser::parseTypeParams() {
  std::vector<std::string> names;
  expect(TK::LBracket, "'['");
  while (!check(TK::RBracket)) {
    (void)(match(TK::Star) || match(TK::StarStar));
    names.push_back(expect(TK::Ident, "type parameter name").text);
    if (match(TK::Colon)) { (void)parseExpr(); }
    if (match(TK::Equal)) { (void)parseExpr(); }
    if (!match(TK::Comma)) { break; }
  }
  expect(TK::RBracket, "']'");
  return names;
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
std::vector<ast::Param> Parser::parseParamList(const TK closer, const bool allowAnnotations) {
  std::vector<ast::Param> params;
  bool seenSlash = false;
  bool kwOnly = false;
  bool seenKwVar = false;
  bool seenDefault = false;
  while (!check(closer)) {
    const auto tok = peek();
    if (seenKwVar) { fail(tok, "arguments cannot follow var-keyword argument"); }
    if (match(TK::Slash)) {
      if (seenSlash) { fail(tok, "'/' may appear only once"); }
      if (kwOnly) { fail(tok, "'/' must be ahead of '*'"); }
      if (params.empty()) { fail(tok, "at least one argument must precede '/'"); }
      seenSlash = true;
      for (auto& p : params) { p.isPosOnly = true; }
    } else if (match(TK::Star)) {
      if (kwOnly) { fail(tok, "'*' argument may appear only once"); }
      kwOnly = true;
      if (check(TK::Ident)) {
        const auto nameTok = get();
        ast::Param p;
        p.name = nameTok.text;
        p.isVarArg = true;
        p.line = nameTok.line;
        p.col = nameTok.col;
        if (allowAnnotations && match(TK::Colon)) {
          p.annotation = check(TK::Star) ? parseStarNamedExpression() : parseExpr();
        }
        params.push_back(std::move(p));
      } else if (check(closer) || (check(TK::Comma) && peek(1).kind == closer)) {
        fail(tok, "named arguments must follow bare *");
      }
    } else if (match(TK::StarStar)) {
      const auto nameTok = expect(TK::Ident, "parameter name");
      ast::Param p;
      p.name = nameTok.text;
      p.isKwVarArg = true;
      p.line = nameTok.line;
      p.col = nameTok.col;
      if (allowAnnotations && match(TK::Colon)) { p.annotation = parseExpr(); }
      params.push_back(std::move(p));
      seenKwVar = true;
    } else {
      const auto nameTok = expect(TK::Ident, "parameter name");
      ast::Param p;
      p.name = nameTok.text;
      p.isKwOnly = kwOnly;
      p.line = nameTok.line;
      p.col = nameTok.col;
      if (allowAnnotations && match(TK::Colon)) { p.annotation = parseExpr(); }
      if (match(TK::Equal)) {
        p.defaultValue = parseExpr();
        if (!kwOnly) { seenDefault = true; }
      } else if (!kwOnly && seenDefault) {
        fail(nameTok, "non-default argument follows default argument");
      }
      params.push_back(std::move(p));
    }
    if (!match(TK::Comma)) { break; }
  }
  if (closer == TK::RParen) {
    expect(TK::RParen, "')'");
  } else if (!check(closer)) {
    fail(peek(), "expected ':'");
  }
  return params;
}

std::unique_ptr<ast::Stmt> Parser::parseIfStmt() {
  const auto start = get(); // 'if' or 'elif'
  auto iff = makeAt<ast::IfStmt>(start);
  iff->cond = parseNamedExpr();
  parseBlockInto(iff->thenBody);
  if (check(TK::Elif)) {
    iff->elseBody.push_back(parseIfStmt());
  } else if (match(TK::Else)) {
    parseBlockInto(iff->elseBody);
  }
  return iff;
}

std::unique_ptr<ast::Stmt> Parser::parseWhileStmt() {
  const auto start = expect(TK::While, "'while'");
  auto loop = makeAt<ast::WhileStmt>(start);
  loop->cond = parseNamedExpr();
  parseBlockInto(loop->thenBody);
  if (match(TK::Else)) { parseBlockInto(loop->elseBody); }
  return loop;
}

std::unique_ptr<ast::Stmt> Parser::parseForStmt(const bool isAsync) {
  const auto start = expect(TK::For, "'for'");
  auto loop = makeAt<ast::ForStmt>(start);
  loop->isAsync = isAsync;
  loop->target = parseTargetList(TK::In);
  expect(TK::In, "'in'");
  loop->iterable = parseStarExpressions();
  parseBlockInto(loop->thenBody);
  if (match(TK::Else)) { parseBlockInto(loop->elseBody); }
  return loop;
}

std::unique_ptr<ast::Stmt> Parser::parseTryStmt() {
  const auto start = expect(TK::Try, "'try'");
  auto tryStmt = makeAt<ast::TryStmt>(start);
  parseBlockInto(tryStmt->body);
  bool sawPlain = false;
  while (check(TK::Except)) {
    const auto exceptTok = get();
    const bool star = match(TK::Star);
    if (star) { tryStmt->isStar = true; } else { sawPlain = true; }
    if (tryStmt->isStar && sawPlain) { fail(exceptTok, "cannot have both 'except' and 'except*' on the same 'try'"); }
    auto handler = makeAt<ast::ExceptHandler>(exceptTok);
    if (!check(TK::Colon)) {
      handler->type = parseExpr();
      if (match(TK::Comma)) {
        // except A, B:  (3.14 form without parentheses)
        auto tuple = std::make_unique<ast::TupleLiteral>();
        tuple->line = handler->type->line;
        tuple->col = handler->type->col;
        tuple->elements.push_back(std::move(handler->type));
        do {
          tuple->elements.push_back(parseExpr());
        } while (match(TK::Comma));
        handler->type = std::move(tuple);
      }
      if (match(TK::As)) { handler->name = expect(TK::Ident, "identifier").text; }
    } else if (star) {
      fail(peek(), "expected exception type after 'except*'");
    }
    parseBlockInto(handler->body);
    tryStmt->handlers.push_back(std::move(handler));
  }
  if (!tryStmt->handlers.empty() && match(TK::Else)) { parseBlockInto(tryStmt->orelse); }
  if (match(TK::Finally)) { parseBlockInto(tryStmt->finalbody); }
  if (tryStmt->handlers.empty() && tryStmt->finalbody.empty()) {
    fail(peek(), "expected 'except' or 'finally' block");
  }
  return tryStmt;
}

std::unique_ptr<ast::Stmt> Parser::parseWithStmt(const bool isAsync) {
  const auto start = expect(TK::With, "'with'");
  auto with = makeAt<ast::WithStmt>(start);
  with->isAsync = isAsync;

  // with ( item, item, ): ...  -- detected by the ':' right after the matching ')'
  bool parenthesized = false;
  if (check(TK::LParen)) {
    int depth = 0;
    for (size_t k = 0;; ++k) {
      const auto kind = peek(k).kind;
      if (kind == TK::End || kind == TK::Newline) { break; }
      if (kind == TK::LParen || kind == TK::LBracket || kind == TK::LBrace) { ++depth; }
      if (kind == TK::RParen || kind == TK::RBracket || kind == TK::RBrace) {
        if (--depth == 0) {
          parenthesized = peek(k + 1).kind == TK::Colon;
          break;
        }
      }
    }
  }
  const TK closer = parenthesized ? TK::RParen : TK::Colon;
  if (parenthesized) { (void)get(); }
  do {
    if (parenthesized && check(TK::RParen)) { break; }
    ast::WithItem item;
    item.context = parseExpr();
    if (match(TK::As)) {
      item.optionalVars = parseBitwiseOr();
      setTargetContext(*item.optionalVars, ast::ExprContext::Store);
    }
    with->items.push_back(std::move(item));
  } while (match(TK::Comma));
  if (parenthesized) { expect(closer, "')'"); }
  if (with->items.empty()) { fail(peek(), "expected a context manager"); }
  parseBlockInto(with->body);
  return with;
}

std::string Parser::parseDottedName() {
  std::string name = expect(TK::Ident, "module name").text;
  while (match(TK::Dot)) {
    name += ".";
    name += expect(TK::Ident, "module name").text;
  }
  return name;
}

std::unique_ptr<ast::Stmt> Parser::parseImportStmt() {
  const auto start = expect(TK::Import, "'import'");
  auto imp = makeAt<ast::Import>(start);
  do {
    ast::Alias alias;
    alias.name = parseDottedName();
    if (match(TK::As)) { alias.asname = expect(TK::Ident, "identifier").text; }
    imp->names.push_back(std::move(alias));
  } while (match(TK::Comma));
  return imp;
}

std::unique_ptr<ast::Stmt> Parser::parseFromImportStmt() {
  const auto start = expect(TK::From, "'from'");
  auto imp = makeAt<ast::ImportFrom>(start);
  for (;;) {
    if (match(TK::Dot)) { imp->level += 1; continue; }
    if (match(TK::Ellipsis)) { imp->level += 3; continue; }
    break;
  }
  if (check(TK::Ident)) { imp->module = parseDottedName(); }
  if (imp->module.empty() && imp->level == 0) { fail(peek(), "expected module name"); }
  expect(TK::Import, "'import'");
  if (match(TK::Star)) {
    imp->names.push_back(ast::Alias{"*", ""});
    return imp;
  }
  const bool paren = match(TK::LParen);
  do {
    if (paren && check(TK::RParen)) { break; }
    ast::Alias alias;
    alias.name = expect(TK::Ident, "imported name").text;
    if (match(TK::As)) { alias.asname = expect(TK::Ident, "identifier").text; }
    imp->names.push_back(std::move(alias));
  } while (match(TK::Comma));
  if (paren) { expect(TK::RParen, "')'"); }
  if (imp->names.empty()) { fail(peek(), "expected imported name"); }
  return imp;
}

std::unique_ptr<ast::Stmt> Parser::parseRaiseStmt() {
  const auto start = expect(TK::Raise, "'raise'");
  auto raise = makeAt<ast::RaiseStmt>(start);
  if (startsExpression(peek().kind)) {
    raise->exc = parseExpr();
    if (match(TK::From)) { raise->cause = parseExpr(); }
  }
  return raise;
}

std::unique_ptr<ast::Stmt> Parser::parseDelStmt() {
  const auto start = expect(TK::Del, "'del'");
  auto del = makeAt<ast::DelStmt>(start);
  do {
    if (!startsExpression(peek().kind)) { break; }
    auto target = parseBitwiseOr();
    setTargetContext(*target, ast::ExprContext::Del);
    del->targets.push_back(std::move(target));
  } while (match(TK::Comma));
  if (del->targets.empty()) { fail(peek(), "expected target after 'del'"); }
  return del;
}

std::unique_ptr<ast::Stmt> Parser::parseAssertStmt() {
  const auto start = expect(TK::Assert, "'assert'");
  auto assertion = makeAt<ast::AssertStmt>(start);
  assertion->test = parseExpr();
  if (match(TK::Comma)) { assertion->msg = parseExpr(); }
  return assertion;
}

std::unique_ptr<ast::Stmt> Parser::parseTypeAliasStmt() {
  const auto start = get(); // soft keyword 'type'
  const auto nameTok = expect(TK::Ident, "type alias name");
  auto alias = makeAt<ast::TypeAliasStmt>(start, nameTok.text);
  if (check(TK::LBracket)) { alias->typeParams = parseTypeParams(); }
  expect(TK::Equal, "'='");
  alias->value = parseExpr();
  return alias;
}

} // namespace pysca::parse
