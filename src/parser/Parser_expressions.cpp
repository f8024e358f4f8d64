/***
 * Name: pysca::parse::Parser (expressions)
 * Purpose: Operator-precedence levels, atoms, displays, calls, subscripts
 *   and comprehensions.
 */
#include "parser/Parser.h"

#include <string>
#include <utility>
#include <vector>

namespace pysca::parse {

using TK = lex::TokenKind;
using detail::makeAt;

namespace {
template <typename N>
std::unique_ptr<N> makeLike(const ast::Node& where) {
  auto node = std::make_unique<N>();
  node->line = where.line;
  node->col = where.col;
  return node;
}

std::unique_ptr<ast::Expr> binary(const ast::BinaryOperator op, std::unique_ptr<ast::Expr> lhs,
                                  std::unique_ptr<ast::Expr> rhs) {
  const int line = lhs->line;
  const int col = lhs->col;
  auto node = std::make_unique<ast::Binary>(op, std::move(lhs), std::move(rhs));
  node->line = line;
  node->col = col;
  return node;
}

bool isFormatString(const std::string& text) {
  for (const char chr : text) {
    if (chr == '\'' || chr == '"') { return false; }
    if (chr == 'f' || chr == 'F') { return true; }
  }
  return false;
}
} // namespace

// star_expressions: a tuple when a top-level comma appears ('x = 1, 2', 'return a, *b')
std::unique_ptr<ast::Expr> Parser::parseStarExpressions() {
  const auto start = peek();
  auto first = parseStarNamedExpression();
  if (!check(TK::Comma)) { return first; }
  auto tuple = makeAt<ast::TupleLiteral>(start);
  tuple->elements.push_back(std::move(first));
  while (match(TK::Comma)) {
    if (!startsExpression(peek().kind)) { break; }
    tuple->elements.push_back(parseStarNamedExpression());
  }
  return tuple;
}

std::unique_ptr<ast::Expr> Parser::parseStarNamedExpression() {
  if (check(TK::Star)) {
    const auto star = get();
    return makeAt<ast::Starred>(star, parseBitwiseOr());
  }
  return parseNamedExpr();
}

std::unique_ptr<ast::Expr> Parser::parseNamedExpr() {
  if (check(TK::Ident) && peek(1).kind == TK::ColonEqual) {
    const auto nameTok = get();
    (void)get();
    auto named = makeAt<ast::NamedExpr>(nameTok);
    named->target = makeAt<ast::Name>(nameTok, nameTok.text);
    named->target->ctx = ast::ExprContext::Store;
    named->value = parseExpr();
    return named;
  }
  return parseExpr();
}

std::unique_ptr<ast::Expr> Parser::parseExpr() {
  if (check(TK::Lambda)) { return parseLambda(); }
  auto body = parseOrTest();
  if (!check(TK::If)) { return body; }
  (void)get(); // conditional expression: body 'if' test 'else' orelse
  auto cond = makeLike<ast::IfExpr>(*body);
  cond->test = parseOrTest();
  expect(TK::Else, "'else' in conditional expression");
  cond->body = std::move(body);
  cond->orelse = parseExpr();
  return cond;
}

std::unique_ptr<ast::Expr> Parser::parseLambda() {
  const auto start = expect(TK::Lambda, "'lambda'");
  auto lambda = makeAt<ast::LambdaExpr>(start);
  lambda->params = parseParamList(TK::Colon, false);
  expect(TK::Colon, "':'");
  lambda->body = parseExpr();
  return lambda;
}

std::unique_ptr<ast::Expr> Parser::parseOrTest() {
  auto lhs = parseAndTest();
  while (match(TK::Or)) { lhs = binary(ast::BinaryOperator::Or, std::move(lhs), parseAndTest()); }
  return lhs;
}

std::unique_ptr<ast::Expr> Parser::parseAndTest() {
  auto lhs = parseNotTest();
  while (match(TK::And)) { lhs = binary(ast::BinaryOperator::And, std::move(lhs), parseNotTest()); }
  return lhs;
}

std::unique_ptr<ast::Expr> Parser::parseNotTest() {
  if (check(TK::Not)) {
    const auto tok = get();
    return makeAt<ast::Unary>(tok, ast::UnaryOperator::Not, parseNotTest());
  }
  return parseComparison();
}

std::unique_ptr<ast::Expr> Parser::parseComparison() {
  auto left = parseBitwiseOr();
  std::unique_ptr<ast::Compare> cmp;
  for (;;) {
    ast::BinaryOperator op{};
    const auto kind = peek().kind;
    if (kind == TK::EqEq) { op = ast::BinaryOperator::Eq; }
    else if (kind == TK::NotEq) { op = ast::BinaryOperator::Ne; }
    else if (kind == TK::Lt) { op = ast::BinaryOperator::Lt; }
    else if (kind == TK::Le) { op = ast::BinaryOperator::Le; }
    else if (kind == TK::Gt) { op = ast::BinaryOperator::Gt; }
    else if (kind == TK::Ge) { op = ast::BinaryOperator::Ge; }
    else if (kind == TK::In) { op = ast::BinaryOperator::In; }
    else if (kind == TK::Is) {
      op = peek(1).kind == TK::Not ? ast::BinaryOperator::IsNot : ast::BinaryOperator::Is;
    } else if (kind == TK::Not && peek(1).kind == TK::In) {
      op = ast::BinaryOperator::NotIn;
    } else {
      break;
    }
    (void)get();
    if (op == ast::BinaryOperator::IsNot || op == ast::BinaryOperator::NotIn) { (void)get(); }
    if (!cmp) {
      cmp = makeLike<ast::Compare>(*left);
      cmp->left = std::move(left);
    }
    cmp->ops.push_back(op);
    cmp->comparators.push_back(parseBitwiseOr());
  }
  if (cmp) { return cmp; }
  return left;
}

std::unique_ptr<ast::Expr> Parser::parseBitwiseOr() {
  auto lhs = parseBitwiseXor();
  while (match(TK::Pipe)) { lhs = binary(ast::BinaryOperator::BitOr, std::move(lhs), parseBitwiseXor()); }
  return lhs;
}

std::unique_ptr<ast::Expr> Parser::parseBitwiseXor() {
  auto lhs = parseBitwiseAnd();
  while (match(TK::Caret)) { lhs = binary(ast::BinaryOperator::BitXor, std::move(lhs), parseBitwiseAnd()); }
  return lhs;
}

std::unique_ptr<ast::Expr> Parser::parseBitwiseAnd() {
  auto lhs = parseShift();
  while (match(TK::Amp)) { lhs = binary(ast::BinaryOperator::BitAnd, std::move(lhs), parseShift()); }
  return lhs;
}

std::unique_ptr<ast::Expr> Parser::parseShift() {
  auto lhs = parseAdditive();
  for (;;) {
    if (match(TK::LShift)) { lhs = binary(ast::BinaryOperator::LShift, std::move(lhs), parseAdditive()); }
    else if (match(TK::RShift)) { lhs = binary(ast::BinaryOperator::RShift, std::move(lhs), parseAdditive()); }
    else { return lhs; }
  }
}

std::unique_ptr<ast::Expr> Parser::parseAdditive() {
  auto lhs = parseMultiplicative();
  for (;;) {
    if (match(TK::Plus)) { lhs = binary(ast::BinaryOperator::Add, std::move(lhs), parseMultiplicative()); }
    else if (match(TK::Minus)) { lhs = binary(ast::BinaryOperator::Sub, std::move(lhs), parseMultiplicative()); }
    else { return lhs; }
  }
}

std::unique_ptr<ast::Expr> Parser::parseMultiplicative() {
  auto lhs = parseUnary();
  for (;;) {
    ast::BinaryOperator op{};
    switch (peek().kind) {
      case TK::Star: op = ast::BinaryOperator::Mul; break;
      case TK::At: op = ast::BinaryOperator::MatMul; break;
      case TK::Slash: op = ast::BinaryOperator::Div; break;
      case TK::SlashSlash: op = ast::BinaryOperator::FloorDiv; break;
      case TK::Percent: op = ast::BinaryOperator::Mod; break;
      default: return lhs;
    }
    (void)get();
    lhs = binary(op, std::move(lhs), parseUnary());
  }
}

std::unique_ptr<ast::Expr> Parser::parseUnary() {
  const auto tok = peek();
  ast::UnaryOperator op{};
  if (tok.kind == TK::Minus) { op = ast::UnaryOperator::Neg; }
  else if (tok.kind == TK::Plus) { op = ast::UnaryOperator::Pos; }
  else if (tok.kind == TK::Tilde) { op = ast::UnaryOperator::BitNot; }
  else { return parsePower(); }
  (void)get();
  return makeAt<ast::Unary>(tok, op, parseUnary());
}

std::unique_ptr<ast::Expr> Parser::parsePower() {
  std::unique_ptr<ast::Expr> base;
  if (check(TK::Await)) {
    const auto tok = get();
    base = makeAt<ast::AwaitExpr>(tok, parsePostfix(parseAtom()));
  } else {
    base = parsePostfix(parseAtom());
  }
  if (match(TK::StarStar)) {
    // right-associative; binds tighter than unary minus on its left only
    return binary(ast::BinaryOperator::Pow, std::move(base), parseUnary());
  }
  return base;
}

std::unique_ptr<ast::Expr> Parser::parsePostfix(std::unique_ptr<ast::Expr> base) {
  for (;;) {
    if (check(TK::LParen)) {
      (void)get();
      const int line = base->line;
      const int col = base->col;
      auto call = std::make_unique<ast::Call>(std::move(base));
      call->line = line;
      call->col = col;
      parseCallArgs(*call);
      base = std::move(call);
    } else if (check(TK::LBracket)) {
      (void)get();
      const int line = base->line;
      const int col = base->col;
      auto slice = parseSubscriptList();
      expect(TK::RBracket, "']'");
      auto sub = std::make_unique<ast::Subscript>(std::move(base), std::move(slice));
      sub->line = line;
      sub->col = col;
      base = std::move(sub);
    } else if (check(TK::Dot)) {
      (void)get();
      const int line = base->line;
      const int col = base->col;
      auto attr = std::make_unique<ast::Attribute>(std::move(base), expect(TK::Ident, "attribute name").text);
      attr->line = line;
      attr->col = col;
      base = std::move(attr);
    } else {
      return base;
    }
  }
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
std::unique_ptr<ast::Expr> Parser::parseAtom() {
  const auto tok = peek();
  switch (tok.kind) {
    case TK::Ident: (void)get(); return makeAt<ast::Name>(tok, tok.text);
    case TK::Int: (void)get(); return makeAt<ast::IntLiteral>(tok, tok.text);
    case TK::Float: (void)get(); return makeAt<ast::FloatLiteral>(tok, tok.text);
    case TK::Imag: (void)get(); return makeAt<ast::ImagLiteral>(tok, tok.text);
    case TK::BoolLit: (void)get(); return makeAt<ast::BoolLiteral>(tok, tok.text == "True");
    case TK::NoneLit: (void)get(); return makeAt<ast::NoneLiteral>(tok);
    case TK::Ellipsis: (void)get(); return makeAt<ast::EllipsisLiteral>(tok);
    case TK::String:
    case TK::Bytes:
      return parseStrings();
    case TK::LParen: (void)get(); return parseParenthesized(tok);
    case TK::LBracket: (void)get(); return parseListDisplay(tok);
    case TK::LBrace: (void)get(); return parseDictOrSetDisplay(tok);
    default:
      fail(tok, "invalid syntax: expected expression");
  }
}

// Adjacent string literals concatenate into one node.
std::unique_ptr<ast::Expr> Parser::parseStrings() {
  const auto first = peek();
  std::string text;
  bool sawBytes = false;
  bool sawText = false;
  bool sawFormat = false;
  while (check(TK::String) || check(TK::Bytes)) {
    const auto tok = get();
    if (tok.kind == TK::Bytes) { sawBytes = true; } else { sawText = true; }
    if (tok.kind == TK::String && isFormatString(tok.text)) { sawFormat = true; }
    if (sawBytes && sawText) { fail(tok, "cannot mix bytes and nonbytes literals"); }
    if (!text.empty()) { text += " "; }
    text += tok.text;
  }
  if (sawBytes) { return makeAt<ast::BytesLiteral>(first, text); }
  if (sawFormat) { return makeAt<ast::FStringLiteral>(first, text); }
  return makeAt<ast::StringLiteral>(first, text);
}

std::unique_ptr<ast::Expr> Parser::parseParenthesized(const lex::Token& open) {
  if (match(TK::RParen)) { return makeAt<ast::TupleLiteral>(open); }
  if (check(TK::Yield)) {
    auto yield = parseYieldExpr();
    expect(TK::RParen, "')'");
    return yield;
  }
  auto first = parseStarNamedExpression();
  if (atComprehension()) {
    auto gen = makeAt<ast::GeneratorExpr>(open);
    gen->elt = std::move(first);
    gen->fors = parseComprehensionFors();
    expect(TK::RParen, "')'");
    return gen;
  }
  if (!check(TK::Comma)) {
    expect(TK::RParen, "')'");
    if (first->kind == ast::NodeKind::Starred) { failAt(*first, "cannot use starred expression here"); }
    return first;
  }
  auto tuple = makeAt<ast::TupleLiteral>(open);
  tuple->elements.push_back(std::move(first));
  while (match(TK::Comma)) {
    if (check(TK::RParen)) { break; }
    tuple->elements.push_back(parseStarNamedExpression());
  }
  expect(TK::RParen, "')'");
  return tuple;
}

std::unique_ptr<ast::Expr> Parser::parseListDisplay(const lex::Token& open) {
  if (match(TK::RBracket)) { return makeAt<ast::ListLiteral>(open); }
  auto first = parseStarNamedExpression();
  if (atComprehension()) {
    auto comp = makeAt<ast::ListComp>(open);
    comp->elt = std::move(first);
    comp->fors = parseComprehensionFors();
    expect(TK::RBracket, "']'");
    return comp;
  }
  auto list = makeAt<ast::ListLiteral>(open);
  list->elements.push_back(std::move(first));
  while (match(TK::Comma)) {
    if (check(TK::RBracket)) { break; }
    list->elements.push_back(parseStarNamedExpression());
  }
  expect(TK::RBracket, "']'");
  return list;
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
std::unique_ptr<ast::Expr> Parser::parseDictOrSetDisplay(const lex::Token& open) {
  if (match(TK::RBrace)) { return makeAt<ast::DictLiteral>(open); }

  auto parseDictEntry = [this](ast::DictLiteral& dict) {
    if (match(TK::StarStar)) {
      dict.keys.push_back(nullptr);
      dict.values.push_back(parseBitwiseOr());
      return;
    }
    dict.keys.push_back(parseExpr());
    expect(TK::Colon, "':'");
    dict.values.push_back(parseExpr());
  };

  if (check(TK::StarStar)) {
    auto dict = makeAt<ast::DictLiteral>(open);
    parseDictEntry(*dict);
    while (match(TK::Comma)) {
      if (check(TK::RBrace)) { break; }
      parseDictEntry(*dict);
    }
    expect(TK::RBrace, "'}'");
    return dict;
  }

  auto first = parseStarNamedExpression();
  if (match(TK::Colon)) {
    auto value = parseExpr();
    if (atComprehension()) {
      auto comp = makeAt<ast::DictComp>(open);
      comp->key = std::move(first);
      comp->value = std::move(value);
      comp->fors = parseComprehensionFors();
      expect(TK::RBrace, "'}'");
      return comp;
    }
    auto dict = makeAt<ast::DictLiteral>(open);
    dict->keys.push_back(std::move(first));
    dict->values.push_back(std::move(value));
    while (match(TK::Comma)) {
      if (check(TK::RBrace)) { break; }
      parseDictEntry(*dict);
    }
    expect(TK::RBrace, "'}'");
    return dict;
  }

  if (atComprehension()) {
    auto comp = makeAt<ast::SetComp>(open);
    comp->elt = std::move(first);
    comp->fors = parseComprehensionFors();
    expect(TK::RBrace, "'}'");
    return comp;
  }
  auto set = makeAt<ast::SetLiteral>(open);
  set->elements.push_back(std::move(first));
  while (match(TK::Comma)) {
    if (check(TK::RBrace)) { break; }
    set->elements.push_back(parseStarNamedExpression());
  }
  expect(TK::RBrace, "'}'");
  return set;
}

std::unique_ptr<ast::Expr> Parser::parseYieldExpr() {
  const auto start = expect(TK::Yield, "'yield'");
  auto yield = makeAt<ast::YieldExpr>(start);
  if (match(TK::From)) {
    yield->isFrom = true;
    yield->value = parseExpr();
  } else if (startsExpression(peek().kind)) {
    yield->value = parseStarExpressions();
  }
  return yield;
}

// a[i], a[i:j:k], a[i, j:k], a[*idx]
std::unique_ptr<ast::Expr> Parser::parseSubscriptList() {
  const auto start = peek();
  auto first = parseSliceItem();
  if (!check(TK::Comma)) { return first; }
  auto tuple = makeAt<ast::TupleLiteral>(start);
  tuple->elements.push_back(std::move(first));
  while (match(TK::Comma)) {
    if (check(TK::RBracket)) { break; }
    tuple->elements.push_back(parseSliceItem());
  }
  return tuple;
}

std::unique_ptr<ast::Expr> Parser::parseSliceItem() {
  const auto start = peek();
  std::unique_ptr<ast::Expr> lower;
  if (!check(TK::Colon)) {
    lower = parseStarNamedExpression();
    if (!check(TK::Colon)) { return lower; }
  }
  (void)get(); // ':'
  auto slice = makeAt<ast::Slice>(start);
  slice->lower = std::move(lower);
  if (!check(TK::Colon) && !check(TK::Comma) && !check(TK::RBracket)) { slice->upper = parseExpr(); }
  if (match(TK::Colon)) {
    if (!check(TK::Comma) && !check(TK::RBracket)) { slice->step = parseExpr(); }
  }
  return slice;
}

// Targets of 'for' and comprehension clauses, ending before `stop`.
std::unique_ptr<ast::Expr> Parser::parseTargetList(const TK stop) {
  const auto start = peek();
  auto parseOne = [this]() -> std::unique_ptr<ast::Expr> {
    if (check(TK::Star)) {
      const auto star = get();
      return makeAt<ast::Starred>(star, parseBitwiseOr());
    }
    return parseBitwiseOr();
  };
  auto first = parseOne();
  std::unique_ptr<ast::Expr> target;
  if (check(TK::Comma)) {
    auto tuple = makeAt<ast::TupleLiteral>(start);
    tuple->elements.push_back(std::move(first));
    while (match(TK::Comma)) {
      if (check(stop)) { break; }
      tuple->elements.push_back(parseOne());
    }
    target = std::move(tuple);
  } else {
    target = std::move(first);
  }
  setTargetContext(*target, ast::ExprContext::Store);
  return target;
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
void Parser::parseCallArgs(ast::Call& call, const bool allowGenerator) {
  bool sawKeyword = false;
  bool sawKwUnpack = false;
  while (!check(TK::RParen)) {
    const auto tok = peek();
    if (match(TK::StarStar)) {
      call.keywords.push_back(ast::KeywordArg{"", parseExpr()});
      sawKeyword = true;
      sawKwUnpack = true;
    } else if (match(TK::Star)) {
      if (sawKwUnpack) { fail(tok, "iterable argument unpacking follows keyword argument unpacking"); }
      call.args.push_back(makeAt<ast::Starred>(tok, parseExpr()));
    } else if (tok.kind == TK::Ident && peek(1).kind == TK::Equal) {
      (void)get();
      (void)get();
      for (const auto& kw : call.keywords) {
        if (kw.name == tok.text) { fail(tok, "keyword argument repeated: " + tok.text); }
      }
      call.keywords.push_back(ast::KeywordArg{tok.text, parseExpr()});
      sawKeyword = true;
    } else {
      auto arg = parseNamedExpr();
      if (atComprehension()) {
        auto gen = makeLike<ast::GeneratorExpr>(*arg);
        gen->elt = std::move(arg);
        gen->fors = parseComprehensionFors();
        if (!allowGenerator) { failAt(*gen, "invalid syntax"); }
        if (!call.args.empty() || !call.keywords.empty() || check(TK::Comma)) {
          failAt(*gen, "Generator expression must be parenthesized");
        }
        call.args.push_back(std::move(gen));
      } else {
        if (sawKeyword) { failAt(*arg, "positional argument follows keyword argument"); }
        call.args.push_back(std::move(arg));
      }
    }
    if (!match(TK::Comma)) { break; }
  }
  expect(TK::RParen, "')'");
}

bool Parser::atComprehension() const {
  return check(TK::For) || (check(TK::Async) && peek(1).kind == TK::For);
}

std::vector<ast::ComprehensionFor> Parser::parseComprehensionFors() {
  std::vector<ast::ComprehensionFor> fors;
  while (atComprehension()) {
    ast::ComprehensionFor clause;
    clause.isAsync = match(TK::Async);
    expect(TK::For, "'for'");
    clause.target = parseTargetList(TK::In);
    expect(TK::In, "'in'");
    clause.iter = parseOrTest();
    while (match(TK::If)) { clause.ifs.push_back(parseOrTest()); }
    fors.push_back(std::move(clause));
  }
  return fors;
}

} // namespace pysca::parse
