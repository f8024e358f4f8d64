/***
 * Name: pysca::parse::Parser
 * Purpose: Build a Python syntax tree from tokens.
 * Inputs:
 *   - Token stream from Lexer (pull-based)
 *   - Optional source text, used only to quote the offending line in errors
 * Outputs:
 *   - Module AST covering the full statement and expression grammar of Python 3
 * Theory of Operation:
 *   Recursive descent, one method per grammar level:
 *     module      := { statement } END
 *     statement   := compound | simple { ';' simple } [';'] NEWLINE
 *     compound    := decorated | def | class | if | while | for | try | with | match
 *     block       := ':' ( simple-line | NEWLINE INDENT { statement } DEDENT )
 *     expression  := lambda | or_test [ 'if' or_test 'else' expression ]
 *   Assignment, annotated-assignment, augmented-assignment, del, for, with-as
 *   and comprehension targets are validated and marked with a Store or Del
 *   context. `match`, `case` and `type` are soft keywords recognized by
 *   lookahead. The first error throws exceptions::ParseError carrying
 *   `file:line:col: message`, the source line and a caret.
 */
#pragma once

#include "ast/Nodes.h"
#include "lexer/Lexer.h"
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace pysca::parse {

namespace detail {
// Allocate a node positioned at the given token.
template <typename N, typename... Args>
std::unique_ptr<N> makeAt(const lex::Token& tok, Args&&... args) {
  auto node = std::make_unique<N>(std::forward<Args>(args)...);
  node->line = tok.line;
  node->col = tok.col;
  return node;
}
} // namespace detail

class Parser {
 public:
  explicit Parser(lex::ITokenStream& stream, const std::string& source = {});
  std::unique_ptr<ast::Module> parseModule();

 private:
  lex::ITokenStream& ts_;
  std::vector<std::string> lines_{};
  std::string file_{};

  // token helpers
  const lex::Token& peek(size_t k = 0) const;
  lex::Token get();
  bool check(lex::TokenKind kind) const;
  bool match(lex::TokenKind kind);
  lex::Token expect(lex::TokenKind kind, const char* what);
  bool checkSoft(const char* word, size_t k = 0) const;
  static bool startsExpression(lex::TokenKind kind);

  // errors
  std::string formatContext(int line, int col, size_t width, const std::string& headMsg) const;
  [[noreturn]] void fail(const lex::Token& tok, const std::string& msg) const;
  [[noreturn]] void failAt(const ast::Node& node, const std::string& msg) const;

  // statements (Parser_statements.cpp)
  void parseStatementInto(std::vector<std::unique_ptr<ast::Stmt>>& out);
  void parseSimpleLineInto(std::vector<std::unique_ptr<ast::Stmt>>& out);
  void parseBlockInto(std::vector<std::unique_ptr<ast::Stmt>>& out);
  std::unique_ptr<ast::Stmt> parseSmallStmt();
  std::unique_ptr<ast::Stmt> parseExprOrAssignStmt();
  std::unique_ptr<ast::Stmt> parseDecorated();
  std::unique_ptr<ast::Stmt> parseFunction(std::vector<std::unique_ptr<ast::Expr>> decorators);
  std::unique_ptr<ast::Stmt> parseClass(std::vector<std::unique_ptr<ast::Expr>> decorators);
  std::vector<ast::Param> parseParamList(lex::TokenKind closer, bool allowAnnotations);
  std::vector<std::string> parseTypeParams();
  std::unique_ptr<ast::Stmt> parseIfStmt();
  std::unique_ptr<ast::Stmt> parseWhileStmt();
  std::unique_ptr<ast::Stmt> parseForStmt(bool isAsync);
  std::unique_ptr<ast::Stmt> parseTryStmt();
  std::unique_ptr<ast::Stmt> parseWithStmt(bool isAsync);
  std::unique_ptr<ast::Stmt> parseImportStmt();
  std::unique_ptr<ast::Stmt> parseFromImportStmt();
  std::unique_ptr<ast::Stmt> parseRaiseStmt();
  std::unique_ptr<ast::Stmt> parseDelStmt();
  std::unique_ptr<ast::Stmt> parseAssertStmt();
  std::unique_ptr<ast::Stmt> parseTypeAliasStmt();
  std::string parseDottedName();

  // match/case (Parser_patterns.cpp)
  bool atMatchStatement() const;
  std::unique_ptr<ast::Stmt> parseMatchStmt();
  std::unique_ptr<ast::Pattern> parsePatternTop();
  std::unique_ptr<ast::Pattern> parsePattern();
  std::unique_ptr<ast::Pattern> parsePatternOr();
  std::unique_ptr<ast::Pattern> parseClosedPattern();
  std::unique_ptr<ast::Pattern> parseMappingPattern(const lex::Token& open);
  void parsePatternSequence(lex::TokenKind closer, std::vector<std::unique_ptr<ast::Pattern>>& out);

  // expressions (Parser_expressions.cpp)
  std::unique_ptr<ast::Expr> parseStarExpressions(); // a, *b, c  (tuple when comma)
  std::unique_ptr<ast::Expr> parseStarNamedExpression();
  std::unique_ptr<ast::Expr> parseNamedExpr();
  std::unique_ptr<ast::Expr> parseExpr(); // 'test'
  std::unique_ptr<ast::Expr> parseLambda();
  std::unique_ptr<ast::Expr> parseOrTest();
  std::unique_ptr<ast::Expr> parseAndTest();
  std::unique_ptr<ast::Expr> parseNotTest();
  std::unique_ptr<ast::Expr> parseComparison();
  std::unique_ptr<ast::Expr> parseBitwiseOr();
  std::unique_ptr<ast::Expr> parseBitwiseXor();
  std::unique_ptr<ast::Expr> parseBitwiseAnd();
  std::unique_ptr<ast::Expr> parseShift();
  std::unique_ptr<ast::Expr> parseAdditive();
  std::unique_ptr<ast::Expr> parseMultiplicative();
  std::unique_ptr<ast::Expr> parseUnary();
  std::unique_ptr<ast::Expr> parsePower();
  std::unique_ptr<ast::Expr> parsePostfix(std::unique_ptr<ast::Expr> base);
  std::unique_ptr<ast::Expr> parseAtom();
  std::unique_ptr<ast::Expr> parseStrings();
  std::unique_ptr<ast::Expr> parseParenthesized(const lex::Token& open);
  std::unique_ptr<ast::Expr> parseListDisplay(const lex::Token& open);
  std::unique_ptr<ast::Expr> parseDictOrSetDisplay(const lex::Token& open);
  std::unique_ptr<ast::Expr> parseYieldExpr();
  std::unique_ptr<ast::Expr> parseSubscriptList();
  std::unique_ptr<ast::Expr> parseSliceItem();
  std::unique_ptr<ast::Expr> parseTargetList(lex::TokenKind stop);
  void parseCallArgs(ast::Call& call, bool allowGenerator = true);
  bool atComprehension() const;
  std::vector<ast::ComprehensionFor> parseComprehensionFors();

  // Set ExprContext recursively on assignment/del targets; rejects non-targets
  void setTargetContext(ast::Expr& e, ast::ExprContext ctx) const;
};

} // namespace pysca::parse
