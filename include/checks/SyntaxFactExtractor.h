/***
 * Name: pysca::checks::SyntaxFactExtractor
 * Purpose: Collect naming and default-argument facts in one tree walk.
 * Inputs: ast::Module
 * Outputs: SyntaxFacts
 * Theory of Operation:
 *   A RecursiveVisitor. Each def / async def records its positional
 *   (positional-only and regular) parameter names keyed by the def line, and
 *   marks the def line when any positional default is not a
 *   literal constant. Every Name bound in Store context records its line.
 *   In function-scope mode, only Names inside some def body are recorded;
 *   parameter defaults, annotations and decorators belong to the enclosing
 *   scope.
 */
#pragma once

#include <string>
#include <vector>
#include "ast/Nodes.h"
#include "ast/RecursiveVisitor.h"
#include "checks/Diagnostic.h"
#include "checks/SyntaxFacts.h"

namespace pysca::checks {

class SyntaxFactExtractor final : public ast::RecursiveVisitor {
 public:
  explicit SyntaxFactExtractor(bool functionScopeOnly = false) : functionScopeOnly_(functionScopeOnly) {}

  SyntaxFacts extract(const ast::Module& module);

  // Number, string and bytes literals, True/False/None and '...'; a signed number is an expression.
  static bool IsLiteralConstant(const ast::Expr& expr);

  using RecursiveVisitor::visit;
  void visit(const ast::FunctionDef& fn) override;
  void visit(const ast::Name& name) override;

 private:
  bool functionScopeOnly_;
  int functionDepth_{0};
  SyntaxFacts facts_{};
};

// S011 per non-snake_case variable, then S010 per non-snake_case parameter,
// then S012 per mutable-default line.
std::vector<Diagnostic> FactsToDiagnostics(const SyntaxFacts& facts, const std::string& file);

} // namespace pysca::checks
