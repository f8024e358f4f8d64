/**
 * @file
 * @brief AST recursive visitor declarations.
 */
/***
 * Name: pysca::ast::RecursiveVisitor
 * Purpose: Visitor that walks every child of every node, in source order.
 * Theory of Operation:
 *   Each visit overload walks the node's children through walk(), which
 *   brackets the child's accept() with enter()/leave() hooks. Subclasses
 *   override the overloads they care about and call the base overload to
 *   continue the descent (or skip it to prune a subtree). Subclasses that
 *   override a subset must re-expose the rest with `using RecursiveVisitor::visit;`.
 *   Parameters, keyword arguments, with-items, match cases and comprehension
 *   clauses are not nodes; their expressions are walked in place.
 */
#pragma once

#include <memory>
#include <vector>
#include "ast/Comprehension.h"
#include "ast/Param.h"
#include "ast/VisitorBase.h"

namespace pysca::ast {

struct RecursiveVisitor : VisitorBase {
  void walk(const Node* node);

  template <typename T>
  void walkAll(const std::vector<std::unique_ptr<T>>& nodes) {
    for (const auto& n : nodes) { walk(n.get()); }
  }

  // Called around every walked node (including the root passed to walk()).
  virtual void enter(const Node&) {}
  virtual void leave(const Node&) {}

  void visit(const Module&) override;
  void visit(const FunctionDef&) override;
  void visit(const ClassDef&) override;
  void visit(const ReturnStmt&) override;
  void visit(const AssignStmt&) override;
  void visit(const AnnAssignStmt&) override;
  void visit(const AugAssignStmt&) override;
  void visit(const ExprStmt&) override;
  void visit(const IfStmt&) override;
  void visit(const WhileStmt&) override;
  void visit(const ForStmt&) override;
  void visit(const TryStmt&) override;
  void visit(const ExceptHandler&) override;
  void visit(const WithStmt&) override;
  void visit(const RaiseStmt&) override;
  void visit(const DelStmt&) override;
  void visit(const AssertStmt&) override;
  void visit(const MatchStmt&) override;
  void visit(const Pattern&) override;
  void visit(const TypeAliasStmt&) override;

  void visit(const Attribute&) override;
  void visit(const Subscript&) override;
  void visit(const Slice&) override;
  void visit(const Starred&) override;
  void visit(const Call&) override;
  void visit(const Binary&) override;
  void visit(const Unary&) override;
  void visit(const Compare&) override;
  void visit(const IfExpr&) override;
  void visit(const LambdaExpr&) override;
  void visit(const NamedExpr&) override;
  void visit(const TupleLiteral&) override;
  void visit(const ListLiteral&) override;
  void visit(const SetLiteral&) override;
  void visit(const DictLiteral&) override;
  void visit(const ListComp&) override;
  void visit(const SetComp&) override;
  void visit(const DictComp&) override;
  void visit(const GeneratorExpr&) override;
  void visit(const YieldExpr&) override;
  void visit(const AwaitExpr&) override;

 protected:
  void walkParams(const std::vector<Param>& params);
  void walkGenerators(const std::vector<ComprehensionFor>& fors);
};

} // namespace pysca::ast
