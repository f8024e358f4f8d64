/**
 * @file
 * @brief AST recursive visitor implementation.
 */
/***
 * Name: pysca::ast::RecursiveVisitor
 * Purpose: Depth-first walk over every child, fields in declaration order
 *   (targets before values, bodies before decorators).
 */
#include "ast/RecursiveVisitor.h"

#include "ast/Nodes.h"

namespace pysca::ast {

void RecursiveVisitor::walk(const Node* node) {
  if (node == nullptr) { return; }
  enter(*node);
  node->accept(*this);
  leave(*node);
}

void RecursiveVisitor::walkParams(const std::vector<Param>& params) {
  for (const auto& p : params) { walk(p.annotation.get()); }
  for (const auto& p : params) { walk(p.defaultValue.get()); }
}

void RecursiveVisitor::walkGenerators(const std::vector<ComprehensionFor>& fors) {
  for (const auto& gen : fors) {
    walk(gen.target.get());
    walk(gen.iter.get());
    walkAll(gen.ifs);
  }
}

void RecursiveVisitor::visit(const Module& module) { walkAll(module.body); }

void RecursiveVisitor::visit(const FunctionDef& fn) {
  walkParams(fn.params);
  walkAll(fn.body);
  walkAll(fn.decorators);
  walk(fn.returns.get());
}

void RecursiveVisitor::visit(const ClassDef& cls) {
  walkAll(cls.bases);
  for (const auto& kw : cls.keywords) { walk(kw.value.get()); }
  walkAll(cls.body);
  walkAll(cls.decorators);
}

void RecursiveVisitor::visit(const ReturnStmt& ret) { walk(ret.value.get()); }

void RecursiveVisitor::visit(const AssignStmt& asg) {
  walkAll(asg.targets);
  walk(asg.value.get());
}

void RecursiveVisitor::visit(const AnnAssignStmt& asg) {
  walk(asg.target.get());
  walk(asg.annotation.get());
  walk(asg.value.get());
}

void RecursiveVisitor::visit(const AugAssignStmt& asg) {
  walk(asg.target.get());
  walk(asg.value.get());
}

void RecursiveVisitor::visit(const ExprStmt& stmt) { walk(stmt.value.get()); }

void RecursiveVisitor::visit(const IfStmt& iff) {
  walk(iff.cond.get());
  walkAll(iff.thenBody);
  walkAll(iff.elseBody);
}

void RecursiveVisitor::visit(const WhileStmt& loop) {
  walk(loop.cond.get());
  walkAll(loop.thenBody);
  walkAll(loop.elseBody);
}

void RecursiveVisitor::visit(const ForStmt& loop) {
  walk(loop.target.get());
  walk(loop.iterable.get());
  walkAll(loop.thenBody);
  walkAll(loop.elseBody);
}

void RecursiveVisitor::visit(const TryStmt& tryStmt) {
  walkAll(tryStmt.body);
  walkAll(tryStmt.handlers);
  walkAll(tryStmt.orelse);
  walkAll(tryStmt.finalbody);
}

void RecursiveVisitor::visit(const ExceptHandler& handler) {
  walk(handler.type.get());
  walkAll(handler.body);
}

void RecursiveVisitor::visit(const WithStmt& with) {
  for (const auto& item : with.items) {
    walk(item.context.get());
    walk(item.optionalVars.get());
  }
  walkAll(with.body);
}

void RecursiveVisitor::visit(const RaiseStmt& raise) {
  walk(raise.exc.get());
  walk(raise.cause.get());
}

void RecursiveVisitor::visit(const DelStmt& del) { walkAll(del.targets); }

void RecursiveVisitor::visit(const AssertStmt& assertion) {
  walk(assertion.test.get());
  walk(assertion.msg.get());
}

void RecursiveVisitor::visit(const MatchStmt& match) {
  walk(match.subject.get());
  for (const auto& mc : match.cases) {
    walk(mc.pattern.get());
    walk(mc.guard.get());
    walkAll(mc.body);
  }
}

void RecursiveVisitor::visit(const Pattern& pattern) {
  walk(pattern.value.get());
  walkAll(pattern.keys);
  walkAll(pattern.children);
  walkAll(pattern.keywordPatterns);
}

void RecursiveVisitor::visit(const TypeAliasStmt& alias) { walk(alias.value.get()); }

void RecursiveVisitor::visit(const Attribute& attr) { walk(attr.value.get()); }

void RecursiveVisitor::visit(const Subscript& sub) {
  walk(sub.value.get());
  walk(sub.slice.get());
}

void RecursiveVisitor::visit(const Slice& slice) {
  walk(slice.lower.get());
  walk(slice.upper.get());
  walk(slice.step.get());
}

void RecursiveVisitor::visit(const Starred& starred) { walk(starred.value.get()); }

void RecursiveVisitor::visit(const Call& call) {
  walk(call.callee.get());
  walkAll(call.args);
  for (const auto& kw : call.keywords) { walk(kw.value.get()); }
}

void RecursiveVisitor::visit(const Binary& bin) {
  walk(bin.lhs.get());
  walk(bin.rhs.get());
}

void RecursiveVisitor::visit(const Unary& unary) { walk(unary.operand.get()); }

void RecursiveVisitor::visit(const Compare& cmp) {
  walk(cmp.left.get());
  walkAll(cmp.comparators);
}

void RecursiveVisitor::visit(const IfExpr& expr) {
  walk(expr.test.get());
  walk(expr.body.get());
  walk(expr.orelse.get());
}

void RecursiveVisitor::visit(const LambdaExpr& lambda) {
  walkParams(lambda.params);
  walk(lambda.body.get());
}

void RecursiveVisitor::visit(const NamedExpr& named) {
  walk(named.target.get());
  walk(named.value.get());
}

void RecursiveVisitor::visit(const TupleLiteral& tuple) { walkAll(tuple.elements); }

void RecursiveVisitor::visit(const ListLiteral& list) { walkAll(list.elements); }

void RecursiveVisitor::visit(const SetLiteral& set) { walkAll(set.elements); }

void RecursiveVisitor::visit(const DictLiteral& dict) {
  walkAll(dict.keys);
  walkAll(dict.values);
}

void RecursiveVisitor::visit(const ListComp& comp) {
  walk(comp.elt.get());
  walkGenerators(comp.fors);
}

void RecursiveVisitor::visit(const SetComp& comp) {
  walk(comp.elt.get());
  walkGenerators(comp.fors);
}

void RecursiveVisitor::visit(const DictComp& comp) {
  walk(comp.key.get());
  walk(comp.value.get());
  walkGenerators(comp.fors);
}

void RecursiveVisitor::visit(const GeneratorExpr& gen) {
  walk(gen.elt.get());
  walkGenerators(gen.fors);
}

void RecursiveVisitor::visit(const YieldExpr& yield) { walk(yield.value.get()); }

void RecursiveVisitor::visit(const AwaitExpr& await) { walk(await.value.get()); }

} // namespace pysca::ast
