/***
 * Name: pysca::checks::SyntaxFactExtractor
 * Purpose: Gather stored-variable, parameter and mutable-default facts.
 * Theory of Operation:
 *   The FunctionDef override replaces the base descent so that the body can
 *   be bracketed by the function-depth counter; the walk order of the base
 *   (parameters, body, decorators, return annotation) is preserved.
 */
#include "checks/SyntaxFactExtractor.h"

#include <string>
#include <utility>
#include <vector>
#include "checks/Naming.h"

namespace pysca::checks {

using ast::NodeKind;

SyntaxFacts SyntaxFactExtractor::extract(const ast::Module& module) {
  facts_ = SyntaxFacts{};
  functionDepth_ = 0;
  walk(&module);
  return std::move(facts_);
}

bool SyntaxFactExtractor::IsLiteralConstant(const ast::Expr& expr) {
  switch (expr.kind) {
    case NodeKind::IntLiteral:
    case NodeKind::FloatLiteral:
    case NodeKind::ImagLiteral:
    case NodeKind::StringLiteral:
    case NodeKind::BytesLiteral:
    case NodeKind::BoolLiteral:
    case NodeKind::NoneLiteral:
    case NodeKind::EllipsisLiteral:
      return true;
    default:
      return false;
  }
}

void SyntaxFactExtractor::visit(const ast::FunctionDef& fn) {
  for (const auto& param : fn.params) {
    if (param.isVarArg || param.isKwVarArg || param.isKwOnly) { continue; }
    facts_.recordParameter(fn.line, param.name);
    if (param.defaultValue && !IsLiteralConstant(*param.defaultValue)) { facts_.recordMutableDefault(fn.line); }
  }
  walkParams(fn.params);
  ++functionDepth_;
  walkAll(fn.body);
  --functionDepth_;
  walkAll(fn.decorators);
  walk(fn.returns.get());
}

void SyntaxFactExtractor::visit(const ast::Name& name) {
  if (name.ctx != ast::ExprContext::Store) { return; }
  if (functionScopeOnly_ && functionDepth_ == 0) { return; }
  facts_.recordVariable(name.id, name.line);
}

std::vector<Diagnostic> FactsToDiagnostics(const SyntaxFacts& facts, const std::string& file) {
  std::vector<Diagnostic> out;
  for (const auto& [name, line] : facts.storedVariables()) {
    if (!IsSnakeCase(name)) {
      out.emplace_back(line, DiagnosticCode::VariableNameNotSnakeCase, "Variable '" + name + "' should be snake_case",
                       file);
    }
  }
  for (const auto& [line, name] : facts.parameters()) {
    if (!IsSnakeCase(name)) {
      out.emplace_back(line, DiagnosticCode::ArgumentNameNotSnakeCase,
                       "Argument name '" + name + "' should be snake_case", file);
    }
  }
  for (const int line : facts.mutableDefaults()) {
    out.emplace_back(line, DiagnosticCode::MutableDefaultArgument,
                     std::string(DefaultMessage(DiagnosticCode::MutableDefaultArgument)), file);
  }
  return out;
}

} // namespace pysca::checks
