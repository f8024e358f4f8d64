/**
 * @file
 * @brief AST declarations.
 */
#pragma once

#include <memory>
#include <vector>
#include "ast/BinaryOperator.h"
#include "ast/Expr.h"

namespace pysca::ast {

struct Compare final : Expr {
  std::unique_ptr<Expr> left;
  std::vector<BinaryOperator> ops;
  std::vector<std::unique_ptr<Expr>> comparators; // length equals ops.size()
  Compare() : Expr(NodeKind::Compare) {}
};

} // namespace pysca::ast
