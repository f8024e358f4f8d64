#pragma once

#include <memory>
#include "ast/Expr.h"
#include "ast/ExprContext.h"

namespace pysca::ast {

struct Subscript final : Expr {
  std::unique_ptr<Expr> value;
  std::unique_ptr<Expr> slice; // Slice, TupleLiteral of slices, or any expression
  ExprContext ctx{ExprContext::Load};
  Subscript(std::unique_ptr<Expr> v, std::unique_ptr<Expr> s)
      : Expr(NodeKind::Subscript), value(std::move(v)), slice(std::move(s)) {}
};

} // namespace pysca::ast
