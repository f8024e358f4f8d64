#pragma once

#include <memory>
#include "ast/Expr.h"
#include "ast/ExprContext.h"

namespace pysca::ast {

struct Starred final : Expr {
  std::unique_ptr<Expr> value;
  ExprContext ctx{ExprContext::Load};
  explicit Starred(std::unique_ptr<Expr> v) : Expr(NodeKind::Starred), value(std::move(v)) {}
};

} // namespace pysca::ast
