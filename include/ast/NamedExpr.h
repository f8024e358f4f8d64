#pragma once

#include <memory>
#include "ast/Expr.h"
#include "ast/Name.h"

namespace pysca::ast {

// target := value
struct NamedExpr final : Expr {
  std::unique_ptr<Name> target;
  std::unique_ptr<Expr> value;
  NamedExpr() : Expr(NodeKind::NamedExpr) {}
};

} // namespace pysca::ast
