#pragma once

#include <memory>
#include <vector>
#include "ast/Expr.h"
#include "ast/ExprContext.h"

namespace pysca::ast {
    struct ListLiteral final : Expr {
        std::vector<std::unique_ptr<Expr>> elements;
        ExprContext ctx{ExprContext::Load};
        ListLiteral() : Expr(NodeKind::ListLiteral) {}
    };
} // namespace pysca::ast
