#pragma once

#include <memory>
#include "ast/Expr.h"

namespace pysca::ast {
    struct YieldExpr final : Expr {
        std::unique_ptr<Expr> value; // optional
        bool isFrom{false};          // yield from
        YieldExpr() : Expr(NodeKind::YieldExpr) {}
    };
}
