#pragma once

#include <memory>
#include "ast/Expr.h"

namespace pysca::ast {
    struct AwaitExpr final : Expr {
        std::unique_ptr<Expr> value;
        explicit AwaitExpr(std::unique_ptr<Expr> v) : Expr(NodeKind::AwaitExpr), value(std::move(v)) {}
    };
}
