#pragma once

#include <memory>
#include <vector>
#include "ast/Expr.h"

namespace pysca::ast {
    struct SetLiteral final : Expr {
        std::vector<std::unique_ptr<Expr>> elements;
        SetLiteral() : Expr(NodeKind::SetLiteral) {}
    };
} // namespace pysca::ast
