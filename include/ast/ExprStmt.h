#pragma once

#include <memory>
#include "ast/Expr.h"
#include "ast/Stmt.h"

namespace pysca::ast {
    struct ExprStmt final : Stmt {
        std::unique_ptr<Expr> value;
        ExprStmt() : Stmt(NodeKind::ExprStmt) {}
    };
} // namespace pysca::ast
