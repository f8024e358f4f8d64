#pragma once

#include <memory>
#include "ast/Expr.h"
#include "ast/Stmt.h"

namespace pysca::ast {
    struct AnnAssignStmt final : Stmt {
        std::unique_ptr<Expr> target;
        std::unique_ptr<Expr> annotation;
        std::unique_ptr<Expr> value; // optional: bare annotations bind nothing at runtime
        AnnAssignStmt() : Stmt(NodeKind::AnnAssignStmt) {}
    };
} // namespace pysca::ast
