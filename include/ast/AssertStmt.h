#pragma once

#include <memory>
#include "ast/Expr.h"
#include "ast/Stmt.h"

namespace pysca::ast {
    struct AssertStmt final : Stmt {
        std::unique_ptr<Expr> test;
        std::unique_ptr<Expr> msg; // optional
        AssertStmt() : Stmt(NodeKind::AssertStmt) {}
    };
} // namespace pysca::ast
